#include <nmbridge/browser/browser_tools.h>
#include <nmbridge/host/bridge_host.h>
#include <nmbridge/mcp/http_server.h>
#include <nmbridge/mcp/mcp_server.h>
#include <nmbridge/native/correlation_manager.h>
#include <nmbridge/native/native_transport.h>
#include <nmbridge/version.hpp>

#include <spdlog/spdlog.h>

namespace nmbridge::host {

BridgeHost::BridgeHost(Options options) : opts_(std::move(options)) {
    const auto& cfg = opts_.config;

    native::NativeTransport::Config tcfg;
    tcfg.inputFd = opts_.inputFd;
    tcfg.outputFd = opts_.outputFd;
    transport_ = std::make_shared<native::NativeTransport>(tcfg);

    native::CorrelationManager::Config ccfg;
    ccfg.defaultTimeout = cfg.callTimeout;
    correlation_ = std::make_shared<native::CorrelationManager>(transport_, ccfg);

    mcp_ = std::make_shared<mcp::MCPServer>(
        mcp::HostInfo{NMBRIDGE_HOST_NAME, NMBRIDGE_VERSION_STRING, cfg.runMode});

    mcp::HttpMcpServer::Config hcfg;
    hcfg.bindAddress = cfg.bindAddress;
    hcfg.bindPort = cfg.port;
    http_ = std::make_shared<mcp::HttpMcpServer>(mcp_, hcfg);

    ControlHandlers::Context ctx;
    ctx.name = NMBRIDGE_HOST_NAME;
    ctx.version = NMBRIDGE_VERSION_STRING;
    ctx.runMode = cfg.runMode;
    ctx.sseBaseUrl = cfg.baseUrl;
    ctx.ssePort = [http = std::weak_ptr<mcp::HttpMcpServer>(http_)]() -> uint16_t {
        auto h = http.lock();
        return h ? h->port() : 0;
    };
    ctx.pendingRequests = [corr = std::weak_ptr<native::CorrelationManager>(correlation_)]() {
        auto c = corr.lock();
        return c ? c->pendingCount() : size_t{0};
    };
    control_ = std::make_unique<ControlHandlers>(std::move(ctx), lifecycle_);
}

BridgeHost::~BridgeHost() {
    // Normal path runs the shutdown steps; this covers start() failures and early exits
    if (started_ && lifecycle_.state() != HostState::Stopped) {
        http_->shutdown(std::chrono::milliseconds(0));
        correlation_->failAll(Error{ErrorCode::SystemShutdown, "Host is shutting down"});
        transport_->stop();
    }
}

void BridgeHost::wireTransport() {
    std::weak_ptr<native::CorrelationManager> corr = correlation_;
    transport_->setReplyRouter([corr](const native::RpcReply& reply) {
        auto c = corr.lock();
        return c && c->resolve(reply);
    });

    transport_->setDisconnectListener([corr](const Error& error) {
        if (auto c = corr.lock()) {
            const auto failed = c->failAll(Error{ErrorCode::NetworkError, error.message});
            if (failed > 0)
                spdlog::warn("Failed {} pending request(s): {}", failed, error.message);
        }
    });

    const bool exitOnDisconnect = opts_.config.exitOnDisconnect;
    transport_->setClosedListener([this, exitOnDisconnect](native::TransportState state) {
        if (!exitOnDisconnect) {
            spdlog::warn("Companion gone ({}); staying alive for MCP clients",
                         native::transportStateName(state));
            return;
        }
        lifecycle_.requestShutdown(state == native::TransportState::Error
                                       ? ShutdownReason::TransportError
                                       : ShutdownReason::TransportClosed);
    });

    std::weak_ptr<mcp::HttpMcpServer> http = http_;
    transport_->registerPushConsumer(
        std::string(native::message_type::RESOURCE_UPDATED), [http](const native::PushMessage& push) {
            std::string uri;
            if (push.data.is_object() && push.data.contains("uri") && push.data["uri"].is_string())
                uri = push.data["uri"].get<std::string>();
            if (uri.empty()) {
                spdlog::warn("resource_updated without uri: {}", push.raw.dump());
                return;
            }
            auto h = http.lock();
            if (!h)
                return;
            const nlohmann::json notification{
                {"jsonrpc", "2.0"},
                {"method", std::string(mcp::protocol::NOTIFY_RESOURCES_UPDATED)},
                {"params", {{"uri", uri}}}};
            const auto sessions = h->broadcast(notification);
            spdlog::debug("Resource {} updated; notified {} session(s)", uri, sessions);
        });

    control_->registerWith(*transport_);
}

void BridgeHost::registerShutdownSteps() {
    const auto drain = opts_.config.drainTimeout;

    lifecycle_.addShutdownStep("stop-accepting", [this]() {
        http_->stopAccepting();
        mcp_->beginDrain();
    });

    lifecycle_.addShutdownStep("drain-pending", [this, drain]() {
        if (mcp_->waitForIdle(drain)) {
            spdlog::info("All in-flight MCP calls completed");
        } else {
            spdlog::warn("{} MCP call(s) still running after {}ms drain", mcp_->inFlightCalls(),
                         drain.count());
        }
        const auto cancelled =
            correlation_->failAll(Error{ErrorCode::SystemShutdown, "Host is shutting down"});
        if (cancelled > 0)
            spdlog::warn("Cancelled {} pending companion request(s)", cancelled);
        // Cancelled calls return promptly; let their MCP responses go out
        mcp_->waitForIdle(std::chrono::milliseconds(500));
    });

    lifecycle_.addShutdownStep("stop-native", [this]() { transport_->stop(); });

    lifecycle_.addShutdownStep("release-listener",
                               [this]() { http_->shutdown(std::chrono::milliseconds(0)); });
}

Result<void> BridgeHost::start() {
    const auto& cfg = opts_.config;
    spdlog::info("Starting {} {} (run mode: {})", NMBRIDGE_HOST_NAME, NMBRIDGE_VERSION_STRING,
                 cfg.runMode);

    auto registered = browser::BrowserCapabilities(correlation_).registerWith(*mcp_);
    if (!registered) {
        return Error{registered.error().code,
                     "Capability registration failed: " + registered.error().message};
    }
    spdlog::info("Registered {} tool(s) and {} resource(s)", mcp_->registry().toolCount(),
                 mcp_->registry().resourceCount());

    wireTransport();
    registerShutdownSteps();

    auto listening = http_->start();
    if (!listening)
        return listening.error();

    auto opened = transport_->start();
    if (!opened) {
        http_->shutdown(std::chrono::milliseconds(0));
        return opened.error();
    }

    started_ = true;
    lifecycle_.markRunning();
    spdlog::info("Host running; MCP endpoint {} (port {})", cfg.baseUrl, http_->port());
    return Result<void>();
}

int BridgeHost::run() {
    return lifecycle_.run();
}

} // namespace nmbridge::host
