#include <nmbridge/core/uuid.h>
#include <nmbridge/host/control_handlers.h>
#include <nmbridge/native/native_transport.h>

#include <spdlog/spdlog.h>

namespace nmbridge::host {

ControlHandlers::ControlHandlers(Context ctx, LifecycleCoordinator& lifecycle)
    : ctx_(std::move(ctx)),
      lifecycle_(lifecycle),
      startTime_(std::chrono::system_clock::now()),
      startSteady_(std::chrono::steady_clock::now()) {}

void ControlHandlers::registerWith(native::NativeTransport& transport) {
    transport.registerHandler("status", [this](const json& p) { return status(p); });
    transport.registerHandler("init", [this](const json& p) { return init(p); });
    transport.registerHandler("shutdown", [this](const json& p) { return shutdown(p); });
}

Result<json> ControlHandlers::status(const json&) const {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - startSteady_);

    json j;
    j["status"] = hostStateName(lifecycle_.state());
    j["name"] = ctx_.name;
    j["version"] = ctx_.version;
    j["run_mode"] = ctx_.runMode;
    j["start_time"] = core::formatTimestamp(startTime_);
    j["current_time"] = core::formatTimestamp(std::chrono::system_clock::now());
    j["uptime"] = core::formatUptime(uptime);
    j["uptime_seconds"] = uptime.count();
    j["sse_port"] = ctx_.ssePort ? ctx_.ssePort() : 0;
    j["sse_base_url"] = ctx_.sseBaseUrl;
    j["pending_requests"] = ctx_.pendingRequests ? ctx_.pendingRequests() : 0;
    j["initialized"] = initialized();
    return j;
}

Result<json> ControlHandlers::init(const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++initCount_;
    if (!firstInitTime_) {
        firstInitTime_ = std::chrono::system_clock::now();
        spdlog::info("Companion initialized host{}",
                     params.is_object() && params.contains("capabilities")
                         ? " with capabilities " + params["capabilities"].dump()
                         : std::string{});
    } else {
        spdlog::debug("Companion re-sent init (count {})", initCount_);
    }
    return json{{"status", "initialized"},
                {"init_count", initCount_},
                {"first_init_time", core::formatTimestamp(*firstInitTime_)}};
}

Result<json> ControlHandlers::shutdown(const json&) {
    spdlog::info("Shutdown requested by companion");
    lifecycle_.requestShutdown(ShutdownReason::ControlRequest);
    return json{{"status", "shutting_down"}};
}

bool ControlHandlers::initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initCount_ > 0;
}

int ControlHandlers::initCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initCount_;
}

} // namespace nmbridge::host
