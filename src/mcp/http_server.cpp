#include <nmbridge/core/uuid.h>
#include <nmbridge/mcp/http_server.h>

#include <boost/algorithm/string.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

#include <future>

using nlohmann::json;

namespace nmbridge::mcp {

namespace {

constexpr const char* kServerName = "nmbridge";
constexpr const char* kSessionHeader = "Mcp-Session-Id";

std::optional<std::string> getQueryParam(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos)
        return std::nullopt;
    auto q = target.substr(pos + 1);
    std::vector<std::string> parts;
    boost::split(parts, q, boost::is_any_of("&"));
    for (auto& p : parts) {
        auto eq = p.find('=');
        if (eq == std::string::npos)
            continue;
        if (p.substr(0, eq) == key)
            return p.substr(eq + 1);
    }
    return std::nullopt;
}

void applyCors(http::response<http::string_body>& res) {
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Mcp-Session-Id");
    res.set(http::field::access_control_expose_headers, "Mcp-Session-Id");
}

http::response<http::string_body> textResponse(http::status status, unsigned version,
                                               std::string body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "text/plain");
    applyCors(res);
    res.body() = std::move(body);
    res.prepare_payload();
    res.keep_alive(false);
    return res;
}

http::response<http::string_body> jsonResponse(http::status status, unsigned version,
                                               const json& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "application/json; charset=utf-8");
    applyCors(res);
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    res.keep_alive(false);
    return res;
}

json parseErrorEnvelope(const std::string& what) {
    return MCPServer::createError(nullptr, protocol::PARSE_ERROR, "parse error: " + what);
}

} // namespace

// --- SSEChannel ---

SSEChannel::SSEChannel(std::shared_ptr<tcp::socket> socket, std::chrono::milliseconds keepAlive)
    : socket_(std::move(socket)), keepAlive_(keepAlive) {}

void SSEChannel::run() {
    beast::error_code ec;
    const std::string hdr = "HTTP/1.1 200 OK\r\n"
                            "Content-Type: text/event-stream\r\n"
                            "Cache-Control: no-cache\r\n"
                            "Connection: keep-alive\r\n"
                            "Access-Control-Allow-Origin: *\r\n\r\n";
    boost::asio::write(*socket_, boost::asio::buffer(hdr), ec);
    if (ec) {
        spdlog::warn("SSE header write failed: {}", ec.message());
        return;
    }
    open_.store(true);
    writerLoop();
}

void SSEChannel::send(const std::string& event, const std::string& data) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closeRequested_.load())
            return;
        std::string ev;
        ev.reserve(data.size() + event.size() + 16);
        ev += "event: ";
        ev += event;
        ev += "\ndata: ";
        ev += data;
        ev += "\n\n";
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

void SSEChannel::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        closeRequested_.store(true);
    }
    cv_.notify_all();
    beast::error_code ec;
    socket_->shutdown(tcp::socket::shutdown_both, ec);
}

void SSEChannel::writerLoop() {
    beast::error_code ec;
    for (;;) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lk(mu_);
            const bool woke = cv_.wait_for(lk, keepAlive_, [this] {
                return closeRequested_.load() || !queue_.empty();
            });
            if (closeRequested_.load())
                break;
            if (woke) {
                chunk = std::move(queue_.front());
                queue_.pop_front();
            } else {
                // Idle: keepalive comment, which also detects a vanished client
                chunk = ": ping\n\n";
            }
        }
        boost::asio::write(*socket_, boost::asio::buffer(chunk), ec);
        if (ec) {
            spdlog::debug("SSE write failed: {}", ec.message());
            break;
        }
    }
    open_.store(false);
    socket_->shutdown(tcp::socket::shutdown_send, ec);
}

// --- SessionRegistry ---

std::shared_ptr<InFlightSession> SessionRegistry::create(const std::string& idPrefix) {
    auto session = std::make_shared<InFlightSession>();
    session->id = core::generateId(idPrefix);
    std::lock_guard<std::mutex> lk(mu_);
    map_[session->id] = Entry{session, {}};
    return session;
}

std::shared_ptr<InFlightSession> SessionRegistry::find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = map_.find(sessionId);
    return it == map_.end() ? nullptr : it->second.session;
}

void SessionRegistry::bind(const std::string& sessionId, std::shared_ptr<SSEChannel> ch) {
    std::lock_guard<std::mutex> lk(mu_);
    if (auto it = map_.find(sessionId); it != map_.end())
        it->second.channel = ch;
}

void SessionRegistry::remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lk(mu_);
    map_.erase(sessionId);
}

bool SessionRegistry::publish(const std::string& sessionId, const json& message) {
    std::shared_ptr<SSEChannel> ch;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = map_.find(sessionId);
        if (it != map_.end())
            ch = it->second.channel.lock();
    }
    if (!ch)
        return false;
    ch->send("message", message.dump(-1, ' ', false, json::error_handler_t::replace));
    return true;
}

size_t SessionRegistry::broadcast(const json& message) {
    std::vector<std::shared_ptr<SSEChannel>> channels;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, entry] : map_) {
            if (auto ch = entry.channel.lock())
                channels.push_back(std::move(ch));
        }
    }
    const auto payload = message.dump(-1, ' ', false, json::error_handler_t::replace);
    for (auto& ch : channels)
        ch->send("message", payload);
    return channels.size();
}

void SessionRegistry::closeAll() {
    std::vector<std::shared_ptr<SSEChannel>> channels;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, entry] : map_) {
            if (auto ch = entry.channel.lock())
                channels.push_back(std::move(ch));
        }
        map_.clear();
    }
    for (auto& ch : channels)
        ch->close();
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return map_.size();
}

// --- HttpMcpServer ---

HttpMcpServer::HttpMcpServer(std::shared_ptr<MCPServer> mcp, Config cfg)
    : mcp_(std::move(mcp)), cfg_(std::move(cfg)), acceptor_(ioc_) {}

HttpMcpServer::~HttpMcpServer() {
    shutdown(std::chrono::milliseconds(0));
}

Result<void> HttpMcpServer::start() {
    beast::error_code ec;
    const auto address = boost::asio::ip::make_address(cfg_.bindAddress, ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid bind address '" + cfg_.bindAddress + "': " + ec.message()};
    }
    const tcp::endpoint ep{address, cfg_.bindPort};
    acceptor_.open(ep.protocol(), ec);
    if (ec) {
        return Error{ErrorCode::NetworkError, "acceptor open failed: " + ec.message()};
    }
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        return Error{ErrorCode::NetworkError, "bind " + cfg_.bindAddress + ":" +
                                                  std::to_string(cfg_.bindPort) +
                                                  " failed: " + ec.message()};
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        return Error{ErrorCode::NetworkError, "listen failed: " + ec.message()};
    }

    boundPort_.store(acceptor_.local_endpoint().port());
    accepting_.store(true);
    doAccept();
    ioThread_ = std::thread([this]() { ioc_.run(); });
    spdlog::info("MCP HTTP/SSE listening on {}:{}", cfg_.bindAddress, boundPort_.load());
    return Result<void>();
}

void HttpMcpServer::doAccept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !accepting_.load())
                return;
            spdlog::warn("accept error: {}", ec.message());
            doAccept();
            return;
        }
        if (!accepting_.load()) {
            beast::error_code ignored;
            socket.close(ignored);
            return;
        }

        auto sock = std::make_shared<tcp::socket>(std::move(socket));
        std::lock_guard<std::mutex> lk(connMutex_);
        reapFinishedLocked();
        const uint64_t connectionId = nextConnectionId_++;
        ++activeConnections_;
        liveSockets_.insert(sock);
        connThreads_.emplace(connectionId, std::thread([this, sock, connectionId]() {
                                 try {
                                     handleConnection(sock);
                                 } catch (const std::exception& e) {
                                     spdlog::error("HTTP connection handler failed: {}", e.what());
                                 }
                                 connectionFinished(sock, connectionId);
                             }));
        doAccept();
    });
}

void HttpMcpServer::connectionFinished(const std::shared_ptr<tcp::socket>& socket,
                                       uint64_t connectionId) {
    beast::error_code ec;
    socket->close(ec);
    std::lock_guard<std::mutex> lk(connMutex_);
    liveSockets_.erase(socket);
    finishedThreads_.push_back(connectionId);
    --activeConnections_;
    connCv_.notify_all();
}

void HttpMcpServer::reapFinishedLocked() {
    for (const auto id : finishedThreads_) {
        auto it = connThreads_.find(id);
        if (it == connThreads_.end())
            continue;
        if (it->second.joinable())
            it->second.join();
        connThreads_.erase(it);
    }
    finishedThreads_.clear();
}

void HttpMcpServer::joinConnectionThreads() {
    std::unordered_map<uint64_t, std::thread> threads;
    {
        std::lock_guard<std::mutex> lk(connMutex_);
        threads.swap(connThreads_);
        finishedThreads_.clear();
    }
    for (auto& [id, thread] : threads) {
        if (!thread.joinable())
            continue;
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
            continue;
        }
        thread.join();
    }
}

size_t HttpMcpServer::activeConnections() const {
    std::lock_guard<std::mutex> lk(connMutex_);
    return activeConnections_;
}

void HttpMcpServer::handleConnection(const std::shared_ptr<tcp::socket>& socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;
    http::request<http::string_body> req;
    http::read(*socket, buffer, req, ec);
    if (ec) {
        spdlog::debug("http read error: {}", ec.message());
        return;
    }

    const std::string target = std::string(req.target());
    const std::string path = target.substr(0, target.find('?'));
    spdlog::debug("HTTP {} {}", std::string(req.method_string()), target);

    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::no_content, req.version()};
        applyCors(res);
        res.set(http::field::access_control_max_age, "86400");
        res.keep_alive(false);
        http::write(*socket, res, ec);
        return;
    }

    if (req.method() == http::verb::get && (path == "/sse" || path == "/mcp/events")) {
        if (mcp_->isDraining()) {
            http::write(*socket,
                        textResponse(http::status::service_unavailable, req.version(),
                                     "shutting down"),
                        ec);
            return;
        }
        handleSse(socket);
        return;
    }

    if (req.method() == http::verb::post && path == "/message") {
        auto sessionId = getQueryParam(target, "sessionId");
        if (!sessionId)
            sessionId = getQueryParam(target, "session");
        if (!sessionId) {
            http::write(*socket,
                        textResponse(http::status::bad_request, req.version(), "missing sessionId"),
                        ec);
            return;
        }
        handleSessionMessage(*socket, req, *sessionId);
        return;
    }

    if (req.method() == http::verb::post &&
        (path == "/" || path == "/mcp" || path == "/mcp/jsonrpc")) {
        std::shared_ptr<InFlightSession> session;
        if (auto h = req.find(kSessionHeader); h != req.end()) {
            session = sessions_.find(std::string(h->value()));
            if (!session) {
                http::write(*socket,
                            textResponse(http::status::not_found, req.version(), "unknown session"),
                            ec);
                return;
            }
        }
        auto res = handleJsonRpc(req, session);
        http::write(*socket, res, ec);
        socket->shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    if (req.method() == http::verb::delete_ && path == "/mcp") {
        if (auto h = req.find(kSessionHeader); h != req.end()) {
            sessions_.remove(std::string(h->value()));
            http::write(*socket, textResponse(http::status::ok, req.version(), "session closed"),
                        ec);
        } else {
            http::write(*socket,
                        textResponse(http::status::bad_request, req.version(), "missing session"),
                        ec);
        }
        return;
    }

    http::write(*socket, textResponse(http::status::not_found, req.version(), "not found"), ec);
}

http::response<http::string_body>
HttpMcpServer::handleJsonRpc(const http::request<http::string_body>& req,
                             std::shared_ptr<InFlightSession>& session) {
    json j;
    try {
        j = json::parse(req.body());
    } catch (const std::exception& e) {
        return jsonResponse(http::status::bad_request, req.version(), parseErrorEnvelope(e.what()));
    }

    const bool isInitialize = j.is_object() && j.contains("method") && j["method"].is_string() &&
                              j["method"].get<std::string>() == protocol::METHOD_INITIALIZE;
    if (!session && isInitialize) {
        session = sessions_.create();
        spdlog::debug("Created MCP session {}", session->id);
    }

    auto response = mcp_->handleRequest(j, session.get());
    http::response<http::string_body> res;
    if (!response) {
        res = textResponse(http::status::accepted, req.version(), "");
    } else {
        res = jsonResponse(http::status::ok, req.version(), *response);
    }
    if (session) {
        res.set(kSessionHeader, session->id);
    }
    return res;
}

void HttpMcpServer::handleSessionMessage(tcp::socket& socket,
                                         const http::request<http::string_body>& req,
                                         const std::string& sessionId) {
    beast::error_code ec;
    auto session = sessions_.find(sessionId);
    if (!session) {
        http::write(socket, textResponse(http::status::not_found, req.version(), "unknown session"),
                    ec);
        return;
    }

    json j;
    try {
        j = json::parse(req.body());
    } catch (const std::exception& e) {
        http::write(socket,
                    jsonResponse(http::status::bad_request, req.version(),
                                 parseErrorEnvelope(e.what())),
                    ec);
        return;
    }

    // Acknowledge at once; the response travels over the event stream
    http::write(socket, textResponse(http::status::accepted, req.version(), "Accepted"), ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);

    auto response = mcp_->handleRequest(j, session.get());
    if (response && !sessions_.publish(sessionId, *response)) {
        spdlog::warn("Dropping response for session {}: event stream closed", sessionId);
    }
}

void HttpMcpServer::handleSse(const std::shared_ptr<tcp::socket>& socket) {
    auto session = sessions_.create();
    auto ch = std::make_shared<SSEChannel>(socket, cfg_.keepAlive);
    sessions_.bind(session->id, ch);
    spdlog::info("SSE session {} connected", session->id);
    ch->send("endpoint", "/message?sessionId=" + session->id);
    ch->run();
    sessions_.remove(session->id);
    spdlog::info("SSE session {} disconnected", session->id);
}

size_t HttpMcpServer::broadcast(const json& notification) {
    return sessions_.broadcast(notification);
}

void HttpMcpServer::stopAccepting() {
    if (!accepting_.exchange(false))
        return;

    if (ioThread_.joinable() && !ioc_.stopped()) {
        auto closed = std::make_shared<std::promise<void>>();
        auto done = closed->get_future();
        boost::asio::post(ioc_, [this, closed]() {
            beast::error_code ec;
            acceptor_.close(ec);
            closed->set_value();
        });
        if (done.wait_for(std::chrono::seconds(2)) == std::future_status::ready) {
            spdlog::info("MCP HTTP server stopped accepting connections");
            return;
        }
        spdlog::warn("Acceptor close did not complete on the io thread");
    }
    beast::error_code ec;
    acceptor_.close(ec);
}

void HttpMcpServer::shutdown(std::chrono::milliseconds drainTimeout) {
    if (stopped_.exchange(true))
        return;

    stopAccepting();

    mcp_->beginDrain();
    if (!mcp_->waitForIdle(drainTimeout)) {
        spdlog::warn("{} MCP call(s) still in flight after {}ms drain", mcp_->inFlightCalls(),
                     drainTimeout.count());
    }

    sessions_.closeAll();
    {
        std::lock_guard<std::mutex> lk(connMutex_);
        for (const auto& sock : liveSockets_) {
            beast::error_code ec;
            sock->shutdown(tcp::socket::shutdown_both, ec);
        }
    }
    {
        std::unique_lock<std::mutex> lk(connMutex_);
        if (!connCv_.wait_for(lk, cfg_.connectionJoinTimeout,
                              [this] { return activeConnections_ == 0; })) {
            spdlog::error("{} HTTP connection(s) did not finish within {}ms; waiting for them",
                          activeConnections_, cfg_.connectionJoinTimeout.count());
        }
    }

    ioc_.stop();
    if (ioThread_.joinable())
        ioThread_.join();
    // Connection threads use this object until they return
    joinConnectionThreads();
    spdlog::info("MCP HTTP server stopped");
}

} // namespace nmbridge::mcp
