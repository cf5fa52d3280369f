#include <nmbridge/native/native_transport.h>

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>

namespace nmbridge::native {

const char* transportStateName(TransportState state) noexcept {
    switch (state) {
        case TransportState::Idle:
            return "idle";
        case TransportState::Connected:
            return "connected";
        case TransportState::Disconnected:
            return "disconnected";
        case TransportState::Error:
            return "error";
        case TransportState::Closing:
            return "closing";
    }
    return "unknown";
}

NativeTransport::NativeTransport() : NativeTransport(Config{}) {}

NativeTransport::NativeTransport(Config cfg)
    : cfg_(cfg), framer_(cfg.maxOutboundSize), reader_(cfg.maxInboundSize),
      pool_(std::make_unique<boost::asio::thread_pool>(cfg.handlerThreads == 0
                                                           ? 1
                                                           : cfg.handlerThreads)) {}

NativeTransport::~NativeTransport() {
    stop();
}

void NativeTransport::registerHandler(const std::string& method, RpcHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    auto [it, inserted] = handlers_.emplace(method, std::move(handler));
    if (!inserted) {
        throw std::logic_error("Native RPC handler already registered for method: " + method);
    }
    spdlog::debug("Registered native RPC handler: {}", method);
}

void NativeTransport::registerPushConsumer(const std::string& type, PushConsumer consumer) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    auto [it, inserted] = pushConsumers_.emplace(type, std::move(consumer));
    if (!inserted) {
        throw std::logic_error("Push consumer already registered for message type: " + type);
    }
    spdlog::debug("Registered push consumer: {}", type);
}

void NativeTransport::setReplyRouter(ReplyRouter router) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    replyRouter_ = std::move(router);
}

void NativeTransport::setDisconnectListener(DisconnectListener listener) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    disconnectListener_ = std::move(listener);
}

void NativeTransport::setClosedListener(ClosedListener listener) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    closedListener_ = std::move(listener);
}

Result<void> NativeTransport::send(const json& message) {
    const auto st = state_.load();
    if (st == TransportState::Disconnected || st == TransportState::Error) {
        return Error{ErrorCode::NetworkError,
                     std::string("Native transport not connected (") + transportStateName(st) +
                         ")"};
    }

    std::string payload;
    try {
        payload = message.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Failed to serialize message: ") +
                                                 e.what()};
    }

    auto frame = framer_.frame(payload);
    if (!frame) {
        spdlog::error("Refusing to send native message: {}", frame.error().message);
        return frame.error();
    }

    const auto& bytes = frame.value();
    std::lock_guard<std::mutex> lock(writeMutex_);
    return writeAll(bytes.data(), bytes.size());
}

Result<void> NativeTransport::writeAll(const uint8_t* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        const ssize_t n = ::write(cfg_.outputFd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Error{ErrorCode::NetworkError,
                         std::string("Native transport write failed: ") + std::strerror(errno)};
        }
        written += static_cast<size_t>(n);
    }
    return Result<void>();
}

Result<void> NativeTransport::start() {
    if (running_.load()) {
        return Error{ErrorCode::InvalidState, "Native transport already started"};
    }
    if (::fcntl(cfg_.inputFd, F_GETFD) == -1) {
        return Error{ErrorCode::NetworkError, "Native input descriptor is not open"};
    }
    if (::fcntl(cfg_.outputFd, F_GETFD) == -1) {
        return Error{ErrorCode::NetworkError, "Native output descriptor is not open"};
    }
    if (::pipe(wakePipe_) != 0) {
        return Error{ErrorCode::InternalError,
                     std::string("Failed to create wake pipe: ") + std::strerror(errno)};
    }

    state_.store(TransportState::Connected);
    peerClosedNotified_.store(false);
    running_.store(true);
    readThread_ = std::thread(&NativeTransport::readLoop, this);
    spdlog::info("Native transport started (in fd {}, out fd {})", cfg_.inputFd, cfg_.outputFd);
    return Result<void>();
}

void NativeTransport::stop() {
    const bool wasRunning = running_.exchange(false);
    if (wasRunning) {
        auto expected = TransportState::Connected;
        state_.compare_exchange_strong(expected, TransportState::Closing);
        const char wake = 1;
        if (::write(wakePipe_[1], &wake, 1) < 0) {
            spdlog::debug("Native transport wake write failed: {}", std::strerror(errno));
        }
    }

    if (readThread_.joinable()) {
        if (readThread_.get_id() == std::this_thread::get_id()) {
            spdlog::error("NativeTransport::stop called from the read thread; detaching");
            readThread_.detach();
        } else {
            readThread_.join();
        }
    }

    // Flush replies of inbound calls that were already dispatched
    if (pool_) {
        pool_->join();
    }

    for (int& fd : wakePipe_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    if (wasRunning) {
        auto expected = TransportState::Closing;
        state_.compare_exchange_strong(expected, TransportState::Disconnected);
        spdlog::info("Native transport stopped");
    }
}

void NativeTransport::readLoop() {
    std::vector<uint8_t> chunk(64 * 1024);

    while (running_.load()) {
        std::array<pollfd, 2> fds{};
        fds[0].fd = cfg_.inputFd;
        fds[0].events = POLLIN | POLLHUP;
        fds[1].fd = wakePipe_[0];
        fds[1].events = POLLIN;

        const int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            onPeerClosed(TransportState::Error,
                         Error{ErrorCode::NetworkError,
                               std::string("Native transport poll failed: ") +
                                   std::strerror(errno)});
            return;
        }

        if (fds[1].revents != 0) {
            spdlog::debug("Native read loop woken for stop");
            return;
        }

        if (fds[0].revents & POLLNVAL) {
            onPeerClosed(TransportState::Error,
                         Error{ErrorCode::NetworkError, "Native input descriptor closed"});
            return;
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            continue;

        const ssize_t n = ::read(cfg_.inputFd, chunk.data(), chunk.size());
        if (n == 0) {
            onPeerClosed(TransportState::Disconnected,
                         Error{ErrorCode::NetworkError, "Native transport disconnected (EOF)"});
            return;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            onPeerClosed(TransportState::Error,
                         Error{ErrorCode::NetworkError, std::string("Native transport read failed: ") +
                                                            std::strerror(errno)});
            return;
        }

        reader_.append(std::span<const uint8_t>(chunk.data(), static_cast<size_t>(n)));
        for (;;) {
            const auto status = reader_.status();
            if (status == FrameReader::FrameStatus::NeedMoreData)
                break;
            auto frame = reader_.try_read_frame();
            if (!frame) {
                // Oversized length header: the stream cannot be resynchronized
                onPeerClosed(TransportState::Error,
                             Error{ErrorCode::NetworkError,
                                   "Native transport protocol error: " + frame.error().message});
                return;
            }
            dispatchFrame(frame.value());
        }
    }
}

void NativeTransport::dispatchFrame(const std::string& payload) {
    auto parsed = parseJson(payload);
    if (!parsed) {
        spdlog::warn("Dropping malformed native message: {}", parsed.error().message);
        return;
    }
    Result<InboundMessage> classified = Error{ErrorCode::InvalidData, "unclassified"};
    try {
        classified = classifyMessage(parsed.value());
    } catch (const json::exception& e) {
        spdlog::warn("Dropping native message with mistyped fields: {}", e.what());
        return;
    }
    if (!classified) {
        spdlog::warn("Dropping unclassifiable native message: {}", classified.error().message);
        return;
    }

    InboundMessage message = std::move(classified).value();
    std::visit(Overloaded{
                   [this](RpcReply& reply) {
                       ReplyRouter router;
                       {
                           std::lock_guard<std::mutex> lock(handlersMutex_);
                           router = replyRouter_;
                       }
                       if (!router || !router(reply)) {
                           spdlog::warn("Received response for unknown request ID: {}", reply.id);
                       }
                   },
                   [this](RpcCall& call) {
                       boost::asio::post(*pool_,
                                         [this, call = std::move(call)]() { handleCall(call); });
                   },
                   [this](PushMessage& push) {
                       boost::asio::post(*pool_,
                                         [this, push = std::move(push)]() { handlePush(push); });
                   }},
               message);
}

void NativeTransport::handleCall(const RpcCall& call) {
    RpcHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        if (auto it = handlers_.find(call.method); it != handlers_.end())
            handler = it->second;
    }

    RpcReply reply;
    reply.id = call.id;
    if (!handler) {
        spdlog::warn("No handler registered for native RPC method: {}", call.method);
        reply.error = RpcError{rpc_error::METHOD_NOT_FOUND, "Method not found: " + call.method};
        sendReply(std::move(reply));
        return;
    }

    spdlog::debug("Native RPC call: {} (id: {})", call.method, call.id);
    try {
        auto result = handler(call.params);
        if (result) {
            reply.result = std::move(result).value();
        } else {
            reply.error =
                RpcError{rpc_error::SERVER_ERROR, "Server error: " + result.error().message};
        }
    } catch (const std::exception& e) {
        spdlog::error("Native RPC handler '{}' threw: {}", call.method, e.what());
        reply.error = RpcError{rpc_error::SERVER_ERROR, std::string("Server error: ") + e.what()};
    }
    sendReply(std::move(reply));
}

void NativeTransport::handlePush(const PushMessage& push) {
    PushConsumer consumer;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        if (auto it = pushConsumers_.find(push.type); it != pushConsumers_.end())
            consumer = it->second;
    }
    if (!consumer) {
        spdlog::warn("No consumer registered for native message type: {}", push.type);
        if (auto r = send(makeErrorMessage("Unknown message type: " + push.type)); !r) {
            spdlog::warn("Failed to report unknown message type: {}", r.error().message);
        }
        return;
    }
    try {
        consumer(push);
    } catch (const std::exception& e) {
        spdlog::error("Push consumer for '{}' threw: {}", push.type, e.what());
    }
}

void NativeTransport::sendReply(RpcReply reply) {
    if (auto r = send(toJson(reply)); !r) {
        spdlog::error("Failed to send reply for request {}: {}", reply.id, r.error().message);
    }
}

void NativeTransport::onPeerClosed(TransportState finalState, Error error) {
    state_.store(finalState);
    if (peerClosedNotified_.exchange(true))
        return;

    if (finalState == TransportState::Error) {
        spdlog::error("{}", error.message);
    } else {
        spdlog::info("{}", error.message);
    }

    DisconnectListener onDisconnect;
    ClosedListener onClosed;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        onDisconnect = disconnectListener_;
        onClosed = closedListener_;
    }
    if (onDisconnect)
        onDisconnect(error);
    if (onClosed)
        onClosed(finalState);
}

} // namespace nmbridge::native
