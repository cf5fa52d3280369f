#pragma once

#include <nmbridge/core/types.h>
#include <nmbridge/native/message_framing.h>
#include <nmbridge/native/native_message.h>

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <unistd.h>

namespace nmbridge::native {

enum class TransportState : int {
    Idle = 0,
    Connected = 1,
    Disconnected = 2, // peer closed its end (EOF)
    Error = 3,        // read failure or protocol violation
    Closing = 4       // stop() requested locally
};

const char* transportStateName(TransportState state) noexcept;

/**
 * Outbound half of the companion channel. The correlation manager and the control handlers only
 * need to send, so they hold this interface rather than the full transport.
 */
class IMessageSink {
public:
    virtual ~IMessageSink() = default;
    virtual Result<void> send(const json& message) = 0;
};

/**
 * Native messaging transport over a pair of file descriptors (stdin/stdout by default).
 *
 * A dedicated read thread decodes frames and routes them: replies go to the reply router inline,
 * inbound calls and push messages run on a small handler pool so a slow handler never stalls the
 * pipe. Writes are serialized by a mutex so frames from concurrent callers never interleave.
 */
class NativeTransport : public IMessageSink {
public:
    using RpcHandler = std::function<Result<json>(const json& params)>;
    using PushConsumer = std::function<void(const PushMessage&)>;
    using ReplyRouter = std::function<bool(const RpcReply&)>;
    using DisconnectListener = std::function<void(const Error&)>;
    using ClosedListener = std::function<void(TransportState)>;

    struct Config {
        int inputFd = STDIN_FILENO;
        int outputFd = STDOUT_FILENO;
        size_t handlerThreads = 4;
        size_t maxInboundSize = NativeFramer::MAX_INBOUND_SIZE;
        size_t maxOutboundSize = NativeFramer::MAX_OUTBOUND_SIZE;
    };

    NativeTransport();
    explicit NativeTransport(Config cfg);
    ~NativeTransport() override;

    NativeTransport(const NativeTransport&) = delete;
    NativeTransport& operator=(const NativeTransport&) = delete;

    // Registration happens during startup wiring. A duplicate method or push type is a
    // programming error and throws std::logic_error.
    void registerHandler(const std::string& method, RpcHandler handler);
    void registerPushConsumer(const std::string& type, PushConsumer consumer);

    void setReplyRouter(ReplyRouter router);
    // Fired once when the peer goes away (EOF or read error); never fired by stop()
    void setDisconnectListener(DisconnectListener listener);
    void setClosedListener(ClosedListener listener);

    Result<void> send(const json& message) override;

    Result<void> start();
    void stop();

    TransportState state() const noexcept { return state_.load(); }
    bool isConnected() const noexcept { return state_.load() == TransportState::Connected; }

private:
    void readLoop();
    void dispatchFrame(const std::string& payload);
    void handleCall(const RpcCall& call);
    void handlePush(const PushMessage& push);
    void sendReply(RpcReply reply);
    void onPeerClosed(TransportState finalState, Error error);
    Result<void> writeAll(const uint8_t* data, size_t size);

    Config cfg_;
    NativeFramer framer_;
    FrameReader reader_;

    std::atomic<TransportState> state_{TransportState::Idle};
    std::atomic<bool> running_{false};
    std::atomic<bool> peerClosedNotified_{false};

    mutable std::mutex handlersMutex_;
    std::unordered_map<std::string, RpcHandler> handlers_;
    std::unordered_map<std::string, PushConsumer> pushConsumers_;
    ReplyRouter replyRouter_;
    DisconnectListener disconnectListener_;
    ClosedListener closedListener_;

    std::mutex writeMutex_;
    int wakePipe_[2] = {-1, -1};
    std::thread readThread_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace nmbridge::native
