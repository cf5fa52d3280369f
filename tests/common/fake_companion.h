#pragma once

#include <nmbridge/native/message_framing.h>
#include <nmbridge/native/native_message.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include <unistd.h>

namespace nmbridge::test {

using json = nlohmann::json;

/**
 * The browser side of a native messaging channel, over two pipes.
 *
 * The host under test reads hostInputFd() and writes hostOutputFd(). Every frame the host writes
 * is recorded; rpc_request frames are passed to the responder, whose return value (if any) is
 * framed back. Declare the companion before the transport so the transport stops first.
 */
class FakeCompanion {
public:
    using Responder = std::function<std::optional<json>(const json& request)>;

    FakeCompanion() {
        if (::pipe(toHost_) != 0 || ::pipe(fromHost_) != 0)
            throw std::runtime_error("pipe() failed");
    }

    ~FakeCompanion() {
        closeWrite();
        closeFd(fromHost_[1]);
        if (reader_.joinable())
            reader_.join();
        closeFd(fromHost_[0]);
        closeFd(toHost_[0]);
    }

    FakeCompanion(const FakeCompanion&) = delete;
    FakeCompanion& operator=(const FakeCompanion&) = delete;

    int hostInputFd() const { return toHost_[0]; }
    int hostOutputFd() const { return fromHost_[1]; }

    void setResponder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void start() {
        reader_ = std::thread([this]() { readLoop(); });
    }

    void send(const json& message) {
        native::NativeFramer framer(native::NativeFramer::MAX_INBOUND_SIZE);
        auto frame = framer.frame(message.dump());
        sendRaw(frame.value());
    }

    void sendRaw(const std::vector<uint8_t>& bytes) {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (toHost_[1] < 0)
            return;
        size_t off = 0;
        while (off < bytes.size()) {
            ssize_t n = ::write(toHost_[1], bytes.data() + off, bytes.size() - off);
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                throw std::runtime_error("companion write failed");
            off += static_cast<size_t>(n);
        }
    }

    // Host sees EOF on its input
    void closeWrite() {
        std::lock_guard<std::mutex> lock(writeMutex_);
        closeFd(toHost_[1]);
    }

    std::vector<json> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    bool waitForMessages(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return received_.size() >= count; });
    }

    static json reply(const json& request, json result) {
        return json{{"type", "rpc_response"}, {"id", request.at("id")}, {"result", std::move(result)}};
    }

    static json errorReply(const json& request, int code, const std::string& message) {
        return json{{"type", "rpc_response"},
                    {"id", request.at("id")},
                    {"error", {{"code", code}, {"message", message}}}};
    }

private:
    static void closeFd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    void readLoop() {
        native::FrameReader reader;
        uint8_t buf[8192];
        for (;;) {
            ssize_t n = ::read(fromHost_[0], buf, sizeof(buf));
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                return;
            reader.append(std::span<const uint8_t>(buf, static_cast<size_t>(n)));
            while (reader.status() == native::FrameReader::FrameStatus::FrameComplete) {
                auto payload = reader.try_read_frame();
                auto msg = json::parse(payload.value());
                Responder responder;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    received_.push_back(msg);
                    responder = responder_;
                }
                cv_.notify_all();
                if (responder && msg.value("type", "") == "rpc_request") {
                    if (auto out = responder(msg))
                        send(*out);
                }
            }
        }
    }

    int toHost_[2] = {-1, -1};
    int fromHost_[2] = {-1, -1};
    std::thread reader_;
    mutable std::mutex mutex_;
    std::mutex writeMutex_;
    std::condition_variable cv_;
    std::vector<json> received_;
    Responder responder_;
};

} // namespace nmbridge::test
