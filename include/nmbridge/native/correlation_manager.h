#pragma once

#include <nmbridge/core/types.h>
#include <nmbridge/native/native_message.h>
#include <nmbridge/native/native_transport.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace nmbridge::native {

// One outstanding host -> companion request
struct PendingRequest {
    std::string id;
    std::string method;
    SteadyTimePoint createdAt;
    std::promise<Result<json>> completion;
};

/**
 * Turns the companion's asynchronous, id-tagged replies into blocking calls.
 *
 * The pending table is the single source of truth for whether a call is outstanding. Every
 * terminal outcome (reply, timeout, mass failure) removes the entry under the table lock, and only
 * the side that removed it completes the promise. Callers wait on their own future, never on the
 * table lock.
 */
class CorrelationManager {
public:
    struct Config {
        std::chrono::milliseconds defaultTimeout{5000};
        std::string idPrefix = "req";
    };

    explicit CorrelationManager(std::shared_ptr<IMessageSink> sink);
    CorrelationManager(std::shared_ptr<IMessageSink> sink, Config cfg);

    CorrelationManager(const CorrelationManager&) = delete;
    CorrelationManager& operator=(const CorrelationManager&) = delete;

    // Send a request and block until it resolves, times out or is failed
    Result<json> call(const std::string& method, const json& params = json::object(),
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Route a reply to its pending request. Returns false when no request matches.
    bool resolve(const RpcReply& reply);

    // Fail every pending request with `error` and refuse later calls with the same error.
    // Returns the number of requests failed.
    size_t failAll(const Error& error);

    // Wait until the pending table is empty or the timeout elapses
    bool waitForEmpty(std::chrono::milliseconds timeout);

    size_t pendingCount() const;
    bool isClosed() const;
    std::chrono::milliseconds defaultTimeout() const noexcept { return cfg_.defaultTimeout; }

private:
    std::unique_ptr<PendingRequest> takePending(const std::string& id);

    std::shared_ptr<IMessageSink> sink_;
    Config cfg_;

    mutable std::mutex mutex_;
    std::condition_variable drainedCv_;
    std::unordered_map<std::string, std::unique_ptr<PendingRequest>> pending_;
    std::optional<Error> closedWith_;
};

} // namespace nmbridge::native
