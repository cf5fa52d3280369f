#include <nmbridge/core/uuid.h>
#include <nmbridge/native/correlation_manager.h>

#include <spdlog/spdlog.h>

#include <vector>

namespace nmbridge::native {

CorrelationManager::CorrelationManager(std::shared_ptr<IMessageSink> sink)
    : CorrelationManager(std::move(sink), Config{}) {}

CorrelationManager::CorrelationManager(std::shared_ptr<IMessageSink> sink, Config cfg)
    : sink_(std::move(sink)), cfg_(std::move(cfg)) {}

Result<json> CorrelationManager::call(const std::string& method, const json& params,
                                      std::optional<std::chrono::milliseconds> timeout) {
    const auto waitFor = timeout.value_or(cfg_.defaultTimeout);

    auto pending = std::make_unique<PendingRequest>();
    pending->id = core::generateId(cfg_.idPrefix);
    pending->method = method;
    pending->createdAt = std::chrono::steady_clock::now();
    auto future = pending->completion.get_future();
    const std::string id = pending->id;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closedWith_) {
            return *closedWith_;
        }
        pending_.emplace(id, std::move(pending));
    }

    spdlog::debug("Sending RPC request {} (id: {}, timeout: {}ms)", method, id, waitFor.count());
    auto sent = sink_->send(toJson(RpcCall{id, method, params}));
    if (!sent) {
        if (takePending(id)) {
            spdlog::error("Failed to send RPC request {}: {}", method, sent.error().message);
            return sent.error();
        }
        // Already failed by failAll; its outcome stands
        return future.get();
    }

    if (future.wait_for(waitFor) == std::future_status::ready) {
        return future.get();
    }

    if (takePending(id)) {
        spdlog::warn("RPC request timeout: {} (id: {}) after {}ms", method, id, waitFor.count());
        return Error{ErrorCode::Timeout, "RPC request timeout: " + method + " (id: " + id + ")"};
    }
    // A resolver removed the entry first and is about to complete the promise
    return future.get();
}

std::unique_ptr<PendingRequest> CorrelationManager::takePending(const std::string& id) {
    std::unique_ptr<PendingRequest> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto node = pending_.extract(id);
        if (node.empty())
            return nullptr;
        taken = std::move(node.mapped());
        if (pending_.empty())
            drainedCv_.notify_all();
    }
    return taken;
}

bool CorrelationManager::resolve(const RpcReply& reply) {
    auto pending = takePending(reply.id);
    if (!pending) {
        return false;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - pending->createdAt);
    if (reply.error) {
        spdlog::debug("RPC {} (id: {}) failed after {}ms: {}", pending->method, reply.id,
                      elapsed.count(), reply.error->message);
        pending->completion.set_value(
            Result<json>(Error{ErrorCode::RemoteError, "RPC error: " + reply.error->message}));
    } else {
        spdlog::debug("RPC {} (id: {}) resolved after {}ms", pending->method, reply.id,
                      elapsed.count());
        pending->completion.set_value(Result<json>(reply.result.value_or(json(nullptr))));
    }
    return true;
}

size_t CorrelationManager::failAll(const Error& error) {
    std::vector<std::unique_ptr<PendingRequest>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closedWith_) {
            closedWith_ = error;
        }
        failed.reserve(pending_.size());
        for (auto& [id, pending] : pending_) {
            failed.push_back(std::move(pending));
        }
        pending_.clear();
        drainedCv_.notify_all();
    }

    for (auto& pending : failed) {
        pending->completion.set_value(Result<json>(error));
    }
    if (!failed.empty()) {
        spdlog::warn("Failed {} pending RPC request(s): {}", failed.size(), error.message);
    }
    return failed.size();
}

bool CorrelationManager::waitForEmpty(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drainedCv_.wait_for(lock, timeout, [this] { return pending_.empty(); });
}

size_t CorrelationManager::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool CorrelationManager::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closedWith_.has_value();
}

} // namespace nmbridge::native
