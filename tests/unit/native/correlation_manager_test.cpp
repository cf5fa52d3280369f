#include <gtest/gtest.h>

#include <nmbridge/native/correlation_manager.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace nmbridge;
using namespace nmbridge::native;
using namespace std::chrono_literals;

namespace {

// Records outbound requests; an optional hook runs inline on every send
class RecordingSink : public IMessageSink {
public:
    Result<void> send(const json& message) override {
        std::function<void(const json&)> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failWith_)
                return *failWith_;
            sent_.push_back(message);
            hook = onSend_;
        }
        cv_.notify_all();
        if (hook)
            hook(message);
        return Result<void>();
    }

    void onSend(std::function<void(const json&)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        onSend_ = std::move(hook);
    }

    void failWith(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failWith_ = std::move(error);
    }

    bool waitForSent(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return sent_.size() >= count; });
    }

    std::vector<json> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<json> sent_;
    std::optional<Error> failWith_;
    std::function<void(const json&)> onSend_;
};

RpcReply replyTo(const json& request, json result) {
    RpcReply reply;
    reply.id = request.at("id").get<std::string>();
    reply.result = std::move(result);
    return reply;
}

} // namespace

class CorrelationManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<RecordingSink>();
        CorrelationManager::Config cfg;
        cfg.defaultTimeout = 2000ms;
        manager_ = std::make_unique<CorrelationManager>(sink_, cfg);
    }

    std::shared_ptr<RecordingSink> sink_;
    std::unique_ptr<CorrelationManager> manager_;
};

TEST_F(CorrelationManagerTest, RequestCarriesPrefixedId) {
    sink_->onSend([this](const json& req) { manager_->resolve(replyTo(req, json::object())); });

    ASSERT_TRUE(manager_->call("get_dom_state", json{{"a", 1}}));
    auto req = sink_->sent().front();
    EXPECT_EQ(req["type"], "rpc_request");
    EXPECT_EQ(req["method"], "get_dom_state");
    EXPECT_EQ(req["params"]["a"], 1);
    EXPECT_EQ(req["id"].get<std::string>().rfind("req_", 0), 0u);
}

TEST_F(CorrelationManagerTest, ReplyWithinDeadlineResolvesCall) {
    std::thread responder([this] {
        ASSERT_TRUE(sink_->waitForSent(1, 2s));
        std::this_thread::sleep_for(50ms);
        EXPECT_TRUE(manager_->resolve(replyTo(sink_->sent().front(), json{{"echo", "hi"}})));
    });

    auto result = manager_->call("echo", json::object(), 1000ms);
    responder.join();

    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value()["echo"], "hi");
    EXPECT_EQ(manager_->pendingCount(), 0u);
}

TEST_F(CorrelationManagerTest, MissingReplyTimesOut) {
    const auto begin = std::chrono::steady_clock::now();
    auto result = manager_->call("slow", json::object(), 100ms);
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_NE(result.error().message.find("RPC request timeout: slow (id: req_"),
              std::string::npos);
    EXPECT_GE(elapsed, 100ms);
    EXPECT_EQ(manager_->pendingCount(), 0u);

    // A reply arriving after the deadline no longer matches anything
    EXPECT_FALSE(manager_->resolve(replyTo(sink_->sent().front(), json::object())));
}

TEST_F(CorrelationManagerTest, RemoteErrorIsPropagated) {
    sink_->onSend([this](const json& req) {
        RpcReply reply;
        reply.id = req["id"].get<std::string>();
        reply.error = RpcError{-1, "boom"};
        manager_->resolve(reply);
    });

    auto result = manager_->call("explode");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::RemoteError);
    EXPECT_EQ(result.error().message, "RPC error: boom");
}

TEST_F(CorrelationManagerTest, MissingResultResolvesToNull) {
    sink_->onSend([this](const json& req) {
        RpcReply reply;
        reply.id = req["id"].get<std::string>();
        manager_->resolve(reply);
    });

    auto result = manager_->call("noop");
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().is_null());
}

TEST_F(CorrelationManagerTest, SendFailureLeavesNothingPending) {
    sink_->failWith(Error{ErrorCode::NetworkError, "pipe closed"});

    auto result = manager_->call("anything");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(result.error().message, "pipe closed");
    EXPECT_EQ(manager_->pendingCount(), 0u);
}

TEST_F(CorrelationManagerTest, UnknownReplyIsIgnored) {
    RpcReply stray;
    stray.id = "req_nobody";
    stray.result = json(1);
    EXPECT_FALSE(manager_->resolve(stray));
}

TEST_F(CorrelationManagerTest, ConcurrentCallsMatchOutOfOrderReplies) {
    constexpr int kCalls = 8;
    std::vector<std::future<Result<json>>> calls;
    for (int i = 0; i < kCalls; ++i) {
        calls.push_back(std::async(std::launch::async, [this, i] {
            return manager_->call("square", json{{"n", i}});
        }));
    }
    ASSERT_TRUE(sink_->waitForSent(kCalls, 2s));
    EXPECT_EQ(manager_->pendingCount(), static_cast<size_t>(kCalls));

    auto requests = sink_->sent();
    std::set<std::string> ids;
    for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
        ids.insert((*it)["id"].get<std::string>());
        const int n = (*it)["params"]["n"];
        EXPECT_TRUE(manager_->resolve(replyTo(*it, json(n * n))));
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(kCalls));

    for (int i = 0; i < kCalls; ++i) {
        auto result = calls[i].get();
        ASSERT_TRUE(result);
        EXPECT_EQ(result.value().get<int>(), i * i);
    }
    EXPECT_TRUE(manager_->waitForEmpty(10ms));
}

TEST_F(CorrelationManagerTest, FailAllWakesWaitersAndRefusesNewCalls) {
    auto blocked = std::async(std::launch::async, [this] { return manager_->call("hang"); });
    ASSERT_TRUE(sink_->waitForSent(1, 2s));
    EXPECT_FALSE(manager_->waitForEmpty(20ms));

    EXPECT_EQ(manager_->failAll(Error{ErrorCode::SystemShutdown, "Host is shutting down"}), 1u);
    auto result = blocked.get();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::SystemShutdown);
    EXPECT_TRUE(manager_->isClosed());
    EXPECT_TRUE(manager_->waitForEmpty(10ms));

    auto refused = manager_->call("later");
    ASSERT_FALSE(refused);
    EXPECT_EQ(refused.error().code, ErrorCode::SystemShutdown);
    EXPECT_EQ(sink_->sent().size(), 1u);

    EXPECT_EQ(manager_->failAll(Error{ErrorCode::NetworkError, "again"}), 0u);
}
