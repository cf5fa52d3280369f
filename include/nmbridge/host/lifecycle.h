#pragma once

#include <nmbridge/core/types.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace nmbridge::host {

enum class HostState {
    Starting = 0,
    Running,
    ShuttingDown,
    Stopped,
};

const char* hostStateName(HostState state) noexcept;

enum class ShutdownReason {
    Signal,
    ControlRequest,
    TransportClosed,
    TransportError,
};

const char* shutdownReasonName(ShutdownReason reason) noexcept;

// Process exit status for a completed shutdown
int exitCodeFor(ShutdownReason reason) noexcept;

namespace exit_code {
constexpr int CLEAN = 0;
constexpr int STARTUP_FAILURE = 1;
constexpr int TRANSPORT_ERROR = 2;
} // namespace exit_code

// Single-fire latch shared by every shutdown trigger. The first fire() wins.
class ShutdownSignal {
public:
    bool fire(ShutdownReason reason);
    bool fired() const noexcept { return fired_.load(); }
    std::optional<ShutdownReason> reason() const;

    void wait() const;
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> fired_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<ShutdownReason> reason_;
};

// Events that drive the host state machine
struct StartedEvent {};
struct ShutdownRequestedEvent {
    ShutdownReason reason;
};
struct StoppedEvent {};

/**
 * Owns the host state machine and the ordered shutdown sequence.
 *
 * Triggers (OS signals, the companion's shutdown control call, transport loss) all go through
 * requestShutdown(). run() blocks the main thread until the signal fires, then runs the registered
 * steps exactly once and in registration order.
 */
class LifecycleCoordinator {
public:
    using TransitionObserver = std::function<void(HostState from, HostState to)>;
    using StepFn = std::function<void()>;

    LifecycleCoordinator() = default;

    LifecycleCoordinator(const LifecycleCoordinator&) = delete;
    LifecycleCoordinator& operator=(const LifecycleCoordinator&) = delete;

    void addShutdownStep(std::string name, StepFn step);
    void addObserver(TransitionObserver observer);

    void markRunning();
    bool requestShutdown(ShutdownReason reason);

    // Blocks until shutdown is requested, runs the steps, returns the exit code
    int run();

    HostState state() const;
    std::vector<HostState> history() const;
    std::optional<ShutdownReason> shutdownReason() const { return signal_.reason(); }
    const ShutdownSignal& signal() const noexcept { return signal_; }

    void dispatch(const StartedEvent&);
    void dispatch(const ShutdownRequestedEvent&);
    void dispatch(const StoppedEvent&);

private:
    struct Step {
        std::string name;
        StepFn fn;
    };

    void transitionTo(HostState next);
    void runSteps();

    ShutdownSignal signal_;

    mutable std::mutex mutex_;
    HostState state_{HostState::Starting};
    std::vector<HostState> history_{HostState::Starting};
    std::vector<TransitionObserver> observers_;
    std::vector<Step> steps_;

    std::mutex runMutex_;
    std::optional<int> exitCode_;
};

// Turns SIGINT/SIGTERM into requestShutdown(Signal) on a dedicated thread
class SignalWatcher {
public:
    explicit SignalWatcher(LifecycleCoordinator& lifecycle);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    Result<void> start();
    void stop();

private:
    LifecycleCoordinator& lifecycle_;
    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_;
    std::thread thread_;
};

} // namespace nmbridge::host
