#include <nmbridge/host/lifecycle.h>

#include <spdlog/spdlog.h>

#include <csignal>

namespace nmbridge::host {

const char* hostStateName(HostState state) noexcept {
    switch (state) {
        case HostState::Starting:
            return "starting";
        case HostState::Running:
            return "running";
        case HostState::ShuttingDown:
            return "shutting_down";
        case HostState::Stopped:
            return "stopped";
    }
    return "unknown";
}

const char* shutdownReasonName(ShutdownReason reason) noexcept {
    switch (reason) {
        case ShutdownReason::Signal:
            return "signal";
        case ShutdownReason::ControlRequest:
            return "control_request";
        case ShutdownReason::TransportClosed:
            return "transport_closed";
        case ShutdownReason::TransportError:
            return "transport_error";
    }
    return "unknown";
}

int exitCodeFor(ShutdownReason reason) noexcept {
    return reason == ShutdownReason::TransportError ? exit_code::TRANSPORT_ERROR : exit_code::CLEAN;
}

// --- ShutdownSignal ---

bool ShutdownSignal::fire(ShutdownReason reason) {
    bool expected = false;
    if (!fired_.compare_exchange_strong(expected, true))
        return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reason_ = reason;
    }
    cv_.notify_all();
    return true;
}

std::optional<ShutdownReason> ShutdownSignal::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

void ShutdownSignal::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return reason_.has_value(); });
}

bool ShutdownSignal::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return reason_.has_value(); });
}

// --- LifecycleCoordinator ---

void LifecycleCoordinator::addShutdownStep(std::string name, StepFn step) {
    std::lock_guard<std::mutex> lock(mutex_);
    steps_.push_back(Step{std::move(name), std::move(step)});
}

void LifecycleCoordinator::addObserver(TransitionObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

HostState LifecycleCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<HostState> LifecycleCoordinator::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

void LifecycleCoordinator::transitionTo(HostState next) {
    HostState prev;
    std::vector<TransitionObserver> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == next) {
            spdlog::debug("Lifecycle transition no-op: already {}", hostStateName(next));
            return;
        }
        prev = state_;
        state_ = next;
        history_.push_back(next);
        observers = observers_;
    }
    spdlog::info("Lifecycle transition: {} -> {}", hostStateName(prev), hostStateName(next));
    for (auto& observer : observers)
        observer(prev, next);
}

void LifecycleCoordinator::dispatch(const StartedEvent&) {
    switch (state()) {
        case HostState::Starting:
            transitionTo(HostState::Running);
            break;
        default:
            break;
    }
}

void LifecycleCoordinator::dispatch(const ShutdownRequestedEvent& ev) {
    switch (state()) {
        case HostState::Starting:
        case HostState::Running:
            spdlog::info("Shutdown requested ({})", shutdownReasonName(ev.reason));
            transitionTo(HostState::ShuttingDown);
            break;
        default:
            break;
    }
}

void LifecycleCoordinator::dispatch(const StoppedEvent&) {
    switch (state()) {
        case HostState::ShuttingDown:
            transitionTo(HostState::Stopped);
            break;
        default:
            break;
    }
}

void LifecycleCoordinator::markRunning() {
    dispatch(StartedEvent{});
}

bool LifecycleCoordinator::requestShutdown(ShutdownReason reason) {
    if (!signal_.fire(reason)) {
        spdlog::debug("Shutdown already requested; ignoring {}", shutdownReasonName(reason));
        return false;
    }
    return true;
}

int LifecycleCoordinator::run() {
    signal_.wait();

    std::lock_guard<std::mutex> runLock(runMutex_);
    if (exitCode_)
        return *exitCode_;

    const auto reason = signal_.reason().value_or(ShutdownReason::Signal);
    dispatch(ShutdownRequestedEvent{reason});
    runSteps();
    dispatch(StoppedEvent{});

    exitCode_ = exitCodeFor(reason);
    spdlog::info("Host stopped ({}), exit code {}", shutdownReasonName(reason), *exitCode_);
    return *exitCode_;
}

void LifecycleCoordinator::runSteps() {
    std::vector<Step> steps;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        steps = steps_;
    }
    for (const auto& step : steps) {
        const auto start = std::chrono::steady_clock::now();
        spdlog::info("Shutdown step '{}' starting", step.name);
        try {
            step.fn();
        } catch (const std::exception& e) {
            // Later steps still release their resources
            spdlog::error("Shutdown step '{}' failed: {}", step.name, e.what());
        }
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - start)
                            .count();
        spdlog::info("Shutdown step '{}' finished in {}ms", step.name, ms);
    }
}

// --- SignalWatcher ---

SignalWatcher::SignalWatcher(LifecycleCoordinator& lifecycle)
    : lifecycle_(lifecycle), signals_(ioc_) {}

SignalWatcher::~SignalWatcher() {
    stop();
}

Result<void> SignalWatcher::start() {
    boost::system::error_code ec;
    signals_.add(SIGINT, ec);
    if (!ec)
        signals_.add(SIGTERM, ec);
    if (ec)
        return Error{ErrorCode::InternalError, "Failed to install signal handlers: " + ec.message()};

    signals_.async_wait([this](const boost::system::error_code& error, int signo) {
        if (error)
            return;
        spdlog::info("Received signal {}, shutting down", signo);
        lifecycle_.requestShutdown(ShutdownReason::Signal);
    });
    thread_ = std::thread([this]() { ioc_.run(); });
    return Result<void>();
}

void SignalWatcher::stop() {
    boost::system::error_code ec;
    signals_.cancel(ec);
    ioc_.stop();
    if (thread_.joinable())
        thread_.join();
}

} // namespace nmbridge::host
