#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>

#include <execinfo.h>

#include <nmbridge/config/host_config.h>
#include <nmbridge/host/bridge_host.h>
#include <nmbridge/host/lifecycle.h>
#include <nmbridge/version.hpp>

namespace {

void log_fatal(const char* what) {
    try {
        spdlog::critical("FATAL: {}", what);
        spdlog::critical("Aborting after fatal error");
    } catch (...) {
        // Logger not ready
        std::fprintf(stderr, "FATAL: %s\n", what);
    }
}

void signal_handler(int signo) {
    const char* sigstr = (signo == SIGSEGV)   ? "SIGSEGV"
                         : (signo == SIGABRT) ? "SIGABRT"
                                              : "UNKNOWN";
    log_fatal(sigstr);
    void* bt[64];
    int n = backtrace(bt, 64);
    char** syms = backtrace_symbols(bt, n);
    if (syms) {
        for (int i = 0; i < n; ++i) {
            spdlog::critical("Backtrace[{}]: {}", i, syms[i]);
        }
        free(syms);
    }
    spdlog::shutdown();
    std::_Exit(128 + signo);
}

void setup_fatal_handlers() {
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGABRT, signal_handler);
    // A companion that vanishes mid-write must surface as EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);
    std::set_terminate([]() noexcept {
        log_fatal("std::terminate called");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::_Exit(1);
    });
}

spdlog::level::level_enum toSpdlogLevel(const std::string& level) {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "warn")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

// stdout carries native frames; logs go to stderr and the rotating file only
void setup_logging(const nmbridge::config::HostConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!cfg.logFile.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(cfg.logFile.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.logFile.string(), 10 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            std::fprintf(stderr, "Log file %s unavailable: %s\n", cfg.logFile.c_str(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("nmbridge", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(toSpdlogLevel(cfg.logLevel));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    spdlog::flush_on(spdlog::level::warn);
    spdlog::flush_every(std::chrono::seconds(2));
}

} // namespace

int main(int argc, char* argv[]) {
    setup_fatal_handlers();

    CLI::App app{"nmbridge - native messaging to MCP bridge host"};
    app.set_version_flag("--version", std::string(NMBRIDGE_VERSION_STRING));

    nmbridge::config::CliOverrides cli;
    std::string host, port, baseUrl, runMode, logFile, logLevel, callTimeout, drainTimeout;

    app.add_option("-c,--config", cli.configPath, "Config file (default: ~/.config/nmbridge/config.toml)");
    auto* hostOpt = app.add_option("--host", host, "Address the MCP endpoint binds to");
    auto* portOpt = app.add_option("-p,--port", port, "MCP endpoint port (0 picks a free port)");
    auto* baseOpt = app.add_option("--base-url", baseUrl, "Public URL of the SSE endpoint");
    auto* modeOpt = app.add_option("--run-mode", runMode, "Run mode reported in status");
    auto* fileOpt = app.add_option("--log-file", logFile, "Log file path");
    auto* levelOpt = app.add_option("-l,--log-level", logLevel,
                                    "Log level (trace, debug, info, warn, error)")
                         ->check(CLI::IsMember(
                             {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"}));
    auto* callOpt = app.add_option("--call-timeout-ms", callTimeout,
                                   "Default companion call timeout in milliseconds");
    auto* drainOpt = app.add_option("--drain-timeout-ms", drainTimeout,
                                    "Grace period for in-flight calls at shutdown");
    app.add_flag("--stay-alive", cli.stayAlive,
                 "Keep serving MCP clients after the companion disconnects");

    CLI11_PARSE(app, argc, argv);

    auto take = [](CLI::Option* opt, const std::string& v) -> std::optional<std::string> {
        if (opt->count() == 0)
            return std::nullopt;
        return v;
    };
    cli.bindAddress = take(hostOpt, host);
    cli.port = take(portOpt, port);
    cli.baseUrl = take(baseOpt, baseUrl);
    cli.runMode = take(modeOpt, runMode);
    cli.logFile = take(fileOpt, logFile);
    cli.logLevel = take(levelOpt, logLevel);
    cli.callTimeoutMs = take(callOpt, callTimeout);
    cli.drainTimeoutMs = take(drainOpt, drainTimeout);

    auto resolved = nmbridge::config::resolveHostConfig(cli);
    if (!resolved) {
        std::fprintf(stderr, "Configuration error: %s\n", resolved.error().message.c_str());
        return nmbridge::host::exit_code::STARTUP_FAILURE;
    }
    const auto cfg = resolved.value();
    setup_logging(cfg);
    if (!cfg.configPath.empty())
        spdlog::info("Loaded configuration from {}", cfg.configPath.string());

    int exitCode = nmbridge::host::exit_code::CLEAN;
    try {
        nmbridge::host::BridgeHost bridge({cfg});

        auto started = bridge.start();
        if (!started) {
            spdlog::critical("Startup failed: {}", started.error().message);
            spdlog::shutdown();
            return nmbridge::host::exit_code::STARTUP_FAILURE;
        }

        nmbridge::host::SignalWatcher signals(bridge.lifecycle());
        if (auto watching = signals.start(); !watching) {
            spdlog::warn("{}", watching.error().message);
        }

        exitCode = bridge.run();
        signals.stop();
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled exception: {}", e.what());
        exitCode = nmbridge::host::exit_code::STARTUP_FAILURE;
    }

    spdlog::shutdown();
    return exitCode;
}
