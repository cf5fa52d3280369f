#pragma once

#include <nmbridge/config/config_helpers.h>
#include <nmbridge/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace nmbridge::config {

struct HostConfig {
    std::string bindAddress = "127.0.0.1";
    uint16_t port = 9333;
    std::string baseUrl; // defaults to http://localhost:<port>/sse
    std::string runMode = "production";
    std::filesystem::path logFile;
    std::string logLevel = "info";
    std::chrono::milliseconds callTimeout{5000};
    std::chrono::milliseconds drainTimeout{3000};
    bool exitOnDisconnect = true;

    // File the settings were read from; empty when none existed
    std::filesystem::path configPath;
};

// Values given on the command line; unset fields fall through to env, file, defaults
struct CliOverrides {
    std::string configPath;
    std::optional<std::string> bindAddress;
    std::optional<std::string> port;
    std::optional<std::string> baseUrl;
    std::optional<std::string> runMode;
    std::optional<std::string> logFile;
    std::optional<std::string> logLevel;
    std::optional<std::string> callTimeoutMs;
    std::optional<std::string> drainTimeoutMs;
    bool stayAlive = false;
};

// Accepts "9333" or ":9333"
Result<uint16_t> parsePort(const std::string& raw);
Result<std::chrono::milliseconds> parseMillis(const std::string& key, const std::string& raw);
Result<bool> parseBool(const std::string& key, const std::string& raw);
Result<std::string> normalizeLogLevel(const std::string& raw);

std::string defaultBaseUrl(uint16_t port);

// Precedence: command line > environment > [host] section of the config file > defaults
Result<HostConfig> resolveHostConfig(const CliOverrides& cli,
                                     const EnvLookup& env = processEnvironment());

} // namespace nmbridge::config
