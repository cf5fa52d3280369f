#include <nmbridge/config/host_config.h>

#include <spdlog/spdlog.h>

#include <array>
#include <charconv>

namespace nmbridge::config {

namespace {

constexpr const char* kSection = "host";

// One setting as seen by each layer, highest precedence last
struct Layered {
    std::optional<std::string> file;
    std::optional<std::string> env;
    std::optional<std::string> cli;

    std::optional<std::string> pick() const {
        if (cli)
            return cli;
        if (env)
            return env;
        return file;
    }
};

std::optional<std::string> fileValue(const std::filesystem::path& path, const std::string& key) {
    if (path.empty())
        return std::nullopt;
    auto v = parse_config_value(path, kSection, key);
    if (v.empty())
        return std::nullopt;
    return v;
}

Result<long long> parseInteger(const std::string& key, std::string raw) {
    trim(raw);
    long long value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (raw.empty() || ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": '" + raw + "'"};
    }
    return value;
}

} // namespace

Result<uint16_t> parsePort(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (!s.empty() && s.front() == ':')
        s.erase(0, 1);
    auto value = parseInteger("port", s);
    if (!value)
        return value.error();
    if (value.value() < 0 || value.value() > 65535) {
        return Error{ErrorCode::InvalidArgument,
                     "Port out of range (0-65535): " + std::to_string(value.value())};
    }
    return static_cast<uint16_t>(value.value());
}

Result<std::chrono::milliseconds> parseMillis(const std::string& key, const std::string& raw) {
    auto value = parseInteger(key, raw);
    if (!value)
        return value.error();
    if (value.value() <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     key + " must be positive, got " + std::to_string(value.value())};
    }
    return std::chrono::milliseconds(value.value());
}

Result<bool> parseBool(const std::string& key, const std::string& raw) {
    std::string s = raw;
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on")
        return true;
    if (s == "0" || s == "false" || s == "no" || s == "off")
        return false;
    return Error{ErrorCode::InvalidArgument, "Invalid boolean for " + key + ": '" + raw + "'"};
}

Result<std::string> normalizeLogLevel(const std::string& raw) {
    static const std::array<const char*, 8> kLevels = {"trace", "debug",    "info", "warn",
                                                       "warning", "error", "critical", "off"};
    std::string s = raw;
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (std::find(kLevels.begin(), kLevels.end(), s) == kLevels.end())
        return Error{ErrorCode::InvalidArgument, "Unknown log level: '" + raw + "'"};
    return s == "warning" ? std::string("warn") : s;
}

std::string defaultBaseUrl(uint16_t port) {
    return "http://localhost:" + std::to_string(port) + "/sse";
}

Result<HostConfig> resolveHostConfig(const CliOverrides& cli, const EnvLookup& env) {
    HostConfig cfg;

    const auto path = get_config_path(cli.configPath, env);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        cfg.configPath = path;
        spdlog::debug("Reading host configuration from {}", path.string());
    } else if (!cli.configPath.empty()) {
        spdlog::warn("Config file {} not found; using environment and defaults", path.string());
    }

    auto layer = [&](const char* tomlKey, const char* envName,
                     const std::optional<std::string>& cliValue) {
        Layered l;
        l.file = fileValue(cfg.configPath, tomlKey);
        if (envName)
            l.env = env(envName);
        l.cli = cliValue;
        return l.pick();
    };

    if (auto v = layer("bind_address", "SSE_HOST", cli.bindAddress))
        cfg.bindAddress = *v;

    if (auto v = layer("port", "SSE_PORT", cli.port)) {
        auto port = parsePort(*v);
        if (!port)
            return port.error();
        cfg.port = port.value();
    }

    if (auto v = layer("base_url", "SSE_BASE_URL", cli.baseUrl))
        cfg.baseUrl = *v;
    else
        cfg.baseUrl = defaultBaseUrl(cfg.port);

    if (auto v = layer("run_mode", "RUN_MODE", cli.runMode))
        cfg.runMode = *v;

    if (auto v = layer("log_file", "LOG_FILE", cli.logFile)) {
        cfg.logFile = expand_tilde(*v, env);
    } else if (auto dir = env("LOG_DIR")) {
        cfg.logFile = expand_tilde(*dir, env) / "nmbridge.log";
    } else {
        cfg.logFile = expand_tilde("~/.nmbridge/logs/nmbridge.log", env);
    }

    if (auto v = layer("log_level", "LOG_LEVEL", cli.logLevel)) {
        auto level = normalizeLogLevel(*v);
        if (!level)
            return level.error();
        cfg.logLevel = level.value();
    }

    if (auto v = layer("call_timeout_ms", "NMBRIDGE_CALL_TIMEOUT_MS", cli.callTimeoutMs)) {
        auto ms = parseMillis("call_timeout_ms", *v);
        if (!ms)
            return ms.error();
        cfg.callTimeout = ms.value();
    }

    if (auto v = layer("drain_timeout_ms", "NMBRIDGE_DRAIN_TIMEOUT_MS", cli.drainTimeoutMs)) {
        auto ms = parseMillis("drain_timeout_ms", *v);
        if (!ms)
            return ms.error();
        cfg.drainTimeout = ms.value();
    }

    if (cli.stayAlive) {
        cfg.exitOnDisconnect = false;
    } else if (auto v = layer("exit_on_disconnect", "NMBRIDGE_EXIT_ON_DISCONNECT", std::nullopt)) {
        auto flag = parseBool("exit_on_disconnect", *v);
        if (!flag)
            return flag.error();
        cfg.exitOnDisconnect = flag.value();
    }

    return cfg;
}

} // namespace nmbridge::config
