#include <gtest/gtest.h>

#include <nmbridge/config/host_config.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <string>

using namespace nmbridge;
using namespace nmbridge::config;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

EnvLookup envFrom(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end())
            return std::nullopt;
        return it->second;
    };
}

} // namespace

class HostConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("nmbridge_config_test_" + std::to_string(rd()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path writeConfig(const std::string& body, const std::string& name = "config.toml") {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << body;
        return path;
    }

    // HOME points into the temp dir so defaults never read the real user config
    EnvLookup isolatedEnv(std::map<std::string, std::string> vars = {}) {
        vars.emplace("HOME", dir_.string());
        return envFrom(std::move(vars));
    }

    fs::path dir_;
};

TEST_F(HostConfigTest, DefaultsWithoutAnySource) {
    auto cfg = resolveHostConfig(CliOverrides{}, isolatedEnv());
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.bindAddress, "127.0.0.1");
    EXPECT_EQ(c.port, 9333);
    EXPECT_EQ(c.baseUrl, "http://localhost:9333/sse");
    EXPECT_EQ(c.runMode, "production");
    EXPECT_EQ(c.logLevel, "info");
    EXPECT_EQ(c.callTimeout, 5000ms);
    EXPECT_EQ(c.drainTimeout, 3000ms);
    EXPECT_TRUE(c.exitOnDisconnect);
    EXPECT_TRUE(c.configPath.empty());
    EXPECT_EQ(c.logFile, dir_ / ".nmbridge/logs/nmbridge.log");
}

TEST_F(HostConfigTest, CommandLineBeatsEnvironmentBeatsFile) {
    auto path = writeConfig("[host]\n"
                            "port = 7000\n"
                            "run_mode = \"file\"\n"
                            "log_level = \"debug\"\n"
                            "bind_address = \"0.0.0.0\"\n");
    CliOverrides cli;
    cli.configPath = path.string();
    cli.port = "9000";

    auto cfg = resolveHostConfig(
        cli, isolatedEnv({{"SSE_PORT", "8000"}, {"RUN_MODE", "env"}}));
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.port, 9000);
    EXPECT_EQ(c.runMode, "env");
    EXPECT_EQ(c.logLevel, "debug");
    EXPECT_EQ(c.bindAddress, "0.0.0.0");
    EXPECT_EQ(c.configPath, path);
    // The derived URL follows the effective port
    EXPECT_EQ(c.baseUrl, "http://localhost:9000/sse");
}

TEST_F(HostConfigTest, ConfigFileIsFoundUnderXdgConfigHome) {
    fs::create_directories(dir_ / "xdg" / "nmbridge");
    std::ofstream(dir_ / "xdg" / "nmbridge" / "config.toml")
        << "# comment\n[other]\nport = 1\n[host]\nport = \":4100\" # inline\n"
           "call_timeout_ms = 2500\nexit_on_disconnect = \"no\"\n";

    auto cfg = resolveHostConfig(CliOverrides{},
                                 isolatedEnv({{"XDG_CONFIG_HOME", (dir_ / "xdg").string()}}));
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().port, 4100);
    EXPECT_EQ(cfg.value().callTimeout, 2500ms);
    EXPECT_FALSE(cfg.value().exitOnDisconnect);
}

TEST_F(HostConfigTest, MissingExplicitConfigFallsBackToEnvironment) {
    CliOverrides cli;
    cli.configPath = (dir_ / "absent.toml").string();
    auto cfg = resolveHostConfig(cli, isolatedEnv({{"SSE_BASE_URL", "https://bridge.test/sse"}}));
    ASSERT_TRUE(cfg);
    EXPECT_TRUE(cfg.value().configPath.empty());
    EXPECT_EQ(cfg.value().baseUrl, "https://bridge.test/sse");
}

TEST_F(HostConfigTest, StayAliveOverridesEverything) {
    CliOverrides cli;
    cli.stayAlive = true;
    auto cfg = resolveHostConfig(cli, isolatedEnv({{"NMBRIDGE_EXIT_ON_DISCONNECT", "true"}}));
    ASSERT_TRUE(cfg);
    EXPECT_FALSE(cfg.value().exitOnDisconnect);

    auto fromEnv = resolveHostConfig(CliOverrides{},
                                     isolatedEnv({{"NMBRIDGE_EXIT_ON_DISCONNECT", "off"}}));
    ASSERT_TRUE(fromEnv);
    EXPECT_FALSE(fromEnv.value().exitOnDisconnect);
}

TEST_F(HostConfigTest, LogFileResolution) {
    auto fromDir = resolveHostConfig(CliOverrides{}, isolatedEnv({{"LOG_DIR", "~/logs"}}));
    ASSERT_TRUE(fromDir);
    EXPECT_EQ(fromDir.value().logFile, dir_ / "logs" / "nmbridge.log");

    CliOverrides cli;
    cli.logFile = "/tmp/explicit.log";
    auto explicitFile = resolveHostConfig(cli, isolatedEnv({{"LOG_FILE", "/tmp/env.log"}}));
    ASSERT_TRUE(explicitFile);
    EXPECT_EQ(explicitFile.value().logFile, fs::path("/tmp/explicit.log"));
}

TEST_F(HostConfigTest, InvalidValuesAreStartupErrors) {
    auto badPort = resolveHostConfig(CliOverrides{}, isolatedEnv({{"SSE_PORT", "99999"}}));
    ASSERT_FALSE(badPort);
    EXPECT_EQ(badPort.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(badPort.error().message, "Port out of range (0-65535): 99999");

    CliOverrides cli;
    cli.logLevel = "loud";
    auto badLevel = resolveHostConfig(cli, isolatedEnv());
    ASSERT_FALSE(badLevel);
    EXPECT_EQ(badLevel.error().message, "Unknown log level: 'loud'");

    auto badDrain = resolveHostConfig(CliOverrides{},
                                      isolatedEnv({{"NMBRIDGE_DRAIN_TIMEOUT_MS", "0"}}));
    ASSERT_FALSE(badDrain);
    EXPECT_EQ(badDrain.error().message, "drain_timeout_ms must be positive, got 0");

    auto badFlag = resolveHostConfig(CliOverrides{},
                                     isolatedEnv({{"NMBRIDGE_EXIT_ON_DISCONNECT", "maybe"}}));
    ASSERT_FALSE(badFlag);
    EXPECT_EQ(badFlag.error().message, "Invalid boolean for exit_on_disconnect: 'maybe'");
}

TEST(HostConfigParseTest, Ports) {
    EXPECT_EQ(parsePort("9333").value(), 9333);
    EXPECT_EQ(parsePort(" :8080 ").value(), 8080);
    EXPECT_EQ(parsePort("0").value(), 0);
    EXPECT_FALSE(parsePort(""));
    EXPECT_FALSE(parsePort("-1"));
    auto junk = parsePort("80a");
    ASSERT_FALSE(junk);
    EXPECT_EQ(junk.error().message, "Invalid value for port: '80a'");
}

TEST(HostConfigParseTest, MillisBoolsAndLevels) {
    EXPECT_EQ(parseMillis("call_timeout_ms", "1500").value(), 1500ms);
    EXPECT_FALSE(parseMillis("call_timeout_ms", "-5"));
    EXPECT_FALSE(parseMillis("call_timeout_ms", "1.5"));

    EXPECT_TRUE(parseBool("k", "Yes").value());
    EXPECT_TRUE(parseBool("k", "1").value());
    EXPECT_FALSE(parseBool("k", "OFF").value());
    EXPECT_FALSE(parseBool("k", "nah"));

    EXPECT_EQ(normalizeLogLevel("WARNING").value(), "warn");
    EXPECT_EQ(normalizeLogLevel(" Debug ").value(), "debug");
    EXPECT_EQ(normalizeLogLevel("off").value(), "off");
    EXPECT_FALSE(normalizeLogLevel("verbose"));

    EXPECT_EQ(defaultBaseUrl(1234), "http://localhost:1234/sse");
}

TEST_F(HostConfigTest, ConfigHelpers) {
    auto path = writeConfig("host.port = 5151\n"
                            "[host]\n"
                            "base_url = 'http://a.b/sse#frag' # comment\n"
                            "empty =\n");
    EXPECT_EQ(parse_config_value(path, "host", "port"), "5151");
    EXPECT_EQ(parse_config_value(path, "host", "base_url"), "http://a.b/sse#frag");
    EXPECT_EQ(parse_config_value(path, "host", "empty"), "");
    EXPECT_EQ(parse_config_value(path, "host", "missing"), "");
    EXPECT_EQ(parse_config_value(dir_ / "nope.toml", "host", "port"), "");

    auto env = envFrom({{"HOME", "/home/u"}});
    EXPECT_EQ(expand_tilde("~/x/y", env), fs::path("/home/u/x/y"));
    EXPECT_EQ(expand_tilde("~", env), fs::path("/home/u"));
    EXPECT_EQ(expand_tilde("/abs", env), fs::path("/abs"));
    EXPECT_EQ(expand_tilde("~/x", envFrom({})), fs::path("~/x"));

    EXPECT_EQ(get_config_dir(env), fs::path("/home/u/.config/nmbridge"));
    EXPECT_EQ(get_config_dir(envFrom({{"XDG_CONFIG_HOME", "/xdg"}})), fs::path("/xdg/nmbridge"));
    EXPECT_EQ(get_config_path("", env), fs::path("/home/u/.config/nmbridge/config.toml"));
    EXPECT_EQ(get_config_path("~/c.toml", env), fs::path("/home/u/c.toml"));
}
