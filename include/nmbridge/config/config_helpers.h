#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace nmbridge::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Environment lookup; injectable so resolution can be tested without touching the process env
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads the process environment. Unset and empty variables both yield nullopt.
EnvLookup processEnvironment();

// "~/x" -> "$HOME/x"
std::filesystem::path expand_tilde(const std::string& path, const EnvLookup& env = processEnvironment());

// Value of `key` in `[section]` of a flat TOML file, unquoted; empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/nmbridge or ~/.config/nmbridge
std::filesystem::path get_config_dir(const EnvLookup& env = processEnvironment());

// Config file: the override when given, else <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "",
                                      const EnvLookup& env = processEnvironment());

} // namespace nmbridge::config
