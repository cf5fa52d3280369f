#include <fstream>
#include <nmbridge/config/config_helpers.h>

namespace nmbridge::config {

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v || !*v)
            return std::nullopt;
        return std::string(v);
    };
}

std::filesystem::path expand_tilde(const std::string& path, const EnvLookup& env) {
    if (!path.empty() && path[0] == '~') {
        if (auto home = env("HOME")) {
            if (path.size() <= 2)
                return std::filesystem::path(*home);
            return std::filesystem::path(*home) / path.substr(2);
        }
    }
    return path;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Dotted keys at top level: host.port = 9333
        const bool dotted = !section.empty() && k == section + "." + key;
        if (!(in_target_section && k == key) && !dotted)
            continue;

        // Inline comment, unless the '#' sits inside a quoted string
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        } else if (size_t comment = v.find('#'); comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }
        return unquote(v);
    }

    return "";
}

std::filesystem::path get_config_dir(const EnvLookup& env) {
    if (auto xdg = env("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "nmbridge";
    }
    if (auto home = env("HOME")) {
        return std::filesystem::path(*home) / ".config" / "nmbridge";
    }
    return std::filesystem::path("~/.config") / "nmbridge";
}

std::filesystem::path get_config_path(const std::string& override_path, const EnvLookup& env) {
    if (!override_path.empty()) {
        return expand_tilde(override_path, env);
    }
    return get_config_dir(env) / "config.toml";
}

} // namespace nmbridge::config
