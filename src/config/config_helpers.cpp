#include <coderag/config/config_helpers.h>

#include <cstdlib>
#include <fstream>

namespace coderag::config {

ConfigValues load_config_values(const std::filesystem::path& config_path) {
    ConfigValues values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments; a '#' inside a quoted value is kept
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // "section.key = value" at top level is accepted too
        if (currentSection.empty()) {
            if (auto dot = k.find('.'); dot != std::string::npos) {
                values[k.substr(0, dot)][k.substr(dot + 1)] = unquote(v);
                continue;
            }
        }
        values[currentSection][k] = unquote(v);
    }
    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = load_config_values(config_path);
    auto sec = values.find(section);
    if (sec == values.end()) {
        return "";
    }
    auto it = sec->second.find(key);
    return it != sec->second.end() ? it->second : "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("CODERAG_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path(".coderag") / "config.toml";
    }

    return configHome / "coderag" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "coderag";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "coderag";
    }
    return std::filesystem::current_path() / "coderag_data";
}

} // namespace coderag::config
