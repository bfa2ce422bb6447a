#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace coderag::config {

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

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() > 2 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// section -> key -> unquoted value; keys outside any section live under ""
using ConfigValues = std::map<std::string, std::map<std::string, std::string>>;

// Read every key of a TOML-style file; a missing file yields an empty map
ConfigValues load_config_values(const std::filesystem::path& config_path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Config file location: override, then $CODERAG_CONFIG, then
/// $XDG_CONFIG_HOME/coderag/config.toml or ~/.config/coderag/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_DATA_HOME/coderag or ~/.local/share/coderag
std::filesystem::path get_data_dir();

} // namespace coderag::config
