#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

namespace lore::config {

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
            if (path.size() == 1) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from TOML config file. Both "[section] key = v" and "section.key = v" match.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// $LORE_CONFIG, then $XDG_CONFIG_HOME/lore/config.toml or ~/.config/lore/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory
/// $XDG_DATA_HOME/lore or ~/.local/share/lore
std::filesystem::path get_data_dir();

/// Directory holding global-scope stores (env → config → XDG defaults)
std::filesystem::path resolve_global_dir_from_config(const std::filesystem::path& config_path);

/// Apply a textual level ("trace".."off") to the default spdlog logger
void configure_logging(const std::string& level);

} // namespace lore::config
