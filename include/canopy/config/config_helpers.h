#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

namespace canopy::config {

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
            if (path.size() <= 2) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

inline bool parse_bool(std::string_view s, bool fallback) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return fallback;
}

inline std::size_t parse_size(std::string_view s, std::size_t fallback) {
    try {
        std::string v(s);
        trim(v);
        if (v.empty() || v.front() == '-')
            return fallback;
        return static_cast<std::size_t>(std::stoull(v));
    } catch (const std::exception&) {
        return fallback;
    }
}

// Parse a value from TOML config file. Accepts both "[section] key = v" and
// "section.key = v". Returns an empty string when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
// CANOPY_CONFIG, then $XDG_CONFIG_HOME/canopy/config.toml, then ~/.config/canopy/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Data directory resolution (env -> config -> defaults)
// CANOPY_DATA_DIR, then [storage] data_dir, then ~/.canopy-data
std::filesystem::path resolve_data_dir_from_config();

} // namespace canopy::config
