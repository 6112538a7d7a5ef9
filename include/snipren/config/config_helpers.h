#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace snipren::config {

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

// Accepts true/false, yes/no, on/off, 1/0 (case-insensitive)
std::optional<bool> parse_bool(std::string_view value);

// Parse a value from TOML config file; empty when the file, section or key is missing
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory
/// $XDG_CONFIG_HOME/snipren or ~/.config/snipren
std::filesystem::path get_config_dir();

// Config file resolution: override > $SNIPREN_CONFIG > <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * Settings read from config.toml.
 *
 *   [logging]
 *   level = "debug"
 *
 *   [rename]
 *   dry_run = false
 */
struct Settings {
    std::string logLevel;
    bool dryRun = false;
};

Settings load_settings(const std::filesystem::path& config_path);

} // namespace snipren::config
