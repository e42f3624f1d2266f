#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>

namespace sieve::config {

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

/// Flatten a simple TOML file into "section.key" -> value. Comments, blank lines and
/// quoting are handled; arrays and inline tables are returned as raw text. A missing
/// or unreadable file yields an empty map.
std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path);

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/sieve or ~/.config/sieve
std::filesystem::path get_config_dir();

// Resolve the config file: explicit override, then SIEVE_CONFIG, then
// get_config_dir()/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace sieve::config
