#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <sieve/core/types.h>

namespace sieve::config {

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

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / (path.size() > 2 ? path.substr(2) : "");
        }
    }
    return path;
}

/// section -> key -> raw (unquoted) value
using ConfigTable = std::map<std::string, std::map<std::string, std::string>>;

/// Read a TOML subset: [section] headers, key = value pairs, '#' comments, quoted strings.
Result<ConfigTable> parse_config_file(const std::filesystem::path& config_path);

/// Single lookup; empty string when the file, section or key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Value parsers. Each rejects trailing garbage with ErrorCode::InvalidArgument.
Result<size_t> parse_size(std::string_view s);
Result<double> parse_double(std::string_view s);
Result<bool> parse_bool(std::string_view s);
Result<std::chrono::milliseconds> parse_ms(std::string_view s);

/// $SIEVE_CONFIG, else $XDG_CONFIG_HOME/sieve/config.toml, else ~/.config/sieve/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_CACHE_HOME/sieve or ~/.cache/sieve
std::filesystem::path get_cache_dir();

} // namespace sieve::config
