#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sieve/config/config_helpers.h>

namespace sieve::config {

Result<ConfigTable> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::NotFound, "Config file not found: " + config_path.string()};
    }

    ConfigTable table;
    std::string line;
    std::string currentSection;
    size_t lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidData, "Unterminated section header at line " +
                                                         std::to_string(lineNo)};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidData,
                         "Expected key = value at line " + std::to_string(lineNo)};
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments, unless the '#' sits inside a quoted string
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (!v.empty()) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        }

        // "section.key = value" at top level is accepted as well
        std::string section = currentSection;
        if (section.empty()) {
            if (auto dot = k.find('.'); dot != std::string::npos) {
                section = k.substr(0, dot);
                k = k.substr(dot + 1);
            }
        }
        table[section][k] = unquote(v);
    }

    return table;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto table = parse_config_file(config_path);
    if (!table)
        return "";
    auto s = table.value().find(section);
    if (s == table.value().end())
        return "";
    auto v = s->second.find(key);
    return v == s->second.end() ? "" : v->second;
}

Result<size_t> parse_size(std::string_view s) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return Error{ErrorCode::InvalidArgument, "Not an unsigned integer: '" + std::string(s) + "'"};
    }
    return value;
}

Result<double> parse_double(std::string_view s) {
    // from_chars for double is not available on every supported standard library
    std::string buf(s);
    char* end = nullptr;
    double value = std::strtod(buf.c_str(), &end);
    if (buf.empty() || end != buf.c_str() + buf.size()) {
        return Error{ErrorCode::InvalidArgument, "Not a number: '" + buf + "'"};
    }
    return value;
}

Result<bool> parse_bool(std::string_view s) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::InvalidArgument, "Not a boolean: '" + std::string(s) + "'"};
}

Result<std::chrono::milliseconds> parse_ms(std::string_view s) {
    auto n = parse_size(s);
    if (!n)
        return n.error();
    return std::chrono::milliseconds(static_cast<int64_t>(n.value()));
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("SIEVE_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "sieve" / "config.toml";
    }

    return configHome / "sieve" / "config.toml";
}

std::filesystem::path get_cache_dir() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "sieve";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".cache" / "sieve";
    }
    return std::filesystem::temp_directory_path() / "sieve-cache";
}

} // namespace sieve::config
