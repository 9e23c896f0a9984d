#pragma once

#include <docseek/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>

namespace docseek::config {

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
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Flat view of a TOML-style config file, keyed "section.key"
using ConfigValues = std::map<std::string, std::string>;

/**
 * @brief Parse `[section]` headers and `key = value` lines
 *
 * Comments start with '#' outside quotes, values may be quoted. Keys before
 * any section header are stored without a prefix; dotted keys
 * ("chunking.size = 400") are accepted in any section.
 * @return Values, empty when the file does not exist; InvalidData for a
 *         line that is neither a header nor an assignment
 */
Result<ConfigValues> parse_config_file(const std::filesystem::path& config_path);

// Get standard config path: override, else $XDG_CONFIG_HOME/docseek/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory (named databases live below it)
/// $XDG_DATA_HOME/docseek or ~/.local/share/docseek
std::filesystem::path get_data_dir();

} // namespace docseek::config
