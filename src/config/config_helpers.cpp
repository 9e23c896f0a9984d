#include <docseek/config/config_helpers.h>

#include <fstream>

namespace docseek::config {

namespace {

// Cut a trailing "# comment" that is not inside a quoted value
std::string strip_comment(const std::string& value) {
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return value.substr(0, i);
        }
    }
    return value;
}

} // namespace

Result<ConfigValues> parse_config_file(const std::filesystem::path& config_path) {
    ConfigValues values;
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return values;
    }

    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot read config file " + config_path.string()};
    }

    std::string line;
    std::string currentSection;
    size_t lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidData, config_path.string() + ":" +
                                                         std::to_string(lineNo) +
                                                         ": unterminated section header"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidData, config_path.string() + ":" +
                                                     std::to_string(lineNo) +
                                                     ": expected 'key = value'"};
        }

        std::string k = line.substr(0, eq);
        std::string v = strip_comment(line.substr(eq + 1));
        trim(k);

        if (k.find('.') == std::string::npos && !currentSection.empty()) {
            k = currentSection + "." + k;
        }
        values[k] = unquote(v);
    }

    return values;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("docseek") / "config.toml";
    }

    return configHome / "docseek" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "docseek";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "docseek";
    }
    return std::filesystem::current_path() / "docseek_data";
}

} // namespace docseek::config
