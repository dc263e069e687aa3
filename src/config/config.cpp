#include <neograph/config/config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace neograph::config {

namespace fs = std::filesystem;

Result<TomlSections> parseTomlConfig(const fs::path& path) {
    TomlSections config;
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + path.string()};
    }

    std::string line;
    std::string currentSection;
    int lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        // Check for section headers
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
                         "Expected 'key = value' at line " + std::to_string(lineNo)};
        }

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        // Remove inline comments outside of quotes
        if (!value.empty() && value.front() != '"' && value.front() != '\'') {
            size_t comment = value.find('#');
            if (comment != std::string::npos) {
                value = value.substr(0, comment);
                trim(value);
            }
        }

        config[currentSection][key] = unquote(value);
    }

    return config;
}

Result<bool> parseBool(std::string_view raw) {
    std::string v(raw);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::InvalidArgument, "Not a boolean: " + std::string(raw)};
}

void applyEnvironmentOverrides(NeographConfig& config) {
    if (const char* uri = std::getenv("NEOGRAPH_URI"); uri && *uri) {
        config.connection.uri = uri;
    }
    if (const char* user = std::getenv("NEOGRAPH_USER"); user && *user) {
        config.connection.user = user;
    }
    if (const char* password = std::getenv("NEOGRAPH_PASSWORD"); password) {
        config.connection.password = password;
    }
    if (const char* level = std::getenv("NEOGRAPH_LOG_LEVEL"); level && *level) {
        config.sync.logLevel = level;
    }
}

Result<NeographConfig> loadConfig(const fs::path& path) {
    NeographConfig config;

    if (!path.empty() && fs::exists(path)) {
        auto parsed = parseTomlConfig(path);
        if (!parsed) {
            return parsed.error();
        }
        const auto& sections = parsed.value();

        if (auto it = sections.find("connection"); it != sections.end()) {
            const auto& conn = it->second;
            if (auto v = conn.find("uri"); v != conn.end())
                config.connection.uri = v->second;
            if (auto v = conn.find("user"); v != conn.end())
                config.connection.user = v->second;
            if (auto v = conn.find("password"); v != conn.end())
                config.connection.password = v->second;
            if (auto v = conn.find("busy_timeout_ms"); v != conn.end()) {
                try {
                    config.connection.busyTimeout = std::chrono::milliseconds(std::stol(v->second));
                } catch (const std::exception&) {
                    return Error{ErrorCode::InvalidData,
                                 "connection.busy_timeout_ms is not a number: " + v->second};
                }
            }
        }

        if (auto it = sections.find("sync"); it != sections.end()) {
            const auto& sync = it->second;
            if (auto v = sync.find("verbose"); v != sync.end()) {
                auto b = parseBool(v->second);
                if (!b)
                    return b.error();
                config.sync.verbose = b.value();
            }
            if (auto v = sync.find("log_level"); v != sync.end())
                config.sync.logLevel = v->second;
        }
        spdlog::debug("Loaded config from {}", path.string());
    } else {
        spdlog::debug("No config file at '{}', using defaults", path.string());
    }

    applyEnvironmentOverrides(config);
    return config;
}

fs::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return fs::path(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    fs::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = fs::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = fs::path(homeEnv) / ".config";
    } else {
        return fs::path("~/.config") / "neograph" / "config.toml";
    }

    return configHome / "neograph" / "config.toml";
}

} // namespace neograph::config
