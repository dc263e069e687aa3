#pragma once

#include <neograph/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace neograph::config {

/**
 * @brief Where and how to reach the graph store
 *
 * Retained by the owning caller and handed to GraphExecutor::open(); reopen() reuses it.
 */
struct ConnectionConfig {
    std::string uri = "sqlite://neograph.db"; ///< sqlite://<path> or sqlite://:memory:
    std::string user;
    std::string password;
    std::chrono::milliseconds busyTimeout{5000}; ///< Store-side lock wait per statement
};

/**
 * @brief Behaviour of the synchronize pass
 */
struct SyncSettings {
    bool verbose = false;         ///< Log every statement and raw result
    std::string logLevel = "warn"; ///< trace/debug/info/warn/error/off
};

struct NeographConfig {
    ConnectionConfig connection;
    SyncSettings sync;
};

using TomlSections = std::map<std::string, std::map<std::string, std::string>>;

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

/**
 * @brief Parse a flat `[section]` / `key = value` TOML file
 *
 * Keys before the first section header land in the "" section. Inline `#` comments
 * are stripped from unquoted values.
 */
Result<TomlSections> parseTomlConfig(const std::filesystem::path& path);

/**
 * @brief Parse a boolean config value ("true"/"false"/"1"/"0"/"yes"/"no"/"on"/"off")
 */
Result<bool> parseBool(std::string_view raw);

/**
 * @brief Load configuration: defaults, then the file (if it exists), then environment
 *
 * Recognized keys: [connection] uri, user, password, busy_timeout_ms;
 * [sync] verbose, log_level. Environment overrides: NEOGRAPH_URI, NEOGRAPH_USER,
 * NEOGRAPH_PASSWORD, NEOGRAPH_LOG_LEVEL.
 */
Result<NeographConfig> loadConfig(const std::filesystem::path& path);

/// Apply NEOGRAPH_* environment variables on top of @p config.
void applyEnvironmentOverrides(NeographConfig& config);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace neograph::config
