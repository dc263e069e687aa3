#pragma once

#include <neograph/config/config.h>
#include <neograph/core/types.h>
#include <neograph/executor/graph_executor.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace neograph::cli {

/// Process exit codes of the neograph tool.
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitPartialSync = 2; ///< Sync finished but some entities failed

/**
 * @brief Command line front end: sync, read, constraint create, constraint list
 *
 * Settings resolve in order: built-in defaults, config file, NEOGRAPH_* environment,
 * then command line flags.
 */
class NeographCLI {
public:
    explicit NeographCLI(std::ostream& out = std::cout);

    int run(int argc, char* argv[]);

private:
    std::ostream& out_;

    // Global options
    std::string configPath_;
    std::optional<std::string> uri_;
    std::optional<std::string> user_;
    std::optional<std::string> password_;
    std::optional<std::string> logLevel_;
    bool verbose_ = false;

    // Subcommand arguments
    std::string graphFile_;
    std::string constraintLabel_;
    std::string constraintProperty_;
    std::string constraintTarget_ = "node";
    std::string constraintKind_ = "unique";

    Result<config::NeographConfig> resolveConfig() const;
    Result<std::unique_ptr<executor::GraphExecutor>> connect(const config::NeographConfig& cfg);

    int runSync(const config::NeographConfig& cfg);
    int runRead(const config::NeographConfig& cfg);
    int runConstraintCreate(const config::NeographConfig& cfg);
    int runConstraintList(const config::NeographConfig& cfg);
};

/// Apply a level name (trace/debug/info/warn/error/off) to spdlog; false if unknown.
bool applyLogLevel(const std::string& level);

} // namespace neograph::cli
