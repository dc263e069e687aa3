#include <neograph/cli/neograph_cli.h>
#include <neograph/graph/graph_loader.h>
#include <neograph/sync/constraint_manager.h>
#include <neograph/sync/sync_engine.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace neograph::cli {

bool applyLogLevel(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        return false;
    }
    return true;
}

NeographCLI::NeographCLI(std::ostream& out) : out_(out) {}

int NeographCLI::run(int argc, char* argv[]) {
    CLI::App app{"neograph - synchronize property graphs with a graph store"};
    app.require_subcommand(1);

    app.add_option("--config", configPath_, "Configuration file path");
    app.add_option("--uri", uri_, "Graph store URI (sqlite://<path> or sqlite://:memory:)");
    app.add_option("--user", user_, "Store user name");
    app.add_option("--password", password_, "Store password");
    app.add_option("--log-level", logLevel_, "Log level (trace/debug/info/warn/error/off)");
    app.add_flag("-v,--verbose", verbose_, "Log every statement and its raw result");

    auto* syncCmd = app.add_subcommand("sync", "Upsert every node and edge of a graph document");
    syncCmd->add_option("graph", graphFile_, "Graph document (JSON node-link format)")
        ->required()
        ->check(CLI::ExistingFile);

    auto* readCmd = app.add_subcommand("read", "Print every node stored in the graph store");

    auto* constraintCmd = app.add_subcommand("constraint", "Manage store constraints");
    constraintCmd->require_subcommand(1);

    auto* createCmd = constraintCmd->add_subcommand("create", "Create a constraint");
    createCmd->add_option("--label", constraintLabel_, "Node label or relationship type")
        ->required();
    createCmd->add_option("--property", constraintProperty_, "Constrained property")->required();
    createCmd->add_option("--target", constraintTarget_, "node or relationship")
        ->default_val("node");
    createCmd->add_option("--kind", constraintKind_, "unique or exists")->default_val("unique");

    auto* listCmd = constraintCmd->add_subcommand("list", "List constraints");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? kExitSuccess : kExitError;
    }

    auto cfgResult = resolveConfig();
    if (!cfgResult) {
        spdlog::error("Configuration error: {}", cfgResult.error().message);
        return kExitError;
    }
    const auto& cfg = cfgResult.value();

    if (!applyLogLevel(cfg.sync.logLevel)) {
        spdlog::warn("Unknown log level '{}', keeping current level", cfg.sync.logLevel);
    }

    if (syncCmd->parsed())
        return runSync(cfg);
    if (readCmd->parsed())
        return runRead(cfg);
    if (createCmd->parsed())
        return runConstraintCreate(cfg);
    if (listCmd->parsed())
        return runConstraintList(cfg);
    return kExitError;
}

Result<config::NeographConfig> NeographCLI::resolveConfig() const {
    auto path = config::get_config_path(configPath_);
    if (!configPath_.empty() && !std::filesystem::exists(path)) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }

    auto loaded = config::loadConfig(path);
    if (!loaded) {
        return loaded.error();
    }
    auto cfg = std::move(loaded).value();

    if (uri_)
        cfg.connection.uri = *uri_;
    if (user_)
        cfg.connection.user = *user_;
    if (password_)
        cfg.connection.password = *password_;
    if (logLevel_)
        cfg.sync.logLevel = *logLevel_;
    if (verbose_)
        cfg.sync.verbose = true;
    return cfg;
}

Result<std::unique_ptr<executor::GraphExecutor>>
NeographCLI::connect(const config::NeographConfig& cfg) {
    auto executor = executor::makeExecutor(cfg.connection);
    if (!executor) {
        spdlog::error("Cannot connect to '{}': {}", cfg.connection.uri,
                      executor.error().message);
    }
    return executor;
}

int NeographCLI::runSync(const config::NeographConfig& cfg) {
    auto graph = graph::loadGraphFromFile(graphFile_);
    if (!graph) {
        spdlog::error("Failed to load graph '{}': {}", graphFile_, graph.error().message);
        return kExitError;
    }

    auto executor = connect(cfg);
    if (!executor)
        return kExitError;

    sync::SyncEngine engine(*executor.value());
    auto report = engine.synchronize(graph.value(), cfg.sync.verbose);
    if (!report) {
        spdlog::error("Sync failed: {}", report.error().message);
        return kExitError;
    }

    out_ << report.value().summary() << "\n";
    for (const auto& failure : report.value().failures()) {
        out_ << "  failed " << sync::toString(failure.kind) << " " << failure.key << ": "
             << (failure.error ? failure.error->message : std::string("unknown error")) << "\n";
    }
    return report.value().ok() ? kExitSuccess : kExitPartialSync;
}

int NeographCLI::runRead(const config::NeographConfig& cfg) {
    auto executor = connect(cfg);
    if (!executor)
        return kExitError;

    sync::SyncEngine engine(*executor.value());
    auto nodes = engine.synchronizeRead();
    if (!nodes) {
        spdlog::error("Read failed: {}", nodes.error().message);
        return kExitError;
    }

    auto output = nlohmann::json::array();
    for (const auto& node : nodes.value()) {
        nlohmann::json entry{{"id", node.id},
                             {"name", node.name},
                             {"label", node.label},
                             {"properties", graph::propertiesToJson(node.properties)}};
        entry["created"] = node.created ? nlohmann::json(*node.created) : nlohmann::json(nullptr);
        output.push_back(std::move(entry));
    }
    out_ << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return kExitSuccess;
}

int NeographCLI::runConstraintCreate(const config::NeographConfig& cfg) {
    // Reject bad input before touching the store
    auto target = sync::parseConstraintTarget(constraintTarget_);
    auto kind = sync::parseConstraintKind(constraintKind_);
    if (!target || !kind) {
        spdlog::error("{}", (!target ? target.error() : kind.error()).message);
        return kExitError;
    }

    auto executor = connect(cfg);
    if (!executor)
        return kExitError;

    sync::ConstraintManager manager(*executor.value());
    auto status =
        manager.createConstraint(constraintLabel_, constraintProperty_, target.value(),
                                 kind.value());
    if (!status) {
        spdlog::error("Failed to create constraint: {}", status.error().message);
        return kExitError;
    }

    out_ << status.value().name << ": "
         << (status.value().created ? "created" : "already existed") << "\n";
    return kExitSuccess;
}

int NeographCLI::runConstraintList(const config::NeographConfig& cfg) {
    auto executor = connect(cfg);
    if (!executor)
        return kExitError;

    sync::ConstraintManager manager(*executor.value());
    auto constraints = manager.listConstraints();
    if (!constraints) {
        spdlog::error("Failed to list constraints: {}", constraints.error().message);
        return kExitError;
    }

    if (constraints.value().empty()) {
        out_ << "No constraints\n";
        return kExitSuccess;
    }
    for (const auto& c : constraints.value()) {
        out_ << c.name << "  " << c.type << "  " << c.entityType << "  ";
        for (const auto& label : c.labelsOrTypes)
            out_ << label;
        out_ << "(";
        for (size_t i = 0; i < c.properties.size(); ++i)
            out_ << (i ? ", " : "") << c.properties[i];
        out_ << ")\n";
    }
    return kExitSuccess;
}

} // namespace neograph::cli
