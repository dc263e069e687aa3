#include <neograph/executor/graph_executor.h>
#include <neograph/storage/sqlite_graph_executor.h>

#include <spdlog/spdlog.h>

namespace neograph::executor {

nlohmann::json QueryResult::toJson() const {
    return nlohmann::json{{"keys", keys},
                          {"records", records},
                          {"summary",
                           {{"nodesCreated", summary.nodesCreated},
                            {"relationshipsCreated", summary.relationshipsCreated},
                            {"propertiesSet", summary.propertiesSet},
                            {"labelsAdded", summary.labelsAdded},
                            {"constraintsAdded", summary.constraintsAdded}}}};
}

Result<std::unique_ptr<GraphExecutor>> makeExecutor(const config::ConnectionConfig& config) {
    // Reject unknown schemes before anything is allocated
    auto path = storage::SqliteGraphExecutor::pathFromUri(config.uri);
    if (!path) {
        return path.error();
    }

    auto executor = std::make_unique<storage::SqliteGraphExecutor>();
    auto opened = executor->open(config);
    if (!opened) {
        spdlog::error("Failed to open graph store '{}': {}", config.uri, opened.error().message);
        return opened.error();
    }
    return std::unique_ptr<GraphExecutor>(std::move(executor));
}

} // namespace neograph::executor
