#pragma once

#include <neograph/core/types.h>
#include <neograph/executor/graph_executor.h>
#include <neograph/graph/property_graph.h>
#include <neograph/sync/sync_report.h>

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace neograph::sync {

struct SyncOptions {
    /// Channel for verbose statement/result output; spdlog's default logger when null.
    std::shared_ptr<spdlog::logger> logger;
};

/**
 * @brief A node as read back from the store
 */
struct PersistedNode {
    int64_t id = 0;
    std::string label;
    std::string name;
    std::optional<int64_t> created;
    graph::PropertyMap properties; ///< Everything except name and created
};

/**
 * @brief Pushes an in-memory graph into the store with match-or-create statements
 *
 * Nodes are matched by (label, name) and edges by (from, type, to), so running the
 * same graph any number of times never creates duplicates. Supplementary properties
 * are merged on every pass; the creation timestamp is set once.
 *
 * The engine does not own the executor. Opening, closing and reopening the connection
 * stays with the caller.
 */
class SyncEngine {
public:
    explicit SyncEngine(executor::GraphExecutor& executor, SyncOptions options = {});

    /**
     * @brief Upsert every node, then every edge, each in its own write transaction
     *
     * A failing entity is recorded in the report and the walk continues. The call
     * itself fails only when the session cannot be opened or closed.
     *
     * @param verbose Log each statement and its raw result at info level
     */
    Result<SyncReport> synchronize(const graph::PropertyGraph& graph, bool verbose = false);

    /**
     * @brief Read every persisted node
     *
     * An empty store yields an empty vector.
     */
    Result<std::vector<PersistedNode>> synchronizeRead();

private:
    executor::GraphExecutor& executor_;
    std::shared_ptr<spdlog::logger> logger_;

    EntityOutcome upsertNode(executor::ExecutorSession& session, const std::string& name,
                             const graph::NodeData& node, bool verbose);
    EntityOutcome upsertEdge(executor::ExecutorSession& session, const graph::PropertyGraph& graph,
                             const graph::EdgeKey& key, const graph::EdgeData& edge, bool verbose);

    EntityOutcome execute(executor::ExecutorSession& session, EntityKind kind, std::string key,
                          const std::string& statement, const std::string& createdColumn,
                          bool verbose);
};

} // namespace neograph::sync
