#pragma once

#include <neograph/config/config.h>
#include <neograph/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace neograph::executor {

/**
 * @brief Update counters reported by the store for one statement
 */
struct ResultSummary {
    int64_t nodesCreated = 0;
    int64_t relationshipsCreated = 0;
    int64_t propertiesSet = 0;
    int64_t labelsAdded = 0;
    int64_t constraintsAdded = 0;
};

/**
 * @brief Records returned by one statement
 *
 * Each record is a JSON object keyed by return column. Nodes are rendered as
 * {"id", "labels", "properties"} and relationships as
 * {"id", "type", "start", "end", "properties"}.
 */
struct QueryResult {
    std::vector<std::string> keys;
    std::vector<nlohmann::json> records;
    ResultSummary summary;

    [[nodiscard]] bool empty() const { return records.empty(); }

    /// Raw form used for verbose logging.
    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief A logical unit of work against the store
 *
 * Every runWrite() executes inside its own write transaction and either applies
 * completely or not at all. Sessions are released by close() or on destruction.
 */
class ExecutorSession {
public:
    virtual ~ExecutorSession() = default;

    virtual Result<QueryResult> runWrite(const std::string& statement) = 0;
    virtual Result<QueryResult> runRead(const std::string& statement) = 0;

    virtual Result<void> close() = 0;
    [[nodiscard]] virtual bool isOpen() const = 0;
};

/**
 * @brief Transactional request/response interface to a graph store
 *
 * Connection lifecycle (open/close/reopen) belongs to the owner of the executor;
 * the sync engine only opens sessions on an already open executor.
 */
class GraphExecutor {
public:
    virtual ~GraphExecutor() = default;

    virtual Result<void> open(const config::ConnectionConfig& config) = 0;
    virtual void close() = 0;

    /// Close and open again with the configuration of the last successful open().
    virtual Result<void> reopen() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;

    virtual Result<std::unique_ptr<ExecutorSession>> openSession() = 0;
};

/**
 * @brief Create and open the executor matching the URI scheme of @p config
 *
 * Supports sqlite:// URIs. Other schemes yield NotSupported.
 */
Result<std::unique_ptr<GraphExecutor>> makeExecutor(const config::ConnectionConfig& config);

} // namespace neograph::executor
