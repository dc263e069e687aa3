#pragma once

#include <neograph/executor/graph_executor.h>
#include <neograph/storage/database.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace neograph::storage {

/**
 * @brief Embedded graph store that evaluates the upsert dialect against SQLite
 *
 * Nodes, relationships and declared constraints live in three tables (see
 * GraphStoreMigrations). Every statement is parsed, then evaluated inside its own
 * transaction: writes take the write lock up front (BEGIN IMMEDIATE) and are rolled
 * back as a whole on any evaluation or constraint error. Statements from all sessions
 * are serialized through one mutex.
 *
 * URIs: `sqlite://<path>` for a file store, `sqlite://:memory:` for a private in-memory
 * store that lives until close().
 */
class SqliteGraphExecutor : public executor::GraphExecutor {
public:
    SqliteGraphExecutor();
    ~SqliteGraphExecutor() override;

    SqliteGraphExecutor(const SqliteGraphExecutor&) = delete;
    SqliteGraphExecutor& operator=(const SqliteGraphExecutor&) = delete;

    Result<void> open(const config::ConnectionConfig& config) override;
    void close() override;
    Result<void> reopen() override;
    [[nodiscard]] bool isOpen() const override;

    Result<std::unique_ptr<executor::ExecutorSession>> openSession() override;

    /// Database path derived from a sqlite:// URI (":memory:" for in-memory stores).
    static Result<std::string> pathFromUri(const std::string& uri);

    /// State shared between the executor and the sessions it handed out.
    struct SharedState {
        std::mutex mutex;
        Database db;
    };

private:
    std::shared_ptr<SharedState> state_;
    std::optional<config::ConnectionConfig> config_;
};

} // namespace neograph::storage
