// Shared helpers for the Catch2 unit tests

#pragma once

#include <neograph/config/config.h>
#include <neograph/storage/sqlite_graph_executor.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace neograph::test {

/**
 * @brief Creates a unique temporary directory with the given prefix.
 */
inline std::filesystem::path make_temp_dir(std::string_view prefix = "neograph_test_") {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path();
    std::uniform_int_distribution<int> dist(0, 9999);
    thread_local std::mt19937_64 rng{std::random_device{}()};
    for (int attempt = 0; attempt < 512; ++attempt) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        auto candidate =
            base / (std::string(prefix) + std::to_string(stamp) + "_" + std::to_string(dist(rng)));
        std::error_code ec;
        if (fs::create_directories(candidate, ec)) {
            return candidate;
        }
    }
    return base;
}

/**
 * @brief Write data to a file, creating parent directories as needed.
 */
inline std::filesystem::path write_file(const std::filesystem::path& path, std::string_view data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary);
    stream.write(data.data(), static_cast<std::streamsize>(data.size()));
    stream.close();
    return path;
}

/**
 * @brief RAII helper to set an environment variable and restore it on scope exit.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value)
        : key_(std::move(key)), previous_(get_env(key_)) {
        set_env(key_, std::move(value));
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { set_env(key_, previous_); }

private:
    static std::optional<std::string> get_env(const std::string& key) {
        if (const auto* value = std::getenv(key.c_str()); value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    }

    static void set_env(const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            ::setenv(key.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
};

/**
 * @brief Removes a temporary directory tree on scope exit.
 */
struct TempDirGuard {
    std::filesystem::path path = make_temp_dir();

    ~TempDirGuard() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

inline config::ConnectionConfig memoryStoreConfig() {
    config::ConnectionConfig cfg;
    cfg.uri = "sqlite://:memory:";
    return cfg;
}

/**
 * @brief Executor decorator that can fail statements, session opens and session closes
 *
 * Forwards to a real executor; failStatement decides per statement text whether the
 * session returns an injected DatabaseError instead of running it.
 */
class FaultInjectingExecutor : public executor::GraphExecutor {
public:
    explicit FaultInjectingExecutor(executor::GraphExecutor& inner) : inner_(inner) {}

    std::function<bool(const std::string&)> failStatement;
    bool failOpenSession = false;
    bool failCloseSession = false;
    int statementsSeen = 0;
    std::vector<std::string> statements; ///< Every statement text, in issue order
    int sessionsOpened = 0;
    int sessionsClosed = 0;

    Result<void> open(const config::ConnectionConfig& config) override {
        return inner_.open(config);
    }
    void close() override { inner_.close(); }
    Result<void> reopen() override { return inner_.reopen(); }
    bool isOpen() const override { return inner_.isOpen(); }

    Result<std::unique_ptr<executor::ExecutorSession>> openSession() override {
        if (failOpenSession) {
            return Error{ErrorCode::NetworkError, "injected: connection refused"};
        }
        auto session = inner_.openSession();
        if (!session) {
            return session.error();
        }
        ++sessionsOpened;
        return std::unique_ptr<executor::ExecutorSession>(
            std::make_unique<Session>(*this, std::move(session).value()));
    }

private:
    class Session : public executor::ExecutorSession {
    public:
        Session(FaultInjectingExecutor& owner, std::unique_ptr<executor::ExecutorSession> inner)
            : owner_(owner), inner_(std::move(inner)) {}

        Result<executor::QueryResult> runWrite(const std::string& statement) override {
            if (shouldFail(statement)) {
                return Error{ErrorCode::DatabaseError, "injected statement failure"};
            }
            return inner_->runWrite(statement);
        }

        Result<executor::QueryResult> runRead(const std::string& statement) override {
            if (shouldFail(statement)) {
                return Error{ErrorCode::DatabaseError, "injected statement failure"};
            }
            return inner_->runRead(statement);
        }

        Result<void> close() override {
            ++owner_.sessionsClosed;
            auto closed = inner_->close();
            if (owner_.failCloseSession) {
                return Error{ErrorCode::NetworkError, "injected: connection reset on close"};
            }
            return closed;
        }

        bool isOpen() const override { return inner_->isOpen(); }

    private:
        bool shouldFail(const std::string& statement) {
            ++owner_.statementsSeen;
            owner_.statements.push_back(statement);
            return owner_.failStatement && owner_.failStatement(statement);
        }

        FaultInjectingExecutor& owner_;
        std::unique_ptr<executor::ExecutorSession> inner_;
    };

    executor::GraphExecutor& inner_;
};

} // namespace neograph::test
