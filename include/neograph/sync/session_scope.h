#pragma once

#include <neograph/core/result_helpers.hpp>
#include <neograph/executor/graph_executor.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace neograph::sync {

/**
 * @brief Run @p body with a fresh session and release the session on every path
 *
 * A session that cannot be opened, or that fails to close after @p body returns, is
 * reported as ResourceFailure carrying the executor's message. A close failure wins
 * even when @p body succeeded; work already committed stays committed.
 */
template <typename Func>
auto withSession(executor::GraphExecutor& executor, Func&& body)
    -> decltype(body(std::declval<executor::ExecutorSession&>())) {
    auto sessionResult = executor.openSession();
    if (!sessionResult) {
        const auto& cause = sessionResult.error();
        return Error{ErrorCode::ResourceFailure,
                     fmt::format("Failed to open session: {} ({})", cause.message, cause.code)};
    }
    auto session = std::move(sessionResult).value();

    // Only fires if body throws
    auto guard = scope_exit([&session] {
        auto closed = session->close();
        if (!closed) {
            spdlog::warn("Failed to close session: {}", closed.error().message);
        }
    });

    auto result = body(*session);
    guard.dismiss();

    auto closed = session->close();
    if (!closed) {
        if (!result) {
            spdlog::warn("Session work failed before close: {}", result.error().message);
        }
        return Error{ErrorCode::ResourceFailure,
                     "Failed to close session: " + closed.error().message};
    }
    return result;
}

} // namespace neograph::sync
