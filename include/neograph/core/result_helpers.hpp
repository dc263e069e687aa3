#pragma once

/**
 * @file result_helpers.hpp
 * @brief Error handling macros and utilities for Result<T>
 *
 * Provides TRY macros to reduce boilerplate in error handling code.
 * These macros implement early return on error.
 */

#include <neograph/core/types.h>

#include <utility>

namespace neograph {

/**
 * @def NEOGRAPH_TRY(expr)
 * @brief Evaluate expression and return early if it's an error
 *
 * Use this for expressions that return Result<void> when you don't need
 * the value, just need to propagate errors.
 *
 * Example:
 * @code
 * Result<void> doWork() {
 *     NEOGRAPH_TRY(step1());  // Returns if step1() fails
 *     NEOGRAPH_TRY(step2());  // Returns if step2() fails
 *     return {};              // Success
 * }
 * @endcode
 */
#define NEOGRAPH_TRY(expr)                                                                         \
    do {                                                                                           \
        auto _neograph_try_result = (expr);                                                        \
        if (!_neograph_try_result.has_value()) {                                                   \
            return _neograph_try_result.error();                                                   \
        }                                                                                          \
    } while (0)

/**
 * @def NEOGRAPH_TRY_UNWRAP(var, expr)
 * @brief Declare and initialize variable from Result, returning error if failed
 *
 * Example:
 * @code
 * Result<int> compute() {
 *     NEOGRAPH_TRY_UNWRAP(stmt, db.prepare(sql));
 *     NEOGRAPH_TRY_UNWRAP(hasRow, stmt.step());
 *     return hasRow ? stmt.getInt(0) : 0;
 * }
 * @endcode
 */
#define NEOGRAPH_TRY_UNWRAP(var, expr)                                                             \
    auto _neograph_res_##var = (expr);                                                             \
    if (!_neograph_res_##var.has_value()) {                                                        \
        return _neograph_res_##var.error();                                                        \
    }                                                                                              \
    auto var = std::move(_neograph_res_##var).value()

// ============================================================================
// Scope Guard for RAII-style cleanup
// ============================================================================

/**
 * @brief Execute cleanup code on scope exit
 *
 * Useful for ensuring cleanup happens regardless of early returns.
 *
 * Example:
 * @code
 * Result<void> doWork() {
 *     auto cleanup = scope_exit([&] { releaseResource(); });
 *     NEOGRAPH_TRY(step1());
 *     NEOGRAPH_TRY(step2());
 *     cleanup.dismiss(); // Don't run cleanup on success
 *     return {};
 * }
 * @endcode
 */
template <typename Func> class ScopeGuard {
public:
    explicit ScopeGuard(Func func) : func_(std::move(func)) {}

    ~ScopeGuard() {
        if (active_) {
            func_();
        }
    }

    // Move-only
    ScopeGuard(ScopeGuard&& other) noexcept
        : func_(std::move(other.func_)), active_(other.active_) {
        other.active_ = false;
    }
    ScopeGuard& operator=(ScopeGuard&&) = delete;
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    void dismiss() noexcept { active_ = false; }

private:
    Func func_;
    bool active_ = true;
};

template <typename Func> ScopeGuard<Func> scope_exit(Func func) {
    return ScopeGuard<Func>(std::move(func));
}

} // namespace neograph
