#pragma once

#include <neograph/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace neograph::sync {

enum class EntityKind { Node, Edge };

enum class OutcomeStatus {
    Created, ///< The store created the node or relationship
    Matched, ///< An existing entity was matched and its properties merged
    Failed   ///< The statement was rejected; see EntityOutcome::error
};

const char* toString(EntityKind kind);
const char* toString(OutcomeStatus status);

/**
 * @brief Result of upserting one node or edge
 */
struct EntityOutcome {
    EntityKind kind = EntityKind::Node;
    std::string key; ///< Node name, or "from->to" for an edge
    OutcomeStatus status = OutcomeStatus::Matched;
    std::optional<int64_t> createdAt; ///< Creation timestamp reported by the store
    std::optional<Error> error;       ///< Set only for Failed outcomes
};

/**
 * @brief Per-entity outcomes of one synchronize pass
 *
 * Failed entities are collected here rather than returned as the call's error; the
 * call itself only fails when no session could be used at all.
 */
struct SyncReport {
    std::vector<EntityOutcome> nodes;
    std::vector<EntityOutcome> edges;

    [[nodiscard]] std::size_t count(EntityKind kind, OutcomeStatus status) const;
    [[nodiscard]] std::vector<EntityOutcome> failures() const;

    /// True when no entity failed.
    [[nodiscard]] bool ok() const;

    /// One-line tally for logs, e.g. "nodes: 2 created, 1 matched, 0 failed; edges: ..."
    [[nodiscard]] std::string summary() const;
};

} // namespace neograph::sync
