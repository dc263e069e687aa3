#include <neograph/sync/sync_report.h>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace neograph::sync {

const char* toString(EntityKind kind) {
    return kind == EntityKind::Node ? "node" : "edge";
}

const char* toString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Created:
            return "created";
        case OutcomeStatus::Matched:
            return "matched";
        case OutcomeStatus::Failed:
            return "failed";
    }
    return "unknown";
}

std::size_t SyncReport::count(EntityKind kind, OutcomeStatus status) const {
    const auto& list = kind == EntityKind::Node ? nodes : edges;
    return static_cast<std::size_t>(std::count_if(
        list.begin(), list.end(), [status](const EntityOutcome& o) { return o.status == status; }));
}

std::vector<EntityOutcome> SyncReport::failures() const {
    std::vector<EntityOutcome> out;
    for (const auto* list : {&nodes, &edges}) {
        std::copy_if(list->begin(), list->end(), std::back_inserter(out),
                     [](const EntityOutcome& o) { return o.status == OutcomeStatus::Failed; });
    }
    return out;
}

bool SyncReport::ok() const {
    return count(EntityKind::Node, OutcomeStatus::Failed) == 0 &&
           count(EntityKind::Edge, OutcomeStatus::Failed) == 0;
}

std::string SyncReport::summary() const {
    return fmt::format("nodes: {} created, {} matched, {} failed; "
                       "edges: {} created, {} matched, {} failed",
                       count(EntityKind::Node, OutcomeStatus::Created),
                       count(EntityKind::Node, OutcomeStatus::Matched),
                       count(EntityKind::Node, OutcomeStatus::Failed),
                       count(EntityKind::Edge, OutcomeStatus::Created),
                       count(EntityKind::Edge, OutcomeStatus::Matched),
                       count(EntityKind::Edge, OutcomeStatus::Failed));
}

} // namespace neograph::sync
