#include <neograph/cypher/sanitizer.h>
#include <neograph/sync/constraint_manager.h>
#include <neograph/sync/session_scope.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace neograph::sync {

namespace {

constexpr const char* kShowConstraints = "SHOW CONSTRAINTS";

bool validTarget(ConstraintTarget target) {
    return target == ConstraintTarget::Node || target == ConstraintTarget::Relationship;
}

bool validKind(ConstraintKind kind) {
    return kind == ConstraintKind::Unique || kind == ConstraintKind::Exists;
}

std::vector<std::string> stringList(const nlohmann::json& record, const char* key) {
    std::vector<std::string> out;
    auto it = record.find(key);
    if (it == record.end() || !it->is_array())
        return out;
    for (const auto& item : *it) {
        if (item.is_string())
            out.push_back(item.get<std::string>());
    }
    return out;
}

std::string stringField(const nlohmann::json& record, const char* key) {
    auto it = record.find(key);
    return it != record.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

} // namespace

const char* toString(ConstraintTarget target) {
    return target == ConstraintTarget::Node ? "node" : "relationship";
}

const char* toString(ConstraintKind kind) {
    return kind == ConstraintKind::Unique ? "unique" : "exists";
}

Result<ConstraintTarget> parseConstraintTarget(std::string_view text) {
    if (text == "node")
        return ConstraintTarget::Node;
    if (text == "relationship")
        return ConstraintTarget::Relationship;
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("Invalid constraint target '{}': expected node or relationship",
                             text)};
}

Result<ConstraintKind> parseConstraintKind(std::string_view text) {
    if (text == "unique")
        return ConstraintKind::Unique;
    if (text == "exists")
        return ConstraintKind::Exists;
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("Invalid constraint kind '{}': expected unique or exists", text)};
}

std::string constraintName(std::string_view label, std::string_view property,
                           ConstraintTarget target, ConstraintKind kind) {
    return fmt::format("{}_{}_{}_{}", label, toString(target), property, toString(kind));
}

ConstraintManager::ConstraintManager(executor::GraphExecutor& executor) : executor_(executor) {}

Result<std::string> ConstraintManager::buildCreateStatement(std::string_view label,
                                                            std::string_view property,
                                                            ConstraintTarget target,
                                                            ConstraintKind kind) {
    if (!validTarget(target)) {
        return Error{ErrorCode::InvalidArgument, "Invalid constraint target"};
    }
    if (!validKind(kind)) {
        return Error{ErrorCode::InvalidArgument, "Invalid constraint kind"};
    }

    auto pattern = target == ConstraintTarget::Node ? fmt::format("(x:{})", label)
                                                    : fmt::format("()-[x:{}]-()", label);
    const char* requirement = kind == ConstraintKind::Unique ? "IS UNIQUE" : "IS NOT NULL";

    return fmt::format("CREATE CONSTRAINT {} IF NOT EXISTS\n"
                       "FOR {}\n"
                       "REQUIRE x.{} {}",
                       constraintName(label, property, target, kind), pattern, property,
                       requirement);
}

Result<ConstraintStatus> ConstraintManager::createConstraint(const std::string& label,
                                                             const std::string& property,
                                                             ConstraintTarget target,
                                                             ConstraintKind kind) {
    auto [cleanLabel, cleanProperty] = cypher::sanitizeAll(label, property);
    auto statement = buildCreateStatement(cleanLabel, cleanProperty, target, kind);
    if (!statement) {
        return statement.error();
    }

    ConstraintStatus status;
    status.name = constraintName(cleanLabel, cleanProperty, target, kind);

    return withSession(executor_,
                       [&](executor::ExecutorSession& session) -> Result<ConstraintStatus> {
                           auto result = session.runWrite(statement.value());
                           if (!result) {
                               return result.error();
                           }
                           status.created = result.value().summary.constraintsAdded > 0;
                           spdlog::info("Constraint {} {}", status.name,
                                        status.created ? "created" : "already existed");
                           return status;
                       });
}

Result<ConstraintStatus> ConstraintManager::createConstraint(const std::string& label,
                                                             const std::string& property,
                                                             std::string_view target,
                                                             std::string_view kind) {
    auto parsedTarget = parseConstraintTarget(target);
    if (!parsedTarget) {
        return parsedTarget.error();
    }
    auto parsedKind = parseConstraintKind(kind);
    if (!parsedKind) {
        return parsedKind.error();
    }
    return createConstraint(label, property, parsedTarget.value(), parsedKind.value());
}

Result<std::vector<ConstraintDescriptor>> ConstraintManager::listConstraints() {
    return withSession(
        executor_,
        [](executor::ExecutorSession& session) -> Result<std::vector<ConstraintDescriptor>> {
            auto result = session.runRead(kShowConstraints);
            if (!result) {
                return result.error();
            }

            std::vector<ConstraintDescriptor> constraints;
            for (const auto& record : result.value().records) {
                ConstraintDescriptor d;
                d.name = stringField(record, "name");
                d.type = stringField(record, "type");
                d.entityType = stringField(record, "entityType");
                d.labelsOrTypes = stringList(record, "labelsOrTypes");
                d.properties = stringList(record, "properties");
                constraints.push_back(std::move(d));
            }
            return constraints;
        });
}

} // namespace neograph::sync
