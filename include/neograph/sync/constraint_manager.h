#pragma once

#include <neograph/core/types.h>
#include <neograph/executor/graph_executor.h>

#include <string>
#include <string_view>
#include <vector>

namespace neograph::sync {

enum class ConstraintTarget { Node, Relationship };
enum class ConstraintKind { Unique, Exists };

const char* toString(ConstraintTarget target);
const char* toString(ConstraintKind kind);

/// Accepts "node" / "relationship"; anything else is InvalidArgument.
Result<ConstraintTarget> parseConstraintTarget(std::string_view text);
/// Accepts "unique" / "exists"; anything else is InvalidArgument.
Result<ConstraintKind> parseConstraintKind(std::string_view text);

/**
 * @brief Deterministic constraint name: <label>_<target>_<property>_<kind>
 */
std::string constraintName(std::string_view label, std::string_view property,
                           ConstraintTarget target, ConstraintKind kind);

struct ConstraintStatus {
    std::string name;
    bool created = false; ///< False when the constraint already existed
};

/**
 * @brief A constraint as reported by the store
 */
struct ConstraintDescriptor {
    std::string name;
    std::string type;       ///< e.g. UNIQUENESS, NODE_PROPERTY_EXISTENCE
    std::string entityType; ///< NODE or RELATIONSHIP
    std::vector<std::string> labelsOrTypes;
    std::vector<std::string> properties;
};

/**
 * @brief Declares uniqueness and existence constraints on the store
 *
 * Every call runs in its own session. Creating a constraint that already exists is
 * not an error; it is reported with created == false.
 */
class ConstraintManager {
public:
    explicit ConstraintManager(executor::GraphExecutor& executor);

    Result<ConstraintStatus> createConstraint(const std::string& label,
                                              const std::string& property,
                                              ConstraintTarget target, ConstraintKind kind);

    /**
     * @brief String form for user input; target and kind are validated before any
     *        statement is issued
     */
    Result<ConstraintStatus> createConstraint(const std::string& label,
                                              const std::string& property,
                                              std::string_view target, std::string_view kind);

    Result<std::vector<ConstraintDescriptor>> listConstraints();

    /// Statement text for a constraint; label and property must already be sanitized.
    static Result<std::string> buildCreateStatement(std::string_view label,
                                                    std::string_view property,
                                                    ConstraintTarget target, ConstraintKind kind);

private:
    executor::GraphExecutor& executor_;
};

} // namespace neograph::sync
