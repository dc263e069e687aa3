#pragma once

#include <neograph/core/types.h>
#include <neograph/graph/property_value.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace neograph::storage {

/**
 * Parsed form of the statement dialect understood by the SQLite graph store: the
 * MERGE / ON CREATE SET / SET += / RETURN upserts, MATCH reads, and the
 * CREATE CONSTRAINT / SHOW CONSTRAINTS schema commands.
 */

struct Expression {
    enum class Kind { Literal, Null, Timestamp };

    Kind kind = Kind::Null;
    graph::PropertyValue literal;

    static Expression makeLiteral(graph::PropertyValue value) {
        return Expression{Kind::Literal, std::move(value)};
    }
};

using MapLiteral = std::vector<std::pair<std::string, Expression>>;

struct NodePattern {
    std::string variable; ///< Empty for anonymous nodes
    std::optional<std::string> label;
    MapLiteral properties;
};

enum class Direction { Outgoing, Incoming, Undirected };

struct RelationshipPattern {
    std::string variable;
    std::optional<std::string> type;
    Direction direction = Direction::Undirected;
    MapLiteral properties;
};

/// A single node, or node-relationship-node.
struct PathPattern {
    NodePattern start;
    std::optional<RelationshipPattern> relationship;
    std::optional<NodePattern> end;
};

struct SetItem {
    enum class Kind {
        Property, ///< var.key = expr
        MergeMap, ///< var += {...}
        ReplaceMap ///< var = {...}
    };

    Kind kind = Kind::Property;
    std::string variable;
    std::string property;
    Expression value;
    MapLiteral map;
};

struct MatchClause {
    PathPattern pattern;
};

struct MergeClause {
    PathPattern pattern;
    std::vector<SetItem> onCreate;
    std::vector<SetItem> onMatch;
};

struct SetClause {
    std::vector<SetItem> items;
};

struct ReturnItem {
    std::string variable;
    std::optional<std::string> property;
    std::string column; ///< Output column name (alias or source text)
};

struct ReturnClause {
    std::vector<ReturnItem> items;
};

using Clause = std::variant<MatchClause, MergeClause, SetClause, ReturnClause>;

struct QueryStatement {
    std::vector<Clause> clauses;

    /// True when any clause can modify the store.
    [[nodiscard]] bool isWrite() const;
};

enum class ConstraintEntity { Node, Relationship };
enum class ConstraintRequirement { Unique, NotNull };

struct CreateConstraintStatement {
    std::string name;
    bool ifNotExists = false;
    ConstraintEntity entity = ConstraintEntity::Node;
    std::string label; ///< Node label or relationship type
    std::string property;
    ConstraintRequirement requirement = ConstraintRequirement::Unique;
};

struct ShowConstraintsStatement {};

using ParsedStatement =
    std::variant<QueryStatement, CreateConstraintStatement, ShowConstraintsStatement>;

/**
 * @brief Parse one statement
 *
 * Syntax errors are reported as InvalidData with the offending position, the way a
 * graph server rejects malformed input. A single trailing ';' is accepted.
 */
Result<ParsedStatement> parseStatement(std::string_view text);

} // namespace neograph::storage
