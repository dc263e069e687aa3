#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace neograph::cypher {

/**
 * @brief A match-or-create statement together with the result shape it yields
 */
struct UpsertStatement {
    std::string text;                 ///< Statement text sent to the store
    std::vector<std::string> returns; ///< Expected result columns, in order
};

/**
 * @brief Builds the MERGE statements used to synchronize nodes and edges
 *
 * Inputs must already be sanitized (see sanitize()) and the property fragment
 * encoded (see encodeProperties()). Labels and relationship types are embedded as
 * bare tokens; names are double-quoted.
 */
class UpsertQueryBuilder {
public:
    /**
     * @brief Match-or-create a node by (label, name)
     *
     * @code
     * MERGE (n:Person {name: "Alice"})
     * ON CREATE
     *     SET n.created = timestamp()
     * SET n += {city: "LA"}
     * RETURN n, n.created
     * @endcode
     *
     * The `SET n += {...}` line is omitted when @p properties is empty.
     */
    static UpsertStatement buildNodeUpsert(std::string_view label, std::string_view name,
                                           std::string_view properties);

    /**
     * @brief Match-or-create both endpoints and the directed relationship between them
     *
     * The relationship is matched by (from, type, to) in that direction, so an
     * existing relationship of the same type is never duplicated.
     */
    static UpsertStatement buildEdgeUpsert(std::string_view fromLabel, std::string_view fromName,
                                           std::string_view toLabel, std::string_view toName,
                                           std::string_view relationship,
                                           std::string_view properties);
};

} // namespace neograph::cypher
