#include <neograph/cypher/upsert_query_builder.h>

#include <fmt/format.h>

namespace neograph::cypher {

namespace {

std::string mergeClause(std::string_view var, std::string_view properties) {
    if (properties.empty()) {
        return {};
    }
    return fmt::format("SET {} += {{{}}}\n", var, properties);
}

} // namespace

UpsertStatement UpsertQueryBuilder::buildNodeUpsert(std::string_view label, std::string_view name,
                                                    std::string_view properties) {
    UpsertStatement stmt;
    stmt.text = fmt::format("MERGE (n:{} {{name: \"{}\"}})\n"
                            "ON CREATE\n"
                            "    SET n.created = timestamp()\n"
                            "{}"
                            "RETURN n, n.created",
                            label, name, mergeClause("n", properties));
    stmt.returns = {"n", "n.created"};
    return stmt;
}

UpsertStatement UpsertQueryBuilder::buildEdgeUpsert(std::string_view fromLabel,
                                                    std::string_view fromName,
                                                    std::string_view toLabel,
                                                    std::string_view toName,
                                                    std::string_view relationship,
                                                    std::string_view properties) {
    UpsertStatement stmt;
    stmt.text = fmt::format("MERGE (a:{} {{name: \"{}\"}})\n"
                            "MERGE (b:{} {{name: \"{}\"}})\n"
                            "MERGE (a)-[e:{}]->(b)\n"
                            "ON CREATE\n"
                            "    SET e.created = timestamp()\n"
                            "{}"
                            "RETURN e, e.created",
                            fromLabel, fromName, toLabel, toName, relationship,
                            mergeClause("e", properties));
    stmt.returns = {"e", "e.created"};
    return stmt;
}

} // namespace neograph::cypher
