#include <catch2/catch_test_macros.hpp>

#include <neograph/storage/statement_parser.h>

using namespace neograph;
using namespace neograph::storage;

namespace {
QueryStatement parseQuery(const std::string& text) {
    auto parsed = parseStatement(text);
    REQUIRE(parsed.has_value());
    REQUIRE(std::holds_alternative<QueryStatement>(parsed.value()));
    return std::get<QueryStatement>(parsed.value());
}
} // namespace

TEST_CASE("StatementParser: node upsert", "[unit][storage][parser]") {
    auto q = parseQuery("MERGE (n:Person {name: \"Alice\"})\n"
                        "ON CREATE\n"
                        "    SET n.created = timestamp()\n"
                        "SET n += {city: \"LA\", age: 30, score: -1.5, active: true}\n"
                        "RETURN n, n.created");
    REQUIRE(q.clauses.size() == 3);
    CHECK(q.isWrite());

    const auto& merge = std::get<MergeClause>(q.clauses[0]);
    CHECK(merge.pattern.start.variable == "n");
    CHECK(merge.pattern.start.label == "Person");
    REQUIRE(merge.pattern.start.properties.size() == 1);
    CHECK(merge.pattern.start.properties[0].first == "name");
    CHECK(merge.pattern.start.properties[0].second.literal == graph::PropertyValue("Alice"));
    CHECK_FALSE(merge.pattern.relationship);

    REQUIRE(merge.onCreate.size() == 1);
    CHECK(merge.onCreate[0].kind == SetItem::Kind::Property);
    CHECK(merge.onCreate[0].property == "created");
    CHECK(merge.onCreate[0].value.kind == Expression::Kind::Timestamp);
    CHECK(merge.onMatch.empty());

    const auto& set = std::get<SetClause>(q.clauses[1]);
    REQUIRE(set.items.size() == 1);
    CHECK(set.items[0].kind == SetItem::Kind::MergeMap);
    REQUIRE(set.items[0].map.size() == 4);
    CHECK(set.items[0].map[1].second.literal == graph::PropertyValue(30));
    CHECK(set.items[0].map[2].second.literal == graph::PropertyValue(-1.5));
    CHECK(set.items[0].map[3].second.literal == graph::PropertyValue(true));

    const auto& ret = std::get<ReturnClause>(q.clauses[2]);
    REQUIRE(ret.items.size() == 2);
    CHECK(ret.items[0].column == "n");
    CHECK(ret.items[1].column == "n.created");
    CHECK(ret.items[1].property == "created");
}

TEST_CASE("StatementParser: relationship patterns", "[unit][storage][parser]") {
    auto q = parseQuery("MERGE (a)-[e:KNOWS]->(b)");
    const auto& merge = std::get<MergeClause>(q.clauses[0]);
    REQUIRE(merge.pattern.relationship);
    CHECK(merge.pattern.relationship->type == "KNOWS");
    CHECK(merge.pattern.relationship->direction == Direction::Outgoing);
    CHECK(merge.pattern.end->variable == "b");

    auto incoming = parseQuery("MATCH (a)<-[r]-(b) RETURN r");
    CHECK(std::get<MatchClause>(incoming.clauses[0]).pattern.relationship->direction ==
          Direction::Incoming);
    CHECK_FALSE(incoming.isWrite());

    auto undirected = parseQuery("MATCH ()-[r:T]-() RETURN r");
    CHECK(std::get<MatchClause>(undirected.clauses[0]).pattern.relationship->direction ==
          Direction::Undirected);
}

TEST_CASE("StatementParser: read statement", "[unit][storage][parser]") {
    auto q = parseQuery("MATCH (n)\nRETURN n;");
    REQUIRE(q.clauses.size() == 2);
    CHECK_FALSE(q.isWrite());
    CHECK_FALSE(std::get<MatchClause>(q.clauses[0]).pattern.start.label);
}

TEST_CASE("StatementParser: string escapes", "[unit][storage][parser]") {
    auto q = parseQuery(R"(MERGE (n:L {name: 'It\'s é'}))");
    const auto& merge = std::get<MergeClause>(q.clauses[0]);
    CHECK(merge.pattern.start.properties[0].second.literal ==
          graph::PropertyValue("It's \xC3\xA9"));

    auto u = parseQuery(R"(MERGE (n:L {name: "caf\u00e9 \u20AC"}))");
    const auto& umerge = std::get<MergeClause>(u.clauses[0]);
    CHECK(umerge.pattern.start.properties[0].second.literal ==
          graph::PropertyValue("caf\xC3\xA9 \xE2\x82\xAC"));
}

TEST_CASE("StatementParser: constraint commands", "[unit][storage][parser]") {
    auto parsed = parseStatement("CREATE CONSTRAINT Person_node_name_unique IF NOT EXISTS\n"
                                 "FOR (x:Person)\n"
                                 "REQUIRE x.name IS UNIQUE");
    REQUIRE(parsed.has_value());
    const auto& c = std::get<CreateConstraintStatement>(parsed.value());
    CHECK(c.name == "Person_node_name_unique");
    CHECK(c.ifNotExists);
    CHECK(c.entity == ConstraintEntity::Node);
    CHECK(c.label == "Person");
    CHECK(c.property == "name");
    CHECK(c.requirement == ConstraintRequirement::Unique);

    auto rel = parseStatement("create constraint KNOWS_relationship_since_exists if not exists "
                              "for ()-[x:KNOWS]-() require x.since is not null");
    REQUIRE(rel.has_value());
    const auto& r = std::get<CreateConstraintStatement>(rel.value());
    CHECK(r.entity == ConstraintEntity::Relationship);
    CHECK(r.label == "KNOWS");
    CHECK(r.requirement == ConstraintRequirement::NotNull);

    auto show = parseStatement("SHOW CONSTRAINTS");
    REQUIRE(show.has_value());
    CHECK(std::holds_alternative<ShowConstraintsStatement>(show.value()));
}

TEST_CASE("StatementParser: syntax errors", "[unit][storage][parser]") {
    const char* bad[] = {
        "",
        "MERGE (n: {name: \"x\"})",                 // empty label
        "MERGE (n:Big Person {name: \"x\"})",       // label with a space
        "MERGE (n:L {first-name: \"x\"})",          // hyphenated key
        "MERGE (n:L {name: \"unterminated})",
        "MERGE (n:L {name: \"x\"}) RETURN",
        "MERGE (n:L {name: \"x\\q\"})",             // unknown escape
        "DELETE n",
        "MATCH (n) RETURN n; extra",
        "CREATE CONSTRAINT c FOR (x:L) REQUIRE y.p IS UNIQUE",
        "MERGE (a)<-[e:R]->(b)",
        "MERGE (n:L {name: \"\\uD800\"})",         // lone surrogate
        "MERGE (n:L {name: \"\\uDFFF\"})",
    };
    for (const auto* text : bad) {
        INFO(text);
        auto parsed = parseStatement(text);
        REQUIRE_FALSE(parsed);
        CHECK(parsed.error().code == ErrorCode::InvalidData);
    }
}
