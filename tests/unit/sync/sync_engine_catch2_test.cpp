#include <catch2/catch_test_macros.hpp>

#include <neograph/storage/sqlite_graph_executor.h>
#include <neograph/sync/sync_engine.h>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

#include "../../common/test_helpers_catch2.h"

using namespace neograph;
using namespace neograph::sync;
using graph::PropertyGraph;
using graph::PropertyMap;
using graph::PropertyValue;

namespace {
struct SyncFixture {
    SyncFixture() { REQUIRE(store.open(test::memoryStoreConfig())); }

    std::vector<PersistedNode> readAll() {
        SyncEngine engine(store);
        auto nodes = engine.synchronizeRead();
        REQUIRE(nodes.has_value());
        return std::move(nodes).value();
    }

    size_t relationshipCount() {
        auto session = store.openSession();
        REQUIRE(session.has_value());
        auto r = session.value()->runRead("MATCH (a)-[e]->(b) RETURN e");
        REQUIRE(r.has_value());
        return r.value().records.size();
    }

    storage::SqliteGraphExecutor store;
};

PropertyGraph sampleGraph() {
    PropertyGraph g;
    g.addNode("Alice", "Person", PropertyMap{{"city", PropertyValue("LA")}});
    g.addNode("Bob", "Person");
    g.addNode("LA", "City", PropertyMap{{"population", PropertyValue(3900000)}});
    REQUIRE(g.addEdge("Alice", "Bob", "KNOWS", PropertyMap{{"since", PropertyValue(2015)}}));
    REQUIRE(g.addEdge("Alice", "LA", "LIVES_IN"));
    return g;
}

const PersistedNode* findByName(const std::vector<PersistedNode>& nodes, const std::string& name) {
    for (const auto& n : nodes) {
        if (n.name == name)
            return &n;
    }
    return nullptr;
}
} // namespace

TEST_CASE("SyncEngine: repeated sync never duplicates", "[unit][sync]") {
    SyncFixture fix;
    SyncEngine engine(fix.store);
    auto graph = sampleGraph();

    auto first = engine.synchronize(graph);
    REQUIRE(first.has_value());
    CHECK(first.value().ok());
    CHECK(first.value().count(EntityKind::Node, OutcomeStatus::Created) == 3);
    CHECK(first.value().count(EntityKind::Edge, OutcomeStatus::Created) == 2);
    for (const auto& outcome : first.value().nodes) {
        CHECK(outcome.createdAt.has_value());
    }

    auto second = engine.synchronize(graph);
    REQUIRE(second.has_value());
    CHECK(second.value().ok());
    CHECK(second.value().count(EntityKind::Node, OutcomeStatus::Created) == 0);
    CHECK(second.value().count(EntityKind::Node, OutcomeStatus::Matched) == 3);
    CHECK(second.value().count(EntityKind::Edge, OutcomeStatus::Created) == 0);
    CHECK(second.value().count(EntityKind::Edge, OutcomeStatus::Matched) == 2);

    CHECK(fix.readAll().size() == 3);
    CHECK(fix.relationshipCount() == 2);
    CHECK(second.value().summary() ==
          "nodes: 0 created, 3 matched, 0 failed; edges: 0 created, 2 matched, 0 failed");
}

TEST_CASE("SyncEngine: properties merge and creation time is kept", "[unit][sync]") {
    SyncFixture fix;
    SyncEngine engine(fix.store);

    PropertyGraph g;
    g.addNode("Alice", "Person", PropertyMap{{"city", PropertyValue("LA")}});
    auto first = engine.synchronize(g);
    REQUIRE(first.has_value());
    REQUIRE(first.value().nodes.size() == 1);
    auto createdAt = first.value().nodes[0].createdAt;
    REQUIRE(createdAt.has_value());

    PropertyGraph later;
    later.addNode("Alice", "Person", PropertyMap{{"age", PropertyValue(30)}});
    auto second = engine.synchronize(later);
    REQUIRE(second.has_value());
    CHECK(second.value().nodes[0].status == OutcomeStatus::Matched);
    CHECK(second.value().nodes[0].createdAt == createdAt);

    auto nodes = fix.readAll();
    REQUIRE(nodes.size() == 1);
    const auto& alice = nodes[0];
    CHECK(alice.name == "Alice");
    CHECK(alice.label == "Person");
    CHECK(alice.created == createdAt);
    CHECK(alice.properties.at("city") == PropertyValue("LA"));
    CHECK(alice.properties.at("age") == PropertyValue(30));
    CHECK(alice.properties.count("name") == 0);
}

TEST_CASE("SyncEngine: edges from another snapshot are not duplicated", "[unit][sync]") {
    SyncFixture fix;
    SyncEngine engine(fix.store);
    REQUIRE(engine.synchronize(sampleGraph()).has_value());

    PropertyGraph other;
    other.addNode("Alice", "Person");
    other.addNode("Bob", "Person");
    REQUIRE(other.addEdge("Alice", "Bob", "KNOWS", PropertyMap{{"weight", PropertyValue(0.5)}}));
    REQUIRE(other.addEdge("Bob", "Alice", "KNOWS"));

    auto report = engine.synchronize(other);
    REQUIRE(report.has_value());
    REQUIRE(report.value().edges.size() == 2);
    // Alice->Bob already exists; Bob->Alice is a new direction
    CHECK(report.value().edges[0].key == "Alice->Bob");
    CHECK(report.value().edges[0].status == OutcomeStatus::Matched);
    CHECK(report.value().edges[1].key == "Bob->Alice");
    CHECK(report.value().edges[1].status == OutcomeStatus::Created);
    CHECK(fix.relationshipCount() == 3);
}

TEST_CASE("SyncEngine: entities without properties still sync", "[unit][sync]") {
    SyncFixture fix;
    SyncEngine engine(fix.store);

    PropertyGraph g;
    g.addNode("solo", "Thing");
    auto report = engine.synchronize(g);
    REQUIRE(report.has_value());
    CHECK(report.value().nodes[0].status == OutcomeStatus::Created);
    CHECK(fix.readAll().at(0).properties.empty());
}

TEST_CASE("SyncEngine: names and labels are sanitized", "[unit][sync]") {
    SyncFixture fix;
    SyncEngine engine(fix.store);

    PropertyGraph g;
    g.addNode("Al(ice)", "Per;son", PropertyMap{{"no`te", PropertyValue("a{b}c")}});
    auto report = engine.synchronize(g);
    REQUIRE(report.has_value());
    CHECK(report.value().ok());
    CHECK(report.value().nodes[0].key == "Al(ice)");

    auto nodes = fix.readAll();
    REQUIRE(nodes.size() == 1);
    CHECK(nodes[0].name == "Alice");
    CHECK(nodes[0].label == "Person");
    CHECK(nodes[0].properties.at("note") == PropertyValue("abc"));
}

TEST_CASE("SyncEngine: a failing entity does not stop the walk", "[unit][sync]") {
    SyncFixture fix;
    SyncEngine engine(fix.store);

    SECTION("store rejects an empty endpoint label") {
        PropertyGraph g;
        g.addNode("A", "Person");
        g.addNode("B", "");
        g.addNode("C", "Person");
        REQUIRE(g.addEdge("A", "B", "KNOWS"));
        REQUIRE(g.addEdge("A", "C", "KNOWS"));

        auto report = engine.synchronize(g);
        REQUIRE(report.has_value());
        CHECK_FALSE(report.value().ok());
        CHECK(report.value().count(EntityKind::Node, OutcomeStatus::Created) == 2);
        CHECK(report.value().count(EntityKind::Node, OutcomeStatus::Failed) == 1);

        const auto& edges = report.value().edges;
        REQUIRE(edges.size() == 2);
        CHECK(edges[0].status == OutcomeStatus::Failed);
        REQUIRE(edges[0].error.has_value());
        CHECK(edges[0].error->code == ErrorCode::InvalidData);
        CHECK(edges[1].status == OutcomeStatus::Created);

        auto failures = report.value().failures();
        CHECK(failures.size() == 2);
    }

    SECTION("injected executor failures") {
        test::FaultInjectingExecutor faulty(fix.store);
        faulty.failStatement = [](const std::string& text) {
            return text.find("\"Bob\"") != std::string::npos;
        };
        SyncEngine faultyEngine(faulty);

        auto report = faultyEngine.synchronize(sampleGraph());
        REQUIRE(report.has_value());
        CHECK(faulty.statementsSeen == 5);
        CHECK(report.value().count(EntityKind::Node, OutcomeStatus::Failed) == 1);
        CHECK(report.value().count(EntityKind::Node, OutcomeStatus::Created) == 2);
        CHECK(report.value().count(EntityKind::Edge, OutcomeStatus::Failed) == 1);
        CHECK(report.value().count(EntityKind::Edge, OutcomeStatus::Created) == 1);
        CHECK(faulty.sessionsClosed == 1);
    }
}

TEST_CASE("SyncEngine: session failures surface to the caller", "[unit][sync]") {
    SyncFixture fix;
    test::FaultInjectingExecutor faulty(fix.store);
    SyncEngine engine(faulty);

    SECTION("open failure runs nothing") {
        faulty.failOpenSession = true;
        auto report = engine.synchronize(sampleGraph());
        REQUIRE_FALSE(report);
        CHECK(report.error().code == ErrorCode::ResourceFailure);
        CHECK(report.error().message.find("connection refused") != std::string::npos);
        CHECK(faulty.statementsSeen == 0);
        CHECK(fix.readAll().empty());
    }

    SECTION("close failure keeps committed work") {
        faulty.failCloseSession = true;
        auto report = engine.synchronize(sampleGraph());
        REQUIRE_FALSE(report);
        CHECK(report.error().code == ErrorCode::ResourceFailure);
        CHECK(fix.readAll().size() == 3);
    }

    SECTION("closed executor") {
        fix.store.close();
        auto report = engine.synchronize(sampleGraph());
        REQUIRE_FALSE(report);
        CHECK(report.error().code == ErrorCode::ResourceFailure);

        REQUIRE(fix.store.reopen());
        CHECK(engine.synchronize(sampleGraph()).has_value());
    }
}

TEST_CASE("SyncEngine: a failing body and a failing close", "[unit][sync]") {
    SyncFixture fix;
    test::FaultInjectingExecutor faulty(fix.store);
    faulty.failCloseSession = true;
    faulty.failStatement = [](const std::string&) { return true; };

    auto nodes = SyncEngine(faulty).synchronizeRead();
    REQUIRE_FALSE(nodes);
    CHECK(nodes.error().code == ErrorCode::ResourceFailure);
    CHECK(faulty.sessionsClosed == 1);
}

TEST_CASE("SyncEngine: every node is upserted before any edge", "[unit][sync]") {
    SyncFixture fix;
    test::FaultInjectingExecutor recording(fix.store);

    auto report = SyncEngine(recording).synchronize(sampleGraph());
    REQUIRE(report.has_value());
    REQUIRE(recording.statements.size() == 5);

    auto isNode = [](const std::string& s) { return s.rfind("MERGE (n:", 0) == 0; };
    auto isEdge = [](const std::string& s) { return s.rfind("MERGE (a:", 0) == 0; };
    auto firstEdge = std::find_if(recording.statements.begin(), recording.statements.end(), isEdge);
    REQUIRE(firstEdge != recording.statements.end());
    CHECK(std::count_if(recording.statements.begin(), firstEdge, isNode) == 3);
    CHECK(std::none_of(firstEdge, recording.statements.end(), isNode));
}

TEST_CASE("SyncEngine: undecodable text fails only its own entity", "[unit][sync]") {
    SyncFixture fix;
    SyncEngine engine(fix.store);

    SECTION("name that is not valid UTF-8") {
        PropertyGraph g;
        g.addNode("Alice", "Person");
        g.addNode("Caf\xE9", "Place");
        g.addNode("Zed", "Person");

        auto report = engine.synchronize(g);
        REQUIRE(report.has_value());
        const auto& nodes = report.value().nodes;
        REQUIRE(nodes.size() == 3);
        CHECK(nodes[0].status == OutcomeStatus::Created);
        CHECK(nodes[1].status == OutcomeStatus::Failed);
        REQUIRE(nodes[1].error.has_value());
        CHECK(nodes[1].error->code == ErrorCode::InvalidData);
        CHECK(nodes[2].key == "Zed");
        CHECK(nodes[2].status == OutcomeStatus::Created);
        CHECK(fix.readAll().size() == 2);
    }

    SECTION("escaped lone surrogate in a property value") {
        PropertyGraph g;
        g.addNode("Alice", "Person", PropertyMap{{"note", PropertyValue("x\\uD800")}});
        g.addNode("Bob", "Person");

        auto report = engine.synchronize(g);
        REQUIRE(report.has_value());
        CHECK(report.value().nodes[0].status == OutcomeStatus::Failed);
        CHECK(report.value().nodes[0].error->code == ErrorCode::InvalidData);
        CHECK(report.value().nodes[1].status == OutcomeStatus::Created);
    }

    SECTION("verbose logging of undecodable text does not throw") {
        PropertyGraph g;
        g.addNode("Caf\xE9", "Place");
        g.addNode("Zed", "Person");
        auto report = engine.synchronize(g, true);
        REQUIRE(report.has_value());
        CHECK(report.value().count(EntityKind::Node, OutcomeStatus::Created) == 1);
    }
}

TEST_CASE("SyncEngine: verbose output goes to the configured logger", "[unit][sync]") {
    SyncFixture fix;
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto logger = std::make_shared<spdlog::logger>("sync-test", sink);
    logger->set_level(spdlog::level::info);
    logger->set_pattern("%v");

    SyncEngine engine(fix.store, SyncOptions{logger});
    PropertyGraph g;
    g.addNode("Alice", "Person");

    SECTION("quiet by default") {
        REQUIRE(engine.synchronize(g).has_value());
        logger->flush();
        CHECK(captured.str().find("MERGE") == std::string::npos);
    }

    SECTION("verbose logs statement and raw result") {
        auto report = engine.synchronize(g, true);
        REQUIRE(report.has_value());
        CHECK(report.value().nodes[0].status == OutcomeStatus::Created);
        logger->flush();
        auto text = captured.str();
        CHECK(text.find("MERGE (n:Person {name: \"Alice\"})") != std::string::npos);
        CHECK(text.find("\"nodesCreated\":1") != std::string::npos);
    }
}

TEST_CASE("SyncEngine: reading an empty store", "[unit][sync]") {
    SyncFixture fix;
    CHECK(fix.readAll().empty());

    REQUIRE(SyncEngine(fix.store).synchronize(sampleGraph()).has_value());
    auto nodes = fix.readAll();
    REQUIRE(nodes.size() == 3);
    const auto* la = findByName(nodes, "LA");
    REQUIRE(la != nullptr);
    CHECK(la->label == "City");
    CHECK(la->properties.at("population") == PropertyValue(3900000));
    CHECK(la->created.has_value());
}
