#include <catch2/catch_test_macros.hpp>

#include <neograph/storage/sqlite_graph_executor.h>
#include <neograph/sync/constraint_manager.h>
#include <neograph/sync/sync_engine.h>

#include "../../common/test_helpers_catch2.h"

using namespace neograph;
using namespace neograph::sync;

TEST_CASE("ConstraintManager: statement text", "[unit][sync][constraint]") {
    SECTION("node uniqueness") {
        auto text = ConstraintManager::buildCreateStatement(
            "Person", "name", ConstraintTarget::Node, ConstraintKind::Unique);
        REQUIRE(text.has_value());
        CHECK(text.value() == "CREATE CONSTRAINT Person_node_name_unique IF NOT EXISTS\n"
                              "FOR (x:Person)\n"
                              "REQUIRE x.name IS UNIQUE");
    }

    SECTION("relationship existence") {
        auto text = ConstraintManager::buildCreateStatement(
            "KNOWS", "since", ConstraintTarget::Relationship, ConstraintKind::Exists);
        REQUIRE(text.has_value());
        CHECK(text.value() == "CREATE CONSTRAINT KNOWS_relationship_since_exists IF NOT EXISTS\n"
                              "FOR ()-[x:KNOWS]-()\n"
                              "REQUIRE x.since IS NOT NULL");
    }

    SECTION("out of range enum") {
        auto text = ConstraintManager::buildCreateStatement(
            "Person", "name", static_cast<ConstraintTarget>(7), ConstraintKind::Unique);
        REQUIRE_FALSE(text);
        CHECK(text.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("ConstraintManager: name format", "[unit][sync][constraint]") {
    CHECK(constraintName("Person", "name", ConstraintTarget::Node, ConstraintKind::Unique) ==
          "Person_node_name_unique");
    CHECK(constraintName("KNOWS", "since", ConstraintTarget::Relationship,
                         ConstraintKind::Exists) == "KNOWS_relationship_since_exists");
}

TEST_CASE("ConstraintManager: parsing target and kind", "[unit][sync][constraint]") {
    CHECK(parseConstraintTarget("node").value() == ConstraintTarget::Node);
    CHECK(parseConstraintTarget("relationship").value() == ConstraintTarget::Relationship);
    CHECK(parseConstraintKind("unique").value() == ConstraintKind::Unique);
    CHECK(parseConstraintKind("exists").value() == ConstraintKind::Exists);

    auto badTarget = parseConstraintTarget("edge");
    REQUIRE_FALSE(badTarget);
    CHECK(badTarget.error().code == ErrorCode::InvalidArgument);
    CHECK_FALSE(parseConstraintKind("Unique"));
}

TEST_CASE("ConstraintManager: create against a store", "[unit][sync][constraint]") {
    storage::SqliteGraphExecutor store;
    REQUIRE(store.open(test::memoryStoreConfig()));
    test::FaultInjectingExecutor counting(store);
    ConstraintManager manager(counting);

    SECTION("created then already existed") {
        auto first = manager.createConstraint("Person", "name", ConstraintTarget::Node,
                                              ConstraintKind::Unique);
        REQUIRE(first.has_value());
        CHECK(first.value().name == "Person_node_name_unique");
        CHECK(first.value().created);

        auto second = manager.createConstraint("Person", "name", "node", "unique");
        REQUIRE(second.has_value());
        CHECK_FALSE(second.value().created);
        CHECK(counting.sessionsClosed == 2);
    }

    SECTION("invalid text issues nothing") {
        auto bad = manager.createConstraint("Person", "name", "edge", "unique");
        REQUIRE_FALSE(bad);
        CHECK(bad.error().code == ErrorCode::InvalidArgument);

        auto badKind = manager.createConstraint("Person", "name", "node", "mandatory");
        REQUIRE_FALSE(badKind);
        CHECK(badKind.error().code == ErrorCode::InvalidArgument);
        CHECK(counting.statementsSeen == 0);
        CHECK(counting.sessionsOpened == 0);
    }

    SECTION("label and property are sanitized") {
        auto status = manager.createConstraint("Per;son", "na(me)", ConstraintTarget::Node,
                                               ConstraintKind::Exists);
        REQUIRE(status.has_value());
        CHECK(status.value().name == "Person_node_name_exists");
    }

    SECTION("existing data violating the constraint") {
        graph::PropertyGraph g;
        g.addNode("a", "Tag", graph::PropertyMap{{"code", graph::PropertyValue(1)}});
        g.addNode("b", "Tag", graph::PropertyMap{{"code", graph::PropertyValue(1)}});
        REQUIRE(SyncEngine(store).synchronize(g).has_value());

        auto status = manager.createConstraint("Tag", "code", ConstraintTarget::Node,
                                               ConstraintKind::Unique);
        REQUIRE_FALSE(status);
        CHECK(status.error().code == ErrorCode::ConstraintViolation);
    }

    SECTION("store failure is returned") {
        counting.failStatement = [](const std::string&) { return true; };
        auto status = manager.createConstraint("Person", "name", ConstraintTarget::Node,
                                               ConstraintKind::Unique);
        REQUIRE_FALSE(status);
        CHECK(status.error().code == ErrorCode::DatabaseError);
        CHECK(counting.sessionsClosed == 1);
    }
}

TEST_CASE("ConstraintManager: list constraints", "[unit][sync][constraint]") {
    storage::SqliteGraphExecutor store;
    REQUIRE(store.open(test::memoryStoreConfig()));
    ConstraintManager manager(store);

    auto empty = manager.listConstraints();
    REQUIRE(empty.has_value());
    CHECK(empty.value().empty());

    REQUIRE(manager.createConstraint("Person", "name", ConstraintTarget::Node,
                                     ConstraintKind::Unique));
    REQUIRE(manager.createConstraint("KNOWS", "since", ConstraintTarget::Relationship,
                                     ConstraintKind::Exists));

    auto listed = manager.listConstraints();
    REQUIRE(listed.has_value());
    REQUIRE(listed.value().size() == 2);

    const auto& knows = listed.value()[0];
    CHECK(knows.name == "KNOWS_relationship_since_exists");
    CHECK(knows.type == "RELATIONSHIP_PROPERTY_EXISTENCE");
    CHECK(knows.entityType == "RELATIONSHIP");
    CHECK(knows.labelsOrTypes == std::vector<std::string>{"KNOWS"});
    CHECK(knows.properties == std::vector<std::string>{"since"});

    const auto& person = listed.value()[1];
    CHECK(person.name == "Person_node_name_unique");
    CHECK(person.type == "UNIQUENESS");
    CHECK(person.entityType == "NODE");
}
