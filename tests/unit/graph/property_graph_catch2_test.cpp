#include <catch2/catch_test_macros.hpp>

#include <neograph/graph/property_graph.h>

using namespace neograph;
using namespace neograph::graph;

namespace {
PropertyMap props(std::initializer_list<std::pair<const std::string, PropertyValue>> init) {
    return PropertyMap(init);
}
} // namespace

TEST_CASE("PropertyGraph: nodes keyed by name", "[unit][graph]") {
    PropertyGraph g;
    REQUIRE(g.empty());

    g.addNode("Alice", "Person", props({{"city", PropertyValue("LA")}}));
    g.addNode("Bob", "Person");

    CHECK(g.nodeCount() == 2);
    REQUIRE(g.findNode("Alice") != nullptr);
    CHECK(g.findNode("Alice")->label == "Person");
    CHECK(g.findNode("Alice")->properties.at("city") == PropertyValue("LA"));
    CHECK(g.findNode("Carol") == nullptr);

    SECTION("re-adding merges properties and replaces the label") {
        g.addNode("Alice", "Employee", props({{"age", PropertyValue(30)}}));
        const auto* alice = g.findNode("Alice");
        REQUIRE(alice != nullptr);
        CHECK(g.nodeCount() == 2);
        CHECK(alice->label == "Employee");
        CHECK(alice->properties.size() == 2);
        CHECK(alice->properties.at("age") == PropertyValue(30));
    }

    SECTION("reserved keys never land in the property map") {
        g.addNode("Carol", "Person",
                  props({{"name", PropertyValue("X")}, {"label", PropertyValue("Y")}}));
        CHECK(g.findNode("Carol")->properties.empty());

        auto res = g.setNodeProperty("Carol", "name", PropertyValue("Z"));
        REQUIRE_FALSE(res);
        CHECK(res.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("PropertyGraph: edges require known endpoints", "[unit][graph]") {
    PropertyGraph g;
    g.addNode("Alice", "Person");
    g.addNode("LA", "City");

    auto missing = g.addEdge("Alice", "Paris", "LIVES_IN");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::NotFound);
    CHECK(g.edgeCount() == 0);

    REQUIRE(g.addEdge("Alice", "LA", "LIVES_IN", props({{"since", PropertyValue(2020)}})));
    CHECK(g.edgeCount() == 1);

    SECTION("direction is significant") {
        CHECK(g.findEdge("Alice", "LA") != nullptr);
        CHECK(g.findEdge("LA", "Alice") == nullptr);
        CHECK(g.successors("Alice") == std::vector<std::string>{"LA"});
        CHECK(g.predecessors("LA") == std::vector<std::string>{"Alice"});
        CHECK(g.successors("LA").empty());
    }

    SECTION("one edge per ordered pair") {
        REQUIRE(g.addEdge("Alice", "LA", "WORKS_IN", props({{"role", PropertyValue("dev")}})));
        CHECK(g.edgeCount() == 1);
        const auto* e = g.findEdge("Alice", "LA");
        REQUIRE(e != nullptr);
        CHECK(e->label == "WORKS_IN");
        CHECK(e->properties.size() == 2);
    }

    SECTION("removing a node removes incident edges") {
        REQUIRE(g.removeNode("LA"));
        CHECK(g.edgeCount() == 0);
        CHECK(g.nodeCount() == 1);
        CHECK_FALSE(g.removeNode("LA"));
    }

    SECTION("edge properties can be updated") {
        REQUIRE(g.setEdgeProperty("Alice", "LA", "since", PropertyValue(2021)));
        CHECK(g.findEdge("Alice", "LA")->properties.at("since") == PropertyValue(2021));
        CHECK_FALSE(g.setEdgeProperty("LA", "Alice", "since", PropertyValue(1)));
    }

    SECTION("removeEdge and clear") {
        REQUIRE(g.removeEdge("Alice", "LA"));
        CHECK_FALSE(g.removeEdge("Alice", "LA"));
        g.clear();
        CHECK(g.empty());
    }
}
