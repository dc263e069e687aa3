#pragma once

#include <neograph/core/types.h>
#include <neograph/graph/property_value.h>

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace neograph::graph {

/**
 * @brief Attributes of a node: its database label plus supplementary properties
 */
struct NodeData {
    std::string label;
    PropertyMap properties;
};

/**
 * @brief Attributes of a directed edge: its relationship label plus properties
 */
struct EdgeData {
    std::string label;
    PropertyMap properties;
};

/// Ordered (from-name, to-name) pair identifying an edge.
using EdgeKey = std::pair<std::string, std::string>;

using NodeMap = std::map<std::string, NodeData, std::less<>>;
using EdgeMap = std::map<EdgeKey, EdgeData>;

/**
 * @brief In-memory directed property graph
 *
 * Nodes are keyed by name, edges by the ordered pair of endpoint names (at most one
 * edge per ordered pair, as in a simple digraph). Every edge references nodes that are
 * present in the node set. The reserved keys "name" and "label" never appear in a
 * property map; they are dropped on insert.
 *
 * The graph is a plain value: it owns no database state and can be copied, moved and
 * synchronized any number of times.
 */
class PropertyGraph {
public:
    PropertyGraph() = default;

    /**
     * @brief Add a node or update an existing one
     *
     * An existing node takes the new label and the union of its old and new
     * properties; new values win on key collision.
     */
    void addNode(const std::string& name, std::string label, PropertyMap properties = {});

    /**
     * @brief Add an edge or update the existing edge for the same ordered pair
     *
     * @return NotFound if either endpoint is not a node of this graph
     */
    Result<void> addEdge(const std::string& from, const std::string& to, std::string label,
                         PropertyMap properties = {});

    Result<void> setNodeProperty(std::string_view name, const std::string& key,
                                 PropertyValue value);
    Result<void> setEdgeProperty(const std::string& from, const std::string& to,
                                 const std::string& key, PropertyValue value);

    /**
     * @brief Remove a node together with all edges incident to it
     */
    Result<void> removeNode(std::string_view name);
    Result<void> removeEdge(const std::string& from, const std::string& to);

    [[nodiscard]] const NodeData* findNode(std::string_view name) const;
    [[nodiscard]] const EdgeData* findEdge(const std::string& from, const std::string& to) const;

    [[nodiscard]] bool hasNode(std::string_view name) const { return findNode(name) != nullptr; }

    /// Names of the nodes reachable over one outgoing edge.
    [[nodiscard]] std::vector<std::string> successors(std::string_view name) const;
    /// Names of the nodes with an edge into @p name.
    [[nodiscard]] std::vector<std::string> predecessors(std::string_view name) const;

    [[nodiscard]] const NodeMap& nodes() const { return nodes_; }
    [[nodiscard]] const EdgeMap& edges() const { return edges_; }

    [[nodiscard]] std::size_t nodeCount() const { return nodes_.size(); }
    [[nodiscard]] std::size_t edgeCount() const { return edges_.size(); }
    [[nodiscard]] bool empty() const { return nodes_.empty(); }

    void clear();

private:
    NodeMap nodes_;
    EdgeMap edges_;
};

} // namespace neograph::graph
