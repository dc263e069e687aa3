#include <neograph/graph/property_graph.h>

#include <spdlog/spdlog.h>

namespace neograph::graph {

namespace {

void mergeProperties(PropertyMap& target, PropertyMap source) {
    for (auto& [key, value] : source) {
        if (isReservedKey(key)) {
            spdlog::debug("Dropping reserved property key '{}'", key);
            continue;
        }
        target.insert_or_assign(key, std::move(value));
    }
}

} // namespace

void PropertyGraph::addNode(const std::string& name, std::string label, PropertyMap properties) {
    auto [it, inserted] = nodes_.try_emplace(name);
    it->second.label = std::move(label);
    mergeProperties(it->second.properties, std::move(properties));
    if (!inserted) {
        spdlog::trace("Updated node '{}'", name);
    }
}

Result<void> PropertyGraph::addEdge(const std::string& from, const std::string& to,
                                    std::string label, PropertyMap properties) {
    if (!hasNode(from)) {
        return Error{ErrorCode::NotFound, "Edge source node not in graph: " + from};
    }
    if (!hasNode(to)) {
        return Error{ErrorCode::NotFound, "Edge target node not in graph: " + to};
    }

    auto& edge = edges_[EdgeKey{from, to}];
    edge.label = std::move(label);
    mergeProperties(edge.properties, std::move(properties));
    return {};
}

Result<void> PropertyGraph::setNodeProperty(std::string_view name, const std::string& key,
                                            PropertyValue value) {
    if (isReservedKey(key)) {
        return Error{ErrorCode::InvalidArgument, "Reserved property key: " + key};
    }
    auto it = nodes_.find(name);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "Node not in graph: " + std::string(name)};
    }
    it->second.properties.insert_or_assign(key, std::move(value));
    return {};
}

Result<void> PropertyGraph::setEdgeProperty(const std::string& from, const std::string& to,
                                            const std::string& key, PropertyValue value) {
    if (isReservedKey(key)) {
        return Error{ErrorCode::InvalidArgument, "Reserved property key: " + key};
    }
    auto it = edges_.find(EdgeKey{from, to});
    if (it == edges_.end()) {
        return Error{ErrorCode::NotFound, "Edge not in graph: " + from + " -> " + to};
    }
    it->second.properties.insert_or_assign(key, std::move(value));
    return {};
}

Result<void> PropertyGraph::removeNode(std::string_view name) {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) {
        return Error{ErrorCode::NotFound, "Node not in graph: " + std::string(name)};
    }

    for (auto e = edges_.begin(); e != edges_.end();) {
        if (e->first.first == name || e->first.second == name) {
            e = edges_.erase(e);
        } else {
            ++e;
        }
    }
    nodes_.erase(it);
    return {};
}

Result<void> PropertyGraph::removeEdge(const std::string& from, const std::string& to) {
    if (edges_.erase(EdgeKey{from, to}) == 0) {
        return Error{ErrorCode::NotFound, "Edge not in graph: " + from + " -> " + to};
    }
    return {};
}

const NodeData* PropertyGraph::findNode(std::string_view name) const {
    auto it = nodes_.find(name);
    return it != nodes_.end() ? &it->second : nullptr;
}

const EdgeData* PropertyGraph::findEdge(const std::string& from, const std::string& to) const {
    auto it = edges_.find(EdgeKey{from, to});
    return it != edges_.end() ? &it->second : nullptr;
}

std::vector<std::string> PropertyGraph::successors(std::string_view name) const {
    std::vector<std::string> out;
    for (const auto& [key, _] : edges_) {
        if (key.first == name) {
            out.push_back(key.second);
        }
    }
    return out;
}

std::vector<std::string> PropertyGraph::predecessors(std::string_view name) const {
    std::vector<std::string> out;
    for (const auto& [key, _] : edges_) {
        if (key.second == name) {
            out.push_back(key.first);
        }
    }
    return out;
}

void PropertyGraph::clear() {
    edges_.clear();
    nodes_.clear();
}

} // namespace neograph::graph
