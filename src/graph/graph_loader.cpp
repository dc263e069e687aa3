#include <neograph/graph/graph_loader.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>

namespace neograph::graph {

namespace {

Result<std::string> requireString(const nlohmann::json& object, const char* key,
                                  const char* what) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return Error{ErrorCode::InvalidData,
                     std::string(what) + " entry requires a string '" + key + "' field"};
    }
    return it->get<std::string>();
}

} // namespace

Result<PropertyValue> propertyFromJson(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::string:
            return PropertyValue(value.get<std::string>());
        case nlohmann::json::value_t::boolean:
            return PropertyValue(value.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return PropertyValue(value.get<int64_t>());
        case nlohmann::json::value_t::number_unsigned: {
            auto u = value.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Error{ErrorCode::InvalidData, "Integer property out of range"};
            }
            return PropertyValue(static_cast<int64_t>(u));
        }
        case nlohmann::json::value_t::number_float:
            return PropertyValue(value.get<double>());
        default:
            return Error{ErrorCode::InvalidData,
                         std::string("Unsupported property value type: ") + value.type_name()};
    }
}

nlohmann::json propertyToJson(const PropertyValue& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value.value);
}

Result<PropertyMap> propertiesFromJson(const nlohmann::json& object) {
    PropertyMap out;
    if (object.is_null()) {
        return out;
    }
    if (!object.is_object()) {
        return Error{ErrorCode::InvalidData, "Properties must be a JSON object"};
    }
    for (const auto& [key, value] : object.items()) {
        auto converted = propertyFromJson(value);
        if (!converted) {
            return Error{ErrorCode::InvalidData,
                         "Property '" + key + "': " + converted.error().message};
        }
        out.emplace(key, std::move(converted).value());
    }
    return out;
}

nlohmann::json propertiesToJson(const PropertyMap& properties) {
    auto out = nlohmann::json::object();
    for (const auto& [key, value] : properties) {
        out[key] = propertyToJson(value);
    }
    return out;
}

Result<PropertyGraph> loadGraphFromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Error{ErrorCode::InvalidData, "Graph document must be a JSON object"};
    }

    PropertyGraph graph;

    if (auto nodes = document.find("nodes"); nodes != document.end()) {
        if (!nodes->is_array()) {
            return Error{ErrorCode::InvalidData, "'nodes' must be an array"};
        }
        for (const auto& node : *nodes) {
            if (!node.is_object()) {
                return Error{ErrorCode::InvalidData, "Node entry must be an object"};
            }
            auto name = requireString(node, "name", "Node");
            if (!name)
                return name.error();
            auto label = requireString(node, "label", "Node");
            if (!label)
                return label.error();
            auto props = propertiesFromJson(node.value("properties", nlohmann::json()));
            if (!props)
                return props.error();
            graph.addNode(name.value(), std::move(label).value(), std::move(props).value());
        }
    }

    if (auto edges = document.find("edges"); edges != document.end()) {
        if (!edges->is_array()) {
            return Error{ErrorCode::InvalidData, "'edges' must be an array"};
        }
        for (const auto& edge : *edges) {
            if (!edge.is_object()) {
                return Error{ErrorCode::InvalidData, "Edge entry must be an object"};
            }
            auto from = requireString(edge, "from", "Edge");
            if (!from)
                return from.error();
            auto to = requireString(edge, "to", "Edge");
            if (!to)
                return to.error();
            auto label = requireString(edge, "label", "Edge");
            if (!label)
                return label.error();
            auto props = propertiesFromJson(edge.value("properties", nlohmann::json()));
            if (!props)
                return props.error();
            auto added = graph.addEdge(from.value(), to.value(), std::move(label).value(),
                                       std::move(props).value());
            if (!added)
                return added.error();
        }
    }

    spdlog::debug("Loaded graph with {} nodes and {} edges", graph.nodeCount(),
                  graph.edgeCount());
    return graph;
}

Result<PropertyGraph> loadGraphFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open graph file: " + path.string()};
    }

    auto document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        return Error{ErrorCode::InvalidData, "Malformed JSON in graph file: " + path.string()};
    }
    return loadGraphFromJson(document);
}

nlohmann::json graphToJson(const PropertyGraph& graph) {
    auto nodes = nlohmann::json::array();
    for (const auto& [name, data] : graph.nodes()) {
        nodes.push_back({{"name", name},
                         {"label", data.label},
                         {"properties", propertiesToJson(data.properties)}});
    }

    auto edges = nlohmann::json::array();
    for (const auto& [key, data] : graph.edges()) {
        edges.push_back({{"from", key.first},
                         {"to", key.second},
                         {"label", data.label},
                         {"properties", propertiesToJson(data.properties)}});
    }

    return {{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
}

} // namespace neograph::graph
