#pragma once

#include <neograph/core/types.h>
#include <neograph/graph/property_graph.h>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace neograph::graph {

/**
 * Graph documents are node-link JSON:
 *
 *   {
 *     "nodes": [{"name": "Alice", "label": "Person", "properties": {"city": "LA"}}],
 *     "edges": [{"from": "Alice", "to": "Bob", "label": "KNOWS", "properties": {}}]
 *   }
 *
 * Property values must be strings, integers, floats or booleans.
 */

Result<PropertyValue> propertyFromJson(const nlohmann::json& value);
nlohmann::json propertyToJson(const PropertyValue& value);

Result<PropertyMap> propertiesFromJson(const nlohmann::json& object);
nlohmann::json propertiesToJson(const PropertyMap& properties);

Result<PropertyGraph> loadGraphFromJson(const nlohmann::json& document);
Result<PropertyGraph> loadGraphFromFile(const std::filesystem::path& path);

nlohmann::json graphToJson(const PropertyGraph& graph);

} // namespace neograph::graph
