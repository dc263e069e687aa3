#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace neograph::graph {

enum class PropertyType { String, Integer, Real, Boolean };

/**
 * @brief Supplementary attribute value carried by nodes and edges
 *
 * Strings are sanitized and quoted when embedded into a statement; the other
 * alternatives are embedded as literals.
 */
struct PropertyValue {
    std::variant<std::string, int64_t, double, bool> value;

    PropertyValue() = default;

    explicit PropertyValue(std::string str) : value(std::move(str)) {}
    explicit PropertyValue(const char* str) : value(std::string(str)) {}
    explicit PropertyValue(int64_t num) : value(num) {}
    explicit PropertyValue(int num) : value(static_cast<int64_t>(num)) {}
    explicit PropertyValue(double num) : value(num) {}
    explicit PropertyValue(bool b) : value(b) {}

    [[nodiscard]] PropertyType type() const {
        switch (value.index()) {
            case 0: return PropertyType::String;
            case 1: return PropertyType::Integer;
            case 2: return PropertyType::Real;
            default: return PropertyType::Boolean;
        }
    }

    [[nodiscard]] bool isString() const { return std::holds_alternative<std::string>(value); }

    // Type-safe getters; calling the wrong one throws std::bad_variant_access
    [[nodiscard]] const std::string& asString() const { return std::get<std::string>(value); }
    [[nodiscard]] int64_t asInteger() const { return std::get<int64_t>(value); }
    [[nodiscard]] double asReal() const { return std::get<double>(value); }
    [[nodiscard]] bool asBoolean() const { return std::get<bool>(value); }

    bool operator==(const PropertyValue& other) const { return value == other.value; }
    bool operator!=(const PropertyValue& other) const { return value != other.value; }
};

/// Property keys are kept ordered so repeated iteration is stable.
using PropertyMap = std::map<std::string, PropertyValue>;

/// Keys that carry structural identity and never appear in a PropertyMap.
inline constexpr std::string_view kNameKey = "name";
inline constexpr std::string_view kLabelKey = "label";

inline bool isReservedKey(std::string_view key) {
    return key == kNameKey || key == kLabelKey;
}

} // namespace neograph::graph
