#include <neograph/cypher/property_encoder.h>
#include <neograph/cypher/sanitizer.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <set>
#include <type_traits>

namespace neograph::cypher {

namespace {

// Set by the upsert statements on creation
constexpr std::string_view kCreatedKey = "created";

std::string encodeReal(double value) {
    auto text = fmt::format("{}", value);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

} // namespace

std::optional<std::string> encodeLiteral(const graph::PropertyValue& value) {
    return std::visit(
        [](const auto& v) -> std::optional<std::string> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return "\"" + sanitize(v) + "\"";
            } else if constexpr (std::is_same_v<T, bool>) {
                return std::string(v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    return std::nullopt;
                }
                return encodeReal(v);
            } else {
                return std::to_string(v);
            }
        },
        value.value);
}

std::string encodeProperties(const graph::PropertyMap& properties) {
    std::string fragment;
    std::set<std::string, std::less<>> seen;
    for (const auto& [rawKey, value] : properties) {
        auto key = sanitize(rawKey);
        if (graph::isReservedKey(key)) {
            continue;
        }
        if (key.empty()) {
            spdlog::warn("Skipping property '{}': key is empty after sanitization", rawKey);
            continue;
        }
        auto literal = encodeLiteral(value);
        if (!literal) {
            spdlog::warn("Skipping property '{}': value has no literal form", key);
            continue;
        }
        if (!seen.insert(key).second) {
            spdlog::warn("Skipping property '{}': sanitizes to duplicate key '{}'", rawKey, key);
            continue;
        }
        if (key == kCreatedKey) {
            spdlog::warn("Property '{}' overwrites the creation timestamp on every sync", key);
        }
        if (!fragment.empty()) {
            fragment += ", ";
        }
        fragment += key;
        fragment += ": ";
        fragment += *literal;
    }
    return fragment;
}

} // namespace neograph::cypher
