#pragma once

#include <array>
#include <string>
#include <string_view>

namespace neograph::cypher {

/// Characters that could terminate or escape a statement fragment.
inline constexpr std::string_view kForbiddenChars = "`;/(){}";

/**
 * @brief Remove every forbidden character from a value bound for a statement
 *
 * Removal only, no escaping. All other characters, including spaces and hyphens,
 * are kept. Total over all inputs and idempotent: sanitize(sanitize(s)) == sanitize(s).
 *
 * Every interpolated value (node names and labels, edge labels, property keys and
 * string property values) must pass through here first.
 */
std::string sanitize(std::string_view input);

/// True when @p input contains none of the forbidden characters.
bool isSanitized(std::string_view input);

/**
 * @brief Sanitize several values at once, preserving order
 *
 * Example:
 * @code
 * auto [label, name] = sanitizeAll(nodeLabel, nodeName);
 * @endcode
 */
template <typename... Strings> auto sanitizeAll(const Strings&... inputs) {
    return std::array<std::string, sizeof...(Strings)>{sanitize(std::string_view(inputs))...};
}

} // namespace neograph::cypher
