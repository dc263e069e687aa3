#pragma once

#include <neograph/graph/property_value.h>

#include <optional>
#include <string>

namespace neograph::cypher {

/**
 * @brief Render a single value as a statement literal
 *
 * Strings are sanitized and double-quoted. Integers and booleans use their literal
 * form; reals always carry a decimal point or exponent so they stay floats on the
 * server. Returns nullopt for NaN and infinities, which have no literal form.
 */
std::optional<std::string> encodeLiteral(const graph::PropertyValue& value);

/**
 * @brief Encode extra properties as the body of a map literal
 *
 * Produces `key: value` entries joined by ", " without the surrounding braces, for
 * use in a `SET x += {...}` clause. Keys are sanitized; reserved keys, keys that
 * sanitize to nothing or to an earlier key, and values without a literal form are
 * skipped. A `created` key is kept but logged, since it replaces the timestamp. An empty map
 * yields an empty fragment, in which case the caller must leave the merge clause out.
 */
std::string encodeProperties(const graph::PropertyMap& properties);

} // namespace neograph::cypher
