/**
 * @file Parse.hpp
 * @brief String-to-Value typing for environment variables and --set overrides
 *
 * Rules, first match wins:
 * - "true"/"false" (case-insensitive) -> boolean
 * - "null" (case-insensitive) -> null
 * - ^-?[0-9]+$ -> integer
 * - ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$ -> float
 * - {...} or [...] that parses as JSON -> object/array
 * - "..." that parses as a JSON string -> unquoted string
 * - anything else -> raw string
 */

#ifndef DEFPATCH_PARSE_HPP
#define DEFPATCH_PARSE_HPP

#include "defpatch/Settings.hpp"
#include <string>
#include <utility>

namespace defpatch {

/**
 * @brief Parse string value to the appropriate JSON type
 *
 * Examples:
 * ```cpp
 * parse_value("true")          // -> true
 * parse_value("42")            // -> 42
 * parse_value("[\"Royalty\"]") // -> ["Royalty"]
 * parse_value("debug")         // -> "debug"
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Split "key=value" into a dot-key and a typed value
 * @throws ConfigError if there is no '=' or the key is empty
 */
std::pair<std::string, Value> parse_assignment(const std::string& text);

} // namespace defpatch

#endif // DEFPATCH_PARSE_HPP
