/**
 * @file Parse.cpp
 * @brief Implementation of value typing
 */

#include "defpatch/Parse.hpp"
#include "defpatch/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <stdexcept>

namespace defpatch {

namespace {
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }
    if (lower == "null") {
        return nullptr;
    }

    if (std::regex_match(str, integer_pattern())) {
        try {
            return static_cast<int64_t>(std::stoll(str));
        } catch (const std::out_of_range&) {
            // Too large for int64; fall through to string
        }
    }

    if (std::regex_match(str, float_pattern())) {
        try {
            return std::stod(str);
        } catch (const std::out_of_range&) {
            // Overflows double; keep as string
        }
    }

    const bool compound = (str.front() == '{' && str.back() == '}') ||
                          (str.front() == '[' && str.back() == ']');
    const bool quoted = str.size() >= 2 && str.front() == '"' && str.back() == '"';
    if (compound || quoted) {
        Value parsed = Value::parse(str, nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded() && (compound || parsed.is_string())) {
            return parsed;
        }
    }

    return str;
}

std::pair<std::string, Value> parse_assignment(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw ConfigError("Expected key=value, got '" + text + "'");
    }
    return {text.substr(0, eq), parse_value(text.substr(eq + 1))};
}

} // namespace defpatch
