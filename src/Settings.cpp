/**
 * @file Settings.cpp
 * @brief Layered settings: defaults, file, environment, overrides
 */

#include "defpatch/Settings.hpp"
#include "defpatch/Errors.hpp"
#include "defpatch/Parse.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#ifndef _WIN32
extern char** environ;
#endif

namespace fs = std::filesystem;

namespace defpatch {

Value default_settings() {
    return {
        {"base", ""},
        {"patches", Value::array()},
        {"capabilities", Value::array()},
        {"output", ""},
        {"report", ""},
        {"inheritance", {{"enabled", true}}},
        {"log", {{"level", "info"}, {"pattern", "[%H:%M:%S.%e] [%^%l%$] %v"}}}
    };
}

// ============================================================================
// Dot-path helpers
// ============================================================================

namespace {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    return "object";
}

Value toml_to_json(const toml::node& node) {
    if (auto v = node.as_string()) return Value(v->get());
    if (auto v = node.as_integer()) return Value(v->get());
    if (auto v = node.as_floating_point()) return Value(v->get());
    if (auto v = node.as_boolean()) return Value(v->get());
    if (auto arr = node.as_array()) {
        Value out = Value::array();
        for (const auto& elem : *arr) {
            out.push_back(toml_to_json(elem));
        }
        return out;
    }
    if (auto tbl = node.as_table()) {
        Value out = Value::object();
        for (const auto& [key, val] : *tbl) {
            out[std::string(key.str())] = toml_to_json(val);
        }
        return out;
    }
    // Dates and times are kept as their TOML text
    std::ostringstream oss;
    if (auto v = node.as_date()) oss << *v;
    else if (auto v = node.as_time()) oss << *v;
    else if (auto v = node.as_date_time()) oss << *v;
    return Value(oss.str());
}

std::string extension_of(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

} // anonymous namespace

const Value& get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        if (!current->is_object()) {
            throw TypeError(path, "object", type_name(*current));
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            throw KeyError(path, seg);
        }
        current = &*it;
    }
    return *current;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current->is_object()) {
            *current = Value::object();
        }
        current = &(*current)[segments[i]];
    }
    if (!current->is_object()) {
        *current = Value::object();
    }
    (*current)[segments.back()] = value;
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        if (!current->is_object()) {
            return false;
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            return false;
        }
        current = &*it;
    }
    return true;
}

Value deep_merge(const Value& base, const Value& override_val) {
    if (override_val.is_null()) {
        return base;
    }
    if (!base.is_object() || !override_val.is_object()) {
        return override_val;
    }

    Value result = base;
    for (auto it = override_val.begin(); it != override_val.end(); ++it) {
        if (result.contains(it.key())) {
            result[it.key()] = deep_merge(result[it.key()], it.value());
        } else {
            result[it.key()] = it.value();
        }
    }
    return result;
}

// ============================================================================
// Settings
// ============================================================================

Settings Settings::load(const LoadOptions& opts) {
    Value merged = opts.defaults.is_object() ? opts.defaults : Value::object();

    if (opts.file_path.has_value() && !opts.file_path->empty()) {
        merged = deep_merge(merged, read_file_any(*opts.file_path));
    }

    Settings settings(std::move(merged));

    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        settings.apply_env_prefix(*opts.prefix);
    }
    settings.apply_overrides(opts.overrides);
    settings.enforce_mandatory(opts.mandatory);
    return settings;
}

std::vector<std::string> Settings::get_list(const std::string& path) const {
    std::vector<std::string> out;
    if (!contains(path)) {
        return out;
    }
    const Value& v = at(path);
    if (v.is_string()) {
        if (!v.get<std::string>().empty()) out.push_back(v.get<std::string>());
        return out;
    }
    if (!v.is_array()) {
        throw TypeError(path, "array of strings", type_name(v));
    }
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw TypeError(path, "array of strings", "array containing " + type_name(item));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

void Settings::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) {
        throw MissingMandatoryConfig(missing);
    }
}

void Settings::apply_env_prefix(const std::string& prefix) {
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

#ifndef _WIN32
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string entry(*env);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        std::string name = entry.substr(0, eq);
        if (name.rfind(normalized, 0) != 0) continue;

        // DEFPATCH_LOG_LEVEL -> log.level
        std::string key = name.substr(normalized.size());
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        std::replace(key.begin(), key.end(), '_', '.');
        if (key.empty()) continue;

        set_by_dot(data_, key, parse_value(entry.substr(eq + 1)));
    }
#endif
}

void Settings::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

Value Settings::read_file_any(const std::string& file) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        throw FileNotFoundError(file);
    }

    const std::string ext = extension_of(file);
    if (ext == ".json") {
        std::ifstream ifs(file);
        if (!ifs) throw FileNotFoundError(file);
        try {
            return Value::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigParseError(file, e.what());
        }
    }
    if (ext == ".toml") {
        try {
            toml::table tbl = toml::parse_file(file);
            return toml_to_json(tbl);
        } catch (const toml::parse_error& e) {
            std::ostringstream oss;
            oss << e.description() << " (line " << e.source().begin.line << ")";
            throw ConfigParseError(file, oss.str());
        }
    }
    throw ConfigError("Unsupported settings file type: '" + ext + "' (expected .json or .toml)");
}

} // namespace defpatch
