/**
 * @file Settings.hpp
 * @brief Layered run settings with dot-notation access
 *
 * Precedence, lowest first:
 * 1. defaults (default_settings())
 * 2. settings file (.json via nlohmann::json, .toml via toml++)
 * 3. environment variables with a prefix: DEFPATCH_LOG_LEVEL -> log.level
 * 4. explicit dot-key overrides
 * Mandatory keys are checked last.
 *
 * Keys:
 * - base: base document path
 * - patches: patch file paths, in load order
 * - capabilities: capability ids visible to FindMod
 * - output: patched document path ("" = stdout)
 * - report: JSON report path ("" = none)
 * - inheritance.enabled: run the inheritance resolver
 * - log.level, log.pattern
 */

#ifndef DEFPATCH_SETTINGS_HPP
#define DEFPATCH_SETTINGS_HPP

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace defpatch {

/// JSON-like value type for settings
using Value = nlohmann::json;

/// Environment prefix used by the CLI
inline const std::string ENV_PREFIX = "DEFPATCH";

/**
 * @brief Built-in defaults for every known key
 */
Value default_settings();

/**
 * @brief Options for constructing Settings from multiple sources
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix;         ///< e.g. "DEFPATCH"; nullopt disables env
    std::map<std::string, Value> overrides;    ///< final precedence
    Value defaults = default_settings();
    std::vector<std::string> mandatory;
};

// ============================================================================
// Dot-path helpers
// ============================================================================

/**
 * @brief Get value by dot-path ("inheritance.enabled")
 * @throws KeyError if a segment is missing
 * @throws TypeError if traversal hits a non-object
 */
const Value& get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Set value by dot-path, creating intermediate objects
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

/**
 * @brief True if the dot-path fully resolves
 */
bool contains_dot(const Value& data, const std::string& path);

/**
 * @brief Recursive merge; objects merge key by key, anything else replaces
 */
Value deep_merge(const Value& base, const Value& override_val);

class Settings {
public:
    Settings() = default;
    explicit Settings(Value data) : data_(std::move(data)) {}

    /**
     * @brief Load with precedence defaults -> file -> env -> overrides
     * @throws FileNotFoundError, ConfigParseError, MissingMandatoryConfig
     */
    static Settings load(const LoadOptions& opts);

    const Value& data() const noexcept { return data_; }

    const Value& at(const std::string& path) const { return get_by_dot(data_, path); }
    bool contains(const std::string& path) const { return contains_dot(data_, path); }
    void set(const std::string& path, const Value& v) { set_by_dot(data_, path, v); }

    /**
     * @brief Typed read with fallback for missing or mistyped keys
     */
    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        try {
            return at(path).get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

    /// String list at path; a single string is treated as a one-element list
    std::vector<std::string> get_list(const std::string& path) const;

    /**
     * @throws MissingMandatoryConfig listing every absent key
     */
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

    std::string to_json_string(int indent = 2) const { return data_.dump(indent); }

    /**
     * @brief Read a .json or .toml settings file
     * @throws FileNotFoundError, ConfigParseError, ConfigError (unknown extension)
     */
    static Value read_file_any(const std::string& file);

private:
    Value data_ = Value::object();
};

} // namespace defpatch

#endif // DEFPATCH_SETTINGS_HPP
