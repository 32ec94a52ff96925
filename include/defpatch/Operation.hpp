/**
 * @file Operation.hpp
 * @brief Parsed patch operations and patch units
 *
 * A PatchUnit owns all of its operations in a flat arena; composite kinds
 * (Sequence, Conditional, FindMod) refer to their nested operations by
 * OpId. Operations are immutable once loaded.
 */

#ifndef DEFPATCH_OPERATION_HPP
#define DEFPATCH_OPERATION_HPP

#include "defpatch/Node.hpp"
#include "defpatch/PathExpr.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace defpatch {

using OpId = std::size_t;

/// Ordering hint; Default means the kind's own default
enum class Order {
    Default,
    Append,
    Prepend
};

/**
 * @brief Outcome override applied after an operation runs
 *
 * Deprecated in favour of PatchOperationConditional; kept for existing
 * patches. Never is diagnostic only.
 */
enum class SuccessMode {
    Normal,
    Always,
    Invert,
    Never
};

/// Prefix of every built-in operation discriminator
inline const std::string KIND_PREFIX = "PatchOperation";

struct Operation {
    /// Discriminator, e.g. "PatchOperationAdd"
    std::string kind;

    /// Raw `xpath` text as authored
    std::string path_text;

    /// Parsed `xpath`, absent if not authored or unparsable
    std::optional<PathExpression> path;

    /// The `<value>` element: children are the node payload, text the scalar payload
    NodePtr value;

    std::string attribute;
    std::string name;
    Order order = Order::Default;
    SuccessMode success = SuccessMode::Normal;

    /// Capability ids for FindMod
    std::vector<std::string> mods;

    /// Nested operations for Sequence
    std::vector<OpId> operations;

    std::optional<OpId> match;
    std::optional<OpId> nomatch;

    /// Set by the loader when the declaration itself is malformed
    std::string payload_error;

    /// Payload element nodes, empty if no value
    const std::vector<NodePtr>& payload() const;

    /// Payload text, empty if no value
    std::string payload_text() const;
};

class PatchUnit {
public:
    explicit PatchUnit(std::string name = "<unnamed>");

    PatchUnit(PatchUnit&&) noexcept = default;
    PatchUnit& operator=(PatchUnit&&) noexcept = default;

    const std::string& name() const noexcept { return name_; }

    /// Store an operation in the arena
    OpId add(Operation op);

    /// Append an already stored operation to the top-level list
    void add_root(OpId id);

    /**
     * @brief Access an operation by id
     * @throws std::out_of_range for an unknown id
     */
    const Operation& at(OpId id) const { return arena_.at(id); }

    const std::vector<OpId>& roots() const noexcept { return roots_; }

    /// Number of operations in the arena, nested ones included
    size_t size() const noexcept { return arena_.size(); }

private:
    std::string name_;
    std::vector<Operation> arena_;
    std::vector<OpId> roots_;
};

std::string to_string(Order order);
std::string to_string(SuccessMode mode);

/// Parse "Append"/"Prepend"; nullopt if unrecognized
std::optional<Order> parse_order(const std::string& text);

/// Parse "Normal"/"Always"/"Invert"/"Never"; nullopt if unrecognized
std::optional<SuccessMode> parse_success_mode(const std::string& text);

/// "Add" -> "PatchOperationAdd"; already prefixed names are unchanged
std::string canonical_kind(const std::string& kind);

/// "PatchOperationAdd" -> "Add"
std::string short_kind(const std::string& kind);

} // namespace defpatch

#endif // DEFPATCH_OPERATION_HPP
