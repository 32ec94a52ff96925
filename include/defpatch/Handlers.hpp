/**
 * @file Handlers.hpp
 * @brief Operation handler interface and dispatch table
 *
 * Each operation kind is served by one OperationHandler registered under
 * its discriminator. The Engine looks handlers up by kind and drives the
 * validate -> resolve -> apply sequence; new kinds are added by
 * registering a handler, without touching the dispatch loop.
 *
 * Handlers report per-operation failures by throwing EmptyTargetError,
 * CollisionError or PayloadError. The Engine turns those into Failed
 * outcomes.
 */

#ifndef DEFPATCH_HANDLERS_HPP
#define DEFPATCH_HANDLERS_HPP

#include "defpatch/Document.hpp"
#include "defpatch/Markers.hpp"
#include "defpatch/Operation.hpp"
#include "defpatch/PathQuery.hpp"
#include "defpatch/Report.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace defpatch {

class Engine;

/// Answers "is capability/package X present" for FindMod operations
using CapabilityQuery = std::function<bool(const std::string&)>;

/**
 * @brief State visible to a handler while one patch unit runs
 */
class ExecutionContext {
public:
    ExecutionContext(Document& doc, const PatchUnit& unit, const Engine& engine);

    Document& document() noexcept { return doc_; }
    const PatchUnit& unit() const noexcept { return unit_; }
    const InheritanceMarkers& markers() const;

    /**
     * @brief Run a nested operation through the Engine
     *
     * The nested report is also recorded under the operation currently
     * being applied.
     */
    OperationReport run(OpId id);

    /// Query the host for a capability
    bool has_capability(const std::string& id) const;

    /// Resolve a path against the current tree
    std::vector<Target> select(const PathExpression& expr) const;

private:
    friend class Engine;

    Document& doc_;
    const PatchUnit& unit_;
    const Engine& engine_;
    std::vector<OperationReport>* nested_ = nullptr;
};

class OperationHandler {
public:
    virtual ~OperationHandler() = default;

    /**
     * @brief Check that the declaration carries what this kind needs
     * @throws PayloadError on a missing or malformed field
     *
     * The default requires a path.
     */
    virtual void validate(const Operation& op) const;

    /**
     * @brief Resolve the operation's targets against the current tree
     *
     * The default selects `op.path`; kinds without a path return nothing.
     */
    virtual std::vector<Target> resolve(const Operation& op, ExecutionContext& ctx) const;

    /**
     * @brief Apply to the resolved targets
     * @return Applied or Skipped
     * @throws EmptyTargetError, CollisionError, PayloadError
     */
    virtual Outcome apply(const Operation& op, const std::vector<Target>& targets,
                          ExecutionContext& ctx) const = 0;

    /**
     * @brief Short label for the report, e.g. "Add" or "Add (Prepend)"
     */
    virtual std::string describe(const Operation& op) const;
};

/**
 * @brief Throw EmptyTargetError if nothing was resolved
 */
void require_targets(const Operation& op, const std::vector<Target>& targets);

/**
 * @brief Dispatch table from discriminator to handler
 */
class OperationRegistry {
public:
    /// Registry holding every built-in kind
    static OperationRegistry with_builtins();

    /**
     * @brief Register (or replace) the handler for a kind
     *
     * The kind is stored in canonical form ("Add" -> "PatchOperationAdd").
     */
    void register_handler(const std::string& kind, std::shared_ptr<const OperationHandler> handler);

    /// Handler for a kind (canonicalized), or nullptr
    const OperationHandler* find(const std::string& kind) const;

    bool contains(const std::string& kind) const { return find(kind) != nullptr; }

    /// Registered kinds, sorted
    std::vector<std::string> kinds() const;

private:
    std::map<std::string, std::shared_ptr<const OperationHandler>> handlers_;
};

/**
 * @brief Register the built-in catalog
 *
 * Add, Insert, Remove, Replace, AttributeAdd, AttributeSet,
 * AttributeRemove, SetName, AddModExtension, Test, Sequence,
 * Conditional, FindMod.
 */
void register_builtin_operations(OperationRegistry& registry);

} // namespace defpatch

#endif // DEFPATCH_HANDLERS_HPP
