/**
 * @file Engine.hpp
 * @brief Applies patch units to a document
 *
 * Execution model:
 * - Units run one at a time in the given order against the same tree
 * - Within a unit, top-level operations run in document order; a failure
 *   is recorded and the next operation still runs
 * - Only Sequence stops early, and only its own nested operations
 * - Each operation re-resolves its path against the current tree
 *
 * Per unit: Pending -> Running -> {Succeeded, Failed}.
 */

#ifndef DEFPATCH_ENGINE_HPP
#define DEFPATCH_ENGINE_HPP

#include "defpatch/Document.hpp"
#include "defpatch/Handlers.hpp"
#include "defpatch/Markers.hpp"
#include "defpatch/Operation.hpp"
#include "defpatch/Report.hpp"

#include <string>
#include <vector>

namespace defpatch {

/**
 * @brief Reclassify a raw outcome according to the success override
 *
 * - Normal: unchanged
 * - Always: a failure becomes success (Applied if mutated, else Skipped)
 * - Invert: success becomes Failed(Inverted); failure becomes success
 * - Never: always Failed(Forced)
 */
Outcome apply_success_mode(SuccessMode mode, Outcome raw);

class Engine {
public:
    explicit Engine(OperationRegistry registry = OperationRegistry::with_builtins());

    /// Host capability query for FindMod; without one, nothing is present
    void set_capability_query(CapabilityQuery query) { capabilities_ = std::move(query); }

    void set_markers(InheritanceMarkers markers) { markers_ = std::move(markers); }
    const InheritanceMarkers& markers() const noexcept { return markers_; }

    const OperationRegistry& registry() const noexcept { return registry_; }
    OperationRegistry& registry() noexcept { return registry_; }

    bool has_capability(const std::string& id) const;

    /**
     * @brief Apply one patch unit
     * @return Report with one entry per top-level operation
     * @throws MalformedDocumentError if the document is empty
     */
    UnitReport apply(Document& doc, const PatchUnit& unit) const;

    /**
     * @brief Apply all units in order against the same document
     */
    ExecutionReport apply_all(Document& doc, const std::vector<PatchUnit>& units) const;

    /**
     * @brief Static check of every operation in a unit without running it
     * @return One message per problem, prefixed with the operation position
     */
    std::vector<std::string> validate(const PatchUnit& unit) const;

    /**
     * @brief Dispatch one operation, with its success override applied
     *
     * Used for top-level operations and, through ExecutionContext::run,
     * for nested ones.
     */
    OperationReport execute(ExecutionContext& ctx, OpId id) const;

private:
    OperationRegistry registry_;
    CapabilityQuery capabilities_;
    InheritanceMarkers markers_;

    Outcome dispatch(ExecutionContext& ctx, const Operation& op, OperationReport& report) const;
    void validate_tree(const PatchUnit& unit, OpId id, const std::string& where,
                       std::vector<std::string>& problems) const;
};

} // namespace defpatch

#endif // DEFPATCH_ENGINE_HPP
