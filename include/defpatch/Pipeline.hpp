/**
 * @file Pipeline.hpp
 * @brief End-to-end run: base document, patch units, inheritance, outputs
 *
 * Order of a run:
 * 1. load the base document (uniqueness checked)
 * 2. load every patch file, in the configured order, one unit per file
 * 3. apply all units with the Engine
 * 4. resolve inheritance, only after every unit has run
 * 5. write the final document and the JSON report
 *
 * A broken base document or an unreadable patch file aborts the run with
 * the corresponding exception. Operation failures never do.
 */

#ifndef DEFPATCH_PIPELINE_HPP
#define DEFPATCH_PIPELINE_HPP

#include "defpatch/Document.hpp"
#include "defpatch/Engine.hpp"
#include "defpatch/Inheritance.hpp"
#include "defpatch/Markers.hpp"
#include "defpatch/Operation.hpp"
#include "defpatch/Report.hpp"
#include "defpatch/Settings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace defpatch {

struct RunOptions {
    std::string base_path;
    std::vector<std::string> patch_paths;

    /// Capability ids answered as present to FindMod (case-insensitive)
    std::vector<std::string> capabilities;

    /// Final document path; empty leaves writing to the caller
    std::string output_path;

    /// JSON report path; empty writes none
    std::string report_path;

    bool resolve_inheritance = true;
    InheritanceMarkers markers;

    /**
     * @brief Build from the `base`, `patches`, `capabilities`, `output`,
     * `report` and `inheritance.enabled` settings keys
     * @throws TypeError if a list key holds something other than strings
     */
    static RunOptions from_settings(const Settings& settings);
};

struct RunResult {
    /// Document after all patch units, before inheritance
    Document patched;

    /// Present when inheritance resolution ran
    std::optional<Document> resolved;

    ExecutionReport report;
    InheritanceReport inheritance;

    /// The resolved document if present, otherwise the patched one
    const Document& final_document() const {
        return resolved.has_value() ? *resolved : patched;
    }
};

class Pipeline {
public:
    explicit Pipeline(RunOptions options,
                      OperationRegistry registry = OperationRegistry::with_builtins());

    const RunOptions& options() const noexcept { return options_; }
    const Engine& engine() const noexcept { return engine_; }

    /**
     * @brief Load inputs, apply, resolve and write outputs
     * @throws FileNotFoundError, MalformedDocumentError on unusable inputs
     */
    RunResult run() const;

    /**
     * @brief Apply already loaded units to a base document; writes nothing
     */
    RunResult run(Document base, const std::vector<PatchUnit>& units) const;

    /**
     * @throws FileNotFoundError, MalformedDocumentError
     */
    Document load_base() const;

    /**
     * @brief One unit per patch file, in configured order
     * @throws FileNotFoundError, MalformedDocumentError
     */
    std::vector<PatchUnit> load_units() const;

    /**
     * @brief Write the final document and report to the configured paths
     * @throws PatchError if a file cannot be written
     */
    void write_outputs(const RunResult& result) const;

private:
    RunOptions options_;
    Engine engine_;
};

} // namespace defpatch

#endif // DEFPATCH_PIPELINE_HPP
