/**
 * @file Pipeline.cpp
 * @brief Run orchestration
 */

#include "defpatch/Pipeline.hpp"
#include "defpatch/Errors.hpp"
#include "defpatch/PatchLoader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

namespace defpatch {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // anonymous namespace

RunOptions RunOptions::from_settings(const Settings& settings) {
    RunOptions opts;
    opts.base_path = settings.get<std::string>("base", "");
    opts.patch_paths = settings.get_list("patches");
    opts.capabilities = settings.get_list("capabilities");
    opts.output_path = settings.get<std::string>("output", "");
    opts.report_path = settings.get<std::string>("report", "");
    opts.resolve_inheritance = settings.get<bool>("inheritance.enabled", true);
    return opts;
}

Pipeline::Pipeline(RunOptions options, OperationRegistry registry)
    : options_(std::move(options))
    , engine_(std::move(registry))
{
    std::set<std::string> present;
    for (const auto& id : options_.capabilities) {
        present.insert(to_lower(id));
    }
    engine_.set_capability_query([present](const std::string& id) {
        return present.count(to_lower(id)) > 0;
    });
    engine_.set_markers(options_.markers);
}

Document Pipeline::load_base() const {
    if (options_.base_path.empty()) {
        throw ConfigError("No base document configured (set 'base')");
    }
    spdlog::debug("Loading base document '{}'", options_.base_path);
    return Document::load_file(options_.base_path);
}

std::vector<PatchUnit> Pipeline::load_units() const {
    std::vector<PatchUnit> units;
    units.reserve(options_.patch_paths.size());
    for (const auto& path : options_.patch_paths) {
        units.push_back(load_patch_file(path));
    }
    return units;
}

RunResult Pipeline::run(Document base, const std::vector<PatchUnit>& units) const {
    base.validate(options_.base_path.empty() ? "<memory>" : options_.base_path);

    RunResult result;
    result.patched = std::move(base);
    result.report = engine_.apply_all(result.patched, units);

    // Inheritance sees only what the patches left behind
    if (options_.resolve_inheritance) {
        InheritanceResolver resolver(options_.markers);
        result.resolved = resolver.resolve(result.patched, &result.inheritance);
    }
    return result;
}

RunResult Pipeline::run() const {
    Document base = load_base();
    std::vector<PatchUnit> units = load_units();
    spdlog::info("Applying {} patch unit(s) to '{}'", units.size(), options_.base_path);

    RunResult result = run(std::move(base), units);
    write_outputs(result);
    return result;
}

void Pipeline::write_outputs(const RunResult& result) const {
    if (!options_.output_path.empty()) {
        result.final_document().save_file(options_.output_path);
        spdlog::info("Wrote document to '{}'", options_.output_path);
    }

    if (!options_.report_path.empty()) {
        std::ofstream ofs(options_.report_path);
        if (!ofs) {
            throw PatchError("Failed to open for write: " + options_.report_path);
        }
        nlohmann::json j = result.report.to_json();
        if (options_.resolve_inheritance) {
            j["inheritance"] = {
                {"resolved", result.inheritance.resolved},
                {"removed_abstract", result.inheritance.removed_abstract},
                {"diagnostics", result.inheritance.diagnostics}
            };
        }
        ofs << j.dump(2) << "\n";
        spdlog::info("Wrote report to '{}'", options_.report_path);
    }
}

} // namespace defpatch
