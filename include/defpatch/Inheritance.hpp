/**
 * @file Inheritance.hpp
 * @brief Template inheritance expansion, run after all patches
 *
 * Records (children of the root element) carrying the template marker are
 * templates; records carrying the inheritance marker are merged onto a
 * resolved copy of their template:
 * - attributes of the inheritor overwrite the template's
 * - `li` children are appended after the template's
 * - other children merge recursively by tag
 * - text replaces the template's content
 * - a child marked Inherit="False" replaces the template's child outright
 *
 * Abstract templates are dropped from the result. The template marker and
 * the abstract flag are not inherited.
 */

#ifndef DEFPATCH_INHERITANCE_HPP
#define DEFPATCH_INHERITANCE_HPP

#include "defpatch/Document.hpp"
#include "defpatch/Markers.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace defpatch {

struct InheritanceReport {
    /// Records merged onto a template
    size_t resolved = 0;

    /// Abstract templates dropped
    size_t removed_abstract = 0;

    /// Unknown parents, cycles, duplicate template names
    std::vector<std::string> diagnostics;
};

class InheritanceResolver {
public:
    explicit InheritanceResolver(InheritanceMarkers markers = {});

    /**
     * @brief Expand inheritance into a new document
     * @param patched Document after every patch unit has been applied
     * @param report Optional diagnostics sink
     */
    Document resolve(const Document& patched, InheritanceReport* report = nullptr) const;

private:
    InheritanceMarkers markers_;
};

} // namespace defpatch

#endif // DEFPATCH_INHERITANCE_HPP
