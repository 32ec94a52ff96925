/**
 * @file Markers.hpp
 * @brief Reserved attribute names for templates and inheritance
 *
 * The engine preserves these attributes like any other; the path evaluator
 * reads them for `inherits(...)` predicates and the inheritance resolver
 * reads them after patching.
 */

#ifndef DEFPATCH_MARKERS_HPP
#define DEFPATCH_MARKERS_HPP

#include <string>

namespace defpatch {

struct InheritanceMarkers {
    /// Names a node as a template: <ThingDef Name="BaseGun">
    std::string template_name = "Name";

    /// References a template: <ThingDef ParentName="BaseGun">
    std::string parent_name = "ParentName";

    /// Marks a template as abstract (dropped after resolution)
    std::string abstract_flag = "Abstract";

    /// Inherit="False" on a child element disables merging for it
    std::string inherit_flag = "Inherit";
};

} // namespace defpatch

#endif // DEFPATCH_MARKERS_HPP
