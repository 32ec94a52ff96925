/**
 * @file PatchLoader.hpp
 * @brief Read patch documents into PatchUnits
 *
 * Patch document layout:
 * ```xml
 * <Patch>
 *   <Operation Class="PatchOperationAdd">
 *     <xpath>Defs/ThingDef[defName="Gun"]/comps</xpath>
 *     <order>Prepend</order>
 *     <value><li>...</li></value>
 *     <success>Always</success>
 *   </Operation>
 *   <Operation Class="PatchOperationSequence">
 *     <operations>
 *       <li Class="PatchOperationRemove"><xpath>...</xpath></li>
 *     </operations>
 *   </Operation>
 *   <Operation Class="PatchOperationFindMod">
 *     <mods><li>Royalty</li></mods>
 *     <match Class="PatchOperationReplace">...</match>
 *   </Operation>
 * </Patch>
 * ```
 *
 * A malformed declaration does not stop loading: the operation is kept
 * with Operation::payload_error set and fails when executed, so the
 * report still has an entry for it.
 */

#ifndef DEFPATCH_PATCHLOADER_HPP
#define DEFPATCH_PATCHLOADER_HPP

#include "defpatch/Document.hpp"
#include "defpatch/Operation.hpp"

#include <string>

namespace defpatch {

/// Root element of a patch document
inline const std::string PATCH_ROOT_TAG = "Patch";

/// Element holding one top-level operation
inline const std::string OPERATION_TAG = "Operation";

/// Discriminator attribute
inline const std::string CLASS_ATTRIBUTE = "Class";

/**
 * @brief Build a PatchUnit from a parsed patch document
 * @param doc Parsed patch document
 * @param name Unit name used in reports
 * @throws MalformedDocumentError if the root element is not <Patch>
 */
PatchUnit load_patch(const Document& doc, const std::string& name);

/**
 * @brief Parse XML text and build a PatchUnit
 * @throws MalformedDocumentError on broken markup
 */
PatchUnit load_patch_string(const std::string& xml, const std::string& name = "<memory>");

/**
 * @brief Load a patch file; the unit is named after the path
 * @throws FileNotFoundError if the file cannot be opened
 * @throws MalformedDocumentError on broken markup
 */
PatchUnit load_patch_file(const std::string& path);

} // namespace defpatch

#endif // DEFPATCH_PATCHLOADER_HPP
