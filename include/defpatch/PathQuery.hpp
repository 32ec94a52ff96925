/**
 * @file PathQuery.hpp
 * @brief Evaluate path expressions against a document
 *
 * Evaluation walks step by step from a virtual document node whose only
 * child is the root element. Results are de-duplicated and returned in
 * document order. Zero matches is a valid result, not an error.
 *
 * Every call resolves against the current tree; nothing is cached between
 * calls, so results always reflect earlier mutations.
 */

#ifndef DEFPATCH_PATHQUERY_HPP
#define DEFPATCH_PATHQUERY_HPP

#include "defpatch/Document.hpp"
#include "defpatch/Markers.hpp"
#include "defpatch/PathExpr.hpp"
#include <map>
#include <string>
#include <vector>

namespace defpatch {

enum class TargetKind {
    Node,
    Text,
    Attribute
};

/**
 * @brief One resolved target
 *
 * For Text and Attribute targets, `node` is the element owning the text
 * or attribute.
 */
struct Target {
    Node* node = nullptr;
    TargetKind kind = TargetKind::Node;
    std::string attribute;
};

/**
 * @brief Resolve a path expression
 * @param doc Document to search
 * @param expr Parsed expression
 * @param markers Attribute names used by `inherits(...)`
 * @return Targets in document order
 */
std::vector<Target> select(const Document& doc, const PathExpression& expr,
                           const InheritanceMarkers& markers = {});

/**
 * @brief Resolve a path expression to its element nodes
 *
 * Text and attribute selectors yield their owning elements.
 */
std::vector<Node*> select_nodes(const Document& doc, const PathExpression& expr,
                                const InheritanceMarkers& markers = {});

/**
 * @brief Existence test used by Conditional and Test operations
 */
bool matches_any(const Document& doc, const PathExpression& expr,
                 const InheritanceMarkers& markers = {});

/**
 * @brief Named templates among the records of `root`, by template name
 *
 * Only direct children of the root element are records. The first
 * declaration of a name wins; later ones are appended to `duplicates`
 * when it is given.
 */
std::map<std::string, const Node*> template_index(const Node& root,
                                                  const InheritanceMarkers& markers = {},
                                                  std::vector<std::string>* duplicates = nullptr);

/**
 * @brief All records that would inherit from the named template
 *
 * Follows inheritance references transitively through the templates of
 * template_index(). Inheritance is not expanded, and nodes below the
 * records never match.
 */
std::vector<Node*> find_inheritors(const Document& doc, const std::string& template_name,
                                   const InheritanceMarkers& markers = {});

} // namespace defpatch

#endif // DEFPATCH_PATHQUERY_HPP
