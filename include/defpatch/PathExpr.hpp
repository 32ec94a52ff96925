/**
 * @file PathExpr.hpp
 * @brief Parsed path expressions (XPath subset)
 *
 * Grammar:
 * ```
 * path      := ('/' | '//')? step (('/' | '//') step)* tail?
 * tail      := '/text()' | '/@' NAME
 * step      := (NAME | '*') ('[' predicate ']')?
 * predicate := clause ('or' clause)*
 * clause    := NAME '=' LITERAL        child text equality
 *            | '@' NAME '=' LITERAL    attribute equality
 *            | '@' NAME                attribute presence
 *            | 'inherits(' LITERAL ')' inheritor query
 * ```
 *
 * Anything outside this subset (conjunction, nested paths, positional
 * predicates, other functions) is rejected with PayloadError.
 */

#ifndef DEFPATCH_PATHEXPR_HPP
#define DEFPATCH_PATHEXPR_HPP

#include <optional>
#include <string>
#include <vector>

namespace defpatch {

enum class PredicateKind {
    ChildText,        ///< [tag="value"]
    AttributeEquals,  ///< [@attr="value"]
    AttributePresent, ///< [@attr]
    InheritsFrom      ///< [inherits("Template")]
};

struct PredicateClause {
    PredicateKind kind = PredicateKind::ChildText;
    std::string name;   ///< child tag or attribute name; empty for InheritsFrom
    std::string value;  ///< comparison literal or template name
};

/// Disjunction of clauses; matches if any clause matches
struct Predicate {
    std::vector<PredicateClause> any_of;
};

enum class Axis {
    Child,     ///< direct children of the context
    Descendant ///< all descendants of the context
};

struct Step {
    Axis axis = Axis::Child;
    std::string tag; ///< "*" matches any tag
    std::optional<Predicate> predicate;

    bool is_wildcard() const noexcept { return tag == "*"; }
};

/// What the final step selects
enum class Selector {
    Node,
    Text,
    Attribute
};

class PathExpression {
public:
    /**
     * @brief Parse a path expression
     * @throws PayloadError if the text is empty or outside the subset
     *
     * Examples:
     * ```cpp
     * PathExpression::parse("Defs/ThingDef[defName=\"Gun\"]/statBases");
     * PathExpression::parse("//ThingDef[@Name=\"BaseGun\" or @Name=\"BaseBow\"]");
     * PathExpression::parse("Defs/ThingDef/label/text()");
     * PathExpression::parse("Defs/ThingDef/@ParentName");
     * ```
     */
    static PathExpression parse(const std::string& text);

    const std::string& source() const noexcept { return source_; }
    const std::vector<Step>& steps() const noexcept { return steps_; }
    Selector selector() const noexcept { return selector_; }

    /// Attribute name when selector() == Selector::Attribute
    const std::string& attribute_name() const noexcept { return attribute_; }

private:
    std::string source_;
    std::vector<Step> steps_;
    Selector selector_ = Selector::Node;
    std::string attribute_;
};

} // namespace defpatch

#endif // DEFPATCH_PATHEXPR_HPP
