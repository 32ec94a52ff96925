/**
 * @file PathQuery.cpp
 * @brief Path evaluation over the document tree
 */

#include "defpatch/PathQuery.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace defpatch {

namespace {

void collect_preorder(Node* node, std::vector<Node*>& out) {
    out.push_back(node);
    for (const auto& c : node->children()) {
        collect_preorder(c.get(), out);
    }
}

/**
 * @brief Single-use evaluator holding the lazily built template index
 */
class Evaluator {
public:
    Evaluator(const Document& doc, const InheritanceMarkers& markers)
        : doc_(doc), markers_(markers) {}

    std::vector<Node*> evaluate(const PathExpression& expr) {
        if (doc_.empty()) {
            return {};
        }

        // nullptr stands for the virtual document node
        std::vector<Node*> contexts{nullptr};
        for (const auto& step : expr.steps()) {
            std::unordered_set<Node*> seen;
            std::vector<Node*> next;
            for (Node* ctx : contexts) {
                for (Node* candidate : candidates(ctx, step.axis)) {
                    if (!matches(*candidate, step)) continue;
                    if (seen.insert(candidate).second) {
                        next.push_back(candidate);
                    }
                }
            }
            contexts = std::move(next);
            if (contexts.empty()) break;
        }
        return in_document_order(contexts);
    }

    bool inherits_from(const Node& node, const std::string& template_name) {
        // Only records take part in inheritance
        if (node.parent() != doc_.root()) {
            return false;
        }
        std::unordered_set<std::string> visited;
        const std::string* parent = node.attribute(markers_.parent_name);
        while (parent != nullptr) {
            if (*parent == template_name) {
                return true;
            }
            if (!visited.insert(*parent).second) {
                return false; // cycle
            }
            const Node* tmpl = find_template(*parent);
            if (tmpl == nullptr) {
                return false;
            }
            parent = tmpl->attribute(markers_.parent_name);
        }
        return false;
    }

    std::vector<Node*> in_document_order(const std::vector<Node*>& nodes) const {
        if (nodes.size() < 2) {
            return nodes;
        }
        std::unordered_set<Node*> wanted(nodes.begin(), nodes.end());
        std::vector<Node*> all;
        collect_preorder(doc_.root(), all);

        std::vector<Node*> ordered;
        ordered.reserve(nodes.size());
        for (Node* n : all) {
            if (wanted.count(n) > 0) ordered.push_back(n);
        }
        return ordered;
    }

    std::vector<Node*> all_nodes() const {
        std::vector<Node*> all;
        collect_preorder(doc_.root(), all);
        return all;
    }

private:
    const Document& doc_;
    const InheritanceMarkers& markers_;
    bool index_built_ = false;
    std::map<std::string, const Node*> templates_;

    std::vector<Node*> candidates(Node* ctx, Axis axis) const {
        std::vector<Node*> out;
        if (ctx == nullptr) {
            if (axis == Axis::Child) {
                out.push_back(doc_.root());
            } else {
                collect_preorder(doc_.root(), out);
            }
            return out;
        }
        for (const auto& c : ctx->children()) {
            if (axis == Axis::Child) {
                out.push_back(c.get());
            } else {
                collect_preorder(c.get(), out);
            }
        }
        return out;
    }

    bool matches(const Node& node, const Step& step) {
        if (!step.is_wildcard() && node.tag() != step.tag) {
            return false;
        }
        if (!step.predicate.has_value()) {
            return true;
        }
        for (const auto& clause : step.predicate->any_of) {
            if (clause_matches(node, clause)) {
                return true;
            }
        }
        return false;
    }

    bool clause_matches(const Node& node, const PredicateClause& clause) {
        switch (clause.kind) {
            case PredicateKind::ChildText:
                for (const auto& c : node.children()) {
                    if (c->tag() == clause.name && c->inner_text() == clause.value) {
                        return true;
                    }
                }
                return false;

            case PredicateKind::AttributeEquals: {
                const std::string* v = node.attribute(clause.name);
                return v != nullptr && *v == clause.value;
            }

            case PredicateKind::AttributePresent:
                return node.has_attribute(clause.name);

            case PredicateKind::InheritsFrom:
                return inherits_from(node, clause.value);
        }
        return false;
    }

    const Node* find_template(const std::string& name) {
        if (!index_built_) {
            templates_ = template_index(*doc_.root(), markers_);
            index_built_ = true;
        }
        auto it = templates_.find(name);
        return it == templates_.end() ? nullptr : it->second;
    }
};

} // anonymous namespace

std::vector<Target> select(const Document& doc, const PathExpression& expr,
                           const InheritanceMarkers& markers) {
    Evaluator eval(doc, markers);
    std::vector<Node*> nodes = eval.evaluate(expr);

    std::vector<Target> targets;
    targets.reserve(nodes.size());
    for (Node* n : nodes) {
        switch (expr.selector()) {
            case Selector::Node:
                targets.push_back(Target{n, TargetKind::Node, {}});
                break;
            case Selector::Text:
                if (n->text().has_value()) {
                    targets.push_back(Target{n, TargetKind::Text, {}});
                }
                break;
            case Selector::Attribute:
                if (n->has_attribute(expr.attribute_name())) {
                    targets.push_back(Target{n, TargetKind::Attribute, expr.attribute_name()});
                }
                break;
        }
    }

    spdlog::debug("Path '{}' matched {} target(s)", expr.source(), targets.size());
    return targets;
}

std::vector<Node*> select_nodes(const Document& doc, const PathExpression& expr,
                                const InheritanceMarkers& markers) {
    std::vector<Node*> nodes;
    for (const auto& t : select(doc, expr, markers)) {
        nodes.push_back(t.node);
    }
    return nodes;
}

bool matches_any(const Document& doc, const PathExpression& expr,
                 const InheritanceMarkers& markers) {
    return !select(doc, expr, markers).empty();
}

std::map<std::string, const Node*> template_index(const Node& root,
                                                  const InheritanceMarkers& markers,
                                                  std::vector<std::string>* duplicates) {
    std::map<std::string, const Node*> index;
    for (const auto& rec : root.children()) {
        const std::string* name = rec->attribute(markers.template_name);
        if (name == nullptr) continue;
        if (!index.emplace(*name, rec.get()).second && duplicates != nullptr) {
            duplicates->push_back(*name);
        }
    }
    return index;
}

std::vector<Node*> find_inheritors(const Document& doc, const std::string& template_name,
                                   const InheritanceMarkers& markers) {
    if (doc.empty()) {
        return {};
    }
    Evaluator eval(doc, markers);
    std::vector<Node*> result;
    for (Node* n : eval.all_nodes()) {
        if (eval.inherits_from(*n, template_name)) {
            result.push_back(n);
        }
    }
    return result;
}

} // namespace defpatch
