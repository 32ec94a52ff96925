/**
 * @file Operations.cpp
 * @brief Built-in operation catalog
 *
 * Node-changing kinds check every target before mutating any, so a
 * failed operation leaves the tree untouched. Composite kinds run their
 * nested operations through ExecutionContext::run.
 */

#include "defpatch/Handlers.hpp"
#include "defpatch/Errors.hpp"

#include <set>

namespace defpatch {

namespace {

/// List child created by AddModExtension
const std::string EXTENSIONS_TAG = "modExtensions";

void require_payload_nodes(const Operation& op) {
    if (op.payload().empty()) {
        throw PayloadError(short_kind(op.kind) + " requires a <value> with at least one element");
    }
}

void require_value(const Operation& op) {
    if (!op.value) {
        throw PayloadError(short_kind(op.kind) + " requires a <value>");
    }
}

void require_attribute_name(const Operation& op) {
    if (op.attribute.empty()) {
        throw PayloadError(short_kind(op.kind) + " requires an <attribute>");
    }
}

void require_node_target(const Operation& op, const Target& t) {
    if (t.kind != TargetKind::Node) {
        throw PayloadError(short_kind(op.kind) + " cannot target text or attributes ('" +
                           op.path_text + "')");
    }
}

/**
 * @brief True if `node` is no longer reachable from the document root
 *
 * An earlier target of the same operation may have removed an ancestor.
 */
bool detached(const Document& doc, const Node* node) {
    return !doc.contains(node);
}

// ============================================================================
// Add: payload as children (Append default)
// ============================================================================

class AddHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        OperationHandler::validate(op);
        require_payload_nodes(op);
    }

    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& ctx) const override {
        require_targets(op, targets);
        Document& doc = ctx.document();

        for (const auto& t : targets) {
            require_node_target(op, t);
            std::set<std::string> incoming;
            for (const auto& p : op.payload()) {
                if (doc.allows_duplicate(*t.node, p->tag())) continue;
                if (const Node* existing = t.node->child(p->tag())) {
                    throw CollisionError(op.path_text, p->tag(), existing->equals(*p));
                }
                if (!incoming.insert(p->tag()).second) {
                    throw CollisionError(op.path_text, p->tag());
                }
            }
        }

        for (const auto& t : targets) {
            if (op.order == Order::Prepend) {
                size_t at = 0;
                for (const auto& p : op.payload()) {
                    t.node->insert_child(at++, p->clone());
                }
            } else {
                for (const auto& p : op.payload()) {
                    t.node->append_child(p->clone());
                }
            }
        }
        return Outcome::applied();
    }
};

// ============================================================================
// Insert: payload as siblings (Prepend = before, the default)
// ============================================================================

class InsertHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        OperationHandler::validate(op);
        require_payload_nodes(op);
    }

    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& /*ctx*/) const override {
        require_targets(op, targets);
        for (const auto& t : targets) {
            require_node_target(op, t);
            if (t.node->parent() == nullptr) {
                throw PayloadError("Insert cannot add a sibling to the root element");
            }
        }

        for (const auto& t : targets) {
            Node* parent = t.node->parent();
            size_t at = parent->index_of(t.node);
            if (op.order == Order::Append) {
                ++at;
            }
            for (const auto& p : op.payload()) {
                parent->insert_child(at++, p->clone());
            }
        }
        return Outcome::applied();
    }
};

// ============================================================================
// Remove: nodes, attributes or text
// ============================================================================

class RemoveHandler : public OperationHandler {
public:
    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& ctx) const override {
        require_targets(op, targets);
        Document& doc = ctx.document();
        for (const auto& t : targets) {
            if (t.kind == TargetKind::Node && t.node->parent() == nullptr) {
                throw PayloadError("Remove cannot delete the root element");
            }
        }

        // Detached subtrees stay alive until every target has been visited
        std::vector<NodePtr> removed;
        for (const auto& t : targets) {
            if (detached(doc, t.node)) continue;
            switch (t.kind) {
                case TargetKind::Node:
                    removed.push_back(t.node->parent()->remove_child(t.node));
                    break;
                case TargetKind::Attribute:
                    t.node->remove_attribute(t.attribute);
                    break;
                case TargetKind::Text:
                    t.node->clear_text();
                    break;
            }
        }
        return Outcome::applied();
    }
};

// ============================================================================
// Replace: nodes in place, or text
// ============================================================================

class ReplaceHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        OperationHandler::validate(op);
        require_value(op);
        if (op.path->selector() == Selector::Node) {
            require_payload_nodes(op);
        } else if (!op.payload().empty()) {
            throw PayloadError("Replace of text or attribute takes a text <value>, not elements");
        }
    }

    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& ctx) const override {
        require_targets(op, targets);
        Document& doc = ctx.document();

        for (const auto& t : targets) {
            if (t.kind == TargetKind::Node && t.node->parent() == nullptr &&
                op.payload().size() != 1) {
                throw PayloadError("Replace of the root element requires exactly one element");
            }
        }

        std::vector<NodePtr> removed;
        for (const auto& t : targets) {
            if (detached(doc, t.node)) continue;
            switch (t.kind) {
                case TargetKind::Node: {
                    Node* parent = t.node->parent();
                    if (parent == nullptr) {
                        removed.push_back(doc.set_root(op.payload().front()->clone()));
                        break;
                    }
                    size_t at = parent->index_of(t.node);
                    for (const auto& p : op.payload()) {
                        parent->insert_child(at++, p->clone());
                    }
                    removed.push_back(parent->remove_child(t.node));
                    break;
                }
                case TargetKind::Text:
                    t.node->set_text(op.payload_text());
                    break;
                case TargetKind::Attribute:
                    t.node->set_attribute(t.attribute, op.payload_text());
                    break;
            }
        }
        return Outcome::applied();
    }
};

// ============================================================================
// Attribute kinds
// ============================================================================

class AttributeAddHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        OperationHandler::validate(op);
        require_attribute_name(op);
        require_value(op);
    }

    std::string describe(const Operation& op) const override {
        return "AttributeAdd @" + op.attribute;
    }

    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& /*ctx*/) const override {
        require_targets(op, targets);
        bool mutated = false;
        for (const auto& t : targets) {
            require_node_target(op, t);
            if (t.node->has_attribute(op.attribute)) continue;
            t.node->set_attribute(op.attribute, op.payload_text());
            mutated = true;
        }
        return Outcome::success(mutated);
    }
};

class AttributeSetHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        OperationHandler::validate(op);
        require_attribute_name(op);
        require_value(op);
    }

    std::string describe(const Operation& op) const override {
        return "AttributeSet @" + op.attribute;
    }

    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& /*ctx*/) const override {
        require_targets(op, targets);
        for (const auto& t : targets) {
            require_node_target(op, t);
            t.node->set_attribute(op.attribute, op.payload_text());
        }
        return Outcome::applied();
    }
};

class AttributeRemoveHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        OperationHandler::validate(op);
        require_attribute_name(op);
    }

    std::string describe(const Operation& op) const override {
        return "AttributeRemove @" + op.attribute;
    }

    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& /*ctx*/) const override {
        require_targets(op, targets);
        bool mutated = false;
        for (const auto& t : targets) {
            require_node_target(op, t);
            mutated = t.node->remove_attribute(op.attribute) || mutated;
        }
        return Outcome::success(mutated);
    }
};

// ============================================================================
// SetName
// ============================================================================

class SetNameHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        OperationHandler::validate(op);
        if (op.name.empty()) {
            throw PayloadError("SetName requires a <name>");
        }
    }

    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& ctx) const override {
        require_targets(op, targets);
        Document& doc = ctx.document();

        std::set<const Node*> renaming;
        for (const auto& t : targets) {
            require_node_target(op, t);
            renaming.insert(t.node);
        }
        std::set<const Node*> parents_seen;
        for (const auto& t : targets) {
            Node* parent = t.node->parent();
            if (parent == nullptr || doc.allows_duplicate(*parent, op.name)) continue;
            if (!parents_seen.insert(parent).second) {
                throw CollisionError(op.path_text, op.name);
            }
            for (const auto& sibling : parent->children()) {
                if (sibling.get() != t.node && sibling->tag() == op.name &&
                    renaming.count(sibling.get()) == 0) {
                    throw CollisionError(op.path_text, op.name);
                }
            }
        }

        bool mutated = false;
        for (const auto& t : targets) {
            if (t.node->tag() == op.name) continue;
            t.node->set_tag(op.name);
            mutated = true;
        }
        return Outcome::success(mutated);
    }
};

// ============================================================================
// AddModExtension
// ============================================================================

class AddModExtensionHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        OperationHandler::validate(op);
        require_payload_nodes(op);
    }

    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& /*ctx*/) const override {
        require_targets(op, targets);
        for (const auto& t : targets) {
            require_node_target(op, t);
        }

        for (const auto& t : targets) {
            Node* list = t.node->child(EXTENSIONS_TAG);
            if (list == nullptr) {
                list = &t.node->append_child(make_node(EXTENSIONS_TAG));
            }
            for (const auto& p : op.payload()) {
                if (p->is_list_item()) {
                    list->append_child(p->clone());
                } else {
                    Node& entry = list->append_child(make_node(LIST_ITEM_TAG));
                    entry.append_child(p->clone());
                }
            }
        }
        return Outcome::applied();
    }
};

// ============================================================================
// Test: existence check only
// ============================================================================

class TestHandler : public OperationHandler {
public:
    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& /*ctx*/) const override {
        require_targets(op, targets);
        return Outcome::skipped();
    }
};

// ============================================================================
// Composite kinds
// ============================================================================

/**
 * @brief Carry a branch's outcome up, naming the branch on failure
 */
Outcome branch_outcome(const OperationReport& branch, const std::string& label) {
    Outcome result = branch.outcome;
    if (result.failed()) {
        result.reason = label + " branch failed: " + result.reason;
    }
    return result;
}

class SequenceHandler : public OperationHandler {
public:
    void validate(const Operation& /*op*/) const override {}

    Outcome apply(const Operation& op, const std::vector<Target>& /*targets*/,
                  ExecutionContext& ctx) const override {
        bool mutated = false;
        for (size_t i = 0; i < op.operations.size(); ++i) {
            OperationReport nested = ctx.run(op.operations[i]);
            mutated = mutated || nested.outcome.mutated;
            if (nested.outcome.failed()) {
                // Earlier nested mutations stay applied
                return Outcome::failure(
                    nested.outcome.error,
                    "nested operation #" + std::to_string(i) + " (" + short_kind(nested.kind) +
                        ") failed: " + nested.outcome.reason,
                    mutated);
            }
        }
        return Outcome::success(mutated);
    }
};

class ConditionalHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        OperationHandler::validate(op);
        if (!op.match.has_value() && !op.nomatch.has_value()) {
            throw PayloadError("Conditional requires <match> or <nomatch>");
        }
    }

    Outcome apply(const Operation& op, const std::vector<Target>& targets,
                  ExecutionContext& ctx) const override {
        if (!targets.empty()) {
            if (!op.match.has_value()) return Outcome::skipped("no match branch");
            return branch_outcome(ctx.run(*op.match), "match");
        }
        if (!op.nomatch.has_value()) return Outcome::skipped("no nomatch branch");
        return branch_outcome(ctx.run(*op.nomatch), "nomatch");
    }
};

class FindModHandler : public OperationHandler {
public:
    void validate(const Operation& op) const override {
        if (op.mods.empty()) {
            throw PayloadError("FindMod requires a non-empty <mods> list");
        }
        if (!op.match.has_value() && !op.nomatch.has_value()) {
            throw PayloadError("FindMod requires <match> or <nomatch>");
        }
    }

    std::vector<Target> resolve(const Operation& /*op*/, ExecutionContext& /*ctx*/) const override {
        return {};
    }

    Outcome apply(const Operation& op, const std::vector<Target>& /*targets*/,
                  ExecutionContext& ctx) const override {
        bool found = false;
        for (const auto& mod : op.mods) {
            if (ctx.has_capability(mod)) {
                found = true;
                break;
            }
        }
        if (found) {
            if (!op.match.has_value()) return Outcome::skipped("no match branch");
            return branch_outcome(ctx.run(*op.match), "match");
        }
        if (!op.nomatch.has_value()) return Outcome::skipped("no nomatch branch");
        return branch_outcome(ctx.run(*op.nomatch), "nomatch");
    }
};

} // anonymous namespace

void register_builtin_operations(OperationRegistry& registry) {
    registry.register_handler("Add", std::make_shared<AddHandler>());
    registry.register_handler("Insert", std::make_shared<InsertHandler>());
    registry.register_handler("Remove", std::make_shared<RemoveHandler>());
    registry.register_handler("Replace", std::make_shared<ReplaceHandler>());
    registry.register_handler("AttributeAdd", std::make_shared<AttributeAddHandler>());
    registry.register_handler("AttributeSet", std::make_shared<AttributeSetHandler>());
    registry.register_handler("AttributeRemove", std::make_shared<AttributeRemoveHandler>());
    registry.register_handler("SetName", std::make_shared<SetNameHandler>());
    registry.register_handler("AddModExtension", std::make_shared<AddModExtensionHandler>());
    registry.register_handler("Test", std::make_shared<TestHandler>());
    registry.register_handler("Sequence", std::make_shared<SequenceHandler>());
    registry.register_handler("Conditional", std::make_shared<ConditionalHandler>());
    registry.register_handler("FindMod", std::make_shared<FindModHandler>());
}

} // namespace defpatch
