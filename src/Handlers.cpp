/**
 * @file Handlers.cpp
 * @brief Handler defaults, execution context and registry
 */

#include "defpatch/Handlers.hpp"
#include "defpatch/Engine.hpp"
#include "defpatch/Errors.hpp"

namespace defpatch {

// ============================================================================
// ExecutionContext
// ============================================================================

ExecutionContext::ExecutionContext(Document& doc, const PatchUnit& unit, const Engine& engine)
    : doc_(doc), unit_(unit), engine_(engine)
{}

const InheritanceMarkers& ExecutionContext::markers() const {
    return engine_.markers();
}

OperationReport ExecutionContext::run(OpId id) {
    std::vector<OperationReport>* sink = nested_;
    OperationReport report = engine_.execute(*this, id);
    nested_ = sink;
    if (sink != nullptr) {
        report.index = sink->size();
        sink->push_back(report);
    }
    return report;
}

bool ExecutionContext::has_capability(const std::string& id) const {
    return engine_.has_capability(id);
}

std::vector<Target> ExecutionContext::select(const PathExpression& expr) const {
    return defpatch::select(doc_, expr, engine_.markers());
}

// ============================================================================
// OperationHandler defaults
// ============================================================================

void OperationHandler::validate(const Operation& op) const {
    if (!op.path.has_value()) {
        throw PayloadError(short_kind(op.kind) + " requires an <xpath>");
    }
}

std::vector<Target> OperationHandler::resolve(const Operation& op, ExecutionContext& ctx) const {
    if (!op.path.has_value()) {
        return {};
    }
    return ctx.select(*op.path);
}

std::string OperationHandler::describe(const Operation& op) const {
    std::string label = short_kind(op.kind);
    if (op.order != Order::Default) {
        label += " (" + to_string(op.order) + ")";
    }
    return label;
}

void require_targets(const Operation& op, const std::vector<Target>& targets) {
    if (targets.empty()) {
        throw EmptyTargetError(op.path_text);
    }
}

// ============================================================================
// OperationRegistry
// ============================================================================

OperationRegistry OperationRegistry::with_builtins() {
    OperationRegistry registry;
    register_builtin_operations(registry);
    return registry;
}

void OperationRegistry::register_handler(const std::string& kind,
                                         std::shared_ptr<const OperationHandler> handler) {
    handlers_[canonical_kind(kind)] = std::move(handler);
}

const OperationHandler* OperationRegistry::find(const std::string& kind) const {
    auto it = handlers_.find(canonical_kind(kind));
    return it == handlers_.end() ? nullptr : it->second.get();
}

std::vector<std::string> OperationRegistry::kinds() const {
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace defpatch
