/**
 * @file Engine.cpp
 * @brief Dispatch loop, failure isolation and success overrides
 */

#include "defpatch/Engine.hpp"
#include "defpatch/Errors.hpp"

#include <spdlog/spdlog.h>

namespace defpatch {

namespace {

/**
 * @brief Points the context's nested-report sink at one report for a scope
 */
class NestedScope {
public:
    NestedScope(std::vector<OperationReport>*& slot, std::vector<OperationReport>* target)
        : slot_(slot), saved_(slot) {
        slot_ = target;
    }
    ~NestedScope() { slot_ = saved_; }

    NestedScope(const NestedScope&) = delete;
    NestedScope& operator=(const NestedScope&) = delete;

private:
    std::vector<OperationReport>*& slot_;
    std::vector<OperationReport>* saved_;
};

} // anonymous namespace

Outcome apply_success_mode(SuccessMode mode, Outcome raw) {
    switch (mode) {
        case SuccessMode::Normal:
            return raw;

        case SuccessMode::Always:
            if (raw.failed()) {
                Outcome ok = Outcome::success(raw.mutated);
                ok.reason = "failure suppressed (success=Always): " + raw.reason;
                return ok;
            }
            return raw;

        case SuccessMode::Invert:
            if (raw.succeeded()) {
                return Outcome::failure(ErrorKind::Inverted,
                                        "operation succeeded (success=Invert)", raw.mutated);
            } else {
                Outcome ok = Outcome::success(raw.mutated);
                ok.reason = "failure inverted (success=Invert): " + raw.reason;
                return ok;
            }

        case SuccessMode::Never:
            return Outcome::failure(ErrorKind::Forced, "forced failure (success=Never)", raw.mutated);
    }
    return raw;
}

Engine::Engine(OperationRegistry registry)
    : registry_(std::move(registry))
{}

bool Engine::has_capability(const std::string& id) const {
    return capabilities_ ? capabilities_(id) : false;
}

OperationReport Engine::execute(ExecutionContext& ctx, OpId id) const {
    const Operation& op = ctx.unit().at(id);

    OperationReport report;
    report.kind = op.kind;
    report.path = op.path_text;

    Outcome raw = dispatch(ctx, op, report);
    report.outcome = apply_success_mode(op.success, std::move(raw));
    return report;
}

Outcome Engine::dispatch(ExecutionContext& ctx, const Operation& op, OperationReport& report) const {
    NestedScope scope(ctx.nested_, &report.nested);

    try {
        if (!op.payload_error.empty()) {
            throw PayloadError(op.payload_error);
        }
        const OperationHandler* handler = registry_.find(op.kind);
        if (handler == nullptr) {
            throw PayloadError("Unknown operation kind '" + op.kind + "'");
        }

        handler->validate(op);
        std::vector<Target> targets = handler->resolve(op, ctx);
        Outcome outcome = handler->apply(op, targets, ctx);

        spdlog::debug("{}: {} '{}' -> {}", ctx.unit().name(), handler->describe(op),
                      op.path_text, to_string(outcome.status));
        return outcome;
    } catch (const MalformedDocumentError&) {
        throw;
    } catch (const EmptyTargetError& e) {
        return Outcome::failure(ErrorKind::EmptyTarget, e.what());
    } catch (const CollisionError& e) {
        return Outcome::failure(ErrorKind::Collision, e.what());
    } catch (const PayloadError& e) {
        return Outcome::failure(ErrorKind::Payload, e.what());
    } catch (const PatchError& e) {
        return Outcome::failure(ErrorKind::Other, e.what());
    }
}

UnitReport Engine::apply(Document& doc, const PatchUnit& unit) const {
    if (doc.empty()) {
        throw MalformedDocumentError(unit.name(), 0, 0, "target document has no root element");
    }

    UnitReport result;
    result.name = unit.name();
    result.state = UnitState::Running;

    spdlog::debug("Applying patch unit '{}' ({} top-level operation(s))",
                  unit.name(), unit.roots().size());

    ExecutionContext ctx(doc, unit, *this);
    bool failed = false;

    const auto& roots = unit.roots();
    for (size_t i = 0; i < roots.size(); ++i) {
        OperationReport report = execute(ctx, roots[i]);
        report.index = i;
        if (report.outcome.failed()) {
            failed = true;
            spdlog::warn("{}: operation #{} {} '{}' failed: {}", unit.name(), i,
                         short_kind(report.kind), report.path, report.outcome.reason);
        }
        result.operations.push_back(std::move(report));
    }

    result.state = failed ? UnitState::Failed : UnitState::Succeeded;
    return result;
}

ExecutionReport Engine::apply_all(Document& doc, const std::vector<PatchUnit>& units) const {
    ExecutionReport report;
    for (const auto& unit : units) {
        report.units.push_back(apply(doc, unit));
    }
    spdlog::info("Patching finished: {}", report.summary());
    return report;
}

std::vector<std::string> Engine::validate(const PatchUnit& unit) const {
    std::vector<std::string> problems;
    const auto& roots = unit.roots();
    for (size_t i = 0; i < roots.size(); ++i) {
        validate_tree(unit, roots[i], "#" + std::to_string(i), problems);
    }
    return problems;
}

void Engine::validate_tree(const PatchUnit& unit, OpId id, const std::string& where,
                           std::vector<std::string>& problems) const {
    const Operation& op = unit.at(id);
    const std::string label = unit.name() + " " + where + " (" + short_kind(op.kind) + ")";

    if (!op.payload_error.empty()) {
        problems.push_back(label + ": " + op.payload_error);
    } else if (const OperationHandler* handler = registry_.find(op.kind)) {
        try {
            handler->validate(op);
        } catch (const PayloadError& e) {
            problems.push_back(label + ": " + e.what());
        }
    } else {
        problems.push_back(label + ": unknown operation kind '" + op.kind + "'");
    }

    for (size_t k = 0; k < op.operations.size(); ++k) {
        validate_tree(unit, op.operations[k], where + "/" + std::to_string(k), problems);
    }
    if (op.match.has_value()) {
        validate_tree(unit, *op.match, where + "/match", problems);
    }
    if (op.nomatch.has_value()) {
        validate_tree(unit, *op.nomatch, where + "/nomatch", problems);
    }
}

} // namespace defpatch
