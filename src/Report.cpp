/**
 * @file Report.cpp
 * @brief Execution report aggregation and JSON output
 */

#include "defpatch/Report.hpp"

#include <algorithm>
#include <sstream>

namespace defpatch {

std::string to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Applied: return "applied";
        case OutcomeStatus::Skipped: return "skipped";
        case OutcomeStatus::Failed: return "failed";
    }
    return "unknown";
}

std::string to_string(ErrorKind error) {
    switch (error) {
        case ErrorKind::None: return "none";
        case ErrorKind::EmptyTarget: return "empty-target";
        case ErrorKind::Collision: return "collision";
        case ErrorKind::Payload: return "payload";
        case ErrorKind::Inverted: return "inverted";
        case ErrorKind::Forced: return "forced";
        case ErrorKind::Other: return "other";
    }
    return "unknown";
}

std::string to_string(UnitState state) {
    switch (state) {
        case UnitState::Pending: return "pending";
        case UnitState::Running: return "running";
        case UnitState::Succeeded: return "succeeded";
        case UnitState::Failed: return "failed";
    }
    return "unknown";
}

size_t UnitReport::count(OutcomeStatus status) const {
    return static_cast<size_t>(std::count_if(
        operations.begin(), operations.end(),
        [status](const OperationReport& r) { return r.outcome.status == status; }));
}

bool ExecutionReport::all_succeeded() const {
    return std::all_of(units.begin(), units.end(),
                       [](const UnitReport& u) { return u.state == UnitState::Succeeded; });
}

size_t ExecutionReport::count(OutcomeStatus status) const {
    size_t total = 0;
    for (const auto& u : units) {
        total += u.count(status);
    }
    return total;
}

std::string ExecutionReport::summary() const {
    std::ostringstream oss;
    oss << units.size() << " unit(s): "
        << count(OutcomeStatus::Applied) << " applied, "
        << count(OutcomeStatus::Skipped) << " skipped, "
        << count(OutcomeStatus::Failed) << " failed";
    return oss.str();
}

nlohmann::json to_json(const OperationReport& report) {
    nlohmann::json j = {
        {"index", report.index},
        {"kind", report.kind},
        {"path", report.path},
        {"status", to_string(report.outcome.status)},
        {"mutated", report.outcome.mutated}
    };
    if (report.outcome.error != ErrorKind::None) {
        j["error"] = to_string(report.outcome.error);
    }
    if (!report.outcome.reason.empty()) {
        j["reason"] = report.outcome.reason;
    }
    if (!report.nested.empty()) {
        nlohmann::json nested = nlohmann::json::array();
        for (const auto& n : report.nested) {
            nested.push_back(to_json(n));
        }
        j["nested"] = std::move(nested);
    }
    return j;
}

nlohmann::json to_json(const UnitReport& report) {
    nlohmann::json ops = nlohmann::json::array();
    for (const auto& op : report.operations) {
        ops.push_back(to_json(op));
    }
    return {
        {"name", report.name},
        {"state", to_string(report.state)},
        {"operations", std::move(ops)}
    };
}

nlohmann::json ExecutionReport::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& u : units) {
        arr.push_back(defpatch::to_json(u));
    }
    return {
        {"summary", summary()},
        {"succeeded", all_succeeded()},
        {"units", std::move(arr)}
    };
}

} // namespace defpatch
