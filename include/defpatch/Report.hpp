/**
 * @file Report.hpp
 * @brief Operation outcomes and the execution report
 *
 * The report holds one entry per top-level operation attempted, in order,
 * with nested entries for composite operations. It serializes to JSON via
 * nlohmann::json.
 */

#ifndef DEFPATCH_REPORT_HPP
#define DEFPATCH_REPORT_HPP

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace defpatch {

enum class OutcomeStatus {
    Applied,  ///< tree mutated
    Skipped,  ///< succeeded without mutating
    Failed
};

enum class ErrorKind {
    None,
    EmptyTarget,
    Collision,
    Payload,
    Inverted, ///< success reclassified by success=Invert
    Forced,   ///< failure forced by success=Never
    Other
};

struct Outcome {
    OutcomeStatus status = OutcomeStatus::Skipped;
    ErrorKind error = ErrorKind::None;
    std::string reason;

    /// Whether the tree changed, even if the outcome is Failed
    bool mutated = false;

    bool succeeded() const noexcept { return status != OutcomeStatus::Failed; }
    bool failed() const noexcept { return status == OutcomeStatus::Failed; }

    static Outcome applied() {
        return Outcome{OutcomeStatus::Applied, ErrorKind::None, {}, true};
    }

    static Outcome skipped(std::string reason = {}) {
        return Outcome{OutcomeStatus::Skipped, ErrorKind::None, std::move(reason), false};
    }

    /// Applied if `mutated`, Skipped otherwise
    static Outcome success(bool mutated) {
        return mutated ? applied() : skipped();
    }

    static Outcome failure(ErrorKind error, std::string reason, bool mutated = false) {
        return Outcome{OutcomeStatus::Failed, error, std::move(reason), mutated};
    }
};

struct OperationReport {
    /// Position among its siblings (top-level list or nested list)
    size_t index = 0;
    std::string kind;
    std::string path;
    Outcome outcome;
    std::vector<OperationReport> nested;
};

enum class UnitState {
    Pending,
    Running,
    Succeeded,
    Failed
};

struct UnitReport {
    std::string name;
    UnitState state = UnitState::Pending;
    std::vector<OperationReport> operations;

    size_t count(OutcomeStatus status) const;
};

struct ExecutionReport {
    std::vector<UnitReport> units;

    /// True if every unit succeeded
    bool all_succeeded() const;

    /// Number of top-level operations with the given status across units
    size_t count(OutcomeStatus status) const;

    /// One-line human summary, e.g. "3 unit(s): 10 applied, 1 skipped, 2 failed"
    std::string summary() const;

    nlohmann::json to_json() const;
};

std::string to_string(OutcomeStatus status);
std::string to_string(ErrorKind error);
std::string to_string(UnitState state);

nlohmann::json to_json(const OperationReport& report);
nlohmann::json to_json(const UnitReport& report);

} // namespace defpatch

#endif // DEFPATCH_REPORT_HPP
