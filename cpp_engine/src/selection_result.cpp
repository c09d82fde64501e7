#include "engine/selection_result.hpp"

#include <stdexcept>
#include <utility>

namespace parlay::engine {

bool resolve_include_category_x(const SelectionRequest &request, const RuleSet *profile_rules) {
    if (request.include_category_x) {
        return *request.include_category_x;
    }
    return profile_rules != nullptr && profile_rules->include_category_x;
}

std::string to_string(SelectionStatus status) {
    return status == SelectionStatus::Accepted ? "ACCEPTED" : "REJECTED";
}

std::string to_string(ReasonCode reason) {
    switch (reason) {
        case ReasonCode::InsufficientPool:
            return "INSUFFICIENT_POOL";
        case ReasonCode::NoValidSelection:
            return "NO_VALID_SELECTION";
        case ReasonCode::InvalidRequest:
            return "INVALID_REQUEST";
        default:
            return "UNKNOWN";
    }
}

std::string to_string(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::Accepted:
            return "ACCEPTED";
        case AttemptOutcome::ConstraintBlocked:
            return "CONSTRAINT_BLOCKED";
        case AttemptOutcome::WeightTooLow:
            return "WEIGHT_TOO_LOW";
        default:
            return "UNKNOWN";
    }
}

SelectionResult SelectionResult::accept(AcceptedSelection selection, Diagnostic diagnostic,
                                        std::vector<LadderAttempt> trace) {
    SelectionResult r;
    r.status_ = SelectionStatus::Accepted;
    r.accepted_ = std::move(selection);
    r.diagnostic_ = diagnostic;
    r.trace_ = std::move(trace);
    return r;
}

SelectionResult SelectionResult::reject(ReasonCode reason, std::string detail, Diagnostic diagnostic,
                                        std::vector<LadderAttempt> trace) {
    SelectionResult r;
    r.status_ = SelectionStatus::Rejected;
    r.rejected_ = RejectedSelection{reason, std::move(detail)};
    r.diagnostic_ = diagnostic;
    r.trace_ = std::move(trace);
    return r;
}

const AcceptedSelection &SelectionResult::accepted() const {
    if (!accepted_) {
        throw std::logic_error("SelectionResult::accepted() called on a rejected result");
    }
    return *accepted_;
}

const RejectedSelection &SelectionResult::rejected() const {
    if (!rejected_) {
        throw std::logic_error("SelectionResult::rejected() called on an accepted result");
    }
    return *rejected_;
}

}  // namespace parlay::engine
