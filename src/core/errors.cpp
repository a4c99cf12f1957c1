#include "errors.hpp"
#include "logging.hpp"

namespace atl {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::NotEligible: return "NotEligible";
        case ErrorCode::InvalidTarget: return "InvalidTarget";
        case ErrorCode::InvalidDelta: return "InvalidDelta";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyDecided: return "AlreadyDecided";
        case ErrorCode::NotOwner: return "NotOwner";
        case ErrorCode::DomainEffectFailed: return "DomainEffectFailed";
        case ErrorCode::RefundError: return "RefundError";
        case ErrorCode::StoreBusy: return "StoreBusy";
        case ErrorCode::IntegrityViolation: return "IntegrityViolation";
        case ErrorCode::Forbidden: return "Forbidden";
    }
    return "None";
}

std::string reason_text(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "";
        case ErrorCode::InsufficientBalance: return "Insufficient coins for this action.";
        case ErrorCode::NotEligible: return "Your profile must be approved before you can do this.";
        case ErrorCode::InvalidTarget: return "The selected recipient is not valid.";
        case ErrorCode::InvalidDelta: return "The amount must be a non-zero whole number of coins.";
        case ErrorCode::NotFound: return "The requested item does not exist.";
        case ErrorCode::AlreadyDecided: return "This item has already been decided.";
        case ErrorCode::NotOwner: return "Only the owner can do this.";
        case ErrorCode::DomainEffectFailed: return "The request could not be recorded. No coins were charged.";
        case ErrorCode::RefundError: return "Refund integrity check failed. The operation was stopped.";
        case ErrorCode::StoreBusy: return "The ledger is busy. Please retry.";
        case ErrorCode::IntegrityViolation: return "Ledger integrity check failed. The operation was stopped.";
        case ErrorCode::Forbidden: return "Action requires administrator privileges.";
    }
    return "";
}

bool is_integrity_fault(ErrorCode code) {
    return code == ErrorCode::RefundError || code == ErrorCode::IntegrityViolation;
}

bool is_retryable(ErrorCode code) {
    return code == ErrorCode::StoreBusy;
}

Outcome outcome_from_exception(const std::string& operation, const LedgerError& error) {
    if (is_integrity_fault(error.code())) {
        atl_log("INTEGRITY", operation + " halted: " + to_string(error.code()) + ": " + error.what());
        return Outcome::failure(error.code());
    }
    if (is_retryable(error.code())) {
        atl_log("WARN", operation + " busy: " + error.what());
        return Outcome::failure(error.code());
    }
    atl_log("DEBUG", operation + " rejected: " + to_string(error.code()) + ": " + error.what());
    return Outcome::failure(error.code());
}

Outcome outcome_from_store_failure(const std::string& operation, const std::exception& error) {
    atl_log("ERROR", operation + " store failure: " + std::string(error.what()));
    return Outcome::failure(ErrorCode::StoreBusy);
}

} // namespace atl
