/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: errors.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Error taxonomy of the ledger core. Inner layers throw LedgerError (or one of
 * its two specialisations); public operations convert to an Outcome at their
 * boundary so callers receive a specific rejection reason.
 * ============================================================================
 */

#ifndef ATL_ERRORS_HPP
#define ATL_ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include "atl_types.hpp"

namespace atl {

    enum class ErrorCode {
        None,
        InsufficientBalance,
        NotEligible,
        InvalidTarget,
        InvalidDelta,
        NotFound,
        AlreadyDecided,
        NotOwner,
        DomainEffectFailed,
        RefundError,
        StoreBusy,
        IntegrityViolation,
        Forbidden
    };

    const char* to_string(ErrorCode code);

    // User-facing rejection reason for a failed request.
    std::string reason_text(ErrorCode code);

    // Broken atomicity. Never retried, always logged at INTEGRITY.
    bool is_integrity_fault(ErrorCode code);

    bool is_retryable(ErrorCode code);

    class LedgerError : public std::runtime_error {
    public:
        LedgerError(ErrorCode code, const std::string& detail)
            : std::runtime_error(detail), code_(code) {}

        ErrorCode code() const { return code_; }

    private:
        ErrorCode code_;
    };

    class IntegrityFault : public LedgerError {
    public:
        IntegrityFault(ErrorCode code, const std::string& detail) : LedgerError(code, detail) {}
    };

    // Bounded wait on a per-account or per-subject lock ran out.
    class TransientFailure : public LedgerError {
    public:
        explicit TransientFailure(const std::string& detail)
            : LedgerError(ErrorCode::StoreBusy, detail) {}
    };

    struct Outcome {
        bool ok = false;
        ErrorCode code = ErrorCode::None;
        std::string message;
        std::optional<SubjectRef> subject;

        static Outcome success(std::optional<SubjectRef> subject = std::nullopt, std::string msg = {}) {
            Outcome out;
            out.ok = true;
            out.subject = subject;
            out.message = std::move(msg);
            return out;
        }

        static Outcome failure(ErrorCode code, std::string msg = {}) {
            Outcome out;
            out.code = code;
            out.message = msg.empty() ? reason_text(code) : std::move(msg);
            return out;
        }
    };

    /**
     * guarded
     * Runs `body` and converts whatever it throws into a failed Outcome.
     * `operation` names the call in the log line.
     */
    template <typename Body>
    Outcome guarded(const std::string& operation, Body&& body);

    // Logs a caught exception at the level its kind deserves and builds the Outcome.
    Outcome outcome_from_exception(const std::string& operation, const LedgerError& error);
    Outcome outcome_from_store_failure(const std::string& operation, const std::exception& error);

    template <typename Body>
    Outcome guarded(const std::string& operation, Body&& body) {
        try {
            return body();
        } catch (const LedgerError& e) {
            return outcome_from_exception(operation, e);
        } catch (const std::exception& e) {
            return outcome_from_store_failure(operation, e);
        }
    }

} // namespace atl

#endif // ATL_ERRORS_HPP
