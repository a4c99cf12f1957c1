/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: ActionGate.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Single entry point for user actions that create a moderated subject and may
 * cost coins. The subject insert and its debit are one transaction: either a
 * PENDING subject exists and the owner has paid for it, or neither happened.
 * ============================================================================
 */

#ifndef ATL_ACTION_GATE_HPP
#define ATL_ACTION_GATE_HPP

#include <functional>
#include <optional>
#include "atl_types.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "NotificationEmitter.hpp"
#include "../storage/Repository.hpp"

namespace atl {

/**
 * @brief Builds the subject the action creates.
 * Runs inside the gate's transaction and may read through it. The gate owns
 * owner, status, cost and timestamps; the effect supplies the details. Any
 * exception other than LedgerError becomes DomainEffectFailed.
 */
typedef std::function<ModeratedSubject(storage::Transaction&)> DomainEffect;

class ActionGate {
public:
    ActionGate(storage::Repository& repo, LedgerStore& ledger, NotificationEmitter& notifier);

    /**
     * attempt
     * Checks eligibility and balance, inserts the subject in PENDING and
     * appends the debit (skipped when cost is 0), then commits.
     * Failures: NotFound, NotEligible, InvalidTarget, InvalidDelta (negative
     * cost), InsufficientBalance, DomainEffectFailed, StoreBusy. On any
     * failure nothing is written.
     */
    Outcome attempt(AccountId account_id, ActionKind action, coin_t cost, const DomainEffect& effect,
                    std::optional<AccountId> target = std::nullopt);

    static LedgerReason reason_for(ActionKind action);
    static SubjectKind kind_for(ActionKind action);

    // Posting and connecting need an APPROVED profile; top-ups do not.
    static bool requires_approved_profile(ActionKind action);

private:
    void check_eligibility(storage::Transaction& tx, AccountId account_id, ActionKind action,
                           std::optional<AccountId> target) const;

    storage::Repository& repo_;
    LedgerStore& ledger_;
    NotificationEmitter& notifier_;
};

const char* to_string(ActionKind action);

} // namespace atl

#endif // ATL_ACTION_GATE_HPP
