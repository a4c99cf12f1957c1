/**
 * ATL: Atoll Coin Ledger - Core Ledger Logic
 * Focus: the only write path to balance state, plus the read side that proves
 * a balance equals the sum of its history.
 */

#ifndef ATL_LEDGER_HPP
#define ATL_LEDGER_HPP

#include <optional>
#include <string>
#include "atl_types.hpp"
#include "../storage/Repository.hpp"

namespace atl {

class LedgerStore {
public:
    explicit LedgerStore(storage::Repository& repo);

    /**
     * append
     * Appends one sealed entry inside the caller's transaction. Locks the
     * account, so the balance check and the insert are one step with respect
     * to every other append on that account.
     * @throws LedgerError InvalidDelta when delta is zero, NotFound when the
     * account does not exist, InsufficientBalance when a debit would take the
     * derived balance below zero.
     */
    LedgerEntry append(storage::Transaction& tx, AccountId account_id, coin_t delta, LedgerReason reason,
                       std::optional<SubjectRef> reference = std::nullopt,
                       const std::string& description = "");

    // Same as above, committed as its own unit.
    LedgerEntry append(AccountId account_id, coin_t delta, LedgerReason reason,
                       std::optional<SubjectRef> reference = std::nullopt,
                       const std::string& description = "");

    coin_t balance_of(AccountId account_id) const;

    /**
     * history
     * Newest first. Pass the returned next_before back as page.before to
     * continue; next_before is empty once the oldest entry has been returned.
     */
    HistoryPage history(AccountId account_id, const PageRequest& page) const;

    /**
     * reconcile
     * Replays the account's chain under its lock: recomputes every seal and
     * the running sum and compares the sum with the cached balance. A failed
     * report is logged at INTEGRITY.
     */
    ReconcileReport reconcile(AccountId account_id) const;

private:
    storage::Repository& repo_;
};

} // namespace atl

#endif // ATL_LEDGER_HPP
