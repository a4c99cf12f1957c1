#include "ledger.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace atl {

LedgerStore::LedgerStore(storage::Repository& repo) : repo_(repo) {}

LedgerEntry LedgerStore::append(storage::Transaction& tx, AccountId account_id, coin_t delta, LedgerReason reason,
                                std::optional<SubjectRef> reference, const std::string& description) {
    if (delta == 0) {
        throw LedgerError(ErrorCode::InvalidDelta, "ledger delta must be non-zero");
    }

    tx.lock_account(account_id);
    if (!tx.find_account(account_id)) {
        throw LedgerError(ErrorCode::NotFound, "account " + std::to_string(account_id) + " does not exist");
    }

    coin_t balance = tx.cached_balance(account_id);
    if (delta < 0 && balance + delta < 0) {
        throw LedgerError(ErrorCode::InsufficientBalance,
                          "account " + std::to_string(account_id) + " holds " + std::to_string(balance) +
                          ", debit of " + std::to_string(-delta) + " refused");
    }

    LedgerEntry entry;
    entry.account_id = account_id;
    entry.delta = delta;
    entry.reason = reason;
    entry.reference = reference;
    entry.description = description;
    entry.created_at = unix_now();
    entry.seal = AtlCrypto::calculate_entry_seal(tx.last_seal(account_id), entry);

    return tx.insert_entry(entry);
}

LedgerEntry LedgerStore::append(AccountId account_id, coin_t delta, LedgerReason reason,
                                std::optional<SubjectRef> reference, const std::string& description) {
    auto tx = repo_.begin();
    LedgerEntry entry = append(*tx, account_id, delta, reason, reference, description);
    tx->commit();
    return entry;
}

coin_t LedgerStore::balance_of(AccountId account_id) const {
    return repo_.balance_of(account_id);
}

HistoryPage LedgerStore::history(AccountId account_id, const PageRequest& page) const {
    HistoryPage result;
    if (page.limit == 0) return result;

    result.entries = repo_.entries(account_id, page);
    if (result.entries.size() == page.limit) {
        result.next_before = result.entries.back().id;
    }
    return result;
}

ReconcileReport LedgerStore::reconcile(AccountId account_id) const {
    ReconcileReport report;
    report.account_id = account_id;

    auto tx = repo_.begin();
    tx->lock_account(account_id);

    std::string expected_prev_seal = kGenesisSeal;
    for (const auto& entry : tx->entries_ascending(account_id)) {
        std::string recalc_seal = AtlCrypto::calculate_entry_seal(expected_prev_seal, entry);
        if (recalc_seal != entry.seal) {
            report.chain_ok = false;
        }
        report.summed += entry.delta;
        if (report.summed < 0) {
            report.never_negative = false;
        }
        expected_prev_seal = entry.seal;
        ++report.entries;
    }
    report.cached = tx->cached_balance(account_id);
    report.balanced = report.cached == report.summed;

    if (!report.ok()) {
        atl_log("INTEGRITY", "Reconciliation failed for account " + std::to_string(account_id) +
                ": summed=" + std::to_string(report.summed) + " cached=" + std::to_string(report.cached) +
                " chain_ok=" + (report.chain_ok ? "true" : "false") +
                " never_negative=" + (report.never_negative ? "true" : "false"));
    }
    return report;
}

} // namespace atl
