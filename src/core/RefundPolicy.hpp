/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: RefundPolicy.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Compensating credit for a coin-bearing subject that was rejected or
 * cancelled. The refund entry and the subject's refund_applied flag are
 * written in the same transaction, which makes the refund at-most-once.
 * ============================================================================
 */

#ifndef ATL_REFUND_POLICY_HPP
#define ATL_REFUND_POLICY_HPP

#include <optional>
#include "atl_types.hpp"
#include "ledger.hpp"
#include "../storage/Repository.hpp"

namespace atl {

class RefundPolicy {
public:
    // allow_refunds is fixed for the life of the process.
    RefundPolicy(storage::Repository& repo, LedgerStore& ledger, bool allow_refunds);

    /**
     * apply
     * Inside the caller's transaction, which must already hold the subject's
     * lock. The subject must already be REJECTED or CANCELLED. Returns no entry (and is not an error) when the subject is free,
     * already refunded, or refunds are disabled. On a refund, sets
     * subject.refund_applied and stages the subject update.
     * @throws LedgerError(InvalidTarget) for a PENDING or APPROVED subject.
     * @throws IntegrityFault(RefundError) if a REFUND entry for the subject
     * exists while its flag is still false.
     */
    std::optional<LedgerEntry> apply(storage::Transaction& tx, ModeratedSubject& subject);

    /**
     * apply
     * Standalone form: locks the subject and its owner, applies, commits.
     * @throws LedgerError(NotFound) for an unknown subject, and everything
     * the in-transaction form throws.
     */
    std::optional<LedgerEntry> apply(const SubjectRef& ref);

    bool refunds_enabled() const { return allow_refunds_; }

private:
    storage::Repository& repo_;
    LedgerStore& ledger_;
    const bool allow_refunds_;
};

} // namespace atl

#endif // ATL_REFUND_POLICY_HPP
