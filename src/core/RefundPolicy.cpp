#include "RefundPolicy.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace atl {

RefundPolicy::RefundPolicy(storage::Repository& repo, LedgerStore& ledger, bool allow_refunds)
    : repo_(repo), ledger_(ledger), allow_refunds_(allow_refunds) {}

std::optional<LedgerEntry> RefundPolicy::apply(storage::Transaction& tx, ModeratedSubject& subject) {
    if (subject.status != SubjectStatus::Rejected && subject.status != SubjectStatus::Cancelled) {
        throw LedgerError(ErrorCode::InvalidTarget,
                          std::string(to_string(subject.kind())) + " " + std::to_string(subject.id) + " is " +
                          to_string(subject.status) + ", only rejected or cancelled subjects are refunded");
    }
    if (subject.coin_cost == 0 || subject.refund_applied) {
        return std::nullopt;
    }
    if (!allow_refunds_) {
        atl_log("DEBUG", std::string("Refunds disabled, ") + to_string(subject.kind()) + " " +
                std::to_string(subject.id) + " keeps its charge");
        return std::nullopt;
    }

    if (tx.has_entry_for(subject.ref(), LedgerReason::Refund)) {
        throw IntegrityFault(ErrorCode::RefundError,
                             std::string("refund entry already exists for ") + to_string(subject.kind()) + " " +
                             std::to_string(subject.id) + " while refund_applied is false");
    }

    LedgerEntry entry = ledger_.append(tx, subject.owner_account_id, subject.coin_cost, LedgerReason::Refund,
                                       subject.ref(),
                                       std::string("Refund for ") + to_string(subject.kind()) + " " +
                                       std::to_string(subject.id));
    subject.refund_applied = true;
    tx.update_subject(subject);
    return entry;
}

std::optional<LedgerEntry> RefundPolicy::apply(const SubjectRef& ref) {
    auto tx = repo_.begin();
    tx->lock_subject(ref);
    auto subject = tx->find_subject(ref);
    if (!subject) {
        throw LedgerError(ErrorCode::NotFound, std::string("no ") + to_string(ref.kind) + " " + std::to_string(ref.id));
    }
    tx->lock_account(subject->owner_account_id);

    auto entry = apply(*tx, *subject);
    if (entry) tx->commit();
    return entry;
}

} // namespace atl
