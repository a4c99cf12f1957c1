#include "ActionGate.hpp"
#include "logging.hpp"

namespace atl {

const char* to_string(ActionKind action) {
    switch (action) {
        case ActionKind::CreatePost: return "CREATE_POST";
        case ActionKind::SendConnection: return "SEND_CONNECTION";
        case ActionKind::RequestTopup: return "REQUEST_TOPUP";
    }
    return "CREATE_POST";
}

ActionGate::ActionGate(storage::Repository& repo, LedgerStore& ledger, NotificationEmitter& notifier)
    : repo_(repo), ledger_(ledger), notifier_(notifier) {}

LedgerReason ActionGate::reason_for(ActionKind action) {
    switch (action) {
        case ActionKind::CreatePost: return LedgerReason::Post;
        case ActionKind::SendConnection: return LedgerReason::Connect;
        case ActionKind::RequestTopup: return LedgerReason::Topup;
    }
    return LedgerReason::Adjust;
}

SubjectKind ActionGate::kind_for(ActionKind action) {
    switch (action) {
        case ActionKind::CreatePost: return SubjectKind::Post;
        case ActionKind::SendConnection: return SubjectKind::ConnectionRequest;
        case ActionKind::RequestTopup: return SubjectKind::TopupRequest;
    }
    return SubjectKind::Post;
}

bool ActionGate::requires_approved_profile(ActionKind action) {
    return action == ActionKind::CreatePost || action == ActionKind::SendConnection;
}

void ActionGate::check_eligibility(storage::Transaction& tx, AccountId account_id, ActionKind action,
                                   std::optional<AccountId> target) const {
    if (requires_approved_profile(action)) {
        auto profile = tx.find_subject(SubjectRef{SubjectKind::UserProfile, account_id});
        if (!profile || profile->status != SubjectStatus::Approved) {
            throw LedgerError(ErrorCode::NotEligible,
                              "profile of account " + std::to_string(account_id) + " is not approved");
        }
    }

    if (action == ActionKind::SendConnection) {
        if (!target || *target == account_id) {
            throw LedgerError(ErrorCode::InvalidTarget, "connection request needs another account as target");
        }
        if (!tx.find_account(*target)) {
            throw LedgerError(ErrorCode::InvalidTarget, "target account " + std::to_string(*target) + " does not exist");
        }
    }
}

Outcome ActionGate::attempt(AccountId account_id, ActionKind action, coin_t cost, const DomainEffect& effect,
                            std::optional<AccountId> target) {
    const std::string operation = std::string(to_string(action)) + " by account " + std::to_string(account_id);
    coin_t charged = 0;

    Outcome outcome = guarded(operation, [&]() -> Outcome {
        if (cost < 0) {
            throw LedgerError(ErrorCode::InvalidDelta, "action cost must not be negative");
        }

        auto tx = repo_.begin();
        tx->lock_account(account_id);
        if (!tx->find_account(account_id)) {
            throw LedgerError(ErrorCode::NotFound, "account " + std::to_string(account_id) + " does not exist");
        }

        check_eligibility(*tx, account_id, action, target);

        coin_t balance = tx->cached_balance(account_id);
        if (balance < cost) {
            throw LedgerError(ErrorCode::InsufficientBalance,
                              "balance " + std::to_string(balance) + " below cost " + std::to_string(cost));
        }

        ModeratedSubject subject;
        try {
            subject = effect(*tx);
            subject.owner_account_id = account_id;
            subject.status = SubjectStatus::Pending;
            subject.coin_cost = cost;
            subject.refund_applied = false;
            subject.created_at = unix_now();
            subject.decided_at = 0;
            subject.decided_by.reset();
            subject.admin_note.clear();
            if (subject.kind() != kind_for(action)) {
                throw LedgerError(ErrorCode::DomainEffectFailed,
                                  std::string("effect built a ") + to_string(subject.kind()) + " for " + to_string(action));
            }
            subject = tx->insert_subject(subject);
        } catch (const LedgerError&) {
            throw;
        } catch (const std::exception& e) {
            throw LedgerError(ErrorCode::DomainEffectFailed, e.what());
        }

        if (cost > 0) {
            ledger_.append(*tx, account_id, -cost, reason_for(action), subject.ref(),
                           std::string("Charged for ") + to_string(subject.kind()) + " " + std::to_string(subject.id));
        }

        tx->commit();
        charged = cost;
        atl_log("INFO", operation + " created " + to_string(subject.kind()) + " " + std::to_string(subject.id) +
                " for " + std::to_string(cost) + " coins");
        return Outcome::success(subject.ref());
    });

    if (outcome.ok && charged > 0) {
        notifier_.emit(account_id, events::kCoinsDebited, {
            {"coins", charged},
            {"refKind", to_string(outcome.subject->kind)},
            {"refId", outcome.subject->id}
        });
    }
    return outcome;
}

} // namespace atl
