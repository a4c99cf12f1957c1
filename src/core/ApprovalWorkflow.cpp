#include "ApprovalWorkflow.hpp"
#include "logging.hpp"

namespace atl {

namespace {

WorkflowRules make_rules(bool coin_bearing, bool owner_may_cancel, bool reopenable, bool approved_revocable,
                         bool credits_on_approve) {
    WorkflowRules rules;
    rules.coin_bearing = coin_bearing;
    rules.owner_may_cancel = owner_may_cancel;
    rules.reopenable = reopenable;
    rules.approved_revocable = approved_revocable;
    rules.credits_on_approve = credits_on_approve;
    return rules;
}

const WorkflowRules kProfileRules = make_rules(false, false, true, true, false);
const WorkflowRules kPostRules = make_rules(true, false, false, false, false);
const WorkflowRules kConnectionRules = make_rules(true, true, false, false, false);
const WorkflowRules kTopupRules = make_rules(false, false, false, false, true);

std::string audit_action(SubjectKind kind, const char* verb) {
    switch (kind) {
        case SubjectKind::UserProfile: return std::string("USER_") + verb;
        case SubjectKind::Post: return std::string("POST_") + verb;
        case SubjectKind::ConnectionRequest: return std::string("CONNECTION_") + verb;
        case SubjectKind::TopupRequest: return std::string("TOPUP_") + verb;
    }
    return verb;
}

std::string describe(const SubjectRef& ref) {
    return std::string(to_string(ref.kind)) + " " + std::to_string(ref.id);
}

} // namespace

const WorkflowRules& rules_for(SubjectKind kind) {
    switch (kind) {
        case SubjectKind::UserProfile: return kProfileRules;
        case SubjectKind::Post: return kPostRules;
        case SubjectKind::ConnectionRequest: return kConnectionRules;
        case SubjectKind::TopupRequest: return kTopupRules;
    }
    return kPostRules;
}

bool transition_allowed(SubjectKind kind, SubjectStatus from, SubjectStatus to, Actor actor) {
    const WorkflowRules& rules = rules_for(kind);

    if (actor == Actor::Admin) {
        if (from == SubjectStatus::Pending) {
            return to == SubjectStatus::Approved || to == SubjectStatus::Rejected;
        }
        return rules.approved_revocable && from == SubjectStatus::Approved && to == SubjectStatus::Rejected;
    }

    if (to == SubjectStatus::Cancelled) {
        return rules.owner_may_cancel && from == SubjectStatus::Pending;
    }
    if (to == SubjectStatus::Pending) {
        return rules.reopenable && from != SubjectStatus::Cancelled;
    }
    return false;
}

ApprovalWorkflow::ApprovalWorkflow(storage::Repository& repo, LedgerStore& ledger, RefundPolicy& refunds,
                                   NotificationEmitter& notifier, IAuditSink& audit, const Config& config)
    : repo_(repo), ledger_(ledger), refunds_(refunds), notifier_(notifier), audit_(audit), config_(config) {}

Outcome ApprovalWorkflow::decide(const SubjectRef& ref, Decision decision, AccountId admin_id, const std::string& note) {
    const SubjectStatus target = decision == Decision::Approved ? SubjectStatus::Approved : SubjectStatus::Rejected;
    const std::string operation = std::string("decide ") + to_string(decision) + " on " + describe(ref);

    std::optional<ModeratedSubject> decided;
    std::optional<LedgerEntry> refund;
    std::optional<LedgerEntry> credit;

    Outcome outcome = guarded(operation, [&]() -> Outcome {
        auto tx = repo_.begin();

        auto admin = tx->find_account(admin_id);
        if (!admin || admin->role != Role::Admin) {
            throw LedgerError(ErrorCode::Forbidden, "account " + std::to_string(admin_id) + " is not an administrator");
        }

        tx->lock_subject(ref);
        auto subject = tx->find_subject(ref);
        if (!subject) {
            throw LedgerError(ErrorCode::NotFound, describe(ref) + " does not exist");
        }
        if (!transition_allowed(ref.kind, subject->status, target, Actor::Admin)) {
            throw LedgerError(ErrorCode::AlreadyDecided,
                              describe(ref) + " is " + to_string(subject->status) + ", cannot become " + to_string(target));
        }
        tx->lock_account(subject->owner_account_id);

        subject->status = target;
        subject->decided_at = unix_now();
        subject->decided_by = admin_id;
        subject->admin_note = note;

        const WorkflowRules& rules = rules_for(ref.kind);
        std::optional<LedgerEntry> refunded;
        std::optional<LedgerEntry> credited;
        if (target == SubjectStatus::Rejected && rules.coin_bearing) {
            refunded = refunds_.apply(*tx, *subject);
        }
        if (target == SubjectStatus::Approved && rules.credits_on_approve) {
            credited = credit_topup(*tx, *subject);
        }

        tx->update_subject(*subject);
        tx->commit();
        decided = subject;
        refund = refunded;
        credit = credited;
        return Outcome::success(ref);
    });

    AuditRecord record;
    record.admin_id = admin_id;
    const char* verb = decision == Decision::Approved ? "APPROVE_FAILED" : "REJECT_FAILED";
    record.action = audit_action(ref.kind, outcome.ok ? to_string(decision) : verb);
    record.entity = entity_name(ref.kind);
    record.entity_id = ref.id;
    record.meta = {{"note", note}, {"ok", outcome.ok}, {"code", to_string(outcome.code)}};
    if (refund) record.meta["refundedCoins"] = refund->delta;
    if (credit) record.meta["coins"] = credit->delta;
    record.created_at = unix_now();
    audit_.record(record);

    if (outcome.ok) {
        notify_decision(*decided, decision, refund, credit);
    }
    return outcome;
}

Outcome ApprovalWorkflow::cancel(const SubjectRef& ref, AccountId requester_id) {
    const std::string operation = "cancel " + describe(ref) + " by account " + std::to_string(requester_id);

    std::optional<ModeratedSubject> cancelled;
    std::optional<LedgerEntry> refund;

    Outcome outcome = guarded(operation, [&]() -> Outcome {
        auto tx = repo_.begin();
        tx->lock_subject(ref);
        auto subject = tx->find_subject(ref);
        if (!subject) {
            throw LedgerError(ErrorCode::NotFound, describe(ref) + " does not exist");
        }
        if (subject->owner_account_id != requester_id) {
            throw LedgerError(ErrorCode::NotOwner, describe(ref) + " belongs to another account");
        }
        if (!rules_for(ref.kind).owner_may_cancel) {
            throw LedgerError(ErrorCode::InvalidTarget, std::string(to_string(ref.kind)) + " cannot be withdrawn");
        }
        if (!transition_allowed(ref.kind, subject->status, SubjectStatus::Cancelled, Actor::Owner)) {
            throw LedgerError(ErrorCode::AlreadyDecided, describe(ref) + " is already " + to_string(subject->status));
        }
        tx->lock_account(subject->owner_account_id);

        subject->status = SubjectStatus::Cancelled;
        subject->decided_at = unix_now();
        subject->decided_by = requester_id;

        std::optional<LedgerEntry> refunded;
        if (rules_for(ref.kind).coin_bearing) {
            refunded = refunds_.apply(*tx, *subject);
        }

        tx->update_subject(*subject);
        tx->commit();
        cancelled = subject;
        refund = refunded;
        return Outcome::success(ref);
    });

    AuditRecord record;
    record.admin_id = requester_id;
    record.action = audit_action(ref.kind, outcome.ok ? "CANCELLED" : "CANCEL_FAILED");
    record.entity = entity_name(ref.kind);
    record.entity_id = ref.id;
    record.meta = {{"ok", outcome.ok}, {"code", to_string(outcome.code)}};
    if (refund) record.meta["refundedCoins"] = refund->delta;
    record.created_at = unix_now();
    audit_.record(record);

    if (outcome.ok) {
        json payload = {{"requestId", ref.id}, {"refundedCoins", refund ? refund->delta : 0}};
        notifier_.emit(requester_id, events::kConnectionCancelled, payload);
        if (refund) notify_refund(*cancelled, *refund);
    }
    return outcome;
}

Outcome ApprovalWorkflow::resubmit(const SubjectRef& ref, AccountId owner_id) {
    const std::string operation = "resubmit " + describe(ref);

    return guarded(operation, [&]() -> Outcome {
        if (!rules_for(ref.kind).reopenable) {
            throw LedgerError(ErrorCode::InvalidTarget, std::string(to_string(ref.kind)) + " cannot be resubmitted");
        }

        auto tx = repo_.begin();
        tx->lock_subject(ref);
        auto subject = tx->find_subject(ref);
        if (!subject) {
            throw LedgerError(ErrorCode::NotFound, describe(ref) + " does not exist");
        }
        if (subject->owner_account_id != owner_id) {
            throw LedgerError(ErrorCode::NotOwner, describe(ref) + " belongs to another account");
        }
        if (subject->status == SubjectStatus::Pending) {
            return Outcome::success(ref, "already pending");
        }
        if (!transition_allowed(ref.kind, subject->status, SubjectStatus::Pending, Actor::Owner)) {
            throw LedgerError(ErrorCode::AlreadyDecided, describe(ref) + " is " + to_string(subject->status));
        }

        subject->status = SubjectStatus::Pending;
        subject->decided_at = 0;
        subject->decided_by.reset();
        tx->update_subject(*subject);
        tx->commit();

        atl_log("INFO", describe(ref) + " resubmitted for review");
        return Outcome::success(ref);
    });
}

std::optional<LedgerEntry> ApprovalWorkflow::credit_topup(storage::Transaction& tx, ModeratedSubject& subject) {
    auto* topup = std::get_if<TopupDetails>(&subject.details);
    if (topup == nullptr) {
        throw LedgerError(ErrorCode::DomainEffectFailed, "top-up subject without top-up details");
    }

    int64_t price = topup->price_per_coin_laari > 0 ? topup->price_per_coin_laari : config_.coin_price_laari;
    topup->computed_coins = topup->amount_laari / price;
    if (topup->computed_coins <= 0) {
        atl_log("WARN", "Top-up " + std::to_string(subject.id) + " approved for less than one coin");
        return std::nullopt;
    }

    return ledger_.append(tx, subject.owner_account_id, topup->computed_coins, LedgerReason::Topup, subject.ref(),
                          "Coin topup approved - " + std::to_string(topup->amount_laari) + " laari");
}

void ApprovalWorkflow::notify_decision(const ModeratedSubject& subject, Decision decision,
                                       const std::optional<LedgerEntry>& refund,
                                       const std::optional<LedgerEntry>& credit) {
    const bool approved = decision == Decision::Approved;
    const AccountId owner = subject.owner_account_id;
    json payload = {{"note", subject.admin_note}};

    switch (subject.kind()) {
        case SubjectKind::UserProfile:
            notifier_.emit(owner, approved ? events::kProfileApproved : events::kProfileRejected, payload);
            break;
        case SubjectKind::Post:
            payload["postId"] = subject.id;
            payload["refundedCoins"] = refund ? refund->delta : 0;
            notifier_.emit(owner, approved ? events::kPostApproved : events::kPostRejected, payload);
            break;
        case SubjectKind::ConnectionRequest: {
            const auto& connection = std::get<ConnectionDetails>(subject.details);
            payload["requestId"] = subject.id;
            payload["targetUserId"] = connection.target_account_id;
            if (!approved) {
                payload["refundedCoins"] = refund ? refund->delta : 0;
                notifier_.emit(owner, events::kConnectionRejected, payload);
            } else if (config_.require_target_accept) {
                payload["awaitingTarget"] = true;
                notifier_.emit(owner, events::kConnectionApproved, payload);
                notifier_.emit(connection.target_account_id, events::kConnectionRequestReceived,
                               {{"requestId", subject.id}, {"requesterId", owner}});
            } else {
                payload["awaitingTarget"] = false;
                notifier_.emit(owner, events::kConnectionApproved, payload);
                notifier_.emit(connection.target_account_id, events::kConnectionApproved,
                               {{"requestId", subject.id}, {"requesterId", owner}, {"awaitingTarget", false}});
            }
            break;
        }
        case SubjectKind::TopupRequest:
            payload["topupId"] = subject.id;
            payload["coins"] = credit ? credit->delta : 0;
            notifier_.emit(owner, approved ? events::kTopupApproved : events::kTopupRejected, payload);
            break;
    }

    if (refund) notify_refund(subject, *refund);
}

void ApprovalWorkflow::notify_refund(const ModeratedSubject& subject, const LedgerEntry& refund) {
    notifier_.emit(subject.owner_account_id, events::kCoinsRefunded, {
        {"coins", refund.delta},
        {"refKind", to_string(subject.kind())},
        {"refId", subject.id}
    });
}

} // namespace atl
