#include "LedgerCore.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace atl {

namespace {

const std::size_t kMaxTitleLength = 120;

} // namespace

LedgerCore::LedgerCore(storage::Repository& repo, const Config& config, IAuditSink& audit,
                       plugins::SinkManager* sinks)
    : repo_(repo),
      config_(config),
      audit_(audit),
      ledger_(repo),
      notifier_(repo, sinks),
      refunds_(repo, ledger_, config_.allow_refunds),
      gate_(repo, ledger_, notifier_),
      workflow_(repo, ledger_, refunds_, notifier_, audit, config_) {}

Outcome LedgerCore::register_account(const std::string& username, Role role) {
    return guarded("register " + username, [&]() -> Outcome {
        if (username.empty()) {
            throw LedgerError(ErrorCode::DomainEffectFailed, "username must not be empty");
        }

        auto tx = repo_.begin();
        Account account = tx->insert_account(username, role);

        ModeratedSubject profile;
        profile.owner_account_id = account.id;
        profile.status = SubjectStatus::Pending;
        profile.created_at = account.created_at;
        profile.details = ProfileDetails{username};
        profile = tx->insert_subject(profile);

        tx->commit();
        atl_log("INFO", "Registered account " + std::to_string(account.id) + " (" + username + ")");
        return Outcome::success(profile.ref());
    });
}

Outcome LedgerCore::create_post(AccountId account_id, const std::string& title, const std::string& description) {
    return gate_.attempt(account_id, ActionKind::CreatePost, config_.cost_post,
                         [&](storage::Transaction&) {
                             if (description.empty()) {
                                 throw std::invalid_argument("post description must not be empty");
                             }
                             if (title.size() > kMaxTitleLength) {
                                 throw std::invalid_argument("post title longer than 120 characters");
                             }
                             ModeratedSubject post;
                             post.details = PostDetails{title, description};
                             return post;
                         });
}

Outcome LedgerCore::send_connection(AccountId requester_id, AccountId target_id, std::optional<SubjectId> post_id) {
    return gate_.attempt(requester_id, ActionKind::SendConnection, config_.cost_connect,
                         [&](storage::Transaction& tx) {
                             if (post_id) {
                                 auto post = tx.find_subject(SubjectRef{SubjectKind::Post, *post_id});
                                 if (!post || post->owner_account_id != target_id) {
                                     throw LedgerError(ErrorCode::InvalidTarget,
                                                       "post " + std::to_string(*post_id) + " does not belong to the target");
                                 }
                             }
                             ConnectionDetails connection;
                             connection.target_account_id = target_id;
                             connection.post_id = post_id;
                             ModeratedSubject request;
                             request.details = connection;
                             return request;
                         },
                         target_id);
}

Outcome LedgerCore::request_topup(AccountId account_id, int64_t amount_laari) {
    if (amount_laari <= 0) {
        return Outcome::failure(ErrorCode::InvalidDelta, "Top-up amount must be positive.");
    }

    const int64_t price = config_.coin_price_laari;
    return gate_.attempt(account_id, ActionKind::RequestTopup, 0,
                         [&](storage::Transaction&) {
                             TopupDetails topup;
                             topup.amount_laari = amount_laari;
                             topup.price_per_coin_laari = price;
                             ModeratedSubject request;
                             request.details = topup;
                             return request;
                         });
}

Outcome LedgerCore::decide(const SubjectRef& ref, Decision decision, AccountId admin_id, const std::string& note) {
    return workflow_.decide(ref, decision, admin_id, note);
}

Outcome LedgerCore::cancel_connection(SubjectId request_id, AccountId requester_id) {
    return workflow_.cancel(SubjectRef{SubjectKind::ConnectionRequest, request_id}, requester_id);
}

Outcome LedgerCore::resubmit_profile(AccountId account_id) {
    return workflow_.resubmit(SubjectRef{SubjectKind::UserProfile, account_id}, account_id);
}

Outcome LedgerCore::adjust(AccountId account_id, coin_t delta, AccountId admin_id, const std::string& note) {
    const std::string operation = "adjust account " + std::to_string(account_id) + " by " + std::to_string(delta);

    Outcome outcome = guarded(operation, [&]() -> Outcome {
        auto tx = repo_.begin();
        auto admin = tx->find_account(admin_id);
        if (!admin || admin->role != Role::Admin) {
            throw LedgerError(ErrorCode::Forbidden, "account " + std::to_string(admin_id) + " is not an administrator");
        }
        ledger_.append(*tx, account_id, delta, LedgerReason::Adjust, std::nullopt,
                       note.empty() ? std::string("Balance adjusted by administrator") : note);
        tx->commit();
        return Outcome::success();
    });

    AuditRecord record;
    record.admin_id = admin_id;
    record.action = outcome.ok ? "BALANCE_ADJUSTED" : "BALANCE_ADJUST_FAILED";
    record.entity = "users";
    record.entity_id = account_id;
    record.meta = {{"delta", delta}, {"note", note}, {"ok", outcome.ok}, {"code", to_string(outcome.code)}};
    record.created_at = unix_now();
    audit_.record(record);

    if (outcome.ok) {
        notifier_.emit(account_id, events::kBalanceAdjusted, {{"delta", delta}, {"note", note}});
    }
    return outcome;
}

} // namespace atl
