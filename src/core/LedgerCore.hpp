/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: LedgerCore.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Owns and wires the core components over one Repository and exposes the
 * operations the surrounding application calls: account registration, the
 * three user actions, admin decisions, withdrawal, resubmission, manual
 * adjustment and the read side.
 * ============================================================================
 */

#ifndef ATL_LEDGER_CORE_HPP
#define ATL_LEDGER_CORE_HPP

#include <optional>
#include <string>
#include <vector>
#include "ActionGate.hpp"
#include "ApprovalWorkflow.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "NotificationEmitter.hpp"
#include "RefundPolicy.hpp"
#include "../plugins/interface/atl_sink.hpp"
#include "../storage/Repository.hpp"

namespace atl {

class LedgerCore {
public:
    LedgerCore(storage::Repository& repo, const Config& config, IAuditSink& audit,
               plugins::SinkManager* sinks = nullptr);

    // New account plus its PENDING profile. Outcome.subject is the profile.
    Outcome register_account(const std::string& username, Role role = Role::User);

    Outcome create_post(AccountId account_id, const std::string& title, const std::string& description);
    Outcome send_connection(AccountId requester_id, AccountId target_id,
                            std::optional<SubjectId> post_id = std::nullopt);
    Outcome request_topup(AccountId account_id, int64_t amount_laari);

    Outcome decide(const SubjectRef& ref, Decision decision, AccountId admin_id, const std::string& note = "");
    Outcome cancel_connection(SubjectId request_id, AccountId requester_id);
    Outcome resubmit_profile(AccountId account_id);

    /**
     * adjust
     * Admin correction with reason ADJUST. Debits obey the non-negative rule.
     * Emits one audit record (BALANCE_ADJUST_FAILED when refused) and, on
     * success, a BALANCE_ADJUSTED notification.
     */
    Outcome adjust(AccountId account_id, coin_t delta, AccountId admin_id, const std::string& note);

    coin_t balance_of(AccountId account_id) const { return ledger_.balance_of(account_id); }
    HistoryPage history(AccountId account_id, const PageRequest& page) const { return ledger_.history(account_id, page); }
    ReconcileReport reconcile(AccountId account_id) const { return ledger_.reconcile(account_id); }

    std::optional<ModeratedSubject> subject(const SubjectRef& ref) const { return repo_.subject(ref); }
    std::optional<Account> account(AccountId id) const { return repo_.account(id); }

    // Owner views: every status, newest first.
    std::vector<ModeratedSubject> subjects_of(AccountId owner, SubjectKind kind) const {
        return repo_.subjects_of(owner, kind);
    }
    std::vector<ModeratedSubject> connections_to(AccountId target) const { return repo_.connections_to(target); }

    // Public feed.
    std::vector<ModeratedSubject> approved_posts(std::size_t limit, std::size_t offset) const {
        return repo_.subjects(SubjectKind::Post, SubjectStatus::Approved, limit, offset);
    }

    LedgerStore& ledger() { return ledger_; }
    ActionGate& gate() { return gate_; }
    ApprovalWorkflow& workflow() { return workflow_; }
    RefundPolicy& refunds() { return refunds_; }
    NotificationEmitter& notifications() { return notifier_; }
    const Config& config() const { return config_; }

private:
    storage::Repository& repo_;
    const Config config_;
    IAuditSink& audit_;
    LedgerStore ledger_;
    NotificationEmitter notifier_;
    RefundPolicy refunds_;
    ActionGate gate_;
    ApprovalWorkflow workflow_;
};

} // namespace atl

#endif // ATL_LEDGER_CORE_HPP
