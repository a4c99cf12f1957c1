/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: ApprovalWorkflow.hpp
 * ============================================================================
 * * DESCRIPTION:
 * One state machine for every moderated subject. The variants share the
 * PENDING -> APPROVED | REJECTED shape and differ only through their row in
 * the rule table:
 *
 *   kind                coin-bearing  owner cancel  reopenable  revocable  credits
 *   USER_PROFILE        no            no            yes         yes        no
 *   POST                yes           no            no          no         no
 *   CONNECTION_REQUEST  yes           yes           no          no         no
 *   TOPUP_REQUEST       no            no            no          no         yes
 *
 * Status change, refund or top-up credit, and subject update commit together.
 * Notifications and the audit record follow the commit.
 * ============================================================================
 */

#ifndef ATL_APPROVAL_WORKFLOW_HPP
#define ATL_APPROVAL_WORKFLOW_HPP

#include <optional>
#include <string>
#include "atl_types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "NotificationEmitter.hpp"
#include "RefundPolicy.hpp"
#include "../plugins/interface/atl_sink.hpp"
#include "../storage/Repository.hpp"

namespace atl {

enum class Actor { Admin, Owner };

struct WorkflowRules {
    bool coin_bearing = false;        // rejection and cancellation go through RefundPolicy
    bool owner_may_cancel = false;    // PENDING -> CANCELLED by the owner
    bool reopenable = false;          // owner resubmission returns to PENDING
    bool approved_revocable = false;  // admin may reject after approving
    bool credits_on_approve = false;  // approval appends a TOPUP credit
};

const WorkflowRules& rules_for(SubjectKind kind);

bool transition_allowed(SubjectKind kind, SubjectStatus from, SubjectStatus to, Actor actor);

class ApprovalWorkflow {
public:
    ApprovalWorkflow(storage::Repository& repo, LedgerStore& ledger, RefundPolicy& refunds,
                     NotificationEmitter& notifier, IAuditSink& audit, const Config& config);

    /**
     * decide
     * Administrative approve or reject. Rejecting a coin-bearing subject
     * refunds its cost in the same unit (unless refunds are disabled);
     * approving a top-up credits the computed coins in the same unit.
     * Failures: Forbidden (not an admin), NotFound, AlreadyDecided.
     * Emits exactly one audit record, successful or not; a failed call is
     * recorded as <KIND>_APPROVE_FAILED or <KIND>_REJECT_FAILED.
     */
    Outcome decide(const SubjectRef& ref, Decision decision, AccountId admin_id, const std::string& note = "");

    /**
     * cancel
     * Requester withdraws a PENDING connection request; refunds like a
     * rejection. Failures: NotFound, NotOwner, AlreadyDecided, InvalidTarget
     * for subject kinds that cannot be withdrawn. Emits one audit record,
     * CONNECTION_CANCELLED or CONNECTION_CANCEL_FAILED.
     */
    Outcome cancel(const SubjectRef& ref, AccountId requester_id);

    /**
     * resubmit
     * Owner edited their profile: APPROVED or REJECTED goes back to PENDING.
     * Only UserProfile subjects re-enter PENDING.
     */
    Outcome resubmit(const SubjectRef& ref, AccountId owner_id);

private:
    std::optional<LedgerEntry> credit_topup(storage::Transaction& tx, ModeratedSubject& subject);
    void notify_decision(const ModeratedSubject& subject, Decision decision,
                         const std::optional<LedgerEntry>& refund, const std::optional<LedgerEntry>& credit);
    void notify_refund(const ModeratedSubject& subject, const LedgerEntry& refund);

    storage::Repository& repo_;
    LedgerStore& ledger_;
    RefundPolicy& refunds_;
    NotificationEmitter& notifier_;
    IAuditSink& audit_;
    const Config& config_;
};

} // namespace atl

#endif // ATL_APPROVAL_WORKFLOW_HPP
