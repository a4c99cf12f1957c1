#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <utility>
#include "test_support.hpp"

using namespace atl;
using atl::test::LedgerFixture;
using atl::test::RecordingAuditSink;

namespace {

// Forwards to a memory transaction but loses the connection at commit.
class CommitFailingTransaction : public storage::Transaction {
public:
    explicit CommitFailingTransaction(std::unique_ptr<storage::Transaction> inner) : inner_(std::move(inner)) {}

    void lock_account(AccountId id) override { inner_->lock_account(id); }
    void lock_subject(const SubjectRef& ref) override { inner_->lock_subject(ref); }
    std::optional<Account> find_account(AccountId id) override { return inner_->find_account(id); }
    Account insert_account(const std::string& username, Role role) override {
        return inner_->insert_account(username, role);
    }
    coin_t cached_balance(AccountId id) override { return inner_->cached_balance(id); }
    std::string last_seal(AccountId id) override { return inner_->last_seal(id); }
    LedgerEntry insert_entry(LedgerEntry entry) override { return inner_->insert_entry(entry); }
    bool has_entry_for(const SubjectRef& ref, LedgerReason reason) override {
        return inner_->has_entry_for(ref, reason);
    }
    std::vector<LedgerEntry> entries_ascending(AccountId id) override { return inner_->entries_ascending(id); }
    std::optional<ModeratedSubject> find_subject(const SubjectRef& ref) override { return inner_->find_subject(ref); }
    ModeratedSubject insert_subject(ModeratedSubject subject) override { return inner_->insert_subject(subject); }
    void update_subject(const ModeratedSubject& subject) override { inner_->update_subject(subject); }
    bool has_open_connection(AccountId requester, AccountId target) override {
        return inner_->has_open_connection(requester, target);
    }
    void commit() override { throw std::runtime_error("server closed the connection unexpectedly"); }

private:
    std::unique_ptr<storage::Transaction> inner_;
};

class CommitFailingRepository : public storage::MemoryRepository {
public:
    std::atomic<bool> fail_commits{false};

    std::unique_ptr<storage::Transaction> begin() override {
        auto inner = MemoryRepository::begin();
        if (!fail_commits.load()) return inner;
        return std::unique_ptr<storage::Transaction>(new CommitFailingTransaction(std::move(inner)));
    }
};

} // namespace

class ApprovalWorkflowTest : public LedgerFixture {
protected:
    bool notified(AccountId account, const std::string& kind) {
        auto kinds = notification_kinds(account);
        return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
    }
};

TEST(WorkflowRulesTest, TransitionTable) {
    EXPECT_TRUE(transition_allowed(SubjectKind::Post, SubjectStatus::Pending, SubjectStatus::Approved, Actor::Admin));
    EXPECT_TRUE(transition_allowed(SubjectKind::Post, SubjectStatus::Pending, SubjectStatus::Rejected, Actor::Admin));
    EXPECT_FALSE(transition_allowed(SubjectKind::Post, SubjectStatus::Approved, SubjectStatus::Rejected, Actor::Admin));
    EXPECT_FALSE(transition_allowed(SubjectKind::Post, SubjectStatus::Rejected, SubjectStatus::Approved, Actor::Admin));
    EXPECT_FALSE(transition_allowed(SubjectKind::Post, SubjectStatus::Pending, SubjectStatus::Cancelled, Actor::Owner));

    EXPECT_TRUE(transition_allowed(SubjectKind::UserProfile, SubjectStatus::Approved, SubjectStatus::Rejected,
                                   Actor::Admin));
    EXPECT_TRUE(transition_allowed(SubjectKind::UserProfile, SubjectStatus::Rejected, SubjectStatus::Pending,
                                   Actor::Owner));

    EXPECT_TRUE(transition_allowed(SubjectKind::ConnectionRequest, SubjectStatus::Pending, SubjectStatus::Cancelled,
                                   Actor::Owner));
    EXPECT_FALSE(transition_allowed(SubjectKind::ConnectionRequest, SubjectStatus::Approved,
                                    SubjectStatus::Cancelled, Actor::Owner));
    EXPECT_FALSE(transition_allowed(SubjectKind::TopupRequest, SubjectStatus::Approved, SubjectStatus::Rejected,
                                    Actor::Admin));

    EXPECT_TRUE(rules_for(SubjectKind::Post).coin_bearing);
    EXPECT_TRUE(rules_for(SubjectKind::TopupRequest).credits_on_approve);
    EXPECT_FALSE(rules_for(SubjectKind::UserProfile).coin_bearing);
}

TEST_F(ApprovalWorkflowTest, ApprovingAPostMovesNoCoins) {
    AccountId alice = make_user("alice", 10);
    SubjectRef post = *core_->create_post(alice, "t", "d").subject;

    Outcome outcome = core_->decide(post, Decision::Approved, admin_, "looks good");
    ASSERT_TRUE(outcome.ok) << outcome.message;
    EXPECT_EQ(8, core_->balance_of(alice));

    auto subject = core_->subject(post);
    EXPECT_EQ(SubjectStatus::Approved, subject->status);
    EXPECT_EQ(admin_, *subject->decided_by);
    EXPECT_GT(subject->decided_at, 0);
    EXPECT_EQ("looks good", subject->admin_note);
    EXPECT_TRUE(notified(alice, events::kPostApproved));
    EXPECT_EQ(1u, audit_.count("POST_APPROVED"));
}

TEST_F(ApprovalWorkflowTest, RejectingAPostRefundsItsCost) {
    AccountId alice = make_user("alice", 10);
    SubjectRef post = *core_->create_post(alice, "t", "d").subject;

    Outcome outcome = core_->decide(post, Decision::Rejected, admin_, "spam");
    ASSERT_TRUE(outcome.ok) << outcome.message;
    EXPECT_EQ(10, core_->balance_of(alice));

    auto subject = core_->subject(post);
    EXPECT_EQ(SubjectStatus::Rejected, subject->status);
    EXPECT_TRUE(subject->refund_applied);
    EXPECT_TRUE(notified(alice, events::kPostRejected));
    EXPECT_TRUE(notified(alice, events::kCoinsRefunded));

    auto records = audit_.records();
    ASSERT_FALSE(records.empty());
    EXPECT_EQ("POST_REJECTED", records.back().action);
    EXPECT_EQ("posts", records.back().entity);
    EXPECT_EQ(2, records.back().meta["refundedCoins"]);
}

TEST_F(ApprovalWorkflowTest, DecisionsAreFinalForPosts) {
    AccountId alice = make_user("alice", 10);
    SubjectRef post = *core_->create_post(alice, "t", "d").subject;
    ASSERT_TRUE(core_->decide(post, Decision::Rejected, admin_).ok);

    EXPECT_EQ(ErrorCode::AlreadyDecided, core_->decide(post, Decision::Rejected, admin_).code);
    EXPECT_EQ(ErrorCode::AlreadyDecided, core_->decide(post, Decision::Approved, admin_).code);
    EXPECT_EQ(10, core_->balance_of(alice));

    SubjectRef approved = *core_->create_post(alice, "t2", "d2").subject;
    ASSERT_TRUE(core_->decide(approved, Decision::Approved, admin_).ok);
    EXPECT_EQ(ErrorCode::AlreadyDecided, core_->decide(approved, Decision::Rejected, admin_).code);
    EXPECT_EQ(8, core_->balance_of(alice));

    EXPECT_EQ(1u, audit_.count("POST_REJECTED"));
    EXPECT_EQ(1u, audit_.count("POST_APPROVED"));
    EXPECT_EQ(2u, audit_.count("POST_REJECT_FAILED"));
    EXPECT_EQ(1u, audit_.count("POST_APPROVE_FAILED"));
}

TEST_F(ApprovalWorkflowTest, OnlyAdminsDecideAndEveryCallIsAudited) {
    AccountId alice = make_user("alice", 10);
    AccountId mallory = make_user("mallory", 0);
    SubjectRef post = *core_->create_post(alice, "t", "d").subject;
    const std::size_t before = audit_.records().size();

    Outcome outcome = core_->decide(post, Decision::Rejected, mallory);
    EXPECT_EQ(ErrorCode::Forbidden, outcome.code);
    EXPECT_EQ(SubjectStatus::Pending, core_->subject(post)->status);
    EXPECT_EQ(8, core_->balance_of(alice));

    auto records = audit_.records();
    ASSERT_EQ(before + 1, records.size());
    EXPECT_EQ("POST_REJECT_FAILED", records.back().action);
    EXPECT_FALSE(records.back().meta["ok"].get<bool>());
    EXPECT_EQ("Forbidden", records.back().meta["code"]);
}

TEST_F(ApprovalWorkflowTest, UnknownSubjectIsNotFound) {
    Outcome outcome = core_->decide(SubjectRef{SubjectKind::Post, 777}, Decision::Approved, admin_);
    EXPECT_EQ(ErrorCode::NotFound, outcome.code);
}

TEST_F(ApprovalWorkflowTest, ProfileApprovalCanBeRevokedAndResubmitted) {
    AccountId alice = make_user("alice", 10);
    SubjectRef profile{SubjectKind::UserProfile, alice};
    EXPECT_EQ(SubjectStatus::Approved, core_->subject(profile)->status);

    ASSERT_TRUE(core_->decide(profile, Decision::Rejected, admin_, "photo missing").ok);
    EXPECT_TRUE(notified(alice, events::kProfileRejected));
    EXPECT_EQ(ErrorCode::NotEligible, core_->create_post(alice, "t", "d").code);

    Outcome resubmitted = core_->resubmit_profile(alice);
    ASSERT_TRUE(resubmitted.ok) << resubmitted.message;
    auto subject = core_->subject(profile);
    EXPECT_EQ(SubjectStatus::Pending, subject->status);
    EXPECT_FALSE(subject->decided_by.has_value());

    Outcome again = core_->resubmit_profile(alice);
    EXPECT_TRUE(again.ok);
    EXPECT_EQ("already pending", again.message);

    ASSERT_TRUE(core_->decide(profile, Decision::Approved, admin_).ok);
    EXPECT_TRUE(core_->create_post(alice, "t", "d").ok);
}

TEST_F(ApprovalWorkflowTest, ResubmitChecksOwnerAndKind) {
    AccountId alice = make_user("alice", 10);
    AccountId bob = make_user("bob", 0);

    Outcome foreign = core_->workflow().resubmit(SubjectRef{SubjectKind::UserProfile, alice}, bob);
    EXPECT_EQ(ErrorCode::NotOwner, foreign.code);

    SubjectRef post = *core_->create_post(alice, "t", "d").subject;
    ASSERT_TRUE(core_->decide(post, Decision::Rejected, admin_).ok);
    EXPECT_EQ(ErrorCode::InvalidTarget, core_->workflow().resubmit(post, alice).code);
    EXPECT_EQ(SubjectStatus::Rejected, core_->subject(post)->status);
}

TEST_F(ApprovalWorkflowTest, RequesterCancelsPendingConnection) {
    AccountId alice = make_user("alice", 10);
    AccountId bob = make_user("bob", 0);
    SubjectRef request = *core_->send_connection(alice, bob).subject;
    EXPECT_EQ(5, core_->balance_of(alice));

    EXPECT_EQ(ErrorCode::NotOwner, core_->cancel_connection(request.id, bob).code);

    Outcome outcome = core_->cancel_connection(request.id, alice);
    ASSERT_TRUE(outcome.ok) << outcome.message;
    EXPECT_EQ(10, core_->balance_of(alice));
    EXPECT_EQ(SubjectStatus::Cancelled, core_->subject(request)->status);
    EXPECT_TRUE(core_->subject(request)->refund_applied);
    EXPECT_TRUE(notified(alice, events::kConnectionCancelled));
    EXPECT_EQ(1u, audit_.count("CONNECTION_CANCELLED"));
    EXPECT_EQ(1u, audit_.count("CONNECTION_CANCEL_FAILED"));

    EXPECT_EQ(ErrorCode::AlreadyDecided, core_->cancel_connection(request.id, alice).code);
    EXPECT_EQ(1u, audit_.count("CONNECTION_CANCELLED"));
    EXPECT_EQ(2u, audit_.count("CONNECTION_CANCEL_FAILED"));
    EXPECT_EQ(ErrorCode::AlreadyDecided, core_->decide(request, Decision::Rejected, admin_).code);
    EXPECT_EQ(10, core_->balance_of(alice));

    // A cancelled request no longer blocks a new one.
    EXPECT_TRUE(core_->send_connection(alice, bob).ok);
}

TEST_F(ApprovalWorkflowTest, ApprovedConnectionCannotBeCancelled) {
    AccountId alice = make_user("alice", 10);
    AccountId bob = make_user("bob", 0);
    SubjectRef request = *core_->send_connection(alice, bob).subject;
    ASSERT_TRUE(core_->decide(request, Decision::Approved, admin_).ok);

    EXPECT_EQ(ErrorCode::AlreadyDecided, core_->cancel_connection(request.id, alice).code);
    EXPECT_EQ(5, core_->balance_of(alice));
}

TEST_F(ApprovalWorkflowTest, OnlyConnectionsCanBeWithdrawn) {
    AccountId alice = make_user("alice", 10);
    SubjectRef post = *core_->create_post(alice, "t", "d").subject;

    EXPECT_EQ(ErrorCode::InvalidTarget, core_->workflow().cancel(post, alice).code);
    EXPECT_EQ(ErrorCode::NotFound, core_->cancel_connection(999, alice).code);
    EXPECT_EQ(8, core_->balance_of(alice));
}

TEST_F(ApprovalWorkflowTest, ApprovedConnectionNotifiesTargetWhenAcceptanceIsRequired) {
    AccountId alice = make_user("alice", 10);
    AccountId bob = make_user("bob", 0);
    SubjectRef request = *core_->send_connection(alice, bob).subject;
    ASSERT_TRUE(core_->decide(request, Decision::Approved, admin_).ok);

    EXPECT_TRUE(notified(alice, events::kConnectionApproved));
    EXPECT_TRUE(notified(bob, events::kConnectionRequestReceived));
    EXPECT_FALSE(notified(bob, events::kConnectionApproved));
}

TEST_F(ApprovalWorkflowTest, ApprovedConnectionNotifiesBothWithoutAcceptance) {
    config_.require_target_accept = false;
    rebuild();
    AccountId alice = make_user("alice", 10);
    AccountId bob = make_user("bob", 0);
    SubjectRef request = *core_->send_connection(alice, bob).subject;
    ASSERT_TRUE(core_->decide(request, Decision::Approved, admin_).ok);

    EXPECT_TRUE(notified(alice, events::kConnectionApproved));
    EXPECT_TRUE(notified(bob, events::kConnectionApproved));
    EXPECT_FALSE(notified(bob, events::kConnectionRequestReceived));
}

TEST_F(ApprovalWorkflowTest, RejectedConnectionRefundsRequester) {
    AccountId alice = make_user("alice", 10);
    AccountId bob = make_user("bob", 0);
    SubjectRef request = *core_->send_connection(alice, bob).subject;

    ASSERT_TRUE(core_->decide(request, Decision::Rejected, admin_).ok);
    EXPECT_EQ(10, core_->balance_of(alice));
    EXPECT_TRUE(notified(alice, events::kConnectionRejected));
    EXPECT_EQ(0, core_->balance_of(bob));
}

TEST_F(ApprovalWorkflowTest, TopupApprovalCreditsWholeCoins) {
    AccountId alice = make_user("alice", 0);
    SubjectRef topup = *core_->request_topup(alice, 5500).subject;

    Outcome outcome = core_->decide(topup, Decision::Approved, admin_);
    ASSERT_TRUE(outcome.ok) << outcome.message;
    EXPECT_EQ(5, core_->balance_of(alice));

    auto subject = core_->subject(topup);
    EXPECT_EQ(5, std::get<TopupDetails>(subject->details).computed_coins);

    HistoryPage history = core_->history(alice, PageRequest());
    ASSERT_EQ(1u, history.entries.size());
    EXPECT_EQ(LedgerReason::Topup, history.entries[0].reason);
    EXPECT_EQ(topup, *history.entries[0].reference);
    EXPECT_TRUE(notified(alice, events::kTopupApproved));

    EXPECT_EQ(ErrorCode::AlreadyDecided, core_->decide(topup, Decision::Approved, admin_).code);
    EXPECT_EQ(5, core_->balance_of(alice));
}

TEST_F(ApprovalWorkflowTest, TopupBelowOneCoinApprovesWithoutEntry) {
    AccountId alice = make_user("alice", 0);
    SubjectRef topup = *core_->request_topup(alice, 999).subject;

    ASSERT_TRUE(core_->decide(topup, Decision::Approved, admin_).ok);
    EXPECT_EQ(SubjectStatus::Approved, core_->subject(topup)->status);
    EXPECT_EQ(0, core_->balance_of(alice));
    EXPECT_TRUE(core_->history(alice, PageRequest()).entries.empty());
}

TEST_F(ApprovalWorkflowTest, TopupRejectionMovesNoCoins) {
    AccountId alice = make_user("alice", 0);
    SubjectRef topup = *core_->request_topup(alice, 5000).subject;

    ASSERT_TRUE(core_->decide(topup, Decision::Rejected, admin_, "no receipt").ok);
    EXPECT_EQ(0, core_->balance_of(alice));
    EXPECT_TRUE(notified(alice, events::kTopupRejected));
    EXPECT_EQ(1u, audit_.count("TOPUP_REJECTED"));
}

TEST_F(ApprovalWorkflowTest, RejectionKeepsChargeWhenRefundsAreDisabled) {
    config_.allow_refunds = false;
    rebuild();
    AccountId alice = make_user("alice", 10);
    SubjectRef post = *core_->create_post(alice, "t", "d").subject;

    ASSERT_TRUE(core_->decide(post, Decision::Rejected, admin_).ok);
    EXPECT_EQ(8, core_->balance_of(alice));
    EXPECT_FALSE(core_->subject(post)->refund_applied);
    EXPECT_FALSE(notified(alice, events::kCoinsRefunded));
}

TEST(ApprovalWorkflowCommitTest, FailedCommitLeavesNoRefundOrCreditInTheAudit) {
    CommitFailingRepository repo;
    Config config;
    config.store = "memory";
    RecordingAuditSink audit;
    LedgerCore core(repo, config, audit);

    AccountId admin = core.register_account("admin", Role::Admin).subject->id;
    Outcome registered = core.register_account("alice");
    ASSERT_TRUE(registered.ok) << registered.message;
    AccountId alice = registered.subject->id;
    ASSERT_TRUE(core.decide(*registered.subject, Decision::Approved, admin).ok);
    core.ledger().append(alice, 10, LedgerReason::Topup, std::nullopt, "opening balance");

    SubjectRef post = *core.create_post(alice, "t", "d").subject;
    SubjectRef topup = *core.request_topup(alice, 5000).subject;
    repo.fail_commits = true;

    Outcome rejected = core.decide(post, Decision::Rejected, admin);
    EXPECT_EQ(ErrorCode::StoreBusy, rejected.code);
    auto records = audit.records();
    ASSERT_FALSE(records.empty());
    EXPECT_EQ("POST_REJECT_FAILED", records.back().action);
    EXPECT_FALSE(records.back().meta.contains("refundedCoins"));

    Outcome approved = core.decide(topup, Decision::Approved, admin);
    EXPECT_EQ(ErrorCode::StoreBusy, approved.code);
    records = audit.records();
    EXPECT_EQ("TOPUP_APPROVE_FAILED", records.back().action);
    EXPECT_FALSE(records.back().meta.contains("coins"));

    EXPECT_EQ(8, core.balance_of(alice));
    EXPECT_EQ(SubjectStatus::Pending, core.subject(post)->status);
    EXPECT_EQ(SubjectStatus::Pending, core.subject(topup)->status);
}
