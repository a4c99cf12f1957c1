#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "test_support.hpp"

using namespace atl;
using atl::test::LedgerFixture;

class ConcurrencyTest : public LedgerFixture {
protected:
    // Runs `body(i)` on `n` threads released together.
    template <typename Body>
    void race(int n, Body body) {
        std::atomic<bool> go(false);
        std::vector<std::thread> threads;
        for (int i = 0; i < n; ++i) {
            threads.emplace_back([&, i] {
                while (!go.load()) std::this_thread::yield();
                body(i);
            });
        }
        go.store(true);
        for (auto& t : threads) t.join();
    }

    std::size_t refunds_for(AccountId owner, const SubjectRef& ref) {
        std::size_t n = 0;
        PageRequest page;
        page.limit = 1000;
        for (const auto& entry : core_->history(owner, page).entries) {
            if (entry.reason == LedgerReason::Refund && entry.reference && *entry.reference == ref) ++n;
        }
        return n;
    }
};

TEST_F(ConcurrencyTest, TwoChargesAgainstOneBalanceOnlyOneWins) {
    AccountId alice = make_user("alice", 3);
    std::vector<Outcome> outcomes(2);

    race(2, [&](int i) { outcomes[i] = core_->create_post(alice, "t", "d"); });

    int succeeded = 0;
    int refused = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.ok) ++succeeded;
        if (outcome.code == ErrorCode::InsufficientBalance) ++refused;
    }
    EXPECT_EQ(1, succeeded);
    EXPECT_EQ(1, refused);
    EXPECT_EQ(1, core_->balance_of(alice));
    EXPECT_EQ(1u, repo_->subjects_of(alice, SubjectKind::Post).size());
}

TEST_F(ConcurrencyTest, RacingRejectionsRefundOnce) {
    AccountId alice = make_user("alice", 10);
    SubjectRef post = *core_->create_post(alice, "t", "d").subject;
    std::atomic<int> succeeded(0);

    race(8, [&](int) {
        if (core_->decide(post, Decision::Rejected, admin_).ok) ++succeeded;
    });

    EXPECT_EQ(1, succeeded.load());
    EXPECT_EQ(10, core_->balance_of(alice));
    EXPECT_EQ(1u, refunds_for(alice, post));
}

TEST_F(ConcurrencyTest, RejectRacingCancelRefundsOnce) {
    AccountId alice = make_user("alice", 10);
    AccountId bob = make_user("bob", 0);
    SubjectRef request = *core_->send_connection(alice, bob).subject;
    std::vector<Outcome> outcomes(2);

    race(2, [&](int i) {
        outcomes[i] = i == 0 ? core_->decide(request, Decision::Rejected, admin_)
                             : core_->cancel_connection(request.id, alice);
    });

    EXPECT_NE(outcomes[0].ok, outcomes[1].ok);
    for (const auto& outcome : outcomes) {
        if (!outcome.ok) EXPECT_EQ(ErrorCode::AlreadyDecided, outcome.code);
    }
    EXPECT_EQ(10, core_->balance_of(alice));
    EXPECT_EQ(1u, refunds_for(alice, request));

    auto subject = core_->subject(request);
    EXPECT_TRUE(subject->refund_applied);
    EXPECT_TRUE(subject->status == SubjectStatus::Rejected || subject->status == SubjectStatus::Cancelled);
}

TEST_F(ConcurrencyTest, MixedTrafficKeepsBalancesConsistent) {
    AccountId alice = make_user("alice", 15);
    AccountId bob = make_user("bob", 0);

    race(6, [&](int i) {
        for (int round = 0; round < 5; ++round) {
            Outcome created = core_->create_post(alice, "t", "d");
            if (created.ok && (i + round) % 2 == 0) {
                core_->decide(*created.subject, Decision::Rejected, admin_);
            }
            if (i == 0) core_->adjust(bob, 1, admin_, "drip");
        }
    });

    for (AccountId id : {alice, bob}) {
        EXPECT_GE(core_->balance_of(id), 0);
        ReconcileReport report = core_->reconcile(id);
        EXPECT_TRUE(report.ok()) << "account " << id;
    }
    EXPECT_EQ(5, core_->balance_of(bob));

    for (const auto& post : repo_->subjects_of(alice, SubjectKind::Post)) {
        EXPECT_LE(refunds_for(alice, post.ref()), 1u);
        EXPECT_EQ(post.refund_applied ? 1u : 0u, refunds_for(alice, post.ref()));
    }
}

TEST_F(ConcurrencyTest, LockTimeoutSurfacesAsStoreBusy) {
    AccountId alice = make_user("alice", 10);

    auto holder = repo_->begin();
    holder->lock_account(alice);

    Outcome outcome = core_->create_post(alice, "t", "d");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(ErrorCode::StoreBusy, outcome.code);
    EXPECT_TRUE(is_retryable(outcome.code));

    holder.reset();
    EXPECT_TRUE(core_->create_post(alice, "t", "d").ok);
    EXPECT_EQ(8, core_->balance_of(alice));
}
