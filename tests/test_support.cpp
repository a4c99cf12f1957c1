#include "test_support.hpp"

namespace atl {
namespace test {

void RecordingAuditSink::record(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<AuditRecord> RecordingAuditSink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t RecordingAuditSink::count(const std::string& action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& record : records_) {
        if (record.action == action) ++n;
    }
    return n;
}

bool RecordingNotificationSink::deliver(const Notification& notification) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++attempts_;
    if (accept_) delivered_.push_back(notification);
    return accept_;
}

std::vector<Notification> RecordingNotificationSink::delivered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

int RecordingNotificationSink::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

void LedgerFixture::SetUp() {
    config_.store = "memory";
    config_.lock_timeout_ms = 500;
    rebuild();
}

void LedgerFixture::rebuild() {
    core_.reset();
    repo_.reset(new storage::MemoryRepository(std::chrono::milliseconds(config_.lock_timeout_ms)));
    core_.reset(new LedgerCore(*repo_, config_, audit_, &sinks_));

    Outcome registered = core_->register_account("admin", Role::Admin);
    ASSERT_TRUE(registered.ok) << registered.message;
    admin_ = registered.subject->id;
}

AccountId LedgerFixture::make_user(const std::string& name, coin_t coins, bool approved) {
    Outcome registered = core_->register_account(name);
    EXPECT_TRUE(registered.ok) << registered.message;
    AccountId id = registered.subject->id;

    if (approved) {
        Outcome decided = core_->decide(*registered.subject, Decision::Approved, admin_);
        EXPECT_TRUE(decided.ok) << decided.message;
    }
    if (coins > 0) credit(id, coins);
    return id;
}

void LedgerFixture::credit(AccountId account_id, coin_t coins) {
    core_->ledger().append(account_id, coins, LedgerReason::Topup, std::nullopt, "test credit");
}

std::vector<std::string> LedgerFixture::notification_kinds(AccountId account_id) {
    std::vector<std::string> kinds;
    for (const auto& n : core_->notifications().notifications(account_id, 100)) {
        kinds.push_back(n.kind);
    }
    return kinds;
}

} // namespace test
} // namespace atl
