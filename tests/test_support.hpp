/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: test_support.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Shared fixture for the core suites: an in-memory repository, a default
 * Config, a recording audit sink and a LedgerCore wired over them.
 * ============================================================================
 */

#ifndef ATL_TEST_SUPPORT_HPP
#define ATL_TEST_SUPPORT_HPP

#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "LedgerCore.hpp"
#include "plugins/interface/atl_sink.hpp"
#include "plugins/interface/SinkManager.hpp"
#include "storage/MemoryRepository.hpp"

namespace atl {
namespace test {

class RecordingAuditSink : public IAuditSink {
public:
    void record(const AuditRecord& record) override;

    std::vector<AuditRecord> records() const;
    std::size_t count(const std::string& action) const;

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
};

// Accepts or refuses every delivery; counts both.
class RecordingNotificationSink : public INotificationSink {
public:
    explicit RecordingNotificationSink(bool accept = true) : accept_(accept) {}

    std::string get_sink_name() override { return "recording"; }
    bool deliver(const Notification& notification) override;

    std::vector<Notification> delivered() const;
    int attempts() const;

private:
    bool accept_;
    mutable std::mutex mutex_;
    std::vector<Notification> delivered_;
    int attempts_ = 0;
};

class LedgerFixture : public ::testing::Test {
protected:
    void SetUp() override;

    // Rebuilds the engine, e.g. after changing config_.
    void rebuild();

    // Registers an account, approves its profile when asked, credits `coins`.
    AccountId make_user(const std::string& name, coin_t coins, bool approved = true);

    void credit(AccountId account_id, coin_t coins);

    std::vector<std::string> notification_kinds(AccountId account_id);

    std::unique_ptr<storage::MemoryRepository> repo_;
    Config config_;
    RecordingAuditSink audit_;
    plugins::SinkManager sinks_;
    std::unique_ptr<LedgerCore> core_;
    AccountId admin_ = 0;
};

} // namespace test
} // namespace atl

#endif // ATL_TEST_SUPPORT_HPP
