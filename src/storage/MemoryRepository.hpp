/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: MemoryRepository.hpp
 * ============================================================================
 * * DESCRIPTION:
 * In-process Repository. Per-account and per-subject timed mutexes give the
 * bounded-wait exclusion; a transaction stages its writes privately and
 * applies them under one data lock at commit, so readers see either all of a
 * unit or none of it. The running balance cache is updated in that same step.
 * State lives only as long as the object.
 * ============================================================================
 */

#ifndef ATL_STORAGE_MEMORY_REPOSITORY_HPP
#define ATL_STORAGE_MEMORY_REPOSITORY_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include "Repository.hpp"

namespace atl {
namespace storage {

    class MemoryTransaction;

    class MemoryRepository : public Repository {
    public:
        explicit MemoryRepository(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(2000));

        std::unique_ptr<Transaction> begin() override;

        coin_t balance_of(AccountId id) override;
        std::vector<LedgerEntry> entries(AccountId id, const PageRequest& page) override;
        std::optional<Account> account(AccountId id) override;
        std::optional<ModeratedSubject> subject(const SubjectRef& ref) override;
        std::vector<ModeratedSubject> subjects(SubjectKind kind, std::optional<SubjectStatus> status,
                                               std::size_t limit, std::size_t offset) override;
        std::vector<ModeratedSubject> subjects_of(AccountId owner, SubjectKind kind) override;
        std::vector<ModeratedSubject> connections_to(AccountId target) override;

        Notification insert_notification(AccountId account, const std::string& kind, const json& payload) override;
        std::vector<Notification> notifications(AccountId account, std::size_t limit) override;
        bool mark_notification_seen(int64_t id, AccountId account) override;

        void insert_audit(const AuditRecord& record) override;
        std::vector<AuditRecord> audits(std::size_t limit, std::size_t offset) override;

    private:
        friend class MemoryTransaction;

        std::timed_mutex& account_mutex(AccountId id);
        std::timed_mutex& subject_mutex(const SubjectRef& ref);

        std::chrono::milliseconds lock_timeout_;

        std::mutex lock_table_mutex_;
        std::map<AccountId, std::unique_ptr<std::timed_mutex>> account_locks_;
        std::map<SubjectRef, std::unique_ptr<std::timed_mutex>> subject_locks_;

        mutable std::mutex data_mutex_;
        std::map<AccountId, Account> accounts_;
        std::map<AccountId, coin_t> balances_;
        std::map<AccountId, std::string> seals_;
        std::vector<LedgerEntry> ledger_;
        std::map<AccountId, std::vector<std::size_t>> ledger_by_account_;
        std::set<std::pair<SubjectRef, LedgerReason>> entry_refs_;
        std::map<SubjectRef, ModeratedSubject> subjects_;
        std::vector<Notification> notifications_;
        std::vector<AuditRecord> audits_;
        int64_t next_notification_id_ = 1;

        std::atomic<int64_t> next_entry_id_{1};
        std::atomic<int64_t> next_subject_id_{1};
        std::atomic<int64_t> next_account_id_{1};
    };

} // namespace storage
} // namespace atl

#endif // ATL_STORAGE_MEMORY_REPOSITORY_HPP
