/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: Repository.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The persistence substrate seen by the ledger core. A Transaction is one
 * all-or-nothing unit of work: nothing it writes is visible to anyone else
 * until commit(), and destroying it uncommitted discards every staged write
 * and releases every lock it holds.
 *
 * Backends: PgRepository (libpqxx, production) and MemoryRepository
 * (in-process, used by tests and the "memory" store setting).
 * ============================================================================
 */

#ifndef ATL_STORAGE_REPOSITORY_HPP
#define ATL_STORAGE_REPOSITORY_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../core/atl_types.hpp"

namespace atl {
namespace storage {

    class Transaction {
    public:
        virtual ~Transaction() {}

        /**
         * @brief Per-account and per-subject exclusion.
         * Held until commit or rollback. Re-locking a key already held by this
         * transaction is a no-op. Waits are bounded by the configured lock
         * timeout; past it the call throws TransientFailure.
         * Callers lock subjects before accounts.
         */
        virtual void lock_account(AccountId id) = 0;
        virtual void lock_subject(const SubjectRef& ref) = 0;

        virtual std::optional<Account> find_account(AccountId id) = 0;

        // Throws LedgerError(DomainEffectFailed) on a duplicate username.
        virtual Account insert_account(const std::string& username, Role role) = 0;

        // Running total including this transaction's own staged entries.
        virtual coin_t cached_balance(AccountId id) = 0;

        // Seal of the account's newest entry, or kGenesisSeal.
        virtual std::string last_seal(AccountId id) = 0;

        // Assigns the id. Seal and created_at are taken as given.
        virtual LedgerEntry insert_entry(LedgerEntry entry) = 0;

        virtual bool has_entry_for(const SubjectRef& ref, LedgerReason reason) = 0;

        // Oldest first.
        virtual std::vector<LedgerEntry> entries_ascending(AccountId id) = 0;

        virtual std::optional<ModeratedSubject> find_subject(const SubjectRef& ref) = 0;

        /**
         * @brief Inserts a new subject.
         * Assigns the id except for UserProfile, whose id is the owner's
         * account id. Throws LedgerError(DomainEffectFailed) when a uniqueness
         * rule is violated (second open connection request to the same target,
         * second profile for one account).
         */
        virtual ModeratedSubject insert_subject(ModeratedSubject subject) = 0;

        virtual void update_subject(const ModeratedSubject& subject) = 0;

        // PENDING or APPROVED request from requester to target.
        virtual bool has_open_connection(AccountId requester, AccountId target) = 0;

        virtual void commit() = 0;
    };

    class Repository {
    public:
        virtual ~Repository() {}

        virtual std::unique_ptr<Transaction> begin() = 0;

        // Committed running total.
        virtual coin_t balance_of(AccountId id) = 0;

        // Newest first, strictly older than page.before when set.
        virtual std::vector<LedgerEntry> entries(AccountId id, const PageRequest& page) = 0;

        virtual std::optional<Account> account(AccountId id) = 0;
        virtual std::optional<ModeratedSubject> subject(const SubjectRef& ref) = 0;

        // Moderation queue, oldest first.
        virtual std::vector<ModeratedSubject> subjects(SubjectKind kind, std::optional<SubjectStatus> status,
                                                       std::size_t limit, std::size_t offset) = 0;

        // Subjects owned by an account, newest first.
        virtual std::vector<ModeratedSubject> subjects_of(AccountId owner, SubjectKind kind) = 0;

        // Connection requests addressed to an account, newest first.
        virtual std::vector<ModeratedSubject> connections_to(AccountId target) = 0;

        virtual Notification insert_notification(AccountId account, const std::string& kind, const json& payload) = 0;
        virtual std::vector<Notification> notifications(AccountId account, std::size_t limit) = 0;
        virtual bool mark_notification_seen(int64_t id, AccountId account) = 0;

        virtual void insert_audit(const AuditRecord& record) = 0;
        virtual std::vector<AuditRecord> audits(std::size_t limit, std::size_t offset) = 0;
    };

} // namespace storage
} // namespace atl

#endif // ATL_STORAGE_REPOSITORY_HPP
