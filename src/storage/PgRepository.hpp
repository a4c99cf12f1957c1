/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: PgRepository.hpp
 * ============================================================================
 * * DESCRIPTION:
 * PostgreSQL Repository over libpqxx. Each Transaction is one pqxx::work on
 * its own connection. Exclusion is SELECT ... FOR UPDATE on the account or
 * subject row, bounded by SET LOCAL lock_timeout. accounts.coins is the
 * cached running total and is updated by the same statement batch that
 * inserts the ledger row.
 * ============================================================================
 */

#ifndef ATL_STORAGE_PG_REPOSITORY_HPP
#define ATL_STORAGE_PG_REPOSITORY_HPP

#include <string>
#include "Repository.hpp"

namespace atl {
namespace storage {

    class PgRepository : public Repository {
    public:
        PgRepository(std::string conn_str, int64_t lock_timeout_ms);

        // Creates tables, sequence and indexes when missing.
        void ensure_schema();

        static const std::string& schema_sql();

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
        std::string conn_str_;
        int64_t lock_timeout_ms_;
    };

} // namespace storage
} // namespace atl

#endif // ATL_STORAGE_PG_REPOSITORY_HPP
