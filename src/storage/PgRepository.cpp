#include "PgRepository.hpp"
#include "../core/errors.hpp"
#include "../core/json_codec.hpp"
#include "../core/logging.hpp"
#include <pqxx/pqxx>
#include <set>
#include <utility>

namespace atl {
namespace storage {

namespace {

const char* const kSqlLockNotAvailable = "55P03";
const char* const kSqlDeadlock = "40P01";
const char* const kSqlSerialization = "40001";

const char* const kSubjectColumns =
    "kind, id, owner_id, status, coin_cost, refund_applied, created_at, "
    "decided_at, decided_by, admin_note, details";

const char* const kEntryColumns =
    "id, account_id, delta, reason, ref_kind, ref_id, description, created_at, seal";

// Lock waits, deadlocks and serialization failures are retryable.
template <typename Body>
auto translated(const std::string& what, Body&& body) -> decltype(body()) {
    try {
        return body();
    } catch (const pqxx::sql_error& e) {
        const std::string state = e.sqlstate();
        if (state == kSqlLockNotAvailable || state == kSqlDeadlock || state == kSqlSerialization) {
            throw TransientFailure(what + ": " + e.what());
        }
        throw;
    }
}

LedgerEntry read_entry(const pqxx::row& row) {
    LedgerEntry entry;
    entry.id = row["id"].as<int64_t>();
    entry.account_id = row["account_id"].as<int64_t>();
    entry.delta = row["delta"].as<int64_t>();
    entry.reason = reason_from_string(row["reason"].as<std::string>());
    if (!row["ref_kind"].is_null()) {
        entry.reference = SubjectRef{kind_from_string(row["ref_kind"].as<std::string>()), row["ref_id"].as<int64_t>()};
    }
    entry.description = row["description"].is_null() ? "" : row["description"].as<std::string>();
    entry.created_at = row["created_at"].as<int64_t>();
    entry.seal = row["seal"].as<std::string>();
    return entry;
}

ModeratedSubject read_subject(const pqxx::row& row) {
    ModeratedSubject subject;
    const SubjectKind kind = kind_from_string(row["kind"].as<std::string>());
    subject.id = row["id"].as<int64_t>();
    subject.owner_account_id = row["owner_id"].as<int64_t>();
    subject.status = status_from_string(row["status"].as<std::string>());
    subject.coin_cost = row["coin_cost"].as<int64_t>();
    subject.refund_applied = row["refund_applied"].as<bool>();
    subject.created_at = row["created_at"].as<int64_t>();
    subject.decided_at = row["decided_at"].is_null() ? 0 : row["decided_at"].as<int64_t>();
    if (!row["decided_by"].is_null()) subject.decided_by = row["decided_by"].as<int64_t>();
    subject.admin_note = row["admin_note"].is_null() ? "" : row["admin_note"].as<std::string>();
    subject.details = details_from_json(kind, json::parse(row["details"].as<std::string>()));
    return subject;
}

Account read_account(const pqxx::row& row) {
    Account account;
    account.id = row["id"].as<int64_t>();
    account.username = row["username"].as<std::string>();
    account.role = role_from_string(row["role"].as<std::string>());
    account.created_at = row["created_at"].as<int64_t>();
    return account;
}

std::optional<AccountId> target_of(const ModeratedSubject& subject) {
    if (const auto* connection = std::get_if<ConnectionDetails>(&subject.details)) {
        return connection->target_account_id;
    }
    return std::nullopt;
}

std::optional<int64_t> nullable(int64_t value) {
    if (value == 0) return std::nullopt;
    return value;
}

std::string describe(const SubjectRef& ref) {
    return std::string(to_string(ref.kind)) + " " + std::to_string(ref.id);
}

} // namespace

class PgTransaction : public Transaction {
public:
    PgTransaction(const std::string& conn_str, int64_t lock_timeout_ms)
        : conn_(new pqxx::connection(conn_str)), work_(new pqxx::work(*conn_)) {
        work_->exec("SET LOCAL lock_timeout = '" + std::to_string(lock_timeout_ms) + "ms'");
    }

    void lock_account(AccountId id) override {
        if (held_accounts_.count(id)) return;
        translated("lock account " + std::to_string(id), [&] {
            work_->exec_params("SELECT id FROM accounts WHERE id = $1 FOR UPDATE", id);
        });
        held_accounts_.insert(id);
    }

    void lock_subject(const SubjectRef& ref) override {
        if (held_subjects_.count(ref)) return;
        translated("lock " + describe(ref), [&] {
            work_->exec_params("SELECT id FROM moderated_subjects WHERE kind = $1 AND id = $2 FOR UPDATE",
                               to_string(ref.kind), ref.id);
        });
        held_subjects_.insert(ref);
    }

    std::optional<Account> find_account(AccountId id) override {
        pqxx::result r = work_->exec_params(
            "SELECT id, username, role, created_at FROM accounts WHERE id = $1", id);
        if (r.empty()) return std::nullopt;
        return read_account(r[0]);
    }

    Account insert_account(const std::string& username, Role role) override {
        try {
            pqxx::result r = work_->exec_params(
                "INSERT INTO accounts (username, role, coins, created_at) VALUES ($1, $2, 0, $3) "
                "RETURNING id, username, role, created_at",
                username, to_string(role), unix_now());
            return read_account(r[0]);
        } catch (const pqxx::unique_violation&) {
            throw LedgerError(ErrorCode::DomainEffectFailed, "username already taken: " + username);
        }
    }

    coin_t cached_balance(AccountId id) override {
        pqxx::result r = work_->exec_params("SELECT coins FROM accounts WHERE id = $1", id);
        return r.empty() ? 0 : r[0][0].as<int64_t>();
    }

    std::string last_seal(AccountId id) override {
        pqxx::result r = work_->exec_params(
            "SELECT seal FROM coin_ledger WHERE account_id = $1 ORDER BY id DESC LIMIT 1", id);
        return r.empty() ? std::string(kGenesisSeal) : r[0][0].as<std::string>();
    }

    LedgerEntry insert_entry(LedgerEntry entry) override {
        std::optional<std::string> ref_kind;
        std::optional<int64_t> ref_id;
        if (entry.reference) {
            ref_kind = std::string(to_string(entry.reference->kind));
            ref_id = entry.reference->id;
        }

        try {
            pqxx::result r = work_->exec_params(
                "INSERT INTO coin_ledger (account_id, delta, reason, ref_kind, ref_id, description, created_at, seal) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8) RETURNING id",
                entry.account_id, entry.delta, to_string(entry.reason), ref_kind, ref_id,
                entry.description, entry.created_at, entry.seal);
            entry.id = r[0][0].as<int64_t>();
            work_->exec_params("UPDATE accounts SET coins = coins + $1 WHERE id = $2", entry.delta, entry.account_id);
        } catch (const pqxx::unique_violation& e) {
            throw IntegrityFault(ErrorCode::RefundError, std::string("duplicate refund entry: ") + e.what());
        } catch (const pqxx::check_violation& e) {
            throw IntegrityFault(ErrorCode::IntegrityViolation,
                                 "balance of account " + std::to_string(entry.account_id) + " would go negative: " + e.what());
        }
        return entry;
    }

    bool has_entry_for(const SubjectRef& ref, LedgerReason reason) override {
        pqxx::result r = work_->exec_params(
            "SELECT 1 FROM coin_ledger WHERE ref_kind = $1 AND ref_id = $2 AND reason = $3 LIMIT 1",
            to_string(ref.kind), ref.id, to_string(reason));
        return !r.empty();
    }

    std::vector<LedgerEntry> entries_ascending(AccountId id) override {
        pqxx::result r = work_->exec_params(
            std::string("SELECT ") + kEntryColumns + " FROM coin_ledger WHERE account_id = $1 ORDER BY id ASC", id);
        std::vector<LedgerEntry> out;
        for (const auto& row : r) out.push_back(read_entry(row));
        return out;
    }

    std::optional<ModeratedSubject> find_subject(const SubjectRef& ref) override {
        pqxx::result r = work_->exec_params(
            std::string("SELECT ") + kSubjectColumns + " FROM moderated_subjects WHERE kind = $1 AND id = $2",
            to_string(ref.kind), ref.id);
        if (r.empty()) return std::nullopt;
        return read_subject(r[0]);
    }

    ModeratedSubject insert_subject(ModeratedSubject subject) override {
        if (subject.kind() == SubjectKind::UserProfile) {
            subject.id = subject.owner_account_id;
        } else {
            subject.id = work_->exec("SELECT nextval('moderated_subject_ids')")[0][0].as<int64_t>();
        }

        try {
            work_->exec_params(
                "INSERT INTO moderated_subjects (kind, id, owner_id, status, coin_cost, refund_applied, created_at, "
                "decided_at, decided_by, admin_note, target_id, details) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12::jsonb)",
                to_string(subject.kind()), subject.id, subject.owner_account_id, to_string(subject.status),
                subject.coin_cost, subject.refund_applied, subject.created_at, nullable(subject.decided_at),
                subject.decided_by, subject.admin_note, target_of(subject), details_to_json(subject.details).dump());
        } catch (const pqxx::unique_violation&) {
            throw LedgerError(ErrorCode::DomainEffectFailed, describe(subject.ref()) + " conflicts with an open subject");
        }
        return subject;
    }

    void update_subject(const ModeratedSubject& subject) override {
        pqxx::result r = work_->exec_params(
            "UPDATE moderated_subjects SET status = $3, refund_applied = $4, decided_at = $5, decided_by = $6, "
            "admin_note = $7, details = $8::jsonb WHERE kind = $1 AND id = $2",
            to_string(subject.kind()), subject.id, to_string(subject.status), subject.refund_applied,
            nullable(subject.decided_at), subject.decided_by, subject.admin_note,
            details_to_json(subject.details).dump());
        if (r.affected_rows() == 0) {
            throw LedgerError(ErrorCode::NotFound, describe(subject.ref()) + " does not exist");
        }
    }

    bool has_open_connection(AccountId requester, AccountId target) override {
        pqxx::result r = work_->exec_params(
            "SELECT 1 FROM moderated_subjects WHERE kind = 'CONNECTION_REQUEST' AND owner_id = $1 "
            "AND target_id = $2 AND status IN ('PENDING', 'APPROVED') LIMIT 1",
            requester, target);
        return !r.empty();
    }

    void commit() override {
        try {
            translated("commit", [&] { work_->commit(); });
        } catch (const pqxx::check_violation& e) {
            throw IntegrityFault(ErrorCode::IntegrityViolation, e.what());
        }
    }

private:
    std::unique_ptr<pqxx::connection> conn_;
    std::unique_ptr<pqxx::work> work_;
    std::set<AccountId> held_accounts_;
    std::set<SubjectRef> held_subjects_;
};

PgRepository::PgRepository(std::string conn_str, int64_t lock_timeout_ms)
    : conn_str_(std::move(conn_str)), lock_timeout_ms_(lock_timeout_ms) {}

const std::string& PgRepository::schema_sql() {
    static const std::string sql = R"SQL(
CREATE TABLE IF NOT EXISTS accounts (
    id          BIGSERIAL PRIMARY KEY,
    username    TEXT NOT NULL UNIQUE,
    role        TEXT NOT NULL DEFAULT 'USER',
    coins       BIGINT NOT NULL DEFAULT 0 CHECK (coins >= 0),
    created_at  BIGINT NOT NULL
);

CREATE SEQUENCE IF NOT EXISTS moderated_subject_ids;

CREATE TABLE IF NOT EXISTS moderated_subjects (
    kind            TEXT NOT NULL,
    id              BIGINT NOT NULL,
    owner_id        BIGINT NOT NULL REFERENCES accounts(id),
    status          TEXT NOT NULL,
    coin_cost       BIGINT NOT NULL DEFAULT 0,
    refund_applied  BOOLEAN NOT NULL DEFAULT FALSE,
    created_at      BIGINT NOT NULL,
    decided_at      BIGINT,
    decided_by      BIGINT,
    admin_note      TEXT,
    target_id       BIGINT,
    details         JSONB NOT NULL,
    PRIMARY KEY (kind, id)
);

CREATE UNIQUE INDEX IF NOT EXISTS uniq_open_connection
    ON moderated_subjects (owner_id, target_id)
    WHERE kind = 'CONNECTION_REQUEST' AND status IN ('PENDING', 'APPROVED');

CREATE TABLE IF NOT EXISTS coin_ledger (
    id           BIGSERIAL PRIMARY KEY,
    account_id   BIGINT NOT NULL REFERENCES accounts(id),
    delta        BIGINT NOT NULL CHECK (delta <> 0),
    reason       TEXT NOT NULL,
    ref_kind     TEXT,
    ref_id       BIGINT,
    description  TEXT,
    created_at   BIGINT NOT NULL,
    seal         TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_coin_ledger_account ON coin_ledger (account_id, id);

CREATE UNIQUE INDEX IF NOT EXISTS uniq_refund_per_subject
    ON coin_ledger (ref_kind, ref_id) WHERE reason = 'REFUND';

CREATE TABLE IF NOT EXISTS notifications (
    id          BIGSERIAL PRIMARY KEY,
    account_id  BIGINT NOT NULL,
    kind        TEXT NOT NULL,
    payload     JSONB NOT NULL,
    seen        BOOLEAN NOT NULL DEFAULT FALSE,
    created_at  BIGINT NOT NULL
);

CREATE TABLE IF NOT EXISTS audits (
    id          BIGSERIAL PRIMARY KEY,
    admin_id    BIGINT NOT NULL,
    action      TEXT NOT NULL,
    entity      TEXT NOT NULL,
    entity_id   BIGINT NOT NULL,
    meta        JSONB NOT NULL,
    created_at  BIGINT NOT NULL
);
)SQL";
    return sql;
}

void PgRepository::ensure_schema() {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    W.exec(schema_sql());
    W.commit();
    atl_log("INFO", "Database schema verified.");
}

std::unique_ptr<Transaction> PgRepository::begin() {
    return translated("begin transaction", [&] {
        return std::unique_ptr<Transaction>(new PgTransaction(conn_str_, lock_timeout_ms_));
    });
}

coin_t PgRepository::balance_of(AccountId id) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params("SELECT coins FROM accounts WHERE id = $1", id);
    return r.empty() ? 0 : r[0][0].as<int64_t>();
}

std::vector<LedgerEntry> PgRepository::entries(AccountId id, const PageRequest& page) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params(
        std::string("SELECT ") + kEntryColumns + " FROM coin_ledger "
        "WHERE account_id = $1 AND ($2::BIGINT IS NULL OR id < $2) ORDER BY id DESC LIMIT $3",
        id, page.before, static_cast<int64_t>(page.limit));
    std::vector<LedgerEntry> out;
    for (const auto& row : r) out.push_back(read_entry(row));
    return out;
}

std::optional<Account> PgRepository::account(AccountId id) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params("SELECT id, username, role, created_at FROM accounts WHERE id = $1", id);
    if (r.empty()) return std::nullopt;
    return read_account(r[0]);
}

std::optional<ModeratedSubject> PgRepository::subject(const SubjectRef& ref) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params(
        std::string("SELECT ") + kSubjectColumns + " FROM moderated_subjects WHERE kind = $1 AND id = $2",
        to_string(ref.kind), ref.id);
    if (r.empty()) return std::nullopt;
    return read_subject(r[0]);
}

std::vector<ModeratedSubject> PgRepository::subjects(SubjectKind kind, std::optional<SubjectStatus> status,
                                                     std::size_t limit, std::size_t offset) {
    std::optional<std::string> status_name;
    if (status) status_name = std::string(to_string(*status));

    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params(
        std::string("SELECT ") + kSubjectColumns + " FROM moderated_subjects "
        "WHERE kind = $1 AND ($2::TEXT IS NULL OR status = $2) ORDER BY created_at ASC, id ASC LIMIT $3 OFFSET $4",
        to_string(kind), status_name, static_cast<int64_t>(limit), static_cast<int64_t>(offset));
    std::vector<ModeratedSubject> out;
    for (const auto& row : r) out.push_back(read_subject(row));
    return out;
}

std::vector<ModeratedSubject> PgRepository::subjects_of(AccountId owner, SubjectKind kind) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params(
        std::string("SELECT ") + kSubjectColumns + " FROM moderated_subjects "
        "WHERE owner_id = $1 AND kind = $2 ORDER BY created_at DESC, id DESC",
        owner, to_string(kind));
    std::vector<ModeratedSubject> out;
    for (const auto& row : r) out.push_back(read_subject(row));
    return out;
}

std::vector<ModeratedSubject> PgRepository::connections_to(AccountId target) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params(
        std::string("SELECT ") + kSubjectColumns + " FROM moderated_subjects "
        "WHERE kind = 'CONNECTION_REQUEST' AND target_id = $1 ORDER BY created_at DESC, id DESC",
        target);
    std::vector<ModeratedSubject> out;
    for (const auto& row : r) out.push_back(read_subject(row));
    return out;
}

Notification PgRepository::insert_notification(AccountId account, const std::string& kind, const json& payload) {
    Notification n;
    n.account_id = account;
    n.kind = kind;
    n.payload = payload;
    n.created_at = unix_now();

    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params(
        "INSERT INTO notifications (account_id, kind, payload, created_at) VALUES ($1, $2, $3::jsonb, $4) RETURNING id",
        account, kind, payload.dump(), n.created_at);
    W.commit();
    n.id = r[0][0].as<int64_t>();
    return n;
}

std::vector<Notification> PgRepository::notifications(AccountId account, std::size_t limit) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params(
        "SELECT id, account_id, kind, payload, seen, created_at FROM notifications "
        "WHERE account_id = $1 ORDER BY id DESC LIMIT $2",
        account, static_cast<int64_t>(limit));
    std::vector<Notification> out;
    for (const auto& row : r) {
        Notification n;
        n.id = row["id"].as<int64_t>();
        n.account_id = row["account_id"].as<int64_t>();
        n.kind = row["kind"].as<std::string>();
        n.payload = json::parse(row["payload"].as<std::string>());
        n.seen = row["seen"].as<bool>();
        n.created_at = row["created_at"].as<int64_t>();
        out.push_back(n);
    }
    return out;
}

bool PgRepository::mark_notification_seen(int64_t id, AccountId account) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params(
        "UPDATE notifications SET seen = TRUE WHERE id = $1 AND account_id = $2", id, account);
    W.commit();
    return r.affected_rows() > 0;
}

void PgRepository::insert_audit(const AuditRecord& record) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    W.exec_params(
        "INSERT INTO audits (admin_id, action, entity, entity_id, meta, created_at) VALUES ($1, $2, $3, $4, $5::jsonb, $6)",
        record.admin_id, record.action, record.entity, record.entity_id, record.meta.dump(), record.created_at);
    W.commit();
}

std::vector<AuditRecord> PgRepository::audits(std::size_t limit, std::size_t offset) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result r = W.exec_params(
        "SELECT admin_id, action, entity, entity_id, meta, created_at FROM audits ORDER BY id DESC LIMIT $1 OFFSET $2",
        static_cast<int64_t>(limit), static_cast<int64_t>(offset));
    std::vector<AuditRecord> out;
    for (const auto& row : r) {
        AuditRecord record;
        record.admin_id = row["admin_id"].as<int64_t>();
        record.action = row["action"].as<std::string>();
        record.entity = row["entity"].as<std::string>();
        record.entity_id = row["entity_id"].as<int64_t>();
        record.meta = json::parse(row["meta"].as<std::string>());
        record.created_at = row["created_at"].as<int64_t>();
        out.push_back(record);
    }
    return out;
}

} // namespace storage
} // namespace atl
