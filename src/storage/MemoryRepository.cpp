#include "MemoryRepository.hpp"
#include "../core/errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace atl {
namespace storage {

class MemoryTransaction : public Transaction {
public:
    explicit MemoryTransaction(MemoryRepository& repo) : repo_(repo) {}

    void lock_account(AccountId id) override {
        if (held_accounts_.count(id)) return;
        acquire(repo_.account_mutex(id), "account " + std::to_string(id));
        held_accounts_.insert(id);
    }

    void lock_subject(const SubjectRef& ref) override {
        if (held_subjects_.count(ref)) return;
        acquire(repo_.subject_mutex(ref),
                std::string(to_string(ref.kind)) + " " + std::to_string(ref.id));
        held_subjects_.insert(ref);
    }

    std::optional<Account> find_account(AccountId id) override {
        for (const auto& account : staged_accounts_) {
            if (account.id == id) return account;
        }
        std::lock_guard<std::mutex> guard(repo_.data_mutex_);
        auto it = repo_.accounts_.find(id);
        if (it == repo_.accounts_.end()) return std::nullopt;
        return it->second;
    }

    Account insert_account(const std::string& username, Role role) override {
        bool taken = std::any_of(staged_accounts_.begin(), staged_accounts_.end(),
                                 [&](const Account& a) { return a.username == username; });
        if (!taken) {
            std::lock_guard<std::mutex> guard(repo_.data_mutex_);
            taken = username_taken_locked(username);
        }
        if (taken) {
            throw LedgerError(ErrorCode::DomainEffectFailed, "username already taken: " + username);
        }

        Account account;
        account.id = repo_.next_account_id_++;
        account.username = username;
        account.role = role;
        account.created_at = unix_now();
        staged_accounts_.push_back(account);
        return account;
    }

    coin_t cached_balance(AccountId id) override {
        coin_t balance = 0;
        {
            std::lock_guard<std::mutex> guard(repo_.data_mutex_);
            auto it = repo_.balances_.find(id);
            if (it != repo_.balances_.end()) balance = it->second;
        }
        for (const auto& entry : staged_entries_) {
            if (entry.account_id == id) balance += entry.delta;
        }
        return balance;
    }

    std::string last_seal(AccountId id) override {
        for (auto it = staged_entries_.rbegin(); it != staged_entries_.rend(); ++it) {
            if (it->account_id == id) return it->seal;
        }
        std::lock_guard<std::mutex> guard(repo_.data_mutex_);
        auto it = repo_.seals_.find(id);
        return it == repo_.seals_.end() ? std::string(kGenesisSeal) : it->second;
    }

    LedgerEntry insert_entry(LedgerEntry entry) override {
        entry.id = repo_.next_entry_id_++;
        staged_entries_.push_back(entry);
        return entry;
    }

    bool has_entry_for(const SubjectRef& ref, LedgerReason reason) override {
        for (const auto& entry : staged_entries_) {
            if (entry.reason == reason && entry.reference && *entry.reference == ref) return true;
        }
        std::lock_guard<std::mutex> guard(repo_.data_mutex_);
        return repo_.entry_refs_.count(std::make_pair(ref, reason)) > 0;
    }

    std::vector<LedgerEntry> entries_ascending(AccountId id) override {
        std::vector<LedgerEntry> out;
        {
            std::lock_guard<std::mutex> guard(repo_.data_mutex_);
            auto it = repo_.ledger_by_account_.find(id);
            if (it != repo_.ledger_by_account_.end()) {
                for (std::size_t index : it->second) out.push_back(repo_.ledger_[index]);
            }
        }
        for (const auto& entry : staged_entries_) {
            if (entry.account_id == id) out.push_back(entry);
        }
        return out;
    }

    std::optional<ModeratedSubject> find_subject(const SubjectRef& ref) override {
        auto staged = staged_subjects_.find(ref);
        if (staged != staged_subjects_.end()) return staged->second;
        std::lock_guard<std::mutex> guard(repo_.data_mutex_);
        auto it = repo_.subjects_.find(ref);
        if (it == repo_.subjects_.end()) return std::nullopt;
        return it->second;
    }

    ModeratedSubject insert_subject(ModeratedSubject subject) override {
        if (subject.kind() == SubjectKind::UserProfile) {
            subject.id = subject.owner_account_id;
            if (find_subject(subject.ref())) {
                throw LedgerError(ErrorCode::DomainEffectFailed,
                                  "profile already exists for account " + std::to_string(subject.id));
            }
        } else {
            subject.id = repo_.next_subject_id_++;
        }

        if (const auto* connection = std::get_if<ConnectionDetails>(&subject.details)) {
            if (has_open_connection(subject.owner_account_id, connection->target_account_id)) {
                throw LedgerError(ErrorCode::DomainEffectFailed, "connection request already exists");
            }
        }

        staged_subjects_[subject.ref()] = subject;
        return subject;
    }

    void update_subject(const ModeratedSubject& subject) override {
        if (!find_subject(subject.ref())) {
            throw LedgerError(ErrorCode::NotFound, "no such subject to update");
        }
        staged_subjects_[subject.ref()] = subject;
    }

    bool has_open_connection(AccountId requester, AccountId target) override {
        auto is_open_match = [&](const ModeratedSubject& s) {
            const auto* connection = std::get_if<ConnectionDetails>(&s.details);
            return connection != nullptr
                && s.owner_account_id == requester
                && connection->target_account_id == target
                && (s.status == SubjectStatus::Pending || s.status == SubjectStatus::Approved);
        };

        for (const auto& kv : staged_subjects_) {
            if (is_open_match(kv.second)) return true;
        }
        std::lock_guard<std::mutex> guard(repo_.data_mutex_);
        for (const auto& kv : repo_.subjects_) {
            if (staged_subjects_.count(kv.first)) continue;
            if (is_open_match(kv.second)) return true;
        }
        return false;
    }

    void commit() override {
        if (committed_) {
            throw std::logic_error("transaction already committed");
        }

        std::lock_guard<std::mutex> guard(repo_.data_mutex_);

        for (const auto& account : staged_accounts_) {
            if (username_taken_locked(account.username)) {
                throw LedgerError(ErrorCode::DomainEffectFailed, "username already taken: " + account.username);
            }
        }

        std::map<AccountId, coin_t> projected;
        for (const auto& entry : staged_entries_) {
            auto it = projected.find(entry.account_id);
            if (it == projected.end()) {
                auto committed = repo_.balances_.find(entry.account_id);
                coin_t start = committed == repo_.balances_.end() ? 0 : committed->second;
                it = projected.emplace(entry.account_id, start).first;
            }
            it->second += entry.delta;
        }
        for (const auto& kv : projected) {
            if (kv.second < 0) {
                throw IntegrityFault(ErrorCode::IntegrityViolation,
                                     "commit would leave account " + std::to_string(kv.first) + " negative");
            }
        }

        for (const auto& account : staged_accounts_) {
            repo_.accounts_[account.id] = account;
        }
        for (const auto& kv : staged_subjects_) {
            repo_.subjects_[kv.first] = kv.second;
        }
        for (const auto& entry : staged_entries_) {
            repo_.ledger_by_account_[entry.account_id].push_back(repo_.ledger_.size());
            repo_.ledger_.push_back(entry);
            repo_.seals_[entry.account_id] = entry.seal;
            if (entry.reference) {
                repo_.entry_refs_.insert(std::make_pair(*entry.reference, entry.reason));
            }
        }
        for (const auto& kv : projected) {
            repo_.balances_[kv.first] = kv.second;
        }

        committed_ = true;
        staged_accounts_.clear();
        staged_entries_.clear();
        staged_subjects_.clear();
        held_.clear();
    }

private:
    void acquire(std::timed_mutex& mutex, const std::string& what) {
        std::unique_lock<std::timed_mutex> lock(mutex, std::defer_lock);
        if (!lock.try_lock_for(repo_.lock_timeout_)) {
            throw TransientFailure(what + " is locked by another operation");
        }
        held_.push_back(std::move(lock));
    }

    // Caller holds repo_.data_mutex_.
    bool username_taken_locked(const std::string& username) const {
        for (const auto& kv : repo_.accounts_) {
            if (kv.second.username == username) return true;
        }
        return false;
    }

    MemoryRepository& repo_;
    std::vector<std::unique_lock<std::timed_mutex>> held_;
    std::set<AccountId> held_accounts_;
    std::set<SubjectRef> held_subjects_;
    std::vector<Account> staged_accounts_;
    std::vector<LedgerEntry> staged_entries_;
    std::map<SubjectRef, ModeratedSubject> staged_subjects_;
    bool committed_ = false;
};

MemoryRepository::MemoryRepository(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout) {}

std::unique_ptr<Transaction> MemoryRepository::begin() {
    return std::unique_ptr<Transaction>(new MemoryTransaction(*this));
}

std::timed_mutex& MemoryRepository::account_mutex(AccountId id) {
    std::lock_guard<std::mutex> guard(lock_table_mutex_);
    auto& slot = account_locks_[id];
    if (!slot) slot.reset(new std::timed_mutex());
    return *slot;
}

std::timed_mutex& MemoryRepository::subject_mutex(const SubjectRef& ref) {
    std::lock_guard<std::mutex> guard(lock_table_mutex_);
    auto& slot = subject_locks_[ref];
    if (!slot) slot.reset(new std::timed_mutex());
    return *slot;
}

coin_t MemoryRepository::balance_of(AccountId id) {
    std::lock_guard<std::mutex> guard(data_mutex_);
    auto it = balances_.find(id);
    return it == balances_.end() ? 0 : it->second;
}

std::vector<LedgerEntry> MemoryRepository::entries(AccountId id, const PageRequest& page) {
    std::vector<LedgerEntry> out;
    std::lock_guard<std::mutex> guard(data_mutex_);
    auto it = ledger_by_account_.find(id);
    if (it == ledger_by_account_.end()) return out;

    const auto& indices = it->second;
    for (auto index = indices.rbegin(); index != indices.rend() && out.size() < page.limit; ++index) {
        const LedgerEntry& entry = ledger_[*index];
        if (page.before && entry.id >= *page.before) continue;
        out.push_back(entry);
    }
    return out;
}

std::optional<Account> MemoryRepository::account(AccountId id) {
    std::lock_guard<std::mutex> guard(data_mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) return std::nullopt;
    return it->second;
}

std::optional<ModeratedSubject> MemoryRepository::subject(const SubjectRef& ref) {
    std::lock_guard<std::mutex> guard(data_mutex_);
    auto it = subjects_.find(ref);
    if (it == subjects_.end()) return std::nullopt;
    return it->second;
}

std::vector<ModeratedSubject> MemoryRepository::subjects(SubjectKind kind, std::optional<SubjectStatus> status,
                                                         std::size_t limit, std::size_t offset) {
    std::vector<ModeratedSubject> out;
    std::size_t skipped = 0;
    std::lock_guard<std::mutex> guard(data_mutex_);
    for (const auto& kv : subjects_) {
        if (out.size() >= limit) break;
        if (kv.first.kind != kind) continue;
        if (status && kv.second.status != *status) continue;
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        out.push_back(kv.second);
    }
    return out;
}

std::vector<ModeratedSubject> MemoryRepository::subjects_of(AccountId owner, SubjectKind kind) {
    std::vector<ModeratedSubject> out;
    std::lock_guard<std::mutex> guard(data_mutex_);
    for (auto it = subjects_.rbegin(); it != subjects_.rend(); ++it) {
        if (it->first.kind == kind && it->second.owner_account_id == owner) out.push_back(it->second);
    }
    return out;
}

std::vector<ModeratedSubject> MemoryRepository::connections_to(AccountId target) {
    std::vector<ModeratedSubject> out;
    std::lock_guard<std::mutex> guard(data_mutex_);
    for (auto it = subjects_.rbegin(); it != subjects_.rend(); ++it) {
        const auto* connection = std::get_if<ConnectionDetails>(&it->second.details);
        if (connection != nullptr && connection->target_account_id == target) out.push_back(it->second);
    }
    return out;
}

Notification MemoryRepository::insert_notification(AccountId account, const std::string& kind, const json& payload) {
    std::lock_guard<std::mutex> guard(data_mutex_);
    Notification notification;
    notification.id = next_notification_id_++;
    notification.account_id = account;
    notification.kind = kind;
    notification.payload = payload;
    notification.created_at = unix_now();
    notifications_.push_back(notification);
    return notification;
}

std::vector<Notification> MemoryRepository::notifications(AccountId account, std::size_t limit) {
    std::vector<Notification> out;
    std::lock_guard<std::mutex> guard(data_mutex_);
    for (auto it = notifications_.rbegin(); it != notifications_.rend() && out.size() < limit; ++it) {
        if (it->account_id == account) out.push_back(*it);
    }
    return out;
}

bool MemoryRepository::mark_notification_seen(int64_t id, AccountId account) {
    std::lock_guard<std::mutex> guard(data_mutex_);
    for (auto& notification : notifications_) {
        if (notification.id == id && notification.account_id == account) {
            notification.seen = true;
            return true;
        }
    }
    return false;
}

void MemoryRepository::insert_audit(const AuditRecord& record) {
    std::lock_guard<std::mutex> guard(data_mutex_);
    audits_.push_back(record);
}

std::vector<AuditRecord> MemoryRepository::audits(std::size_t limit, std::size_t offset) {
    std::vector<AuditRecord> out;
    std::lock_guard<std::mutex> guard(data_mutex_);
    std::size_t skipped = 0;
    for (auto it = audits_.rbegin(); it != audits_.rend() && out.size() < limit; ++it) {
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        out.push_back(*it);
    }
    return out;
}

} // namespace storage
} // namespace atl
