/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: atl_types.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Shared vocabulary of the ledger core: coin amounts, ledger entries and the
 * moderated subjects (profile, post, connection request, top-up request).
 * Every component and every storage backend speaks these types.
 * ============================================================================
 */

#ifndef ATL_TYPES_HPP
#define ATL_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace atl {

    // Coins are whole units. int64_t keeps sums exact.
    typedef int64_t coin_t;
    typedef int64_t AccountId;
    typedef int64_t SubjectId;
    typedef int64_t EntryId;

    // Seed of every account's seal chain.
    extern const char* const kGenesisSeal;

    enum class Role { User, Admin };

    enum class LedgerReason { Topup, Post, Connect, Adjust, Refund };

    // Order matches the alternatives of SubjectDetails.
    enum class SubjectKind { UserProfile = 0, Post = 1, ConnectionRequest = 2, TopupRequest = 3 };

    enum class SubjectStatus { Pending, Approved, Rejected, Cancelled };

    enum class Decision { Approved, Rejected };

    enum class ActionKind { CreatePost, SendConnection, RequestTopup };

    struct SubjectRef {
        SubjectKind kind = SubjectKind::Post;
        SubjectId id = 0;
    };

    inline bool operator==(const SubjectRef& a, const SubjectRef& b) {
        return a.kind == b.kind && a.id == b.id;
    }

    inline bool operator<(const SubjectRef& a, const SubjectRef& b) {
        if (a.kind != b.kind) return static_cast<int>(a.kind) < static_cast<int>(b.kind);
        return a.id < b.id;
    }

    struct Account {
        AccountId id = 0;
        std::string username;
        Role role = Role::User;
        int64_t created_at = 0;
    };

    /**
     * @brief One immutable signed balance adjustment.
     * Written only by LedgerStore::append, never updated or removed.
     */
    struct LedgerEntry {
        EntryId id = 0;
        AccountId account_id = 0;
        coin_t delta = 0;
        LedgerReason reason = LedgerReason::Adjust;
        std::optional<SubjectRef> reference;
        std::string description;
        int64_t created_at = 0;
        std::string seal;
    };

    struct ProfileDetails {
        std::string username;
    };

    struct PostDetails {
        std::string title;
        std::string description;
    };

    struct ConnectionDetails {
        AccountId target_account_id = 0;
        std::optional<SubjectId> post_id;
    };

    // Amounts are in laari (1/100 MVR).
    struct TopupDetails {
        int64_t amount_laari = 0;
        int64_t price_per_coin_laari = 0;
        coin_t computed_coins = 0;
    };

    typedef std::variant<ProfileDetails, PostDetails, ConnectionDetails, TopupDetails> SubjectDetails;

    /**
     * @brief Any entity whose lifecycle needs an administrative decision.
     * The variant alternative is the subject's kind.
     */
    struct ModeratedSubject {
        SubjectId id = 0;
        AccountId owner_account_id = 0;
        SubjectStatus status = SubjectStatus::Pending;
        coin_t coin_cost = 0;
        bool refund_applied = false;
        int64_t created_at = 0;
        int64_t decided_at = 0;
        std::optional<AccountId> decided_by;
        std::string admin_note;
        SubjectDetails details;

        SubjectKind kind() const { return static_cast<SubjectKind>(details.index()); }
        SubjectRef ref() const { return SubjectRef{kind(), id}; }
    };

    struct Notification {
        int64_t id = 0;
        AccountId account_id = 0;
        std::string kind;
        json payload = json::object();
        bool seen = false;
        int64_t created_at = 0;
    };

    struct AuditRecord {
        AccountId admin_id = 0;
        std::string action;
        std::string entity;
        int64_t entity_id = 0;
        json meta = json::object();
        int64_t created_at = 0;
    };

    struct PageRequest {
        std::size_t limit = 50;
        std::optional<EntryId> before;  // exclusive cursor, newest first
    };

    struct HistoryPage {
        std::vector<LedgerEntry> entries;
        std::optional<EntryId> next_before;
    };

    struct ReconcileReport {
        AccountId account_id = 0;
        std::size_t entries = 0;
        coin_t summed = 0;
        coin_t cached = 0;
        bool chain_ok = true;
        bool balanced = true;
        bool never_negative = true;

        bool ok() const { return chain_ok && balanced && never_negative; }
    };

    int64_t unix_now();

    const char* to_string(Role role);
    const char* to_string(LedgerReason reason);
    const char* to_string(SubjectKind kind);
    const char* to_string(SubjectStatus status);
    const char* to_string(Decision decision);

    // Parsers throw std::invalid_argument on unknown names.
    Role role_from_string(const std::string& name);
    LedgerReason reason_from_string(const std::string& name);
    SubjectKind kind_from_string(const std::string& name);
    SubjectStatus status_from_string(const std::string& name);

    // Storage table name used in audit records ("posts", "coin_topups", ...).
    const char* entity_name(SubjectKind kind);

    // Empty details of the alternative matching `kind`.
    SubjectDetails details_for(SubjectKind kind);

} // namespace atl

#endif // ATL_TYPES_HPP
