#include "json_codec.hpp"

namespace atl {

namespace {

struct DetailsWriter {
    json operator()(const ProfileDetails& d) const {
        return {{"username", d.username}};
    }
    json operator()(const PostDetails& d) const {
        return {{"title", d.title}, {"description", d.description}};
    }
    json operator()(const ConnectionDetails& d) const {
        json out = {{"targetUserId", d.target_account_id}};
        out["postId"] = d.post_id ? json(*d.post_id) : json(nullptr);
        return out;
    }
    json operator()(const TopupDetails& d) const {
        return {
            {"amountLaari", d.amount_laari},
            {"pricePerCoinLaari", d.price_per_coin_laari},
            {"computedCoins", d.computed_coins}
        };
    }
};

} // namespace

void to_json(json& j, const Account& account) {
    j = {
        {"id", account.id},
        {"username", account.username},
        {"role", to_string(account.role)},
        {"createdAt", account.created_at}
    };
}

void to_json(json& j, const LedgerEntry& entry) {
    j = {
        {"id", entry.id},
        {"userId", entry.account_id},
        {"delta", entry.delta},
        {"reason", to_string(entry.reason)},
        {"description", entry.description},
        {"createdAt", entry.created_at},
        {"seal", entry.seal}
    };
    if (entry.reference) {
        j["refKind"] = to_string(entry.reference->kind);
        j["refId"] = entry.reference->id;
    } else {
        j["refKind"] = nullptr;
        j["refId"] = nullptr;
    }
}

void to_json(json& j, const ModeratedSubject& subject) {
    j = {
        {"id", subject.id},
        {"kind", to_string(subject.kind())},
        {"ownerId", subject.owner_account_id},
        {"status", to_string(subject.status)},
        {"coinCost", subject.coin_cost},
        {"refundApplied", subject.refund_applied},
        {"createdAt", subject.created_at},
        {"decidedAt", subject.decided_at},
        {"adminNote", subject.admin_note},
        {"details", details_to_json(subject.details)}
    };
    j["decidedBy"] = subject.decided_by ? json(*subject.decided_by) : json(nullptr);
}

void to_json(json& j, const Notification& notification) {
    j = {
        {"id", notification.id},
        {"userId", notification.account_id},
        {"type", notification.kind},
        {"data", notification.payload},
        {"seen", notification.seen},
        {"createdAt", notification.created_at}
    };
}

void to_json(json& j, const AuditRecord& record) {
    j = {
        {"adminId", record.admin_id},
        {"action", record.action},
        {"entity", record.entity},
        {"entityId", record.entity_id},
        {"meta", record.meta},
        {"createdAt", record.created_at}
    };
}

void to_json(json& j, const ReconcileReport& report) {
    j = {
        {"userId", report.account_id},
        {"entries", report.entries},
        {"summed", report.summed},
        {"cached", report.cached},
        {"chainOk", report.chain_ok},
        {"balanced", report.balanced},
        {"neverNegative", report.never_negative},
        {"ok", report.ok()}
    };
}

void to_json(json& j, const HistoryPage& page) {
    j = json::object();
    j["entries"] = page.entries;
    j["nextBefore"] = page.next_before ? json(*page.next_before) : json(nullptr);
}

json details_to_json(const SubjectDetails& details) {
    return std::visit(DetailsWriter{}, details);
}

SubjectDetails details_from_json(SubjectKind kind, const json& j) {
    switch (kind) {
        case SubjectKind::UserProfile: {
            ProfileDetails d;
            d.username = j.value("username", std::string());
            return d;
        }
        case SubjectKind::Post: {
            PostDetails d;
            d.title = j.value("title", std::string());
            d.description = j.at("description").get<std::string>();
            return d;
        }
        case SubjectKind::ConnectionRequest: {
            ConnectionDetails d;
            d.target_account_id = j.at("targetUserId").get<AccountId>();
            if (j.contains("postId") && !j.at("postId").is_null()) {
                d.post_id = j.at("postId").get<SubjectId>();
            }
            return d;
        }
        case SubjectKind::TopupRequest: {
            TopupDetails d;
            d.amount_laari = j.at("amountLaari").get<int64_t>();
            d.price_per_coin_laari = j.value("pricePerCoinLaari", int64_t(0));
            d.computed_coins = j.value("computedCoins", coin_t(0));
            return d;
        }
    }
    return PostDetails{};
}

} // namespace atl
