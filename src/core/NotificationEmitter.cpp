#include "NotificationEmitter.hpp"
#include "logging.hpp"
#include "../plugins/interface/SinkManager.hpp"

namespace atl {

namespace events {
    const char* const kProfileApproved = "PROFILE_APPROVED";
    const char* const kProfileRejected = "PROFILE_REJECTED";
    const char* const kPostApproved = "POST_APPROVED";
    const char* const kPostRejected = "POST_REJECTED";
    const char* const kConnectionApproved = "CONNECTION_APPROVED";
    const char* const kConnectionRejected = "CONNECTION_REJECTED";
    const char* const kConnectionCancelled = "CONNECTION_CANCELLED";
    const char* const kConnectionRequestReceived = "CONNECTION_REQUEST_RECEIVED";
    const char* const kTopupApproved = "TOPUP_APPROVED";
    const char* const kTopupRejected = "TOPUP_REJECTED";
    const char* const kCoinsDebited = "COINS_DEBITED";
    const char* const kCoinsRefunded = "COINS_REFUNDED";
    const char* const kBalanceAdjusted = "BALANCE_ADJUSTED";
}

NotificationEmitter::NotificationEmitter(storage::Repository& repo, plugins::SinkManager* sinks)
    : repo_(repo), sinks_(sinks) {}

void NotificationEmitter::emit(AccountId account_id, const std::string& kind, const json& payload) {
    Notification stored;
    try {
        stored = repo_.insert_notification(account_id, kind, payload);
    } catch (const std::exception& e) {
        atl_log("WARN", "Notification " + kind + " for account " + std::to_string(account_id) +
                " dropped: " + e.what());
        return;
    }

    if (sinks_ != nullptr) {
        sinks_->Dispatch(stored);
    }
}

std::vector<Notification> NotificationEmitter::notifications(AccountId account_id, std::size_t limit) const {
    return repo_.notifications(account_id, limit);
}

bool NotificationEmitter::mark_seen(int64_t notification_id, AccountId account_id) {
    return repo_.mark_notification_seen(notification_id, account_id);
}

} // namespace atl
