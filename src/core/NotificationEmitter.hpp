/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: NotificationEmitter.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Records user-visible events after a ledger or workflow unit has committed
 * and forwards them to the registered sinks. Fire-and-forget: a failure here
 * is logged and dropped, it never reaches the caller.
 * ============================================================================
 */

#ifndef ATL_NOTIFICATION_EMITTER_HPP
#define ATL_NOTIFICATION_EMITTER_HPP

#include <string>
#include <vector>
#include "atl_types.hpp"
#include "../storage/Repository.hpp"

namespace atl {

namespace plugins {
class SinkManager;
}

// Event kinds rendered by the presentation layer.
namespace events {
    extern const char* const kProfileApproved;
    extern const char* const kProfileRejected;
    extern const char* const kPostApproved;
    extern const char* const kPostRejected;
    extern const char* const kConnectionApproved;
    extern const char* const kConnectionRejected;
    extern const char* const kConnectionCancelled;
    extern const char* const kConnectionRequestReceived;
    extern const char* const kTopupApproved;
    extern const char* const kTopupRejected;
    extern const char* const kCoinsDebited;
    extern const char* const kCoinsRefunded;
    extern const char* const kBalanceAdjusted;
}

class NotificationEmitter {
public:
    // `sinks` may be null; events are then only stored.
    NotificationEmitter(storage::Repository& repo, plugins::SinkManager* sinks = nullptr);

    void emit(AccountId account_id, const std::string& kind, const json& payload);

    std::vector<Notification> notifications(AccountId account_id, std::size_t limit = 50) const;

    // false when the id is unknown or belongs to someone else.
    bool mark_seen(int64_t notification_id, AccountId account_id);

private:
    storage::Repository& repo_;
    plugins::SinkManager* sinks_;
};

} // namespace atl

#endif // ATL_NOTIFICATION_EMITTER_HPP
