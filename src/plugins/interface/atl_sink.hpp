/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: atl_sink.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Interfaces for the collaborators that consume what the ledger core emits.
 * A notification sink pushes user-visible events to a transport the core does
 * not own (webhook relay, chat bot). An audit sink stores one record per
 * administrative call. Implement these to plug a new consumer in.
 * ============================================================================
 */

#ifndef ATL_SINK_HPP
#define ATL_SINK_HPP

#include <string>
#include "../../core/atl_types.hpp"

namespace atl {

    class INotificationSink {
    public:
        virtual ~INotificationSink() {}

        /**
         * @return The display name of the sink (e.g. "Telegram Relay")
         */
        virtual std::string get_sink_name() = 0;

        /**
         * @brief Push one stored notification.
         * @return false when the transport refused or was unreachable.
         * May throw; callers treat a throw like false.
         */
        virtual bool deliver(const Notification& notification) = 0;
    };

    class IAuditSink {
    public:
        virtual ~IAuditSink() {}

        virtual void record(const AuditRecord& record) = 0;
    };

} // namespace atl

#endif // ATL_SINK_HPP
