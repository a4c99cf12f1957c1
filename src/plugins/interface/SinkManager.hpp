/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: SinkManager.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Routing table for notification sinks. The core hands every stored
 * notification to Dispatch; the manager fans it out to the active sinks and
 * hides transport failures from the caller.
 * ============================================================================
 */

#ifndef ATL_SINK_MANAGER_HPP
#define ATL_SINK_MANAGER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "atl_sink.hpp"
#include "../../core/config.hpp"

namespace atl {
namespace plugins {

    /**
     * @brief Posts each notification as JSON to an external endpoint
     * (e.g. a Telegram relay) with cpp-httplib.
     */
    class WebhookSink : public INotificationSink {
    public:
        explicit WebhookSink(const WebhookDefinition& def);

        std::string get_sink_name() override;
        bool deliver(const Notification& notification) override;

    private:
        WebhookDefinition def_;
    };

    class SinkManager {
    public:
        SinkManager();
        ~SinkManager();

        /**
         * @brief Adds a sink under a unique id.
         * @return false on an id conflict or a null sink.
         */
        bool RegisterSink(const std::string& id, std::shared_ptr<INotificationSink> sink);

        // Registers a WebhookSink per configured webhook. Returns how many were added.
        std::size_t RegisterWebhooks(const std::vector<WebhookDefinition>& hooks);

        void SetActive(const std::string& id, bool active);

        /**
         * @brief Delivers to every active sink.
         * A sink that fails three times in a row is marked inactive.
         * @return number of sinks that accepted the notification.
         */
        std::size_t Dispatch(const Notification& notification);

        std::vector<std::string> ActiveSinks() const;

    private:
        struct Slot {
            std::shared_ptr<INotificationSink> sink;
            bool is_active = true;
            int consecutive_failures = 0;
        };

        mutable std::mutex mutex_;
        std::map<std::string, Slot> registry_;
    };

} // namespace plugins
} // namespace atl

#endif // ATL_SINK_MANAGER_HPP
