/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: SinkManager.cpp
 * ============================================================================
 * * DESCRIPTION:
 * Implementation of the SinkManager and the webhook transport. Sinks run
 * outside the ledger's transactions; nothing that happens here can undo a
 * committed coin movement.
 * ============================================================================
 */

#include "SinkManager.hpp"
#include "../../core/json_codec.hpp"
#include "../../core/logging.hpp"
#include <httplib.h>

namespace atl {
namespace plugins {

namespace {

const int kMaxConsecutiveFailures = 3;

} // namespace

// ----------------------------------------------------------------------------
// WebhookSink
// ----------------------------------------------------------------------------
WebhookSink::WebhookSink(const WebhookDefinition& def) : def_(def) {}

std::string WebhookSink::get_sink_name() {
    return "webhook:" + def_.id;
}

bool WebhookSink::deliver(const Notification& notification) {
    json request_body = {
        {"event", notification},
        {"source", "ATL_CORE"}
    };

    httplib::Client cli(def_.url);
    cli.set_connection_timeout(2, 0);
    cli.set_read_timeout(5, 0);

    auto res = cli.Post(def_.path, request_body.dump(), "application/json");
    if (!res) {
        atl_log("WARN", "Webhook " + def_.id + " unreachable: " + httplib::to_string(res.error()));
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        atl_log("WARN", "Webhook " + def_.id + " answered " + std::to_string(res->status));
        return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// SinkManager
// ----------------------------------------------------------------------------
SinkManager::SinkManager() {
    atl_log("INFO", "Sink Manager Initialised.");
}

SinkManager::~SinkManager() {
    std::lock_guard<std::mutex> lock(mutex_);
    registry_.clear();
}

bool SinkManager::RegisterSink(const std::string& id, std::shared_ptr<INotificationSink> sink) {
    if (!sink) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (registry_.find(id) != registry_.end()) {
        atl_log("ERROR", "Sink ID conflict: " + id);
        return false;
    }

    Slot slot;
    slot.sink = sink;
    registry_[id] = slot;
    atl_log("INFO", "Registered Sink: " + sink->get_sink_name() + " (" + id + ")");
    return true;
}

std::size_t SinkManager::RegisterWebhooks(const std::vector<WebhookDefinition>& hooks) {
    std::size_t added = 0;
    for (const auto& hook : hooks) {
        if (RegisterSink(hook.id, std::make_shared<WebhookSink>(hook))) {
            SetActive(hook.id, hook.is_active);
            ++added;
        }
    }
    return added;
}

void SinkManager::SetActive(const std::string& id, bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(id);
    if (it == registry_.end()) return;
    it->second.is_active = active;
    if (active) it->second.consecutive_failures = 0;
}

std::size_t SinkManager::Dispatch(const Notification& notification) {
    std::vector<std::pair<std::string, std::shared_ptr<INotificationSink>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : registry_) {
            if (kv.second.is_active) targets.emplace_back(kv.first, kv.second.sink);
        }
    }

    std::size_t delivered = 0;
    for (const auto& target : targets) {
        bool ok = false;
        try {
            ok = target.second->deliver(notification);
        } catch (const std::exception& e) {
            atl_log("WARN", "Sink " + target.first + " threw: " + e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registry_.find(target.first);
        if (it == registry_.end()) continue;
        if (ok) {
            it->second.consecutive_failures = 0;
            ++delivered;
        } else if (++it->second.consecutive_failures >= kMaxConsecutiveFailures && it->second.is_active) {
            it->second.is_active = false;
            atl_log("WARN", "Sink lost connection, marked inactive: " + target.first);
        }
    }
    return delivered;
}

std::vector<std::string> SinkManager::ActiveSinks() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : registry_) {
        if (kv.second.is_active) ids.push_back(kv.first);
    }
    return ids;
}

} // namespace plugins
} // namespace atl
