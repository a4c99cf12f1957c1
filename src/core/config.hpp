/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Deployment-time settings. Read once at startup from a JSON file (path from
 * ATL_CONFIG, default config/atl_config.json), then ATL_DB_CONN and ATL_PORT
 * from the environment. Nothing here is a per-request choice.
 * ============================================================================
 */

#ifndef ATL_CONFIG_HPP
#define ATL_CONFIG_HPP

#include <string>
#include <vector>
#include "atl_types.hpp"

namespace atl {

    struct WebhookDefinition {
        std::string id;         // e.g. "telegram-relay"
        std::string url;        // scheme://host:port
        std::string path;       // e.g. "/hooks/atl"
        bool is_active = true;
    };

    struct Config {
        coin_t cost_post = 2;
        coin_t cost_connect = 5;
        bool allow_refunds = true;
        bool require_target_accept = true;
        int64_t coin_price_laari = 1000;
        int64_t lock_timeout_ms = 2000;
        std::string store = "postgres";
        std::vector<WebhookDefinition> webhooks;

        std::string db_conn;
        int port = 8080;

        /**
         * @brief Builds a Config from the manifest JSON.
         * Missing keys keep their defaults.
         * @throws std::invalid_argument on negative costs, a non-positive
         * coin price or lock timeout, or an unknown store name.
         */
        static Config from_json(const json& manifest);

        /**
         * @brief Reads the manifest at `path`.
         * A missing file yields defaults (logged at WARN); a corrupt file throws.
         */
        static Config load(const std::string& path);

        // Overlays ATL_DB_CONN and ATL_PORT when set.
        void apply_environment();

        void validate() const;

        // Public subset served at GET /api/settings.
        json public_settings() const;
    };

    std::string default_config_path();

} // namespace atl

#endif // ATL_CONFIG_HPP
