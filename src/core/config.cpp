#include "config.hpp"
#include "logging.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace atl {

Config Config::from_json(const json& manifest) {
    Config config;
    config.cost_post = manifest.value("costPost", config.cost_post);
    config.cost_connect = manifest.value("costConnect", config.cost_connect);
    config.allow_refunds = manifest.value("allowRefunds", config.allow_refunds);
    config.require_target_accept = manifest.value("requireTargetAccept", config.require_target_accept);
    config.coin_price_laari = manifest.value("coinPriceLaari", config.coin_price_laari);
    config.lock_timeout_ms = manifest.value("lockTimeoutMs", config.lock_timeout_ms);
    config.store = manifest.value("store", config.store);
    config.db_conn = manifest.value("dbConn", config.db_conn);
    config.port = manifest.value("port", config.port);

    if (manifest.contains("webhooks")) {
        for (const auto& hook : manifest.at("webhooks")) {
            WebhookDefinition def;
            def.id = hook.at("id").get<std::string>();
            def.url = hook.at("url").get<std::string>();
            def.path = hook.value("path", std::string("/"));
            def.is_active = hook.value("active", true);
            config.webhooks.push_back(def);
        }
    }

    config.validate();
    return config;
}

Config Config::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        atl_log("WARN", "Config file " + path + " missing. Using system defaults.");
        return Config();
    }

    json manifest;
    try {
        manifest = json::parse(ifs);
    } catch (const json::exception& e) {
        atl_log("ERROR", "Config Parse Error: " + std::string(e.what()));
        throw std::runtime_error("configuration file is corrupt: " + path);
    }
    return from_json(manifest);
}

void Config::apply_environment() {
    if (const char* env_db = std::getenv("ATL_DB_CONN")) {
        db_conn = env_db;
    }
    if (const char* env_port = std::getenv("ATL_PORT")) {
        try {
            port = std::stoi(env_port);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("ATL_PORT is not a number: ") + env_port);
        }
    }
}

void Config::validate() const {
    if (cost_post < 0 || cost_connect < 0) {
        throw std::invalid_argument("action costs must not be negative");
    }
    if (coin_price_laari <= 0) {
        throw std::invalid_argument("coinPriceLaari must be positive");
    }
    if (lock_timeout_ms <= 0) {
        throw std::invalid_argument("lockTimeoutMs must be positive");
    }
    if (store != "postgres" && store != "memory") {
        throw std::invalid_argument("store must be \"postgres\" or \"memory\", got \"" + store + "\"");
    }
}

json Config::public_settings() const {
    return {
        {"costPost", cost_post},
        {"costConnect", cost_connect},
        {"allowRefunds", allow_refunds},
        {"requireTargetAccept", require_target_accept},
        {"coinPriceLaari", coin_price_laari}
    };
}

std::string default_config_path() {
    const char* env_path = std::getenv("ATL_CONFIG");
    return env_path ? env_path : "config/atl_config.json";
}

} // namespace atl
