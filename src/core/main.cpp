/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: main.cpp
 * ============================================================================
 * * DESCRIPTION:
 * HTTP surface of the ledger. Authentication happens at the gateway, which
 * forwards the caller's account id in Remote-User and group membership in
 * Remote-Groups.
 * ============================================================================
 */

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "atl_types.hpp"
#include "audit.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "LedgerCore.hpp"
#include "logging.hpp"
#include "../plugins/interface/SinkManager.hpp"
#include "../storage/MemoryRepository.hpp"
#include "../storage/PgRepository.hpp"

using namespace atl;

namespace {

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return 200;
        case ErrorCode::InsufficientBalance:
        case ErrorCode::NotEligible:
        case ErrorCode::InvalidTarget:
        case ErrorCode::InvalidDelta:
        case ErrorCode::DomainEffectFailed: return 400;
        case ErrorCode::NotOwner:
        case ErrorCode::Forbidden: return 403;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::AlreadyDecided: return 409;
        case ErrorCode::StoreBusy: return 503;
        case ErrorCode::RefundError:
        case ErrorCode::IntegrityViolation: return 500;
    }
    return 500;
}

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    send_json(res, status, {{"error", message}});
}

void send_outcome(httplib::Response& res, const Outcome& outcome) {
    json body = {
        {"ok", outcome.ok},
        {"code", to_string(outcome.code)},
        {"message", outcome.message}
    };
    if (outcome.subject) {
        body["subject"] = {{"kind", to_string(outcome.subject->kind)}, {"id", outcome.subject->id}};
    }
    send_json(res, http_status_for(outcome.code), body);
}

bool is_admin(const httplib::Request& req) {
    if (req.has_header("Remote-Groups")) {
        std::string groups = req.get_header_value("Remote-Groups");
        return groups.find("admins") != std::string::npos;
    }
    return false;
}

std::optional<AccountId> caller_id(const httplib::Request& req) {
    if (!req.has_header("Remote-User")) return std::nullopt;
    try {
        return std::stoll(req.get_header_value("Remote-User"));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<SubjectKind> kind_for_segment(const std::string& segment) {
    if (segment == "profiles") return SubjectKind::UserProfile;
    if (segment == "posts") return SubjectKind::Post;
    if (segment == "connections") return SubjectKind::ConnectionRequest;
    if (segment == "topups") return SubjectKind::TopupRequest;
    return std::nullopt;
}

std::size_t param_or(const httplib::Request& req, const char* name, std::size_t fallback) {
    if (!req.has_param(name)) return fallback;
    return static_cast<std::size_t>(std::stoul(req.get_param_value(name)));
}

json body_of(const httplib::Request& req) {
    return req.body.empty() ? json::object() : json::parse(req.body);
}

} // namespace

int main() {
    Config config;
    try {
        config = Config::load(default_config_path());
        config.apply_environment();
        config.validate();
    } catch (const std::exception& e) {
        atl_log("FATAL", std::string("Configuration rejected: ") + e.what());
        return 1;
    }

    std::unique_ptr<storage::Repository> repo;
    if (config.store == "postgres") {
        if (config.db_conn.empty()) {
            atl_log("FATAL", "Database connection variable missing. System halted.");
            return 1;
        }
        std::unique_ptr<storage::PgRepository> pg(new storage::PgRepository(config.db_conn, config.lock_timeout_ms));
        try {
            pg->ensure_schema();
        } catch (const std::exception& e) {
            atl_log("FATAL", std::string("Database bootstrap failed: ") + e.what());
            return 1;
        }
        repo = std::move(pg);
    } else {
        atl_log("WARN", "Running on the in-memory store. Nothing survives a restart.");
        repo.reset(new storage::MemoryRepository(std::chrono::milliseconds(config.lock_timeout_ms)));
    }

    plugins::SinkManager sink_manager;
    std::size_t hooks = sink_manager.RegisterWebhooks(config.webhooks);
    atl_log("INFO", std::to_string(hooks) + " notification webhook(s) registered.");

    RepositoryAuditSink audit_sink(*repo);
    LedgerCore core(*repo, config, audit_sink, &sink_manager);

    httplib::Server svr;
    atl_log("INFO", "ATL Coin Ledger: Engine Active.");

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        atl_log("INFO", "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status));
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const json::exception& e) {
            atl_log("WARN", "Malformed request body on " + req.path + ": " + e.what());
            send_error(res, 400, "Invalid request format.");
        } catch (const std::invalid_argument& e) {
            send_error(res, 400, e.what());
        } catch (const std::exception& e) {
            atl_log("ERROR", "Unhandled failure on " + req.path + ": " + e.what());
            send_error(res, 500, "Internal error.");
        }
    });

    // === [SEARCH: COIN WALLET ROUTES] ===
    svr.Get("/api/coins/balance", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        send_json(res, 200, {{"userId", *me}, {"coins", core.balance_of(*me)}});
    });

    svr.Get("/api/coins/ledger", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }

        PageRequest page;
        page.limit = std::min<std::size_t>(param_or(req, "limit", 50), 200);
        if (req.has_param("before")) page.before = std::stoll(req.get_param_value("before"));
        send_json(res, 200, core.history(*me, page));
    });

    svr.Post("/api/coins/topups", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        json j = body_of(req);
        send_outcome(res, core.request_topup(*me, j.at("amountLaari").get<int64_t>()));
    });

    svr.Get("/api/coins/topups", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        send_json(res, 200, {{"items", core.subjects_of(*me, SubjectKind::TopupRequest)}});
    });

    // === [SEARCH: USER ACTION ROUTES] ===
    svr.Get("/api/posts", [&](const httplib::Request& req, httplib::Response& res) {
        send_json(res, 200, {{"items", core.approved_posts(std::min<std::size_t>(param_or(req, "limit", 50), 200),
                                                           param_or(req, "offset", 0))}});
    });

    svr.Get("/api/posts/my", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        send_json(res, 200, {{"items", core.subjects_of(*me, SubjectKind::Post)}});
    });

    svr.Post("/api/posts", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        json j = body_of(req);
        send_outcome(res, core.create_post(*me, j.value("title", std::string()),
                                           j.value("description", std::string())));
    });

    svr.Post("/api/connect", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        json j = body_of(req);
        std::optional<SubjectId> post_id;
        if (j.contains("postId") && !j["postId"].is_null()) post_id = j["postId"].get<int64_t>();
        send_outcome(res, core.send_connection(*me, j.at("targetUserId").get<int64_t>(), post_id));
    });

    svr.Get(R"(/api/connect/(sent|received))", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        auto items = req.matches[1] == "sent" ? core.subjects_of(*me, SubjectKind::ConnectionRequest)
                                              : core.connections_to(*me);
        send_json(res, 200, {{"items", items}});
    });

    svr.Post(R"(/api/connect/(\d+)/cancel)", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        send_outcome(res, core.cancel_connection(std::stoll(req.matches[1]), *me));
    });

    svr.Post("/api/me/resubmit", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        send_outcome(res, core.resubmit_profile(*me));
    });

    // === [SEARCH: ADMIN MODERATION ROUTES] ===
    svr.Post(R"(/api/admin/(profiles|posts|connections|topups)/(\d+)/(approve|reject))",
             [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me || !is_admin(req)) {
            atl_log("WARN", "Unauthorized moderation attempt blocked.");
            send_error(res, 403, "Action Requires Administrator Privileges.");
            return;
        }
        SubjectRef ref{*kind_for_segment(req.matches[1]), std::stoll(req.matches[2])};
        Decision decision = req.matches[3] == "approve" ? Decision::Approved : Decision::Rejected;
        json j = body_of(req);
        send_outcome(res, core.decide(ref, decision, *me, j.value("note", std::string())));
    });

    svr.Get(R"(/api/admin/queue/(profiles|posts|connections|topups))",
            [&](const httplib::Request& req, httplib::Response& res) {
        if (!is_admin(req)) { res.status = 403; return; }
        std::optional<SubjectStatus> status;
        if (req.has_param("status")) status = status_from_string(req.get_param_value("status"));
        auto items = repo->subjects(*kind_for_segment(req.matches[1]), status,
                                    param_or(req, "limit", 50), param_or(req, "offset", 0));
        send_json(res, 200, {{"items", items}});
    });

    svr.Post("/api/admin/accounts", [&](const httplib::Request& req, httplib::Response& res) {
        if (!is_admin(req)) { res.status = 403; return; }
        json j = body_of(req);
        Role role = role_from_string(j.value("role", std::string("USER")));
        send_outcome(res, core.register_account(j.at("username").get<std::string>(), role));
    });

    svr.Post("/api/admin/adjust", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me || !is_admin(req)) { res.status = 403; return; }
        json j = body_of(req);
        send_outcome(res, core.adjust(j.at("userId").get<int64_t>(), j.at("delta").get<int64_t>(), *me,
                                      j.value("note", std::string())));
    });

    svr.Get(R"(/api/admin/reconcile/(\d+))", [&](const httplib::Request& req, httplib::Response& res) {
        if (!is_admin(req)) { res.status = 403; return; }
        ReconcileReport report = core.reconcile(std::stoll(req.matches[1]));
        send_json(res, report.ok() ? 200 : 500, report);
    });

    svr.Get("/api/admin/audits", [&](const httplib::Request& req, httplib::Response& res) {
        if (!is_admin(req)) { res.status = 403; return; }
        send_json(res, 200, {{"items", repo->audits(param_or(req, "limit", 50), param_or(req, "offset", 0))}});
    });

    // === [SEARCH: NOTIFICATION ROUTES] ===
    svr.Get("/api/notifications", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        send_json(res, 200, {{"items", core.notifications().notifications(*me, param_or(req, "limit", 50))}});
    });

    svr.Post(R"(/api/notifications/(\d+)/seen)", [&](const httplib::Request& req, httplib::Response& res) {
        auto me = caller_id(req);
        if (!me) { res.status = 401; return; }
        if (!core.notifications().mark_seen(std::stoll(req.matches[1]), *me)) {
            send_error(res, 404, "Notification not found.");
            return;
        }
        send_json(res, 200, {{"status", "SUCCESS"}});
    });

    // === [SEARCH: SETTINGS & SYSTEM ROUTES] ===
    svr.Get("/api/settings", [&](const httplib::Request& req, httplib::Response& res) {
        if (!caller_id(req)) { res.status = 401; return; }
        send_json(res, 200, core.config().public_settings());
    });

    svr.Get("/api/system/logs", [&](const httplib::Request& req, httplib::Response& res) {
        if (!is_admin(req)) {
            atl_log("WARN", "Unauthorized log access blocked.");
            send_error(res, 403, "Action Requires Administrator Privileges.");
            return;
        }
        json response;
        response["logs"] = req.has_param("level") ? recent_logs(req.get_param_value("level")) : recent_logs();
        response["sinks"] = sink_manager.ActiveSinks();
        send_json(res, 200, response);
    });

    // === [SEARCH: SERVER INITIALIZATION] ===
    atl_log("INFO", "ATL Server running on port " + std::to_string(config.port));
    if (!svr.listen("0.0.0.0", config.port)) {
        atl_log("FATAL", "Could not bind port " + std::to_string(config.port));
        return 1;
    }
    return 0;
}
