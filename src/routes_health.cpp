/**
 * Mark2Docx — Health and CORS routes
 * /api/health, OPTIONS preflight
 */

#include "common.h"
#include "routes.h"

void register_health_routes(httplib::Server& svr, const ServerConfig& cfg, const PandocConverter& pandoc) {

    // ── GET /api/health — server health check ───────────────────────────────
    svr.Get("/api/health", [&cfg, &pandoc](const httplib::Request&, httplib::Response& res) {
        string version = pandoc.version();

        json response = {
            {"status", "ok"},
            {"server", "Mark2Docx v" MARK2DOCX_VERSION},
            {"pandoc_available", !version.empty()},
            {"pandoc_version", version.empty() ? "not installed" : version},
            {"timeout_sec", cfg.convert_timeout.count()}
        };
        res.set_content(response.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    });
}

void register_cors(httplib::Server& svr) {
    svr.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });
}
