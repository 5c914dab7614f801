/**
 * Mark2Docx - Markdown to Word conversion service
 * C++ Backend Server using cpp-httplib + pandoc
 */

#include "common.h"
#include "config.h"
#include "converter.h"
#include "discord.h"
#include "routes.h"

#include <csignal>

int main() {
    // A client hanging up mid-response must not kill the server.
    std::signal(SIGPIPE, SIG_IGN);

    ServerConfig cfg = load_config_from_env();

    if (!prepare_scratch_dir(cfg)) return 1;
    discord_init(cfg);

    PandocConverter pandoc(cfg.converter_path);
    string pandoc_version = pandoc.version();

    if (pandoc_version.empty()) {
        cerr << "[Mark2Docx] WARNING: " << cfg.converter_path << " did not run. Conversions will fail." << endl;
    } else {
        cout << "[Mark2Docx] pandoc found: " << cfg.converter_path << " (" << pandoc_version << ")" << endl;
    }

    httplib::Server svr;

    svr.set_payload_max_length(cfg.max_body_bytes);
    svr.set_read_timeout(60, 0);
    svr.set_write_timeout(60, 0);

    register_cors(svr);
    register_convert_routes(svr, cfg, pandoc);
    register_health_routes(svr, cfg, pandoc);

    cout << "[Mark2Docx] Server starting on http://" << cfg.host << ":" << cfg.port << endl;
    cout << "[Mark2Docx] Scratch directory: " << absolute_or_as_is(cfg.scratch_dir) << endl;
    cout << "[Mark2Docx] Conversion timeout: " << cfg.convert_timeout.count() << "s" << endl;
    if (discord_enabled()) cout << "[Mark2Docx] Discord webhook logging enabled" << endl;
    cout << "[Mark2Docx] Press Ctrl+C to stop" << endl;

    discord_log_server_start(cfg, pandoc_version);

    if (!svr.listen(cfg.host, cfg.port)) {
        cerr << "[Mark2Docx] Failed to start server on " << cfg.host << ":" << cfg.port << endl;
        return 1;
    }

    return 0;
}
