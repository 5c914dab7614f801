/**
 * Mark2Docx — Discord webhook logging implementation
 * Sends rich embeds to a Discord channel via webhook + curl.
 */

#include "discord.h"
#include "process.h"
#include "scratch.h"

#include <unistd.h>

// Set once by discord_init() before the server starts listening.
static string g_webhook_url;
static string g_scratch_dir;
static string g_hostname;

// ─── Internal: fire-and-forget POST via curl ────────────────────────────────

// Created empty and chmod'ed before the content goes in.
static void write_private_file(const string& path, const string& data) {
    write_file_binary(path, "");
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    write_file_binary(path, data);
}

static string curl_quote(const string& value) {
    string out = "\"";

    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';

        if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else out += c;
    }

    return out + "\"";
}

// The webhook URL holds its secret token, so it and the payload travel in
// owner-only files under the scratch dir instead of on curl's command line.
static void discord_send(const json& payload) {
    if (g_webhook_url.empty()) return;
    string url = g_webhook_url;
    string dir = g_scratch_dir;
    string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);

    thread([url, dir, body]() {
        try {
            ScratchArtifacts files(dir, ".json", ".curlrc");
            write_private_file(files.input_path(), body);
            write_private_file(files.output_path(), curl_webhook_config(url, files.input_path()));

            auto r = run_process({"curl", "-q", "-K", files.output_path()}, std::chrono::seconds(15));

            if (r.timed_out || r.exit_code != 0) {
                cerr << "[Mark2Docx] Discord webhook failed (curl exit " << r.exit_code << ")" << endl;
            }
        } catch (const std::exception& e) {
            cerr << "[Mark2Docx] Discord webhook error: " << e.what() << endl;
        }
    }).detach();
}

// ─── Get ISO-8601 timestamp ─────────────────────────────────────────────────

static string iso_now() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    char buf[32];
    struct tm gmt;
    gmtime_r(&t, &gmt);
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return string(buf);
}

static string human_size(size_t bytes) {
    char buf[32];

    if (bytes < 1024) snprintf(buf, sizeof(buf), "%zu B", bytes);
    else if (bytes < 1024 * 1024) snprintf(buf, sizeof(buf), "%.1f KB", bytes / 1024.0);
    else snprintf(buf, sizeof(buf), "%.1f MB", bytes / (1024.0 * 1024.0));
    return string(buf);
}

// ─── Public API ─────────────────────────────────────────────────────────────

void discord_init(const ServerConfig& cfg) {
    g_webhook_url = cfg.webhook_url;
    g_scratch_dir = cfg.scratch_dir;

    if (g_scratch_dir.empty()) {
        std::error_code ec;
        auto tmp = fs::temp_directory_path(ec);
        g_scratch_dir = ec ? string("/tmp") : tmp.string();
    }

    char host[256] = {0};

    if (gethostname(host, sizeof(host) - 1) == 0) g_hostname = host;
}

bool discord_enabled() {
    return !g_webhook_url.empty();
}

string curl_webhook_config(const string& url, const string& payload_path) {
    return "url = " + curl_quote(url) + "\n"
           "request = \"POST\"\n"
           "header = \"Content-Type: application/json\"\n"
           "data-binary = " + curl_quote("@" + payload_path) + "\n"
           "silent\n";
}

string mask_ip(const string& ip) {
    if (ip.empty()) return "unknown";

    if (ip.find(':') != string::npos) {
        // IPv6: keep the first two groups
        auto first = ip.find(':');
        auto second = ip.find(':', first + 1);

        if (second == string::npos) return "*";
        return ip.substr(0, second) + ":*";
    }

    auto first = ip.find('.');
    auto second = (first == string::npos) ? string::npos : ip.find('.', first + 1);

    if (second == string::npos) return "*";
    return ip.substr(0, second) + ".*.*";
}

void discord_log(const string& title, const string& description, int color) {
    string footer_text = "Mark2Docx v" MARK2DOCX_VERSION;

    if (!g_hostname.empty()) footer_text += " • " + g_hostname;
    json embed = {
        {"title",       title},
        {"description", description},
        {"color",       color},
        {"timestamp",   iso_now()},
        {"footer",      {{"text", footer_text}}}
    };
    json payload = {{"embeds", json::array({embed})}};
    discord_send(payload);
}

void discord_log_conversion(size_t input_bytes, size_t output_bytes, long long elapsed_ms, const string& ip) {
    string desc = "📝 **Markdown** › `" + human_size(input_bytes) + "`\n"
                  "📄 **DOCX** › `" + human_size(output_bytes) + "`\n"
                  "⏱️ **Elapsed** › `" + to_string(elapsed_ms) + " ms`\n"
                  "🌐 **Client** › `" + mask_ip(ip) + "`";
    discord_log("✅ Document Converted", desc, 0x57F287);
}

void discord_log_error(const string& context, const string& error, const string& ip) {
    string desc = "🔍 **Context** › `" + context + "`\n"
                  "💥 **Error** › " + error + "\n"
                  "🌐 **Client** › `" + mask_ip(ip) + "`";
    discord_log("❌ Conversion Failed", desc, 0xED4245);  // Discord red
}

void discord_log_server_start(const ServerConfig& cfg, const string& pandoc_version) {
    string desc = "🌐 **Port** › `" + to_string(cfg.port) + "`\n"
                  "⏱️ **Timeout** › `" + to_string(cfg.convert_timeout.count()) + " s`\n\n"
                  "**📦 Dependencies**\n";
    desc += (pandoc_version.empty() ? "❌ pandoc" : "✅ " + pandoc_version);

    discord_log("🚀 Server Online", desc, 0x5865F2);  // Discord blurple
}
