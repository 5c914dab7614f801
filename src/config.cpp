/**
 * Mark2Docx — Configuration loading
 */

#include "config.h"

#include <unistd.h>

static string env_or(const char* name, const string& def) {
    const char* v = std::getenv(name);
    return (v && *v) ? string(v) : def;
}

// Parses a strictly positive integer no larger than max. Anything else is rejected.
static bool parse_positive(const string& raw, long max, long& out) {
    if (raw.empty()) return false;
    try {
        size_t used = 0;
        long v = std::stol(raw, &used);

        if (used != raw.size() || v <= 0 || v > max) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static string default_scratch_dir() {
    string tmp = env_or("TMPDIR", "");

    if (!tmp.empty()) return tmp;
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    return ec ? string("/tmp") : p.string();
}

ServerConfig load_config_from_env() {
    ServerConfig cfg;

    cfg.scratch_dir = env_or("MARK2DOCX_SCRATCH_DIR", default_scratch_dir());

    string pandoc = env_or("PANDOC_PATH", "");

    if (pandoc.empty()) pandoc = find_pandoc();
    if (pandoc.empty()) {
        cerr << "[Mark2Docx] WARNING: pandoc not found. Conversions will fail." << endl;
        pandoc = "pandoc";
    }
    cfg.converter_path = pandoc;

    long v = 0;
    string raw = env_or("CONVERT_TIMEOUT_SEC", "");

    if (!raw.empty()) {
        if (parse_positive(raw, 3600, v)) cfg.convert_timeout = std::chrono::seconds(v);
        else cerr << "[Mark2Docx] WARNING: ignoring CONVERT_TIMEOUT_SEC=" << raw << endl;
    }

    cfg.host = env_or("HOST", cfg.host);

    raw = env_or("PORT", "");

    if (!raw.empty()) {
        if (parse_positive(raw, 65535, v)) cfg.port = static_cast<int>(v);
        else cerr << "[Mark2Docx] WARNING: ignoring PORT=" << raw << endl;
    }

    raw = env_or("MAX_BODY_MB", "");

    if (!raw.empty()) {
        if (parse_positive(raw, 4096, v)) cfg.max_body_bytes = static_cast<size_t>(v) * 1024 * 1024;
        else cerr << "[Mark2Docx] WARNING: ignoring MAX_BODY_MB=" << raw << endl;
    }

    cfg.webhook_url = env_or("DISCORD_WEBHOOK_URL", "");
    return cfg;
}

bool prepare_scratch_dir(const ServerConfig& cfg) {
    std::error_code ec;

    if (!fs::exists(cfg.scratch_dir, ec)) fs::create_directories(cfg.scratch_dir, ec);

    if (ec || !fs::is_directory(cfg.scratch_dir, ec)) {
        cerr << "[Mark2Docx] Scratch directory unusable: " << cfg.scratch_dir << endl;
        return false;
    }

    if (access(cfg.scratch_dir.c_str(), W_OK | X_OK) != 0) {
        cerr << "[Mark2Docx] Scratch directory not writable: " << cfg.scratch_dir << endl;
        return false;
    }

    return true;
}
