/**
 * Mark2Docx — Conversion route handler
 * POST /api/convert: Markdown JSON in, DOCX attachment out.
 */

#include "common.h"
#include "discord.h"
#include "routes.h"
#include "scratch.h"

// ─── Request classification ─────────────────────────────────────────────────

bool is_json_request(const httplib::Request& req) {
    string type = to_lower(req.get_header_value("Content-Type"));
    auto semi = type.find(';');

    if (semi != string::npos) type = type.substr(0, semi);
    type = trim(type);

    if (type == "application/json") return true;

    const string suffix = "+json";
    return type.rfind("application/", 0) == 0 &&
           type.size() > suffix.size() &&
           type.compare(type.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ─── Conversion ─────────────────────────────────────────────────────────────

// Runs inside the lifetime of one ScratchArtifacts; every return leaves
// cleanup to its destructor.
static void convert_in_scratch(const string& markdown, const ScratchArtifacts& scratch,
                               const httplib::Request& req, httplib::Response& res,
                               const ServerConfig& cfg, Converter& converter) {
    try {
        write_file_binary(scratch.input_path(), markdown);
    } catch (const std::exception& e) {
        cerr << "[Mark2Docx] Scratch write failed: " << e.what() << endl;
        discord_log_error("Scratch write", "Could not write input file", req.remote_addr);
        send_json_error(res, 500, "Failed to prepare conversion");
        return;
    }

    auto started = std::chrono::steady_clock::now();
    ProcessResult result = converter.run(scratch.input_path(), scratch.output_path(), cfg.convert_timeout);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (result.timed_out) {
        cerr << "[Mark2Docx] Pandoc timed out after " << cfg.convert_timeout.count() << "s" << endl;
        discord_log_error("Pandoc", "Timed out after " + to_string(cfg.convert_timeout.count()) + "s", req.remote_addr);
        send_json_error(res, 500, "Pandoc conversion timed out");
        return;
    }

    if (result.exit_code != 0) {
        cerr << "[Mark2Docx] Pandoc Error (exit " << result.exit_code << "): " << result.stderr_text << endl;
        discord_log_error("Pandoc", "Exit code " + to_string(result.exit_code), req.remote_addr);
        res.status = 500;
        // Converter output is not guaranteed to be valid UTF-8.
        res.set_content(json({
            {"error", "Pandoc conversion failed"},
            {"details", result.stderr_text}
        }).dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        return;
    }

    std::error_code ec;

    if (!fs::exists(scratch.output_path(), ec)) {
        cerr << "[Mark2Docx] Pandoc exited 0 but produced no output" << endl;
        discord_log_error("Pandoc", "Output file missing after successful exit", req.remote_addr);
        send_json_error(res, 500, "Converted file not found on server");
        return;
    }

    string data;
    try {
        data = read_file_binary(scratch.output_path());
    } catch (const std::exception& e) {
        cerr << "[Mark2Docx] Reading converted file failed: " << e.what() << endl;
        discord_log_error("Read output", "Could not read converted file", req.remote_addr);
        send_json_error(res, 500, "Failed to read converted file");
        return;
    }

    cout << "[Mark2Docx] Converted " << markdown.size() << " bytes -> "
         << data.size() << " bytes in " << elapsed_ms << " ms" << endl;
    discord_log_conversion(markdown.size(), data.size(), elapsed_ms, req.remote_addr);

    res.status = 200;
    res.set_content(std::move(data), DOCX_MIME_TYPE);
    res.set_header("Content-Disposition", "attachment; filename=\"" + DOCX_DOWNLOAD_NAME + "\"");
}

void handle_convert(const httplib::Request& req, httplib::Response& res,
                    const ServerConfig& cfg, Converter& converter) {
    if (!is_json_request(req)) {
        send_json_error(res, 415, "Request must be JSON");
        return;
    }

    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::parse_error&) {
        send_json_error(res, 400, "Invalid JSON in request body");
        return;
    }

    string markdown = json_str(body, "markdown");

    if (markdown.empty()) {
        send_json_error(res, 400, "Missing 'markdown' key in request body");
        return;
    }

    cout << "[Mark2Docx] Convert request: " << markdown.size() << " bytes" << endl;

    try {
        ScratchArtifacts scratch(cfg.scratch_dir, ".md", ".docx");
        convert_in_scratch(markdown, scratch, req, res, cfg, converter);
    } catch (const std::exception& e) {
        cerr << "[Mark2Docx] Conversion error: " << e.what() << endl;
        discord_log_error("Convert", e.what(), req.remote_addr);
        send_json_error(res, 500, "Internal server error");
    }
}

// ─── Registration ───────────────────────────────────────────────────────────

void register_convert_routes(httplib::Server& svr, const ServerConfig& cfg, Converter& converter) {

    // ── POST /api/convert — Markdown to DOCX via pandoc ─────────────────────
    svr.Post("/api/convert", [&cfg, &converter](const httplib::Request& req, httplib::Response& res) {
        handle_convert(req, res, cfg, converter);
    });
}
