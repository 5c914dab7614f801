#pragma once
/**
 * Mark2Docx — Discord webhook logging
 */

#include "config.h"

// Enables the webhook sink when cfg.webhook_url is set. Call once at startup.
void discord_init(const ServerConfig& cfg);
bool discord_enabled();

// Send a rich embed to the configured Discord webhook
void discord_log(const string& title, const string& description, int color = 0x2B579A);

// curl -K config file that POSTs the JSON file at payload_path to url.
string curl_webhook_config(const string& url, const string& payload_path);

// Keeps the first half of an address, e.g. "203.0.113.7" -> "203.0.*.*".
string mask_ip(const string& ip);

// Convenience helpers
void discord_log_conversion(size_t input_bytes, size_t output_bytes, long long elapsed_ms, const string& ip = "");
void discord_log_error(const string& context, const string& error, const string& ip = "");
void discord_log_server_start(const ServerConfig& cfg, const string& pandoc_version);
