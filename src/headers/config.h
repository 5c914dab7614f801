#pragma once
/**
 * Mark2Docx — Server configuration
 *
 * Built once at startup from the environment and passed by reference into
 * route registration. Never mutated after the server starts listening.
 *
 *   MARK2DOCX_SCRATCH_DIR  scratch directory (default: $TMPDIR or system temp)
 *   PANDOC_PATH            converter executable (default: pandoc on $PATH)
 *   CONVERT_TIMEOUT_SEC    converter wall-clock limit (default: 30)
 *   HOST / PORT            bind address (default: 0.0.0.0:5001)
 *   MAX_BODY_MB            request payload limit (default: 50)
 *   DISCORD_WEBHOOK_URL    remote log sink (default: disabled)
 */

#include "common.h"

struct ServerConfig {
    string               scratch_dir;
    string               converter_path   = "pandoc";
    std::chrono::seconds convert_timeout{30};
    string               host             = "0.0.0.0";
    int                  port             = 5001;
    size_t               max_body_bytes   = 50 * 1024 * 1024;
    string               webhook_url;
};

// Reads the variables listed above. Bad numeric values keep the default.
ServerConfig load_config_from_env();

// Creates the scratch directory if needed. Returns false when it is unusable.
bool prepare_scratch_dir(const ServerConfig& cfg);
