#pragma once
/**
 * Mark2Docx — Route registration
 */

#include "common.h"
#include "config.h"
#include "converter.h"

// Fixed names the client sees; the scratch token never leaves the server.
inline const string DOCX_DOWNLOAD_NAME = "converted_document.docx";
inline const string DOCX_MIME_TYPE =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document";

// application/json or application/*+json, parameters ignored.
bool is_json_request(const httplib::Request& req);

// POST /api/convert body handler. Always leaves a complete response in res
// and never lets an exception escape. Scratch files are gone on return.
void handle_convert(const httplib::Request& req, httplib::Response& res,
                    const ServerConfig& cfg, Converter& converter);

void register_convert_routes(httplib::Server& svr, const ServerConfig& cfg, Converter& converter);
void register_health_routes(httplib::Server& svr, const ServerConfig& cfg, const PandocConverter& pandoc);
void register_cors(httplib::Server& svr);
