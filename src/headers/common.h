#pragma once
/**
 * Mark2Docx — Common header
 * Shared includes, using declarations, and utility declarations
 */

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <array>
#include <memory>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdio>
#include <chrono>
#include <thread>
#include <algorithm>
#include <vector>
#include <functional>

// ─── Type aliases & namespace shortcuts ─────────────────────────────────────

using json = nlohmann::json;
namespace fs = std::filesystem;

using std::string;
using std::vector;
using std::thread;
using std::cout;
using std::cerr;
using std::endl;
using std::array;
using std::unique_ptr;
using std::function;
using std::ofstream;
using std::ifstream;
using std::to_string;

#define MARK2DOCX_VERSION "1.0.0"

// ─── Safe JSON accessors (handles null values) ──────────────────────────────

string json_str(const json& j, const string& key, const string& def = "");

// ─── String / file utilities ────────────────────────────────────────────────

string to_lower(string s);
string trim(const string& s);
string first_line(const string& s);

// Both throw std::runtime_error on I/O failure. Reading an empty file is a failure.
void   write_file_binary(const string& path, const string& data);
string read_file_binary(const string& path);

// ─── JSON responses ─────────────────────────────────────────────────────────

void send_json_error(httplib::Response& res, int status, const string& message);

// ─── Path and executable finding ────────────────────────────────────────────

// Absolute form of path, or path unchanged when that cannot be resolved. Never throws.
string absolute_or_as_is(const string& path);

string find_executable(const string& name);
string find_pandoc();
