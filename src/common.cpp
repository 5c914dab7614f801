/**
 * Mark2Docx — Common utilities implementation
 */

#include "common.h"

#include <cctype>
#include <stdexcept>
#include <unistd.h>

// ─── JSON helpers ───────────────────────────────────────────────────────────

string json_str(const json& j, const string& key, const string& def) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<string>();
    return def;
}

// ─── String utilities ───────────────────────────────────────────────────────

string to_lower(string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

string trim(const string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");

    if (begin == string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

string first_line(const string& s) {
    auto nl = s.find('\n');
    string line = (nl == string::npos) ? s : s.substr(0, nl);
    line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
    return line;
}

// ─── File helpers ───────────────────────────────────────────────────────────

void write_file_binary(const string& path, const string& data) {
    ofstream f(path, std::ios::binary | std::ios::trunc);

    if (!f) throw std::runtime_error("cannot open " + path + " for writing");
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    f.close();

    if (!f) throw std::runtime_error("cannot write " + path);
}

string read_file_binary(const string& path) {
    ifstream f(path, std::ios::binary);

    if (!f) throw std::runtime_error("cannot open " + path + " for reading");
    std::ostringstream ss;
    ss << f.rdbuf();

    // ss fails when nothing was extracted: empty file or unreadable (e.g. a directory)
    if (f.bad() || ss.fail()) throw std::runtime_error("cannot read " + path);
    return ss.str();
}

// ─── JSON responses ─────────────────────────────────────────────────────────

void send_json_error(httplib::Response& res, int status, const string& message) {
    res.status = status;
    res.set_content(json({{"error", message}}).dump(), "application/json");
}

// ─── Path and executable finding ────────────────────────────────────────────

string absolute_or_as_is(const string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    return ec ? path : abs.string();
}

// Walks $PATH the way the shell would, without spawning one.
string find_executable(const string& name) {
    if (name.find('/') != string::npos) {
        return (access(name.c_str(), X_OK) == 0) ? name : "";
    }

    const char* env_path = std::getenv("PATH");

    if (!env_path) return "";
    std::istringstream dirs(env_path);
    string dir;

    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / name;
        std::error_code ec;

        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }

    return "";
}

string find_pandoc() {
    auto p = find_executable("pandoc");

    if (!p.empty()) return p;

    for (const char* candidate : {"/usr/local/bin/pandoc", "/usr/bin/pandoc", "/opt/homebrew/bin/pandoc"}) {
        if (access(candidate, X_OK) == 0) return candidate;
    }

    const char* home = std::getenv("HOME");

    if (home) {
        string local = string(home) + "/.local/bin/pandoc";

        if (access(local.c_str(), X_OK) == 0) return local;
    }

    return "";
}
