/**
 * Mark2Docx — Pandoc converter
 */

#include "converter.h"

PandocConverter::PandocConverter(string executable)
    : executable_(std::move(executable)) {}

ProcessResult PandocConverter::run(const string& input_path, const string& output_path,
                                   std::chrono::seconds timeout) {
    return run_process({executable_, input_path, "-o", output_path}, timeout);
}

string PandocConverter::version() const {
    try {
        auto r = run_process({executable_, "--version"}, std::chrono::seconds(5));

        if (r.timed_out || r.exit_code != 0) return "";
        return trim(first_line(r.stdout_text));
    } catch (const std::exception& e) {
        cerr << "[Mark2Docx] pandoc version probe failed: " << e.what() << endl;
        return "";
    }
}
