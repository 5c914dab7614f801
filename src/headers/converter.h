#pragma once
/**
 * Mark2Docx — External converter boundary
 *
 * The conversion route only sees this interface; production uses pandoc,
 * tests substitute fakes that exercise each outcome branch.
 */

#include "process.h"

class Converter {
public:
    virtual ~Converter() = default;

    // Converts input_path into output_path within the time limit.
    virtual ProcessResult run(const string& input_path, const string& output_path,
                              std::chrono::seconds timeout) = 0;
};

// Runs `<pandoc> <input> -o <output>`.
class PandocConverter : public Converter {
public:
    explicit PandocConverter(string executable);

    ProcessResult run(const string& input_path, const string& output_path,
                      std::chrono::seconds timeout) override;

    const string& executable() const { return executable_; }

    // First line of `<pandoc> --version`, empty when the binary cannot be run.
    string version() const;

private:
    string executable_;
};
