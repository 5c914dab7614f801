#pragma once
/**
 * Mark2Docx — Per-request scratch files
 *
 * Every conversion gets a fresh random token; the input and output files live
 * at <scratch_dir>/<token><ext>. ScratchArtifacts owns both paths for the
 * lifetime of one request and removes them when it goes out of scope, on
 * every exit path. Removal errors are ignored.
 */

#include "common.h"

// Random (v4) UUID string. Never derived from request data.
string generate_unique_token();

class ScratchArtifacts {
public:
    ScratchArtifacts(const string& scratch_dir, const string& input_ext, const string& output_ext);
    ~ScratchArtifacts();

    ScratchArtifacts(const ScratchArtifacts&) = delete;
    ScratchArtifacts& operator=(const ScratchArtifacts&) = delete;

    const string& token() const { return token_; }
    const string& input_path() const { return input_path_; }
    const string& output_path() const { return output_path_; }

private:
    string token_;
    string input_path_;
    string output_path_;
};

// Best-effort delete. Returns true if the file was there and is now gone.
bool remove_if_present(const string& path) noexcept;
