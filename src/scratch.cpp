/**
 * Mark2Docx — Per-request scratch files implementation
 */

#include "scratch.h"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

string generate_unique_token() {
    // One generator per thread: random_generator is not safe to share.
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

ScratchArtifacts::ScratchArtifacts(const string& scratch_dir, const string& input_ext, const string& output_ext)
    : token_(generate_unique_token()) {
    fs::path dir(scratch_dir);
    input_path_  = (dir / (token_ + input_ext)).string();
    output_path_ = (dir / (token_ + output_ext)).string();
}

ScratchArtifacts::~ScratchArtifacts() {
    remove_if_present(input_path_);
    remove_if_present(output_path_);
}

bool remove_if_present(const string& path) noexcept {
    std::error_code ec;
    return fs::remove(path, ec) && !ec;
}
