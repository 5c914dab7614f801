#pragma once
/**
 * Mark2Docx — Subprocess execution
 *
 * Runs an executable with an explicit argument vector (fork + execvp, never
 * through a shell), captures stdout and stderr separately, and enforces a
 * wall-clock timeout. On timeout the child's whole process group is killed
 * with SIGKILL and reaped before returning.
 */

#include "common.h"

struct ProcessResult {
    int    exit_code = -1;      // WEXITSTATUS, 128 + signal when killed, -1 when unknown
    string stdout_text;
    string stderr_text;
    bool   timed_out = false;
};

// argv[0] is looked up on $PATH. Exec failures surface as exit code 127 with
// the reason in stderr_text. Throws std::system_error when pipes or fork fail.
ProcessResult run_process(const vector<string>& argv, std::chrono::milliseconds timeout);
