#pragma once

#include <string>
#include <system_error>
#include <vector>

namespace cvault {

// ── ProcessResult ─────────────────────────────────────────────────────────────

struct ProcessResult {
    int exit_code = -1;       // exit status, or 128 + signal number
    std::string out;          // captured stdout
    std::string err;          // captured stderr
};

// ── run_process ──────────────────────────────────────────────────────────────
//
// Run `argv[0]` (looked up on PATH) with the given arguments, wait for it to
// finish and capture both output streams.  Arguments are passed verbatim to
// execvp(); no shell is involved, so nothing needs quoting.
//
// Returns an error_code only when the process could not be started (fork or
// pipe failure, or execvp() failure, reported with the child's errno such as
// ENOENT for a missing binary).  A non-zero exit status is NOT an error
// at this level; callers inspect `result.exit_code`.

[[nodiscard]] std::error_code run_process(const std::vector<std::string>& argv,
                                          ProcessResult& result);

// Render argv for log lines ("docker create --name web1 ...").
[[nodiscard]] std::string join_argv(const std::vector<std::string>& argv);

} // namespace cvault
