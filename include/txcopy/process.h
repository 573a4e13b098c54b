#pragma once

/// @file process.h
/// Blocking child-process invocation used by the external tool wrappers.

#include <string>
#include <vector>

namespace txcopy {
namespace process {

/// Outcome of run().
struct ProcessResult {
    /// Raw wait status from waitpid(), or -1 if the program could not be
    /// executed at all (see exec_errno).
    int         status = 0;
    int         exec_errno = 0;
    std::string output; ///< Combined stdout and stderr of the child.

    bool success() const { return status == 0; }
};

/// Run `argv[0]` (searched on PATH) with arguments, wait for it and
/// capture its output.  stdin is /dev/null.  No timeout is applied.
///
/// @throws ProcessError if argv is empty or the pipe/fork setup fails.
ProcessResult run(const std::vector<std::string>& argv);

/// Describe how a child ended, e.g. "exited with code 23",
/// "died with signal 9 (Killed)", "failed to execute: No such file or
/// directory".  Returns "exited successfully" for status 0.
std::string explain(const ProcessResult& result);

/// Join argv for log output, single-quoting arguments that a shell would
/// not take literally.
std::string format_command(const std::vector<std::string>& argv);

} // namespace process
} // namespace txcopy
