#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace mediavault {

struct ProcessResult {
    bool launched = false;   // false: executable not found or fork failed
    bool timed_out = false;  // killed after the deadline
    int exit_code = -1;
    std::string stderr_output;  // tail, bounded

    bool succeeded() const { return launched && !timed_out && exit_code == 0; }
};

/// Runs external tools (transcoder, frame extractor) with a deadline.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// argv[0] is looked up on PATH.
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              std::chrono::seconds timeout) = 0;
};

/// fork/execvp runner. stdout is discarded, stderr is captured, and the
/// child is SIGKILLed when the deadline passes.
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::seconds timeout) override;
};

}  // namespace mediavault
