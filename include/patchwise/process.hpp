#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace patchwise {

struct ProcessResult {
    std::string output;       // stdout and stderr interleaved, as far as it was read
    int exit_code = 0;        // 128 + signal when the process was killed
    bool timed_out = false;
};

// Failures to spawn (pipe, fork) throw std::runtime_error; a missing executable
// surfaces as exit code 127 with the exec error in the output.
struct ProcessRunner {
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
    // Starts argv in a new session and returns its pid without waiting for it.
    virtual long start_detached(const std::vector<std::string>& argv) = 0;
};

// Runs each child in its own process group so a timeout kills everything it spawned.
class PosixProcessRunner final : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
    long start_detached(const std::vector<std::string>& argv) override;
};

} // namespace patchwise
