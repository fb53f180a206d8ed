#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Outcome of running a child process to completion
 */
struct ProcessResult
{
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;    // valid when the child exited normally
    int term_signal = 0;   // non-zero when the child was killed by a signal
    std::string output;    // combined stdout and stderr, possibly truncated
    size_t truncated_bytes = 0;
    std::string error_message;

    bool succeeded() const { return launched && !timed_out && term_signal == 0 && exit_code == 0; }
};

/**
 * @brief Runs an external program and waits for it, capturing stdout and stderr on one pipe
 *
 * Captured output is bounded: once max_output_bytes is exceeded only the tail is kept.
 * A zero timeout means wait indefinitely; on expiry the child is killed with SIGKILL.
 */
class ProcessRunner
{
public:
    explicit ProcessRunner(size_t max_output_bytes = 64 * 1024,
                           std::chrono::seconds timeout = std::chrono::seconds(0));

    ProcessResult run(const std::vector<std::string> &argv) const;

    /**
     * @brief Render output for reporting, prefixing a marker when it was truncated
     */
    static std::string describeOutput(const ProcessResult &result);

private:
    size_t max_output_bytes_;
    std::chrono::seconds timeout_;
};
