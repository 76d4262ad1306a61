// ZKCOMPLY - Subprocess Execution
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Runs an external program with a wall-clock limit, capturing its
// combined stdout/stderr. Used to drive the witness calculator and the
// Groth16 prover.

#ifndef ZKCOMPLY_UTIL_PROCESS_H
#define ZKCOMPLY_UTIL_PROCESS_H

#include <chrono>
#include <string>
#include <vector>

namespace zkcomply {
namespace util {

/// Maximum captured output kept per process (excess is discarded)
constexpr size_t MAX_PROCESS_OUTPUT = 64 * 1024;

/// Exit code reported when the program could not be executed
constexpr int EXEC_FAILED_EXIT_CODE = 127;

/**
 * Outcome of a subprocess run.
 */
struct ProcessResult {
    /// Exit status, or 128 + signal number when the child was signalled
    int exitCode{-1};
    
    /// Combined stdout and stderr, truncated to MAX_PROCESS_OUTPUT
    std::string output;
    
    /// True if the child was killed because the deadline passed
    bool timedOut{false};
    
    /// Wall-clock duration of the run
    std::chrono::milliseconds elapsed{0};
    
    bool Succeeded() const { return !timedOut && exitCode == 0; }
};

/**
 * Run argv[0] (resolved through PATH) with the given arguments.
 *
 * The child is killed with SIGKILL once timeout elapses. A zero timeout
 * means no limit. When workdir is non-empty the child changes into it
 * before exec.
 *
 * @throws std::invalid_argument if argv is empty
 * @throws std::runtime_error if the pipe or fork cannot be created
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout,
                         const std::string& workdir = "");

} // namespace util
} // namespace zkcomply

#endif // ZKCOMPLY_UTIL_PROCESS_H
