#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace beamstate::infra {

/**
 * @brief Outcome of one external command run.
 */
struct CommandOutput {
    bool started{false};  ///< False if the pipe or fork failed
    bool timedOut{false}; ///< The child was killed at the deadline
    int exitCode{-1};     ///< 127 when the program could not be executed
    std::string output;   ///< stdout and stderr, merged
};

/**
 * @brief Runs argv[0] with the given arguments, without a shell.
 *
 * stdout and stderr are captured together. The child is killed with SIGKILL
 * once the deadline passes. Blocks the calling thread; callers run it on a
 * worker pool.
 */
CommandOutput runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace beamstate::infra
