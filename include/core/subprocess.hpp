#pragma once

#include "core/error.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace querydesk::utils {

/// Captured output of a finished child process
struct ProcessOutput {
    int exit_code = -1;
    std::string stdout_text;
};

/**
 * @brief Run an executable (looked up on PATH) and capture stdout.
 *
 * No shell is involved; argv is passed verbatim. extra_env entries
 * ("KEY=value") are appended to the inherited environment of the child.
 * The child is killed when `timeout` elapses.
 *
 * Errors: NOT_FOUND when the executable cannot be spawned, TIMEOUT on
 * expiry, INTERNAL_ERROR for pipe/wait failures. A non-zero exit code is
 * reported through ProcessOutput, not as an error.
 */
[[nodiscard]] Result<ProcessOutput> run_process(const std::vector<std::string>& argv,
                                                const std::vector<std::string>& extra_env,
                                                std::chrono::milliseconds timeout);

} // namespace querydesk::utils
