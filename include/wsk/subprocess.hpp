#pragma once

/**
 * @file subprocess.hpp
 * @brief Spawn a command with an explicit environment and capture its output
 *
 * The child runs in its own process group so that timeouts and cancellation
 * reach anything it spawned. Termination is SIGTERM to the group, then
 * SIGKILL once the grace period has elapsed.
 */

#include "wsk/types.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wsk {

struct SubprocessRequest {
    std::vector<std::string> argv;
    std::vector<std::string> envp;  // KEY=VALUE; nothing is inherited
    std::string cwd;
    std::optional<std::chrono::milliseconds> timeout;
    std::chrono::milliseconds grace_period{2000};
    const std::atomic<bool>* cancel = nullptr;
};

struct SubprocessResult {
    bool started = false;
    std::string error;  // set when the command could not be launched
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    std::vector<OutputChunk> output;
    std::chrono::milliseconds duration{0};
};

/**
 * Resolve a program name against a PATH value.
 * Names containing '/' are returned unchanged.
 */
std::optional<std::string> find_program(const std::string& name, const std::string& path_value);

/**
 * Run a command to completion.
 *
 * argv[0] is looked up in the PATH entry of envp, not the caller's PATH.
 * Blocks until the child and its pipes are done.
 */
SubprocessResult run_subprocess(const SubprocessRequest& request);

} // namespace wsk
