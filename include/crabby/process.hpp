#pragma once

#include <crabby/result.hpp>
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace crabby {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

struct CommandOptions {
    std::string working_dir;
    // Set in the child on top of the inherited environment
    std::vector<std::pair<std::string, std::string>> env;
    int timeout_seconds = 60;
    // Polled while the child runs; when set the child is killed
    const std::atomic<bool>* cancel = nullptr;
};

// Run an external command, capturing stdout and stderr.
// Returns Script on timeout, Cancelled when the cancel flag fires and IO on
// fork/exec failure. A non-zero exit is not an error.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options = {});

} // namespace crabby
