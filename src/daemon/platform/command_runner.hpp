#pragma once

#include <expected>
#include <string>
#include <vector>

namespace platform {

struct CommandResult {
    int exit_code = 0;
    std::string output;
};

// Runs argv[0] from PATH and collects stdout. The child is killed when it
// outlives `timeout_ms`.
std::expected<CommandResult, std::string> run_command(const std::vector<std::string>& argv,
                                                      int timeout_ms);

} // namespace platform
