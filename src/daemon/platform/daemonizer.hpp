#pragma once

#include <string>

namespace platform {

// Detaches from the terminal. stderr is appended to `log_path` when it is
// non-empty, otherwise discarded.
void daemonize(const std::string& log_path = {});

} // namespace platform
