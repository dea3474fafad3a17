#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();
std::string ipc_endpoint();

// `name` inside data_dir(), or inside a /tmp fallback when no home is known.
std::string data_file(const std::string& name);

} // namespace platform
