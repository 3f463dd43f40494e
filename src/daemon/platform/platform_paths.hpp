#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();
std::string ipc_endpoint();
std::string temp_dir();

} // namespace platform
