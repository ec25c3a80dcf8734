#pragma once

#include <string>

namespace platform {

// Directory holding config.json, empty when no home directory is known.
std::string config_dir();

} // namespace platform
