#pragma once

#include <string>

namespace platform {

// Per-user configuration directory, empty if it cannot be determined.
std::string config_dir();

// Directory for staged uploads when none is configured.
std::string temp_dir();

} // namespace platform
