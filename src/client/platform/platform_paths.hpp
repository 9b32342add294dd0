#pragma once

#include <string>

namespace platform {

// Per-user configuration directory, empty if it cannot be determined.
std::string config_dir();

// Default interactive history file, empty if $HOME is unset.
std::string history_file();

} // namespace platform
