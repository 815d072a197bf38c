#pragma once

#include <string>

namespace platform {

// Per-user config directory, empty if neither XDG_CONFIG_HOME nor HOME is set.
std::string config_dir();

// Directory for scratch files such as the temporary WAV handed to the engine.
std::string temp_dir();

} // namespace platform
