#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/plasma-deck, or empty if neither it nor $HOME is set.
std::string config_dir();

} // namespace platform
