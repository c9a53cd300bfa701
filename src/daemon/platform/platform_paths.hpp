#pragma once

#include <string>

namespace platform {

// Per-user scribed directories following the XDG base directory rules.
// Relative XDG_* values are ignored; empty when no usable base is set.
std::string config_dir();
std::string data_dir();

} // namespace platform
