#pragma once

#include "Cli.hpp"

namespace weld {

extern const Subcmd BUILD_CMD;

} // namespace weld
