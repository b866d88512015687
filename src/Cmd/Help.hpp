#pragma once

#include "Cli.hpp"

namespace weld {

extern const Subcmd HELP_CMD;

} // namespace weld
