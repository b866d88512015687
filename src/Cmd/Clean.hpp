#pragma once

#include "Cli.hpp"

namespace weld {

extern const Subcmd CLEAN_CMD;

} // namespace weld
