#pragma once

#include "Cli.hpp"

namespace weld {

extern const Subcmd EXEC_CMD;

} // namespace weld
