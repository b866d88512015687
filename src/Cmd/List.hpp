#pragma once

#include "Cli.hpp"

namespace weld {

extern const Subcmd LIST_CMD;

} // namespace weld
