#pragma once

#include "Cli.hpp"

namespace nodesel {

extern const Subcmd HELP_CMD;

} // namespace nodesel
