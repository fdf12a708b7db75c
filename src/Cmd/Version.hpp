#pragma once

#include "Cli.hpp"

namespace nodesel {

extern const Subcmd VERSION_CMD;

} // namespace nodesel
