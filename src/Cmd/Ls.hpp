#pragma once

#include "Cli.hpp"

namespace nodesel {

extern const Subcmd LS_CMD;

} // namespace nodesel
