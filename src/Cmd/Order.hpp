#pragma once

#include "Cli.hpp"

namespace modstack {

extern const Subcmd ORDER_CMD;

} // namespace modstack
