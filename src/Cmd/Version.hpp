#pragma once

#include "Cli.hpp"

namespace modstack {

extern const Subcmd VERSION_CMD;

} // namespace modstack
