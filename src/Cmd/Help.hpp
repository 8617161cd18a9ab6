#pragma once

#include "Cli.hpp"

namespace modstack {

extern const Subcmd HELP_CMD;

} // namespace modstack
