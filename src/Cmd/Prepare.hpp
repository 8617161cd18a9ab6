#pragma once

#include "Cli.hpp"

namespace modstack {

extern const Subcmd PREPARE_CMD;

} // namespace modstack
