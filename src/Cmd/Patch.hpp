#pragma once

#include "Cli.hpp"

namespace modstack {

extern const Subcmd PATCH_CMD;

} // namespace modstack
