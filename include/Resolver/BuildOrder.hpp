#pragma once

#include "DependencyRegistry.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace modstack {

struct BuildOrder {
  // Registered variables, platform excluded, dependencies first.
  std::vector<std::string> modules;
  // The graph could not be fully ordered; the tail of `modules` is in
  // lexicographic order instead.
  bool degraded = false;
  // Unmet requirements of each variable that could not be placed.
  std::map<std::string, std::vector<std::string>> outstanding;
};

BuildOrder solveBuildOrder(const DependencyRegistry& registry,
                           std::string_view platformVariable);

} // namespace modstack
