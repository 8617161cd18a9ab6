#pragma once

#include "DependencyGraph.hpp"
#include "ModuleIdentity.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modstack {

namespace fs = std::filesystem;

// Build-variable name to module identity, and to the node introspection
// produced for it. One registry per resolution run.
class DependencyRegistry {
public:
  explicit DependencyRegistry(fs::path moduleCachePath)
      : moduleCachePath_(std::move(moduleCachePath)) {}

  // Ok(true) when newly registered, Ok(false) when the same identity was
  // already registered. A different identity for a registered variable is
  // an error and leaves the registry unchanged.
  rs::Result<bool> registerIdentity(const std::string& variable,
                                    const ModuleIdentity& identity);

  // The node is owned by the graph; the registry only refers to it.
  rs::Result<void> attachNode(const std::string& variable,
                              const DependencyNode& node);

  bool contains(std::string_view variable) const;
  const ModuleIdentity* identity(std::string_view variable) const;
  const DependencyNode* node(std::string_view variable) const;

  // Cache path of a registered variable.
  std::optional<fs::path> pathFor(std::string_view variable) const;
  fs::path pathFor(const ModuleIdentity& identity) const;

  // Registered variables in lexicographic order.
  std::vector<std::string> variables() const;
  const std::map<std::string, ModuleIdentity, std::less<>>& identities() const {
    return identityByVariable;
  }

  // Names the variable depends on (its node's resolved dependencies,
  // without itself). Empty for variables registered without a node.
  std::vector<std::string> requirementsOf(std::string_view variable) const;

  const fs::path& moduleCachePath() const { return moduleCachePath_; }

private:
  fs::path moduleCachePath_;
  std::map<std::string, ModuleIdentity, std::less<>> identityByVariable;
  std::map<std::string, const DependencyNode*, std::less<>> nodeByVariable;
};

} // namespace modstack
