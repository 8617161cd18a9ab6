#pragma once

#include "DependencyGraph.hpp"

#include <filesystem>
#include <map>
#include <rs/result.hpp>
#include <string>
#include <utility>

namespace modstack {

namespace fs = std::filesystem;

// Handle to the top-level build configuration file of a module.
struct ConfigFile {
  const fs::path path;
  // Module root the configuration belongs to.
  const fs::path root;

  ConfigFile(fs::path path, fs::path root)
      : path(std::move(path)), root(std::move(root)) {}
};

// Reads a module's build configuration and reports which dependencies it
// references, resolved or missing.
class Introspector {
public:
  virtual ~Introspector() = default;

  // Variables visible to every configuration read afterwards.
  virtual void define(std::map<std::string, std::string> variables) = 0;

  virtual rs::Result<ConfigFile> locateConfigFile(const fs::path& path) const = 0;

  // Adds the node for `variableName` to `graph` together with nodes for
  // every resolved dependency not yet in it. Returns the node stored in
  // the graph.
  virtual rs::Result<DependencyNode*>
  buildDependencyNode(const ConfigFile& configFile,
                      const std::string& variableName,
                      DependencyGraph& graph) const = 0;
};

} // namespace modstack
