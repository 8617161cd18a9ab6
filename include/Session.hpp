#pragma once

#include "Backend/BuildBackend.hpp"
#include "Config.hpp"
#include "DependencyGraph.hpp"
#include "DependencyRegistry.hpp"
#include "Introspector.hpp"
#include "ModuleIdentity.hpp"
#include "PathConvention.hpp"
#include "Resolver/BuildOrder.hpp"
#include "Resolver/DependencyResolver.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <rs/result.hpp>
#include <set>
#include <string>
#include <vector>

namespace modstack {

namespace fs = std::filesystem;

// One resolution run against one build target. Owns the dependency graph
// and registry and drives the collaborators through the prepare pipeline:
// usePlatform, findAllDependencies, writeVersionSet, updateConfigFiles,
// updateBuildOrder.
class Session : public Registrar {
public:
  // Variable name of the build target's own node.
  static constexpr const char* ROOT_VARIABLE = "";

  Session(const Config& config, fs::path targetPath, Introspector& introspector,
          BuildBackend& backend);

  // Registers the platform without introspecting it, then reads the build
  // target's configuration into a fresh graph.
  rs::Result<void> usePlatform(const std::string& tag, bool resetConfigure);

  rs::Result<void> findAllDependencies();

  // Registration side effects; a no-op when the same identity is already
  // registered under `variable`.
  rs::Result<void> addDependency(const std::string& variable,
                                 const ModuleIdentity& identity,
                                 bool addToGraph);
  rs::Result<void> addDependency(const std::string& variable,
                                 const ModuleIdentity& identity,
                                 DependencyGraph& graph) override;

  rs::Result<std::string> versionSetText() const;
  rs::Result<fs::path> writeVersionSet(const std::string& name) const;

  // Returns the names patched in any file.
  rs::Result<std::set<std::string>> updateConfigFiles();

  rs::Result<BuildOrder> updateBuildOrder();

  nlohmann::json report() const;

  const DependencyRegistry& registry() const { return registry_; }
  const DependencyGraph* graph() const { return graph_.get(); }
  const std::optional<ModuleIdentity>& platform() const { return platform_; }
  const fs::path& targetPath() const { return targetPath_; }

  // Cache paths of every registered variable plus the extra variables.
  std::map<std::string, std::string> variablesToPatch() const;

private:
  rs::Result<void> registerModule(const std::string& variable,
                                  const ModuleIdentity& identity,
                                  DependencyGraph* graph);
  rs::Result<void> ensureReady(const char* operation) const;
  std::string defaultOwner() const;
  void resetConfigureDir(const fs::path& path, const std::string& owner);

  const Config& config;
  fs::path targetPath_;
  Introspector& introspector;
  BuildBackend* backend;
  PathConventionParser parser;
  DependencyRegistry registry_;
  std::unique_ptr<DependencyGraph> graph_;
  std::optional<ModuleIdentity> platform_;
  bool resetConfigure_ = true;
  std::optional<BuildOrder> lastOrder;
};

} // namespace modstack
