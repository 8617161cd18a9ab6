#pragma once

#include "DependencyGraph.hpp"
#include "DependencyRegistry.hpp"
#include "ModuleIdentity.hpp"
#include "PathConvention.hpp"

#include <rs/result.hpp>
#include <string>

namespace modstack {

// Side effects of discovering a new dependency: registration, settings,
// materialization, and introspection of the module into the graph.
class Registrar {
public:
  virtual ~Registrar() = default;

  virtual rs::Result<void> addDependency(const std::string& variable,
                                         const ModuleIdentity& identity,
                                         DependencyGraph& graph) = 0;
};

class DependencyResolver {
public:
  DependencyResolver(const PathConventionParser& parser, Registrar& registrar)
      : parser(parser), registrar(registrar) {}

  // Runs to a fixpoint: every node of the graph, including those added
  // while resolving, is visited exactly once.
  rs::Result<void> resolve(DependencyGraph& graph,
                           const DependencyRegistry& registry);

private:
  const PathConventionParser& parser;
  Registrar& registrar;
};

} // namespace modstack
