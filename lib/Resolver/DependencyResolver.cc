#include "Resolver/DependencyResolver.hpp"

#include "DependencyGraph.hpp"
#include "DependencyRegistry.hpp"
#include "Diag.hpp"
#include "ModuleIdentity.hpp"
#include "PathConvention.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace modstack {

rs::Result<void>
DependencyResolver::resolve(DependencyGraph& graph,
                            const DependencyRegistry& registry) {
  std::set<std::string> visited;

  // `graph.variables()` grows while we walk it.
  for (std::size_t cursor = 0; cursor < graph.variables().size(); ++cursor) {
    const std::string current = graph.variables()[cursor];
    DependencyNode* node = graph.find(current);
    visited.insert(current);

    // Copied: resolving mutates the map and registration may grow the graph.
    const std::vector<std::pair<std::string, std::string>> references(
        node->unresolvedReferences.begin(), node->unresolvedReferences.end());
    spdlog::debug("Resolving {} ({} unresolved)", displayName(current),
                  references.size());

    for (const auto& [variable, rawPath] : references) {
      if (visited.contains(variable)) {
        if (const std::optional<fs::path> path = registry.pathFor(variable)) {
          node->resolve(variable, *path);
        } else {
          Diag::warn("Dependency still missing: {} ({}) required by {}",
                     variable, rawPath, displayName(current));
        }
        continue;
      }

      if (const ModuleIdentity* known = registry.identity(variable)) {
        const std::optional<ModuleIdentity> parsed = parser.parse(rawPath);
        if (parsed.has_value() && *parsed != *known) {
          Diag::warn("{} refers to {} as {}, but {} is already in use",
                     displayName(current), variable, *parsed, *known);
        }
        node->resolve(variable, registry.pathFor(*known));
        continue;
      }

      const std::optional<ModuleIdentity> identity = parser.parse(rawPath);
      if (!identity.has_value()) {
        spdlog::debug("{}: {} does not follow any known module layout",
                      variable, rawPath);
        continue;
      }

      rs_try(registrar.addDependency(variable, *identity, graph));
      // Registration may have added nodes; the map keeps `node` valid.
      const fs::path path = registry.pathFor(*identity);
      node->resolve(variable, path);
      Diag::info("Resolved", "{} = {}", variable, path.string());
    }
  }
  return rs::Ok();
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <fmt/ranges.h>
#  include <map>
#  include <rs/tests.hpp>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

namespace {

constexpr const char* ROOT = "/nonexistent/epics";

std::string modulePath(const std::string& name, const std::string& tag) {
  return fmt::format("{}/R7.0.2-2.0/modules/{}/{}", ROOT, name, tag);
}

// Registers in the shared registry and adds a node with the references
// listed for the variable.
class FakeRegistrar : public Registrar {
public:
  FakeRegistrar(
      DependencyRegistry& registry,
      std::map<std::string, std::map<std::string, std::string>> references)
      : registry(registry), references(std::move(references)) {}

  rs::Result<void> addDependency(const std::string& variable,
                                 const ModuleIdentity& identity,
                                 DependencyGraph& graph) override {
    rs_try(registry.registerIdentity(variable, identity));
    added.push_back(variable);
    DependencyNode node(variable, registry.pathFor(identity));
    if (const auto itr = references.find(variable); itr != references.end()) {
      node.unresolvedReferences = itr->second;
    }
    rs_try(registry.attachNode(variable, graph.addNode(std::move(node))));
    return rs::Ok();
  }

  std::vector<std::string> added;

private:
  DependencyRegistry& registry;
  std::map<std::string, std::map<std::string, std::string>> references;
};

class FailingRegistrar : public Registrar {
public:
  rs::Result<void> addDependency(const std::string& variable,
                                 const ModuleIdentity&,
                                 DependencyGraph&) override {
    rs_bail("cannot materialize {}", variable);
  }
};

} // namespace

static void testTransitiveChain() {
  DependencyRegistry registry("/cache/modules");
  FakeRegistrar registrar(
      registry,
      { { "B", { { "C", modulePath("c", "R1.0") } } },
        { "C", { { "C", modulePath("c", "R1.0") } } } });
  const PathConventionParser parser({ ROOT });

  DependencyGraph graph("");
  DependencyNode root("", "/work/ioc");
  root.unresolvedReferences.emplace("B", modulePath("b", "R2.0"));
  root.unresolvedReferences.emplace("LOCAL", "/work/not-a-module");
  graph.addNode(std::move(root));

  DependencyResolver(parser, registrar).resolve(graph, registry).unwrap();

  assertEq(registrar.added, std::vector<std::string>{ "B", "C" });
  assertEq(graph.variables(), std::vector<std::string>{ "", "B", "C" });
  assertEq(graph.root().resolvedDependencies.at("B").string(),
           "/cache/modules/b-R2.0");
  assertEq(graph.root().unresolvedReferences.size(), 1UL);
  assertTrue(graph.root().unresolvedReferences.contains("LOCAL"));
  assertEq(graph.find("B")->resolvedDependencies.at("C").string(),
           "/cache/modules/c-R1.0");
  // A node visited before its own references resolves itself.
  assertTrue(graph.find("C")->unresolvedReferences.empty());
  assertEq(graph.find("C")->resolvedDependencies.at("C").string(),
           "/cache/modules/c-R1.0");

  pass();
}

static void testRegisteredWithoutNode() {
  DependencyRegistry registry("/cache/modules");
  const ModuleIdentity platform("R7.0.2-2.0", "epics-base", "R7.0.2-2.0");
  registry.registerIdentity("EPICS_BASE", platform).unwrap();
  FakeRegistrar registrar(registry, {});
  const PathConventionParser parser({ ROOT });

  DependencyGraph graph("");
  DependencyNode root("", "/work/ioc");
  root.unresolvedReferences.emplace(
      "EPICS_BASE", fmt::format("{}/R7.0.2-2.0/base", ROOT));
  graph.addNode(std::move(root));

  DependencyResolver(parser, registrar).resolve(graph, registry).unwrap();

  assertTrue(registrar.added.empty());
  assertEq(graph.root().resolvedDependencies.at("EPICS_BASE").string(),
           "/cache/modules/epics-base-R7.0.2-2.0");

  pass();
}

static void testCycleTerminates() {
  DependencyRegistry registry("/cache/modules");
  FakeRegistrar registrar(
      registry, { { "A", { { "B", modulePath("b", "R1") } } },
                  { "B", { { "A", modulePath("a", "R1") } } } });
  const PathConventionParser parser({ ROOT });

  DependencyGraph graph("");
  DependencyNode root("", "/work/ioc");
  root.unresolvedReferences.emplace("A", modulePath("a", "R1"));
  graph.addNode(std::move(root));

  DependencyResolver(parser, registrar).resolve(graph, registry).unwrap();

  assertEq(graph.size(), 3UL);
  assertTrue(graph.find("A")->resolvedDependencies.contains("B"));
  assertTrue(graph.find("B")->resolvedDependencies.contains("A"));

  pass();
}

static void testRegistrationErrorPropagates() {
  DependencyRegistry registry("/cache/modules");
  FailingRegistrar registrar;
  const PathConventionParser parser({ ROOT });

  DependencyGraph graph("");
  DependencyNode root("", "/work/ioc");
  root.unresolvedReferences.emplace("ASYN", modulePath("asyn", "R4.39"));
  graph.addNode(std::move(root));

  auto res = DependencyResolver(parser, registrar).resolve(graph, registry);
  assertTrue(res.is_err());
  assertEq(std::string(res.unwrap_err()->what()), "cannot materialize ASYN");

  pass();
}

} // namespace tests

int main() {
  modstack::setColorMode("never");

  tests::testTransitiveChain();
  tests::testRegisteredWithoutNode();
  tests::testCycleTerminates();
  tests::testRegistrationErrorPropagates();
}

#endif
