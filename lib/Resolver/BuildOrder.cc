#include "Resolver/BuildOrder.hpp"

#include "DependencyRegistry.hpp"
#include "Diag.hpp"

#include <algorithm>
#include <fmt/ranges.h>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace modstack {

BuildOrder solveBuildOrder(const DependencyRegistry& registry,
                           const std::string_view platformVariable) {
  std::vector<std::string> placed{ std::string(platformVariable) };
  std::set<std::string, std::less<>> placedSet{ std::string(platformVariable) };
  std::set<std::string> remaining;
  for (std::string& variable : registry.variables()) {
    if (variable != platformVariable) {
      remaining.insert(std::move(variable));
    }
  }

  const auto isSatisfied = [&](const std::string& variable) {
    const std::vector<std::string> reqs = registry.requirementsOf(variable);
    return std::ranges::all_of(reqs, [&](const std::string& req) {
      return placedSet.contains(req);
    });
  };

  BuildOrder order;
  while (!remaining.empty()) {
    bool progressed = false;
    for (auto itr = remaining.begin(); itr != remaining.end();) {
      if (!isSatisfied(*itr)) {
        ++itr;
        continue;
      }
      spdlog::trace("Placing {}", *itr);
      placed.push_back(*itr);
      placedSet.insert(*itr);
      itr = remaining.erase(itr);
      progressed = true;
    }
    if (progressed) {
      continue;
    }

    for (const std::string& variable : remaining) {
      std::vector<std::string> unmet;
      for (std::string& req : registry.requirementsOf(variable)) {
        if (!placedSet.contains(req)) {
          unmet.push_back(std::move(req));
        }
      }
      order.outstanding.emplace(variable, std::move(unmet));
    }
    Diag::warn("Unable to fully order the build; placed so far: {}; "
               "remaining: {}; unmet requirements: {}",
               placed, remaining, order.outstanding);
    order.degraded = true;
    placed.insert(placed.end(), remaining.begin(), remaining.end());
    remaining.clear();
  }

  order.modules.assign(placed.begin() + 1, placed.end());
  return order;
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include "DependencyGraph.hpp"
#  include "ModuleIdentity.hpp"

#  include <rs/tests.hpp>
#  include <utility>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

namespace {

// Registers each variable with a node requiring the listed variables.
struct Fixture {
  DependencyRegistry registry{ "/cache/modules" };
  DependencyGraph graph{ "" };

  void add(const std::string& variable, const std::vector<std::string>& reqs) {
    registry
        .registerIdentity(variable,
                          ModuleIdentity("R7.0.2-2.0", variable, "R1.0"))
        .unwrap();
    DependencyNode node(variable, "/cache/modules/" + variable);
    for (const std::string& req : reqs) {
      node.resolvedDependencies.emplace(req, "/cache/modules/" + req);
    }
    registry.attachNode(variable, graph.addNode(std::move(node))).unwrap();
  }

  void addPlatform() {
    registry
        .registerIdentity("EPICS_BASE", ModuleIdentity("R7.0.2-2.0",
                                                       "epics-base",
                                                       "R7.0.2-2.0"))
        .unwrap();
  }
};

} // namespace

static void testDependenciesFirst() {
  Fixture fx;
  fx.addPlatform();
  fx.add("ASYN", { "EPICS_BASE" });
  fx.add("CALC", { "EPICS_BASE", "SSCAN" });
  fx.add("SSCAN", { "EPICS_BASE" });
  fx.add("MOTOR", { "ASYN", "EPICS_BASE" });

  const BuildOrder order = solveBuildOrder(fx.registry, "EPICS_BASE");
  // Within one scan, SSCAN is placed after CALC was checked.
  assertEq(order.modules,
           std::vector<std::string>{ "ASYN", "MOTOR", "SSCAN", "CALC" });
  assertFalse(order.degraded);
  assertTrue(order.outstanding.empty());

  pass();
}

static void testNodelessVariablesHaveNoRequirements() {
  Fixture fx;
  fx.addPlatform();
  fx.registry
      .registerIdentity("SNCSEQ", ModuleIdentity("R7.0.2-2.0", "seq", "R2.2"))
      .unwrap();
  fx.add("ASYN", { "SNCSEQ", "ASYN" });

  const BuildOrder order = solveBuildOrder(fx.registry, "EPICS_BASE");
  assertEq(order.modules, std::vector<std::string>{ "SNCSEQ", "ASYN" });

  pass();
}

static void testCycleDegrades() {
  Fixture fx;
  fx.addPlatform();
  fx.add("ASYN", {});
  fx.add("B", { "C" });
  fx.add("C", { "B", "ASYN" });

  const BuildOrder order = solveBuildOrder(fx.registry, "EPICS_BASE");
  assertEq(order.modules, std::vector<std::string>{ "ASYN", "B", "C" });
  assertTrue(order.degraded);
  assertEq(order.outstanding.at("B"), std::vector<std::string>{ "C" });
  assertEq(order.outstanding.at("C"), std::vector<std::string>{ "B" });

  pass();
}

static void testUnregisteredPlatform() {
  Fixture fx;
  fx.add("ASYN", { "EPICS_BASE" });

  const BuildOrder order = solveBuildOrder(fx.registry, "EPICS_BASE");
  assertEq(order.modules, std::vector<std::string>{ "ASYN" });
  assertFalse(order.degraded);

  pass();
}

} // namespace tests

int main() {
  modstack::setColorMode("never");

  tests::testDependenciesFirst();
  tests::testNodelessVariablesHaveNoRequirements();
  tests::testCycleDegrades();
  tests::testUnregisteredPlatform();
}

#endif
