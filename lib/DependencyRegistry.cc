#include "DependencyRegistry.hpp"

#include "DependencyGraph.hpp"
#include "ModuleIdentity.hpp"

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace modstack {

rs::Result<bool>
DependencyRegistry::registerIdentity(const std::string& variable,
                                     const ModuleIdentity& identity) {
  rs_ensure(!variable.empty(), "cannot register an unnamed dependency");

  const auto itr = identityByVariable.find(variable);
  if (itr == identityByVariable.end()) {
    identityByVariable.emplace(variable, identity);
    spdlog::debug("Registered {}: {}", variable, identity);
    return rs::Ok(true);
  }
  if (itr->second == identity) {
    return rs::Ok(false);
  }
  rs_bail("{} is already registered as {}; refusing to reassign it to {}",
          variable, itr->second, identity);
}

rs::Result<void> DependencyRegistry::attachNode(const std::string& variable,
                                                const DependencyNode& node) {
  rs_ensure(identityByVariable.contains(variable),
            "cannot attach a node to unregistered variable {}", variable);
  rs_ensure(node.variableName == variable,
            "node for {} cannot be attached to {}", node.variableName,
            variable);
  nodeByVariable.insert_or_assign(variable, &node);
  return rs::Ok();
}

bool DependencyRegistry::contains(const std::string_view variable) const {
  return identityByVariable.contains(variable);
}

const ModuleIdentity*
DependencyRegistry::identity(const std::string_view variable) const {
  const auto itr = identityByVariable.find(variable);
  return itr == identityByVariable.end() ? nullptr : &itr->second;
}

const DependencyNode*
DependencyRegistry::node(const std::string_view variable) const {
  const auto itr = nodeByVariable.find(variable);
  return itr == nodeByVariable.end() ? nullptr : itr->second;
}

std::optional<fs::path>
DependencyRegistry::pathFor(const std::string_view variable) const {
  const ModuleIdentity* found = identity(variable);
  if (found == nullptr) {
    return std::nullopt;
  }
  return pathFor(*found);
}

fs::path DependencyRegistry::pathFor(const ModuleIdentity& identity) const {
  return moduleCachePath_ / identity.cacheDirName();
}

std::vector<std::string> DependencyRegistry::variables() const {
  std::vector<std::string> vars;
  vars.reserve(identityByVariable.size());
  for (const auto& [variable, _] : identityByVariable) {
    vars.push_back(variable);
  }
  return vars;
}

std::vector<std::string>
DependencyRegistry::requirementsOf(const std::string_view variable) const {
  std::vector<std::string> reqs;
  const DependencyNode* found = node(variable);
  if (found == nullptr) {
    return reqs;
  }
  for (const auto& [dep, _] : found->resolvedDependencies) {
    if (dep != variable) {
      reqs.push_back(dep);
    }
  }
  return reqs;
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

static void testIdempotentRegistration() {
  DependencyRegistry registry("/cache/modules");
  const ModuleIdentity asyn("R7.0.2-2.0", "asyn", "R4.39-1.0.1");

  assertTrue(registry.registerIdentity("ASYN", asyn).unwrap());
  assertFalse(registry.registerIdentity("ASYN", asyn).unwrap());

  assertEq(registry.variables(), std::vector<std::string>{ "ASYN" });
  assertTrue(*registry.identity("ASYN") == asyn);
  assertEq(registry.pathFor("ASYN")->string(),
           "/cache/modules/asyn-R4.39-1.0.1");

  pass();
}

static void testConflictingRegistration() {
  DependencyRegistry registry("/cache/modules");
  const ModuleIdentity first("R7.0.2-2.0", "asyn", "R4.39-1.0.1");
  const ModuleIdentity second("R7.0.2-2.0", "asyn", "R4.42-1.0.0");

  assertTrue(registry.registerIdentity("ASYN", first).unwrap());
  auto res = registry.registerIdentity("ASYN", second);
  assertTrue(res.is_err());
  assertEq(std::string(res.unwrap_err()->what()),
           "ASYN is already registered as asyn@R4.39-1.0.1 (R7.0.2-2.0); "
           "refusing to reassign it to asyn@R4.42-1.0.0 (R7.0.2-2.0)");
  assertTrue(*registry.identity("ASYN") == first);

  pass();
}

static void testRequirementsExcludeSelf() {
  DependencyRegistry registry("/cache/modules");
  registry
      .registerIdentity("MOTOR",
                        ModuleIdentity("R7.0.2-2.0", "motor", "R6.9-ess"))
      .unwrap();

  DependencyNode node("MOTOR", "/cache/modules/motor-R6.9-ess");
  node.resolvedDependencies.emplace("MOTOR", "/cache/modules/motor-R6.9-ess");
  node.resolvedDependencies.emplace("ASYN", "/cache/modules/asyn-R4.39");
  node.resolvedDependencies.emplace("EPICS_BASE", "/cache/modules/base");
  registry.attachNode("MOTOR", node).unwrap();

  assertEq(registry.requirementsOf("MOTOR"),
           std::vector<std::string>{ "ASYN", "EPICS_BASE" });
  assertTrue(registry.requirementsOf("ASYN").empty());

  pass();
}

static void testAttachNodeNeedsRegistration() {
  DependencyRegistry registry("/cache/modules");
  const DependencyNode node("CALC", "/cache/modules/calc-R3.7");

  assertTrue(registry.attachNode("CALC", node).is_err());
  assertTrue(registry.node("CALC") == nullptr);
  assertFalse(registry.pathFor("CALC").has_value());
  assertTrue(registry.registerIdentity("", ModuleIdentity("a", "b", "c"))
                 .is_err());

  pass();
}

} // namespace tests

int main() {
  tests::testIdempotentRegistration();
  tests::testConflictingRegistration();
  tests::testRequirementsExcludeSelf();
  tests::testAttachNodeNeedsRegistration();
}

#endif
