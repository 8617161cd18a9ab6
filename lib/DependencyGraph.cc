#include "DependencyGraph.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace modstack {

void DependencyNode::resolve(const std::string& variable, fs::path path) {
  unresolvedReferences.erase(variable);
  resolvedDependencies.insert_or_assign(variable, std::move(path));
}

DependencyNode& DependencyGraph::addNode(DependencyNode node) {
  const auto itr = nodesByVariable.find(node.variableName);
  if (itr != nodesByVariable.end()) {
    return itr->second;
  }

  std::string variable = node.variableName;
  auto [inserted, _] = nodesByVariable.emplace(variable, std::move(node));
  insertionOrder.push_back(std::move(variable));
  return inserted->second;
}

bool DependencyGraph::contains(const std::string_view variable) const {
  return nodesByVariable.contains(variable);
}

DependencyNode* DependencyGraph::find(const std::string_view variable) {
  const auto itr = nodesByVariable.find(variable);
  return itr == nodesByVariable.end() ? nullptr : &itr->second;
}

const DependencyNode*
DependencyGraph::find(const std::string_view variable) const {
  const auto itr = nodesByVariable.find(variable);
  return itr == nodesByVariable.end() ? nullptr : &itr->second;
}

DependencyNode& DependencyGraph::root() {
  DependencyNode* node = find(rootVariableName_);
  if (node == nullptr) {
    throw std::logic_error("dependency graph has no root node");
  }
  return *node;
}

const DependencyNode& DependencyGraph::root() const {
  const DependencyNode* node = find(rootVariableName_);
  if (node == nullptr) {
    throw std::logic_error("dependency graph has no root node");
  }
  return *node;
}

std::string displayName(const std::string_view variable) {
  if (variable.empty()) {
    return "the build target";
  }
  return std::string(variable);
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>
#  include <stdexcept>
#  include <vector>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

static void testAddNodeKeepsFirst() {
  DependencyGraph graph("");
  DependencyNode root("", "/work/ioc");
  root.unresolvedReferences.emplace("ASYN", "/epics/asyn");
  graph.addNode(std::move(root));

  DependencyNode& again = graph.addNode(DependencyNode("", "/elsewhere"));
  assertEq(again.rootPath.string(), "/work/ioc");
  assertEq(graph.size(), 1UL);
  assertEq(graph.root().unresolvedReferences.size(), 1UL);

  pass();
}

static void testInsertionOrder() {
  DependencyGraph graph("");
  graph.addNode(DependencyNode("", "/work/ioc"));
  graph.addNode(DependencyNode("MOTOR", "/cache/motor"));
  graph.addNode(DependencyNode("ASYN", "/cache/asyn"));

  assertEq(graph.variables(),
           std::vector<std::string>{ "", "MOTOR", "ASYN" });
  assertTrue(graph.contains("ASYN"));
  assertFalse(graph.contains("CALC"));
  assertTrue(graph.find("CALC") == nullptr);

  pass();
}

static void testResolveMovesEntry() {
  DependencyNode node("MOTOR", "/cache/motor");
  node.unresolvedReferences.emplace("ASYN", "/epics/asyn");
  node.unresolvedReferences.emplace("SNCSEQ", "/epics/seq");

  node.resolve("ASYN", "/cache/modules/asyn-R4.39");
  assertFalse(node.unresolvedReferences.contains("ASYN"));
  assertEq(node.resolvedDependencies.at("ASYN").string(),
           "/cache/modules/asyn-R4.39");
  assertEq(node.unresolvedReferences.size(), 1UL);

  pass();
}

static void testMissingRootThrows() {
  const DependencyGraph graph("");
  bool threw = false;
  try {
    static_cast<void>(graph.root());
  } catch (const std::logic_error&) {
    threw = true;
  }
  assertTrue(threw);
  assertEq(displayName(""), "the build target");
  assertEq(displayName("ASYN"), "ASYN");

  pass();
}

} // namespace tests

int main() {
  tests::testAddNodeKeepsFirst();
  tests::testInsertionOrder();
  tests::testResolveMovesEntry();
  tests::testMissingRootThrows();
}

#endif
