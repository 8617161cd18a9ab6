#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modstack {

namespace fs = std::filesystem;

struct DependencyNode {
  std::string variableName;
  // Root directory of the module (or of the build target).
  fs::path rootPath;
  std::map<std::string, fs::path> resolvedDependencies;
  std::map<std::string, std::string> unresolvedReferences;
  // Configuration files read for this node, relative to rootPath.
  std::vector<fs::path> configFiles;

  DependencyNode(std::string variableName, fs::path rootPath)
      : variableName(std::move(variableName)), rootPath(std::move(rootPath)) {}

  // Moves `variable` from the unresolved references to the resolved ones.
  void resolve(const std::string& variable, fs::path path);
};

// Grows monotonically while resolving; nodes are never removed.
class DependencyGraph {
public:
  explicit DependencyGraph(std::string rootVariableName)
      : rootVariableName_(std::move(rootVariableName)) {}

  const std::string& rootVariableName() const { return rootVariableName_; }

  // Returns the node already stored under the same variable name when
  // there is one; `node` is then discarded.
  DependencyNode& addNode(DependencyNode node);

  bool contains(std::string_view variable) const;
  DependencyNode* find(std::string_view variable);
  const DependencyNode* find(std::string_view variable) const;

  DependencyNode& root();
  const DependencyNode& root() const;

  std::size_t size() const { return insertionOrder.size(); }
  // Variable names in the order their nodes were added.
  const std::vector<std::string>& variables() const { return insertionOrder; }
  const std::map<std::string, DependencyNode, std::less<>>& nodes() const {
    return nodesByVariable;
  }

private:
  std::string rootVariableName_;
  std::map<std::string, DependencyNode, std::less<>> nodesByVariable;
  std::vector<std::string> insertionOrder;
};

// Human readable name of a node; the build target has an empty variable.
std::string displayName(std::string_view variable);

} // namespace modstack
