#include "ReleaseIntrospector.hpp"

#include "DependencyGraph.hpp"
#include "Introspector.hpp"
#include "PathConvention.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <rs/result.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace modstack {

static constexpr std::size_t MAX_INCLUDE_DEPTH = 16;

static std::string_view trim(std::string_view str) {
  const std::size_t first = str.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const std::size_t last = str.find_last_not_of(" \t\r");
  return str.substr(first, last - first + 1);
}

static bool isVariableName(const std::string_view name) {
  if (name.empty()) {
    return false;
  }
  for (const char c : name) {
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
                    || (c >= '0' && c <= '9') || c == '_' || c == '.'
                    || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::string expandVariables(const std::string_view text,
                            const std::map<std::string, std::string>& vars) {
  std::string expanded;
  expanded.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '$' || i + 1 >= text.size()) {
      expanded.push_back(text[i]);
      continue;
    }
    const char open = text[i + 1];
    if (open != '(' && open != '{') {
      expanded.push_back(text[i]);
      continue;
    }
    const char close = open == '(' ? ')' : '}';
    const std::size_t end = text.find(close, i + 2);
    if (end == std::string_view::npos) {
      expanded.append(text.substr(i));
      break;
    }
    const std::string name(text.substr(i + 2, end - i - 2));
    const auto itr = vars.find(name);
    if (itr != vars.end()) {
      expanded.append(itr->second);
    } else {
      spdlog::trace("{} is not defined; expanding to nothing", name);
    }
    i = end;
  }
  return expanded;
}

void ReleaseIntrospector::define(std::map<std::string, std::string> variables) {
  for (auto& [name, value] : variables) {
    spdlog::debug("Defining {}={}", name, value);
    predefined.insert_or_assign(name, std::move(value));
  }
}

rs::Result<ConfigFile>
ReleaseIntrospector::locateConfigFile(const fs::path& path) const {
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    // <root>/configure/RELEASE
    return rs::Ok(ConfigFile(path, path.parent_path().parent_path()));
  }
  if (fs::is_directory(path, ec)) {
    const fs::path release = path / RELEASE_FILE;
    rs_ensure(fs::is_regular_file(release, ec), "{} has no {}",
              path.string(), RELEASE_FILE);
    return rs::Ok(ConfigFile(release, path));
  }
  rs_bail("no build configuration found at {}", path.string());
}

namespace {

class ReleaseReader {
public:
  ReleaseReader(const fs::path& root,
                const std::map<std::string, std::string>& predefined)
      : root(root), vars(predefined) {
    vars.insert_or_assign("TOP", root.string());
  }

  rs::Result<void> readFile(const fs::path& file, const std::size_t depth) {
    rs_ensure(depth <= MAX_INCLUDE_DEPTH,
              "includes nested too deeply while reading {}", file.string());

    std::ifstream ifs(file);
    rs_ensure(ifs.is_open(), "failed to open {}", file.string());
    data.filesRead.push_back(file.lexically_relative(root));
    spdlog::trace("Reading {}", file.string());

    std::string line;
    while (std::getline(ifs, line)) {
      const std::string_view content = trim(line);
      if (content.empty() || content.front() == '#') {
        continue;
      }
      rs_try(readLine(file, content, depth));
    }
    return rs::Ok();
  }

  ReleaseIntrospector::ReleaseData take() && { return std::move(data); }

private:
  rs::Result<void> readLine(const fs::path& file, std::string_view content,
                            const std::size_t depth) {
    bool optional = false;
    if (content.starts_with('-')) {
      optional = true;
      content.remove_prefix(1);
    }
    if (content.starts_with("include ") || content.starts_with("include\t")) {
      const std::string target =
          expandVariables(trim(content.substr(7)), vars);
      fs::path included(target);
      if (included.is_relative()) {
        included = file.parent_path() / included;
      }
      std::error_code ec;
      if (!fs::is_regular_file(included, ec)) {
        if (optional) {
          spdlog::debug("Skipping missing {}", included.string());
          return rs::Ok();
        }
        rs_bail("{} includes missing file {}", file.string(),
                included.string());
      }
      return readFile(included, depth + 1);
    }
    if (optional) {
      spdlog::debug("Ignoring line in {}: {}", file.string(), content);
      return rs::Ok();
    }

    for (const std::string_view op : { "?=", ":=", "=" }) {
      const std::size_t pos = content.find(op);
      if (pos == std::string_view::npos) {
        continue;
      }
      const std::string name(trim(content.substr(0, pos)));
      if (!isVariableName(name)) {
        continue;
      }
      const std::string value =
          expandVariables(trim(content.substr(pos + op.size())), vars);
      assign(name, value, op == "?=");
      return rs::Ok();
    }
    spdlog::debug("Ignoring line in {}: {}", file.string(), content);
    return rs::Ok();
  }

  void assign(const std::string& name, const std::string& value,
              const bool onlyIfUnset) {
    if (onlyIfUnset && vars.contains(name)) {
      return;
    }
    vars.insert_or_assign(name, value);
    if (name == "TOP") {
      return;
    }
    if (assigned.insert(name).second) {
      order.push_back(name);
    }
  }

public:
  void finish() {
    for (const std::string& name : order) {
      data.assignments.emplace_back(name, vars.at(name));
    }
  }

private:
  const fs::path& root;
  std::map<std::string, std::string> vars;
  std::set<std::string> assigned;
  std::vector<std::string> order;
  ReleaseIntrospector::ReleaseData data;
};

} // namespace

rs::Result<ReleaseIntrospector::ReleaseData>
ReleaseIntrospector::read(const ConfigFile& configFile) const {
  ReleaseReader reader(configFile.root, predefined);
  rs_try(reader.readFile(configFile.path, 0));
  reader.finish();
  return rs::Ok(std::move(reader).take());
}

static bool isModuleDirectory(const fs::path& path) {
  std::error_code ec;
  return fs::is_directory(path / "configure", ec);
}

rs::Result<DependencyNode*> ReleaseIntrospector::buildDependencyNode(
    const ConfigFile& configFile, const std::string& variableName,
    DependencyGraph& graph) const {
  if (DependencyNode* existing = graph.find(variableName)) {
    return rs::Ok(existing);
  }

  const ReleaseData data = rs_try(read(configFile));

  DependencyNode node(variableName, configFile.root);
  node.configFiles = data.filesRead;
  for (const auto& [name, value] : data.assignments) {
    const fs::path path(value);
    if (value.empty() || !path.is_absolute()) {
      continue;
    }
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      node.unresolvedReferences.insert_or_assign(name, value);
    } else if (isModuleDirectory(path)) {
      node.resolvedDependencies.insert_or_assign(name, resolvePath(path));
    }
  }
  spdlog::debug("{}: {} resolved, {} unresolved", displayName(variableName),
                node.resolvedDependencies.size(),
                node.unresolvedReferences.size());

  DependencyNode& stored = graph.addNode(std::move(node));

  // Copy: recursion below may add nodes but never touches `stored`.
  const std::map<std::string, fs::path> resolved = stored.resolvedDependencies;
  for (const auto& [name, path] : resolved) {
    if (name == variableName || graph.contains(name)) {
      continue;
    }
    auto located = locateConfigFile(path);
    if (located.is_err()) {
      spdlog::debug("{}: {}", name, located.unwrap_err()->what());
      graph.addNode(DependencyNode(name, path));
      continue;
    }
    rs_try(buildDependencyNode(located.unwrap(), name, graph));
  }
  return rs::Ok(&stored);
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>
#  include <unistd.h>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

namespace {

struct ScratchDir {
  fs::path path;

  ScratchDir() {
    path = fs::temp_directory_path()
           / fmt::format("modstack-release-{}", ::getpid());
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

void write(const fs::path& file, const std::string_view content) {
  fs::create_directories(file.parent_path());
  std::ofstream ofs(file);
  ofs << content;
}

} // namespace

static void testExpandVariables() {
  const std::map<std::string, std::string> vars{
    { "TOP", "/work/ioc" },
    { "SUPPORT", "/epics/support" },
  };
  assertEq(expandVariables("$(TOP)/configure", vars), "/work/ioc/configure");
  assertEq(expandVariables("${SUPPORT}/asyn", vars), "/epics/support/asyn");
  assertEq(expandVariables("$(NOPE)/x", vars), "/x");
  assertEq(expandVariables("cost $5", vars), "cost $5");

  pass();
}

static void testReadWithIncludes() {
  const ScratchDir scratch;
  const fs::path top = scratch.path / "ioc";
  write(top / "configure/RELEASE",
        "# comment\n"
        "\n"
        "SUPPORT = /epics/support\n"
        "include $(TOP)/configure/RELEASE.local\n"
        "-include $(TOP)/configure/RELEASE.missing\n"
        "ASYN ?= /ignored\n"
        "CALC := $(SUPPORT)/calc\n");
  write(top / "configure/RELEASE.local", "ASYN = $(SUPPORT)/asyn\n");

  ReleaseIntrospector introspector;
  const ConfigFile config = introspector.locateConfigFile(top).unwrap();
  assertEq(config.root.string(), top.string());

  const auto data = introspector.read(config).unwrap();
  assertEq(data.filesRead.size(), 2UL);
  assertEq(data.filesRead[0].generic_string(), "configure/RELEASE");
  assertEq(data.filesRead[1].generic_string(), "configure/RELEASE.local");
  assertEq(data.assignments.size(), 3UL);
  assertEq(data.assignments[0].first, "SUPPORT");
  assertEq(data.assignments[1].first, "ASYN");
  assertEq(data.assignments[1].second, "/epics/support/asyn");
  assertEq(data.assignments[2].second, "/epics/support/calc");

  pass();
}

static void testClassification() {
  const ScratchDir scratch;
  const fs::path top = scratch.path / "ioc";
  const fs::path asyn = scratch.path / "cache/asyn";
  const fs::path plain = scratch.path / "plain";
  write(asyn / "configure/RELEASE", "TOP = ..\n");
  fs::create_directories(plain);
  write(top / "configure/RELEASE",
        fmt::format("ASYN = {}\nPLAIN = {}\nMOTOR = /no/such/motor\n"
                    "REL = relative/path\nTOP = {}\n",
                    asyn.string(), plain.string(), top.string()));

  ReleaseIntrospector introspector;
  introspector.define({ { "EPICS_BASE", "/no/such/base" } });
  DependencyGraph graph("");
  const ConfigFile config = introspector.locateConfigFile(top).unwrap();
  DependencyNode* root =
      introspector.buildDependencyNode(config, "", graph).unwrap();

  assertEq(root->resolvedDependencies.size(), 1UL);
  assertTrue(root->resolvedDependencies.contains("ASYN"));
  assertEq(root->unresolvedReferences.size(), 1UL);
  assertEq(root->unresolvedReferences.at("MOTOR"), "/no/such/motor");
  assertFalse(root->unresolvedReferences.contains("EPICS_BASE"));
  assertEq(graph.variables(), std::vector<std::string>{ "", "ASYN" });
  assertEq(graph.find("ASYN")->configFiles.size(), 1UL);

  pass();
}

static void testLocateErrors() {
  const ScratchDir scratch;
  ReleaseIntrospector introspector;
  assertTrue(introspector.locateConfigFile(scratch.path).is_err());
  assertTrue(
      introspector.locateConfigFile(scratch.path / "missing").is_err());

  pass();
}

} // namespace tests

int main() {
  tests::testExpandVariables();
  tests::testReadWithIncludes();
  tests::testClassification();
  tests::testLocateErrors();
}

#endif
