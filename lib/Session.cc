#include "Session.hpp"

#include "Backend/BuildBackend.hpp"
#include "Config.hpp"
#include "DependencyGraph.hpp"
#include "Diag.hpp"
#include "Introspector.hpp"
#include "ModuleIdentity.hpp"
#include "Resolver/BuildOrder.hpp"
#include "Resolver/ConfigPatcher.hpp"
#include "Resolver/DependencyResolver.hpp"
#include "VersionSet.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <rs/result.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace modstack {

Session::Session(const Config& config, fs::path targetPath,
                 Introspector& introspector, BuildBackend& backend)
    : config(config), targetPath_(resolvePath(targetPath)),
      introspector(introspector), backend(&backend),
      parser(config.conventionRoots),
      registry_(config.moduleCachePath()) {}

rs::Result<void> Session::usePlatform(const std::string& tag,
                                      const bool resetConfigure) {
  rs_ensure(!tag.empty(), "platform tag must not be empty");
  rs_ensure(!platform_.has_value(), "platform is already set to {}",
            *platform_);

  resetConfigure_ = resetConfigure;
  platform_.emplace(tag, config.platform.name, tag);
  Diag::info("Platform", "{} {}", config.platform.name, tag);

  CheckoutSuppressingBackend suppressing(*backend);
  std::optional<ScopedOverride<BuildBackend*>> guard;
  if (!resetConfigure_) {
    guard.emplace(backend, &suppressing);
  }

  rs_try(addDependency(config.platform.variable, *platform_, false));

  std::map<std::string, std::string> variables =
      config.introspectionVariablesFor(tag);
  variables.insert_or_assign(config.platform.variable,
                             registry_.pathFor(*platform_).string());
  introspector.define(std::move(variables));

  if (resetConfigure_) {
    resetConfigureDir(targetPath_, displayName(ROOT_VARIABLE));
  }

  // Published only once the root node exists.
  auto graph = std::make_unique<DependencyGraph>(ROOT_VARIABLE);
  const ConfigFile configFile =
      rs_try(introspector.locateConfigFile(targetPath_));
  const DependencyNode* root =
      rs_try(introspector.buildDependencyNode(configFile, ROOT_VARIABLE,
                                              *graph));
  graph_ = std::move(graph);
  spdlog::debug("{} has {} resolved and {} missing dependencies",
                targetPath_.string(), root->resolvedDependencies.size(),
                root->unresolvedReferences.size());
  for (const auto& [variable, rawPath] : root->unresolvedReferences) {
    spdlog::debug("  missing {}={}", variable, rawPath);
  }
  return rs::Ok();
}

rs::Result<void> Session::ensureReady(const char* operation) const {
  rs_ensure(platform_.has_value(), "cannot {} before the platform is set",
            operation);
  rs_ensure(graph_ != nullptr, "cannot {} before the build target is read",
            operation);
  return rs::Ok();
}

rs::Result<void> Session::findAllDependencies() {
  rs_try(ensureReady("resolve dependencies"));

  CheckoutSuppressingBackend suppressing(*backend);
  std::optional<ScopedOverride<BuildBackend*>> guard;
  if (!resetConfigure_) {
    guard.emplace(backend, &suppressing);
  }

  rs_try(DependencyResolver(parser, *this).resolve(*graph_, registry_));
  Diag::info("Finished", "{} dependencies registered",
             registry_.identities().size());
  return rs::Ok();
}

rs::Result<void> Session::addDependency(const std::string& variable,
                                        const ModuleIdentity& identity,
                                        const bool addToGraph) {
  if (addToGraph) {
    rs_try(ensureReady("introspect dependencies"));
  }
  return registerModule(variable, identity, addToGraph ? graph_.get() : nullptr);
}

rs::Result<void> Session::addDependency(const std::string& variable,
                                        const ModuleIdentity& identity,
                                        DependencyGraph& graph) {
  return registerModule(variable, identity, &graph);
}

std::string Session::defaultOwner() const {
  return backend->settings().get("REPOOWNER").value_or(config.repositoryOwner);
}

void Session::resetConfigureDir(const fs::path& path, const std::string& owner) {
  auto res = backend->runCheckoutReset(path, "configure");
  if (res.is_err()) {
    Diag::warn("Could not reset configure/ of {}: {}", owner,
               res.unwrap_err()->what());
  }
}

rs::Result<void> Session::registerModule(const std::string& variable,
                                         const ModuleIdentity& identity,
                                         DependencyGraph* graph) {
  if (!rs_try(registry_.registerIdentity(variable, identity))) {
    spdlog::debug("{} is already registered as {}", variable, identity);
    return rs::Ok();
  }

  const std::string setName = config.setNameFor(variable);
  spdlog::debug("Updating settings for {}: {}", variable, identity);
  backend->settings().update(
      toSettings(expandIdentity(identity, setName, config, defaultOwner())),
      true);
  rs_try(backend->registerDependency(setName));

  const fs::path path = registry_.pathFor(identity);
  if (resetConfigure_) {
    std::error_code ec;
    fs::remove(config.moduleCachePath() / "RELEASE.local", ec);
    if (ec) {
      spdlog::debug("Could not remove RELEASE.local: {}", ec.message());
    }
    resetConfigureDir(path, variable);
  }

  if (graph == nullptr) {
    return rs::Ok();
  }
  const ConfigFile configFile = rs_try(introspector.locateConfigFile(path));
  const DependencyNode* node =
      rs_try(introspector.buildDependencyNode(configFile, variable, *graph));
  rs_try(registry_.attachNode(variable, *node));
  return rs::Ok();
}

rs::Result<std::string> Session::versionSetText() const {
  rs_try(ensureReady("write a version set"));

  const BuildOrder order =
      solveBuildOrder(registry_, config.platform.variable);
  std::vector<std::string> variables;
  if (registry_.contains(config.platform.variable)) {
    variables.push_back(config.platform.variable);
  }
  variables.insert(variables.end(), order.modules.begin(), order.modules.end());

  std::vector<VersionSetEntries> modules;
  modules.reserve(variables.size());
  for (const std::string& variable : variables) {
    modules.push_back(expandIdentity(*registry_.identity(variable),
                                     config.setNameFor(variable), config,
                                     defaultOwner()));
  }
  return rs::Ok(formatVersionSet(modules));
}

rs::Result<fs::path> Session::writeVersionSet(const std::string& name) const {
  rs_ensure(!name.empty(), "version set name must not be empty");
  const std::string text = rs_try(versionSetText());
  const fs::path file = rs_try(writeVersionSetFile(config.setPath, name, text));
  Diag::info("Writing", "{}", file.string());
  return rs::Ok(file);
}

std::map<std::string, std::string> Session::variablesToPatch() const {
  std::map<std::string, std::string> variables;
  for (const auto& [variable, identity] : registry_.identities()) {
    variables.emplace(variable, registry_.pathFor(identity).string());
  }
  for (const auto& [variable, value] : config.extraPatchVariables) {
    variables.insert_or_assign(variable, value);
  }
  return variables;
}

rs::Result<std::set<std::string>> Session::updateConfigFiles() {
  rs_try(ensureReady("update configuration files"));

  for (const auto& [variable, identity] : registry_.identities()) {
    rs_try(backend->updateLocalReleaseRecord(variable,
                                             registry_.pathFor(identity)));
  }

  const std::map<std::string, std::string> variables = variablesToPatch();
  std::set<std::string> updated;
  for (const std::string& variable : registry_.variables()) {
    if (variable == config.platform.variable) {
      continue;
    }
    const DependencyNode* node = registry_.node(variable);
    if (node == nullptr) {
      continue;
    }
    const std::set<std::string> names = patchConfigFiles(
        *registry_.pathFor(variable), node->configFiles, variables);
    updated.insert(names.begin(), names.end());
  }

  const std::set<std::string> names =
      patchConfigFiles(targetPath_, graph_->root().configFiles, variables);
  updated.insert(names.begin(), names.end());
  return rs::Ok(std::move(updated));
}

rs::Result<BuildOrder> Session::updateBuildOrder() {
  rs_try(ensureReady("order the build"));

  BuildOrder order = solveBuildOrder(registry_, config.platform.variable);
  std::vector<std::string> setNames;
  setNames.reserve(order.modules.size());
  for (const std::string& variable : order.modules) {
    setNames.push_back(config.setNameFor(variable));
  }
  backend->settings().set("MODULES_TO_BUILD", fmt::format("{}", fmt::join(setNames, " ")));
  Diag::info("Order", "{}", fmt::join(setNames, " "));

  lastOrder = order;
  return rs::Ok(std::move(order));
}

static nlohmann::json identityToJson(const ModuleIdentity& identity) {
  return {
    { "name", identity.name },
    { "tag", identity.tag },
    { "base", identity.base },
  };
}

nlohmann::json Session::report() const {
  nlohmann::json json;
  json["target"] = targetPath_.string();

  if (platform_.has_value()) {
    nlohmann::json platform = identityToJson(*platform_);
    platform["variable"] = config.platform.variable;
    platform["path"] = registry_.pathFor(*platform_).string();
    json["platform"] = std::move(platform);
  } else {
    json["platform"] = nullptr;
  }

  nlohmann::json modules = nlohmann::json::array();
  for (const auto& [variable, identity] : registry_.identities()) {
    if (variable == config.platform.variable) {
      continue;
    }
    nlohmann::json module = identityToJson(identity);
    module["variable"] = variable;
    module["setName"] = config.setNameFor(variable);
    module["path"] = registry_.pathFor(identity).string();
    module["requires"] = registry_.requirementsOf(variable);
    modules.push_back(std::move(module));
  }
  json["modules"] = std::move(modules);

  const BuildOrder order = lastOrder.has_value()
                               ? *lastOrder
                               : solveBuildOrder(registry_,
                                                 config.platform.variable);
  json["buildOrder"] = order.modules;
  json["degraded"] = order.degraded;
  json["outstanding"] = order.outstanding;

  nlohmann::json unresolved = nlohmann::json::array();
  if (graph_ != nullptr) {
    for (const std::string& variable : graph_->variables()) {
      const DependencyNode* node = graph_->find(variable);
      if (node->unresolvedReferences.empty()) {
        continue;
      }
      unresolved.push_back({
          { "variable", variable },
          { "path", node->rootPath.string() },
          { "references", node->unresolvedReferences },
      });
    }
  }
  json["unresolved"] = std::move(unresolved);
  return json;
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

namespace {

class RecordingBackend : public BuildBackend {
public:
  rs::Result<void> registerDependency(const std::string& variable) override {
    registered.push_back(variable);
    return rs::Ok();
  }
  rs::Result<void> updateLocalReleaseRecord(const std::string& variable,
                                            const fs::path&) override {
    recorded.push_back(variable);
    return rs::Ok();
  }
  rs::Result<void> runCheckoutReset(const fs::path& path,
                                    const std::string&) override {
    resets.push_back(path.filename().string());
    rs_bail("{} is not a repository", path.string());
  }
  SettingsStore& settings() override { return store; }

  std::vector<std::string> registered;
  std::vector<std::string> recorded;
  std::vector<std::string> resets;
  SettingsStore store;
};

// Every module is a leaf; the build target references nothing.
class LeafIntrospector : public Introspector {
public:
  void define(std::map<std::string, std::string> variables) override {
    defined = std::move(variables);
  }
  rs::Result<ConfigFile> locateConfigFile(const fs::path& path) const override {
    rs_ensure(path != missing, "no configure/RELEASE in {}", path.string());
    return rs::Ok(ConfigFile(path / "configure/RELEASE", path));
  }
  rs::Result<DependencyNode*>
  buildDependencyNode(const ConfigFile& configFile,
                      const std::string& variableName,
                      DependencyGraph& graph) const override {
    return rs::Ok(&graph.addNode(DependencyNode(variableName, configFile.root)));
  }

  std::map<std::string, std::string> defined;
  fs::path missing;
};

} // namespace

static void testPreconditions() {
  const Config config = Config::defaults("/work");
  LeafIntrospector introspector;
  RecordingBackend backend;
  Session session(config, "/work/ioc", introspector, backend);

  auto res = session.findAllDependencies();
  assertTrue(res.is_err());
  assertEq(std::string(res.unwrap_err()->what()),
           "cannot resolve dependencies before the platform is set");
  assertTrue(session.updateBuildOrder().is_err());
  assertTrue(session.updateConfigFiles().is_err());
  assertTrue(session.report()["platform"].is_null());

  pass();
}

static void testPlatformWithoutReset() {
  const Config config = Config::defaults("/work");
  LeafIntrospector introspector;
  RecordingBackend backend;
  Session session(config, "/work/ioc", introspector, backend);

  session.usePlatform("R7.0.2-2.0", false).unwrap();

  assertTrue(backend.resets.empty());
  assertEq(backend.registered, std::vector<std::string>{ "BASE" });
  assertEq(backend.store.get("BASE_REPONAME").value(), "epics-base");
  assertEq(introspector.defined.at("EPICS_BASE"),
           "/work/cache/modules/epics-base-R7.0.2-2.0");
  assertEq(introspector.defined.at("EPICS_MODULES"),
           "/cds/group/pcds/epics/R7.0.2-2.0/modules");
  assertEq(session.graph()->size(), 1UL);
  assertTrue(session.usePlatform("R7.0.2-2.0", false).is_err());

  pass();
}

static void testTargetWithoutConfiguration() {
  const Config config = Config::defaults("/work");
  LeafIntrospector introspector;
  introspector.missing = "/work/ioc";
  RecordingBackend backend;
  Session session(config, "/work/ioc", introspector, backend);

  auto res = session.usePlatform("R7.0.2-2.0", false);
  assertTrue(res.is_err());
  assertEq(std::string(res.unwrap_err()->what()),
           "no configure/RELEASE in /work/ioc");
  assertTrue(session.graph() == nullptr);

  auto patched = session.updateConfigFiles();
  assertTrue(patched.is_err());
  assertEq(std::string(patched.unwrap_err()->what()),
           "cannot update configuration files before the build target is "
           "read");
  assertTrue(session.findAllDependencies().is_err());

  pass();
}

static void testRegistrationAndOrder() {
  const Config config = Config::defaults("/work");
  LeafIntrospector introspector;
  RecordingBackend backend;
  backend.store.set("REPOOWNER", "pcdshub");
  Session session(config, "/work/ioc", introspector, backend);
  session.usePlatform("R7.0.2-2.0", true).unwrap();
  // Target and platform resets fail; both are only warnings.
  assertEq(backend.resets.size(), 2UL);

  const ModuleIdentity asyn("R7.0.2-2.0", "asyn", "R4.39-1.0.1");
  session.addDependency("ASYN", asyn, true).unwrap();
  session.addDependency("ASYN", asyn, true).unwrap();
  assertEq(backend.registered, std::vector<std::string>{ "BASE", "ASYN" });
  assertEq(backend.store.get("ASYN_REPOURL").value(),
           "https://github.com/pcdshub/asyn.git");
  assertTrue(session.registry().node("ASYN") != nullptr);

  const ModuleIdentity other("R7.0.2-2.0", "asyn", "R4.42");
  assertTrue(session.addDependency("ASYN", other, true).is_err());

  const BuildOrder order = session.updateBuildOrder().unwrap();
  assertEq(order.modules, std::vector<std::string>{ "ASYN" });
  assertEq(backend.store.get("MODULES_TO_BUILD").value(), "ASYN");

  const std::string text = session.versionSetText().unwrap();
  assertTrue(text.starts_with("BASE=R7.0.2-2.0\n"));
  assertTrue(text.find("ASYN=R4.39-1.0.1\n") != std::string::npos);

  const nlohmann::json report = session.report();
  assertEq(report["modules"].size(), 1UL);
  assertEq(report["modules"][0]["path"].get<std::string>(),
           "/work/cache/modules/asyn-R4.39-1.0.1");
  assertEq(report["buildOrder"][0].get<std::string>(), "ASYN");

  pass();
}

} // namespace tests

int main() {
  modstack::setColorMode("never");

  tests::testPreconditions();
  tests::testPlatformWithoutReset();
  tests::testTargetWithoutConfiguration();
  tests::testRegistrationAndOrder();
}

#endif
