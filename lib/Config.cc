#include "Config.hpp"

#include "Diag.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace toml {

template <typename T, typename... U>
// NOLINTNEXTLINE(readability-identifier-naming,cppcoreguidelines-macro-usage)
inline rs::Result<T> try_find(const toml::value& v, const U&... u) noexcept {
  using std::string_view_literals::operator""sv;

  if (modstack::shouldColorStderr()) {
    color::enable();
  } else {
    color::disable();
  }

  try {
    return rs::Ok(toml::find<T>(v, u...));
  } catch (const std::exception& e) {
    std::string what = e.what();

    static constexpr std::size_t errorPrefixSize = "[error] "sv.size();
    static constexpr std::size_t colorErrorPrefixSize =
        "\033[31m\033[01m[error]\033[00m "sv.size();

    if (modstack::shouldColorStderr()) {
      what = what.substr(colorErrorPrefixSize);
    } else {
      what = what.substr(errorPrefixSize);
    }

    if (!what.empty() && what.back() == '\n') {
      what.pop_back(); // remove the last '\n' since Diag::error adds one.
    }
    return rs::Err(rs::anyhow(
        fmt::format("invalid value for `{}` in {}: {}",
                    fmt::join({ std::string_view(u)... }, "."),
                    modstack::Config::FILE_NAME, what)));
  }
}

} // namespace toml

namespace modstack {

Config Config::defaults(const fs::path& baseDir) {
  Config config;
  config.cachePath = baseDir / "cache";
  config.setPath = baseDir / "cache" / "sets";
  config.conventionRoots = { "/cds/group/pcds/epics", "/reg/g/pcds/epics" };
  config.platform = Platform{ .variable = "EPICS_BASE",
                              .name = "epics-base",
                              .tag = "R7.0.2-2.branch" };
  config.repositoryOwner = "slac-epics";
  config.overrides.repoName = { { "base", "epics-base" } };
  config.overrides.setName = { { "EPICS_BASE", "BASE" } };
  config.extraPatchVariables = { { "RE2C", "re2c" } };
  config.introspectionVariables = {
    { "EPICS_SITE_TOP", "/cds/group/pcds/" },
    { "EPICS_MODULES", "/cds/group/pcds/epics/{tag}/modules" },
  };
  return config;
}

template <typename... Keys>
static std::string tableName(const Keys&... keys) {
  return fmt::format("{}", fmt::join({ std::string_view(keys)... }, "."));
}

// Absent table: nullopt. Every value must be a non-empty string.
template <typename... Keys>
static rs::Result<std::optional<std::map<std::string, std::string>>>
parseStringTable(const toml::value& val, const Keys&... keys) noexcept {
  const auto table = toml::try_find<toml::table>(val, keys...);
  if (table.is_err()) {
    spdlog::trace("[{}] not given", tableName(keys...));
    return rs::Ok(std::nullopt);
  }

  std::map<std::string, std::string> entries;
  for (const auto& [key, value] : table.unwrap()) {
    rs_ensure(!key.empty(), "[{}] has an empty key", tableName(keys...));
    rs_ensure(value.is_string(), "[{}] {} must be a string",
              tableName(keys...), key);
    rs_ensure(!value.as_string().empty(), "[{}] {} must not be empty",
              tableName(keys...), key);
    entries.emplace(key, value.as_string());
  }
  return rs::Ok(std::move(entries));
}

static fs::path relativeTo(const fs::path& baseDir, const fs::path& path) {
  if (path.is_absolute()) {
    return path;
  }
  return (baseDir / path).lexically_normal();
}

// Absent key: nullopt. A present key must hold a string.
static rs::Result<std::optional<std::string>>
findString(const toml::value& data, const char* table,
           const char* key) noexcept {
  if (!data.contains(table)) {
    return rs::Ok(std::nullopt);
  }
  const toml::value& section = data.at(table);
  rs_ensure(section.is_table(), "[{}] must be a table", table);
  if (!section.contains(key)) {
    return rs::Ok(std::nullopt);
  }
  return rs::Ok(rs_try(toml::try_find<std::string>(data, table, key)));
}

rs::Result<Config> Config::tryParse(const fs::path& path) noexcept {
  try {
    return tryFromToml(toml::parse(path), path);
  } catch (const std::exception& e) {
    rs_bail("failed to parse {}: {}", path.string(), e.what());
  }
}

rs::Result<Config> Config::tryFromToml(const toml::value& data,
                                       fs::path path) noexcept {
  const fs::path baseDir =
      path.empty() ? fs::path(".") : path.parent_path();
  Config config = defaults(baseDir);
  config.path = std::move(path);

  if (const auto cache = rs_try(findString(data, "cache", "path"))) {
    config.cachePath = relativeTo(baseDir, *cache);
    config.setPath = config.cachePath / "sets";
  }
  if (const auto sets = rs_try(findString(data, "cache", "sets"))) {
    config.setPath = relativeTo(baseDir, *sets);
  }

  if (data.contains("conventions")) {
    config.conventionRoots = rs_try(
        toml::try_find<std::vector<std::string>>(data, "conventions", "roots"));
    rs_ensure(!config.conventionRoots.empty(),
              "[conventions] roots must not be empty");
    for (const std::string& root : config.conventionRoots) {
      rs_ensure(fs::path(root).is_absolute(),
                "[conventions] root `{}` must be an absolute path", root);
    }
  }

  if (auto variable = rs_try(findString(data, "platform", "variable"))) {
    config.platform.variable = std::move(*variable);
  }
  if (auto name = rs_try(findString(data, "platform", "name"))) {
    config.platform.name = std::move(*name);
  }
  if (auto tag = rs_try(findString(data, "platform", "tag"))) {
    config.platform.tag = std::move(*tag);
  }
  rs_ensure(!config.platform.variable.empty(),
            "[platform] variable must not be empty");
  rs_ensure(!config.platform.name.empty(), "[platform] name must not be empty");
  rs_ensure(!config.platform.tag.empty(), "[platform] tag must not be empty");

  if (auto owner = rs_try(findString(data, "repository", "owner"))) {
    config.repositoryOwner = std::move(*owner);
  }
  rs_ensure(!config.repositoryOwner.empty(),
            "[repository] owner must not be empty");

  if (auto table = rs_try(parseStringTable(data, "overrides", "repo-name"))) {
    config.overrides.repoName = std::move(*table);
  }
  if (auto table = rs_try(parseStringTable(data, "overrides", "repo-owner"))) {
    config.overrides.repoOwner = std::move(*table);
  }
  if (auto table = rs_try(parseStringTable(data, "overrides", "set-name"))) {
    config.overrides.setName = std::move(*table);
  }
  if (auto table = rs_try(parseStringTable(data, "patch", "extra"))) {
    config.extraPatchVariables = std::move(*table);
  }
  if (auto table =
          rs_try(parseStringTable(data, "introspection", "variables"))) {
    config.introspectionVariables = std::move(*table);
  }

  return rs::Ok(std::move(config));
}

rs::Result<fs::path> Config::findPath(fs::path candidateDir) noexcept {
  const fs::path origCandDir = candidateDir;
  while (true) {
    const fs::path configPath = candidateDir / FILE_NAME;
    spdlog::trace("Finding config: {}", configPath.string());
    std::error_code ec;
    if (fs::exists(configPath, ec)) {
      return rs::Ok(configPath);
    }

    const fs::path parentPath = candidateDir.parent_path();
    if (candidateDir.has_parent_path() && parentPath != candidateDir) {
      candidateDir = parentPath;
    } else {
      break;
    }
  }

  rs_bail("{} not found in `{}` and its parents", FILE_NAME,
          origCandDir.string());
}

rs::Result<Config> Config::load(const std::optional<fs::path>& explicitPath,
                                const fs::path& targetDir) noexcept {
  std::error_code ec;
  if (explicitPath.has_value()) {
    const fs::path absolute = fs::absolute(*explicitPath, ec);
    return tryParse(ec ? *explicitPath : absolute);
  }

  const fs::path start = fs::absolute(targetDir, ec);
  auto found = findPath(ec ? targetDir : start);
  if (found.is_ok()) {
    spdlog::debug("Using {}", found.unwrap().string());
    return tryParse(found.unwrap());
  }
  spdlog::debug("{}; using built-in defaults", found.unwrap_err()->what());

  const fs::path cwd = fs::current_path(ec);
  rs_ensure(!ec, "failed to get the current directory: {}", ec.message());
  return rs::Ok(defaults(cwd));
}

std::string Config::repoNameFor(const std::string& moduleName) const {
  const auto itr = overrides.repoName.find(moduleName);
  return itr == overrides.repoName.end() ? moduleName : itr->second;
}

std::string Config::repoOwnerFor(const std::string& moduleName,
                                 const std::string& defaultOwner) const {
  const auto itr = overrides.repoOwner.find(moduleName);
  return itr == overrides.repoOwner.end() ? defaultOwner : itr->second;
}

std::string Config::setNameFor(const std::string& variable) const {
  const auto itr = overrides.setName.find(variable);
  return itr == overrides.setName.end() ? variable : itr->second;
}

std::map<std::string, std::string>
Config::introspectionVariablesFor(const std::string_view tag) const {
  static constexpr std::string_view placeholder = "{tag}";

  std::map<std::string, std::string> variables;
  for (const auto& [name, value] : introspectionVariables) {
    std::string substituted = value;
    for (std::size_t pos = substituted.find(placeholder);
         pos != std::string::npos;
         pos = substituted.find(placeholder, pos + tag.size())) {
      substituted.replace(pos, placeholder.size(), tag);
    }
    variables.emplace(name, std::move(substituted));
  }
  return variables;
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>
#  include <toml11/fwd/literal_fwd.hpp>

namespace tests {

// NOLINTBEGIN
using namespace modstack;
using namespace toml::literals::toml_literals;
// NOLINTEND

static void testDefaults() {
  const Config config = Config::tryFromToml(""_toml, "/work/modstack.toml")
                            .unwrap();
  assertEq(config.cachePath.string(), "/work/cache");
  assertEq(config.setPath.string(), "/work/cache/sets");
  assertEq(config.moduleCachePath().string(), "/work/cache/modules");
  assertEq(config.platform.variable, "EPICS_BASE");
  assertEq(config.platform.tag, "R7.0.2-2.branch");
  assertEq(config.repoNameFor("base"), "epics-base");
  assertEq(config.repoNameFor("asyn"), "asyn");
  assertEq(config.setNameFor("EPICS_BASE"), "BASE");
  assertEq(config.setNameFor("ASYN"), "ASYN");
  assertEq(config.repoOwnerFor("asyn", "slac-epics"), "slac-epics");

  pass();
}

static void testOverrides() {
  const toml::value val = R"(
    [cache]
    path = "/var/cache/modstack"

    [conventions]
    roots = ["/opt/epics"]

    [platform]
    tag = "R7.0.3.1-2.0"

    [overrides.repo-owner]
    motor = "pcdshub"

    [overrides.set-name]
    SNCSEQ = "SEQ"

    [patch.extra]
    RE2C = "/usr/bin/re2c"
  )"_toml;

  const Config config =
      Config::tryFromToml(val, "/work/modstack.toml").unwrap();
  assertEq(config.cachePath.string(), "/var/cache/modstack");
  assertEq(config.setPath.string(), "/var/cache/modstack/sets");
  assertEq(config.conventionRoots, std::vector<std::string>{ "/opt/epics" });
  assertEq(config.platform.variable, "EPICS_BASE");
  assertEq(config.platform.tag, "R7.0.3.1-2.0");
  assertEq(config.repoOwnerFor("motor", "slac-epics"), "pcdshub");
  // Tables replace the defaults.
  assertEq(config.setNameFor("EPICS_BASE"), "EPICS_BASE");
  assertEq(config.setNameFor("SNCSEQ"), "SEQ");
  assertEq(config.extraPatchVariables.at("RE2C"), "/usr/bin/re2c");

  pass();
}

static void testValidation() {
  {
    const toml::value val = R"(
      [conventions]
      roots = []
    )"_toml;
    assertEq(std::string(Config::tryFromToml(val, "").unwrap_err()->what()),
             "[conventions] roots must not be empty");
  }
  {
    const toml::value val = R"(
      [conventions]
      roots = ["relative/root"]
    )"_toml;
    assertEq(std::string(Config::tryFromToml(val, "").unwrap_err()->what()),
             "[conventions] root `relative/root` must be an absolute path");
  }
  {
    const toml::value val = R"(
      [overrides.repo-name]
      asyn = 3
    )"_toml;
    assertEq(std::string(Config::tryFromToml(val, "").unwrap_err()->what()),
             "[overrides.repo-name] asyn must be a string");
  }
  {
    const toml::value val = R"(
      [platform]
      tag = 7
    )"_toml;
    const std::string what = Config::tryFromToml(val, "").unwrap_err()->what();
    assertTrue(what.starts_with(
        "invalid value for `platform.tag` in modstack.toml: "));
  }
  {
    const toml::value val = R"(
      [cache]
      path = 3
    )"_toml;
    const std::string what = Config::tryFromToml(val, "").unwrap_err()->what();
    assertTrue(what.starts_with(
        "invalid value for `cache.path` in modstack.toml: "));
  }
  {
    const toml::value val = R"(
      repository = "slac-epics"
    )"_toml;
    assertEq(std::string(Config::tryFromToml(val, "").unwrap_err()->what()),
             "[repository] must be a table");
  }

  pass();
}

static void testIntrospectionVariables() {
  const Config config = Config::defaults("/work");
  const auto vars = config.introspectionVariablesFor("R7.0.2-2.0");
  assertEq(vars.at("EPICS_MODULES"), "/cds/group/pcds/epics/R7.0.2-2.0/modules");
  assertEq(vars.at("EPICS_SITE_TOP"), "/cds/group/pcds/");

  pass();
}

} // namespace tests

int main() {
  modstack::setColorMode("never");

  tests::testDefaults();
  tests::testOverrides();
  tests::testValidation();
  tests::testIntrospectionVariables();
}

#endif
