#include "VersionSet.hpp"

#include "Config.hpp"
#include "ModuleIdentity.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <map>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace modstack {

VersionSetEntries expandIdentity(const ModuleIdentity& identity,
                                 const std::string& prefix,
                                 const Config& config,
                                 const std::string& defaultOwner) {
  const std::string repoName = config.repoNameFor(identity.name);
  const std::string repoOwner = config.repoOwnerFor(identity.name, defaultOwner);
  return {
    { prefix, identity.tag.empty() ? "master" : identity.tag },
    { prefix + "_DIRNAME", identity.name },
    { prefix + "_REPONAME", repoName },
    { prefix + "_REPOOWNER", repoOwner },
    { prefix + "_VARNAME", prefix },
    { prefix + "_RECURSIVE", "YES" },
    { prefix + "_DEPTH", "-1" },
    { prefix + "_REPOURL",
      fmt::format("https://github.com/{}/{}.git", repoOwner, repoName) },
  };
}

std::map<std::string, std::string> toSettings(const VersionSetEntries& entries) {
  return { entries.begin(), entries.end() };
}

std::string formatVersionSet(const std::vector<VersionSetEntries>& modules) {
  std::string text;
  for (const VersionSetEntries& entries : modules) {
    for (const auto& [key, value] : entries) {
      text += fmt::format("{}={}\n", key, value);
    }
  }
  return text;
}

rs::Result<fs::path> writeVersionSetFile(const fs::path& setPath,
                                         const std::string_view name,
                                         const std::string_view text) {
  std::error_code ec;
  fs::create_directories(setPath, ec);
  rs_ensure(!ec, "failed to create {}: {}", setPath.string(), ec.message());

  const fs::path file = setPath / fmt::format("{}.set", name);
  std::ofstream ofs(file, std::ios::trunc);
  rs_ensure(ofs.is_open(), "failed to open {}", file.string());
  ofs << text;
  ofs.close();
  rs_ensure(!ofs.fail(), "failed to write {}", file.string());
  spdlog::debug("Wrote {}", file.string());
  return rs::Ok(file);
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <rs/tests.hpp>
#  include <sstream>
#  include <unistd.h>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

static void testExpandIdentity() {
  Config config = Config::defaults("/work");
  config.overrides.repoOwner.emplace("motor", "pcdshub");

  const VersionSetEntries base =
      expandIdentity(ModuleIdentity("R7.0.2-2.0", "base", "R7.0.2-2.0"),
                     "BASE", config, "slac-epics");
  assertEq(base.size(), 8UL);
  assertEq(base[0].first, "BASE");
  assertEq(base[0].second, "R7.0.2-2.0");
  assertEq(base[2].second, "epics-base");
  assertEq(base[4].second, "BASE");
  assertEq(base[7].second, "https://github.com/slac-epics/epics-base.git");

  const auto motor = toSettings(
      expandIdentity(ModuleIdentity("R7.0.2-2.0", "motor", ""), "MOTOR",
                     config, "slac-epics"));
  assertEq(motor.at("MOTOR"), "master");
  assertEq(motor.at("MOTOR_DIRNAME"), "motor");
  assertEq(motor.at("MOTOR_REPOOWNER"), "pcdshub");
  assertEq(motor.at("MOTOR_RECURSIVE"), "YES");
  assertEq(motor.at("MOTOR_DEPTH"), "-1");
  assertEq(motor.at("MOTOR_REPOURL"), "https://github.com/pcdshub/motor.git");

  pass();
}

static void testWriteFile() {
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("modstack-sets-{}", ::getpid());
  fs::remove_all(dir);

  const std::string text = formatVersionSet(
      { { { "BASE", "R7.0.2-2.0" } }, { { "ASYN", "R4.39" } } });
  assertEq(text, "BASE=R7.0.2-2.0\nASYN=R4.39\n");

  const fs::path file = writeVersionSetFile(dir / "sets", "defaults", text)
                            .unwrap();
  assertEq(file.filename().string(), "defaults.set");
  std::ifstream ifs(file);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  assertEq(oss.str(), text);

  fs::remove_all(dir);
  pass();
}

} // namespace tests

int main() {
  tests::testExpandIdentity();
  tests::testWriteFile();
}

#endif
