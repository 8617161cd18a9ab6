#include "Backend/LocalBackend.hpp"

#include "Diag.hpp"
#include "Git2/Exception.hpp"
#include "Git2/Repository.hpp"
#include "ModuleIdentity.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace modstack {

rs::Result<fs::path>
LocalBackend::checkoutPath(const std::string& variable) const {
  const std::optional<std::string> dirName = store.get(variable + "_DIRNAME");
  const std::optional<std::string> tag = store.get(variable);
  rs_ensure(dirName.has_value() && tag.has_value(),
            "no version settings for {}", variable);
  return rs::Ok(moduleCachePath
                / fmt::format("{}-{}", *dirName, stripBranchSuffix(*tag)));
}

rs::Result<void>
LocalBackend::registerDependency(const std::string& variable) {
  if (std::ranges::find(registered, variable) != registered.end()) {
    return rs::Ok();
  }
  registered.push_back(variable);

  const fs::path dest = rs_try(checkoutPath(variable));
  std::error_code ec;
  if (fs::exists(dest, ec)) {
    spdlog::debug("{} already present at {}", variable, dest.string());
    return rs::Ok();
  }
  if (!cloneMissing) {
    spdlog::debug("{} is not in the cache; cloning is disabled", variable);
    return rs::Ok();
  }
  return cloneModule(variable, dest);
}

rs::Result<void> LocalBackend::cloneModule(const std::string& variable,
                                           const fs::path& dest) const {
  const std::optional<std::string> url = store.get(variable + "_REPOURL");
  rs_ensure(url.has_value(), "no repository URL for {}", variable);
  const std::string tag = store.get(variable).value_or("master");

  Diag::info("Cloning", "{} ({})", *url, tag);
  try {
    git2::Repository repo;
    repo.clone(*url, dest.string());

    git_oid oid{};
    try {
      oid = repo.revparseCommit(tag);
    } catch (const git2::Exception& e) {
      spdlog::debug("{}: {}; trying origin/{}", tag, e.what(), tag);
      oid = repo.revparseCommit("origin/" + tag);
    }
    repo.checkoutDetached(oid);
  } catch (const git2::Exception& e) {
    rs_bail("failed to clone {} into {}: {}", *url, dest.string(), e.what());
  }
  return rs::Ok();
}

rs::Result<void>
LocalBackend::updateLocalReleaseRecord(const std::string& variable,
                                       const fs::path& path) {
  const auto itr = std::ranges::find_if(
      releaseRecord, [&](const auto& entry) { return entry.first == variable; });
  if (itr != releaseRecord.end()) {
    itr->second = path;
  } else {
    releaseRecord.emplace_back(variable, path);
  }
  return writeReleaseRecord();
}

rs::Result<void> LocalBackend::writeReleaseRecord() const {
  std::error_code ec;
  fs::create_directories(moduleCachePath, ec);
  rs_ensure(!ec, "failed to create {}: {}", moduleCachePath.string(),
            ec.message());

  std::ostringstream oss;
  for (const auto& [variable, path] : releaseRecord) {
    oss << variable << '=' << path.string() << '\n';
  }

  const fs::path record = releaseRecordPath();
  std::ofstream ofs(record, std::ios::trunc);
  rs_ensure(ofs.is_open(), "failed to open {}", record.string());
  ofs << oss.str();
  ofs.close();
  rs_ensure(!ofs.fail(), "failed to write {}", record.string());
  spdlog::debug("Wrote {} ({} entries)", record.string(),
                releaseRecord.size());
  return rs::Ok();
}

rs::Result<void>
LocalBackend::runCheckoutReset(const fs::path& path,
                               const std::string& subdirectory) {
  try {
    git2::Repository repo;
    repo.open(path.string());
    repo.forceCheckoutHead({ subdirectory });
  } catch (const git2::Exception& e) {
    rs_bail("failed to reset {} in {}: {}", subdirectory, path.string(),
            e.what());
  }
  spdlog::debug("Reset {} in {}", subdirectory, path.string());
  return rs::Ok();
}

std::vector<std::string> LocalBackend::modulesToBuild() const {
  std::vector<std::string> modules;
  std::istringstream iss(store.get(MODULES_TO_BUILD).value_or(""));
  std::string module;
  while (iss >> module) {
    modules.push_back(module);
  }
  return modules;
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>
#  include <unistd.h>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

namespace {

fs::path scratchDir(const std::string_view name) {
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("modstack-{}-{}", name, ::getpid());
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string slurp(const fs::path& file) {
  std::ifstream ifs(file);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

} // namespace

static void testReleaseRecord() {
  const fs::path dir = scratchDir("record");
  LocalBackend backend(dir / "modules", false);

  backend.updateLocalReleaseRecord("EPICS_BASE", "/cache/base").unwrap();
  backend.updateLocalReleaseRecord("ASYN", "/cache/asyn-R4.39").unwrap();
  backend.updateLocalReleaseRecord("EPICS_BASE", "/cache/base-2").unwrap();

  assertEq(slurp(backend.releaseRecordPath()),
           "EPICS_BASE=/cache/base-2\nASYN=/cache/asyn-R4.39\n");

  fs::remove_all(dir);
  pass();
}

static void testRegisterWithoutCloning() {
  const fs::path dir = scratchDir("register");
  LocalBackend backend(dir, false);
  backend.settings().update(
      { { "ASYN", "R4.39-branch" }, { "ASYN_DIRNAME", "asyn" } }, true);

  backend.registerDependency("ASYN").unwrap();
  backend.registerDependency("ASYN").unwrap();
  assertEq(backend.modules(), std::vector<std::string>{ "ASYN" });
  assertEq(backend.checkoutPath("ASYN").unwrap().string(),
           (dir / "asyn-R4.39").string());
  assertFalse(fs::exists(dir / "asyn-R4.39"));

  assertTrue(backend.registerDependency("CALC").is_err());

  fs::remove_all(dir);
  pass();
}

static void testModulesToBuild() {
  LocalBackend backend("/cache/modules", false);
  assertTrue(backend.modulesToBuild().empty());
  backend.settings().set(std::string(LocalBackend::MODULES_TO_BUILD),
                         "SNCSEQ ASYN  MOTOR");
  assertEq(backend.modulesToBuild(),
           std::vector<std::string>{ "SNCSEQ", "ASYN", "MOTOR" });

  pass();
}

static void testResetOutsideRepository() {
  const fs::path dir = scratchDir("reset");
  LocalBackend backend(dir, false);
  assertTrue(backend.runCheckoutReset(dir, "configure").is_err());

  fs::remove_all(dir);
  pass();
}

} // namespace tests

int main() {
  tests::testReleaseRecord();
  tests::testRegisterWithoutCloning();
  tests::testModulesToBuild();
  tests::testResetOutsideRepository();
}

#endif
