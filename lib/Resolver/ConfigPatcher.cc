#include "Resolver/ConfigPatcher.hpp"

#include "Diag.hpp"
#include "PathConvention.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fmt/ranges.h>
#include <fstream>
#include <iterator>
#include <map>
#include <rs/result.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace modstack {

static std::string_view trim(std::string_view str) {
  const std::size_t first = str.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const std::size_t last = str.find_last_not_of(" \t");
  return str.substr(first, last - first + 1);
}

static std::string
patchLine(const std::string_view line,
          const std::map<std::string, std::string>& variableToValue,
          std::set<std::string>& updated) {
  if (line.empty() || line.front() == ' ' || line.front() == '\t'
      || line.front() == '#') {
    return std::string(line);
  }

  for (const std::string_view op : { "?=", ":=", "=" }) {
    const std::size_t pos = line.find(op);
    if (pos == std::string_view::npos) {
      continue;
    }
    const std::string name(trim(line.substr(0, pos)));
    const auto itr = variableToValue.find(name);
    if (itr == variableToValue.end()) {
      continue;
    }
    updated.insert(name);
    return fmt::format("{}{}{}", name, op, itr->second);
  }
  return std::string(line);
}

std::string patchLines(const std::string_view content,
                       const std::map<std::string, std::string>& variableToValue,
                       std::set<std::string>& updated) {
  std::string patched;
  patched.reserve(content.size());

  std::size_t start = 0;
  while (start <= content.size()) {
    const std::size_t end = content.find('\n', start);
    if (end == std::string_view::npos) {
      // Content after the last newline; empty when the input ends with one.
      patched += patchLine(content.substr(start), variableToValue, updated);
      break;
    }
    patched += patchLine(content.substr(start, end - start), variableToValue,
                         updated);
    patched.push_back('\n');
    start = end + 1;
  }
  return patched;
}

static PatchError::Kind kindFromErrno(const int err,
                                      const PatchError::Kind fallback) {
  if (err == EACCES || err == EPERM) {
    return PatchError::Kind::Permission;
  }
  return fallback;
}

rs::Result<std::set<std::string>, PatchError>
patchConfigFile(const fs::path& path,
                const std::map<std::string, std::string>& variableToValue) {
  std::string content;
  {
    errno = 0;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
      const int err = errno;
      return rs::Err(PatchError{
          .kind = kindFromErrno(err, PatchError::Kind::Read),
          .path = path,
          .message = err != 0 ? std::strerror(err) : "failed to open",
      });
    }
    content.assign(std::istreambuf_iterator<char>(ifs),
                   std::istreambuf_iterator<char>());
    if (ifs.bad()) {
      return rs::Err(PatchError{ .kind = PatchError::Kind::Read,
                                 .path = path,
                                 .message = "failed to read" });
    }
  }

  std::set<std::string> updated;
  const std::string patched = patchLines(content, variableToValue, updated);
  if (updated.empty()) {
    spdlog::trace("{}: nothing to update", path.string());
    return rs::Ok(std::move(updated));
  }

  errno = 0;
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs.is_open()) {
    const int err = errno;
    return rs::Err(PatchError{
        .kind = kindFromErrno(err, PatchError::Kind::Write),
        .path = path,
        .message = err != 0 ? std::strerror(err) : "failed to open",
    });
  }
  ofs << patched;
  ofs.close();
  if (ofs.fail()) {
    return rs::Err(PatchError{ .kind = PatchError::Kind::Write,
                               .path = path,
                               .message = "failed to write" });
  }
  spdlog::debug("{}: updated {}", path.string(), updated);
  return rs::Ok(std::move(updated));
}

static bool isWithin(const fs::path& path, const fs::path& base) {
  const fs::path rel = path.lexically_relative(base);
  return !rel.empty() && *rel.begin() != "..";
}

std::set<std::string>
patchConfigFiles(const fs::path& basePath,
                 const std::vector<fs::path>& relativeFiles,
                 const std::map<std::string, std::string>& variableToValue) {
  const fs::path base = resolvePath(basePath);
  std::set<std::string> updated;
  for (const fs::path& relative : relativeFiles) {
    const fs::path file = resolvePath(base / relative);
    if (!isWithin(file, base)) {
      spdlog::debug("Skipping {}: outside of {}", file.string(), base.string());
      continue;
    }

    auto res = patchConfigFile(file, variableToValue);
    if (res.is_err()) {
      const PatchError& err = res.unwrap_err();
      if (err.kind == PatchError::Kind::Permission) {
        Diag::error("Permission denied while patching {}: {}",
                    err.path.string(), err.message);
      } else {
        Diag::error("Failed to patch {}: {}", err.path.string(), err.message);
      }
      continue;
    }
    const std::set<std::string>& names = res.unwrap();
    if (!names.empty()) {
      Diag::info("Patched", "{} ({})", file.string(), fmt::join(names, ", "));
    }
    updated.insert(names.begin(), names.end());
  }
  return updated;
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <rs/tests.hpp>
#  include <unistd.h>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

static void testPatchLines() {
  const std::map<std::string, std::string> vars{
    { "ASYN", "/cache/asyn-R4.39" },
    { "EPICS_BASE", "/cache/epics-base-R7.0.2-2.0" },
    { "RE2C", "re2c" },
  };
  std::set<std::string> updated;
  const std::string patched = patchLines("# ASYN=/old\n"
                                         "ASYN = /epics/asyn\n"
                                         "  EPICS_BASE=/indented\n"
                                         "EPICS_BASE?=/epics/base\n"
                                         "RE2C := /usr/bin/re2c\n"
                                         "OTHER=/x \n"
                                         "\n"
                                         "CALC=$(SUPPORT)/calc",
                                         vars, updated);
  assertEq(patched, "# ASYN=/old\n"
                    "ASYN=/cache/asyn-R4.39\n"
                    "  EPICS_BASE=/indented\n"
                    "EPICS_BASE?=/cache/epics-base-R7.0.2-2.0\n"
                    "RE2C:=re2c\n"
                    "OTHER=/x \n"
                    "\n"
                    "CALC=$(SUPPORT)/calc");
  assertEq(updated, std::set<std::string>{ "ASYN", "EPICS_BASE", "RE2C" });

  pass();
}

static void testOperatorFallthrough() {
  // `?=` appears in the value; the name left of it is not patched, so the
  // plain `=` assignment is used.
  const std::map<std::string, std::string> vars{ { "URL", "new" } };
  std::set<std::string> updated;
  assertEq(patchLines("URL=http://h/?a?=b\n", vars, updated), "URL=new\n");
  assertEq(updated.size(), 1UL);

  pass();
}

static void testUntouchedFileIsNotRewritten() {
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("modstack-patch-{}", ::getpid());
  fs::create_directories(dir);
  const fs::path file = dir / "RELEASE";
  {
    std::ofstream ofs(file);
    ofs << "OTHER=/x\n";
  }
  const auto before = fs::last_write_time(file);

  auto res = patchConfigFile(file, { { "ASYN", "/cache/asyn" } });
  assertTrue(res.is_ok());
  assertTrue(res.unwrap().empty());
  assertTrue(fs::last_write_time(file) == before);

  auto missing = patchConfigFile(dir / "missing", { { "ASYN", "/x" } });
  assertTrue(missing.is_err());
  assertTrue(missing.unwrap_err().kind == PatchError::Kind::Read);

  fs::remove_all(dir);
  pass();
}

static void testOutsideBaseIsSkipped() {
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("modstack-patch-base-{}", ::getpid());
  fs::create_directories(dir / "mod/configure");
  {
    std::ofstream ofs(dir / "mod/configure/RELEASE");
    ofs << "ASYN=/old\n";
  }
  {
    std::ofstream ofs(dir / "outside");
    ofs << "ASYN=/old\n";
  }

  const std::set<std::string> updated = patchConfigFiles(
      dir / "mod", { "configure/RELEASE", "../outside" },
      { { "ASYN", "/cache/asyn" } });
  assertEq(updated, std::set<std::string>{ "ASYN" });

  std::ifstream ifs(dir / "outside");
  std::string line;
  std::getline(ifs, line);
  assertEq(line, "ASYN=/old");

  fs::remove_all(dir);
  pass();
}

static void testFailedFileDoesNotStopBatch() {
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("modstack-patch-batch-{}", ::getpid());
  fs::create_directories(dir / "mod/configure");
  {
    std::ofstream ofs(dir / "mod/configure/RELEASE");
    ofs << "ASYN=/old\n";
  }

  auto missing = patchConfigFile(dir / "mod/configure/MISSING",
                                 { { "ASYN", "/cache/asyn" } });
  assertTrue(missing.is_err());
  assertTrue(missing.unwrap_err().kind == PatchError::Kind::Read);

  const std::set<std::string> updated = patchConfigFiles(
      dir / "mod", { "configure/MISSING", "configure/RELEASE" },
      { { "ASYN", "/cache/asyn" } });
  assertEq(updated, std::set<std::string>{ "ASYN" });

  std::ifstream ifs(dir / "mod/configure/RELEASE");
  std::string line;
  std::getline(ifs, line);
  assertEq(line, "ASYN=/cache/asyn");

  fs::remove_all(dir);
  pass();
}

} // namespace tests

int main() {
  modstack::setColorMode("never");

  tests::testPatchLines();
  tests::testOperatorFallthrough();
  tests::testUntouchedFileIsNotRewritten();
  tests::testOutsideBaseIsSkipped();
  tests::testFailedFileDoesNotStopBatch();
}

#endif
