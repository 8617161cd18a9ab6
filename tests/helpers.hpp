#pragma once

#include "Driver.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <vector>

namespace tests {

namespace fs = std::filesystem;

struct TempDir {
  fs::path path;

  TempDir()
      : path([] {
          const auto epoch =
              std::chrono::steady_clock::now().time_since_epoch();
          const auto ticks =
              std::chrono::duration_cast<std::chrono::nanoseconds>(epoch)
                  .count();
          const auto random =
              static_cast<std::uint64_t>(std::random_device{}());
          std::ostringstream oss;
          oss << "modstack-test-" << random << '-' << ticks;
          return fs::temp_directory_path() / oss.str();
        }()) {
    fs::create_directories(path);
    path = fs::canonical(path);
  }

  ~TempDir() {
    if (path.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  TempDir(TempDir&& other) noexcept : path(std::move(other.path)) {
    other.path.clear();
  }

  TempDir& operator=(TempDir&& other) noexcept {
    if (this != &other) {
      path = std::move(other.path);
      other.path.clear();
    }
    return *this;
  }

  [[nodiscard]] fs::path operator/(const fs::path& relative) const {
    return path / relative;
  }
};

inline std::string readFile(const fs::path& file) {
  std::ifstream ifs(file);
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}

inline void writeFile(const fs::path& file, const std::string& content) {
  fs::create_directories(file.parent_path());
  std::ofstream ofs(file);
  ofs << content;
}

// Convention root that never exists on disk, so every path below it is an
// unresolved reference the resolver has to parse.
inline constexpr std::string_view CONVENTION_ROOT = "/modstack-test/epics";
inline constexpr std::string_view BASE = "R7.0.2-2.0";

inline std::string conventionPath(std::string_view name, std::string_view tag) {
  return fmt::format("{}/{}/modules/{}/{}", CONVENTION_ROOT, BASE, name, tag);
}

// A module checked out in the cache with the given release file.
inline fs::path writeCachedModule(const fs::path& cacheModules,
                                  std::string_view dirName,
                                  const std::string& release) {
  const fs::path root = cacheModules / dirName;
  writeFile(root / "configure" / "RELEASE", release);
  return root;
}

// IOC -> MOTOR -> ASYN -> EPICS_BASE, with MOTOR and ASYN already in the
// cache under `<tmp>/cache/modules`.
struct ModuleTree {
  fs::path cacheModules;
  fs::path ioc;
  fs::path motor;
  fs::path asyn;

  explicit ModuleTree(const fs::path& tmp)
      : cacheModules(tmp / "cache" / "modules"), ioc(tmp / "ioc") {
    asyn = writeCachedModule(
        cacheModules, "asyn-R4.39-1.0.1",
        fmt::format("EPICS_BASE={}/base/{}\n", CONVENTION_ROOT, BASE));
    motor = writeCachedModule(
        cacheModules, "motor-R6.9-ess",
        fmt::format("ASYN={}\nEPICS_BASE={}/base/{}\n",
                    conventionPath("asyn", "R4.39-1.0.1"), CONVENTION_ROOT,
                    BASE));
    writeFile(ioc / "configure" / "RELEASE",
              fmt::format("# IOC release\n"
                          "MOTOR={}\n"
                          "EPICS_BASE={}/base/{}\n",
                          conventionPath("motor", "R6.9-ess"),
                          CONVENTION_ROOT, BASE));
  }
};

inline std::string modstackConfig(const fs::path& tmp) {
  return fmt::format("[cache]\n"
                     "path = \"{}\"\n"
                     "sets = \"{}\"\n"
                     "\n"
                     "[conventions]\n"
                     "roots = [\"{}\"]\n"
                     "\n"
                     "[platform]\n"
                     "tag = \"{}\"\n",
                     (tmp / "cache").string(), (tmp / "sets").string(),
                     CONVENTION_ROOT, BASE);
}

struct RunResult {
  bool success;
  std::string out;
  std::string err;
};

// Redirects a standard stream into a temporary file for its lifetime.
class CapturedFd {
public:
  CapturedFd(int fd, std::FILE* stream, fs::path file)
      : fd(fd), stream(stream), file(std::move(file)) {
    std::fflush(stream);
    saved = ::dup(fd);
    const int target =
        ::open(this->file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    ::dup2(target, fd);
    ::close(target);
  }

  ~CapturedFd() { restore(); }

  CapturedFd(const CapturedFd&) = delete;
  CapturedFd& operator=(const CapturedFd&) = delete;

  std::string finish() {
    restore();
    return readFile(file);
  }

private:
  void restore() {
    if (saved < 0) {
      return;
    }
    std::fflush(stream);
    ::dup2(saved, fd);
    ::close(saved);
    saved = -1;
  }

  int fd;
  std::FILE* stream;
  fs::path file;
  int saved = -1;
};

// Runs the command line in-process with colors disabled.
inline RunResult runModstack(const std::vector<std::string>& args) {
  ::setenv("MODSTACK_TERM_COLOR", "never", 1);

  std::vector<std::string> argvStorage;
  argvStorage.reserve(args.size() + 1);
  argvStorage.emplace_back("modstack");
  argvStorage.insert(argvStorage.end(), args.begin(), args.end());
  std::vector<char*> argv;
  argv.reserve(argvStorage.size());
  for (std::string& arg : argvStorage) {
    argv.push_back(arg.data());
  }

  const TempDir capture;
  CapturedFd out(STDOUT_FILENO, stdout, capture / "stdout");
  CapturedFd err(STDERR_FILENO, stderr, capture / "stderr");
  const bool success =
      modstack::run(static_cast<int>(argv.size()), argv.data()).is_ok();
  return RunResult{ success, out.finish(), err.finish() };
}

inline RunResult runModstack(std::initializer_list<std::string> args) {
  return runModstack(std::vector<std::string>(args));
}

} // namespace tests
