#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <rs/result.hpp>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace modstack {

namespace fs = std::filesystem;

struct PatchError {
  enum class Kind : uint8_t {
    Read,
    Permission,
    Write,
  };

  Kind kind;
  fs::path path;
  std::string message;
};

// Rewrites `NAME = value` style assignments (`?=`, `:=`, `=`) of the given
// variables in place. Everything else, including indented and commented
// lines, is kept byte for byte. Returns the names that were rewritten.
rs::Result<std::set<std::string>, PatchError>
patchConfigFile(const fs::path& path,
                const std::map<std::string, std::string>& variableToValue);

// Line-level rewrite used by patchConfigFile.
std::string patchLines(std::string_view content,
                       const std::map<std::string, std::string>& variableToValue,
                       std::set<std::string>& updated);

// Patches each of `relativeFiles` under `basePath`. Failures are reported
// per file and do not stop the others.
std::set<std::string>
patchConfigFiles(const fs::path& basePath,
                 const std::vector<fs::path>& relativeFiles,
                 const std::map<std::string, std::string>& variableToValue);

} // namespace modstack
