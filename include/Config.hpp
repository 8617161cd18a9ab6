#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <vector>

namespace modstack {

namespace fs = std::filesystem;

struct Platform {
  std::string variable;
  std::string name;
  std::string tag;
};

struct Overrides {
  // module name -> repository name
  std::map<std::string, std::string> repoName;
  // module name -> repository owner
  std::map<std::string, std::string> repoOwner;
  // variable -> version-set prefix
  std::map<std::string, std::string> setName;
};

struct Config {
  static constexpr const char* FILE_NAME = "modstack.toml";

  // Empty when built from defaults.
  fs::path path;

  fs::path cachePath;
  fs::path setPath;
  std::vector<std::string> conventionRoots;
  Platform platform;
  std::string repositoryOwner;
  Overrides overrides;
  std::map<std::string, std::string> extraPatchVariables;
  // Values may contain `{tag}`, replaced with the platform tag.
  std::map<std::string, std::string> introspectionVariables;

  // Built-in configuration; relative paths are relative to `baseDir`.
  static Config defaults(const fs::path& baseDir);

  static rs::Result<Config> tryParse(const fs::path& path) noexcept;
  static rs::Result<Config> tryFromToml(const toml::value& data,
                                        fs::path path) noexcept;
  static rs::Result<fs::path> findPath(fs::path candidateDir) noexcept;

  // `explicitPath` when given, else the nearest modstack.toml at or above
  // `targetDir`, else the defaults rooted at the working directory.
  static rs::Result<Config> load(const std::optional<fs::path>& explicitPath,
                                 const fs::path& targetDir) noexcept;

  fs::path moduleCachePath() const { return cachePath / "modules"; }

  std::string repoNameFor(const std::string& moduleName) const;
  std::string repoOwnerFor(const std::string& moduleName,
                           const std::string& defaultOwner) const;
  std::string setNameFor(const std::string& variable) const;
  std::map<std::string, std::string>
  introspectionVariablesFor(std::string_view tag) const;
};

} // namespace modstack
