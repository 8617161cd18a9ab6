#pragma once

#include "ModuleIdentity.hpp"

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace modstack {

namespace fs = std::filesystem;

// Recognizes `<root>/<base>/modules/<name>/<tag>[/]` for each registered
// root prefix, in registration order.
class PathConventionParser {
public:
  explicit PathConventionParser(const std::vector<std::string>& rootPrefixes);

  // A path outside every convention is not an error: it yields nullopt.
  std::optional<ModuleIdentity> parse(const fs::path& path) const;

  const std::vector<std::string>& rootPrefixes() const { return prefixes; }

private:
  std::vector<std::string> prefixes;
  std::vector<std::regex> patterns;
};

// Absolute and symlink-free when the path exists; lexically normalized
// otherwise.
fs::path resolvePath(const fs::path& path);

} // namespace modstack
