#pragma once

#include "Config.hpp"
#include "ModuleIdentity.hpp"

#include <filesystem>
#include <map>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modstack {

namespace fs = std::filesystem;

using VersionSetEntries = std::vector<std::pair<std::string, std::string>>;

// `<prefix>=<tag>`, `<prefix>_DIRNAME=<name>`, ... in version-set order.
VersionSetEntries expandIdentity(const ModuleIdentity& identity,
                                 const std::string& prefix,
                                 const Config& config,
                                 const std::string& defaultOwner);

std::map<std::string, std::string> toSettings(const VersionSetEntries& entries);

// One `KEY=VALUE` line per entry.
std::string formatVersionSet(const std::vector<VersionSetEntries>& modules);

// Writes `<setPath>/<name>.set` and returns its path.
rs::Result<fs::path> writeVersionSetFile(const fs::path& setPath,
                                         std::string_view name,
                                         std::string_view text);

} // namespace modstack
