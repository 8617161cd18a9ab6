#pragma once

#include "DependencyGraph.hpp"
#include "Introspector.hpp"

#include <filesystem>
#include <map>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace modstack {

namespace fs = std::filesystem;

// Release-file reader for EPICS-style modules: `configure/RELEASE` plus
// whatever it includes.
class ReleaseIntrospector : public Introspector {
public:
  static constexpr std::string_view RELEASE_FILE = "configure/RELEASE";

  void define(std::map<std::string, std::string> variables) override;

  rs::Result<ConfigFile> locateConfigFile(const fs::path& path) const override;

  rs::Result<DependencyNode*>
  buildDependencyNode(const ConfigFile& configFile,
                      const std::string& variableName,
                      DependencyGraph& graph) const override;

  // Result of reading one release file and its includes.
  struct ReleaseData {
    // Assigned variables in first-assignment order, with final values.
    std::vector<std::pair<std::string, std::string>> assignments;
    std::vector<fs::path> filesRead;
  };
  rs::Result<ReleaseData> read(const ConfigFile& configFile) const;

private:
  std::map<std::string, std::string> predefined;
};

// Expands `$(NAME)` and `${NAME}`; unknown names expand to nothing.
std::string expandVariables(std::string_view text,
                            const std::map<std::string, std::string>& vars);

} // namespace modstack
