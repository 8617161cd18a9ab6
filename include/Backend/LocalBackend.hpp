#pragma once

#include "Backend/BuildBackend.hpp"

#include <filesystem>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modstack {

namespace fs = std::filesystem;

// Backend working directly on the module cache: modules are git checkouts
// under `moduleCachePath`, and their release record is
// `<moduleCachePath>/RELEASE.local`.
class LocalBackend : public BuildBackend {
public:
  static constexpr std::string_view RELEASE_RECORD = "RELEASE.local";
  static constexpr std::string_view MODULES_TO_BUILD = "MODULES_TO_BUILD";

  LocalBackend(fs::path moduleCachePath, const bool cloneMissing)
      : moduleCachePath(std::move(moduleCachePath)),
        cloneMissing(cloneMissing) {}

  rs::Result<void> registerDependency(const std::string& variable) override;
  rs::Result<void> updateLocalReleaseRecord(const std::string& variable,
                                            const fs::path& path) override;
  rs::Result<void> runCheckoutReset(const fs::path& path,
                                    const std::string& subdirectory) override;
  SettingsStore& settings() override { return store; }

  // Registered variables in registration order.
  const std::vector<std::string>& modules() const { return registered; }
  // Last published build order.
  std::vector<std::string> modulesToBuild() const;

  // Cache directory of a variable whose version-set settings are known.
  rs::Result<fs::path> checkoutPath(const std::string& variable) const;
  fs::path releaseRecordPath() const {
    return moduleCachePath / RELEASE_RECORD;
  }

private:
  rs::Result<void> cloneModule(const std::string& variable,
                               const fs::path& dest) const;
  rs::Result<void> writeReleaseRecord() const;

  fs::path moduleCachePath;
  bool cloneMissing;
  SettingsStore store;
  std::vector<std::string> registered;
  std::vector<std::pair<std::string, fs::path>> releaseRecord;
};

} // namespace modstack
