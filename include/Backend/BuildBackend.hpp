#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace modstack {

namespace fs = std::filesystem;

// Key/value settings shared with the external build driver.
class SettingsStore {
public:
  std::optional<std::string> get(std::string_view key) const;
  void set(const std::string& key, std::string value);

  // Merges `settings`; existing keys are kept unless `overwrite`.
  void update(const std::map<std::string, std::string>& settings,
              bool overwrite);

  const std::map<std::string, std::string, std::less<>>& entries() const {
    return values;
  }

private:
  std::map<std::string, std::string, std::less<>> values;
};

class BuildBackend {
public:
  virtual ~BuildBackend() = default;

  // Records the dependency and materializes it in the cache if needed.
  virtual rs::Result<void> registerDependency(const std::string& variable) = 0;

  // Records `variable=path` in the release record shared by all modules.
  virtual rs::Result<void>
  updateLocalReleaseRecord(const std::string& variable,
                           const fs::path& path) = 0;

  // Discards local changes to `subdirectory` of the checkout at `path`.
  virtual rs::Result<void> runCheckoutReset(const fs::path& path,
                                            const std::string& subdirectory) = 0;

  virtual SettingsStore& settings() = 0;
};

// Forwards everything except checkout resets, which become no-ops.
class CheckoutSuppressingBackend : public BuildBackend {
public:
  explicit CheckoutSuppressingBackend(BuildBackend& inner) : inner(inner) {}

  rs::Result<void> registerDependency(const std::string& variable) override {
    return inner.registerDependency(variable);
  }
  rs::Result<void> updateLocalReleaseRecord(const std::string& variable,
                                            const fs::path& path) override {
    return inner.updateLocalReleaseRecord(variable, path);
  }
  rs::Result<void> runCheckoutReset(const fs::path& path,
                                    const std::string& subdirectory) override;
  SettingsStore& settings() override { return inner.settings(); }

private:
  BuildBackend& inner;
};

// Replaces `target` with `value` until the end of the scope.
template <typename T>
class ScopedOverride {
public:
  ScopedOverride(T& target, T value)
      : target(target), saved(std::exchange(target, std::move(value))) {}
  ~ScopedOverride() { target = std::move(saved); }

  ScopedOverride(const ScopedOverride&) = delete;
  ScopedOverride& operator=(const ScopedOverride&) = delete;
  ScopedOverride(ScopedOverride&&) = delete;
  ScopedOverride& operator=(ScopedOverride&&) = delete;

private:
  T& target;
  T saved;
};

} // namespace modstack
