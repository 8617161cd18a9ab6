#include "Backend/BuildBackend.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>

namespace modstack {

std::optional<std::string> SettingsStore::get(const std::string_view key) const {
  const auto itr = values.find(key);
  if (itr == values.end()) {
    return std::nullopt;
  }
  return itr->second;
}

void SettingsStore::set(const std::string& key, std::string value) {
  spdlog::trace("Setting {}={}", key, value);
  values.insert_or_assign(key, std::move(value));
}

void SettingsStore::update(const std::map<std::string, std::string>& settings,
                           const bool overwrite) {
  for (const auto& [key, value] : settings) {
    const auto itr = values.find(key);
    if (itr == values.end()) {
      spdlog::debug("New setting {}={}", key, value);
      values.emplace(key, value);
    } else if (itr->second == value) {
      continue;
    } else if (overwrite) {
      spdlog::debug("Overwriting {}={} (was {})", key, value, itr->second);
      itr->second = value;
    } else {
      spdlog::debug("Keeping {}={} (not {})", key, itr->second, value);
    }
  }
}

rs::Result<void>
CheckoutSuppressingBackend::runCheckoutReset(const fs::path& path,
                                             const std::string& subdirectory) {
  spdlog::debug("Not resetting {} in {}", subdirectory, path.string());
  return rs::Ok();
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <rs/tests.hpp>
#  include <stdexcept>
#  include <vector>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

namespace {

class RecordingBackend : public BuildBackend {
public:
  rs::Result<void> registerDependency(const std::string& variable) override {
    calls.push_back("register " + variable);
    return rs::Ok();
  }
  rs::Result<void> updateLocalReleaseRecord(const std::string& variable,
                                            const fs::path&) override {
    calls.push_back("record " + variable);
    return rs::Ok();
  }
  rs::Result<void> runCheckoutReset(const fs::path&,
                                    const std::string& subdirectory) override {
    calls.push_back("reset " + subdirectory);
    return rs::Ok();
  }
  SettingsStore& settings() override { return store; }

  std::vector<std::string> calls;
  SettingsStore store;
};

} // namespace

static void testUpdateOverwrite() {
  SettingsStore store;
  store.set("ASYN", "R4.39");
  store.update({ { "ASYN", "R4.42" }, { "CALC", "R3.7" } }, false);
  assertEq(store.get("ASYN").value(), "R4.39");
  assertEq(store.get("CALC").value(), "R3.7");

  store.update({ { "ASYN", "R4.42" } }, true);
  assertEq(store.get("ASYN").value(), "R4.42");
  assertFalse(store.get("MOTOR").has_value());

  pass();
}

static void testSuppressingBackend() {
  RecordingBackend inner;
  CheckoutSuppressingBackend suppressing(inner);
  suppressing.registerDependency("ASYN").unwrap();
  suppressing.runCheckoutReset("/cache/asyn", "configure").unwrap();
  suppressing.updateLocalReleaseRecord("ASYN", "/cache/asyn").unwrap();
  suppressing.settings().set("KEY", "value");

  assertEq(inner.calls,
           std::vector<std::string>{ "register ASYN", "record ASYN" });
  assertEq(inner.store.get("KEY").value(), "value");

  pass();
}

static void testScopedOverrideRestores() {
  RecordingBackend real;
  CheckoutSuppressingBackend suppressing(real);
  BuildBackend* active = &real;
  {
    const ScopedOverride<BuildBackend*> guard(active, &suppressing);
    assertTrue(active == &suppressing);
  }
  assertTrue(active == &real);

  int value = 1;
  try {
    const ScopedOverride<int> guard(value, 2);
    throw std::runtime_error("leave scope");
  } catch (const std::runtime_error&) {
    assertEq(value, 1);
  }

  pass();
}

} // namespace tests

int main() {
  tests::testUpdateOverwrite();
  tests::testSuppressingBackend();
  tests::testScopedOverrideRestores();
}

#endif
