#include "PathConvention.hpp"

#include "ModuleIdentity.hpp"

#include <filesystem>
#include <optional>
#include <regex>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace modstack {

static std::string escapeRegex(const std::string_view str) {
  static constexpr std::string_view special = R"(\^$.|?*+()[]{})";

  std::string escaped;
  escaped.reserve(str.size());
  for (const char c : str) {
    if (special.find(c) != std::string_view::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

static std::string normalizePrefix(std::string prefix) {
  while (prefix.size() > 1 && prefix.back() == '/') {
    prefix.pop_back();
  }
  return prefix;
}

fs::path resolvePath(const fs::path& path) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(path, ec);
  if (ec) {
    resolved = fs::absolute(path, ec).lexically_normal();
    if (ec) {
      return path.lexically_normal();
    }
  }
  return resolved;
}

PathConventionParser::PathConventionParser(
    const std::vector<std::string>& rootPrefixes) {
  prefixes.reserve(rootPrefixes.size());
  patterns.reserve(rootPrefixes.size());
  for (const std::string& root : rootPrefixes) {
    std::string prefix = normalizePrefix(root);
    // <root>/<base>/modules/<name>/<tag>[/]
    patterns.emplace_back("^" + escapeRegex(prefix)
                          + "/([^/]+)/modules/([^/]+)/([^/]+)/?");
    prefixes.push_back(std::move(prefix));
  }
}

std::optional<ModuleIdentity>
PathConventionParser::parse(const fs::path& path) const {
  const std::string pathStr = resolvePath(path).generic_string();
  for (std::size_t i = 0; i < patterns.size(); ++i) {
    std::smatch match;
    if (!std::regex_search(pathStr, match, patterns[i],
                           std::regex_constants::match_continuous)) {
      continue;
    }
    spdlog::trace("{} matches root {}", pathStr, prefixes[i]);
    return ModuleIdentity(match[1].str(), match[2].str(), match[3].str());
  }
  return std::nullopt;
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

static void testParseConvention() {
  const PathConventionParser parser({ "/root" });

  const auto identity =
      parser.parse("/root/R7.0.2-2.0/modules/mymodule/R1.2-1.0/");
  assertTrue(identity.has_value());
  assertEq(identity->base, "R7.0.2-2.0");
  assertEq(identity->name, "mymodule");
  assertEq(identity->tag, "R1.2-1.0");

  assertFalse(parser.parse("/root/unrelated/format").has_value());

  pass();
}

static void testParseWithoutTrailingSlash() {
  const PathConventionParser parser({ "/modstack-test/epics" });

  const auto identity =
      parser.parse("/modstack-test/epics/R7.0.2-2.0/modules/asyn/R4.39-1.0.1");
  assertTrue(identity.has_value());
  assertEq(identity->name, "asyn");
  assertEq(identity->tag, "R4.39-1.0.1");

  pass();
}

static void testRootPriority() {
  const PathConventionParser parser(
      { "/modstack-test/cds/group/pcds/epics/", "/modstack-test/reg/g/pcds/epics" });
  assertEq(parser.rootPrefixes().front(), "/modstack-test/cds/group/pcds/epics");

  const auto reg = parser.parse(
      "/modstack-test/reg/g/pcds/epics/R7.0.2-2.0/modules/motor/R6.9-ess/");
  assertTrue(reg.has_value());
  assertEq(reg->name, "motor");

  // The prefix must be a whole path component.
  assertFalse(parser
                  .parse("/modstack-test/reg/g/pcds/epicsX/R7.0.2-2.0/modules/"
                         "motor/R6.9-ess/")
                  .has_value());

  pass();
}

static void testRegexCharactersInRoot() {
  const PathConventionParser parser({ "/modstack-test/a.b" });

  assertTrue(parser.parse("/modstack-test/a.b/R1/modules/m/R1.0").has_value());
  assertFalse(parser.parse("/modstack-test/aXb/R1/modules/m/R1.0").has_value());

  pass();
}

static void testNormalizedBeforeMatching() {
  const PathConventionParser parser({ "/modstack-test/epics" });

  const auto identity = parser.parse(
      "/modstack-test/epics/other/../R7.0.2-2.0/modules/./asyn/R4.39-1.0.1");
  assertTrue(identity.has_value());
  assertEq(identity->base, "R7.0.2-2.0");
  assertEq(identity->name, "asyn");

  assertFalse(parser.parse("/modstack-test/epics/R7.0.2-2.0/modules/asyn")
                  .has_value());

  pass();
}

} // namespace tests

int main() {
  tests::testParseConvention();
  tests::testParseWithoutTrailingSlash();
  tests::testRootPriority();
  tests::testRegexCharactersInRoot();
  tests::testNormalizedBeforeMatching();
}

#endif
