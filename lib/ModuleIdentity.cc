#include "ModuleIdentity.hpp"

#include <fmt/format.h>
#include <string>
#include <string_view>

namespace modstack {

std::string stripBranchSuffix(const std::string_view tag) {
  static constexpr std::string_view suffix = "-branch";

  std::string result(tag);
  std::size_t pos = 0;
  while ((pos = result.find(suffix, pos)) != std::string::npos) {
    result.erase(pos, suffix.size());
  }
  return result;
}

std::string ModuleIdentity::cacheDirName() const {
  return fmt::format("{}-{}", name, stripBranchSuffix(tag));
}

} // namespace modstack

#ifdef MODSTACK_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace modstack; // NOLINT(build/namespaces,google-build-using-namespace)

static void testStripBranchSuffix() {
  assertEq(stripBranchSuffix("R7.0.3.1-2.0-branch"), "R7.0.3.1-2.0");
  assertEq(stripBranchSuffix("R7.0.2-2.branch"), "R7.0.2-2.branch");
  assertEq(stripBranchSuffix("R1.2-1.0"), "R1.2-1.0");
  assertEq(stripBranchSuffix("a-branch-branch"), "a");
  assertEq(stripBranchSuffix(""), "");

  pass();
}

static void testCacheDirName() {
  const ModuleIdentity asyn("R7.0.2-2.0", "asyn", "R4.39-1.0.1");
  assertEq(asyn.cacheDirName(), "asyn-R4.39-1.0.1");

  const ModuleIdentity base("R7.0.3.1-2.0-branch", "epics-base",
                            "R7.0.3.1-2.0-branch");
  assertEq(base.cacheDirName(), "epics-base-R7.0.3.1-2.0");

  pass();
}

static void testEqualityAndFormat() {
  const ModuleIdentity lhs("R7.0.2-2.0", "motor", "R6.9-ess");
  const ModuleIdentity rhs("R7.0.2-2.0", "motor", "R6.9-ess");
  const ModuleIdentity other("R7.0.2-2.0", "motor", "R7.0");

  assertTrue(lhs == rhs);
  assertTrue(lhs != other);
  assertEq(fmt::format("{}", lhs), "motor@R6.9-ess (R7.0.2-2.0)");

  pass();
}

} // namespace tests

int main() {
  tests::testStripBranchSuffix();
  tests::testCacheDirName();
  tests::testEqualityAndFormat();
}

#endif
