#include "helpers.hpp"

#include <boost/ut.hpp>
#include <filesystem>
#include <string>
#include <unistd.h>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "modstack patch"_test = [] {
    const tests::TempDir tmp;
    const auto release = tmp / "RELEASE";
    tests::writeFile(release, "# comment\n"
                              "ASYN=/old/asyn\n"
                              "  MOTOR=/indented\n"
                              "MOTOR ?= /old/motor\n"
                              "OTHER=/keep\n");

    const auto result = tests::runModstack(
        { "patch", release.string(), "ASYN=/new/asyn", "MOTOR=/new/motor" });
    expect(result.success);
    expect(result.out == "ASYN\nMOTOR\n");
    expect(tests::readFile(release)
           == "# comment\n"
              "ASYN=/new/asyn\n"
              "  MOTOR=/indented\n"
              "MOTOR?=/new/motor\n"
              "OTHER=/keep\n");
  };

  "modstack patch without matches"_test = [] {
    const tests::TempDir tmp;
    const auto release = tmp / "RELEASE";
    tests::writeFile(release, "OTHER=/keep");

    const auto result =
        tests::runModstack({ "patch", release.string(), "ASYN=/new" });
    expect(result.success);
    expect(result.out.empty());
    expect(result.err.find("Unchanged") != std::string::npos);
    expect(tests::readFile(release) == "OTHER=/keep");
  };

  "modstack patch missing file"_test = [] {
    const tests::TempDir tmp;
    const auto missing = tmp / "nope" / "RELEASE";

    const auto result =
        tests::runModstack({ "patch", missing.string(), "ASYN=/new" });
    expect(!result.success);
    expect(result.err.starts_with(
        "Error: failed to patch " + missing.string()));
  };

  "modstack patch read-only file"_test = [] {
    if (::geteuid() == 0) {
      // root ignores file permissions
      return;
    }
    const tests::TempDir tmp;
    const auto release = tmp / "RELEASE";
    tests::writeFile(release, "ASYN=/old\n");
    tests::fs::permissions(release, tests::fs::perms::owner_read,
                           tests::fs::perm_options::replace);

    const auto result =
        tests::runModstack({ "patch", release.string(), "ASYN=/new" });
    expect(!result.success);
    expect(result.err.starts_with("Error: permission denied while patching"));

    tests::fs::permissions(release, tests::fs::perms::owner_all,
                           tests::fs::perm_options::replace);
    expect(tests::readFile(release) == "ASYN=/old\n");
  };

  "modstack patch rejects malformed assignments"_test = [] {
    const tests::TempDir tmp;
    const auto release = tmp / "RELEASE";
    tests::writeFile(release, "ASYN=/old\n");

    const auto result =
        tests::runModstack({ "patch", release.string(), "ASYN" });
    expect(!result.success);
    expect(result.err == "Error: expected VAR=VALUE but got `ASYN`\n");
  };
}
