#include "helpers.hpp"

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <regex>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "modstack version"_test = [] {
    const auto result = tests::runModstack({ "version" });
    expect(result.success);
    static const std::regex pattern(R"(^modstack ([^\s]+)\n$)");
    std::smatch match;
    expect(std::regex_match(result.out, match, pattern));
    expect(match[1].str() == MODSTACK_PKG_VERSION);
    expect(result.err.empty());
  };

  "modstack --version"_test = [] {
    const auto result = tests::runModstack({ "-V" });
    expect(result.success);
    expect(result.out == fmt::format("modstack {}\n", MODSTACK_PKG_VERSION));
  };

  "modstack without arguments"_test = [] {
    const auto result = tests::runModstack({});
    expect(result.success);
    expect(result.out.find("Usage: modstack [OPTIONS] [COMMAND]")
           != std::string::npos);
    for (const char* command : { "prepare", "order", "patch", "help" }) {
      expect(result.out.find(command) != std::string::npos) << command;
    }
  };

  "modstack help prepare"_test = [] {
    const auto result = tests::runModstack({ "help", "prepare" });
    expect(result.success);
    expect(result.out.find("Usage: modstack prepare [OPTIONS] <TARGET>")
           != std::string::npos);
    expect(result.out.find("--set-name <NAME>") != std::string::npos);
    expect(result.out.find("--color <WHEN>") != std::string::npos);
  };

  "modstack order --help"_test = [] {
    const auto result = tests::runModstack({ "order", "--help" });
    expect(result.success);
    expect(result.out.find("--json") != std::string::npos);
  };

  "modstack help for unknown command"_test = [] {
    const auto result = tests::runModstack({ "help", "install" });
    expect(!result.success);
    expect(result.err == "Error: no such command: `install`\n");
  };

  "modstack unknown argument"_test = [] {
    const auto result = tests::runModstack({ "--frobnicate" });
    expect(!result.success);
    expect(result.err.starts_with(
        "Error: unexpected argument '--frobnicate' found"));
  };

  "modstack prepare requires a target"_test = [] {
    const auto result = tests::runModstack({ "prepare", "--offline" });
    expect(!result.success);
    expect(result.err == "Error: missing argument <TARGET>\n");
  };

  "modstack --color rejects unknown values"_test = [] {
    const auto result = tests::runModstack({ "--color", "sometimes" });
    expect(!result.success);
    expect(result.err == "Error: invalid argument for --color: sometimes\n");
  };
}
