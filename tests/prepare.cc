#include "helpers.hpp"

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "modstack prepare"_test = [] {
    const tests::TempDir tmp;
    const tests::ModuleTree tree(tmp.path);
    tests::writeFile(tmp / "modstack.toml", tests::modstackConfig(tmp.path));
    const auto base = tree.cacheModules / "epics-base-R7.0.2-2.0";
    const auto report = tmp / "report.json";

    const auto result = tests::runModstack(
        { "prepare", tree.ioc.string(), "--no-reset", "--offline",
          "--set-name", "ioc", "--report", report.string() });
    expect(result.success) << result.err;

    // Target and cached modules point at the cache.
    expect(tests::readFile(tree.ioc / "configure" / "RELEASE")
           == fmt::format("# IOC release\n"
                          "MOTOR={}\n"
                          "EPICS_BASE={}\n",
                          tree.motor.string(), base.string()));
    expect(tests::readFile(tree.motor / "configure" / "RELEASE")
           == fmt::format("ASYN={}\nEPICS_BASE={}\n", tree.asyn.string(),
                          base.string()));
    expect(tests::readFile(tree.asyn / "configure" / "RELEASE")
           == fmt::format("EPICS_BASE={}\n", base.string()));

    expect(tests::readFile(tree.cacheModules / "RELEASE.local")
           == fmt::format("ASYN={}\nEPICS_BASE={}\nMOTOR={}\n",
                          tree.asyn.string(), base.string(),
                          tree.motor.string()));

    // Platform first, then the build order.
    const std::string set = tests::readFile(tmp / "sets" / "ioc.set");
    const auto basePos = set.find("BASE=R7.0.2-2.0\n");
    const auto asynPos = set.find("ASYN=R4.39-1.0.1\n");
    const auto motorPos = set.find("MOTOR=R6.9-ess\n");
    expect(basePos == 0);
    expect(asynPos != std::string::npos && basePos < asynPos);
    expect(motorPos != std::string::npos && asynPos < motorPos);
    expect(set.find("BASE_REPOURL=https://github.com/slac-epics/"
                    "epics-base.git\n")
           != std::string::npos);
    expect(set.find("ASYN_DIRNAME=asyn\n") != std::string::npos);

    const auto json = nlohmann::json::parse(tests::readFile(report));
    expect(json["buildOrder"]
           == nlohmann::json(std::vector<std::string>{ "ASYN", "MOTOR" }));
    expect(json["degraded"] == false);
    expect(json["platform"]["variable"] == "EPICS_BASE");
    expect(json["modules"].size() == 2U);
    expect(json["unresolved"].empty());

    expect(result.err.find("Resolved ASYN = " + tree.asyn.string())
           != std::string::npos);
    expect(result.err.find("Order ASYN MOTOR") != std::string::npos);
  };

  "modstack prepare leaves unknown layouts alone"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "modstack.toml", tests::modstackConfig(tmp.path));
    const auto ioc = tmp / "ioc";
    tests::writeFile(ioc / "configure" / "RELEASE",
                     "SNCSEQ=/somewhere/else/seq\n");
    const auto report = tmp / "report.json";

    const auto result =
        tests::runModstack({ "prepare", ioc.string(), "--no-reset",
                             "--offline", "--report", report.string() });
    expect(result.success) << result.err;
    expect(tests::readFile(ioc / "configure" / "RELEASE")
           == "SNCSEQ=/somewhere/else/seq\n");

    const auto json = nlohmann::json::parse(tests::readFile(report));
    expect(json["buildOrder"].empty());
    expect(json["unresolved"].size() == 1U);
    expect(json["unresolved"][0]["references"]["SNCSEQ"]
           == "/somewhere/else/seq");
  };

  "modstack prepare without a release file"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "modstack.toml", tests::modstackConfig(tmp.path));
    const auto ioc = tmp / "ioc";
    tests::fs::create_directories(ioc);

    const auto result = tests::runModstack(
        { "prepare", ioc.string(), "--no-reset", "--offline" });
    expect(!result.success);
    expect(result.err.starts_with("Error: "));
  };

  "modstack prepare with an invalid config"_test = [] {
    const tests::TempDir tmp;
    const tests::ModuleTree tree(tmp.path);
    tests::writeFile(tmp / "modstack.toml", "[conventions]\nroots = []\n");

    const auto result = tests::runModstack(
        { "prepare", tree.ioc.string(), "--no-reset", "--offline" });
    expect(!result.success);
    expect(result.err.find("[conventions] roots must not be empty")
           != std::string::npos);
  };
}
