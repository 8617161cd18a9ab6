#include "helpers.hpp"

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "modstack order"_test = [] {
    const tests::TempDir tmp;
    const tests::ModuleTree tree(tmp.path);
    tests::writeFile(tmp / "modstack.toml", tests::modstackConfig(tmp.path));
    const std::string iocRelease =
        tests::readFile(tree.ioc / "configure" / "RELEASE");

    const auto result =
        tests::runModstack({ "order", tree.ioc.string(), "--offline" });
    expect(result.success) << result.err;
    expect(result.out == "ASYN\nMOTOR\n");

    // Ordering never touches the files it reads.
    expect(tests::readFile(tree.ioc / "configure" / "RELEASE") == iocRelease);
    expect(!tests::fs::exists(tree.cacheModules / "RELEASE.local"));
  };

  "modstack order --json"_test = [] {
    const tests::TempDir tmp;
    const tests::ModuleTree tree(tmp.path);
    tests::writeFile(tmp / "modstack.toml", tests::modstackConfig(tmp.path));

    const auto result = tests::runModstack(
        { "order", tree.ioc.string(), "--offline", "--json" });
    expect(result.success) << result.err;

    const auto json = nlohmann::json::parse(result.out);
    expect(json["buildOrder"]
           == nlohmann::json(std::vector<std::string>{ "ASYN", "MOTOR" }));
    expect(json["target"] == tree.ioc.string());
    const auto& modules = json["modules"];
    expect(modules.size() == 2U);
    expect(modules[0]["variable"] == "ASYN");
    expect(modules[0]["requires"]
           == nlohmann::json(std::vector<std::string>{ "EPICS_BASE" }));
    expect(modules[1]["variable"] == "MOTOR");
    expect(modules[1]["requires"]
           == nlohmann::json(std::vector<std::string>{ "ASYN", "EPICS_BASE" }));
  };

  "modstack order with a cycle"_test = [] {
    const tests::TempDir tmp;
    const auto cacheModules = tmp / "cache" / "modules";
    tests::writeFile(tmp / "modstack.toml", tests::modstackConfig(tmp.path));
    tests::writeCachedModule(
        cacheModules, "asyn-R4.39-1.0.1",
        fmt::format("MOTOR={}\n", tests::conventionPath("motor", "R6.9-ess")));
    tests::writeCachedModule(
        cacheModules, "motor-R6.9-ess",
        fmt::format("ASYN={}\n", tests::conventionPath("asyn", "R4.39-1.0.1")));
    const auto ioc = tmp / "ioc";
    tests::writeFile(ioc / "configure" / "RELEASE",
                     fmt::format("MOTOR={}\n",
                                 tests::conventionPath("motor", "R6.9-ess")));

    const auto result = tests::runModstack(
        { "order", ioc.string(), "--offline", "--json" });
    expect(result.success) << result.err;
    expect(result.err.find("Warning:") != std::string::npos);

    const auto json = nlohmann::json::parse(result.out);
    expect(json["degraded"] == true);
    expect(json["buildOrder"]
           == nlohmann::json(std::vector<std::string>{ "ASYN", "MOTOR" }));
    expect(json["outstanding"]["ASYN"]
           == nlohmann::json(std::vector<std::string>{ "MOTOR" }));
  };

  "modstack order with a missing cache entry"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "modstack.toml", tests::modstackConfig(tmp.path));
    const auto ioc = tmp / "ioc";
    tests::writeFile(ioc / "configure" / "RELEASE",
                     fmt::format("MOTOR={}\n",
                                 tests::conventionPath("motor", "R6.9-ess")));

    const auto result =
        tests::runModstack({ "order", ioc.string(), "--offline" });
    expect(!result.success);
    expect(result.err.starts_with("Error: "));
  };
}
