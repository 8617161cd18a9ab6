#include "Prepare.hpp"

#include "Backend/LocalBackend.hpp"
#include "Cli.hpp"
#include "Common.hpp"
#include "Config.hpp"
#include "Diag.hpp"
#include "ReleaseIntrospector.hpp"
#include "Session.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace modstack {

static rs::Result<void> prepareMain(CliArgsView args);

const Subcmd PREPARE_CMD =
    Subcmd{ "prepare" }
        .setDesc("Resolve, check out and configure every dependency of a "
                 "build target")
        .addOpt(OPT_CONFIG)
        .addOpt(OPT_PLATFORM_TAG)
        .addOpt(Opt{ "--set-name" }
                    .setDesc("Name of the version set to write")
                    .setPlaceholder("<NAME>"))
        .addOpt(Opt{ "--no-reset" }.setDesc(
            "Keep local changes to configure/ directories"))
        .addOpt(OPT_OFFLINE)
        .addOpt(Opt{ "--report" }
                    .setDesc("Write a JSON report of the resolution")
                    .setPlaceholder("<FILE>"))
        .setArg(Arg{ "TARGET" }.setDesc("IOC or module directory"))
        .setMainFn(prepareMain);

static rs::Result<void> prepareMain(const CliArgsView args) {
  // Parse args
  TargetOpts opts;
  std::string setName = "defaults";
  bool resetConfigure = true;
  std::optional<fs::path> reportPath;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "prepare"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (rs_try(parseTargetOpt(itr, args.end(), opts))) {
      continue;
    } else if (arg == "--set-name") {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      setName = *++itr;
    } else if (arg == "--no-reset") {
      resetConfigure = false;
    } else if (arg == "--report") {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      reportPath = fs::path(*++itr);
    } else {
      return PREPARE_CMD.noSuchArg(arg);
    }
  }
  rs_ensure(!opts.target.empty(), "missing argument <TARGET>");

  const Config config = rs_try(Config::load(opts.configPath, opts.target));
  LocalBackend backend(config.moduleCachePath(), !opts.offline);
  ReleaseIntrospector introspector;
  Session session(config, opts.target, introspector, backend);

  rs_try(session.usePlatform(opts.platformTag.value_or(config.platform.tag),
                             resetConfigure));
  rs_try(session.findAllDependencies());
  rs_try(session.writeVersionSet(setName));
  rs_try(session.updateConfigFiles());
  rs_try(session.updateBuildOrder());

  if (reportPath.has_value()) {
    std::ofstream ofs(*reportPath);
    rs_ensure(ofs.is_open(), "failed to open {}", reportPath->string());
    ofs << session.report().dump(2) << '\n';
    Diag::info("Reported", "{}", reportPath->string());
  }
  return rs::Ok();
}

} // namespace modstack
