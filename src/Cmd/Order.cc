#include "Order.hpp"

#include "Backend/LocalBackend.hpp"
#include "Cli.hpp"
#include "Common.hpp"
#include "Config.hpp"
#include "ReleaseIntrospector.hpp"
#include "Resolver/BuildOrder.hpp"
#include "Session.hpp"

#include <fmt/core.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace modstack {

static rs::Result<void> orderMain(CliArgsView args);

const Subcmd ORDER_CMD =
    Subcmd{ "order" }
        .setDesc("Print the order in which dependencies must be built")
        .addOpt(OPT_CONFIG)
        .addOpt(OPT_PLATFORM_TAG)
        .addOpt(OPT_OFFLINE)
        .addOpt(Opt{ "--json" }.setDesc("Print the full resolution as JSON"))
        .setArg(Arg{ "TARGET" }.setDesc("IOC or module directory"))
        .setMainFn(orderMain);

static rs::Result<void> orderMain(const CliArgsView args) {
  // Parse args
  TargetOpts opts;
  bool json = false;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "order"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (rs_try(parseTargetOpt(itr, args.end(), opts))) {
      continue;
    } else if (arg == "--json") {
      json = true;
    } else {
      return ORDER_CMD.noSuchArg(arg);
    }
  }
  rs_ensure(!opts.target.empty(), "missing argument <TARGET>");

  const Config config = rs_try(Config::load(opts.configPath, opts.target));
  LocalBackend backend(config.moduleCachePath(), !opts.offline);
  ReleaseIntrospector introspector;
  Session session(config, opts.target, introspector, backend);

  rs_try(session.usePlatform(opts.platformTag.value_or(config.platform.tag),
                             /*resetConfigure=*/false));
  rs_try(session.findAllDependencies());
  const BuildOrder order = rs_try(session.updateBuildOrder());

  if (json) {
    fmt::print("{}\n", session.report().dump(2));
    return rs::Ok();
  }
  for (const std::string& module : order.modules) {
    fmt::print("{}\n", module);
  }
  return rs::Ok();
}

} // namespace modstack
