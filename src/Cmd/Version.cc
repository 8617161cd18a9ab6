#include "Version.hpp"

#include "Cli.hpp"

#include <fmt/core.h>
#include <rs/result.hpp>
#include <string_view>

#ifndef MODSTACK_PKG_VERSION
#  error "MODSTACK_PKG_VERSION is not defined"
#endif

namespace modstack {

static rs::Result<void> versionMain(CliArgsView args) noexcept;

const Subcmd VERSION_CMD = //
    Subcmd{ "version" }
        .setDesc("Show version information")
        .setMainFn(versionMain);

static rs::Result<void> versionMain(const CliArgsView args) noexcept {
  // Parse args
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "version"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else {
      return VERSION_CMD.noSuchArg(*itr);
    }
  }

  fmt::print("modstack {}\n", MODSTACK_PKG_VERSION);
  return rs::Ok();
}

} // namespace modstack
