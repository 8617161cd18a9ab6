#include "Driver.hpp"

#include "Cli.hpp"
#include "Cmd/Help.hpp"
#include "Cmd/Order.hpp"
#include "Cmd/Patch.hpp"
#include "Cmd/Prepare.hpp"
#include "Cmd/Version.hpp"
#include "Diag.hpp"

#include <cstddef>
#include <exception>
#include <rs/result.hpp>
#include <span>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace modstack {

const Cli& getCli() noexcept {
  static const Cli cli = //
      Cli{ "modstack" }
          .setDesc("Resolve, order and configure EPICS module dependencies")
          .addOpt(Opt{ "--verbose" }
                      .setShort("-v")
                      .setDesc("Use verbose output (-vv very verbose output)")
                      .setGlobal(true))
          .addOpt(Opt{ "-vv" }
                      .setDesc("Use very verbose output")
                      .setGlobal(true))
          .addOpt(Opt{ "--quiet" }
                      .setShort("-q")
                      .setDesc("Do not print modstack log messages")
                      .setGlobal(true))
          .addOpt(Opt{ "--color" }
                      .setDesc("Coloring: auto, always, never")
                      .setPlaceholder("<WHEN>")
                      .setGlobal(true))
          .addOpt(Opt{ "--help" }
                      .setShort("-h")
                      .setDesc("Print help")
                      .setGlobal(true))
          .addOpt(Opt{ "--version" }
                      .setShort("-V")
                      .setDesc("Print version info and exit"))
          .addSubcmd(HELP_CMD)
          .addSubcmd(ORDER_CMD)
          .addSubcmd(PATCH_CMD)
          .addSubcmd(PREPARE_CMD)
          .addSubcmd(VERSION_CMD);
  return cli;
}

static rs::Result<void> parseArgs(const CliArgsView args) noexcept {
  // Parse arguments (options should appear before the subcommand, as the
  // help message shows intuitively)
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    // Global options
    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end()));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    }
    // else: Fallthrough: current argument wasn't handled

    // Local options
    else if (matchesAny(arg, { "-V", "--version" })) {
      const std::vector<std::string> remArgs(itr + 1, args.end());
      return getCli().exec("version", remArgs);
    }

    // Subcommands
    else if (getCli().hasSubcmd(arg)) {
      const std::vector<std::string> remArgs(itr + 1, args.end());
      return getCli().exec(arg, remArgs);
    }

    else {
      return getCli().noSuchArg(arg);
    }
  }

  return getCli().printHelp({});
}

static std::vector<std::string> getArgs(const int argc,
                                        char* argv[]) noexcept {
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc > 0 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]); // NOLINT(*-pointer-arithmetic)
  }
  return args;
}

rs::Result<void, void> run(int argc, char* argv[]) noexcept {
  spdlog::set_pattern("%^[%l]%$ %v");
  try {
    const std::vector<std::string> args = getArgs(argc, argv);
    if (const auto res = parseArgs(args); res.is_err()) {
      Diag::error("{}", res.unwrap_err()->what());
      return rs::Err();
    }
  } catch (const std::exception& e) {
    Diag::error("{}", e.what());
    return rs::Err();
  }
  return rs::Ok();
}

} // namespace modstack
