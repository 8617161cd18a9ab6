#include "Cli.hpp"

#include "Diag.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/color.h>
#include <fmt/core.h>
#include <iterator>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace modstack {

static constexpr std::size_t HELP_OFFSET = 28;

static fmt::text_style bold() {
  return shouldColorStderr() ? fmt::emphasis::bold : fmt::text_style();
}
static fmt::text_style header() {
  return shouldColorStderr()
             ? fmt::fg(fmt::terminal_color::green) | fmt::emphasis::bold
             : fmt::text_style();
}
static fmt::text_style literal() {
  return shouldColorStderr()
             ? fmt::fg(fmt::terminal_color::cyan) | fmt::emphasis::bold
             : fmt::text_style();
}

static void printEntry(const std::string_view left, const std::string_view desc) {
  fmt::print("  {}", fmt::styled(left, literal()));
  if (desc.empty()) {
    fmt::print("\n");
    return;
  }
  const std::size_t pad =
      left.size() + 2 < HELP_OFFSET ? HELP_OFFSET - left.size() - 2 : 1;
  fmt::print("{:{}}{}\n", "", pad, desc);
}

std::string Opt::left() const {
  std::string str;
  if (!shortName.empty()) {
    str += fmt::format("{}, ", shortName);
  } else {
    str += "    ";
  }
  str += name;
  if (!placeholder.empty()) {
    str += fmt::format(" {}", placeholder);
  }
  return str;
}

std::string Arg::left() const {
  std::string str = required ? fmt::format("<{}>", name)
                             : fmt::format("[{}]", name);
  if (variadic) {
    str += "...";
  }
  return str;
}

rs::Result<void> Subcmd::noSuchArg(const std::string_view arg) const {
  rs_bail("unexpected argument '{}' found\n\n"
          "For more information, try 'modstack help {}'",
          arg, name);
}

rs::Result<void> Subcmd::missingOptArgumentFor(const std::string_view arg) {
  rs_bail("Missing argument for `{}`", arg);
}

void Subcmd::printHelp(const std::span<const Opt> globalOpts) const {
  fmt::print("{}\n\n", desc);

  std::string usage = fmt::format("modstack {} [OPTIONS]", name);
  for (const Arg& arg : args) {
    usage += fmt::format(" {}", arg.left());
  }
  fmt::print("{} {}\n\n", fmt::styled("Usage:", header()),
             fmt::styled(usage, bold()));

  fmt::print("{}\n", fmt::styled("Options:", header()));
  for (const Opt& opt : globalOpts) {
    printEntry(opt.left(), opt.desc);
  }
  for (const Opt& opt : opts) {
    printEntry(opt.left(), opt.desc);
  }

  if (!args.empty()) {
    fmt::print("\n{}\n", fmt::styled("Arguments:", header()));
    for (const Arg& arg : args) {
      printEntry(arg.left(), arg.desc);
    }
  }
}

bool Cli::hasSubcmd(const std::string_view name) const {
  return subcmds.contains(name);
}

rs::Result<void> Cli::exec(const std::string_view subcmd,
                           const CliArgsView args) const {
  const auto itr = subcmds.find(subcmd);
  rs_ensure(itr != subcmds.end(), "no such command: `{}`", subcmd);
  return itr->second.mainFn(args);
}

rs::Result<void> Cli::noSuchArg(const std::string_view arg) const {
  rs_bail("unexpected argument '{}' found\n\n"
          "For more information, try 'modstack --help'",
          arg);
}

void Cli::printSubcmdHelp(const std::string_view subcmd) const {
  const auto itr = subcmds.find(subcmd);
  if (itr == subcmds.end()) {
    return;
  }
  std::vector<Opt> globalOpts;
  std::ranges::copy_if(opts, std::back_inserter(globalOpts),
                       [](const Opt& opt) { return opt.isGlobal; });
  itr->second.printHelp(globalOpts);
}

rs::Result<void> Cli::printHelp(const CliArgsView args) const {
  if (!args.empty()) {
    const std::string_view subcmd = args.front();
    rs_ensure(args.size() == 1, "unexpected argument '{}' found", args[1]);
    rs_ensure(hasSubcmd(subcmd), "no such command: `{}`", subcmd);
    printSubcmdHelp(subcmd);
    return rs::Ok();
  }

  fmt::print("{}\n\n", desc);
  fmt::print("{} {}\n\n", fmt::styled("Usage:", header()),
             fmt::styled("modstack [OPTIONS] [COMMAND]", bold()));

  fmt::print("{}\n", fmt::styled("Options:", header()));
  for (const Opt& opt : opts) {
    printEntry(opt.left(), opt.desc);
  }

  fmt::print("\n{}\n", fmt::styled("Commands:", header()));
  for (const auto& [name, subcmd] : subcmds) {
    printEntry(std::string(name), subcmd.desc);
  }

  fmt::print("\nSee '{}' for more information on a specific command.\n",
             fmt::styled("modstack help <command>", literal()));
  return rs::Ok();
}

} // namespace modstack
