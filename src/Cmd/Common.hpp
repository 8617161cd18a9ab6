#pragma once

#include "Cli.hpp"

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace modstack {

namespace fs = std::filesystem;

inline constexpr Opt OPT_CONFIG =
    Opt{ "--config" }
        .setShort("-c")
        .setDesc("Use the given modstack.toml")
        .setPlaceholder("<FILE>");
inline constexpr Opt OPT_PLATFORM_TAG =
    Opt{ "--platform-tag" }
        .setShort("-t")
        .setDesc("Platform tag to build against")
        .setPlaceholder("<TAG>");
inline constexpr Opt OPT_OFFLINE =
    Opt{ "--offline" }.setDesc("Never clone missing modules");

// Options shared by the commands that resolve a build target.
struct TargetOpts {
  std::string target;
  std::optional<fs::path> configPath;
  std::optional<std::string> platformTag;
  bool offline = false;
};

// Consumes `--config`, `--platform-tag` and `--offline` (with their values)
// and the positional target. Returns false for anything else.
template <typename Itr>
rs::Result<bool> parseTargetOpt(Itr& itr, const Itr end, TargetOpts& opts) {
  const std::string_view arg = *itr;
  if (matchesAny(arg, { "-c", "--config" })) {
    if (itr + 1 == end) {
      rs_try(Subcmd::missingOptArgumentFor(arg));
    }
    opts.configPath = fs::path(*++itr);
    return rs::Ok(true);
  }
  if (matchesAny(arg, { "-t", "--platform-tag" })) {
    if (itr + 1 == end) {
      rs_try(Subcmd::missingOptArgumentFor(arg));
    }
    opts.platformTag = *++itr;
    return rs::Ok(true);
  }
  if (arg == "--offline") {
    opts.offline = true;
    return rs::Ok(true);
  }
  if (opts.target.empty() && !arg.starts_with('-')) {
    opts.target = arg;
    return rs::Ok(true);
  }
  return rs::Ok(false);
}

} // namespace modstack
