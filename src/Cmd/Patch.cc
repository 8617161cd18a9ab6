#include "Patch.hpp"

#include "Cli.hpp"
#include "Diag.hpp"
#include "Resolver/ConfigPatcher.hpp"

#include <cstddef>
#include <filesystem>
#include <fmt/core.h>
#include <map>
#include <rs/result.hpp>
#include <set>
#include <string>
#include <string_view>

namespace modstack {

static rs::Result<void> patchMain(CliArgsView args);

const Subcmd PATCH_CMD =
    Subcmd{ "patch" }
        .setDesc("Rewrite variable assignments in a build configuration file")
        .addArg(Arg{ "FILE" }.setDesc("File to patch in place"))
        .addArg(Arg{ "VAR=VALUE" }.setVariadic(true).setDesc(
            "New value of an assigned variable"))
        .setMainFn(patchMain);

static rs::Result<void> patchMain(const CliArgsView args) {
  // Parse args
  fs::path file;
  std::map<std::string, std::string> variables;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "patch"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg.starts_with('-')) {
      return PATCH_CMD.noSuchArg(arg);
    } else if (file.empty()) {
      file = arg;
    } else {
      const std::size_t eq = arg.find('=');
      rs_ensure(eq != std::string_view::npos && eq > 0,
                "expected VAR=VALUE but got `{}`", arg);
      variables.insert_or_assign(std::string(arg.substr(0, eq)),
                                 std::string(arg.substr(eq + 1)));
    }
  }
  rs_ensure(!file.empty(), "missing argument <FILE>");
  rs_ensure(!variables.empty(), "missing argument <VAR=VALUE>");

  auto res = patchConfigFile(file, variables);
  if (res.is_err()) {
    const PatchError& err = res.unwrap_err();
    if (err.kind == PatchError::Kind::Permission) {
      rs_bail("permission denied while patching {}: {}", err.path.string(),
              err.message);
    }
    rs_bail("failed to patch {}: {}", err.path.string(), err.message);
  }

  const std::set<std::string>& updated = res.unwrap();
  if (updated.empty()) {
    Diag::info("Unchanged", "{}", file.string());
    return rs::Ok();
  }
  for (const std::string& name : updated) {
    fmt::print("{}\n", name);
  }
  return rs::Ok();
}

} // namespace modstack
