#pragma once

#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace modstack {

// One dependency's on-disk materialization: the platform release the
// module was built against (base), the module directory name, and its tag.
struct ModuleIdentity {
  const std::string base;
  const std::string name;
  const std::string tag;

  ModuleIdentity(std::string base, std::string name, std::string tag)
      : base(std::move(base)), name(std::move(name)), tag(std::move(tag)) {}

  bool operator==(const ModuleIdentity& other) const = default;

  // Directory name of this module under the module cache.
  [[nodiscard]] std::string cacheDirName() const;
};

// Cache directories never carry a `-branch` suffix: `R1.0-branch` and
// `R1.0` share `<name>-R1.0`.
std::string stripBranchSuffix(std::string_view tag);

} // namespace modstack

template <>
struct fmt::formatter<modstack::ModuleIdentity> {
  // NOLINTNEXTLINE(*-static)
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const modstack::ModuleIdentity& id, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}@{} ({})", id.name, id.tag, id.base);
  }
};
