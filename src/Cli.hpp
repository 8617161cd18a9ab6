#pragma once

#include "Diag.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <map>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modstack {

using CliArgsView = std::span<const std::string>;

inline bool matchesAny(const std::string_view arg,
                       const std::initializer_list<std::string_view> options) {
  for (const std::string_view option : options) {
    if (arg == option) {
      return true;
    }
  }
  return false;
}

template <typename Derived>
class CliBase {
public:
  constexpr explicit CliBase(std::string_view name) noexcept : name(name) {}

  constexpr Derived& setDesc(std::string_view desc) noexcept {
    this->desc = desc;
    return static_cast<Derived&>(*this);
  }

  std::string_view name;
  std::string_view desc;
};

class Opt : public CliBase<Opt> {
public:
  using CliBase::CliBase;

  constexpr Opt& setShort(std::string_view shortName) noexcept {
    this->shortName = shortName;
    return *this;
  }
  constexpr Opt& setPlaceholder(std::string_view placeholder) noexcept {
    this->placeholder = placeholder;
    return *this;
  }
  constexpr Opt& setGlobal(bool isGlobal) noexcept {
    this->isGlobal = isGlobal;
    return *this;
  }

  std::string left() const;

  std::string_view shortName;
  std::string_view placeholder;
  bool isGlobal = false;
};

class Arg : public CliBase<Arg> {
public:
  using CliBase::CliBase;

  constexpr Arg& setRequired(bool required) noexcept {
    this->required = required;
    return *this;
  }
  constexpr Arg& setVariadic(bool variadic) noexcept {
    this->variadic = variadic;
    return *this;
  }

  std::string left() const;

  bool required = true;
  bool variadic = false;
};

class Subcmd : public CliBase<Subcmd> {
public:
  using MainFn = std::function<rs::Result<void>(CliArgsView)>;

  using CliBase::CliBase;

  Subcmd& addOpt(Opt opt) {
    opts.push_back(opt);
    return *this;
  }
  Subcmd& addArg(Arg arg) {
    args.push_back(arg);
    return *this;
  }
  Subcmd& setArg(Arg arg) { return addArg(arg); }
  Subcmd& setMainFn(MainFn mainFn) {
    this->mainFn = std::move(mainFn);
    return *this;
  }

  rs::Result<void> noSuchArg(std::string_view arg) const;
  static rs::Result<void> missingOptArgumentFor(std::string_view arg);

  void printHelp(std::span<const Opt> globalOpts) const;

  std::vector<Opt> opts;
  std::vector<Arg> args;
  MainFn mainFn;
};

class Cli : public CliBase<Cli> {
public:
  enum ControlFlow : uint8_t {
    Return,
    Continue,
    Fallthrough,
  };

  using CliBase::CliBase;

  Cli& addOpt(Opt opt) {
    opts.push_back(opt);
    return *this;
  }
  Cli& addSubcmd(const Subcmd& subcmd) {
    subcmds.emplace(subcmd.name, subcmd);
    return *this;
  }

  bool hasSubcmd(std::string_view name) const;
  rs::Result<void> exec(std::string_view subcmd, CliArgsView args) const;
  rs::Result<void> noSuchArg(std::string_view arg) const;

  // `help` without arguments prints the overview; `help <COMMAND>` prints
  // that command's help.
  rs::Result<void> printHelp(CliArgsView args) const;
  void printSubcmdHelp(std::string_view subcmd) const;

  // Handles options valid anywhere on the command line: -h, -v, -vv, -q,
  // --color. `itr` is advanced past consumed values.
  template <typename Itr>
  static rs::Result<ControlFlow>
  handleGlobalOpts(Itr& itr, const Itr end, std::string_view subcmd = "");

private:
  std::vector<Opt> opts;
  std::map<std::string_view, Subcmd> subcmds;
};

const Cli& getCli() noexcept;

template <typename Itr>
rs::Result<Cli::ControlFlow>
Cli::handleGlobalOpts(Itr& itr, const Itr end, const std::string_view subcmd) {
  const std::string_view arg = *itr;

  if (matchesAny(arg, { "-h", "--help" })) {
    if (subcmd.empty()) {
      rs_try(getCli().printHelp({}));
    } else {
      getCli().printSubcmdHelp(subcmd);
    }
    return rs::Ok(Return);
  }
  if (matchesAny(arg, { "-v", "--verbose" })) {
    setDiagLevel(DiagLevel::Verbose);
    return rs::Ok(Continue);
  }
  if (arg == "-vv") {
    setDiagLevel(DiagLevel::VeryVerbose);
    return rs::Ok(Continue);
  }
  if (matchesAny(arg, { "-q", "--quiet" })) {
    setDiagLevel(DiagLevel::Off);
    return rs::Ok(Continue);
  }
  if (arg == "--color") {
    if (std::next(itr) == end) {
      rs_try(Subcmd::missingOptArgumentFor(arg));
    }
    const std::string_view when = *++itr;
    rs_ensure(matchesAny(when, { "auto", "always", "never" }),
              "invalid argument for --color: {}", when);
    setColorMode(when);
    return rs::Ok(Continue);
  }
  return rs::Ok(Fallthrough);
}

} // namespace modstack
