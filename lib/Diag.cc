#include "Diag.hpp"

#include <cstdio>
#include <cstdlib>
#include <fmt/color.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <string_view>
#include <unistd.h>

namespace modstack {

static ColorMode colorMode = ColorMode::Auto;
static DiagLevel diagLevel = DiagLevel::Info;

static ColorMode parseColorMode(const std::string_view str) noexcept {
  if (str == "always") {
    return ColorMode::Always;
  } else if (str == "never") {
    return ColorMode::Never;
  }
  return ColorMode::Auto;
}

void setColorMode(const std::string_view str) noexcept {
  colorMode = parseColorMode(str);
}

bool shouldColorStderr() noexcept {
  switch (colorMode) {
  case ColorMode::Always:
    return true;
  case ColorMode::Never:
    return false;
  case ColorMode::Auto:
    break;
  }
  if (const char* env = std::getenv("MODSTACK_TERM_COLOR")) {
    const ColorMode fromEnv = parseColorMode(env);
    if (fromEnv != ColorMode::Auto) {
      return fromEnv == ColorMode::Always;
    }
  }
  return isatty(STDERR_FILENO) != 0;
}

void setDiagLevel(const DiagLevel level) noexcept {
  diagLevel = level;

  switch (level) {
  case DiagLevel::VeryVerbose:
    spdlog::set_level(spdlog::level::trace);
    break;
  case DiagLevel::Verbose:
    spdlog::set_level(spdlog::level::debug);
    break;
  case DiagLevel::Off:
    spdlog::set_level(spdlog::level::err);
    break;
  case DiagLevel::Warn:
  case DiagLevel::Info:
    spdlog::set_level(spdlog::level::warn);
    break;
  }
}

DiagLevel getDiagLevel() noexcept { return diagLevel; }

void Diag::print(const fmt::text_style style, const std::string_view header,
                 const std::string_view msg, const bool alignHeader) {
  const bool color = shouldColorStderr();
  const std::string styled =
      color ? fmt::format(style, "{}", header) : std::string(header);
  // Headers of info messages are right-aligned to 12 columns.
  if (alignHeader && header.size() < 12) {
    fmt::print(stderr, "{:>{}}{} {}\n", "", 12 - header.size(), styled, msg);
  } else {
    fmt::print(stderr, "{} {}\n", styled, msg);
  }
}

} // namespace modstack
