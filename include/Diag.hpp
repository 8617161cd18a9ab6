#pragma once

#include <cstdint>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string_view>
#include <utility>

namespace modstack {

enum class DiagLevel : uint8_t {
  Off = 0, // --quiet
  Warn = 1,
  Info = 2, // default
  Verbose = 3, // -v
  VeryVerbose = 4, // -vv
};

enum class ColorMode : uint8_t {
  Always,
  Auto,
  Never,
};

void setColorMode(std::string_view str) noexcept;
bool shouldColorStderr() noexcept;

void setDiagLevel(DiagLevel level) noexcept;
DiagLevel getDiagLevel() noexcept;

inline bool isVerbose() noexcept {
  return getDiagLevel() >= DiagLevel::Verbose;
}
inline bool isVeryVerbose() noexcept {
  return getDiagLevel() >= DiagLevel::VeryVerbose;
}
inline bool isQuiet() noexcept { return getDiagLevel() == DiagLevel::Off; }

class Diag {
  static void print(fmt::text_style style, std::string_view header,
                    std::string_view msg, bool alignHeader);

public:
  template <typename... Args>
  static void info(std::string_view header, fmt::format_string<Args...> fmt,
                   Args&&... args) {
    if (getDiagLevel() < DiagLevel::Info) {
      return;
    }
    print(fmt::fg(fmt::terminal_color::green) | fmt::emphasis::bold, header,
          fmt::format(fmt, std::forward<Args>(args)...), true);
  }

  template <typename... Args>
  static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (getDiagLevel() < DiagLevel::Warn) {
      return;
    }
    print(fmt::fg(fmt::terminal_color::yellow) | fmt::emphasis::bold,
          "Warning:", fmt::format(fmt, std::forward<Args>(args)...), false);
  }

  // Errors are printed even with --quiet.
  template <typename... Args>
  static void error(fmt::format_string<Args...> fmt, Args&&... args) {
    print(fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold,
          "Error:", fmt::format(fmt, std::forward<Args>(args)...), false);
  }
};

} // namespace modstack
