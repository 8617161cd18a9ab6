#pragma once

#include <concepts>
#include <exception>
#include <git2/errors.h>
#include <string>
#include <type_traits>

namespace git2 {

struct Exception final : public std::exception {
  Exception();
  ~Exception() noexcept override = default;

  Exception(const Exception&) = default;
  Exception& operator=(const Exception&) = default;
  Exception(Exception&&) noexcept = default;
  Exception& operator=(Exception&&) noexcept = default;

  const char* what() const noexcept override;
  git_error_t category() const noexcept;

private:
  std::string msg = "git2: ";
  git_error_t cat{};
};

// Throws the pending libgit2 error when `ret` signals a failure.
template <typename T>
  requires(std::integral<T> || std::is_pointer_v<T>)
inline T git2Throw(const T ret) {
  if constexpr (std::is_integral_v<T>) {
    if (ret < 0) {
      throw Exception();
    }
  } else {
    if (ret == nullptr) {
      throw Exception();
    }
  }
  return ret;
}

} // namespace git2
