#include "Git2/Exception.hpp"

#include <git2/errors.h>

namespace git2 {

Exception::Exception() {
  if (const git_error* error = git_error_last(); error != nullptr) {
    this->msg += error->message;
    this->cat = static_cast<git_error_t>(error->klass);
    git_error_clear();
  } else {
    this->msg += "unknown error";
  }
}

const char* Exception::what() const noexcept { return this->msg.c_str(); }
git_error_t Exception::category() const noexcept { return this->cat; }

} // namespace git2
