#include "Git2/Global.hpp"

#include "Git2/Exception.hpp"

#include <git2/global.h>
#include <spdlog/spdlog.h>

namespace git2 {

GlobalState::GlobalState() {
  const int count = git2Throw(git_libgit2_init());
  spdlog::trace("libgit2 initialized ({} active)", count);
}

GlobalState::~GlobalState() {
  if (git_libgit2_shutdown() < 0) {
    spdlog::debug("libgit2 shutdown failed");
  }
}

} // namespace git2
