#pragma once

#include "Git2/Global.hpp"

#include <git2/oid.h>
#include <git2/types.h>
#include <string>
#include <vector>

namespace git2 {

struct Repository : public GlobalState {
  git_repository* raw = nullptr;

  Repository() = default;
  ~Repository();

  Repository(const Repository&) = delete;
  Repository& operator=(const Repository&) = delete;
  Repository(Repository&&) = delete;
  Repository& operator=(Repository&&) = delete;

  Repository& open(const std::string& path);
  Repository& clone(const std::string& url, const std::string& path);

  // Commit id of a revision spec such as a tag or `origin/<branch>`.
  git_oid revparseCommit(const std::string& spec) const;

  // Updates the work tree to `oid` and detaches HEAD there.
  void checkoutDetached(const git_oid& oid);

  // Restores `paths` (everything when empty) from HEAD, discarding local
  // modifications.
  void forceCheckoutHead(const std::vector<std::string>& paths = {});
};

} // namespace git2
