#include "Git2/Repository.hpp"

#include "Git2/Exception.hpp"

#include <git2/checkout.h>
#include <git2/clone.h>
#include <git2/commit.h>
#include <git2/object.h>
#include <git2/repository.h>
#include <git2/revparse.h>
#include <git2/strarray.h>
#include <string>
#include <vector>

namespace git2 {

Repository::~Repository() { git_repository_free(this->raw); }

Repository& Repository::open(const std::string& path) {
  git2Throw(git_repository_open(&this->raw, path.c_str()));
  return *this;
}

Repository& Repository::clone(const std::string& url, const std::string& path) {
  git2Throw(git_clone(&this->raw, url.c_str(), path.c_str(), nullptr));
  return *this;
}

git_oid Repository::revparseCommit(const std::string& spec) const {
  git_object* obj = nullptr;
  git2Throw(git_revparse_single(&obj, this->raw, spec.c_str()));

  git_object* commit = nullptr;
  const int peeled = git_object_peel(&commit, obj, GIT_OBJECT_COMMIT);
  git_object_free(obj);
  git2Throw(peeled);

  const git_oid oid = *git_object_id(commit);
  git_object_free(commit);
  return oid;
}

void Repository::checkoutDetached(const git_oid& oid) {
  git_commit* commit = nullptr;
  git2Throw(git_commit_lookup(&commit, this->raw, &oid));

  git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
  opts.checkout_strategy = GIT_CHECKOUT_SAFE;
  const int checkedOut = git_checkout_tree(
      this->raw, reinterpret_cast<const git_object*>(commit), &opts);
  git_commit_free(commit);
  git2Throw(checkedOut);

  git2Throw(git_repository_set_head_detached(this->raw, &oid));
}

void Repository::forceCheckoutHead(const std::vector<std::string>& paths) {
  std::vector<char*> rawPaths;
  rawPaths.reserve(paths.size());
  for (const std::string& path : paths) {
    rawPaths.push_back(const_cast<char*>(path.c_str()));
  }

  git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
  opts.checkout_strategy = GIT_CHECKOUT_FORCE;
  if (!rawPaths.empty()) {
    opts.paths.strings = rawPaths.data();
    opts.paths.count = rawPaths.size();
  }
  git2Throw(git_checkout_head(this->raw, &opts));
}

} // namespace git2
