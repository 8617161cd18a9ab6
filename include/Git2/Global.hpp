#pragma once

namespace git2 {

// libgit2 is usable while an instance is alive.
struct GlobalState {
  GlobalState();
  ~GlobalState();

  GlobalState(const GlobalState&) = delete;
  GlobalState& operator=(const GlobalState&) = delete;
  GlobalState(GlobalState&&) = delete;
  GlobalState& operator=(GlobalState&&) = delete;
};

} // namespace git2
