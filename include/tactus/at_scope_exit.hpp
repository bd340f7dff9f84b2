#pragma once

#include <utility>

namespace tactus {

/*
 * Runs a callable when the scope it lives in ends, whether normally or by exception.  Timelines use it to close an
 * iteration when a callback throws, and clocks to count a tick whose callback threw.
 * */
template <typename CALLABLE> class AtScopeExit {
public:
  explicit AtScopeExit(CALLABLE on_exit) : on_exit(std::move(on_exit)) {}
  ~AtScopeExit() { this->on_exit(); }

  AtScopeExit(const AtScopeExit &) = delete;
  AtScopeExit &operator=(const AtScopeExit &) = delete;

private:
  CALLABLE on_exit;
};

} // namespace tactus
