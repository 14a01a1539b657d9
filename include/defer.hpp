// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <type_traits>
#include <utility>

namespace perfev {

/// Runs the stored callable when leaving the scope, unless released
template <typename F> class ScopeExit {
public:
  explicit ScopeExit(F fn) noexcept(std::is_nothrow_move_constructible_v<F>)
      : _fn(std::move(fn)) {}

  ScopeExit(ScopeExit &&other) noexcept(
      std::is_nothrow_move_constructible_v<F>)
      : _fn(std::move(other._fn)), _active(other._active) {
    other.release();
  }

  ScopeExit(const ScopeExit &) = delete;
  ScopeExit &operator=(const ScopeExit &) = delete;
  ScopeExit &operator=(ScopeExit &&) = delete;

  ~ScopeExit() noexcept {
    if (_active) {
      _fn();
    }
  }

  void release() noexcept { _active = false; }

private:
  F _fn;
  bool _active{true};
};

template <class F> ScopeExit<std::decay_t<F>> make_defer(F &&f) {
  return ScopeExit<std::decay_t<F>>{std::forward<F>(f)};
}

namespace details {
struct DeferDummy {};

template <class F>
ScopeExit<std::decay_t<F>> operator*(DeferDummy, F &&f) {
  return ScopeExit<std::decay_t<F>>{std::forward<F>(f)};
}
} // namespace details

} // namespace perfev

#define DEFER_(LINE) zz_defer##LINE
#define DEFER(LINE) DEFER_(LINE)
#define defer                                                                  \
  [[maybe_unused]] const auto &DEFER(__COUNTER__) =                            \
      ::perfev::details::DeferDummy{} *[&]()
