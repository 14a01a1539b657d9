// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <unistd.h>

namespace perfev {

/// Nullable file descriptor, -1 when empty, usable as a unique_ptr pointer
class FdHandle {
public:
  FdHandle() = default;
  // cppcheck-suppress noExplicitConstructor
  FdHandle(std::nullptr_t) {} // NOLINT(google-explicit-constructor)
  // cppcheck-suppress noExplicitConstructor
  FdHandle(int fd) : _fd(fd) {} // NOLINT(google-explicit-constructor)

  explicit operator bool() const { return _fd != -1; }
  operator int() const { return _fd; } // NOLINT(google-explicit-constructor)

  friend bool operator==(FdHandle a, FdHandle b) = default;

private:
  int _fd{-1};
};

struct FdCloser {
  using pointer = FdHandle;
  void operator()(pointer fd) const { ::close(fd); }
};

/// Owning perf counter file descriptor
using UniqueFd = std::unique_ptr<int, FdCloser>;

} // namespace perfev
