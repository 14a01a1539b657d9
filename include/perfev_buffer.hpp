// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstddef>
#include <span>

namespace perfev {

using Buffer = std::span<std::byte>;
using ConstBuffer = std::span<const std::byte>;

inline ConstBuffer as_bytes(const void *ptr, size_t sz) {
  return {static_cast<const std::byte *>(ptr), sz};
}

} // namespace perfev
