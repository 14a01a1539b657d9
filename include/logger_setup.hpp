// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstdint>

namespace perfev {
inline constexpr auto k_max_log_per_sec_for_non_debug = 100;

/// log_mode: stdout, stderr, syslog, disabled or a file path
/// log_level: debug, informational, notice, warn, error (warn if unknown)
void setup_logger(
    const char *log_mode, const char *log_level,
    uint64_t max_log_per_sec_for_non_debug = k_max_log_per_sec_for_non_debug);

} // namespace perfev
