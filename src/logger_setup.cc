// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger_setup.hpp"

#include "logger.hpp"

#include "absl/strings/match.h"

#include <array>
#include <string_view>

namespace perfev {

namespace {
// Index of the first pattern matching str (case insensitive), -1 if none
template <size_t N>
int arg_which(const char *str, const std::array<std::string_view, N> &list) {
  if (!str) {
    return -1;
  }
  for (size_t i = 0; i < N; ++i) {
    if (absl::EqualsIgnoreCase(str, absl::string_view(list[i].data(), list[i].size()))) {
      return static_cast<int>(i);
    }
  }
  return -1;
}
} // namespace

void setup_logger(const char *log_mode, const char *log_level,
                  uint64_t max_log_per_sec_for_non_debug) {
  constexpr std::array<std::string_view, 4> k_log_modes = {
      "stdout", "stderr", "syslog", "disabled"};
  int const idx_log_mode = log_mode ? arg_which(log_mode, k_log_modes) : 1;
  switch (idx_log_mode) {
  case 0:
    LOG_open(LOG_STDOUT, nullptr);
    break;
  case 1:
    LOG_open(LOG_STDERR, nullptr);
    break;
  case 2:
    if (!LOG_open(LOG_SYSLOG, nullptr)) {
      LOG_open(LOG_STDERR, nullptr);
    }
    break;
  case 3:
    LOG_open(LOG_DISABLE, nullptr);
    break;
  default:
    if (!LOG_open(LOG_FILE, log_mode)) {
      LOG_open(LOG_STDERR, nullptr);
      LG_WRN("Unable to open log file %s, logging to stderr", log_mode);
    }
    break;
  }

  constexpr std::array<std::string_view, 5> k_log_levels = {
      "debug", "informational", "notice", "warn", "error"};
  switch (arg_which(log_level, k_log_levels)) {
  case 0:
    LOG_setlevel(LL_DEBUG);
    break;
  case 1:
    LOG_setlevel(LL_INFORMATIONAL);
    break;
  case 2:
    LOG_setlevel(LL_NOTICE);
    break;
  case 4:
    LOG_setlevel(LL_ERROR);
    break;
  case -1: // default
  case 3:
  default:
    LOG_setlevel(LL_WARNING);
    break;
  }

  if (LOG_getlevel() < LL_DEBUG) {
    LOG_setratelimit(max_log_per_sec_for_non_debug, std::chrono::seconds(1));
  } else {
    LOG_clearratelimit();
  }
}

} // namespace perfev
