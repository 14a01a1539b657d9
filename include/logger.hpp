// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "unlikely.hpp"

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <functional>

namespace perfev {

enum LOG_OPTS {
  LOG_DISABLE = 0,
  LOG_SYSLOG = 1,
  LOG_STDOUT = 2,
  LOG_STDERR = 3,
  LOG_FILE = 4,
};

// Negative levels bypass the level filter
enum LOG_LVL {
  LL_FORCE_ERROR = -3,
  LL_FORCE_WARNING = -4,
  LL_FORCE_NOTICE = -5,
  LL_FORCE_INFORMATIONAL = -6,
  LL_FORCE_DEBUG = -7,
  LL_EMERGENCY = 0, // No force override because always printed
  LL_ALERT = 1,
  LL_CRITICAL = 2,
  LL_ERROR = 3,
  LL_WARNING = 4,
  LL_NOTICE = 5,
  LL_INFORMATIONAL = 6,
  LL_DEBUG = 7,
  LL_LENGTH,
};

enum LOG_FACILITY {
  LF_USER = 1,
  LF_DAEMON = 3,
  LF_LOCAL0 = 16,
  LF_LOCAL7 = 23,
};

// Allow for compile-time argument type checking for printf-like functions
#define printflike(x, y) __attribute__((format(printf, x, y)))

// Manage the logging backend
bool LOG_syslog_open();
void LOG_close();
bool LOG_open(int mode, const char *opts);

// Log-print-Formatted with Level and Facility
printflike(3, 4) void lprintfln(int lvl, int fac, const char *fmt, ...);

// Same as above, used by the LG_* macros once the level was checked
printflike(3, 4) void olprintfln(int lvl, int fac, const char *fmt, ...);

// va_list flavour, as per libc's v*printf() functions
void vlprintfln(int lvl, int fac, const char *format, va_list args);

// Setters for global logger context
void LOG_setname(const char *name);
void LOG_setlevel(int lvl);
int LOG_getlevel();
void LOG_setfacility(int fac);

void LOG_setratelimit(uint64_t max_log_per_interval,
                      std::chrono::nanoseconds interval);
void LOG_clearratelimit();

bool LOG_is_logging_enabled_for_level(int level);

using LogsAllowedCallback = std::function<bool()>;

// Allow to inject a function used by logger to check if logs are allowed
void LOG_set_logs_allowed_function(LogsAllowedCallback logs_allowed_function);

/******************************* Logging Macros *******************************/
#define ABS(__x)                                                               \
  ({                                                                           \
    const __typeof__(__x) _x = (__x);                                          \
    _x < 0 ? -1 * _x : _x;                                                     \
  })

// Avoid evaluating arguments (which can have CPU costs unless level is OK)
#define LG_IF_LVL_OK(level, ...)                                               \
  do {                                                                         \
    if (unlikely(perfev::LOG_is_logging_enabled_for_level(level))) {           \
      perfev::olprintfln(ABS(level), -1, __VA_ARGS__);                         \
    }                                                                          \
  } while (false)

#define LG_ERR(...) LG_IF_LVL_OK(perfev::LL_ERROR, __VA_ARGS__)
#define LG_WRN(...) LG_IF_LVL_OK(perfev::LL_WARNING, __VA_ARGS__)
#define LG_NTC(...) LG_IF_LVL_OK(perfev::LL_NOTICE, __VA_ARGS__)
#define LG_NFO(...) LG_IF_LVL_OK(perfev::LL_INFORMATIONAL, __VA_ARGS__)
#define LG_DBG(...) LG_IF_LVL_OK(perfev::LL_DEBUG, __VA_ARGS__)
#define PRINT_NFO(...)                                                         \
  LG_IF_LVL_OK(perfev::LL_FORCE_INFORMATIONAL, __VA_ARGS__)

} // namespace perfev
