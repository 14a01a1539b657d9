// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "logger.hpp"
#include "peres_def.hpp"
#include "peres_list.hpp"
#include "unlikely.hpp"

#include <cerrno>
#include <cstring>

namespace perfev {

/// Standardized way of formatting error log
#define LOG_ERROR_DETAILS(log_func, what)                                      \
  log_func("%s at %s:%u", peres_error_message(what), __FILE__, __LINE__);

/// Returns a fatal peres while using the LG_ERR API
#define PERES_RETURN_ERROR_LOG(what, ...)                                      \
  do {                                                                         \
    LG_ERR(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_ERR, what);                                           \
    return peres_error(what);                                                  \
  } while (0)

/// Returns a warning peres with the appropriate LG_WRN message
#define PERES_RETURN_WARN_LOG(what, ...)                                       \
  do {                                                                         \
    LG_WRN(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_WRN, what);                                           \
    return peres_warn(what);                                                   \
  } while (0)

/// Evaluate function and return error if -1 (add an error log)
#define PERES_CHECK_ERRNO(eval, what, ...)                                     \
  do {                                                                         \
    if (unlikely((eval) == -1)) {                                              \
      const int e = errno;                                                     \
      LG_ERR(__VA_ARGS__);                                                     \
      LOG_ERROR_DETAILS(LG_ERR, what);                                         \
      LG_ERR("errno(%d): %s", e, strerror(e));                                 \
      return peres_error(what);                                                \
    }                                                                          \
  } while (0)

/// Check boolean and log
#define PERES_CHECK_BOOL(eval, what, ...)                                      \
  do {                                                                         \
    if (unlikely(!(eval))) {                                                   \
      PERES_RETURN_ERROR_LOG(what, __VA_ARGS__);                               \
    }                                                                          \
  } while (0)

inline int peres_sev_to_log_level(int sev) {
  switch (sev) {
  case PE_SEV_ERROR:
    return LL_ERROR;
  case PE_SEV_WARN:
    return LL_WARNING;
  case PE_SEV_NOTICE:
    return LL_DEBUG;
  default: // no log
    return LL_LENGTH;
  }
}

/// Forward any result that is not OK (warnings included)
#define PERES_CHECK_FWD_STRICT(peres)                                          \
  do {                                                                         \
    PERes lperes = peres; /* single eval */                                    \
    if (IsPEResNotOK(lperes)) {                                                \
      LG_IF_LVL_OK(perfev::peres_sev_to_log_level(lperes._sev),                \
                   "Forward error at %s:%u - %s", __FILE__, __LINE__,          \
                   peres_error_message(lperes._what));                         \
      return lperes;                                                           \
    }                                                                          \
  } while (0)

/// Forward result if Fatal, log and carry on otherwise
#define PERES_CHECK_FWD(peres)                                                 \
  do {                                                                         \
    PERes lperes = peres; /* single eval */                                    \
    if (IsPEResNotOK(lperes)) {                                                \
      if (IsPEResFatal(lperes)) {                                              \
        LG_ERR("Forward error at %s:%u - %s", __FILE__, __LINE__,              \
               peres_error_message(lperes._what));                             \
        return lperes;                                                         \
      }                                                                        \
      if (lperes._sev == PE_SEV_WARN) {                                        \
        LG_WRN("Recover from sev=%d at %s:%u - %s", lperes._sev, __FILE__,     \
               __LINE__, peres_error_message(lperes._what));                   \
      } else {                                                                 \
        LG_NTC("Recover from sev=%d at %s:%u - %s", lperes._sev, __FILE__,     \
               __LINE__, peres_error_message(lperes._what));                   \
      }                                                                        \
    }                                                                          \
  } while (0)

} // namespace perfev
