// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <exception>
#include <new>

#include "peres_def.hpp"
#include "peres_helpers.hpp"
#include "peres_list.hpp"

namespace perfev {

/// Standard exception containing a PERes
class PEException : public std::exception {
public:
  explicit PEException(PERes peres) : _peres(peres) {}
  PEException(int16_t sev, int16_t what) : _peres(peres_create(sev, what)) {}
  [[nodiscard]] PERes get_PERes() const { return _peres; }
  [[nodiscard]] const char *what() const noexcept override {
    return peres_error_message(_peres._what);
  }

private:
  PERes _peres;
};
} // namespace perfev

#define PERES_CHECK_THROW_EXCEPTION(peres)                                     \
  do {                                                                         \
    PERes lperes = peres; /* single eval */                                    \
    if (IsPEResNotOK(lperes)) {                                                \
      if (IsPEResFatal(lperes)) {                                              \
        LG_ERR("Forward error at %s:%u - %s", __FILE__, __LINE__,              \
               peres_error_message(lperes._what));                             \
        throw perfev::PEException(lperes);                                     \
      } else if (lperes._sev == PE_SEV_WARN) {                                 \
        LG_WRN("Recover from sev=%d at %s:%u - %s", lperes._sev, __FILE__,     \
               __LINE__, peres_error_message(lperes._what));                   \
      } else {                                                                 \
        LG_NTC("Recover from sev=%d at %s:%u - %s", lperes._sev, __FILE__,     \
               __LINE__, peres_error_message(lperes._what));                   \
      }                                                                        \
    }                                                                          \
  } while (0)

/// Catch exceptions and convert them to a PERes
#define CatchExcept2PERes()                                                    \
  catch (const perfev::PEException &e) {                                       \
    PERES_CHECK_FWD_STRICT(e.get_PERes());                                     \
    return e.get_PERes();                                                      \
  }                                                                            \
  catch (const std::bad_alloc &ba) {                                           \
    LOG_ERROR_DETAILS(LG_ERR, PE_WHAT_BADALLOC);                               \
    return peres_error(PE_WHAT_BADALLOC);                                      \
  }                                                                            \
  catch (const std::exception &e) {                                            \
    LG_ERR("%s", e.what());                                                    \
    LOG_ERROR_DETAILS(LG_ERR, PE_WHAT_STDEXCEPT);                              \
    return peres_error(PE_WHAT_STDEXCEPT);                                     \
  }                                                                            \
  catch (...) {                                                                \
    LOG_ERROR_DETAILS(LG_ERR, PE_WHAT_UKNWEXCEPT);                             \
    return peres_error(PE_WHAT_UKNWEXCEPT);                                    \
  }
