// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "unlikely.hpp"

#include <cstdint>

// Stored in an int16, only the lower byte is used
enum PE_RES_SEV : uint8_t {
  PE_SEV_OK = 0,
  PE_SEV_NOTICE = 1,
  // Recoverable: the current record is lost, the stream is still usable
  PE_SEV_WARN = 2,
  // Fatal: the stream can not be trusted anymore
  PE_SEV_ERROR = 3,
};

/// Result structure containing a what / severity
struct PERes {
  union {
    struct {
      int16_t _what; // Type of result (see peres_list.hpp)
      int16_t _sev;  // fatal, warn, OK...
    };
    int32_t _val;
  };
};

#define FillPERes(res, sev, what)                                              \
  do {                                                                         \
    (res)._sev = (sev);                                                        \
    (res)._what = (what);                                                      \
  } while (0)

#define InitPEResOK(res)                                                       \
  do {                                                                         \
    (res)._val = 0;                                                            \
  } while (0)

/// sev, what
inline PERes peres_create(int16_t sev, int16_t what) {
  PERes peres;
  FillPERes(peres, sev, what);
  return peres;
}

/// Creates a fatal PERes taking an error code (what)
inline PERes peres_error(int16_t what) {
  return peres_create(PE_SEV_ERROR, what);
}

/// Creates a PERes with a warning taking an error code (what)
inline PERes peres_warn(int16_t what) { return peres_create(PE_SEV_WARN, what); }

/// Create an OK PERes
inline PERes peres_init() {
  PERes peres = {};
  return peres;
}

/// returns a bool : true if they are equal
inline bool peres_equal(PERes lhs, PERes rhs) { return lhs._val == rhs._val; }

/// true if peres is not OK (unlikely)
#define IsPEResNotOK(res) unlikely((res)._sev != PE_SEV_OK)

/// true if peres is OK (likely)
#define IsPEResOK(res) likely((res)._sev == PE_SEV_OK)

/// true if peres is fatal (unlikely)
#define IsPEResFatal(res) unlikely((res)._sev == PE_SEV_ERROR)

inline bool operator==(PERes lhs, PERes rhs) { return peres_equal(lhs, rhs); }
