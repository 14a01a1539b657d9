// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <climits>
#include <cstdint>

enum : uint16_t { PE_COMMON_START_RANGE = 1000, PE_NATIVE_START_RANGE = 2000 };

#define EXPAND_ENUM(a, b) PE_WHAT_##a,
#define EXPAND_ERROR_MESSAGE(a, b) #a ": " b,

#define COMMON_ERROR_TABLE(X)                                                  \
  X(UKNW, "undocumented error")                                                \
  X(BADALLOC, "allocation error")                                              \
  X(STDEXCEPT, "standard exception caught")                                    \
  X(UKNWEXCEPT, "unknown exception caught")

#define NATIVE_ERROR_TABLE(X)                                                  \
  X(EOD, "unexpected end of record data")                                      \
  X(BAD_LENGTH, "record length does not match its content")                    \
  X(BAD_HEADER, "record header size smaller than the header itself")          \
  X(RECORD_INFLIGHT, "previous record was not released")                       \
  X(SAMPLER_FAILED, "sampler stopped after a fatal stream error")              \
  X(POLLERROR, "unknown poll error")                                           \
  X(PERFOPEN, "error during perf_event_open")                                  \
  X(PERFMMAP, "error in mmap operations")                                      \
  X(PERFRB, "error with perf_event ringbuffer")                                \
  X(USERREAD, "user space counter read is not available")                      \
  X(ARGUMENT, "invalid argument")                                              \
  X(UNSUPPORTED, "unsupported configuration")                                  \
  X(UNITTEST, "unit test error")

enum PERes_What : uint16_t {
  PE_WHAT_MIN_COMMON = PE_COMMON_START_RANGE,
  // common errors
  COMMON_ERROR_TABLE(EXPAND_ENUM) COMMON_ERROR_SIZE,
  PE_WHAT_MIN_NATIVE = PE_NATIVE_START_RANGE,
  NATIVE_ERROR_TABLE(EXPAND_ENUM) NATIVE_ERROR_SIZE,
  // max
  PE_WHAT_MAX = SHRT_MAX,
};

/// Retrieve an explicit error message matching the error ID (from table above)
const char *peres_error_message(int16_t what);
