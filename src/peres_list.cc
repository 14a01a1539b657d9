// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "peres_list.hpp"

#include <array>
#include <cerrno>
#include <cstring>

namespace {

constexpr std::array k_common_error_messages = {
    COMMON_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

constexpr std::array k_native_error_messages = {
    NATIVE_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

static_assert(k_common_error_messages.size() ==
              COMMON_ERROR_SIZE - PE_WHAT_MIN_COMMON - 1);
static_assert(k_native_error_messages.size() ==
              NATIVE_ERROR_SIZE - PE_WHAT_MIN_NATIVE - 1);

} // namespace

const char *peres_error_message(int16_t what) {
  if (what > PE_WHAT_MIN_COMMON && what < COMMON_ERROR_SIZE) {
    return k_common_error_messages[what - PE_WHAT_MIN_COMMON - 1];
  }
  if (what > PE_WHAT_MIN_NATIVE && what < NATIVE_ERROR_SIZE) {
    return k_native_error_messages[what - PE_WHAT_MIN_NATIVE - 1];
  }
  if (what >= 0 && what < PE_WHAT_MIN_COMMON) {
    // errno values are allowed as "what"
    return strerror(what);
  }
  return "Unknown error. Please update the error table.";
}
