// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger.hpp"

#include "ratelimiter.hpp"
#include "unique_fd.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <optional>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

extern char *__progname; // NOLINT(readability-identifier-naming)

namespace perfev {

namespace {

constexpr size_t k_log_msg_cap = 4096;

constexpr const char *k_level_names[LL_LENGTH] = {
    "EMERGENCY", "ALERT",  "CRITICAL",      "ERROR",
    "WARNING",   "NOTICE", "INFORMATIONAL", "DEBUG",
};

struct LoggerState {
  int mode{LOG_STDERR};
  int level{LL_ERROR};
  int facility{LF_USER};
  // stdout/stderr are borrowed, syslog socket and log files are owned
  int fd{STDERR_FILENO};
  UniqueFd owned_fd;
  std::string name;
  std::optional<IntervalRateLimiter> rate_limiter;
  LogsAllowedCallback logs_allowed_function;
};

LoggerState &state() {
  static LoggerState s;
  return s;
}

UniqueFd connect_syslog() {
  const sockaddr_un sa = {AF_UNIX, "/dev/log"};
  UniqueFd fd{socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0)};
  if (!fd) {
    return {};
  }
  if (connect(fd.get(), reinterpret_cast<const struct sockaddr *>(&sa),
              sizeof(sa)) < 0) {
    return {};
  }
  return fd;
}

// `<LEVEL>Mon DD hh:mm:ss.uuuuuu NAME[PID]: `, syslog gets a numeric priority
int format_prefix(const LoggerState &s, int lvl, int fac, char *buf,
                  size_t cap) {
  using namespace std::chrono;
  auto const since_epoch = system_clock::now().time_since_epoch();
  auto const secs = duration_cast<seconds>(since_epoch);
  auto const usecs = duration_cast<microseconds>(since_epoch - secs);

  time_t const t = secs.count();
  struct tm lt;
  localtime_r(&t, &lt);
  char tm_str[sizeof("mmm dd HH:MM:SS0")];
  if (strftime(tm_str, sizeof(tm_str), "%b %d %H:%M:%S", &lt) == 0) {
    tm_str[0] = '\0';
  }

  const char *name = s.name.empty() ? __progname : s.name.c_str();
  long const us = static_cast<long>(usecs.count());
  if (s.mode == LOG_SYSLOG) {
    return snprintf(buf, cap, "<%d>%s.%06ld %s[%d]: ", lvl + fac * LL_LENGTH,
                    tm_str, us, name, getpid());
  }
  return snprintf(buf, cap, "<%s>%s.%06ld %s[%d]: ", k_level_names[lvl],
                  tm_str, us, name, getpid());
}

void emit(const LoggerState &s, const char *buf, size_t sz) {
  ssize_t rc = 0;
  do {
    rc = s.mode == LOG_SYSLOG ? sendto(s.fd, buf, sz, MSG_NOSIGNAL, nullptr, 0)
                              : write(s.fd, buf, sz);
  } while (rc < 0 && errno == EINTR);
}

} // namespace

void LOG_setlevel(int lvl) {
  if (lvl >= LL_EMERGENCY && lvl <= LL_DEBUG) {
    state().level = lvl;
  }
}

int LOG_getlevel() { return state().level; }

void LOG_setfacility(int fac) {
  if (fac >= LF_USER && fac <= LF_LOCAL7) {
    state().facility = fac;
  }
}

void LOG_setname(const char *name) { state().name = name ? name : ""; }

bool LOG_syslog_open() {
  UniqueFd fd = connect_syslog();
  if (!fd) {
    return false;
  }
  LoggerState &s = state();
  s.fd = fd.get();
  s.owned_fd = std::move(fd);
  return true;
}

void LOG_close() {
  LoggerState &s = state();
  s.owned_fd.reset();
  s.fd = -1;
}

bool LOG_open(int mode, const char *opts) {
  LOG_close();
  LoggerState &s = state();
  s.mode = mode;

  switch (mode) {
  case LOG_DISABLE:
    return true;
  case LOG_SYSLOG:
    return LOG_syslog_open();
  case LOG_STDOUT:
    s.fd = STDOUT_FILENO;
    return true;
  case LOG_FILE: {
    if (!opts) {
      return false;
    }
    UniqueFd fd{open(opts, O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644)};
    if (!fd) {
      return false;
    }
    s.fd = fd.get();
    s.owned_fd = std::move(fd);
    return true;
  }
  case LOG_STDERR:
  default:
    s.mode = LOG_STDERR;
    s.fd = STDERR_FILENO;
    return true;
  }
}

void LOG_setratelimit(uint64_t max_log_per_interval,
                      std::chrono::nanoseconds interval) {
  state().rate_limiter.emplace(max_log_per_interval, interval);
}

void LOG_clearratelimit() { state().rate_limiter.reset(); }

void vlprintfln(int lvl, int fac, const char *format, va_list args) {
  const LoggerState &s = state();
  if (s.fd < 0 || !format) {
    return;
  }
  if (lvl < 0 || lvl >= LL_LENGTH) {
    lvl = s.level;
  }
  if (fac == -1) {
    fac = s.facility;
  }

  char buf[k_log_msg_cap];
  int const sz_prefix = format_prefix(s, lvl, fac, buf, sizeof(buf));
  if (sz_prefix < 0 || static_cast<size_t>(sz_prefix) >= sizeof(buf) - 2) {
    return;
  }

  // keep room for the newline and the terminating NUL
  size_t const cap = sizeof(buf) - sz_prefix - 1;
  int const sz_msg = vsnprintf(&buf[sz_prefix], cap, format, args);
  if (sz_msg < 0) {
    return;
  }
  size_t sz = sz_prefix + std::min(static_cast<size_t>(sz_msg), cap - 1);

  // file and console consumers expect newline-delimited logs
  if (s.mode != LOG_SYSLOG) {
    buf[sz++] = '\n';
    buf[sz] = '\0';
  }
  emit(s, buf, sz);
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void olprintfln(int lvl, int fac, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlprintfln(lvl, fac, fmt, args);
  va_end(args);
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void lprintfln(int lvl, int fac, const char *fmt, ...) {
  if (!LOG_is_logging_enabled_for_level(lvl)) {
    return;
  }
  va_list args;
  va_start(args, fmt);
  vlprintfln(lvl, fac, fmt, args);
  va_end(args);
}

void LOG_set_logs_allowed_function(LogsAllowedCallback logs_allowed_function) {
  state().logs_allowed_function = std::move(logs_allowed_function);
}

bool LOG_is_logging_enabled_for_level(int level) {
  LoggerState &s = state();
  if (level > s.level) {
    return false;
  }
  if (s.logs_allowed_function && !s.logs_allowed_function()) {
    return false;
  }
  return !s.rate_limiter || s.rate_limiter->check();
}

} // namespace perfev
