/*
 * debug.cc -- logging facility for libfamacl
 *
 * Copyright (C) 2018 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>

#include "famacl/debug.hh"

static std::atomic<famacl_log_t> maxlog{FAMACL_LOG_WARNING};
static std::atomic<famacl_log_handler_t> log_handler{nullptr};

static const char *loglevels[] = {
  "emerg", "alert", "crit", "err", "warning", "notice", "info", "debug"
};

famacl_log_t
famacl_get_log_level(void) {
  return maxlog;
}

void
famacl_set_log_level(famacl_log_t level) {
  maxlog = level;
}

void
famacl_set_log_handler(famacl_log_handler_t handler) {
  log_handler = handler;
}

const char *
famacl_log_level_name(famacl_log_t level) {
  if (level < FAMACL_LOG_EMERG || level > FAMACL_LOG_DEBUG)
    return "unknown";
  return loglevels[level];
}

bool
famacl_parse_log_level(const std::string &s, famacl_log_t &level) {
  if (s.empty())
    return false;

  for (size_t idx = 0; idx < sizeof(loglevels)/sizeof(loglevels[0]); idx++) {
    if (s == loglevels[idx]) {
      level = static_cast<famacl_log_t>(idx);
      return true;
    }
  }

  char *end = nullptr;
  long n = strtol(s.c_str(), &end, 10);
  if (end && *end == '\0' && n >= FAMACL_LOG_EMERG && n <= FAMACL_LOG_DEBUG) {
    level = static_cast<famacl_log_t>(n);
    return true;
  }
  return false;
}

static size_t
print_timestamp(char *s, size_t len) {
  time_t now = time(nullptr);
  struct tm tmp;
  if (!localtime_r(&now, &tmp))
    return 0;
  return strftime(s, len, "%b %d %H:%M:%S", &tmp);
}

void
famacl_log(famacl_log_t level, const char *format, ...) {
  char message[512];
  va_list ap;

  if (maxlog < level)
    return;

  va_start(ap, format);
  vsnprintf(message, sizeof(message), format, ap);
  va_end(ap);

  famacl_log_handler_t handler = log_handler;
  if (handler) {
    handler(level, message);
    return;
  }

  char timebuf[32];
  FILE *log_fd = stderr;
  if (print_timestamp(timebuf, sizeof(timebuf)))
    fprintf(log_fd, "%s ", timebuf);
  fprintf(log_fd, "%s ", famacl_log_level_name(level));
  fputs(message, log_fd);
  fflush(log_fd);
}
