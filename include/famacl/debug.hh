/*
 * debug.hh -- logging facility for libfamacl
 *
 * Copyright (C) 2018 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_DEBUG_HH
#define FAMACL_DEBUG_HH 1

#include <string>

/** Pre-defined log levels akin to what is used in \b syslog. */
typedef enum {
  FAMACL_LOG_EMERG=0,
  FAMACL_LOG_ALERT,
  FAMACL_LOG_CRIT,
  FAMACL_LOG_ERR,
  FAMACL_LOG_WARNING,
  FAMACL_LOG_NOTICE,
  FAMACL_LOG_INFO,
  FAMACL_LOG_DEBUG
} famacl_log_t;

/** Returns the current log level. */
famacl_log_t famacl_get_log_level(void);

/** Sets the log level to the specified value. */
void famacl_set_log_level(famacl_log_t level);

typedef void (*famacl_log_handler_t) (famacl_log_t level, const char *message);

/** Add a custom log callback, use nullptr to reset default handler */
void famacl_set_log_handler(famacl_log_handler_t handler);

#if (defined(__GNUC__))
void famacl_log(famacl_log_t level,
                const char *format, ...) __attribute__ ((format(printf, 2, 3)));
#else
void famacl_log(famacl_log_t level, const char *format, ...);
#endif

/**
 * Parses a log level given either as a name ("warning", "debug") or
 * as a number between 0 and 7.
 *
 * @param s     The text to parse.
 * @param level Set to the parsed level on success.
 * @return      @c true if @p s denotes a valid log level.
 */
bool famacl_parse_log_level(const std::string &s, famacl_log_t &level);

/** Returns the lower-case name of @p level. */
const char *famacl_log_level_name(famacl_log_t level);

#endif /* FAMACL_DEBUG_HH */
