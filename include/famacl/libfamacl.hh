/*
 * libfamacl.hh -- version, limits and result codes of libfamacl
 *
 * Copyright (C) 2015-2021 Olaf Bergmann <bergmann@tzi.org>
 *               2015-2021 Stefanie Gerdes <gerdes@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_LIBFAMACL_HH
#define FAMACL_LIBFAMACL_HH 1

#define LIBFAMACL_PACKAGE_NAME    "libfamacl"
#define LIBFAMACL_PACKAGE_VERSION "0.3.0"

/** Default name of the system-wide configuration file. */
#define FAMACL_DEFAULT_CONFIG_FILE "/etc/famaclrc"

/** Default number of resources returned by a single list query. */
#define FAMACL_DEFAULT_PAGE_SIZE   20

/** Upper bound for the page size of a list query. */
#define FAMACL_MAX_PAGE_SIZE       100

/** Maximum nesting of conditions read from configuration files. */
#define FAMACL_MAX_CONDITION_DEPTH 32

namespace famacl {

enum result_t {
  FAMACL_OK,
  FAMACL_ERROR_OUT_OF_MEMORY,
  FAMACL_ERROR_INTERNAL_ERROR,
  FAMACL_ERROR_BAD_REQUEST    = 0x10,
  FAMACL_ERROR_UNAUTHORIZED   = 0x13,
  FAMACL_ERROR_NOT_FOUND      = 0x14,
  FAMACL_ERROR_STORAGE        = 0x20
};

/** Returns a static string describing @p res. */
const char *result_string(result_t res);

} /* namespace famacl */

#endif /* FAMACL_LIBFAMACL_HH */
