/*
 * operation.hh -- CRUD operations and the access level they require
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_OPERATION_HH
#define FAMACL_OPERATION_HH 1

#include <cstdint>
#include <ostream>
#include <string>

#include "famacl/types.hh"

namespace famacl {

enum class Operation : uint8_t { CREATE, READ, UPDATE, DELETE };

/**
 * Returns the access level needed to perform @p op. The switch has
 * no default label so that -Wswitch reports operations added to the
 * enum without a mapping.
 */
constexpr AccessLevel requiredLevel(Operation op) {
  switch (op) {
  case Operation::CREATE:
  case Operation::UPDATE:
    return AccessLevel::WRITE;
  case Operation::DELETE:
    return AccessLevel::DELETE;
  case Operation::READ:
    return AccessLevel::READ;
  }
  /* not reached for valid operations; deny everything else */
  return AccessLevel::ADMIN;
}

/** Returns the lower-case verb for @p op, e.g. "update". */
const char *toString(Operation op);

/** Accepts the verbs returned by toString(Operation). */
bool parse(const std::string &s, Operation &out);

inline std::ostream &operator<<(std::ostream &os, Operation op) {
  return os << toString(op);
}

} /* namespace famacl */

#endif /* FAMACL_OPERATION_HH */
