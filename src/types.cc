/*
 * types.cc -- names of the famacl enumerations
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <string>

#include "famacl/libfamacl.hh"
#include "famacl/operation.hh"
#include "famacl/types.hh"

namespace famacl {

static const char *userRoleNames[] = { "ADMIN", "VOLUNTEER", "MEMBER" };
static const char *familyRoleNames[] = { "PRIMARY_CONTACT", "FAMILY_ADMIN", "MEMBER" };
static const char *levelNames[] = { "NONE", "READ", "WRITE", "DELETE", "ADMIN" };
static const char *typeNames[] = {
  "DOCUMENT", "MESSAGE", "FAMILY", "USER", "NOTIFICATION", "CARE_PLAN",
  "ACTIVITY", "CONTACT"
};
static const char *visibilityNames[] = { "PRIVATE", "FAMILY", "SHARED", "PUBLIC" };
static const char *statusNames[] = {
  "DRAFT", "PENDING", "APPROVED", "FEATURED", "REJECTED", "ARCHIVED"
};
static const char *operationNames[] = { "create", "read", "update", "delete" };

template <typename E, std::size_t N>
static const char *
nameOf(const char *(&names)[N], E value) {
  std::size_t idx = static_cast<std::size_t>(value);
  return idx < N ? names[idx] : "UNKNOWN";
}

template <typename E, std::size_t N>
static bool
valueOf(const char *(&names)[N], const std::string &s, E &out) {
  for (std::size_t idx = 0; idx < N; idx++) {
    if (s == names[idx]) {
      out = static_cast<E>(idx);
      return true;
    }
  }
  return false;
}

const char *toString(UserRole role) { return nameOf(userRoleNames, role); }
const char *toString(FamilyRole role) { return nameOf(familyRoleNames, role); }
const char *toString(AccessLevel level) { return nameOf(levelNames, level); }
const char *toString(ResourceType type) { return nameOf(typeNames, type); }
const char *toString(Visibility visibility) { return nameOf(visibilityNames, visibility); }
const char *toString(ResourceStatus status) { return nameOf(statusNames, status); }
const char *toString(Operation op) { return nameOf(operationNames, op); }

bool parse(const std::string &s, UserRole &out) { return valueOf(userRoleNames, s, out); }
bool parse(const std::string &s, FamilyRole &out) { return valueOf(familyRoleNames, s, out); }
bool parse(const std::string &s, AccessLevel &out) { return valueOf(levelNames, s, out); }
bool parse(const std::string &s, ResourceType &out) { return valueOf(typeNames, s, out); }
bool parse(const std::string &s, Visibility &out) { return valueOf(visibilityNames, s, out); }
bool parse(const std::string &s, ResourceStatus &out) { return valueOf(statusNames, s, out); }
bool parse(const std::string &s, Operation &out) { return valueOf(operationNames, s, out); }

const char *
result_string(result_t res) {
  switch (res) {
  case FAMACL_OK: return "ok";
  case FAMACL_ERROR_OUT_OF_MEMORY: return "out of memory";
  case FAMACL_ERROR_INTERNAL_ERROR: return "internal error";
  case FAMACL_ERROR_BAD_REQUEST: return "bad request";
  case FAMACL_ERROR_UNAUTHORIZED: return "unauthorized";
  case FAMACL_ERROR_NOT_FOUND: return "not found";
  case FAMACL_ERROR_STORAGE: return "storage error";
  }
  return "unknown error";
}

} /* namespace famacl */
