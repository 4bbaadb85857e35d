/*
 * types.hh -- basic types of the famacl authorization core
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_TYPES_HH
#define FAMACL_TYPES_HH 1

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace famacl {

using UserId = std::string;
using FamilyId = std::string;
using ResourceId = std::string;

/** Global role of an authenticated user. */
enum class UserRole : uint8_t { ADMIN, VOLUNTEER, MEMBER };

/** Role of a user within their family. */
enum class FamilyRole : uint8_t { PRIMARY_CONTACT, FAMILY_ADMIN, MEMBER };

/**
 * Permission tiers. The numeric values define the total order
 * NONE < READ < WRITE < DELETE < ADMIN.
 */
enum class AccessLevel : uint8_t { NONE=0, READ=1, WRITE=2, DELETE=3, ADMIN=4 };

/** Kinds of entities for which rule tables can be registered. */
enum class ResourceType : uint8_t {
  DOCUMENT, MESSAGE, FAMILY, USER, NOTIFICATION, CARE_PLAN, ACTIVITY, CONTACT
};

/** Sharing tier of a concrete resource. */
enum class Visibility : uint8_t { PRIVATE, FAMILY, SHARED, PUBLIC };

/** Review state of a concrete resource. */
enum class ResourceStatus : uint8_t {
  DRAFT, PENDING, APPROVED, FEATURED, REJECTED, ARCHIVED
};

/**
 * The facts a single access decision is computed from. An
 * AccessContext is built for one call and never stored.
 */
struct AccessContext {
  UserId userId;
  UserRole userRole = UserRole::MEMBER;
  std::optional<FamilyId> familyId;
  std::optional<FamilyRole> familyRole;
  std::optional<UserId> resourceOwnerId;
  std::optional<FamilyId> resourceFamilyId;
  bool isResourcePublic = false;
};

constexpr int ordinal(AccessLevel level) {
  return static_cast<int>(level);
}

/** Returns true if @p have grants at least what @p need requires. */
constexpr bool isSufficient(AccessLevel have, AccessLevel need) {
  return ordinal(have) >= ordinal(need);
}

constexpr AccessLevel maxLevel(AccessLevel a, AccessLevel b) {
  return ordinal(a) >= ordinal(b) ? a : b;
}

const char *toString(UserRole role);
const char *toString(FamilyRole role);
const char *toString(AccessLevel level);
const char *toString(ResourceType type);
const char *toString(Visibility visibility);
const char *toString(ResourceStatus status);

/*
 * The parse functions accept the upper-case names returned by
 * toString(). They return false and leave @p out untouched if @p s
 * is not a valid name.
 */
bool parse(const std::string &s, UserRole &out);
bool parse(const std::string &s, FamilyRole &out);
bool parse(const std::string &s, AccessLevel &out);
bool parse(const std::string &s, ResourceType &out);
bool parse(const std::string &s, Visibility &out);
bool parse(const std::string &s, ResourceStatus &out);

inline std::ostream &operator<<(std::ostream &os, UserRole r) { return os << toString(r); }
inline std::ostream &operator<<(std::ostream &os, FamilyRole r) { return os << toString(r); }
inline std::ostream &operator<<(std::ostream &os, AccessLevel l) { return os << toString(l); }
inline std::ostream &operator<<(std::ostream &os, ResourceType t) { return os << toString(t); }
inline std::ostream &operator<<(std::ostream &os, Visibility v) { return os << toString(v); }
inline std::ostream &operator<<(std::ostream &os, ResourceStatus s) { return os << toString(s); }

} /* namespace famacl */

#endif /* FAMACL_TYPES_HH */
