/*
 * roles.hh -- role based helpers for user administration
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_ROLES_HH
#define FAMACL_ROLES_HH 1

#include <optional>
#include <string>

#include "famacl/resource.hh"
#include "famacl/types.hh"

namespace famacl {

/** Returns true if a user with @p creator may create a user with @p target. */
bool canCreateUser(UserRole creator, UserRole target);

/** Members created by volunteers must be placed into a family. */
bool requiresFamilyAssignment(UserRole creator, UserRole target);

/** Returns "Administrator", "Volunteer" or "Member". */
const char *roleDisplayName(UserRole role);

bool requireAdmin(const UserRecord &user);

/** Admins, family admins and primary contacts pass. */
bool requireFamilyAdmin(const UserRecord &user);

/** Admins and members of @p family pass. */
bool checkFamilyAccess(const UserRecord &user, const FamilyId &family);

/** Admins and the owner pass. */
bool checkResourceOwnership(const UserRecord &user, const UserId &owner);

/** Only admins and the creator may delete a resource. */
bool canDeleteResource(const Resource &resource, const UserId &user,
                       UserRole role);

/**
 * Resource fields an application passes in to build an
 * AccessContext. Documents carry an uploader, other entities a
 * creator.
 */
struct ResourceFacts {
  std::optional<UserId> uploadedBy;
  std::optional<UserId> createdBy;
  std::optional<FamilyId> familyId;
  bool isPublic = false;
};

/** Builds the AccessContext for @p user acting on @p facts. */
AccessContext makeAccessContext(const UserRecord &user,
                                const std::optional<ResourceFacts> &facts = std::nullopt);

/** Builds the AccessContext for @p user acting on a stored resource. */
AccessContext makeAccessContext(const UserRecord &user, const Resource &resource);

} /* namespace famacl */

#endif /* FAMACL_ROLES_HH */
