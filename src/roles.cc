/*
 * roles.cc -- role based helpers for user administration
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include "famacl/roles.hh"

namespace famacl {

bool
canCreateUser(UserRole creator, UserRole target) {
  switch (creator) {
  case UserRole::ADMIN:
    return true;
  case UserRole::VOLUNTEER:
    return target == UserRole::MEMBER;
  case UserRole::MEMBER:
    return false;
  }
  return false;
}

bool
requiresFamilyAssignment(UserRole creator, UserRole target) {
  return creator == UserRole::VOLUNTEER && target == UserRole::MEMBER;
}

const char *
roleDisplayName(UserRole role) {
  switch (role) {
  case UserRole::ADMIN: return "Administrator";
  case UserRole::VOLUNTEER: return "Volunteer";
  case UserRole::MEMBER: return "Member";
  }
  return "Unknown";
}

bool
requireAdmin(const UserRecord &user) {
  return user.role == UserRole::ADMIN;
}

bool
requireFamilyAdmin(const UserRecord &user) {
  return user.role == UserRole::ADMIN
    || user.familyRole == FamilyRole::FAMILY_ADMIN
    || user.familyRole == FamilyRole::PRIMARY_CONTACT;
}

bool
checkFamilyAccess(const UserRecord &user, const FamilyId &family) {
  return user.role == UserRole::ADMIN
    || (!family.empty() && user.familyId == family);
}

bool
checkResourceOwnership(const UserRecord &user, const UserId &owner) {
  return user.role == UserRole::ADMIN || user.id == owner;
}

bool
canDeleteResource(const Resource &resource, const UserId &user, UserRole role) {
  return role == UserRole::ADMIN || resource.createdBy == user;
}

/* Empty ids are treated as unset. */
static std::optional<std::string>
present(const std::optional<std::string> &id) {
  if (id && id->empty())
    return std::nullopt;
  return id;
}

AccessContext
makeAccessContext(const UserRecord &user, const std::optional<ResourceFacts> &facts) {
  AccessContext context;
  context.userId = user.id;
  context.userRole = user.role;
  context.familyId = present(user.familyId);
  context.familyRole = user.familyRole;

  if (facts) {
    context.resourceOwnerId = present(facts->uploadedBy) ? facts->uploadedBy
      : present(facts->createdBy);
    context.resourceFamilyId = present(facts->familyId);
    context.isResourcePublic = facts->isPublic;
  }
  return context;
}

AccessContext
makeAccessContext(const UserRecord &user, const Resource &resource) {
  ResourceFacts facts;
  facts.createdBy = resource.createdBy;
  facts.familyId = resource.familyId;
  facts.isPublic = resource.visibility == Visibility::PUBLIC;
  return makeAccessContext(user, facts);
}

} /* namespace famacl */
