/*
 * visibility.cc -- visibility checks for concrete resources
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include "famacl/debug.hh"
#include "famacl/visibility.hh"

namespace famacl {

std::optional<FamilyId>
ResourceVisibilityGate::familyOf(const UserId &user) const {
  UserRecord record;
  const result_t res = users.lookupUser(user, record);
  if (res == FAMACL_OK)
    return record.familyId;
  if (res != FAMACL_ERROR_NOT_FOUND)
    famacl_log(FAMACL_LOG_ERR, "cannot look up family of %s: %s\n",
               user.c_str(), result_string(res));
  return std::nullopt;
}

bool
ResourceVisibilityGate::checkResourceAccess(const Resource &resource,
                                            const UserId &user,
                                            UserRole role) const {
  /* admins and creators do not need the directory lookup */
  if (role == UserRole::ADMIN || resource.createdBy == user)
    return checkResourceAccess(resource, user, role, std::nullopt);
  return checkResourceAccess(resource, user, role, familyOf(user));
}

bool
ResourceVisibilityGate::checkResourceAccess(const Resource &resource,
                                            const UserId &user, UserRole role,
                                            const std::optional<FamilyId> &family) const {
  const Predicate visible = visibilityPredicate(user, role, family);
  const bool result = matches(visible, resource, shares, assignments);

  famacl_log(FAMACL_LOG_DEBUG, "%s (%s) %s see %s %s resource %s\n",
             user.c_str(), toString(role), result ? "may" : "may not",
             toString(resource.visibility),
             resource.isSystemGenerated ? "system-generated" : "user",
             resource.id.c_str());
  return result;
}

std::vector<Resource>
ResourceVisibilityGate::listVisible(const ResourceStore &store,
                                    const UserId &user, UserRole role,
                                    const ResourceFilter &filter) const {
  const auto family = role == UserRole::ADMIN ? std::nullopt : familyOf(user);
  return store.listResources(visibilityPredicate(user, role, family), filter);
}

} /* namespace famacl */
