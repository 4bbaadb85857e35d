/*
 * visibility.hh -- visibility checks for concrete resources
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_VISIBILITY_HH
#define FAMACL_VISIBILITY_HH 1

#include <optional>
#include <vector>

#include "famacl/predicate.hh"
#include "famacl/resource.hh"
#include "famacl/types.hh"

namespace famacl {

/**
 * Decides whether a user may see a concrete resource based on its
 * visibility, its creator and the template assignments. The gate is
 * independent of the rule tables: callers combine both results.
 *
 * The stores are held by reference and must outlive the gate.
 */
class ResourceVisibilityGate {
public:
  ResourceVisibilityGate(const UserDirectory &users,
                         const ShareStore &shares,
                         const AssignmentStore &assignments)
    : users(users), shares(shares), assignments(assignments) {}

  /**
   * Returns true if @p user with role @p role may see @p resource.
   * The user's family is taken from the user directory; a user that
   * is not in the directory has no family.
   */
  bool checkResourceAccess(const Resource &resource, const UserId &user,
                           UserRole role) const;

  /** Like above, for callers that already know the user's family. */
  bool checkResourceAccess(const Resource &resource, const UserId &user,
                           UserRole role,
                           const std::optional<FamilyId> &family) const;

  /**
   * Returns the resources from @p store that @p user may see and that
   * pass @p filter. The store evaluates the same predicate that
   * checkResourceAccess() uses.
   */
  std::vector<Resource> listVisible(const ResourceStore &store,
                                    const UserId &user, UserRole role,
                                    const ResourceFilter &filter = {}) const;

private:
  std::optional<FamilyId> familyOf(const UserId &user) const;

  const UserDirectory &users;
  const ShareStore &shares;
  const AssignmentStore &assignments;
};

} /* namespace famacl */

#endif /* FAMACL_VISIBILITY_HH */
