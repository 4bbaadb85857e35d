/*
 * memory_store.hh -- in-memory user, resource, share and assignment store
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_MEMORY_STORE_HH
#define FAMACL_MEMORY_STORE_HH 1

#include <map>
#include <set>
#include <utility>

#include "famacl/predicate.hh"
#include "famacl/resource.hh"

namespace famacl {

/**
 * Keeps all records in standard containers. List queries evaluate
 * the visibility predicate row by row with matches().
 */
class MemoryStore : public UserDirectory,
                    public ResourceStore,
                    public ShareStore,
                    public AssignmentStore {
public:
  /** Adds or replaces @p user. */
  bool addUser(const UserRecord &user);

  /** Adds or replaces @p resource. */
  bool addResource(const Resource &resource);

  /** Grants @p user access to the SHARED resource @p resource. */
  bool addShare(const ResourceId &resource, const UserId &user);

  /**
   * Assigns the template @p resource to @p assignee. Returns false if
   * the pair already exists.
   */
  bool addAssignment(const ResourceId &resource, const UserId &assignee);

  bool removeAssignment(const ResourceId &resource, const UserId &assignee);

  result_t lookupUser(const UserId &id, UserRecord &user) const override;
  result_t lookupResource(const ResourceId &id, Resource &resource) const override;
  std::vector<Resource> listResources(const Predicate &visible,
                                      const ResourceFilter &filter) const override;
  bool shareExists(const ResourceId &resource, const UserId &user) const override;
  bool assignmentExists(const ResourceId &resource,
                        const UserId &assignee) const override;

private:
  using Pair = std::pair<ResourceId, UserId>;

  std::map<UserId, UserRecord> users;
  std::map<ResourceId, Resource> resources;
  std::set<Pair> shares;
  std::set<Pair> assignments;
};

} /* namespace famacl */

#endif /* FAMACL_MEMORY_STORE_HH */
