/*
 * memory_store.cc -- in-memory user, resource, share and assignment store
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include "famacl/debug.hh"
#include "famacl/memory_store.hh"

namespace famacl {

bool
MemoryStore::addUser(const UserRecord &user) {
  famacl_log(FAMACL_LOG_DEBUG, "add user %s (%s)\n", user.id.c_str(), toString(user.role));
  users[user.id] = user;
  return true;
}

bool
MemoryStore::addResource(const Resource &resource) {
  famacl_log(FAMACL_LOG_DEBUG, "add resource %s\n", resource.id.c_str());
  resources[resource.id] = resource;
  return true;
}

bool
MemoryStore::addShare(const ResourceId &resource, const UserId &user) {
  shares.insert({resource, user});
  return true;
}

bool
MemoryStore::addAssignment(const ResourceId &resource, const UserId &assignee) {
  if (!assignments.insert({resource, assignee}).second) {
    famacl_log(FAMACL_LOG_INFO, "%s is already assigned to %s\n",
               resource.c_str(), assignee.c_str());
    return false;
  }
  return true;
}

bool
MemoryStore::removeAssignment(const ResourceId &resource, const UserId &assignee) {
  return assignments.erase({resource, assignee}) > 0;
}

result_t
MemoryStore::lookupUser(const UserId &id, UserRecord &user) const {
  const auto it = users.find(id);
  if (it == users.end())
    return FAMACL_ERROR_NOT_FOUND;
  user = it->second;
  return FAMACL_OK;
}

result_t
MemoryStore::lookupResource(const ResourceId &id, Resource &resource) const {
  const auto it = resources.find(id);
  if (it == resources.end())
    return FAMACL_ERROR_NOT_FOUND;
  resource = it->second;
  return FAMACL_OK;
}

std::vector<Resource>
MemoryStore::listResources(const Predicate &visible,
                           const ResourceFilter &filter) const {
  std::vector<Resource> result;
  const std::size_t limit = filter.pageSize();
  std::size_t skip = filter.offset();

  /* std::map iterates in id order */
  for (const auto &entry : resources) {
    const Resource &r = entry.second;
    if (!filter.accepts(r) || !matches(visible, r, *this, *this))
      continue;
    if (skip > 0) {
      --skip;
      continue;
    }
    result.push_back(r);
    if (result.size() == limit)
      break;
  }
  return result;
}

bool
MemoryStore::shareExists(const ResourceId &resource, const UserId &user) const {
  return shares.count({resource, user}) > 0;
}

bool
MemoryStore::assignmentExists(const ResourceId &resource,
                              const UserId &assignee) const {
  return assignments.count({resource, assignee}) > 0;
}

} /* namespace famacl */
