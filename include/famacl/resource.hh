/*
 * resource.hh -- external records and the stores that provide them
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_RESOURCE_HH
#define FAMACL_RESOURCE_HH 1

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "famacl/libfamacl.hh"
#include "famacl/types.hh"

namespace famacl {

class Predicate;

/** The fields of a stored resource that the visibility gate needs. */
struct Resource {
  ResourceId id;
  UserId createdBy;
  std::optional<FamilyId> familyId;
  Visibility visibility = Visibility::PRIVATE;
  bool isSystemGenerated = false;
  ResourceStatus status = ResourceStatus::DRAFT;
};

/** An entry of the user directory. */
struct UserRecord {
  UserId id;
  UserRole role = UserRole::MEMBER;
  std::optional<FamilyId> familyId;
  std::optional<FamilyRole> familyRole;
};

/**
 * Caller-supplied restrictions for list queries. They narrow the
 * result of the visibility predicate and never widen it.
 */
struct ResourceFilter {
  std::optional<UserId> createdBy;
  std::optional<FamilyId> familyId;
  std::optional<ResourceStatus> status;
  std::optional<bool> isSystemGenerated;
  bool includeArchived = false;
  unsigned int page = 1;
  unsigned int limit = FAMACL_DEFAULT_PAGE_SIZE;

  /** Returns the page size after clamping to [1, FAMACL_MAX_PAGE_SIZE]. */
  unsigned int pageSize(void) const;
  /** Returns the number of rows to skip for the requested page. */
  std::size_t offset(void) const;
  /** Returns true if @p r passes all restrictions except paging. */
  bool accepts(const Resource &r) const;
};

/**
 * Lookups report FAMACL_OK and fill their result argument when the
 * entry exists, FAMACL_ERROR_NOT_FOUND when it does not and
 * FAMACL_ERROR_STORAGE when the backing store cannot be read.
 */
class UserDirectory {
public:
  virtual ~UserDirectory(void) = default;
  virtual result_t lookupUser(const UserId &id, UserRecord &user) const = 0;
};

class ShareStore {
public:
  virtual ~ShareStore(void) = default;
  virtual bool shareExists(const ResourceId &resource, const UserId &user) const = 0;
};

class AssignmentStore {
public:
  virtual ~AssignmentStore(void) = default;
  virtual bool assignmentExists(const ResourceId &resource,
                                const UserId &assignee) const = 0;
};

class ResourceStore {
public:
  virtual ~ResourceStore(void) = default;
  virtual result_t lookupResource(const ResourceId &id, Resource &resource) const = 0;

  /**
   * Returns all resources that satisfy both @p visible and @p filter,
   * ordered by id and paged as requested by @p filter.
   */
  virtual std::vector<Resource> listResources(const Predicate &visible,
                                              const ResourceFilter &filter) const = 0;
};

} /* namespace famacl */

#endif /* FAMACL_RESOURCE_HH */
