/*
 * resource.cc -- list filters for resource queries
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <algorithm>

#include "famacl/resource.hh"

namespace famacl {

unsigned int
ResourceFilter::pageSize(void) const {
  return std::clamp(limit, 1u, static_cast<unsigned int>(FAMACL_MAX_PAGE_SIZE));
}

std::size_t
ResourceFilter::offset(void) const {
  return page < 1 ? 0 : static_cast<std::size_t>(page - 1) * pageSize();
}

bool
ResourceFilter::accepts(const Resource &r) const {
  if (createdBy && r.createdBy != *createdBy)
    return false;
  if (familyId && r.familyId != familyId)
    return false;
  if (status && r.status != *status)
    return false;
  if (isSystemGenerated && r.isSystemGenerated != *isSystemGenerated)
    return false;
  /* an explicit status filter takes precedence */
  if (!status && !includeArchived && r.status == ResourceStatus::ARCHIVED)
    return false;
  return true;
}

} /* namespace famacl */
