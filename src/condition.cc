/*
 * condition.cc -- evaluation of access conditions
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <sstream>
#include <string>

#include "famacl/condition.hh"
#include "famacl/debug.hh"

namespace famacl {

static const char *kindNames[] = {
  "isAdmin", "isOwner", "isFamilyMember", "isFamilyAdmin", "isPublic",
  "isSystemResource", "and", "or", "not"
};

const char *
toString(Condition::Kind kind) {
  std::size_t idx = static_cast<std::size_t>(kind);
  return idx < sizeof(kindNames)/sizeof(kindNames[0]) ? kindNames[idx] : "unknown";
}

bool
parse(const std::string &s, Condition::Kind &out) {
  for (std::size_t idx = 0; idx < sizeof(kindNames)/sizeof(kindNames[0]); idx++) {
    if (s == kindNames[idx]) {
      out = static_cast<Condition::Kind>(idx);
      return true;
    }
  }
  return false;
}

Condition
Condition::allOf(std::vector<Condition> conditions) {
  return Condition{Kind::AND, std::move(conditions)};
}

Condition
Condition::anyOf(std::vector<Condition> conditions) {
  return Condition{Kind::OR, std::move(conditions)};
}

Condition
Condition::negate(Condition condition) {
  return Condition{Kind::NOT, { std::move(condition) }};
}

std::size_t
Condition::depth(void) const {
  std::size_t d = 0;
  for (const auto &c : children_)
    d = std::max(d, c.depth());
  return d + 1;
}

std::string
Condition::describe(void) const {
  if (isLeaf())
    return toString(kind_);

  std::ostringstream os;
  os << toString(kind_) << '(';
  for (std::size_t idx = 0; idx < children_.size(); idx++) {
    if (idx)
      os << ", ";
    os << children_[idx].describe();
  }
  os << ')';
  return os.str();
}

static bool
isFamilyAdminRole(const std::optional<FamilyRole> &role) {
  return role && (*role == FamilyRole::FAMILY_ADMIN
                  || *role == FamilyRole::PRIMARY_CONTACT);
}

bool
evaluate(const AccessContext &context, const Condition &condition) {
  switch (condition.kind()) {
  case Condition::Kind::IS_ADMIN:
    return context.userRole == UserRole::ADMIN;
  case Condition::Kind::IS_OWNER:
    return context.resourceOwnerId && context.userId == *context.resourceOwnerId;
  case Condition::Kind::IS_FAMILY_MEMBER:
    return context.familyId && !context.familyId->empty()
      && context.familyId == context.resourceFamilyId;
  case Condition::Kind::IS_FAMILY_ADMIN:
    /* family membership is not checked here, see Condition::isFamilyAdmin() */
    return isFamilyAdminRole(context.familyRole);
  case Condition::Kind::IS_PUBLIC:
    return context.isResourcePublic;
  case Condition::Kind::IS_SYSTEM_RESOURCE:
    return !context.resourceFamilyId;
  case Condition::Kind::AND:
    return std::all_of(condition.children().cbegin(), condition.children().cend(),
                       [&context](const Condition &c) { return evaluate(context, c); });
  case Condition::Kind::OR:
    return std::any_of(condition.children().cbegin(), condition.children().cend(),
                       [&context](const Condition &c) { return evaluate(context, c); });
  case Condition::Kind::NOT:
    if (condition.children().size() != 1) {
      famacl_log(FAMACL_LOG_WARNING, "not() with %zu operands evaluates to false\n",
                 condition.children().size());
      return false;
    }
    return !evaluate(context, condition.children().front());
  }

  famacl_log(FAMACL_LOG_WARNING, "unknown condition kind %u evaluates to false\n",
             static_cast<unsigned int>(condition.kind()));
  return false;
}

} /* namespace famacl */
