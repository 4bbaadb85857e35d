/*
 * predicate.cc -- declarative visibility predicates over resources
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <sstream>
#include <string>

#include "famacl/debug.hh"
#include "famacl/predicate.hh"

namespace famacl {

Predicate
Predicate::createdBy(const UserId &user) {
  Predicate p{Kind::CREATED_BY};
  p.operand_ = user;
  return p;
}

Predicate
Predicate::visibilityIs(Visibility v) {
  Predicate p{Kind::VISIBILITY_IS};
  p.visibility_ = v;
  return p;
}

Predicate
Predicate::familyIs(const std::optional<FamilyId> &family) {
  /* an empty id does not name a family */
  if (!family || family->empty())
    return never();
  Predicate p{Kind::FAMILY_IS};
  p.operand_ = *family;
  return p;
}

Predicate
Predicate::sharedWith(const UserId &user) {
  Predicate p{Kind::SHARED_WITH};
  p.operand_ = user;
  return p;
}

Predicate
Predicate::assignedTo(const UserId &user) {
  Predicate p{Kind::ASSIGNED_TO};
  p.operand_ = user;
  return p;
}

Predicate
Predicate::allOf(std::vector<Predicate> operands) {
  Predicate p{Kind::AND};
  p.children_ = std::move(operands);
  return p;
}

Predicate
Predicate::anyOf(std::vector<Predicate> operands) {
  Predicate p{Kind::OR};
  p.children_ = std::move(operands);
  return p;
}

Predicate
Predicate::negate(Predicate operand) {
  Predicate p{Kind::NOT};
  p.children_.push_back(std::move(operand));
  return p;
}

static void
describeList(std::ostream &os, const char *name, const std::vector<Predicate> &children) {
  os << name << '(';
  for (std::size_t idx = 0; idx < children.size(); idx++) {
    if (idx)
      os << ", ";
    os << children[idx].describe();
  }
  os << ')';
}

std::string
Predicate::describe(void) const {
  std::ostringstream os;
  switch (kind_) {
  case Kind::ALWAYS: os << "true"; break;
  case Kind::NEVER: os << "false"; break;
  case Kind::CREATED_BY: os << "createdBy(" << operand_ << ')'; break;
  case Kind::VISIBILITY_IS: os << "visibility(" << visibility_ << ')'; break;
  case Kind::FAMILY_IS: os << "family(" << operand_ << ')'; break;
  case Kind::SYSTEM_GENERATED: os << "systemGenerated"; break;
  case Kind::SHARED_WITH: os << "sharedWith(" << operand_ << ')'; break;
  case Kind::ASSIGNED_TO: os << "assignedTo(" << operand_ << ')'; break;
  case Kind::AND: describeList(os, "and", children_); break;
  case Kind::OR: describeList(os, "or", children_); break;
  case Kind::NOT: describeList(os, "not", children_); break;
  }
  return os.str();
}

Predicate
visibilityPredicate(const UserId &user, UserRole role,
                    const std::optional<FamilyId> &family) {
  auto byVisibility = [&]() {
    return Predicate::anyOf({
        Predicate::visibilityIs(Visibility::PUBLIC),
        Predicate::allOf({ Predicate::visibilityIs(Visibility::FAMILY),
                           Predicate::familyIs(family) }),
        Predicate::allOf({ Predicate::visibilityIs(Visibility::SHARED),
                           Predicate::sharedWith(user) })
      });
  };

  switch (role) {
  case UserRole::ADMIN:
    return Predicate::always();
  case UserRole::VOLUNTEER:
    return Predicate::anyOf({ Predicate::createdBy(user), byVisibility() });
  case UserRole::MEMBER:
    /* templates are visible to members only through an assignment */
    return Predicate::anyOf({
        Predicate::createdBy(user),
        Predicate::allOf({ Predicate::systemGenerated(),
                           Predicate::assignedTo(user) }),
        Predicate::allOf({ Predicate::negate(Predicate::systemGenerated()),
                           byVisibility() })
      });
  }

  famacl_log(FAMACL_LOG_WARNING, "unknown role %u sees no resources\n",
             static_cast<unsigned int>(role));
  return Predicate::never();
}

bool
matches(const Predicate &p, const Resource &resource,
        const ShareStore &shares, const AssignmentStore &assignments) {
  switch (p.kind()) {
  case Predicate::Kind::ALWAYS:
    return true;
  case Predicate::Kind::NEVER:
    return false;
  case Predicate::Kind::CREATED_BY:
    return resource.createdBy == p.operand();
  case Predicate::Kind::VISIBILITY_IS:
    return resource.visibility == p.visibility();
  case Predicate::Kind::FAMILY_IS:
    return resource.familyId && *resource.familyId == p.operand();
  case Predicate::Kind::SYSTEM_GENERATED:
    return resource.isSystemGenerated;
  case Predicate::Kind::SHARED_WITH:
    return shares.shareExists(resource.id, p.operand());
  case Predicate::Kind::ASSIGNED_TO:
    return assignments.assignmentExists(resource.id, p.operand());
  case Predicate::Kind::AND:
    for (const auto &c : p.children()) {
      if (!matches(c, resource, shares, assignments))
        return false;
    }
    return true;
  case Predicate::Kind::OR:
    for (const auto &c : p.children()) {
      if (matches(c, resource, shares, assignments))
        return true;
    }
    return false;
  case Predicate::Kind::NOT:
    return p.children().size() == 1
      && !matches(p.children().front(), resource, shares, assignments);
  }
  return false;
}

static void
compileList(const Predicate &p, const std::string &alias, const char *op,
            const char *empty, SqlCondition &out);

static void
compile(const Predicate &p, const std::string &alias, SqlCondition &out) {
  switch (p.kind()) {
  case Predicate::Kind::ALWAYS:
    out.sql += "1";
    break;
  case Predicate::Kind::NEVER:
    out.sql += "0";
    break;
  case Predicate::Kind::CREATED_BY:
    out.sql += alias + ".created_by = ?";
    out.params.push_back(p.operand());
    break;
  case Predicate::Kind::VISIBILITY_IS:
    out.sql += alias + ".visibility = ?";
    out.params.push_back(toString(p.visibility()));
    break;
  case Predicate::Kind::FAMILY_IS:
    /* never NULL, so that NOT() stays correct */
    out.sql += "(" + alias + ".family_id IS NOT NULL AND " + alias + ".family_id = ?)";
    out.params.push_back(p.operand());
    break;
  case Predicate::Kind::SYSTEM_GENERATED:
    out.sql += alias + ".is_system_generated <> 0";
    break;
  case Predicate::Kind::SHARED_WITH:
    out.sql += "EXISTS (SELECT 1 FROM resource_shares s WHERE s.resource_id = "
      + alias + ".id AND s.user_id = ?)";
    out.params.push_back(p.operand());
    break;
  case Predicate::Kind::ASSIGNED_TO:
    out.sql += "EXISTS (SELECT 1 FROM template_assignments t WHERE t.resource_id = "
      + alias + ".id AND t.assignee_id = ?)";
    out.params.push_back(p.operand());
    break;
  case Predicate::Kind::AND:
    compileList(p, alias, " AND ", "1", out);
    break;
  case Predicate::Kind::OR:
    compileList(p, alias, " OR ", "0", out);
    break;
  case Predicate::Kind::NOT:
    if (p.children().size() != 1) {
      out.sql += "0";
    } else {
      out.sql += "(NOT ";
      compile(p.children().front(), alias, out);
      out.sql += ")";
    }
    break;
  }
}

static void
compileList(const Predicate &p, const std::string &alias, const char *op,
            const char *empty, SqlCondition &out) {
  if (p.children().empty()) {
    out.sql += empty;
    return;
  }
  out.sql += "(";
  for (std::size_t idx = 0; idx < p.children().size(); idx++) {
    if (idx)
      out.sql += op;
    compile(p.children()[idx], alias, out);
  }
  out.sql += ")";
}

SqlCondition
compileSql(const Predicate &p, const std::string &alias) {
  SqlCondition result;
  compile(p, alias, result);
  return result;
}

} /* namespace famacl */
