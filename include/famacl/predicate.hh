/*
 * predicate.hh -- declarative visibility predicates over resources
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_PREDICATE_HH
#define FAMACL_PREDICATE_HH 1

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "famacl/resource.hh"
#include "famacl/types.hh"

namespace famacl {

/**
 * A boolean expression over one resource row and the share and
 * template assignment relations. The same tree is evaluated
 * in-process by matches() and translated into an SQL condition by
 * compileSql(), so both paths always agree on which rows pass.
 */
class Predicate {
public:
  enum class Kind : uint8_t {
    ALWAYS,
    NEVER,
    CREATED_BY,         /**< resource.createdBy == operand */
    VISIBILITY_IS,      /**< resource.visibility == visibility */
    FAMILY_IS,          /**< resource.familyId is set and == operand */
    SYSTEM_GENERATED,   /**< resource.isSystemGenerated */
    SHARED_WITH,        /**< a ResourceShare (resource.id, operand) exists */
    ASSIGNED_TO,        /**< a TemplateAssignment (resource.id, operand) exists */
    AND,
    OR,
    NOT
  };

  static Predicate always(void) { return Predicate{Kind::ALWAYS}; }
  static Predicate never(void) { return Predicate{Kind::NEVER}; }
  static Predicate createdBy(const UserId &user);
  static Predicate visibilityIs(Visibility v);
  /* An unset family never matches. */
  static Predicate familyIs(const std::optional<FamilyId> &family);
  static Predicate systemGenerated(void) { return Predicate{Kind::SYSTEM_GENERATED}; }
  static Predicate sharedWith(const UserId &user);
  static Predicate assignedTo(const UserId &user);
  static Predicate allOf(std::vector<Predicate> operands);
  static Predicate anyOf(std::vector<Predicate> operands);
  static Predicate negate(Predicate operand);

  Kind kind(void) const { return kind_; }
  const std::string &operand(void) const { return operand_; }
  Visibility visibility(void) const { return visibility_; }
  const std::vector<Predicate> &children(void) const { return children_; }

  std::string describe(void) const;

private:
  explicit Predicate(Kind k) : kind_(k) {}

  Kind kind_;
  std::string operand_;
  Visibility visibility_ = Visibility::PRIVATE;
  std::vector<Predicate> children_;
};

/**
 * Builds the predicate that selects the resources @p user with
 * global role @p role and family @p family may see:
 *
 *  - an ADMIN sees everything;
 *  - everybody sees resources they created;
 *  - a MEMBER sees a system-generated resource only if it has been
 *    assigned to them, regardless of its visibility;
 *  - otherwise PUBLIC resources, FAMILY resources of the user's own
 *    family and SHARED resources with a share for the user are
 *    visible.
 */
Predicate visibilityPredicate(const UserId &user, UserRole role,
                              const std::optional<FamilyId> &family);

/**
 * Evaluates @p p for @p resource. The share and assignment stores
 * are only consulted for SHARED_WITH and ASSIGNED_TO nodes that are
 * actually reached.
 */
bool matches(const Predicate &p, const Resource &resource,
             const ShareStore &shares, const AssignmentStore &assignments);

/** An SQL boolean expression with positional parameters. */
struct SqlCondition {
  std::string sql;
  std::vector<std::string> params;
};

/**
 * Translates @p p into a condition on the table alias @p alias of
 * the resources table. Shares and assignments are tested with
 * EXISTS sub-queries on resource_shares and template_assignments.
 */
SqlCondition compileSql(const Predicate &p, const std::string &alias = "r");

inline std::ostream &operator<<(std::ostream &os, const Predicate &p) {
  return os << p.describe();
}

} /* namespace famacl */

#endif /* FAMACL_PREDICATE_HH */
