/*
 * condition.hh -- access condition expression trees
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_CONDITION_HH
#define FAMACL_CONDITION_HH 1

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "famacl/types.hh"

namespace famacl {

/**
 * A boolean expression over the facts of an AccessContext. Leaves
 * test a single fact, And/Or/Not combine sub-conditions.
 *
 * Children are held by value, so a Condition can only be assembled
 * from conditions that already exist. This makes every tree finite
 * and acyclic.
 */
class Condition {
public:
  enum class Kind : uint8_t {
    IS_ADMIN,
    IS_OWNER,
    IS_FAMILY_MEMBER,
    IS_FAMILY_ADMIN,
    IS_PUBLIC,
    IS_SYSTEM_RESOURCE,
    AND,
    OR,
    NOT
  };

  static Condition isAdmin(void) { return Condition{Kind::IS_ADMIN}; }
  static Condition isOwner(void) { return Condition{Kind::IS_OWNER}; }
  static Condition isFamilyMember(void) { return Condition{Kind::IS_FAMILY_MEMBER}; }
  /* Does not check that the resource belongs to the user's family. */
  static Condition isFamilyAdmin(void) { return Condition{Kind::IS_FAMILY_ADMIN}; }
  static Condition isPublic(void) { return Condition{Kind::IS_PUBLIC}; }
  static Condition isSystemResource(void) { return Condition{Kind::IS_SYSTEM_RESOURCE}; }

  static Condition allOf(std::vector<Condition> conditions);
  static Condition allOf(std::initializer_list<Condition> conditions) {
    return allOf(std::vector<Condition>(conditions));
  }
  static Condition anyOf(std::vector<Condition> conditions);
  static Condition anyOf(std::initializer_list<Condition> conditions) {
    return anyOf(std::vector<Condition>(conditions));
  }
  static Condition negate(Condition condition);

  Kind kind(void) const { return kind_; }
  const std::vector<Condition> &children(void) const { return children_; }

  bool isLeaf(void) const {
    return kind_ != Kind::AND && kind_ != Kind::OR && kind_ != Kind::NOT;
  }

  /** Returns the height of the tree, 1 for a leaf. */
  std::size_t depth(void) const;

  /**
   * Returns a compact textual form, e.g.
   * "and(isFamilyAdmin, isFamilyMember)".
   */
  std::string describe(void) const;

  friend bool operator==(const Condition &a, const Condition &b) {
    return a.kind_ == b.kind_ && a.children_ == b.children_;
  }
  friend bool operator!=(const Condition &a, const Condition &b) {
    return !(a == b);
  }

protected:
  explicit Condition(Kind k, std::vector<Condition> c = {})
    : kind_(k), children_(std::move(c)) {}

private:
  Kind kind_;
  std::vector<Condition> children_;
};

/**
 * Evaluates @p condition against @p context. The evaluation is pure
 * and does no I/O: every fact must already be present in @p context.
 * and() over no children is true, or() over no children is false.
 * Condition kinds this function does not know evaluate to false.
 */
bool evaluate(const AccessContext &context, const Condition &condition);

/** Returns the name used for @p kind in configuration files. */
const char *toString(Condition::Kind kind);

/**
 * Maps a configuration keyword ("isAdmin", "and", ...) to a
 * Condition::Kind. Returns false if @p s is not known.
 */
bool parse(const std::string &s, Condition::Kind &out);

inline std::ostream &operator<<(std::ostream &os, const Condition &c) {
  return os << c.describe();
}

} /* namespace famacl */

#endif /* FAMACL_CONDITION_HH */
