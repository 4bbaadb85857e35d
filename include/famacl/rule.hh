/*
 * rule.hh -- Authorization rule representation for famacl
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_RULE_HH
#define FAMACL_RULE_HH 1

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "famacl/condition.hh"
#include "famacl/types.hh"

namespace famacl {

/**
 * A Rule grants @p accessLevel to every context that satisfies
 * @p condition.
 */
struct AccessRule {
  Condition condition;
  AccessLevel accessLevel;
  std::string description;

  friend bool operator==(const AccessRule &a, const AccessRule &b) {
    return a.condition == b.condition && a.accessLevel == b.accessLevel
      && a.description == b.description;
  }
  friend bool operator!=(const AccessRule &a, const AccessRule &b) {
    return !(a == b);
  }
};

/*
 * Rules of a RuleSet are not mutually exclusive. Their order does
 * not change any decision but is kept for diagnostics.
 */
using RuleSet = std::vector<AccessRule>;

/**
 * Maps each resource type to its rule set.
 *
 * The registry is filled at configuration time and only read
 * afterwards. setRules() must not be called while other threads
 * evaluate decisions against the same registry.
 */
class RuleSetRegistry {
public:
  /**
   * Replaces the rule set for @p type with @p rules.
   *
   * @param type  The resource type to configure.
   * @param rules The new rule set. An empty set is registered as
   *              such and grants nothing.
   */
  void setRules(ResourceType type, RuleSet rules);

  /** Removes the rule set for @p type. Returns true if one existed. */
  bool removeRules(ResourceType type);

  /**
   * Returns the rule set registered for @p type or nullptr if none
   * is registered. The pointer is invalidated by setRules() and
   * removeRules() for the same type.
   */
  const RuleSet *findRules(ResourceType type) const;

  bool contains(ResourceType type) const { return tables.count(type) > 0; }

  std::size_t size(void) const { return tables.size(); }

  /**
   * Writes all resource types with a registered rule set to the
   * output iterator @p out.
   */
  template <class OutIter>
  void registeredTypes(OutIter out) const {
    std::transform(tables.cbegin(), tables.cend(), out,
                   [](const auto &p) { return p.first; });
  }

private:
  std::map<ResourceType, RuleSet> tables;
};

/**
 * Returns a registry holding the built-in rule tables for all
 * resource types.
 */
RuleSetRegistry defaultRuleSetRegistry(void);

} /* namespace famacl */

#endif /* FAMACL_RULE_HH */
