/*
 * engine.hh -- rule-based access decisions
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_ENGINE_HH
#define FAMACL_ENGINE_HH 1

#include <vector>

#include "famacl/operation.hh"
#include "famacl/rule.hh"
#include "famacl/types.hh"

namespace famacl {

/** Diagnostic view of a single decision. */
struct AccessDetails {
  AccessLevel accessLevel = AccessLevel::NONE;
  std::vector<AccessRule> matchedRules;
  bool canRead = false;
  bool canWrite = false;
  bool canDelete = false;
  bool canAdmin = false;
};

/**
 * Computes the access level a context is granted by the rule table
 * of a resource type. The engine keeps a reference to @p registry,
 * which must outlive it.
 */
class AccessDecisionEngine {
public:
  explicit AccessDecisionEngine(const RuleSetRegistry &registry)
    : registry(registry) {}

  /**
   * Returns the highest level of all rules for @p type whose
   * condition holds for @p context. All rules are evaluated. Returns
   * AccessLevel::NONE if no rule matches or if no rule set is
   * registered for @p type.
   */
  AccessLevel getUserAccessLevel(const AccessContext &context,
                                 ResourceType type) const;

  bool hasAccess(const AccessContext &context, ResourceType type,
                 AccessLevel required) const;

  bool canPerformOperation(const AccessContext &context, ResourceType type,
                           Operation op) const;

  /** Like getUserAccessLevel(), but also reports the matched rules. */
  AccessDetails getAccessDetails(const AccessContext &context,
                                 ResourceType type) const;

  const RuleSetRegistry &rules(void) const { return registry; }

private:
  const RuleSetRegistry &registry;
};

} /* namespace famacl */

#endif /* FAMACL_ENGINE_HH */
