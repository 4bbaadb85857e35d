/*
 * engine.cc -- rule-based access decisions
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include "famacl/condition.hh"
#include "famacl/debug.hh"
#include "famacl/engine.hh"

namespace famacl {

AccessLevel
AccessDecisionEngine::getUserAccessLevel(const AccessContext &context,
                                         ResourceType type) const {
  const RuleSet *rules = registry.findRules(type);
  if (!rules) {
    famacl_log(FAMACL_LOG_DEBUG, "no rules for %s, access level NONE\n",
               toString(type));
    return AccessLevel::NONE;
  }

  /* no early exit: a later rule may grant a higher level */
  AccessLevel highest = AccessLevel::NONE;
  for (const auto &rule : *rules) {
    if (evaluate(context, rule.condition)) {
      highest = maxLevel(highest, rule.accessLevel);
    }
  }

  famacl_log(FAMACL_LOG_DEBUG, "%s has %s access on %s\n",
             context.userId.c_str(), toString(highest), toString(type));
  return highest;
}

bool
AccessDecisionEngine::hasAccess(const AccessContext &context, ResourceType type,
                                AccessLevel required) const {
  return isSufficient(getUserAccessLevel(context, type), required);
}

bool
AccessDecisionEngine::canPerformOperation(const AccessContext &context,
                                          ResourceType type,
                                          Operation op) const {
  return hasAccess(context, type, requiredLevel(op));
}

AccessDetails
AccessDecisionEngine::getAccessDetails(const AccessContext &context,
                                       ResourceType type) const {
  AccessDetails details;
  const RuleSet *rules = registry.findRules(type);
  if (!rules)
    return details;

  for (const auto &rule : *rules) {
    if (evaluate(context, rule.condition)) {
      details.matchedRules.push_back(rule);
      details.accessLevel = maxLevel(details.accessLevel, rule.accessLevel);
    }
  }

  details.canRead = isSufficient(details.accessLevel, AccessLevel::READ);
  details.canWrite = isSufficient(details.accessLevel, AccessLevel::WRITE);
  details.canDelete = isSufficient(details.accessLevel, AccessLevel::DELETE);
  details.canAdmin = isSufficient(details.accessLevel, AccessLevel::ADMIN);
  return details;
}

} /* namespace famacl */
