/*
 * guard.cc -- access checks in front of operation handlers
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <ctime>
#include <string>

#include "famacl/debug.hh"
#include "famacl/guard.hh"

namespace famacl {

static std::string
deniedMessage(const UserId &user, ResourceType type, Operation op,
              AccessLevel required, AccessLevel granted, const char *reason) {
  std::string msg = "access denied: " + user + " may not " + toString(op) + " "
    + toString(type) + " (requires " + toString(required)
    + ", has " + toString(granted) + ")";
  if (reason)
    msg += std::string{": "} + reason;
  return msg;
}

AccessDenied::AccessDenied(const UserId &user, ResourceType type, Operation op,
                           AccessLevel required, AccessLevel granted,
                           const char *reason)
  : std::runtime_error(deniedMessage(user, type, op, required, granted, reason)),
    user_(user), type_(type), op_(op), required_(required), granted_(granted) {
}

void
requireAccess(const AccessDecisionEngine &engine, const AccessContext &context,
              ResourceType type, Operation op, const EventSink &sink,
              const AccessCheck &check) {
  const AccessLevel required = requiredLevel(op);
  const AccessDetails details = engine.getAccessDetails(context, type);
  const bool passed = !check || check(context);
  const bool granted = passed && isSufficient(details.accessLevel, required);
  const char *reason = granted ? "sufficient access level"
    : !passed ? "rejected by access check"
    : "insufficient access level";

  if (sink) {
    AccessEvent event;
    event.timestamp = std::time(nullptr);
    event.type = granted ? AccessEvent::Type::GRANTED : AccessEvent::Type::DENIED;
    event.userId = context.userId;
    event.userRole = context.userRole;
    event.resourceType = type;
    event.operation = op;
    event.requiredLevel = required;
    event.grantedLevel = details.accessLevel;
    for (const auto &rule : details.matchedRules)
      event.matchedRules.push_back(rule.description);
    event.reason = reason;
    sink(event);
  }

  if (!granted) {
    famacl_log(FAMACL_LOG_NOTICE, "deny %s on %s for %s (%s): has %s, needs %s, %s\n",
               toString(op), toString(type), context.userId.c_str(),
               toString(context.userRole), toString(details.accessLevel),
               toString(required), reason);
    throw AccessDenied(context.userId, type, op, required, details.accessLevel,
                       passed ? nullptr : reason);
  }
}

} /* namespace famacl */
