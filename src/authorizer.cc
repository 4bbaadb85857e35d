/*
 * authorizer.cc -- combined rule and visibility decisions
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <ctime>

#include "famacl/authorizer.hh"
#include "famacl/debug.hh"
#include "famacl/roles.hh"

namespace famacl {

void
Authorizer::emit(const UserRecord &user, ResourceType type, Operation op,
                 const std::optional<ResourceId> &resource,
                 const Decision &decision, const char *reason) const {
  if (!sink)
    return;

  AccessEvent event;
  event.timestamp = std::time(nullptr);
  event.type = decision.allowed ? AccessEvent::Type::GRANTED : AccessEvent::Type::DENIED;
  event.userId = user.id;
  event.userRole = user.role;
  event.resourceType = type;
  event.operation = op;
  event.resourceId = resource;
  event.requiredLevel = requiredLevel(op);
  event.grantedLevel = decision.rules.accessLevel;
  for (const auto &rule : decision.rules.matchedRules)
    event.matchedRules.push_back(rule.description);
  event.reason = reason;
  sink(event);
}

void
Authorizer::emitError(const UserRecord &user, ResourceType type, Operation op,
                      const ResourceId &resource, const char *reason) const {
  if (!sink)
    return;

  AccessEvent event;
  event.timestamp = std::time(nullptr);
  event.type = AccessEvent::Type::ERROR;
  event.userId = user.id;
  event.userRole = user.role;
  event.resourceType = type;
  event.operation = op;
  event.resourceId = resource;
  event.requiredLevel = requiredLevel(op);
  event.reason = reason;
  sink(event);
}

result_t
Authorizer::findUser(const UserId &user, UserRecord &record) const {
  const result_t res = users.lookupUser(user, record);
  if (res == FAMACL_ERROR_NOT_FOUND)
    famacl_log(FAMACL_LOG_INFO, "unknown user %s\n", user.c_str());
  else if (res != FAMACL_OK)
    famacl_log(FAMACL_LOG_ERR, "cannot look up user %s: %s\n",
               user.c_str(), result_string(res));
  return res;
}

result_t
Authorizer::authorize(const UserId &user, const ResourceId &resource,
                      ResourceType type, Operation op,
                      Decision *decision) const {
  UserRecord record;
  result_t res = findUser(user, record);
  if (res != FAMACL_OK)
    return res;

  Resource stored;
  res = resources.lookupResource(resource, stored);
  switch (res) {
  case FAMACL_OK:
    break;
  case FAMACL_ERROR_NOT_FOUND:
    famacl_log(FAMACL_LOG_INFO, "unknown resource %s\n", resource.c_str());
    emitError(record, type, op, resource, "resource not found");
    return res;
  default:
    famacl_log(FAMACL_LOG_ERR, "cannot look up resource %s: %s\n",
               resource.c_str(), result_string(res));
    emitError(record, type, op, resource, "storage error");
    return FAMACL_ERROR_STORAGE;
  }

  Decision d;
  d.rules = engine.getAccessDetails(makeAccessContext(record, stored), type);
  d.ruleAllows = isSufficient(d.rules.accessLevel, requiredLevel(op));
  d.gateAllows = gate.checkResourceAccess(stored, record.id, record.role,
                                          record.familyId);
  d.allowed = d.ruleAllows && d.gateAllows;

  const char *reason = d.allowed ? "allowed"
    : !d.ruleAllows ? "insufficient access level"
    : "resource not visible to user";
  famacl_log(d.allowed ? FAMACL_LOG_DEBUG : FAMACL_LOG_NOTICE,
             "%s %s on %s %s: %s\n", user.c_str(), toString(op),
             toString(type), resource.c_str(), reason);

  emit(record, type, op, resource, d, reason);
  if (decision)
    *decision = d;
  return d.allowed ? FAMACL_OK : FAMACL_ERROR_UNAUTHORIZED;
}

result_t
Authorizer::authorizeCreate(const UserId &user, ResourceType type,
                            const std::optional<FamilyId> &family,
                            Decision *decision) const {
  UserRecord record;
  const result_t res = findUser(user, record);
  if (res != FAMACL_OK)
    return res;

  ResourceFacts facts;
  facts.familyId = family;

  Decision d;
  d.rules = engine.getAccessDetails(makeAccessContext(record, facts), type);
  d.ruleAllows = isSufficient(d.rules.accessLevel, requiredLevel(Operation::CREATE));
  d.gateAllows = true;
  d.allowed = d.ruleAllows;

  const char *reason = d.allowed ? "allowed" : "insufficient access level";
  famacl_log(d.allowed ? FAMACL_LOG_DEBUG : FAMACL_LOG_NOTICE,
             "%s create %s: %s\n", user.c_str(), toString(type), reason);

  emit(record, type, Operation::CREATE, std::nullopt, d, reason);
  if (decision)
    *decision = d;
  return d.allowed ? FAMACL_OK : FAMACL_ERROR_UNAUTHORIZED;
}

} /* namespace famacl */
