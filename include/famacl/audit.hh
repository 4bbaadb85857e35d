/*
 * audit.hh -- diagnostic records of access decisions
 *
 * Copyright (C) 2018-2019 Sara Stadler
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_AUDIT_HH
#define FAMACL_AUDIT_HH 1

#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <jansson.h>

#include "famacl/engine.hh"
#include "famacl/operation.hh"
#include "famacl/types.hh"

namespace famacl {

/**
 * Describes one access decision taken by a guard or an Authorizer.
 * famacl only produces these records; storing them is up to the
 * application.
 */
struct AccessEvent {
  enum class Type { GRANTED, DENIED, ERROR };

  std::time_t timestamp = 0;
  Type type = Type::DENIED;
  UserId userId;
  UserRole userRole = UserRole::MEMBER;
  ResourceType resourceType = ResourceType::DOCUMENT;
  Operation operation = Operation::READ;
  std::optional<ResourceId> resourceId;
  AccessLevel requiredLevel = AccessLevel::NONE;
  AccessLevel grantedLevel = AccessLevel::NONE;
  std::vector<std::string> matchedRules;
  std::string reason;
};

using EventSink = std::function<void(const AccessEvent &)>;

const char *toString(AccessEvent::Type type);

/**
 * Creates a new JSON object for @p event. The caller owns the
 * returned reference and must release it with json_decref().
 * Returns nullptr if memory could not be allocated.
 */
json_t *toJsonObject(const AccessEvent &event);

/** Creates a new JSON object for @p details; see above. */
json_t *toJsonObject(const AccessDetails &details);

/**
 * Serializes @p event as compact JSON text. Timestamps are written
 * in ISO 8601 format (UTC).
 */
std::string toJson(const AccessEvent &event);

/** Serializes @p details as compact JSON text. */
std::string toJson(const AccessDetails &details);

} /* namespace famacl */

#endif /* FAMACL_AUDIT_HH */
