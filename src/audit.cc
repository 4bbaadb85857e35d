/*
 * audit.cc -- JSON representation of access decisions
 *
 * Copyright (C) 2018-2019 Sara Stadler
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <cstdlib>
#include <ctime>
#include <memory>
#include <string>

#include <jansson.h>

#include "famacl/audit.hh"
#include "famacl/debug.hh"

namespace famacl {

const char *
toString(AccessEvent::Type type) {
  switch (type) {
  case AccessEvent::Type::GRANTED: return "granted";
  case AccessEvent::Type::DENIED: return "denied";
  case AccessEvent::Type::ERROR: return "error";
  }
  return "unknown";
}

static std::string
iso8601(std::time_t t) {
  char buf[32];
  struct tm tmp;
  if (!gmtime_r(&t, &tmp) || !strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmp))
    return "";
  return buf;
}

/* Adds a string member, returns false on allocation failure. */
static bool
set_string(json_t *obj, const char *key, const std::string &value) {
  return json_object_set_new(obj, key, json_string(value.c_str())) == 0;
}

static json_t *
string_array(const std::vector<std::string> &values) {
  json_t *arr = json_array();
  if (!arr)
    return nullptr;
  for (const auto &v : values) {
    if (json_array_append_new(arr, json_string(v.c_str())) != 0) {
      json_decref(arr);
      return nullptr;
    }
  }
  return arr;
}

json_t *
toJsonObject(const AccessEvent &event) {
  json_t *obj = json_object();
  if (!obj)
    return nullptr;

  bool ok = set_string(obj, "timestamp", iso8601(event.timestamp))
    && set_string(obj, "type", toString(event.type))
    && set_string(obj, "userId", event.userId)
    && set_string(obj, "userRole", toString(event.userRole))
    && set_string(obj, "resourceType", toString(event.resourceType))
    && set_string(obj, "operation", toString(event.operation))
    && set_string(obj, "requiredLevel", toString(event.requiredLevel))
    && set_string(obj, "grantedLevel", toString(event.grantedLevel))
    && json_object_set_new(obj, "matchedRules", string_array(event.matchedRules)) == 0;

  if (ok && event.resourceId)
    ok = set_string(obj, "resourceId", *event.resourceId);
  if (ok && !event.reason.empty())
    ok = set_string(obj, "reason", event.reason);

  if (!ok) {
    famacl_log(FAMACL_LOG_ERR, "cannot create JSON object for access event\n");
    json_decref(obj);
    return nullptr;
  }
  return obj;
}

json_t *
toJsonObject(const AccessDetails &details) {
  json_t *obj = json_object();
  if (!obj)
    return nullptr;

  json_t *rules = json_array();
  bool ok = rules != nullptr;
  for (const auto &rule : details.matchedRules) {
    if (!ok)
      break;
    json_t *r = json_object();
    ok = r != nullptr
      && set_string(r, "condition", rule.condition.describe())
      && set_string(r, "level", toString(rule.accessLevel))
      && set_string(r, "description", rule.description);
    if (ok) {
      ok = json_array_append_new(rules, r) == 0;
    } else if (r) {
      json_decref(r);
    }
  }

  if (!ok) {
    json_decref(rules);
    json_decref(obj);
    return nullptr;
  }

  /* json_object_set_new() takes the reference to rules in any case */
  ok = json_object_set_new(obj, "matchedRules", rules) == 0
    && set_string(obj, "accessLevel", toString(details.accessLevel))
    && json_object_set_new(obj, "canRead", json_boolean(details.canRead)) == 0
    && json_object_set_new(obj, "canWrite", json_boolean(details.canWrite)) == 0
    && json_object_set_new(obj, "canDelete", json_boolean(details.canDelete)) == 0
    && json_object_set_new(obj, "canAdmin", json_boolean(details.canAdmin)) == 0;

  if (!ok) {
    famacl_log(FAMACL_LOG_ERR, "cannot create JSON object for access details\n");
    json_decref(obj);
    return nullptr;
  }
  return obj;
}

template <typename T>
static std::string
dump(const T &value) {
  std::unique_ptr<json_t, decltype(&json_decref)> obj{toJsonObject(value), json_decref};
  if (!obj)
    return "";

  std::unique_ptr<char, decltype(&free)> text{json_dumps(obj.get(), JSON_COMPACT | JSON_PRESERVE_ORDER), free};
  return text ? std::string{text.get()} : "";
}

std::string toJson(const AccessEvent &event) { return dump(event); }
std::string toJson(const AccessDetails &details) { return dump(details); }

} /* namespace famacl */
