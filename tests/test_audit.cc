/*
 * test_audit.cc -- JSON representation of access decisions
 *
 * Copyright (C) 2018 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <cstring>
#include <memory>

#include "test.hh"
#include <catch2/catch.hpp>

using namespace famacl;

static std::string
member(json_t *obj, const char *key) {
  const char *s = json_string_value(json_object_get(obj, key));
  return s ? s : "";
}

SCENARIO( "Access events as JSON", "[audit]" ) {
  static std::unique_ptr<json_t, Deleter> obj;

  GIVEN("A denied event") {
    AccessEvent event;
    event.timestamp = 0;
    event.type = AccessEvent::Type::DENIED;
    event.userId = "m2";
    event.userRole = UserRole::MEMBER;
    event.resourceType = ResourceType::CARE_PLAN;
    event.operation = Operation::UPDATE;
    event.resourceId = "plan-7";
    event.requiredLevel = AccessLevel::WRITE;
    event.grantedLevel = AccessLevel::READ;
    event.matchedRules = { "Family members can view care plans within their family" };
    event.reason = "insufficient access level";

    WHEN("it is serialized") {
      const std::string text = toJson(event);
      json_error_t error;
      obj.reset(json_loads(text.c_str(), 0, &error));

      THEN("the text is valid JSON with all fields") {
        REQUIRE(obj != nullptr);
        REQUIRE(json_is_object(obj.get()));
        REQUIRE(member(obj.get(), "timestamp") == "1970-01-01T00:00:00Z");
        REQUIRE(member(obj.get(), "type") == "denied");
        REQUIRE(member(obj.get(), "userId") == "m2");
        REQUIRE(member(obj.get(), "userRole") == "MEMBER");
        REQUIRE(member(obj.get(), "resourceType") == "CARE_PLAN");
        REQUIRE(member(obj.get(), "operation") == "update");
        REQUIRE(member(obj.get(), "resourceId") == "plan-7");
        REQUIRE(member(obj.get(), "requiredLevel") == "WRITE");
        REQUIRE(member(obj.get(), "grantedLevel") == "READ");
        REQUIRE(member(obj.get(), "reason") == "insufficient access level");

        json_t *rules = json_object_get(obj.get(), "matchedRules");
        REQUIRE(json_is_array(rules));
        REQUIRE(json_array_size(rules) == 1);
      }

      THEN("the text is compact") {
        REQUIRE(text.find('\n') == std::string::npos);
        REQUIRE(text.rfind("{\"timestamp\":", 0) == 0);
      }
    }
  }

  GIVEN("An event without resource and reason") {
    AccessEvent event;
    event.type = AccessEvent::Type::GRANTED;
    event.userId = "root";

    WHEN("it is serialized") {
      obj.reset(toJsonObject(event));

      THEN("the optional members are left out") {
        REQUIRE(obj != nullptr);
        REQUIRE(json_object_get(obj.get(), "resourceId") == nullptr);
        REQUIRE(json_object_get(obj.get(), "reason") == nullptr);
        REQUIRE(member(obj.get(), "type") == "granted");
      }
    }
  }
}

SCENARIO( "Access details as JSON", "[audit]" ) {
  static std::unique_ptr<json_t, Deleter> obj;

  GIVEN("The details for a family admin on a family document") {
    const RuleSetRegistry registry = defaultRuleSetRegistry();
    const AccessDecisionEngine engine{registry};
    AccessContext ctx = test_context("a1", UserRole::MEMBER, "F1", FamilyRole::FAMILY_ADMIN);
    ctx.resourceFamilyId = "F1";

    const AccessDetails details = engine.getAccessDetails(ctx, ResourceType::DOCUMENT);

    WHEN("they are converted") {
      obj.reset(toJsonObject(details));

      THEN("level, matched rules and flags are present") {
        REQUIRE(obj != nullptr);
        REQUIRE(member(obj.get(), "accessLevel") == "WRITE");
        REQUIRE(json_is_true(json_object_get(obj.get(), "canRead")));
        REQUIRE(json_is_true(json_object_get(obj.get(), "canWrite")));
        REQUIRE(json_is_false(json_object_get(obj.get(), "canDelete")));
        REQUIRE(json_is_false(json_object_get(obj.get(), "canAdmin")));

        json_t *rules = json_object_get(obj.get(), "matchedRules");
        REQUIRE(json_array_size(rules) == 2);
        json_t *first = json_array_get(rules, 0);
        REQUIRE(member(first, "condition") == "and(isFamilyAdmin, isFamilyMember)");
        REQUIRE(member(first, "level") == "WRITE");
      }
    }
  }
}
