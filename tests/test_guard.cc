/*
 * test_guard.cc -- access checks in front of operation handlers
 *
 * Copyright (C) 2018 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <optional>
#include <string>
#include <vector>

#include "test.hh"
#include <catch2/catch.hpp>

using namespace famacl;

SCENARIO( "Guarded handlers", "[guard]" ) {
  const RuleSetRegistry registry = defaultRuleSetRegistry();
  const AccessDecisionEngine engine{registry};

  std::vector<AccessEvent> events;
  EventSink sink = [&events](const AccessEvent &e) { events.push_back(e); };

  int calls = 0;
  auto update = withAccessControl(engine, ResourceType::DOCUMENT, Operation::UPDATE,
                                  [&calls](const AccessContext &ctx, const std::string &text) {
                                    calls++;
                                    return ctx.userId + ": " + text;
                                  }, sink);

  GIVEN("A family admin editing a document of their family") {
    AccessContext ctx = test_context("a1", UserRole::MEMBER, "F1", FamilyRole::FAMILY_ADMIN);
    ctx.resourceFamilyId = "F1";
    ctx.resourceOwnerId = "m1";

    WHEN("the guarded handler is called") {
      const std::string result = update(ctx, "hello");

      THEN("the handler runs and a granted event is emitted") {
        REQUIRE(result == "a1: hello");
        REQUIRE(calls == 1);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == AccessEvent::Type::GRANTED);
        REQUIRE(events[0].userId == "a1");
        REQUIRE(events[0].requiredLevel == AccessLevel::WRITE);
        REQUIRE(events[0].grantedLevel == AccessLevel::WRITE);
        REQUIRE(events[0].matchedRules.size() == 2);
      }
    }
  }

  GIVEN("A family member of another family") {
    AccessContext ctx = test_context("m2", UserRole::MEMBER, "F2", FamilyRole::MEMBER);
    ctx.resourceFamilyId = "F1";
    ctx.resourceOwnerId = "m1";

    WHEN("the guarded handler is called") {
      test_log_off();
      REQUIRE_THROWS_AS(update(ctx, "hello"), AccessDenied);
      test_log_on();

      THEN("the handler is not invoked and a denied event is emitted") {
        REQUIRE(calls == 0);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == AccessEvent::Type::DENIED);
        REQUIRE(events[0].grantedLevel == AccessLevel::NONE);
        REQUIRE(events[0].matchedRules.empty());
      }
    }

    WHEN("requireAccess is called directly") {
      std::optional<AccessDenied> denied;
      test_log_off();
      try {
        requireAccess(engine, ctx, ResourceType::DOCUMENT, Operation::DELETE);
      } catch (const AccessDenied &e) {
        denied = e;
      }
      test_log_on();

      THEN("the exception carries the facts of the decision") {
        REQUIRE(denied);
        REQUIRE(denied->userId() == "m2");
        REQUIRE(denied->resourceType() == ResourceType::DOCUMENT);
        REQUIRE(denied->operation() == Operation::DELETE);
        REQUIRE(denied->requiredLevel() == AccessLevel::DELETE);
        REQUIRE(denied->grantedLevel() == AccessLevel::NONE);
        REQUIRE(std::string{denied->what()}
                == "access denied: m2 may not delete DOCUMENT (requires DELETE, has NONE)");
      }
    }
  }

  GIVEN("A guard without event sink") {
    auto read = withAccessControl(engine, ResourceType::NOTIFICATION, Operation::READ,
                                  [](const AccessContext &ctx) { return ctx.userId; });

    THEN("owners pass and others are rejected") {
      AccessContext ctx = test_context("m1", UserRole::MEMBER);
      ctx.resourceOwnerId = "m1";
      REQUIRE(read(ctx) == "m1");

      ctx.resourceOwnerId = "m2";
      test_log_off();
      REQUIRE_THROWS_AS(read(ctx), AccessDenied);
      test_log_on();
    }
  }
}

SCENARIO( "Guarded handlers with an additional check", "[guard]" ) {
  const RuleSetRegistry registry = defaultRuleSetRegistry();
  const AccessDecisionEngine engine{registry};

  std::vector<AccessEvent> events;
  EventSink sink = [&events](const AccessEvent &e) { events.push_back(e); };

  int checks = 0;
  AccessCheck sameFamily = [&checks](const AccessContext &ctx) {
    checks++;
    return ctx.familyId == std::optional<FamilyId>{"F1"};
  };

  int calls = 0;
  auto update = withAccessControl(engine, ResourceType::DOCUMENT, Operation::UPDATE,
                                  [&calls](const AccessContext &) { return ++calls; },
                                  sink, sameFamily);

  GIVEN("An administrator outside of family F1") {
    AccessContext ctx = test_context("root", UserRole::ADMIN);
    ctx.resourceFamilyId = "F1";

    WHEN("the rules allow but the check rejects") {
      test_log_off();
      REQUIRE_THROWS_AS(update(ctx), AccessDenied);
      test_log_on();

      THEN("the handler is not invoked and a denied event is emitted") {
        REQUIRE(checks == 1);
        REQUIRE(calls == 0);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == AccessEvent::Type::DENIED);
        REQUIRE(events[0].grantedLevel == AccessLevel::ADMIN);
        REQUIRE(events[0].reason == "rejected by access check");
      }
    }

    WHEN("requireAccess is called with the check") {
      std::optional<AccessDenied> denied;
      test_log_off();
      try {
        requireAccess(engine, ctx, ResourceType::DOCUMENT, Operation::READ,
                      nullptr, sameFamily);
      } catch (const AccessDenied &e) {
        denied = e;
      }
      test_log_on();

      THEN("the exception names the rejection") {
        REQUIRE(denied);
        REQUIRE(denied->grantedLevel() == AccessLevel::ADMIN);
        REQUIRE(std::string{denied->what()}
                == "access denied: root may not read DOCUMENT (requires READ, has ADMIN)"
                   ": rejected by access check");
      }
    }
  }

  GIVEN("A family admin of F1") {
    AccessContext ctx = test_context("a1", UserRole::MEMBER, "F1", FamilyRole::FAMILY_ADMIN);
    ctx.resourceFamilyId = "F1";

    THEN("the check and the rules both pass") {
      REQUIRE(update(ctx) == 1);
      REQUIRE(checks == 1);
      REQUIRE(events.back().type == AccessEvent::Type::GRANTED);
    }
  }

  GIVEN("A plain member of F1") {
    AccessContext ctx = test_context("m1", UserRole::MEMBER, "F1", FamilyRole::MEMBER);
    ctx.resourceFamilyId = "F1";

    THEN("a passing check does not raise the access level") {
      test_log_off();
      REQUIRE_THROWS_AS(update(ctx), AccessDenied);
      test_log_on();
      REQUIRE(checks == 1);
      REQUIRE(calls == 0);
      REQUIRE(events.back().reason == "insufficient access level");
    }
  }
}
