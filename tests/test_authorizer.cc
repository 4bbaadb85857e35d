/*
 * test_authorizer.cc -- combined rule and visibility decisions
 *
 * Copyright (C) 2018 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <vector>

#include "test.hh"
#include "famacl/memory_store.hh"
#include <catch2/catch.hpp>

using namespace famacl;

static result_t
authorize(const Authorizer &authorizer, const UserId &user, const ResourceId &resource,
          Operation op, Decision *decision = nullptr) {
  test_log_off();
  const result_t res = authorizer.authorize(user, resource, ResourceType::DOCUMENT,
                                            op, decision);
  test_log_on();
  return res;
}

static result_t
authorize_create(const Authorizer &authorizer, const UserId &user, ResourceType type,
                 const std::optional<FamilyId> &family, Decision *decision = nullptr) {
  test_log_off();
  const result_t res = authorize_create(authorizer, user, type, family, decision);
  test_log_on();
  return res;
}

SCENARIO( "Authorizing operations on stored resources", "[authorizer]" ) {
  MemoryStore store;
  store.addUser({ "root", UserRole::ADMIN, std::nullopt, std::nullopt });
  store.addUser({ "m1", UserRole::MEMBER, std::optional<FamilyId>{"F1"}, FamilyRole::MEMBER });
  store.addUser({ "a1", UserRole::MEMBER, std::optional<FamilyId>{"F1"}, FamilyRole::FAMILY_ADMIN });
  store.addUser({ "m2", UserRole::MEMBER, std::optional<FamilyId>{"F2"}, FamilyRole::MEMBER });

  Resource doc;
  doc.id = "doc";
  doc.createdBy = "m1";
  doc.familyId = "F1";
  doc.visibility = Visibility::FAMILY;
  doc.status = ResourceStatus::APPROVED;
  store.addResource(doc);

  Resource diary = doc;
  diary.id = "diary";
  diary.visibility = Visibility::PRIVATE;
  store.addResource(diary);

  const RuleSetRegistry registry = defaultRuleSetRegistry();
  const AccessDecisionEngine engine{registry};
  const ResourceVisibilityGate gate{store, store, store};
  Authorizer authorizer{engine, gate, store, store};

  std::vector<AccessEvent> events;
  authorizer.setEventSink([&events](const AccessEvent &e) { events.push_back(e); });

  GIVEN("A family document") {
    THEN("its creator may delete it") {
      Decision d;
      REQUIRE(authorize(authorizer, "m1", "doc", Operation::DELETE, &d) == FAMACL_OK);
      REQUIRE(d.rules.accessLevel == AccessLevel::DELETE);
      REQUIRE(d.ruleAllows);
      REQUIRE(d.gateAllows);
      REQUIRE(d.allowed);
      REQUIRE(events.size() == 1);
      REQUIRE(events[0].type == AccessEvent::Type::GRANTED);
      REQUIRE(events[0].resourceId == std::optional<ResourceId>{"doc"});
    }

    THEN("the family admin may update but not delete it") {
      REQUIRE(authorize(authorizer, "a1", "doc", Operation::UPDATE) == FAMACL_OK);
      REQUIRE(authorize(authorizer, "a1", "doc", Operation::DELETE) == FAMACL_ERROR_UNAUTHORIZED);
    }

    THEN("a member of another family may not read it") {
      Decision d;
      REQUIRE(authorize(authorizer, "m2", "doc", Operation::READ, &d) == FAMACL_ERROR_UNAUTHORIZED);
      REQUIRE_FALSE(d.ruleAllows);
      REQUIRE_FALSE(d.gateAllows);
      REQUIRE(events.back().type == AccessEvent::Type::DENIED);
      REQUIRE(events.back().reason == "insufficient access level");
    }
  }

  GIVEN("A private document of m1") {
    THEN("the rules let the family read it but the gate does not") {
      Decision d;
      REQUIRE(authorize(authorizer, "a1", "diary", Operation::READ, &d) == FAMACL_ERROR_UNAUTHORIZED);
      REQUIRE(d.ruleAllows);
      REQUIRE_FALSE(d.gateAllows);
      REQUIRE_FALSE(d.allowed);
      REQUIRE(events.back().reason == "resource not visible to user");
    }

    THEN("the administrator may do everything") {
      for (auto op : { Operation::READ, Operation::UPDATE, Operation::DELETE })
        REQUIRE(authorize(authorizer, "root", "diary", op) == FAMACL_OK);
    }
  }

  GIVEN("Unknown users and resources") {
    THEN("the lookup fails") {
      REQUIRE(authorize(authorizer, "ghost", "doc", Operation::READ) == FAMACL_ERROR_NOT_FOUND);
      REQUIRE(events.empty());

      REQUIRE(authorize(authorizer, "m1", "nothing", Operation::READ) == FAMACL_ERROR_NOT_FOUND);
      REQUIRE(events.size() == 1);
      REQUIRE(events[0].type == AccessEvent::Type::ERROR);
    }
  }

  GIVEN("New resources") {
    THEN("only the rule tables decide") {
      Decision d;
      REQUIRE(authorize_create(authorizer, "a1", ResourceType::DOCUMENT,
                               std::optional<FamilyId>{"F1"}, &d) == FAMACL_OK);
      REQUIRE(d.rules.accessLevel == AccessLevel::WRITE);
      REQUIRE(d.gateAllows);

      REQUIRE(authorize_create(authorizer, "m1", ResourceType::DOCUMENT,
                               std::optional<FamilyId>{"F1"}) == FAMACL_ERROR_UNAUTHORIZED);
      REQUIRE(authorize_create(authorizer, "a1", ResourceType::DOCUMENT,
                               std::optional<FamilyId>{"F2"}) == FAMACL_ERROR_UNAUTHORIZED);
      REQUIRE(authorize_create(authorizer, "root", ResourceType::ACTIVITY,
                               std::nullopt) == FAMACL_OK);
      REQUIRE_FALSE(events.back().resourceId);
    }
  }
}
