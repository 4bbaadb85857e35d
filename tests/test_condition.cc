/*
 * test_condition.cc -- evaluation of access conditions
 *
 * Copyright (C) 2018 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include "test.hh"
#include <catch2/catch.hpp>

using namespace famacl;

/* Produces a condition with a kind that evaluate() does not know. */
class ForgedCondition : public Condition {
public:
  ForgedCondition(void) : Condition(static_cast<Kind>(0x7f)) {}
};

SCENARIO( "Leaf conditions test single facts", "[condition]" ) {
  GIVEN("A member of family F1 with no resource facts") {
    AccessContext ctx = test_context("u1", UserRole::MEMBER, "F1");

    THEN("no leaf holds except isSystemResource") {
      REQUIRE_FALSE(evaluate(ctx, Condition::isAdmin()));
      REQUIRE_FALSE(evaluate(ctx, Condition::isOwner()));
      REQUIRE_FALSE(evaluate(ctx, Condition::isFamilyMember()));
      REQUIRE_FALSE(evaluate(ctx, Condition::isFamilyAdmin()));
      REQUIRE_FALSE(evaluate(ctx, Condition::isPublic()));
      REQUIRE(evaluate(ctx, Condition::isSystemResource()));
    }

    WHEN("the resource belongs to F1, is public and owned by u1") {
      ctx.resourceFamilyId = "F1";
      ctx.resourceOwnerId = "u1";
      ctx.isResourcePublic = true;

      THEN("isOwner, isFamilyMember and isPublic hold") {
        REQUIRE(evaluate(ctx, Condition::isOwner()));
        REQUIRE(evaluate(ctx, Condition::isFamilyMember()));
        REQUIRE(evaluate(ctx, Condition::isPublic()));
        REQUIRE_FALSE(evaluate(ctx, Condition::isSystemResource()));
      }
    }

    WHEN("the resource belongs to F2 and is owned by u2") {
      ctx.resourceFamilyId = "F2";
      ctx.resourceOwnerId = "u2";

      THEN("isOwner and isFamilyMember do not hold") {
        REQUIRE_FALSE(evaluate(ctx, Condition::isOwner()));
        REQUIRE_FALSE(evaluate(ctx, Condition::isFamilyMember()));
      }
    }
  }

  GIVEN("A user without family and a resource without family") {
    AccessContext ctx = test_context("u1", UserRole::VOLUNTEER);

    THEN("isFamilyMember does not hold although both families are unset") {
      REQUIRE_FALSE(evaluate(ctx, Condition::isFamilyMember()));
    }
  }

  GIVEN("An administrator") {
    AccessContext ctx = test_context("root", UserRole::ADMIN);

    THEN("isAdmin holds") {
      REQUIRE(evaluate(ctx, Condition::isAdmin()));
    }
  }
}

SCENARIO( "isFamilyAdmin ignores the family of the resource", "[condition]" ) {
  GIVEN("A primary contact of F1 and a resource in F2") {
    AccessContext ctx = test_context("p1", UserRole::MEMBER, "F1",
                                     FamilyRole::PRIMARY_CONTACT);
    ctx.resourceFamilyId = "F2";

    THEN("isFamilyAdmin holds") {
      REQUIRE(evaluate(ctx, Condition::isFamilyAdmin()));
    }

    THEN("the combination with isFamilyMember does not hold") {
      REQUIRE_FALSE(evaluate(ctx, Condition::allOf({
              Condition::isFamilyAdmin(), Condition::isFamilyMember() })));
    }
  }

  GIVEN("A plain family member") {
    AccessContext ctx = test_context("m1", UserRole::MEMBER, "F1",
                                     FamilyRole::MEMBER);

    THEN("isFamilyAdmin does not hold") {
      REQUIRE_FALSE(evaluate(ctx, Condition::isFamilyAdmin()));
    }
  }
}

SCENARIO( "Combinators", "[condition]" ) {
  const AccessContext ctx = test_context("u1", UserRole::MEMBER);
  const Condition yes = Condition::isSystemResource();
  const Condition no = Condition::isAdmin();

  GIVEN("Empty combinators") {
    THEN("and() is true and or() is false") {
      REQUIRE(evaluate(ctx, Condition::allOf(std::vector<Condition>{})));
      REQUIRE_FALSE(evaluate(ctx, Condition::anyOf(std::vector<Condition>{})));
    }
  }

  GIVEN("Mixed operands") {
    THEN("and, or and not behave as boolean operators") {
      REQUIRE(evaluate(ctx, Condition::allOf({ yes, yes })));
      REQUIRE_FALSE(evaluate(ctx, Condition::allOf({ yes, no })));
      REQUIRE(evaluate(ctx, Condition::anyOf({ no, yes })));
      REQUIRE_FALSE(evaluate(ctx, Condition::anyOf({ no, no })));
      REQUIRE(evaluate(ctx, Condition::negate(no)));
      REQUIRE_FALSE(evaluate(ctx, Condition::negate(yes)));
    }
  }

  GIVEN("A nested condition") {
    const Condition c = Condition::anyOf({
        no, Condition::allOf({ yes, Condition::negate(no) }) });

    THEN("it evaluates recursively and reports its shape") {
      REQUIRE(evaluate(ctx, c));
      REQUIRE(c.depth() == 4);
      REQUIRE(c.describe() == "or(isAdmin, and(isSystemResource, not(isAdmin)))");
    }
  }
}

SCENARIO( "Unknown condition kinds fail closed", "[condition]" ) {
  GIVEN("A condition with an unknown kind") {
    const ForgedCondition forged;
    const AccessContext ctx = test_context("root", UserRole::ADMIN);

    WHEN("it is evaluated") {
      test_log_off();
      const bool result = evaluate(ctx, forged);
      test_log_on();

      THEN("the result is false") {
        REQUIRE_FALSE(result);
      }
    }

    WHEN("it is negated") {
      test_log_off();
      const bool result = evaluate(ctx, Condition::negate(forged));
      test_log_on();

      THEN("the negation is true") {
        REQUIRE(result);
      }
    }
  }
}

SCENARIO( "Condition names", "[condition]" ) {
  GIVEN("The name of every kind") {
    THEN("parse() returns the kind that toString() was called with") {
      for (auto kind : { Condition::Kind::IS_ADMIN, Condition::Kind::IS_OWNER,
                         Condition::Kind::IS_FAMILY_MEMBER, Condition::Kind::IS_FAMILY_ADMIN,
                         Condition::Kind::IS_PUBLIC, Condition::Kind::IS_SYSTEM_RESOURCE,
                         Condition::Kind::AND, Condition::Kind::OR, Condition::Kind::NOT }) {
        Condition::Kind parsed;
        REQUIRE(parse(toString(kind), parsed));
        REQUIRE(parsed == kind);
      }
    }
  }

  GIVEN("An unknown name") {
    Condition::Kind parsed = Condition::Kind::OR;
    THEN("parse() fails and leaves the output untouched") {
      REQUIRE_FALSE(parse("isRoot", parsed));
      REQUIRE(parsed == Condition::Kind::OR);
    }
  }
}
