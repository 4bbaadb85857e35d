/*
 * test_roles.cc -- role based helpers for user administration
 *
 * Copyright (C) 2018 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <cstring>

#include "test.hh"
#include <catch2/catch.hpp>

using namespace famacl;

SCENARIO( "Creating users", "[roles]" ) {
  GIVEN("The three global roles") {
    THEN("administrators may create every role") {
      for (auto target : { UserRole::ADMIN, UserRole::VOLUNTEER, UserRole::MEMBER })
        REQUIRE(canCreateUser(UserRole::ADMIN, target));
    }

    THEN("volunteers may only create members, which need a family") {
      REQUIRE(canCreateUser(UserRole::VOLUNTEER, UserRole::MEMBER));
      REQUIRE_FALSE(canCreateUser(UserRole::VOLUNTEER, UserRole::VOLUNTEER));
      REQUIRE_FALSE(canCreateUser(UserRole::VOLUNTEER, UserRole::ADMIN));
      REQUIRE(requiresFamilyAssignment(UserRole::VOLUNTEER, UserRole::MEMBER));
      REQUIRE_FALSE(requiresFamilyAssignment(UserRole::ADMIN, UserRole::MEMBER));
    }

    THEN("members may not create anybody") {
      for (auto target : { UserRole::ADMIN, UserRole::VOLUNTEER, UserRole::MEMBER })
        REQUIRE_FALSE(canCreateUser(UserRole::MEMBER, target));
    }

    THEN("each role has a display name") {
      REQUIRE(strcmp(roleDisplayName(UserRole::ADMIN), "Administrator") == 0);
      REQUIRE(strcmp(roleDisplayName(UserRole::VOLUNTEER), "Volunteer") == 0);
      REQUIRE(strcmp(roleDisplayName(UserRole::MEMBER), "Member") == 0);
    }
  }
}

SCENARIO( "Administrator, family and ownership checks", "[roles]" ) {
  const UserRecord admin{ "root", UserRole::ADMIN, std::nullopt, std::nullopt };
  const UserRecord primary{ "p1", UserRole::MEMBER, std::optional<FamilyId>{"F1"},
                            FamilyRole::PRIMARY_CONTACT };
  const UserRecord member{ "m1", UserRole::MEMBER, std::optional<FamilyId>{"F1"},
                           FamilyRole::MEMBER };

  GIVEN("An administrator, a primary contact and a plain member") {
    THEN("requireAdmin only passes the administrator") {
      REQUIRE(requireAdmin(admin));
      REQUIRE_FALSE(requireAdmin(primary));
      REQUIRE_FALSE(requireAdmin(member));
    }

    THEN("requireFamilyAdmin passes administrators and primary contacts") {
      REQUIRE(requireFamilyAdmin(admin));
      REQUIRE(requireFamilyAdmin(primary));
      REQUIRE_FALSE(requireFamilyAdmin(member));
    }

    THEN("checkFamilyAccess passes administrators and members of the family") {
      REQUIRE(checkFamilyAccess(admin, "F2"));
      REQUIRE(checkFamilyAccess(member, "F1"));
      REQUIRE_FALSE(checkFamilyAccess(member, "F2"));
    }

    THEN("an empty family id matches no member") {
      const UserRecord blank{ "b1", UserRole::MEMBER, std::optional<FamilyId>{""},
                              FamilyRole::MEMBER };
      REQUIRE_FALSE(checkFamilyAccess(blank, ""));
      REQUIRE(checkFamilyAccess(admin, ""));
    }

    THEN("checkResourceOwnership passes administrators and owners") {
      REQUIRE(checkResourceOwnership(admin, "m1"));
      REQUIRE(checkResourceOwnership(member, "m1"));
      REQUIRE_FALSE(checkResourceOwnership(primary, "m1"));
    }
  }

  GIVEN("A resource created by m1") {
    Resource r;
    r.id = "doc";
    r.createdBy = "m1";

    THEN("only its creator and administrators may delete it") {
      REQUIRE(canDeleteResource(r, "m1", UserRole::MEMBER));
      REQUIRE(canDeleteResource(r, "root", UserRole::ADMIN));
      REQUIRE_FALSE(canDeleteResource(r, "v1", UserRole::VOLUNTEER));
    }
  }
}

SCENARIO( "Building access contexts", "[roles]" ) {
  const UserRecord member{ "m1", UserRole::MEMBER, std::optional<FamilyId>{"F1"},
                           FamilyRole::FAMILY_ADMIN };

  GIVEN("No resource facts") {
    const AccessContext ctx = makeAccessContext(member);

    THEN("only the user facts are set") {
      REQUIRE(ctx.userId == "m1");
      REQUIRE(ctx.userRole == UserRole::MEMBER);
      REQUIRE(ctx.familyId == std::optional<FamilyId>{"F1"});
      REQUIRE(ctx.familyRole == FamilyRole::FAMILY_ADMIN);
      REQUIRE_FALSE(ctx.resourceOwnerId);
      REQUIRE_FALSE(ctx.resourceFamilyId);
      REQUIRE_FALSE(ctx.isResourcePublic);
    }
  }

  GIVEN("A document with uploader and creator") {
    ResourceFacts facts;
    facts.uploadedBy = "up";
    facts.createdBy = "cr";
    facts.familyId = "F2";
    facts.isPublic = true;

    THEN("the uploader is the owner") {
      const AccessContext ctx = makeAccessContext(member, facts);
      REQUIRE(ctx.resourceOwnerId == std::optional<UserId>{"up"});
      REQUIRE(ctx.resourceFamilyId == std::optional<FamilyId>{"F2"});
      REQUIRE(ctx.isResourcePublic);
    }

    THEN("without uploader the creator is the owner") {
      facts.uploadedBy.reset();
      const AccessContext ctx = makeAccessContext(member, facts);
      REQUIRE(ctx.resourceOwnerId == std::optional<UserId>{"cr"});
    }
  }

  GIVEN("Empty ids on both sides") {
    const UserRecord blank{ "b1", UserRole::MEMBER, std::optional<FamilyId>{""},
                            FamilyRole::MEMBER };
    ResourceFacts facts;
    facts.uploadedBy = "";
    facts.createdBy = "cr";
    facts.familyId = "";

    THEN("they are treated as unset") {
      const AccessContext ctx = makeAccessContext(blank, facts);
      REQUIRE_FALSE(ctx.familyId);
      REQUIRE_FALSE(ctx.resourceFamilyId);
      REQUIRE(ctx.resourceOwnerId == std::optional<UserId>{"cr"});
      REQUIRE_FALSE(evaluate(ctx, Condition::isFamilyMember()));
    }
  }

  GIVEN("A stored resource") {
    Resource r;
    r.id = "doc";
    r.createdBy = "cr";
    r.familyId = "F1";
    r.visibility = Visibility::SHARED;

    THEN("shared resources are not public") {
      const AccessContext ctx = makeAccessContext(member, r);
      REQUIRE(ctx.resourceOwnerId == std::optional<UserId>{"cr"});
      REQUIRE(ctx.resourceFamilyId == std::optional<FamilyId>{"F1"});
      REQUIRE_FALSE(ctx.isResourcePublic);
    }

    THEN("public resources are") {
      r.visibility = Visibility::PUBLIC;
      REQUIRE(makeAccessContext(member, r).isResourcePublic);
    }
  }
}
