/*
 * rule.cc -- rule set registry and built-in rule tables
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <utility>

#include "famacl/debug.hh"
#include "famacl/rule.hh"

namespace famacl {

void
RuleSetRegistry::setRules(ResourceType type, RuleSet rules) {
  famacl_log(FAMACL_LOG_DEBUG, "set %zu rules for %s\n",
             rules.size(), toString(type));
  tables[type] = std::move(rules);
}

bool
RuleSetRegistry::removeRules(ResourceType type) {
  return tables.erase(type) > 0;
}

const RuleSet *
RuleSetRegistry::findRules(ResourceType type) const {
  auto it = tables.find(type);
  return it == tables.end() ? nullptr : &it->second;
}

/*
 * Each resource type gets its own table. For documents and care
 * plans a family admin must also belong to the resource's family,
 * for families and users the family role alone grants the level.
 */
RuleSetRegistry
defaultRuleSetRegistry(void) {
  RuleSetRegistry registry;
  const auto familyAdminOfResource = Condition::allOf({
      Condition::isFamilyAdmin(), Condition::isFamilyMember()
    });

  registry.setRules(ResourceType::DOCUMENT, {
      { Condition::isAdmin(), AccessLevel::ADMIN,
        "System administrators have full access to all documents" },
      { Condition::isOwner(), AccessLevel::DELETE,
        "Document owners have full access to their documents" },
      { familyAdminOfResource, AccessLevel::WRITE,
        "Family administrators can edit documents within their family" },
      { Condition::isFamilyMember(), AccessLevel::READ,
        "Family members can view documents within their family" },
      { Condition::isPublic(), AccessLevel::READ,
        "Anyone can view public documents" },
    });

  registry.setRules(ResourceType::MESSAGE, {
      { Condition::isAdmin(), AccessLevel::ADMIN,
        "System administrators have full access to all messages" },
      { Condition::isOwner(), AccessLevel::DELETE,
        "Message senders can edit and delete their messages" },
      { Condition::isFamilyMember(), AccessLevel::READ,
        "Family members can view messages in their family conversations" },
    });

  registry.setRules(ResourceType::FAMILY, {
      { Condition::isAdmin(), AccessLevel::ADMIN,
        "System administrators have full access to all families" },
      { Condition::isOwner(), AccessLevel::DELETE,
        "Family creators have full access to their families" },
      { Condition::isFamilyAdmin(), AccessLevel::WRITE,
        "Family administrators can manage their family" },
      { Condition::isFamilyMember(), AccessLevel::READ,
        "Family members can view their family information" },
    });

  registry.setRules(ResourceType::USER, {
      { Condition::isAdmin(), AccessLevel::ADMIN,
        "System administrators have full access to all users" },
      { Condition::isOwner(), AccessLevel::WRITE,
        "Users can edit their own profile" },
      { Condition::isFamilyAdmin(), AccessLevel::READ,
        "Family administrators can view their family members" },
      { Condition::isFamilyMember(), AccessLevel::READ,
        "Family members can view other family members" },
    });

  registry.setRules(ResourceType::NOTIFICATION, {
      { Condition::isAdmin(), AccessLevel::ADMIN,
        "System administrators have full access to all notifications" },
      { Condition::isOwner(), AccessLevel::DELETE,
        "Users have full access to their own notifications" },
    });

  registry.setRules(ResourceType::CARE_PLAN, {
      { Condition::isAdmin(), AccessLevel::ADMIN,
        "System administrators have full access to all care plans" },
      { Condition::isOwner(), AccessLevel::DELETE,
        "Care plan creators have full access to their plans" },
      { familyAdminOfResource, AccessLevel::WRITE,
        "Family administrators can manage care plans within their family" },
      { Condition::isFamilyMember(), AccessLevel::READ,
        "Family members can view care plans within their family" },
    });

  registry.setRules(ResourceType::ACTIVITY, {
      { Condition::isAdmin(), AccessLevel::ADMIN,
        "System administrators have full access to all activities" },
      { Condition::isOwner(), AccessLevel::DELETE,
        "Activity creators have full access to their activities" },
      { Condition::isFamilyMember(), AccessLevel::READ,
        "Family members can view activities within their family" },
    });

  /* contacts use the same policy as user profiles */
  registry.setRules(ResourceType::CONTACT, *registry.findRules(ResourceType::USER));

  return registry;
}

} /* namespace famacl */
