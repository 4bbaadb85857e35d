/*
 * authorizer.hh -- combined rule and visibility decisions
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_AUTHORIZER_HH
#define FAMACL_AUTHORIZER_HH 1

#include <optional>
#include <utility>

#include "famacl/audit.hh"
#include "famacl/engine.hh"
#include "famacl/libfamacl.hh"
#include "famacl/operation.hh"
#include "famacl/resource.hh"
#include "famacl/visibility.hh"

namespace famacl {

/** Outcome of Authorizer::authorize(). */
struct Decision {
  AccessDetails rules;          /**< result of the rule tables */
  bool ruleAllows = false;      /**< rules grant the required level */
  bool gateAllows = false;      /**< visibility gate lets the user see it */
  bool allowed = false;         /**< ruleAllows && gateAllows */
};

/**
 * Looks up the user and the resource, builds the AccessContext and
 * asks both the rule engine and the visibility gate. An operation is
 * allowed only if both agree.
 */
class Authorizer {
public:
  Authorizer(const AccessDecisionEngine &engine,
             const ResourceVisibilityGate &gate,
             const UserDirectory &users,
             const ResourceStore &resources)
    : engine(engine), gate(gate), users(users), resources(resources) {}

  /** Emit an AccessEvent for every decision to @p sink. */
  void setEventSink(EventSink sink) { this->sink = std::move(sink); }

  /**
   * Decides whether @p user may perform @p op on the resource
   * @p resource of type @p type.
   *
   * @param decision If not nullptr, filled with the details of the
   *                 decision when the result is FAMACL_OK or
   *                 FAMACL_ERROR_UNAUTHORIZED.
   * @return FAMACL_OK if allowed, FAMACL_ERROR_UNAUTHORIZED if
   *         denied, FAMACL_ERROR_NOT_FOUND if the user or the
   *         resource does not exist, FAMACL_ERROR_STORAGE if either
   *         cannot be read.
   */
  result_t authorize(const UserId &user, const ResourceId &resource,
                     ResourceType type, Operation op,
                     Decision *decision = nullptr) const;

  /**
   * Decides whether @p user may create a new resource of @p type in
   * @p family. Only the rule tables are consulted as there is no
   * resource instance yet.
   */
  result_t authorizeCreate(const UserId &user, ResourceType type,
                           const std::optional<FamilyId> &family,
                           Decision *decision = nullptr) const;

private:
  void emit(const UserRecord &user, ResourceType type, Operation op,
            const std::optional<ResourceId> &resource,
            const Decision &decision, const char *reason) const;
  void emitError(const UserRecord &user, ResourceType type, Operation op,
                 const ResourceId &resource, const char *reason) const;
  result_t findUser(const UserId &user, UserRecord &record) const;

  const AccessDecisionEngine &engine;
  const ResourceVisibilityGate &gate;
  const UserDirectory &users;
  const ResourceStore &resources;
  EventSink sink;
};

} /* namespace famacl */

#endif /* FAMACL_AUTHORIZER_HH */
