/*
 * guard.hh -- access checks in front of operation handlers
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_GUARD_HH
#define FAMACL_GUARD_HH 1

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include "famacl/audit.hh"
#include "famacl/engine.hh"
#include "famacl/operation.hh"
#include "famacl/types.hh"

namespace famacl {

/**
 * Thrown when a guarded operation is not permitted. The exception
 * carries the facts of the decision so that callers can turn it into
 * an error response.
 */
class AccessDenied : public std::runtime_error {
public:
  AccessDenied(const UserId &user, ResourceType type, Operation op,
               AccessLevel required, AccessLevel granted,
               const char *reason = nullptr);

  const UserId &userId(void) const { return user_; }
  ResourceType resourceType(void) const { return type_; }
  Operation operation(void) const { return op_; }
  AccessLevel requiredLevel(void) const { return required_; }
  AccessLevel grantedLevel(void) const { return granted_; }

private:
  UserId user_;
  ResourceType type_;
  Operation op_;
  AccessLevel required_;
  AccessLevel granted_;
};

/**
 * An additional check of a guarded operation. It can only reject
 * access that the rule tables would grant, never grant more.
 */
using AccessCheck = std::function<bool(const AccessContext &)>;

/**
 * Checks that @p context may perform @p op on resources of @p type
 * and throws AccessDenied otherwise. If @p check is set, it runs
 * before the access level is compared and a false result denies
 * access. If @p sink is set, an AccessEvent is emitted for both
 * outcomes.
 */
void requireAccess(const AccessDecisionEngine &engine,
                   const AccessContext &context,
                   ResourceType type, Operation op,
                   const EventSink &sink = nullptr,
                   const AccessCheck &check = nullptr);

/**
 * Wraps @p handler so that it is only invoked after requireAccess()
 * has succeeded. The returned callable takes the AccessContext as
 * first argument and passes it on to @p handler together with all
 * remaining arguments. @p engine must outlive the returned callable.
 */
template <typename Handler>
auto withAccessControl(const AccessDecisionEngine &engine,
                       ResourceType type, Operation op, Handler handler,
                       EventSink sink = nullptr, AccessCheck check = nullptr) {
  return [&engine, type, op, handler = std::move(handler), sink = std::move(sink),
          check = std::move(check)]
    (const AccessContext &context, auto &&... args) {
    requireAccess(engine, context, type, op, sink, check);
    return handler(context, std::forward<decltype(args)>(args)...);
  };
}

} /* namespace famacl */

#endif /* FAMACL_GUARD_HH */
