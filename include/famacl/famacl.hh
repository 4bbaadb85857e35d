/*
 * famacl.hh -- main header file for libfamacl
 *
 * Copyright (C) 2015-2021 Olaf Bergmann <bergmann@tzi.org>
 *               2015-2021 Stefanie Gerdes <gerdes@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_FAMACL_HH
#define FAMACL_FAMACL_HH 1

#include "famacl/libfamacl.hh"
#include "famacl/debug.hh"
#include "famacl/types.hh"
#include "famacl/condition.hh"
#include "famacl/rule.hh"
#include "famacl/operation.hh"
#include "famacl/engine.hh"
#include "famacl/resource.hh"
#include "famacl/predicate.hh"
#include "famacl/visibility.hh"
#include "famacl/audit.hh"
#include "famacl/guard.hh"
#include "famacl/authorizer.hh"
#include "famacl/roles.hh"

#endif /* FAMACL_FAMACL_HH */
