/*
 * famacl_check.cc -- query access decisions from the command line
 *
 * Copyright (C) 2015-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <unistd.h>

#include "famacl/famacl.hh"
#include "famacl/config_parser.hh"
#include "famacl/sqlite_store.hh"

/* exit codes */
#define EXIT_ALLOWED      0
#define EXIT_DENIED       1
#define EXIT_USAGE        2
#define EXIT_LOOKUP       3

static void
usage( const char *program, const char *version) {
  const char *p;

  p = strrchr(program, '/');
  if (p)
    program = ++p;

  fprintf( stderr, "%s v%s -- famacl access check\n"
           "(c) 2015-2021 Olaf Bergmann <bergmann@tzi.org>\n\n"
           "usage: %s [-C file] [-d database] [-v num] [-j] -u user\n"
           "\t\t(-r resource [-t type] [-o operation] | -l [-a])\n\n"
           "\t-C file\t\tload configuration file\n"
           "\t-d database\tSQLite database with users and resources\n"
           "\t-v num\t\tverbosity level (name or 0-7, default: warning)\n"
           "\t-j\t\tprint the decision as JSON\n"
           "\t-u user\t\tuser to check\n"
           "\t-r resource\tresource to check\n"
           "\t-t type\t\tresource type (default: DOCUMENT)\n"
           "\t-o operation\tcreate, read, update or delete (default: read)\n"
           "\t-l\t\tlist resources visible to user\n"
           "\t-a\t\tinclude archived resources in list\n",
    program, version, program );
}

static bool
load_config(famacl_config::parser &parser, const std::string &filename) {
  std::fstream cf(filename, std::ios_base::in);
  if (!cf) {
    std::cerr << "Cannot open config file '" << filename << "'" << std::endl;
    return false;
  }
  if (!parser.parse(cf)) {
    std::cerr << "Invalid configuration: " << parser.error() << std::endl;
    return false;
  }
  return true;
}

static void
print_decision(const famacl::Decision &d) {
  std::cout << "level:   " << d.rules.accessLevel << std::endl;
  for (const auto &rule : d.rules.matchedRules) {
    std::cout << "  " << rule.accessLevel << "\t" << rule.condition.describe();
    if (!rule.description.empty())
      std::cout << "\t" << rule.description;
    std::cout << std::endl;
  }
  std::cout << "rules:   " << (d.ruleAllows ? "allow" : "deny") << std::endl
            << "gate:    " << (d.gateAllows ? "allow" : "deny") << std::endl
            << "verdict: " << (d.allowed ? "allowed" : "denied") << std::endl;
}

int
main(int argc, char **argv) {
  using namespace famacl;
  int opt;
  famacl_config::parser parser;
  std::string config_file;
  std::optional<std::string> dbname;
  std::optional<famacl_log_t> log_level;
  std::string user;
  std::optional<std::string> resource;
  ResourceType type = ResourceType::DOCUMENT;
  Operation op = Operation::READ;
  bool json = false;
  bool list = false;
  ResourceFilter filter;

  while ((opt = getopt(argc, argv, "aC:d:jlo:r:t:u:v:")) != -1) {
    switch (opt) {
    case 'a':
      filter.includeArchived = true;
      break;
    case 'C':
      config_file = optarg;
      break;
    case 'd':
      dbname = optarg;
      break;
    case 'j':
      json = true;
      break;
    case 'l':
      list = true;
      break;
    case 'o':
      if (!parse(optarg, op)) {
        std::cerr << "Unknown operation '" << optarg << "'" << std::endl;
        exit(EXIT_USAGE);
      }
      break;
    case 'r':
      resource = optarg;
      break;
    case 't':
      if (!parse(optarg, type)) {
        std::cerr << "Unknown resource type '" << optarg << "'" << std::endl;
        exit(EXIT_USAGE);
      }
      break;
    case 'u':
      user = optarg;
      break;
    case 'v': {
      famacl_log_t level;
      if (!famacl_parse_log_level(optarg, level)) {
        std::cerr << "Invalid log level '" << optarg << "'" << std::endl;
        exit(EXIT_USAGE);
      }
      log_level = level;
      break;
    }
    default:
      usage(argv[0], LIBFAMACL_PACKAGE_VERSION);
      exit(EXIT_USAGE);
    }
  }

  if (user.empty() || (list == resource.has_value())) {
    usage(argv[0], LIBFAMACL_PACKAGE_VERSION);
    exit(EXIT_USAGE);
  }

  if (log_level)
    famacl_set_log_level(*log_level);

  if (config_file.empty())
    config_file = famacl_config::getDefaultConfigFile();
  if (!config_file.empty() && !load_config(parser, config_file))
    exit(EXIT_USAGE);

  /* command line takes precedence over the configuration file */
  if (parser.log_level && !log_level)
    famacl_set_log_level(*parser.log_level);
  if (!dbname)
    dbname = parser.database;
  if (!dbname) {
    std::cerr << "No database given" << std::endl;
    exit(EXIT_USAGE);
  }

  RuleSetRegistry registry = defaultRuleSetRegistry();
  parser.apply(registry);

  SqliteStore store{*dbname};
  if (!store) {
    std::cerr << "Cannot open database '" << *dbname << "': "
              << (store.errmsg() ? store.errmsg() : "unknown error") << std::endl;
    exit(EXIT_LOOKUP);
  }

  AccessDecisionEngine engine{registry};
  ResourceVisibilityGate gate{store, store, store};

  if (list) {
    UserRecord record;
    const result_t res = store.lookupUser(user, record);
    if (res != FAMACL_OK) {
      std::cerr << "Cannot look up user '" << user << "': "
                << result_string(res) << std::endl;
      exit(EXIT_LOOKUP);
    }
    for (const auto &r : gate.listVisible(store, record.id, record.role, filter)) {
      std::cout << r.id << "\t" << r.visibility << "\t" << r.status << std::endl;
    }
    return store ? EXIT_ALLOWED : EXIT_LOOKUP;
  }

  Authorizer authorizer{engine, gate, store, store};
  AccessEvent last;
  authorizer.setEventSink([&last](const AccessEvent &event) { last = event; });

  Decision decision;
  result_t res = authorizer.authorize(user, *resource, type, op, &decision);
  switch (res) {
  case FAMACL_OK:
  case FAMACL_ERROR_UNAUTHORIZED:
    if (json)
      std::cout << toJson(last) << std::endl;
    else
      print_decision(decision);
    return res == FAMACL_OK ? EXIT_ALLOWED : EXIT_DENIED;
  default:
    std::cerr << "Cannot check " << user << " on " << *resource << ": "
              << result_string(res) << std::endl;
    return EXIT_LOOKUP;
  }
}
