/*
 * config_parser.hh -- YAML configuration of rule tables
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_CONFIG_PARSER_HH
#define FAMACL_CONFIG_PARSER_HH 1

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

#include "famacl/debug.hh"
#include "famacl/rule.hh"

namespace famacl_config {

std::string getDefaultConfigFile(void);

/** Semantic error in an otherwise well-formed configuration. */
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Reads a configuration like
 *
 *   log-level: info
 *   database: /var/lib/famacl/famacl.db
 *   rules:
 *     - resource: DOCUMENT
 *       rules:
 *         - condition: isAdmin
 *           level: ADMIN
 *           description: Administrators have full access
 *         - condition: { and: [ isFamilyAdmin, isFamilyMember ] }
 *           level: WRITE
 *
 * The rule tables are collected first and only handed to a registry
 * by apply(), so that a broken file never leaves a registry half
 * configured.
 */
class parser {
public:
  using RuleTables = std::map<famacl::ResourceType, famacl::RuleSet>;

  ~parser(void);

  bool parse(std::istream& input);
  bool parseFile(const std::string &filename);

  bool have_config(void) const { return (bool)config_root; }

  /**
   * Replaces the rule set of every resource type listed in the
   * configuration. Types that are not listed keep their rules.
   * Must only be called at configuration time.
   */
  void apply(famacl::RuleSetRegistry &registry) const;

  /** Error message of the last failed parse() or parseFile(). */
  const std::string &error(void) const { return last_error; }

  std::optional<famacl_log_t> log_level;
  std::optional<std::string> database;
  RuleTables rulebase;
protected:
  std::unique_ptr<YAML::Node> config_root;
  std::string last_error;

  bool load(void);
  void readLogLevel(void);
  void readDatabase(void);
  void readRules(void);
};

/**
 * Converts a YAML condition node into a Condition. A scalar names a
 * leaf, a map with the single key "and", "or" or "not" a
 * combinator. Throws ConfigError on unknown names, malformed
 * combinators or nesting deeper than FAMACL_MAX_CONDITION_DEPTH.
 */
famacl::Condition readCondition(const YAML::Node &node, std::size_t depth = 1);

} /* namespace famacl_config */

#endif /* FAMACL_CONFIG_PARSER_HH */
