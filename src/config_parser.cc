/*
 * config_parser.cc -- YAML configuration of rule tables
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>

#include "famacl/libfamacl.hh"
#include "famacl/config_parser.hh"

namespace famacl_config {
using famacl::Condition;

std::string
getDefaultConfigFile(void) {
  char *home = getenv("HOME");
  std::filesystem::path root{"/"};
  std::error_code err;

  if (home) { /* check if $HOME/.famaclrc or $HOME/.local/famacl/famaclrc exists */
    /* these are the paths under $HOME to search for the config file */
    static const char *local_searchpaths[] = { ".famaclrc", ".local/famacl/famaclrc" };

    for (size_t idx=0; idx < sizeof(local_searchpaths)/sizeof(local_searchpaths[0]); idx++) {
      std::filesystem::path path{std::filesystem::path{home}/local_searchpaths[idx]};
      if (std::filesystem::exists(path, err)) {
        return path;
      }
    }
  }
  if (std::filesystem::exists(root/"etc/famaclrc", err)) {
    return root/"etc/famaclrc";
  }
  return "";
}

/* explicitly define destructor to avoid inlining warning */
parser::~parser(void) {
}

static Condition
leaf(Condition::Kind kind) {
  switch (kind) {
  case Condition::Kind::IS_ADMIN: return Condition::isAdmin();
  case Condition::Kind::IS_OWNER: return Condition::isOwner();
  case Condition::Kind::IS_FAMILY_MEMBER: return Condition::isFamilyMember();
  case Condition::Kind::IS_FAMILY_ADMIN: return Condition::isFamilyAdmin();
  case Condition::Kind::IS_PUBLIC: return Condition::isPublic();
  case Condition::Kind::IS_SYSTEM_RESOURCE: return Condition::isSystemResource();
  case Condition::Kind::AND:
  case Condition::Kind::OR:
  case Condition::Kind::NOT:
    break;
  }
  throw ConfigError(std::string{"'"} + famacl::toString(kind) + "' needs operands");
}

Condition
readCondition(const YAML::Node &node, std::size_t depth) {
  if (depth > FAMACL_MAX_CONDITION_DEPTH)
    throw ConfigError("condition nested deeper than "
                      + std::to_string(FAMACL_MAX_CONDITION_DEPTH) + " levels");

  Condition::Kind kind;
  if (node.IsScalar()) {
    const auto name = node.as<std::string>();
    if (!famacl::parse(name, kind))
      throw ConfigError("unknown condition '" + name + "'");
    return leaf(kind);
  }

  if (!node.IsMap() || node.size() != 1)
    throw ConfigError("condition must be a name or a map with a single key");

  const auto entry = *node.begin();
  const auto name = entry.first.as<std::string>();
  if (!famacl::parse(name, kind))
    throw ConfigError("unknown condition '" + name + "'");

  const YAML::Node &operands = entry.second;
  switch (kind) {
  case Condition::Kind::AND:
  case Condition::Kind::OR: {
    if (!operands.IsSequence())
      throw ConfigError("'" + name + "' expects a list of conditions");
    std::vector<Condition> children;
    for (const auto &c : operands)
      children.push_back(readCondition(c, depth + 1));
    return kind == Condition::Kind::AND ? Condition::allOf(std::move(children))
      : Condition::anyOf(std::move(children));
  }
  case Condition::Kind::NOT:
    if (operands.IsSequence()) {
      if (operands.size() != 1)
        throw ConfigError("'not' expects exactly one condition");
      return Condition::negate(readCondition(operands[0], depth + 1));
    }
    return Condition::negate(readCondition(operands, depth + 1));
  case Condition::Kind::IS_ADMIN:
  case Condition::Kind::IS_OWNER:
  case Condition::Kind::IS_FAMILY_MEMBER:
  case Condition::Kind::IS_FAMILY_ADMIN:
  case Condition::Kind::IS_PUBLIC:
  case Condition::Kind::IS_SYSTEM_RESOURCE:
    break;
  }
  throw ConfigError("'" + name + "' does not take operands");
}

void
parser::readLogLevel(void) {
  if (auto level = (*config_root)["log-level"]) {
    famacl_log_t value;
    const auto name = level.as<std::string>();
    if (!famacl_parse_log_level(name, value))
      throw ConfigError("invalid log-level '" + name + "'");
    log_level = value;
  }
}

void
parser::readDatabase(void) {
  if (auto db = (*config_root)["database"]) {
    database = db.as<std::string>();
  }
}

static famacl::AccessRule
readRule(const YAML::Node &rule) {
  if (!rule.IsMap())
    throw ConfigError("rule must be a map");

  auto condition = rule["condition"];
  auto level = rule["level"];
  auto description = rule["description"];
  if (!condition.IsDefined() || !level.IsDefined())
    throw ConfigError("rule needs condition and level");

  famacl::AccessLevel accessLevel;
  const auto name = level.as<std::string>();
  if (!famacl::parse(name, accessLevel))
    throw ConfigError("unknown access level '" + name + "'");

  famacl::AccessRule r{readCondition(condition), accessLevel, ""};
  if (description.IsDefined())
    r.description = description.as<std::string>();
  return r;
}

void
parser::readRules(void) {
  if (auto tables = (*config_root)["rules"]) {
    if (!tables.IsSequence())
      throw ConfigError("rules must be a list");

    for (const auto &table : tables) {
      if (!table.IsMap())
        throw ConfigError("rule table must be a map");

      auto resource = table["resource"];
      auto rules = table["rules"];
      if (!resource.IsDefined() || !rules.IsSequence())
        throw ConfigError("rule table needs resource and a list of rules");

      famacl::ResourceType type;
      const auto name = resource.as<std::string>();
      if (!famacl::parse(name, type))
        throw ConfigError("unknown resource type '" + name + "'");
      if (rulebase.count(type))
        throw ConfigError("duplicate rule table for " + name);

      famacl::RuleSet &ruleset = rulebase[type];
      for (const auto &rule : rules)
        ruleset.push_back(readRule(rule));

      famacl_log(FAMACL_LOG_DEBUG, "read %zu rules for %s\n", ruleset.size(), name.c_str());
    }
  }
}

/* Reads all sections into a fresh state and commits it only if
 * nothing has thrown. */
bool
parser::load(void) {
  parser next;
  next.config_root = std::move(config_root);
  if (!next.config_root->IsMap() && !next.config_root->IsNull())
    throw ConfigError("configuration must be a map");

  if (next.config_root->IsMap()) {
    next.readLogLevel();
    next.readDatabase();
    next.readRules();
  }

  config_root = std::move(next.config_root);
  log_level = next.log_level;
  database = std::move(next.database);
  rulebase = std::move(next.rulebase);
  last_error.clear();
  return true;
}

bool
parser::parse(std::istream& input) {
  std::unique_ptr<YAML::Node> previous = std::move(config_root);
  try {
    config_root = std::make_unique<YAML::Node>(YAML::Load(input));
    return load();
  }
  catch (const YAML::Exception& ex) {
    last_error = ex.what();
  }
  catch (const ConfigError& ex) {
    last_error = ex.what();
  }
  config_root = std::move(previous);
  famacl_log(FAMACL_LOG_ERR, "invalid configuration: %s\n", last_error.c_str());
  return false;
}

bool
parser::parseFile(const std::string &filename) {
  std::unique_ptr<YAML::Node> previous = std::move(config_root);
  try {
    config_root = std::make_unique<YAML::Node>(YAML::LoadFile(filename));
    return load();
  }
  catch (const YAML::BadFile&) {
    last_error = "cannot read " + filename;
  }
  catch (const YAML::Exception& ex) {
    last_error = filename + ": " + ex.what();
  }
  catch (const ConfigError& ex) {
    last_error = filename + ": " + ex.what();
  }
  config_root = std::move(previous);
  famacl_log(FAMACL_LOG_ERR, "invalid configuration: %s\n", last_error.c_str());
  return false;
}

void
parser::apply(famacl::RuleSetRegistry &registry) const {
  for (const auto &table : rulebase) {
    famacl_log(FAMACL_LOG_INFO, "configure %zu rules for %s\n",
               table.second.size(), famacl::toString(table.first));
    registry.setRules(table.first, table.second);
  }
}

} /* namespace famacl_config */
