/*
 * sqlite_store.cc -- SQLite backed user, resource, share and assignment store
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#include <map>
#include <string>
#include <utility>

#include <sqlite3.h>

#include "famacl/debug.hh"
#include "famacl/sqlite_store.hh"

namespace famacl {
using ::std::string;
using ::std::map;
using ::std::pair;

/** A prepared statement that is finalized when it goes out of scope. */
class SqliteStore::Statement {
public:
  Statement(sqlite3 *db, const string &sql) : db(db) {
    code = db ? sqlite3_prepare_v2(db, sql.c_str(), sql.size() + 1, &stmt, nullptr)
      : SQLITE_MISUSE;
    if (code != SQLITE_OK)
      famacl_log(FAMACL_LOG_ERR, "cannot prepare \"%s\": %s\n", sql.c_str(),
                 db ? sqlite3_errmsg(db) : "no database");
  }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  ~Statement(void) { sqlite3_finalize(stmt); }

  operator bool(void) const { return stmt && (code == SQLITE_OK); }

  bool bind(int idx, const string &value) {
    return check(sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT));
  }

  bool bind(int idx, const std::optional<string> &value) {
    return value ? bind(idx, *value) : check(sqlite3_bind_null(stmt, idx));
  }

  bool bind(int idx, int value) {
    return check(sqlite3_bind_int(stmt, idx, value));
  }

  bool bind(const std::vector<string> &params) {
    int idx = 1;
    for (const auto &p : params) {
      if (!bind(idx++, p))
        return false;
    }
    return true;
  }

  /** Returns SQLITE_ROW, SQLITE_DONE or an error code. */
  int step(void) {
    code = sqlite3_step(stmt);
    if ((code != SQLITE_ROW) && (code != SQLITE_DONE))
      famacl_log(FAMACL_LOG_ERR, "step returned %d: %s\n", code, sqlite3_errmsg(db));
    return code;
  }

  int result(void) const { return code; }

  string text(int col) const {
    const unsigned char *s = sqlite3_column_text(stmt, col);
    return s ? string{reinterpret_cast<const char *>(s)} : string{};
  }

  std::optional<string> optionalText(int col) const {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
      return std::nullopt;
    return text(col);
  }

  int integer(int col) const { return sqlite3_column_int(stmt, col); }

private:
  bool check(int rc) {
    code = rc;
    return rc == SQLITE_OK;
  }

  sqlite3 *db;
  sqlite3_stmt *stmt = nullptr;
  int code;
};

const map<string, string> SqliteStore::tables{
  pair{ "users",
        "id TEXT PRIMARY KEY, role TEXT NOT NULL, family_id TEXT, family_role TEXT" },
  pair{ "resources",
        "id TEXT PRIMARY KEY, created_by TEXT NOT NULL, family_id TEXT, "
        "visibility TEXT NOT NULL, is_system_generated INTEGER NOT NULL DEFAULT 0, "
        "status TEXT NOT NULL" },
  pair{ "resource_shares",
        "resource_id TEXT NOT NULL, user_id TEXT NOT NULL, "
        "UNIQUE (resource_id, user_id)" },
  pair{ "template_assignments",
        "resource_id TEXT NOT NULL, assignee_id TEXT NOT NULL, "
        "UNIQUE (resource_id, assignee_id)" }
};

SqliteStore::SqliteStore(const string &dbname) {
  open(dbname);
}

SqliteStore::~SqliteStore(void) {
  if (db) {
    sqlite3_close_v2(db);
    db = nullptr;
  }
}

bool
SqliteStore::open(const string &dbname) {
  status = sqlite3_open_v2(dbname.c_str(), &db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (status != SQLITE_OK) {
    famacl_log(FAMACL_LOG_ERR, "cannot open database %s: %s\n", dbname.c_str(),
               db ? sqlite3_errmsg(db) : "out of memory");
    sqlite3_close_v2(db);
    db = nullptr;
    return false;
  }

  famacl_log(FAMACL_LOG_DEBUG, "opened database %s\n", dbname.c_str());
  for (const auto &table : tables) {
    if (!create_table(table.first, table.second))
      return false;
  }
  return true;
}

SqliteStore::operator bool(void) const {
  return db && ((status == SQLITE_OK)
                || (status == SQLITE_DONE)
                || (status == SQLITE_ROW));
}

const char *
SqliteStore::errmsg(void) const {
  return db ? sqlite3_errmsg(db) : nullptr;
}

bool
SqliteStore::create_table(const string &table, const string &field_def) {
  return execute("create table if not exists " + table + " (" + field_def + ")", {});
}

bool
SqliteStore::execute(const string &sql, const std::vector<string> &params) const {
  Statement stmt{db, sql};
  if (!stmt || !stmt.bind(params)) {
    status = stmt.result();
    return false;
  }
  status = stmt.step();
  if (status == SQLITE_DONE)
    status = SQLITE_OK;
  return status == SQLITE_OK;
}

bool
SqliteStore::exists(const string &sql, const std::vector<string> &params) const {
  Statement stmt{db, sql};
  if (!stmt || !stmt.bind(params)) {
    status = stmt.result();
    return false;
  }
  status = stmt.step();
  return status == SQLITE_ROW;
}

bool
SqliteStore::addUser(const UserRecord &user) {
  famacl_log(FAMACL_LOG_DEBUG, "add user %s (%s)\n", user.id.c_str(), toString(user.role));

  Statement stmt{db, "insert or replace into users (id, role, family_id, family_role) "
                     "values (?, ?, ?, ?)"};
  std::optional<string> familyRole;
  if (user.familyRole)
    familyRole = toString(*user.familyRole);

  if (!stmt
      || !stmt.bind(1, user.id)
      || !stmt.bind(2, string{toString(user.role)})
      || !stmt.bind(3, user.familyId)
      || !stmt.bind(4, familyRole)) {
    status = stmt.result();
    return false;
  }
  status = stmt.step();
  return status == SQLITE_DONE;
}

bool
SqliteStore::addResource(const Resource &resource) {
  famacl_log(FAMACL_LOG_DEBUG, "add resource %s\n", resource.id.c_str());

  Statement stmt{db, "insert or replace into resources "
                     "(id, created_by, family_id, visibility, is_system_generated, status) "
                     "values (?, ?, ?, ?, ?, ?)"};
  if (!stmt
      || !stmt.bind(1, resource.id)
      || !stmt.bind(2, resource.createdBy)
      || !stmt.bind(3, resource.familyId)
      || !stmt.bind(4, string{toString(resource.visibility)})
      || !stmt.bind(5, resource.isSystemGenerated ? 1 : 0)
      || !stmt.bind(6, string{toString(resource.status)})) {
    status = stmt.result();
    return false;
  }
  status = stmt.step();
  return status == SQLITE_DONE;
}

bool
SqliteStore::addShare(const ResourceId &resource, const UserId &user) {
  return execute("insert or ignore into resource_shares (resource_id, user_id) "
                 "values (?, ?)", { resource, user });
}

bool
SqliteStore::addAssignment(const ResourceId &resource, const UserId &assignee) {
  if (!execute("insert or ignore into template_assignments (resource_id, assignee_id) "
               "values (?, ?)", { resource, assignee }))
    return false;

  if (sqlite3_changes(db) == 0) {
    famacl_log(FAMACL_LOG_INFO, "%s is already assigned to %s\n",
               resource.c_str(), assignee.c_str());
    return false;
  }
  return true;
}

result_t
SqliteStore::lookupUser(const UserId &id, UserRecord &user) const {
  Statement stmt{db, "select role, family_id, family_role from users where id = ?"};
  if (!stmt || !stmt.bind(1, id)) {
    status = stmt.result();
    return FAMACL_ERROR_STORAGE;
  }
  status = stmt.step();
  if (status == SQLITE_DONE)
    return FAMACL_ERROR_NOT_FOUND;
  if (status != SQLITE_ROW)
    return FAMACL_ERROR_STORAGE;

  UserRecord record;
  record.id = id;
  record.familyId = stmt.optionalText(1);
  if (!parse(stmt.text(0), record.role)) {
    famacl_log(FAMACL_LOG_WARNING, "user %s has invalid role %s\n",
               id.c_str(), stmt.text(0).c_str());
    return FAMACL_ERROR_STORAGE;
  }
  if (auto name = stmt.optionalText(2)) {
    FamilyRole role;
    if (parse(*name, role))
      record.familyRole = role;
    else
      famacl_log(FAMACL_LOG_WARNING, "user %s has invalid family role %s\n",
                 id.c_str(), name->c_str());
  }
  user = std::move(record);
  return FAMACL_OK;
}

/* Reads the columns id, created_by, family_id, visibility,
 * is_system_generated, status. Returns false for malformed rows. */
template <typename S>
static bool
readResource(const S &stmt, Resource &r) {
  r.id = stmt.text(0);
  r.createdBy = stmt.text(1);
  r.familyId = stmt.optionalText(2);
  r.isSystemGenerated = stmt.integer(4) != 0;
  if (!parse(stmt.text(3), r.visibility) || !parse(stmt.text(5), r.status)) {
    famacl_log(FAMACL_LOG_WARNING, "resource %s has invalid visibility or status\n",
               r.id.c_str());
    return false;
  }
  return true;
}

static const char resourceColumns[] =
  "r.id, r.created_by, r.family_id, r.visibility, r.is_system_generated, r.status";

result_t
SqliteStore::lookupResource(const ResourceId &id, Resource &resource) const {
  Statement stmt{db, string{"select "} + resourceColumns + " from resources r where r.id = ?"};
  if (!stmt || !stmt.bind(1, id)) {
    status = stmt.result();
    return FAMACL_ERROR_STORAGE;
  }
  status = stmt.step();
  if (status == SQLITE_DONE)
    return FAMACL_ERROR_NOT_FOUND;
  if (status != SQLITE_ROW)
    return FAMACL_ERROR_STORAGE;

  Resource r;
  if (!readResource(stmt, r))
    return FAMACL_ERROR_STORAGE;
  resource = std::move(r);
  return FAMACL_OK;
}

std::vector<Resource>
SqliteStore::listResources(const Predicate &visible,
                           const ResourceFilter &filter) const {
  SqlCondition where = compileSql(visible, "r");
  string sql = string{"select "} + resourceColumns + " from resources r where " + where.sql;

  if (filter.createdBy) {
    sql += " and r.created_by = ?";
    where.params.push_back(*filter.createdBy);
  }
  if (filter.familyId) {
    sql += " and r.family_id = ?";
    where.params.push_back(*filter.familyId);
  }
  if (filter.status) {
    sql += " and r.status = ?";
    where.params.push_back(toString(*filter.status));
  } else if (!filter.includeArchived) {
    sql += " and r.status <> ?";
    where.params.push_back(toString(ResourceStatus::ARCHIVED));
  }
  if (filter.isSystemGenerated)
    sql += *filter.isSystemGenerated ? " and r.is_system_generated <> 0"
      : " and r.is_system_generated = 0";

  sql += " order by r.id limit " + std::to_string(filter.pageSize())
    + " offset " + std::to_string(filter.offset());

  famacl_log(FAMACL_LOG_DEBUG, "%s\n", sql.c_str());

  std::vector<Resource> result;
  Statement stmt{db, sql};
  if (!stmt || !stmt.bind(where.params)) {
    status = stmt.result();
    return result;
  }

  while ((status = stmt.step()) == SQLITE_ROW) {
    Resource r;
    if (readResource(stmt, r))
      result.push_back(std::move(r));
  }
  if (status == SQLITE_DONE)
    status = SQLITE_OK;
  return result;
}

bool
SqliteStore::shareExists(const ResourceId &resource, const UserId &user) const {
  return exists("select 1 from resource_shares where resource_id = ? and user_id = ?",
                { resource, user });
}

bool
SqliteStore::assignmentExists(const ResourceId &resource,
                              const UserId &assignee) const {
  return exists("select 1 from template_assignments "
                "where resource_id = ? and assignee_id = ?",
                { resource, assignee });
}

} /* namespace famacl */
