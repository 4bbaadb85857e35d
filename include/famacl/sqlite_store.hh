/*
 * sqlite_store.hh -- SQLite backed user, resource, share and assignment store
 *
 * Copyright (C) 2018-2021 Olaf Bergmann <bergmann@tzi.org>
 *
 * This file is part of the famacl library libfamacl. Please see README
 * for terms of use.
 */

#ifndef FAMACL_SQLITE_STORE_HH
#define FAMACL_SQLITE_STORE_HH 1

#include <map>
#include <string>
#include <vector>

#include "famacl/predicate.hh"
#include "famacl/resource.hh"

struct sqlite3;
struct sqlite3_stmt;

namespace famacl {

/**
 * Stores users, resources, shares and template assignments in an
 * SQLite database. Missing tables are created when the database is
 * opened. List queries translate the visibility predicate into the
 * WHERE clause with compileSql().
 *
 * A store is not copyable. All functions record the SQLite result
 * code that operator bool() and errmsg() report.
 */
class SqliteStore : public UserDirectory,
                    public ResourceStore,
                    public ShareStore,
                    public AssignmentStore {
public:
  /**
   * Opens or creates the database @p dbname. Use ":memory:" for a
   * private in-memory database.
   */
  explicit SqliteStore(const std::string &dbname);
  SqliteStore(const SqliteStore &) = delete;
  SqliteStore(const SqliteStore &&) = delete;
  ~SqliteStore(void);

  SqliteStore &operator=(const SqliteStore &) = delete;
  SqliteStore &operator=(const SqliteStore &&) = delete;

  /** Returns true if the database is open and the last call succeeded. */
  operator bool(void) const;
  const char *errmsg(void) const;

  bool addUser(const UserRecord &user);
  bool addResource(const Resource &resource);
  bool addShare(const ResourceId &resource, const UserId &user);

  /**
   * Assigns the template @p resource to @p assignee. Returns false if
   * the pair already exists or cannot be stored.
   */
  bool addAssignment(const ResourceId &resource, const UserId &assignee);

  result_t lookupUser(const UserId &id, UserRecord &user) const override;
  result_t lookupResource(const ResourceId &id, Resource &resource) const override;
  std::vector<Resource> listResources(const Predicate &visible,
                                      const ResourceFilter &filter) const override;
  bool shareExists(const ResourceId &resource, const UserId &user) const override;
  bool assignmentExists(const ResourceId &resource,
                        const UserId &assignee) const override;

private:
  class Statement;

  static const std::map<std::string, std::string> tables;

  bool open(const std::string &dbname);
  bool create_table(const std::string &table, const std::string &field_def);
  bool execute(const std::string &sql, const std::vector<std::string> &params) const;
  bool exists(const std::string &sql, const std::vector<std::string> &params) const;

  sqlite3 *db = nullptr;
  mutable int status = 0;
};

} /* namespace famacl */

#endif /* FAMACL_SQLITE_STORE_HH */
