/*
 * Copyright (C) 2023 Red Hat, Inc.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <compdb/candidate_source.hpp>
#include <compdb/component.hpp>
#include <compdb/taxonomy_scope.hpp>

#include <memory>
#include <string>

#include <libpq-fe.h>

namespace compdb {

// Database wrapper.
// Members of this class throw pg_exception on error.
class database {
  struct impl;
  std::shared_ptr<impl> impl_;

public:
  // Uses the environment to locate a database.
  database();

  // Uses a libpq connection string ("host=... dbname=...", or a
  // postgresql:// URI).
  explicit database(const char *conninfo);

  // Takes ownership of an existing connection.
  explicit database(PGconn *);

  ~database();

  // The database schema, as a sequence of PostgreSQL DDL statements.
  // The base schema lacks indexes.
  static const char SCHEMA_BASE[];
  static const char SCHEMA_INDEX[];

  void txn_begin();
  void txn_commit();
  void txn_rollback();

  // Starts a REPEATABLE READ, READ ONLY transaction, so that several
  // queries observe the same snapshot.
  void txn_begin_read_only();

  // Sets statement_timeout for the session (or the current
  // transaction, if one is active).  0 disables the timeout.
  void set_statement_timeout(unsigned milliseconds);

  // Creates the "compdb" database schema.
  void create_schema(bool base = true, bool index = true);

  // Executes the SQL statements (separated by ';').
  void exec_sql(const char *);

  // Creates or updates a node of the product hierarchy.  ACTIVE is
  // ignored for levels without an active flag.
  void intern_node(scope_type::type, const std::string &ofuri,
		   const std::string &name, bool active = true);

  // Returns true if the component was freshly added to the database.
  // In both cases, stores the component id in the last argument.
  bool intern_component(const component_identity &, const rpm_evr &,
			component_id &);

  // Links the component to the node.  Returns false if there is no
  // node with the ofuri.  Existing links are preserved.
  bool add_membership(scope_type::type, const std::string &ofuri,
		      const component_id &);

  // Reads components from the database.  Each cursor executes a
  // single statement, fetching rows one by one.  Only one cursor can
  // be active at a time on a database object.
  class source : public candidate_source {
    std::shared_ptr<database::impl> impl_;
    class cursor_impl;
  public:
    explicit source(database &);
    ~source();

    std::unique_ptr<cursor> candidates
      (const component_identity &, const taxonomy_scope &);
    std::unique_ptr<cursor> root_components(const taxonomy_scope &);
  };
};

} // namespace compdb
