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

#include <compdb/database.hpp>
#include <compdb/root_component.hpp>
#include <compdb/pgconn_handle.hpp>
#include <compdb/pgresult_handle.hpp>
#include <compdb/pg_exception.hpp>
#include <compdb/pg_query.hpp>
#include <compdb/pg_response.hpp>
#include <compdb/pg_split_statement.hpp>
#include <compdb/string_support.hpp>

#include <cstdio>

#include <libpq-fe.h>

using namespace compdb;

// Database table names

#define COMPONENT_TABLE "compdb.component"

//////////////////////////////////////////////////////////////////////
// database::impl

struct database::impl {
  pgconn_handle conn;

  // Set while a cursor is streaming rows over the connection.
  bool streaming;

  impl()
    : streaming(false)
  {
  }
};

//////////////////////////////////////////////////////////////////////
// database

// Include the schema.sql file.
const char database::SCHEMA_BASE[] = {
#include "schema-base.sql.inc"
  , 0
};

const char database::SCHEMA_INDEX[] = {
#include "schema-index.sql.inc"
  , 0
};

database::database()
  : impl_(new impl)
{
  impl_->conn.reset(PQconnectdb(""));
}

database::database(const char *conninfo)
  : impl_(new impl)
{
  impl_->conn.reset(PQconnectdb(conninfo));
}

database::database(PGconn *conn)
  : impl_(new impl)
{
  impl_->conn.reset(conn);
}

database::~database()
{
}

void
database::txn_begin()
{
  pgresult_handle res;
  res.exec(impl_->conn, "BEGIN");
}

void
database::txn_commit()
{
  pgresult_handle res;
  res.exec(impl_->conn, "COMMIT");
}

void
database::txn_rollback()
{
  pgresult_handle res;
  res.exec(impl_->conn, "ROLLBACK");
}

void
database::txn_begin_read_only()
{
  pgresult_handle res;
  res.exec(impl_->conn, "BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY");
}

void
database::set_statement_timeout(unsigned milliseconds)
{
  char buf[32];
  snprintf(buf, sizeof(buf), "%u", milliseconds);
  std::string value(buf);
  bool local = impl_->conn.transactionStatus() == PQTRANS_INTRANS;
  pgresult_handle res;
  pg_query(impl_->conn, res,
	   "SELECT set_config('statement_timeout', $1, $2)", value, local);
}

void
database::exec_sql(const char *command)
{
  // Split up long-running SQL statements so that it is easier to
  // determine progress.
  std::vector<std::string> stmts;
  pg_split_statement(command, stmts);
  pgresult_handle res;
  for (std::vector<std::string>::const_iterator
	 p = stmts.begin(), end = stmts.end(); p != end; ++p) {
    res.exec(impl_->conn, p->c_str());
  }
}

void
database::create_schema(bool base, bool index)
{
  txn_begin();
  if (base) {
    exec_sql(SCHEMA_BASE);
  }
  if (index) {
    exec_sql(SCHEMA_INDEX);
    // Root components are the only rows the latest queries look at.
    std::string sql("CREATE INDEX component_root_idx ON " COMPONENT_TABLE
		    " (type, name, arch) WHERE ");
    sql += root_component_condition(NULL);
    pgresult_handle res;
    res.exec(impl_->conn, sql.c_str());
  }
  txn_commit();
}

void
database::intern_node(scope_type::type type, const std::string &ofuri,
		      const std::string &name, bool active)
{
  const scope_traits &t(traits(type));
  std::string sql("INSERT INTO ");
  sql += t.node_table;
  pgresult_handle res;
  if (t.has_active) {
    sql += " (ofuri, name, active) VALUES ($1, $2, $3)"
      " ON CONFLICT (ofuri) DO UPDATE"
      " SET name = EXCLUDED.name, active = EXCLUDED.active";
    pg_query(impl_->conn, res, sql.c_str(), ofuri, name, active);
  } else {
    sql += " (ofuri, name) VALUES ($1, $2)"
      " ON CONFLICT (ofuri) DO UPDATE SET name = EXCLUDED.name";
    pg_query(impl_->conn, res, sql.c_str(), ofuri, name);
  }
}

bool
database::intern_component(const component_identity &identity,
			   const rpm_evr &evr, component_id &id)
{
  std::string ns(to_string(identity.ns));
  std::string uuid;
  pgresult_handle res;
  pg_query_binary
    (impl_->conn, res,
     "INSERT INTO " COMPONENT_TABLE
     " (namespace, name, type, arch, epoch, version, release)"
     " VALUES ($1, $2, $3, $4, $5, $6, $7)"
     " ON CONFLICT DO NOTHING RETURNING uuid::text",
     ns, identity.name, identity.type, identity.arch,
     evr.epoch, evr.version, evr.release);
  if (res.ntuples() == 1) {
    pg_response(res, 0, uuid);
    id = component_id(uuid);
    return true;
  }

  pg_query_binary
    (impl_->conn, res,
     "SELECT uuid::text FROM " COMPONENT_TABLE
     " WHERE namespace = $1 AND name = $2 AND type = $3 AND arch = $4"
     " AND epoch = $5 AND version = $6 AND release = $7",
     ns, identity.name, identity.type, identity.arch,
     evr.epoch, evr.version, evr.release);
  if (res.ntuples() != 1) {
    throw pg_exception("could not locate existing component: "
		       + quote(identity.name));
  }
  pg_response(res, 0, uuid);
  id = component_id(uuid);
  return false;
}

bool
database::add_membership(scope_type::type type, const std::string &ofuri,
			 const component_id &id)
{
  const scope_traits &t(traits(type));
  std::string sql("SELECT uuid::text FROM ");
  sql += t.node_table;
  sql += " WHERE ofuri = $1";
  pgresult_handle res;
  pg_query_binary(impl_->conn, res, sql.c_str(), ofuri);
  if (res.ntuples() == 0) {
    return false;
  }
  std::string node;
  pg_response(res, 0, node);

  sql = "INSERT INTO ";
  sql += t.membership_table;
  sql += " (component_uuid, node_uuid) VALUES ($1::uuid, $2::uuid)"
    " ON CONFLICT DO NOTHING";
  pg_query(impl_->conn, res, sql.c_str(), id.value(), node);
  return true;
}

//////////////////////////////////////////////////////////////////////
// database::source

// Returns the query for the components visible in the scope.  With
// BY_IDENTITY, the query has the parameters $1 = ofuri, $2 =
// namespace, $3 = name, $4 = type, $5 = arch.  Otherwise, there is
// only the ofuri parameter.
static std::string
component_query(const taxonomy_scope &scope, bool by_identity)
{
  const scope_traits &t(traits(scope.type));
  std::string sql("SELECT c.uuid::text, c.namespace, c.name, c.type, c.arch,"
		  " c.epoch, c.version, c.release FROM " COMPONENT_TABLE " c"
		  " JOIN ");
  sql += t.membership_table;
  sql += " m ON m.component_uuid = c.uuid JOIN ";
  sql += t.node_table;
  sql += " n ON n.uuid = m.node_uuid WHERE n.ofuri = $1";
  if (scope.active_only()) {
    sql += " AND n.active";
  }
  if (by_identity) {
    sql += " AND c.namespace = $2 AND c.name = $3"
      " AND c.type = $4 AND c.arch = $5";
  }
  sql += " AND ";
  sql += root_component_condition("c");
  return sql;
}

class database::source::cursor_impl : public candidate_source::cursor {
  std::shared_ptr<database::impl> impl_;
  pgresult_handle res_;
  bool done_;

  void check_idle();
  void activate();
  void discard() throw();
public:
  cursor_impl(const std::shared_ptr<database::impl> &,
	      const taxonomy_scope &);
  cursor_impl(const std::shared_ptr<database::impl> &,
	      const taxonomy_scope &, const component_identity &);
  ~cursor_impl();
  bool next(component_version &);
};

database::source::cursor_impl::cursor_impl
  (const std::shared_ptr<database::impl> &impl, const taxonomy_scope &scope)
  : impl_(impl), done_(false)
{
  check_idle();
  pg_send_query_binary(impl_->conn, component_query(scope, false).c_str(),
		       scope.ofuri);
  activate();
}

database::source::cursor_impl::cursor_impl
  (const std::shared_ptr<database::impl> &impl, const taxonomy_scope &scope,
   const component_identity &identity)
  : impl_(impl), done_(false)
{
  check_idle();
  std::string ns(to_string(identity.ns));
  pg_send_query_binary(impl_->conn, component_query(scope, true).c_str(),
		       scope.ofuri, ns, identity.name, identity.type,
		       identity.arch);
  activate();
}

void
database::source::cursor_impl::check_idle()
{
  if (impl_->streaming) {
    throw pg_exception("another database cursor is still active");
  }
}

// Called after the query has been sent.
void
database::source::cursor_impl::activate()
{
  impl_->streaming = true;
  try {
    impl_->conn.setSingleRowMode();
  } catch (pg_exception &) {
    discard();
    throw;
  }
}

// Stops the server from sending more rows, then consumes what is
// already in transit.
void
database::source::cursor_impl::discard() throw()
{
  PGconn *conn = impl_->conn.get();
  PGcancel *cancel = PQgetCancel(conn);
  if (cancel != NULL) {
    char errbuf[256];
    if (!PQcancel(cancel, errbuf, sizeof(errbuf))) {
      fprintf(stderr, "warning: could not cancel query: %s\n", errbuf);
    }
    PQfreeCancel(cancel);
  }
  while (PGresult *r = PQgetResult(conn)) {
    PQclear(r);
  }
  impl_->streaming = false;
}

database::source::cursor_impl::~cursor_impl()
{
  if (done_) {
    impl_->streaming = false;
  } else {
    discard();
  }
}

bool
database::source::cursor_impl::next(component_version &result)
{
  while (!done_) {
    // On error, the destructor discards the remaining results.
    if (!res_.getresult(impl_->conn)) {
      done_ = true;
      break;
    }
    if (res_.resultStatus() != PGRES_SINGLE_TUPLE) {
      // The zero-row result which terminates the result set.
      continue;
    }
    std::string uuid;
    std::string ns;
    pg_response(res_, 0, uuid, ns, result.identity.name,
		result.identity.type, result.identity.arch,
		result.evr.epoch, result.evr.version, result.evr.release);
    if (!parse_component_namespace(ns, result.identity.ns)) {
      throw pg_exception("invalid component namespace in database: "
			 + quote(ns));
    }
    result.id = component_id(uuid);
    return true;
  }
  return false;
}

database::source::source(database &db)
  : impl_(db.impl_)
{
}

database::source::~source()
{
}

std::unique_ptr<candidate_source::cursor>
database::source::candidates(const component_identity &identity,
			     const taxonomy_scope &scope)
{
  return std::unique_ptr<cursor>(new cursor_impl(impl_, scope, identity));
}

std::unique_ptr<candidate_source::cursor>
database::source::root_components(const taxonomy_scope &scope)
{
  return std::unique_ptr<cursor>(new cursor_impl(impl_, scope));
}
