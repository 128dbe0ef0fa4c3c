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

#include <libpq-fe.h>

namespace compdb {

class pgconn_handle;

// Wrapper around a PostgreSQL result object (PGresult).
class pgresult_handle {
  pgresult_handle(const pgresult_handle &) = delete;
  pgresult_handle &operator=(const pgresult_handle &) = delete;
  PGresult *raw;
public:

  // Initializes the raw pointer to NULL.
  pgresult_handle() throw();

  // Initializes the raw pointer with PGRESULT, taking ownership.
  // Throws pg_exception on error, freeing the result.
  explicit pgresult_handle(PGresult *);

  // Deallocates the raw pointer (if it is not NULL).
  ~pgresult_handle() throw();

  // Throws pg_exception if the raw pointer is NULL or in an error
  // state.
  void check();

  // Returns the raw pointer.
  PGresult *get() throw();

  // Returns the connection handle and sets the raw pointer to NULL,
  // releasing ownership of the handle.
  PGresult *release() throw();

  // Replaces the raw pointer with PGRESULT, closing it first if
  // necessary.  Throws pg_exception on error, freeing the new result
  // (and preserving the old one).
  void reset(PGresult *);

  // Calls PQgetResult().  Returns false and closes the current result
  // if there are no more results for the current query.  Otherwise,
  // replaces the current result and returns true.  Throws
  // pg_exception on error.
  bool getresult(pgconn_handle &);

  // Closes the connection handle and sets the raw pointer to NULL.
  void close() throw();

  // Calls PQntuples().
  int ntuples() const throw();

  // Calls PQgetvalue().  Counting of rows and columns starts at 0.
  const char *getvalue(int row, int column) const throw();

  // Calls PQgetisnull().  Counting of rows and columns starts at 0.
  bool getisnull(int row, int column) const throw();

  // Calls PQresultStatus().
  ExecStatusType resultStatus() const throw();

  // Calls PQexec().  Throws pg_exception on error.  Uses text mode
  // for the output.
  void exec(pgconn_handle &, const char *command);

  // Calls PQexecParam().  Throws pg_exception on error.
  void execParamsCustom(pgconn_handle &,
			const char *command,
			int nParams,
			const Oid *paramTypes,
			const char *const * paramValues,
			const int *paramLengths,
			const int *paramFormats,
			int resultFormat);
};

inline
pgresult_handle::pgresult_handle() throw()
  : raw(NULL)
{
}

inline
pgresult_handle::~pgresult_handle() throw()
{
  PQclear(raw);
}

inline PGresult *
pgresult_handle::get() throw ()
{
  return raw;
}

inline PGresult *
pgresult_handle::release() throw()
{
  PGresult *c = raw;
  raw = NULL;
  return c;
}

inline void
pgresult_handle::close() throw()
{
  PQclear(raw);
  raw = NULL;
}

inline int
pgresult_handle::ntuples() const throw ()
{
  return PQntuples(raw);
}

inline const char *
pgresult_handle::getvalue(int row, int column) const throw ()
{
  return PQgetvalue(raw, row, column);
}

inline bool
pgresult_handle::getisnull(int row, int column) const throw ()
{
  return PQgetisnull(raw, row, column);
}

inline ExecStatusType
pgresult_handle::resultStatus() const throw ()
{
  return PQresultStatus(raw);
}

} // namespace compdb
