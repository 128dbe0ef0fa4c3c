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

#include <compdb/pgresult_handle.hpp>
#include <compdb/pgconn_handle.hpp>
#include <compdb/pg_exception.hpp>

using namespace compdb;

static void
do_check(PGresult *raw)
{
  if (raw == nullptr) {
    throw pg_exception(raw);
  }
  switch (PQresultStatus(raw)) {
  case PGRES_EMPTY_QUERY:
  case PGRES_COMMAND_OK:
  case PGRES_TUPLES_OK:
  case PGRES_SINGLE_TUPLE:
    return;
  default:
    throw pg_exception(raw);
  }
}

// Takes ownership of NEWRAW and checks it.  Frees NEWRAW if it
// represents an error.
static void
checked_take(PGresult *newraw)
{
  try {
    do_check(newraw);
  } catch (pg_exception &) {
    PQclear(newraw);
    throw;
  }
}

pgresult_handle::pgresult_handle(PGresult *newraw)
{
  checked_take(newraw);
  raw = newraw;
}

void
pgresult_handle::check()
{
  do_check(raw);
}

void
pgresult_handle::reset(PGresult *newraw)
{
  checked_take(newraw);
  PQclear(raw);
  raw = newraw;
}

bool
pgresult_handle::getresult(pgconn_handle &h)
{
  PGresult *newraw = PQgetResult(h.get());
  if (newraw == nullptr) {
    close();
    return false;
  }
  reset(newraw);
  return true;
}

void
pgresult_handle::exec(pgconn_handle &conn, const char *command)
{
  PGresult *newraw = PQexec(conn.get(), command);
  reset(newraw);
}

void
pgresult_handle::execParamsCustom(pgconn_handle &conn,
			const char *command,
			int nParams,
			const Oid *paramTypes,
			const char *const * paramValues,
			const int *paramLengths,
			const int *paramFormats,
			int resultFormat)
{
  PGresult *newraw = PQexecParams(conn.get(), command, nParams, paramTypes,
				  paramValues, paramLengths, paramFormats,
				  resultFormat);
  reset(newraw);
}
