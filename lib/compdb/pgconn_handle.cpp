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

#include <compdb/pgconn_handle.hpp>
#include <compdb/pg_exception.hpp>

using namespace compdb;

static void
do_check(PGconn *raw)
{
  if (raw == NULL || PQstatus(raw) != CONNECTION_OK) {
    pg_exception e(raw);
    PQfinish(raw);
    throw e;
  }
}

pgconn_handle::pgconn_handle(PGconn *c)
{
  do_check(c);
  raw = c;
}

void
pgconn_handle::reset(PGconn *c)
{
  do_check(c);
  close();
  raw = c;
}

void
pgconn_handle::sendQueryParams(const char *command,
			       int nParams,
			       const Oid *paramTypes,
			       const char *const * paramValues,
			       const int *paramLengths,
			       const int *paramFormats,
			       int resultFormat)
{
  if (PQsendQueryParams(raw, command, nParams, paramTypes, paramValues,
			paramLengths, paramFormats, resultFormat) == 0) {
    throw pg_exception(raw);
  }
}

void
pgconn_handle::setSingleRowMode()
{
  if (PQsetSingleRowMode(raw) == 0) {
    throw pg_exception("could not activate single-row mode");
  }
}
