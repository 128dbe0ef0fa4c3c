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

#include <compdb/pg_private.hpp>
#include <compdb/pg_exception.hpp>
#include <compdb/string_support.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>

#include <sstream>

using namespace compdb;

const Oid pg_private::dispatch<bool>::oid;
const int pg_private::dispatch<bool>::storage;

const Oid pg_private::dispatch<int>::oid;
const int pg_private::dispatch<int>::storage;

const Oid pg_private::dispatch<const char *>::oid;
const int pg_private::dispatch<const char *>::storage;

const Oid pg_private::dispatch<std::string>::oid;
const int pg_private::dispatch<std::string>::storage;

int
pg_private::length_check(size_t len)
{
  if (len >= INT_MAX) {
    throw pg_exception("argument string length exceeds maximum");
  }
  return len;
}

static inline bool
is_binary(PGresult *res, int col)
{
  switch (PQfformat(res, col)) {
  case 0:
    return false;
  case 1:
    return true;
  default:
    throw pg_exception("invalid format type");
  }
}

// Throws pg_exception after appending " column COL of row ROW" to the
// message.
static void throw_mismatch_exception(const char *msg, int row, int col)
  __attribute__((noreturn));
static void
throw_mismatch_exception(const char *msg, int row, int col)
{
    std::ostringstream str;
    str << msg << " column " << col << " of row " << row;
    throw pg_exception(str.str());
}

void
pg_private::dispatch<bool>::load(PGresult *res, int row, int col, bool &val)
{
  bool binary = is_binary(res, col);
  if (binary && (PQftype(res, col) != oid
		 || PQgetlength(res, row, col) != storage)) {
    throw_mismatch_exception("format mismatch for boolean", row, col);
  }
  if (PQgetisnull(res, row, col)) {
    throw_mismatch_exception("NULL value in non-null boolean", row, col);
  }
  const char *ptr = PQgetvalue(res, row, col);
  if (binary) {
    switch (*ptr) {
    case 0:
      val = false;
      break;
    case 1:
      val = true;
      break;
    default:
      throw_mismatch_exception("invalid binary value in boolean", row, col);
    }
  } else {
    switch (*ptr) {
    case 'f':
      val = false;
      break;
    case 't':
      val = true;
      break;
    default:
      throw_mismatch_exception("invalid value in boolean", row, col);
    }
  }
}

void
pg_private::dispatch<int>::load(PGresult *res, int row, int col, int &val)
{
  bool binary = is_binary(res, col);
  if (binary && (PQftype(res, col) != oid
		 || PQgetlength(res, row, col) != storage)) {
    throw_mismatch_exception("format mismatch for integer", row, col);
  }
  if (PQgetisnull(res, row, col)) {
    throw_mismatch_exception("NULL value in non-null integer", row, col);
  }
  const char *ptr = PQgetvalue(res, row, col);
  if (binary) {
    unsigned be;
    memcpy(&be, ptr, sizeof(be));
    val = static_cast<int>(be_to_cpu_32(be));
  } else {
    char *endptr;
    errno = 0;
    long long llval = strtoll(ptr, &endptr, 10);
    if (errno != 0 || *endptr != '\0'
	|| llval < INT_MIN || llval > INT_MAX) {
      std::string msg("conversion failure for INT4 column: \"");
      msg += quote(ptr);
      msg += '"';
      throw pg_exception(msg);
    }
    val = llval;
  }
}

void
pg_private::dispatch<std::string>::load(PGresult *res, int row, int col,
					std::string &val)
{
  if (is_binary(res, col) && PQftype(res, col) != oid) {
    throw_mismatch_exception("format mismatch for string", row, col);
  }
  if (PQgetisnull(res, row, col)) {
    throw_mismatch_exception("NULL value in non-null string", row, col);
  }
  const char *ptr = PQgetvalue(res, row, col);
  val.assign(ptr, ptr + PQgetlength(res, row, col));
}

int
pg_private::dispatch<std::string>::length(const std::string &str)
{
  return length_check(str.size());
}
