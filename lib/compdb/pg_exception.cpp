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

#include <compdb/pg_exception.hpp>

#include <cstring>

using namespace compdb;

namespace {
  void
  set_field_string(PGresult *res, std::string &field, int code)
  {
    const char *p = PQresultErrorField(res, code);
    if (p != NULL) {
      field = p;
    }
  }

  void
  set_field_int(PGresult *res, int &field, int code)
  {
    const char *p = PQresultErrorField(res, code);
    if (p != NULL && sscanf(p, "%d", &field) != 1) {
      field = -1;
    }
  }

  // SQLSTATE class 58: system error (errors external to PostgreSQL).
  const char CLIENT_SQLSTATE[] = "58000";
}

pg_exception::pg_exception(const char *message)
  : message_(message), status_(PGRES_FATAL_ERROR),
    severity_("FATAL"), sqlstate_(CLIENT_SQLSTATE),
    statement_position_(-1)
{
}

pg_exception::pg_exception(const std::string &message)
  : message_(message), status_(PGRES_FATAL_ERROR),
    severity_("FATAL"), sqlstate_(CLIENT_SQLSTATE),
    statement_position_(-1)
{
}

pg_exception::pg_exception(PGconn *conn)
  : status_(PGRES_FATAL_ERROR), severity_("FATAL"),
    sqlstate_(CLIENT_SQLSTATE),
    statement_position_(-1)
{
  if (conn == NULL) {
    message_ = "out of memory";
  } else {
    message_ = PQerrorMessage(conn);
  }
}

pg_exception::pg_exception(PGresult *res)
  : statement_position_(-1)
{
  if (res == NULL) {
    status_ = PGRES_FATAL_ERROR;
    message_ = "out of memory";
    severity_ = "FATAL";
    sqlstate_ = "53200";
  } else {
    status_ = PQresultStatus(res);
    message_ = PQresultErrorMessage(res);
    set_field_string(res, severity_, PG_DIAG_SEVERITY);
    set_field_string(res, sqlstate_, PG_DIAG_SQLSTATE);
    set_field_string(res, primary_, PG_DIAG_MESSAGE_PRIMARY);
    set_field_string(res, detail_, PG_DIAG_MESSAGE_DETAIL);
    set_field_string(res, hint_, PG_DIAG_MESSAGE_HINT);
    set_field_string(res, context_, PG_DIAG_CONTEXT);
    set_field_int(res, statement_position_, PG_DIAG_STATEMENT_POSITION);
  }
}

pg_exception::~pg_exception() throw()
{
}

bool
pg_exception::query_canceled() const
{
  return sqlstate_ == "57014";
}

const char *
pg_exception::what() const throw()
{
  return message_.c_str();
}

namespace {
  // Writes MESSAGE line by line.  The first line is prefixed with
  // INFIX1, the remaining lines with INFIX2.
  void
  dump_lines(const char *prefix, const char *infix1, const char *infix2,
	     const std::string &message, FILE *out)
  {
    std::string::size_type pos = 0;
    bool first = true;
    while (pos < message.size()) {
      std::string::size_type nl = message.find('\n', pos);
      if (nl == std::string::npos) {
	nl = message.size();
      }
      fprintf(out, "%s%s", prefix, first ? infix1 : infix2);
      fwrite(message.data() + pos, nl - pos, 1, out);
      putc('\n', out);
      first = false;
      pos = nl + 1;
    }
  }
}

void
compdb::dump(const char *prefix, const pg_exception &e, FILE *out)
{
  dump_lines(prefix, "", "  ", e.message_, out);
  fprintf(out, "%s  status=%s severity=%s sqlstate=%s", prefix,
	  PQresStatus(e.status_), e.severity_.c_str(), e.sqlstate_.c_str());
  if (e.statement_position_ >= 0) {
    fprintf(out,  " position=%d\n", e.statement_position_);
  } else {
    putc('\n', out);
  }
  dump_lines(prefix, "  message: ", "  message: ", e.primary_, out);
  dump_lines(prefix, "  detail: ", "  detail: ", e.detail_, out);
  dump_lines(prefix, "  hint: ", "  hint: ", e.hint_, out);
  dump_lines(prefix, "  context: ", "  context: ", e.context_, out);
}
