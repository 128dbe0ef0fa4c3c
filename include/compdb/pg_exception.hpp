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

#include <cstdio>
#include <stdexcept>
#include <string>

namespace compdb {

// A failed catalog access: an error reported by the PostgreSQL
// server, or a client-side failure (lost connection, misuse of a
// cursor).  Client-side errors carry SQLSTATE 58000.
class pg_exception : public std::exception {
public:
  explicit pg_exception(const char *);
  explicit pg_exception(const std::string &);

  // Error message from the connection.
  explicit pg_exception(PGconn *);

  // Initializes the exception from the result.
  explicit pg_exception(PGresult *);

  ~pg_exception() throw();

  // Empty strings were not present in the error message.

  std::string message_; // from PQresultErrorMessage()
  ExecStatusType status_; // from PGresultStatus()
  std::string severity_; // PG_DIAG_SEVERITY
  std::string sqlstate_; // PG_DIAG_SQLSTATE
  std::string primary_; // PG_DIAG_MESSAGE_PRIMARY
  std::string detail_; // PG_DIAG_MESSAGE_DETAIL
  std::string hint_; // PG_DIAG_MESSAGE_HINT
  std::string context_; // PG_DIAG_CONTEXT
  int statement_position_; // PG_DIAG_STATEMENT_POSITION, or -1

  // True if the statement was canceled, because statement_timeout
  // expired or an abandoned cursor was canceled (SQLSTATE 57014).
  bool query_canceled() const;

  // Returns the message from PQresultErrorMessage().
  const char *what() const throw();
};

// Writes a description of the exception to the stream.  Each line
// starts with PREFIX.
void dump(const char *prefix, const pg_exception &, FILE *);

} // namespace compdb
