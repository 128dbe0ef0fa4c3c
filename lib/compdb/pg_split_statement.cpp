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

#include <compdb/pg_split_statement.hpp>
#include <compdb/raise.hpp>

#include <cstring>
#include <stdexcept>

void
compdb::pg_split_statement(const char *sql, std::vector<std::string> &result)
{
  const char *p = sql;
  const char *end = sql + strlen(sql);
  const char *start = p;	// start of the current statement
  bool in_statement = false;
  while (p != end) {
    char ch = *p;
    ++p;
    switch (ch) {
    case '-':
      if (p != end && *p == '-') {
	// Comment up to the end of the line.
	p = static_cast<const char *>(memchr(p, '\n', end - p));
	if (p == NULL) {
	  p = end;
	  if (!in_statement) {
	    start = p;
	  }
	  break;
	}
	++p;
	if (!in_statement) {
	  start = p;
	}
      } else {
	in_statement = true;
      }
      break;
    case '\'':
      if (!in_statement) {
	raise<std::runtime_error>("string at start of SQL statement");
      }
      while (true) {
	if (p == end) {
	  raise<std::runtime_error>("unterminated string in SQL statement");
	}
	if (*p == '\'') {
	  ++p;
	  // '' is an escaped quote character.
	  if (p == end || *p != '\'') {
	    break;
	  }
	}
	++p;
      }
      break;
    case '$':
      if (!in_statement) {
	raise<std::runtime_error>("$ at start of SQL statement");
      }
      if (p != end && *p == '$') {
	const char *close = strstr(p + 1, "$$");
	if (close == NULL) {
	  raise<std::runtime_error>("unterminated $$ string in SQL statement");
	}
	p = close + 2;
      }
      break;
    case ';':
      if (!in_statement) {
	raise<std::runtime_error>("empty SQL statement");
      }
      result.push_back(std::string(start, p));
      start = p;
      in_statement = false;
      break;
    default:
      if (!in_statement) {
	if (ch > ' ') {
	  in_statement = true;
	} else {
	  start = p;
	}
      }
    }
  }
  if (in_statement) {
    raise<std::runtime_error>("unterminated final SQL statement");
  }
}
