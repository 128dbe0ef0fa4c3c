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

#include <string>
#include <vector>

namespace compdb {

// Escapes quote characters, backslashes and non-printable characters
// (less than ASCII 32, greater than ASCII 126).  Does not add the
// surrounding quote characters.
std::string quote(const std::string &);

// Checks if the character is ASCII whitespace.
inline bool
whitespace(char ch)
{
  return 0 <= ch && ch <= ' ';
}

// Removes leading and trailing whitespace.
std::string strip(const std::string &);

// Parses a decimal number, ignoring leading and trailing white space.
// Returns false on empty input, garbage, or overflow.
bool parse_unsigned_long_long(const std::string &, unsigned long long &value);

// Splits STR at each DELIM character.  Empty fields are preserved.
// Replaces the contents of RESULT.
void split(const std::string &str, char delim,
	   std::vector<std::string> &result);

template <unsigned N> bool
starts_with(const std::string &s, const char (&pattern)[N])
{
  if (s.size() < N - 1) {
    return false;
  }
  return s.compare(0, N - 1, pattern) == 0;
}

} // namespace compdb
