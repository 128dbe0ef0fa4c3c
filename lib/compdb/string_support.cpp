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

#include <compdb/string_support.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>

using namespace compdb;

static inline bool
needs_quoting(unsigned char ch)
{
  return ch < ' ' || ch >= 0x7f || ch == '\\' || ch == '"' || ch == '\'';
}

std::string
compdb::quote(const std::string &str)
{
  std::string::const_iterator p = str.begin(), end = str.end();
  while (p != end && !needs_quoting(*p)) {
    ++p;
  }
  if (p == end) {
    return str;
  }

  std::string result(str.begin(), p);
  for (; p != end; ++p) {
    unsigned char ch = *p;
    switch (ch) {
    case '\r':
      result += "\\r";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\t':
      result += "\\t";
      break;
    case '"':
    case '\'':
    case '\\':
      result += '\\';
      result += ch;
      break;
    default:
      if (ch < ' ' || ch >= 0x7f) {
	char buf[8];
	snprintf(buf, sizeof(buf), "\\x%02x", ch);
	result += buf;
      } else {
	result += ch;
      }
    }
  }
  return result;
}

std::string
compdb::strip(const std::string &s)
{
  std::string::size_type first = 0, last = s.size();
  while (first < last && whitespace(s[first])) {
    ++first;
  }
  while (last > first && whitespace(s[last - 1])) {
    --last;
  }
  return s.substr(first, last - first);
}

bool
compdb::parse_unsigned_long_long(const std::string &text,
				 unsigned long long &value)
{
  std::string digits(strip(text));
  if (digits.empty()) {
    return false;
  }
  for (std::string::const_iterator p = digits.begin(), end = digits.end();
       p != end; ++p) {
    if (*p < '0' || *p > '9') {
      return false;
    }
  }
  errno = 0;
  unsigned long long v = strtoull(digits.c_str(), NULL, 10);
  if (errno != 0) {
    return false;
  }
  value = v;
  return true;
}

void
compdb::split(const std::string &str, char delim,
	      std::vector<std::string> &result)
{
  result.clear();
  std::string::size_type start = 0;
  while (true) {
    std::string::size_type pos = str.find(delim, start);
    if (pos == std::string::npos) {
      result.push_back(str.substr(start));
      break;
    }
    result.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
}
