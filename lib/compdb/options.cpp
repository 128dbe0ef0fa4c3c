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

#include <compdb/options.hpp>
#include <compdb/string_support.hpp>

#include <climits>

using namespace compdb;

compdb_options::compdb_options()
  : output(standard), include_inactive(false), superseded(false),
    tie(tie_break::last_visited), timeout(0)
{
}

compdb_options::~compdb_options()
{
}

void
compdb_options::set_tie_break(const char *name)
{
  if (!parse_tie_break(name, tie)) {
    throw usage_error("invalid --tie-break value \"" + quote(name)
		      + "\" (expected last-visited or lowest-id)");
  }
}

void
compdb_options::set_timeout(const char *text)
{
  unsigned long long value;
  if (!parse_unsigned_long_long(text, value) || value > INT_MAX) {
    throw usage_error("invalid --timeout value \"" + quote(text) + "\"");
  }
  timeout = value;
}

//////////////////////////////////////////////////////////////////////
// compdb_options::usage_error

compdb_options::usage_error::usage_error(const std::string &message)
  : what_(message)
{
}

compdb_options::usage_error::~usage_error() throw()
{
}

const char *
compdb_options::usage_error::what() const throw()
{
  return what_.c_str();
}
