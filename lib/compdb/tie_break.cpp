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

#include <compdb/tie_break.hpp>

using namespace compdb;

const char *
compdb::to_string(tie_break::type policy)
{
  switch (policy) {
  case tie_break::last_visited:
    return "last-visited";
  case tie_break::lowest_id:
    return "lowest-id";
  }
  return "";
}

bool
compdb::parse_tie_break(const std::string &name, tie_break::type &policy)
{
  if (name == "last-visited") {
    policy = tie_break::last_visited;
    return true;
  }
  if (name == "lowest-id") {
    policy = tie_break::lowest_id;
    return true;
  }
  return false;
}

bool
compdb::supersedes(const component_version &candidate,
		   const component_version &best, tie_break::type policy)
{
  int rc = candidate.evr.compare(best.evr);
  switch (policy) {
  case tie_break::last_visited:
    return rc >= 0;
  case tie_break::lowest_id:
    return rc > 0 || (rc == 0 && candidate.id < best.id);
  }
  return rc > 0;
}
