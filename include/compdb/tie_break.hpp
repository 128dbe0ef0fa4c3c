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

#include <compdb/component.hpp>

#include <string>

namespace compdb {

// Selects the winner among candidates with equal EVR.
namespace tie_break {
  typedef enum {
    // The candidate seen last wins.  The result depends on the visit
    // order if there are several candidates with the greatest EVR.
    last_visited,
    // The candidate with the lexicographically smallest id wins.
    lowest_id,
  } type;
}

// Returns "last-visited" or "lowest-id".
const char *to_string(tie_break::type);

// Parses the names returned by to_string().  Returns false if the
// name is not recognized.
bool parse_tie_break(const std::string &, tie_break::type &);

// Returns true if CANDIDATE replaces BEST as the latest component.
bool supersedes(const component_version &candidate,
		const component_version &best, tie_break::type);

} // namespace compdb
