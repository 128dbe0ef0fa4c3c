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
#include <compdb/taxonomy_scope.hpp>
#include <compdb/tie_break.hpp>

#include <vector>

namespace compdb {

class candidate_source;

// Which component to look up, and where.
struct latest_query {
  taxonomy_scope scope;
  component_identity identity;

  latest_query();
  latest_query(const taxonomy_scope &, const component_identity &);
  ~latest_query();

  // Throws query_error if the scope is invalid or the type, name or
  // arch of the identity is empty.
  void check() const;
};

// Finds the latest root component matching the query.  Returns true
// and stores the component in RESULT if there is one, and returns
// false otherwise.  Identities which are not root components never
// match, and the source is not consulted for them.  Throws
// query_error for invalid queries.  Exceptions from the source are
// propagated.
bool resolve_latest(candidate_source &, const latest_query &,
		    component_version &result,
		    tie_break::type = tie_break::last_visited);

// As above, but only returns the component id.
bool resolve_latest(candidate_source &, const latest_query &,
		    component_id &result,
		    tie_break::type = tie_break::last_visited);

// Stores the latest component of each root component identity in the
// scope in LATEST, ordered by identity.  Components which are not the
// latest for their identity are stored in SUPERSEDED.  Throws
// query_error for an invalid scope.
void resolve_latest_components(candidate_source &, const taxonomy_scope &,
			       std::vector<component_version> &latest,
			       std::vector<component_version> &superseded,
			       tie_break::type = tie_break::last_visited);

// As above, discarding the superseded components.
void resolve_latest_components(candidate_source &, const taxonomy_scope &,
			       std::vector<component_version> &latest,
			       tie_break::type = tie_break::last_visited);

} // namespace compdb
