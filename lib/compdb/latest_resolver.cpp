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

#include <compdb/latest_resolver.hpp>
#include <compdb/latest_consolidator.hpp>
#include <compdb/candidate_source.hpp>
#include <compdb/root_component.hpp>
#include <compdb/query_error.hpp>
#include <compdb/raise.hpp>

#include <memory>
#include <utility>

using namespace compdb;

latest_query::latest_query()
{
}

latest_query::latest_query(const taxonomy_scope &s,
			   const component_identity &i)
  : scope(s), identity(i)
{
}

latest_query::~latest_query()
{
}

void
latest_query::check() const
{
  scope.check();
  if (identity.type.empty()) {
    raise<query_error>("empty component type");
  }
  if (identity.name.empty()) {
    raise<query_error>("empty component name");
  }
  if (identity.arch.empty()) {
    raise<query_error>("empty component arch");
  }
  if (identity.ns != component_namespace::redhat
      && identity.ns != component_namespace::upstream) {
    raise<query_error>("invalid component namespace value");
  }
}

bool
compdb::resolve_latest(candidate_source &source, const latest_query &query,
		       component_version &result, tie_break::type policy)
{
  query.check();
  if (!is_root_component(query.identity)) {
    return false;
  }

  std::unique_ptr<candidate_source::cursor> cursor
    (source.candidates(query.identity, query.scope));
  component_version best;
  if (!cursor->next(best)) {
    return false;
  }
  component_version candidate;
  while (cursor->next(candidate)) {
    if (supersedes(candidate, best, policy)) {
      std::swap(best, candidate);
    }
  }
  std::swap(result, best);
  return true;
}

bool
compdb::resolve_latest(candidate_source &source, const latest_query &query,
		       component_id &result, tie_break::type policy)
{
  component_version latest;
  if (resolve_latest(source, query, latest, policy)) {
    result = latest.id;
    return true;
  }
  return false;
}

void
compdb::resolve_latest_components(candidate_source &source,
				  const taxonomy_scope &scope,
				  std::vector<component_version> &latest,
				  std::vector<component_version> &superseded,
				  tie_break::type policy)
{
  scope.check();
  latest_consolidator<component_version> consolidator(policy);
  std::unique_ptr<candidate_source::cursor> cursor
    (source.root_components(scope));
  component_version candidate;
  while (cursor->next(candidate)) {
    consolidator.add(candidate, candidate);
  }
  latest = consolidator.values();
  superseded = consolidator.superseded();
}

void
compdb::resolve_latest_components(candidate_source &source,
				  const taxonomy_scope &scope,
				  std::vector<component_version> &latest,
				  tie_break::type policy)
{
  std::vector<component_version> superseded;
  resolve_latest_components(source, scope, latest, superseded, policy);
}
