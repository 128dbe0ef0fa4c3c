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

#include <compdb/candidate_source.hpp>
#include <compdb/component.hpp>
#include <compdb/taxonomy_scope.hpp>

#include <memory>
#include <string>

namespace compdb {

// A candidate_source backed by in-process tables.  Cursors visit
// components in the order in which the memberships were added.
// Modifying the source invalidates open cursors.
class memory_source : public candidate_source {
  struct impl;
  std::shared_ptr<impl> impl_;
  class cursor_impl;
public:
  memory_source();
  ~memory_source();

  // Adds a taxonomy node.  Throws std::runtime_error if a node with
  // the same type and ofuri already exists.
  void add_node(scope_type::type, const std::string &ofuri,
		bool active = true);

  // Adds a component.  Throws std::runtime_error if the id is
  // invalid or a component with the same id already exists.
  void add_component(const component_version &);

  // Links an existing component to an existing node.  Throws
  // std::runtime_error if either does not exist.
  void add_membership(scope_type::type, const std::string &ofuri,
		      const component_id &);

  // Number of cursors created so far.
  unsigned cursors_opened() const;

  std::unique_ptr<cursor> candidates
    (const component_identity &, const taxonomy_scope &);
  std::unique_ptr<cursor> root_components(const taxonomy_scope &);
};

} // namespace compdb
