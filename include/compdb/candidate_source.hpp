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

#include <memory>

namespace compdb {

struct component_identity;
struct component_version;
struct taxonomy_scope;

// Source of the components visible in a taxonomy scope.
// Implementations report data access failures by throwing exceptions
// (pg_exception for the database).
class candidate_source {
public:
  // A finite, read-only stream of components.  No particular order is
  // guaranteed.
  class cursor {
  public:
    virtual ~cursor();

    // Stores the next component in the argument and returns true.
    // Returns false at the end of the stream.
    virtual bool next(component_version &) = 0;
  };

  virtual ~candidate_source();

  // All components with this identity linked to the scope node.  The
  // active flag of product streams is honored.
  virtual std::unique_ptr<cursor> candidates
    (const component_identity &, const taxonomy_scope &) = 0;

  // All root components linked to the scope node, of any identity.
  virtual std::unique_ptr<cursor> root_components
    (const taxonomy_scope &) = 0;
};

} // namespace compdb
