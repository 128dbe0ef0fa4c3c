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

namespace compdb {

struct component_identity;

// One row of the root component policy.  A NULL arch or namespace
// matches any value.
struct root_component_rule {
  const char *type;
  const char *arch;
  const char *ns;
};

// The root component policy, terminated by an entry with a NULL type.
// Root components are the top-level builds which are shipped: source
// RPMs, modules, index container images, and Red Hat GitHub
// repositories.
extern const root_component_rule root_component_rules[];

// Returns true if the identity matches one of the root component
// rules.
bool is_root_component(const component_identity &);

// Returns an SQL boolean expression which is true for rows of the
// component table which are root components.  ALIAS is the table
// alias used to qualify the columns, or NULL for unqualified column
// names (for use in index predicates).
std::string root_component_condition(const char *alias);

} // namespace compdb
