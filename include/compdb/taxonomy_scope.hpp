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

// Level of the product hierarchy.  A product has versions, a version
// has streams, and a stream has variants.
namespace scope_type {
  typedef enum {
    product,
    product_version,
    product_stream,
    product_variant,
  } type;
}

// Per-level information, used to select tables and filters once per
// query.
struct scope_traits {
  scope_type::type type;
  const char *name;		// "Product", "ProductStream", ...
  const char *node_table;	// table with the ofuri column
  const char *membership_table;	// (component_uuid, node_uuid) pairs
  bool has_active;		// node_table has an "active" column
};

// Returns the traits for the scope type.  Throws query_error if the
// value is not one of the enumerated scope types.
const scope_traits &traits(scope_type::type);

// Returns the CamelCase name of the scope type.  Throws query_error
// for an invalid value.
const char *to_string(scope_type::type);

// Parses a CamelCase scope type name ("Product", "ProductVersion",
// "ProductStream", "ProductVariant").  Returns false if the name is
// not recognized.
bool parse_scope_type(const std::string &, scope_type::type &);

// As parse_scope_type(), but throws query_error on failure.
scope_type::type scope_type_from_string(const std::string &);

// A node of the product hierarchy, identified by its ofuri.
struct taxonomy_scope {
  scope_type::type type;
  std::string ofuri;

  // Only meaningful for product streams.  If false, components are
  // only visible through active streams.
  bool include_inactive_streams;

  taxonomy_scope();
  taxonomy_scope(scope_type::type, const std::string &ofuri,
		 bool include_inactive_streams = false);
  ~taxonomy_scope();

  // Throws query_error if the scope type is invalid or the ofuri is
  // empty.
  void check() const;

  // Returns true if nodes which are marked inactive must be skipped.
  bool active_only() const;
};

} // namespace compdb
