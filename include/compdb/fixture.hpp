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
#include <compdb/rpm_evr.hpp>
#include <compdb/taxonomy_scope.hpp>

#include <string>
#include <vector>

namespace compdb {

class database;
class memory_source;

// One line of a fixture file.  Fixture files describe a small
// catalog: product hierarchy nodes, components, and the links between
// them.  Fields are separated by tab characters:
//
//   node	SCOPE	OFURI	NAME	[inactive]
//   component	NAMESPACE	NAME	TYPE	ARCH	EVR
//   member	SCOPE	OFURI	NAMESPACE	NAME	TYPE	ARCH	EVR
//
// Empty lines and lines starting with '#' are ignored.
struct fixture_entry {
  enum kind_type {
    node,
    component,
    member,
  } kind;

  // node, member
  scope_type::type scope;
  std::string ofuri;

  // node
  std::string node_name;
  bool active;

  // component, member
  component_identity identity;
  rpm_evr evr;

  fixture_entry();
  ~fixture_entry();
};

// Parses a single line.  Returns false for empty lines and comments.
// Throws query_error for malformed lines.
bool parse_fixture_line(const std::string &line, fixture_entry &);

// Reads the fixture file at PATH and appends its entries to RESULT.
// Throws query_error if the file cannot be read or contains a
// malformed line (the message includes the line number).
void read_fixture(const char *path, std::vector<fixture_entry> &result);

// Applies the entries to the database, in a single transaction.
// Throws query_error if a member line refers to an unknown node.
void load_fixture(database &, const std::vector<fixture_entry> &);

// Applies the entries to an in-memory source.  Component ids are
// derived from the namespace, type and NEVRA of the component.
void load_fixture(memory_source &, const std::vector<fixture_entry> &);

} // namespace compdb
