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

#include <compdb/rpm_evr.hpp>
#include <compdb/tagged.hpp>

#include <string>

namespace compdb {

// Origin of a component.  REDHAT components are built by Red Hat,
// UPSTREAM components are (unmodified) upstream sources.
namespace component_namespace {
  typedef enum {
    redhat,
    upstream,
  } type;
}

// Returns "REDHAT" or "UPSTREAM".
const char *to_string(component_namespace::type);

// Parses the upper-case namespace name.  Returns false if the name is
// not recognized.
bool parse_component_namespace(const std::string &,
			       component_namespace::type &);

// As parse_component_namespace(), but throws query_error on failure.
component_namespace::type component_namespace_from_string(const std::string &);

// Components with the same identity are different builds of the same
// thing, and only their EVR and id distinguish them.
struct component_identity {
  component_namespace::type ns;
  std::string name;
  std::string type;		// "RPM", "RPMMOD", "OCI", "GITHUB", ...
  std::string arch;		// "src", "noarch", "x86_64", ...

  component_identity();
  component_identity(component_namespace::type, const std::string &name,
		     const std::string &type, const std::string &arch);
  ~component_identity();

  bool operator==(const component_identity &) const;
  bool operator!=(const component_identity &other) const
  {
    return !(*this == other);
  }

  // Orders by type, name, arch, namespace.
  bool operator<(const component_identity &) const;
};

struct component_id_tag {};

// Opaque component identifier (a UUID in the database).
typedef tagged<std::string, component_id_tag> component_id;

// A single build of a component.
struct component_version {
  component_id id;
  component_identity identity;
  rpm_evr evr;

  component_version();
  component_version(const component_id &, const component_identity &,
		    const rpm_evr &);
  ~component_version();

  // "NAME-VERSION[-RELEASE]".
  std::string nvr() const;

  // "NAME[:EPOCH]-VERSION[-RELEASE][.ARCH]".  The epoch is omitted if
  // it is zero.
  std::string nevra() const;
};

} // namespace compdb
