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

#include <compdb/component.hpp>
#include <compdb/query_error.hpp>
#include <compdb/string_support.hpp>
#include <compdb/raise.hpp>

#include <cstdio>

using namespace compdb;

const char *
compdb::to_string(component_namespace::type ns)
{
  switch (ns) {
  case component_namespace::redhat:
    return "REDHAT";
  case component_namespace::upstream:
    return "UPSTREAM";
  }
  return "";
}

bool
compdb::parse_component_namespace(const std::string &name,
				  component_namespace::type &ns)
{
  if (name == "REDHAT") {
    ns = component_namespace::redhat;
    return true;
  }
  if (name == "UPSTREAM") {
    ns = component_namespace::upstream;
    return true;
  }
  return false;
}

component_namespace::type
compdb::component_namespace_from_string(const std::string &name)
{
  component_namespace::type ns;
  if (!parse_component_namespace(name, ns)) {
    raise<query_error>("invalid component namespace: \""
		       + quote(name) + "\"");
  }
  return ns;
}

//////////////////////////////////////////////////////////////////////
// component_identity

component_identity::component_identity()
  : ns(component_namespace::redhat)
{
}

component_identity::component_identity(component_namespace::type n,
					const std::string &nm,
					const std::string &t,
					const std::string &a)
  : ns(n), name(nm), type(t), arch(a)
{
}

component_identity::~component_identity()
{
}

bool
component_identity::operator==(const component_identity &other) const
{
  return ns == other.ns && name == other.name
    && type == other.type && arch == other.arch;
}

bool
component_identity::operator<(const component_identity &other) const
{
  int rc = type.compare(other.type);
  if (rc != 0) {
    return rc < 0;
  }
  rc = name.compare(other.name);
  if (rc != 0) {
    return rc < 0;
  }
  rc = arch.compare(other.arch);
  if (rc != 0) {
    return rc < 0;
  }
  return ns < other.ns;
}

//////////////////////////////////////////////////////////////////////
// component_version

component_version::component_version()
{
}

component_version::component_version(const component_id &i,
				     const component_identity &ident,
				     const rpm_evr &e)
  : id(i), identity(ident), evr(e)
{
}

component_version::~component_version()
{
}

std::string
component_version::nvr() const
{
  std::string result(identity.name);
  result += '-';
  result += evr.version;
  if (!evr.release.empty()) {
    result += '-';
    result += evr.release;
  }
  return result;
}

std::string
component_version::nevra() const
{
  std::string result(identity.name);
  if (evr.epoch != 0) {
    char buf[32];
    snprintf(buf, sizeof(buf), ":%d", evr.epoch);
    result += buf;
  }
  result += '-';
  result += evr.version;
  if (!evr.release.empty()) {
    result += '-';
    result += evr.release;
  }
  if (!identity.arch.empty()) {
    result += '.';
    result += identity.arch;
  }
  return result;
}
