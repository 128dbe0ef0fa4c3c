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

#include "test.hpp"

using namespace compdb;

static void
test_namespace()
{
  COMPARE_STRING(to_string(component_namespace::redhat), "REDHAT");
  COMPARE_STRING(to_string(component_namespace::upstream), "UPSTREAM");

  component_namespace::type ns = component_namespace::redhat;
  CHECK(parse_component_namespace("UPSTREAM", ns));
  CHECK(ns == component_namespace::upstream);
  CHECK(parse_component_namespace("REDHAT", ns));
  CHECK(ns == component_namespace::redhat);
  CHECK(!parse_component_namespace("redhat", ns));
  CHECK(!parse_component_namespace("", ns));
  CHECK(ns == component_namespace::redhat);

  CHECK(component_namespace_from_string("UPSTREAM")
	== component_namespace::upstream);
  try {
    component_namespace_from_string("Upstream");
    CHECK(false);
  } catch (query_error &e) {
    COMPARE_STRING(e.what(), "invalid component namespace: \"Upstream\"");
  }
}

static void
test_identity()
{
  component_identity a(component_namespace::redhat, "bash", "RPM", "src");
  component_identity b(component_namespace::upstream, "bash", "RPM", "src");
  component_identity c(component_namespace::redhat, "bash", "RPM", "x86_64");
  component_identity d(component_namespace::redhat, "zsh", "OCI", "noarch");
  CHECK(a == a);
  CHECK(a != b);
  CHECK(a != c);
  CHECK(a < b);
  CHECK(!(b < a));
  CHECK(a < c);
  // Type is the most significant key.
  CHECK(d < a);
  CHECK(!(a < a));
  CHECK(component_identity().ns == component_namespace::redhat);
}

static void
test_component_id()
{
  component_id none;
  CHECK(!none.valid());
  component_id x(std::string("0b7e3a3e-2c3c-4f3a-9d55-6c9df3e4c001"));
  component_id y(std::string("0b7e3a3e-2c3c-4f3a-9d55-6c9df3e4c002"));
  CHECK(x.valid());
  CHECK(x < y);
  CHECK(x != y);
  CHECK(x == component_id(x.value()));
}

static void
test_version_strings()
{
  component_version v
    (component_id(std::string("id")),
     component_identity(component_namespace::redhat, "ansible-runner",
			"RPM", "src"),
     rpm_evr(0, "2.1.3", "1.el8"));
  COMPARE_STRING(v.nvr(), "ansible-runner-2.1.3-1.el8");
  COMPARE_STRING(v.nevra(), "ansible-runner-2.1.3-1.el8.src");

  v.evr = rpm_evr(3, "7.91", "");
  COMPARE_STRING(v.nvr(), "ansible-runner-7.91");
  COMPARE_STRING(v.nevra(), "ansible-runner:3-7.91.src");
}

static test_register t1("component/namespace", test_namespace);
static test_register t2("component/identity", test_identity);
static test_register t3("component/component_id", test_component_id);
static test_register t4("component/version_strings", test_version_strings);
