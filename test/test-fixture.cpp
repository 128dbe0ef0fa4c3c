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


#include <compdb/fixture.hpp>
#include <compdb/latest_resolver.hpp>
#include <compdb/memory_source.hpp>
#include <compdb/query_error.hpp>

#include "test.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <unistd.h>

using namespace compdb;

namespace {
  // Writes the contents to a temporary file, which is removed by the
  // destructor.
  struct temporary_file {
    std::string path;

    explicit temporary_file(const char *contents)
    {
      const char *tmpdir = getenv("TMPDIR");
      path = tmpdir != NULL && tmpdir[0] != '\0' ? tmpdir : "/tmp";
      path += "/compdb-fixture-XXXXXX";
      std::vector<char> buf(path.begin(), path.end());
      buf.push_back('\0');
      int fd = mkstemp(&buf[0]);
      if (fd < 0) {
	throw std::runtime_error(std::string("mkstemp: ") + strerror(errno));
      }
      path = &buf[0];
      size_t len = strlen(contents);
      ssize_t ret = write(fd, contents, len);
      close(fd);
      if (ret < 0 || static_cast<size_t>(ret) != len) {
	unlink(path.c_str());
	throw std::runtime_error("write to temporary file failed: " + path);
      }
    }

    ~temporary_file()
    {
      unlink(path.c_str());
    }
  };

  const char FIXTURE[] =
    "# OpenShift 3.11\n"
    "node\tProductStream\to:redhat:openshift-enterprise:3.11.z\t"
    "openshift-enterprise-3.11.z\tinactive\n"
    "node\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "openshift-enterprise-4.12.z\n"
    "\n"
    "component\tREDHAT\tansible-runner\tRPM\tsrc\t1.2-1\n"
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.2-1\n"
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.10-1\n"
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.9-2\n"
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.10-1\n"
    "member\tProductStream\to:redhat:openshift-enterprise:3.11.z\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.9-2\n";
}

static void
test_parse()
{
  fixture_entry e;
  CHECK(!parse_fixture_line("", e));
  CHECK(!parse_fixture_line("  \n", e));
  CHECK(!parse_fixture_line("# node\tProduct\to:redhat:rhel\trhel", e));

  CHECK(parse_fixture_line("node\tProduct\to:redhat:rhel\tRHEL\n", e));
  CHECK(e.kind == fixture_entry::node);
  CHECK(e.scope == scope_type::product);
  COMPARE_STRING(e.ofuri, "o:redhat:rhel");
  COMPARE_STRING(e.node_name, "RHEL");
  CHECK(e.active);

  CHECK(parse_fixture_line("node\tProductStream\to:redhat:rhel:8.6.0.z\t"
			   "rhel-8.6.0.z\tinactive", e));
  CHECK(e.scope == scope_type::product_stream);
  CHECK(!e.active);

  CHECK(parse_fixture_line("component\tUPSTREAM\tbash\tRPM\tsrc\t"
			   "1:5.1-2.el9", e));
  CHECK(e.kind == fixture_entry::component);
  CHECK(e.identity == component_identity(component_namespace::upstream,
					 "bash", "RPM", "src"));
  COMPARE_NUMBER(e.evr.epoch, 1);
  COMPARE_STRING(e.evr.version, "5.1");
  COMPARE_STRING(e.evr.release, "2.el9");

  CHECK(parse_fixture_line("member\tProductVariant\to:redhat:rhel:8.6.0.z:"
			   "BaseOS\tREDHAT\tbash\tRPM\tsrc\t5.1-2", e));
  CHECK(e.kind == fixture_entry::member);
  CHECK(e.scope == scope_type::product_variant);
  COMPARE_STRING(e.ofuri, "o:redhat:rhel:8.6.0.z:BaseOS");
  COMPARE_STRING(e.identity.name, "bash");

  static const char *const invalid[] = {
    "frobnicate\tx",
    "node\tProduct\to:redhat:rhel",
    "node\tProduct\to:redhat:rhel\tRHEL\tactive",
    "node\tProductComponent\to:redhat:rhel\tRHEL",
    "node\tProduct\t\tRHEL",
    "component\tREDHAT\tbash\tRPM\tsrc",
    "component\tRedHat\tbash\tRPM\tsrc\t1-1",
    "component\tREDHAT\t\tRPM\tsrc\t1-1",
    "component\tREDHAT\tbash\tRPM\tsrc\tx:1-1",
    "member\tProduct\to:redhat:rhel\tREDHAT\tbash\tRPM\tsrc",
    NULL
  };
  for (unsigned i = 0; invalid[i]; ++i) {
    test_section ts(invalid[i]);
    try {
      parse_fixture_line(invalid[i], e);
      CHECK(false);
    } catch (query_error &) {
    }
  }
}

static void
test_load_memory()
{
  temporary_file file(FIXTURE);
  std::vector<fixture_entry> entries;
  read_fixture(file.path.c_str(), entries);
  COMPARE_NUMBER(entries.size(), 8U);

  memory_source source;
  load_fixture(source, entries);
  component_identity runner(component_namespace::redhat, "ansible-runner",
			    "RPM", "src");
  component_version result;
  CHECK(resolve_latest
	(source, latest_query
	 (taxonomy_scope(scope_type::product_stream,
			 "o:redhat:openshift-enterprise:4.12.z"), runner),
	 result));
  COMPARE_STRING(result.evr.to_string(), "1.10-1");
  COMPARE_STRING(result.id.value(), "REDHAT/RPM/ansible-runner-1.10-1.src");

  latest_query old
    (taxonomy_scope(scope_type::product_stream,
		    "o:redhat:openshift-enterprise:3.11.z"), runner);
  CHECK(!resolve_latest(source, old, result));
  old.scope.include_inactive_streams = true;
  CHECK(resolve_latest(source, old, result));
  COMPARE_STRING(result.evr.to_string(), "1.9-2");
}

static void
test_read_errors()
{
  std::vector<fixture_entry> entries;
  {
    temporary_file file("node\tProduct\to:redhat:rhel\tRHEL\n"
			"\n"
			"component\tREDHAT\tbash\n");
    try {
      read_fixture(file.path.c_str(), entries);
      CHECK(false);
    } catch (query_error &e) {
      COMPARE_STRING(e.what(), file.path
		     + ":3: wrong number of fields for \"component\" line");
    }
  }
  entries.clear();
  try {
    read_fixture("/nonexistent/compdb-fixture", entries);
    CHECK(false);
  } catch (query_error &e) {
    COMPARE_STRING(e.what(),
		   "/nonexistent/compdb-fixture: No such file or directory");
  }
  CHECK(entries.empty());
}

static test_register t1("fixture/parse", test_parse);
static test_register t2("fixture/load_memory", test_load_memory);
static test_register t3("fixture/read_errors", test_read_errors);
