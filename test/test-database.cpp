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

#include <compdb/database.hpp>
#include <compdb/fixture.hpp>
#include <compdb/latest_resolver.hpp>
#include <compdb/memory_source.hpp>
#include <compdb/pg_exception.hpp>
#include <compdb/pg_testdb.hpp>
#include <compdb/pgconn_handle.hpp>
#include <compdb/pgresult_handle.hpp>
#include <compdb/query_error.hpp>

#include "test.hpp"

using namespace compdb;

namespace {
  const char *const fixture_lines[] = {
    "node\tProduct\to:redhat:openshift\tOpenShift",
    "node\tProductStream\to:redhat:openshift-enterprise:3.11.z\t"
    "openshift-enterprise-3.11.z\tinactive",
    "node\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "openshift-enterprise-4.12.z",
    "node\tProductVariant\to:redhat:openshift-enterprise:4.12.z:el8\t"
    "8Base-RHOSE-4.12",
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.2-1",
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.10-1",
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.9-2",
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tansible-runner\tRPM\tnoarch\t9.0-1",
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tose-cli\tOCI\tnoarch\tv4.12.0-2",
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "REDHAT\tose-cli\tOCI\tnoarch\t1:v4.11.0-1",
    "member\tProductStream\to:redhat:openshift-enterprise:4.12.z\t"
    "UPSTREAM\topenshift\tGITHUB\tnoarch\t4.12.0",
    "member\tProductStream\to:redhat:openshift-enterprise:3.11.z\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.9-2",
    "member\tProduct\to:redhat:openshift\t"
    "REDHAT\tansible-runner\tRPM\tsrc\t1.2-1",
    "member\tProductVariant\to:redhat:openshift-enterprise:4.12.z:el8\t"
    "REDHAT\tose-cli\tOCI\tnoarch\tv4.12.0-2",
    NULL
  };

  void
  fixture(std::vector<fixture_entry> &entries)
  {
    fixture_entry e;
    for (const char *const *p = fixture_lines; *p; ++p) {
      if (parse_fixture_line(*p, e)) {
	entries.push_back(e);
      }
    }
  }

  // Resolves the query against both sources and checks that the
  // results agree.  Returns the NEVRA of the result.
  std::string
  resolve(database &db, memory_source &memory, const latest_query &query)
  {
    component_version from_db;
    component_version from_memory;
    database::source source(db);
    bool found = resolve_latest(source, query, from_db);
    CHECK(found == resolve_latest(memory, query, from_memory));
    if (!found) {
      return "(not found)";
    }
    COMPARE_STRING(from_db.nevra(), from_memory.nevra());
    CHECK(from_db.identity == query.identity);
    CHECK(from_db.id.valid());
    return from_db.nevra();
  }
}

static void
test()
{
  if (!pg_testdb::available()) {
    test_skip("PostgreSQL server not available");
    return;
  }
  pg_testdb testdb;
  testdb.exec_test_sql("template1", "CREATE DATABASE compdb_test");
  database db(testdb.connect("compdb_test"));
  db.create_schema();

  std::vector<fixture_entry> entries;
  fixture(entries);
  load_fixture(db, entries);
  // Loading is idempotent.
  load_fixture(db, entries);
  memory_source memory;
  load_fixture(memory, entries);

  component_identity runner(component_namespace::redhat, "ansible-runner",
			    "RPM", "src");
  taxonomy_scope stream(scope_type::product_stream,
			"o:redhat:openshift-enterprise:4.12.z");
  taxonomy_scope old_stream(scope_type::product_stream,
			    "o:redhat:openshift-enterprise:3.11.z");

  {
    test_section ts("latest");
    COMPARE_STRING(resolve(db, memory, latest_query(stream, runner)),
		   "ansible-runner-1.10-1.src");
    COMPARE_STRING(resolve(db, memory, latest_query
			   (taxonomy_scope(scope_type::product,
					   "o:redhat:openshift"), runner)),
		   "ansible-runner-1.2-1.src");
    component_identity cli(component_namespace::redhat, "ose-cli",
			   "OCI", "noarch");
    COMPARE_STRING(resolve(db, memory, latest_query(stream, cli)),
		   "ose-cli:1-v4.11.0-1.noarch");
    COMPARE_STRING(resolve(db, memory, latest_query
			   (taxonomy_scope
			    (scope_type::product_variant,
			     "o:redhat:openshift-enterprise:4.12.z:el8"), cli)),
		   "ose-cli-v4.12.0-2.noarch");
  }
  {
    test_section ts("not found");
    COMPARE_STRING(resolve(db, memory, latest_query(old_stream, runner)),
		   "(not found)");
    old_stream.include_inactive_streams = true;
    COMPARE_STRING(resolve(db, memory, latest_query(old_stream, runner)),
		   "ansible-runner-1.9-2.src");
    COMPARE_STRING(resolve(db, memory, latest_query
			   (taxonomy_scope(scope_type::product_stream,
					   "o:redhat:unknown"), runner)),
		   "(not found)");
    // Not root components.
    component_identity binary(component_namespace::redhat, "ansible-runner",
			      "RPM", "noarch");
    COMPARE_STRING(resolve(db, memory, latest_query(stream, binary)),
		   "(not found)");
    component_identity repo(component_namespace::upstream, "openshift",
			    "GITHUB", "noarch");
    COMPARE_STRING(resolve(db, memory, latest_query(stream, repo)),
		   "(not found)");
  }
  {
    test_section ts("latest components");
    database::source source(db);
    std::vector<component_version> latest;
    std::vector<component_version> superseded;
    resolve_latest_components(source, stream, latest, superseded);
    COMPARE_NUMBER(latest.size(), 2U);
    if (latest.size() == 2) {
      COMPARE_STRING(latest[0].nevra(), "ose-cli:1-v4.11.0-1.noarch");
      COMPARE_STRING(latest[1].nevra(), "ansible-runner-1.10-1.src");
    }
    COMPARE_NUMBER(superseded.size(), 3U);
  }
  {
    test_section ts("interning");
    component_identity bash(component_namespace::redhat, "bash", "RPM",
			    "src");
    component_id first;
    component_id second;
    CHECK(db.intern_component(bash, rpm_evr(0, "5.1", "2.el9"), first));
    CHECK(!db.intern_component(bash, rpm_evr(0, "5.1", "2.el9"), second));
    CHECK(first.valid());
    CHECK(first == second);
    CHECK(!db.intern_component(bash, rpm_evr(0, "5.1", "2.el9"), second));
    CHECK(db.intern_component(bash, rpm_evr(1, "5.1", "2.el9"), second));
    CHECK(first != second);
    CHECK(!db.add_membership(scope_type::product_stream, "o:redhat:unknown",
			     first));
    CHECK(db.add_membership(scope_type::product_stream, stream.ofuri, first));
    CHECK(db.add_membership(scope_type::product_stream, stream.ofuri, first));

    std::vector<fixture_entry> bad;
    fixture_entry e;
    CHECK(parse_fixture_line("member\tProduct\to:redhat:unknown\tREDHAT\t"
			     "bash\tRPM\tsrc\t5.1-2.el9", e));
    bad.push_back(e);
    try {
      load_fixture(db, bad);
      CHECK(false);
    } catch (query_error &err) {
      COMPARE_STRING(err.what(), "unknown Product node: o:redhat:unknown");
    }
  }
  {
    test_section ts("cursors");
    database::source source(db);
    {
      std::unique_ptr<candidate_source::cursor> c1
	(source.root_components(stream));
      component_version v;
      CHECK(c1->next(v));
      try {
	source.candidates(runner, stream);
	CHECK(false);
      } catch (pg_exception &e) {
	COMPARE_STRING(e.message_, "another database cursor is still active");
      }
      // c1 is abandoned before reaching the end.
    }
    component_version result;
    CHECK(resolve_latest(source, latest_query(stream, runner), result));
    COMPARE_STRING(result.nevra(), "ansible-runner-1.10-1.src");
  }
  {
    test_section ts("snapshot and timeout");
    db.txn_begin_read_only();
    db.set_statement_timeout(5000);
    COMPARE_STRING(resolve(db, memory, latest_query(stream, runner)),
		   "ansible-runner-1.10-1.src");
    db.txn_commit();
    db.set_statement_timeout(50);
    try {
      db.exec_sql("SELECT pg_sleep(10)");
      CHECK(false);
    } catch (pg_exception &e) {
      CHECK(e.query_canceled());
      COMPARE_STRING(e.sqlstate_, "57014");
    }
    db.set_statement_timeout(0);
  }
  {
    test_section ts("schema constraints");
    pgconn_handle conn(testdb.connect("compdb_test"));
    pgresult_handle res;
    try {
      res.exec(conn, "INSERT INTO compdb.component"
	       " (namespace, name, type, arch, version)"
	       " VALUES ('FEDORA', 'bash', 'RPM', 'src', '5.1')");
      CHECK(false);
    } catch (pg_exception &e) {
      COMPARE_STRING(e.sqlstate_, "23514");
    }
    res.exec(conn, "SELECT indexname FROM pg_indexes"
	     " WHERE indexname = 'component_root_idx'");
    COMPARE_NUMBER(res.ntuples(), 1);
  }
  {
    test_section ts("rollback after server error");
    pgconn_handle conn(testdb.connect("compdb_test"));
    pgresult_handle res;
    res.exec(conn, "ALTER TABLE compdb.component"
	     " ADD CONSTRAINT component_no_zsh CHECK (name <> 'zsh')");

    std::vector<fixture_entry> bad;
    fixture_entry e;
    CHECK(parse_fixture_line("node\tProduct\to:redhat:discarded\tdiscarded",
			     e));
    bad.push_back(e);
    CHECK(parse_fixture_line("component\tREDHAT\tzsh\tRPM\tsrc\t5.9-1",
			     e));
    bad.push_back(e);
    try {
      load_fixture(db, bad);
      CHECK(false);
    } catch (pg_exception &err) {
      COMPARE_STRING(err.sqlstate_, "23514");
    }

    // The connection is not stuck in the failed transaction.
    COMPARE_STRING(resolve(db, memory, latest_query(stream, runner)),
		   "ansible-runner-1.10-1.src");
    res.exec(conn, "SELECT 1 FROM compdb.product"
	     " WHERE ofuri = 'o:redhat:discarded'");
    COMPARE_NUMBER(res.ntuples(), 0);
    res.exec(conn, "ALTER TABLE compdb.component"
	     " DROP CONSTRAINT component_no_zsh");
  }
}

static test_register t("database", test);
