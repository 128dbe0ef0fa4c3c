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
#include <compdb/database.hpp>
#include <compdb/memory_source.hpp>
#include <compdb/query_error.hpp>
#include <compdb/raise.hpp>
#include <compdb/string_support.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <set>

using namespace compdb;

fixture_entry::fixture_entry()
  : kind(node), scope(scope_type::product), active(true)
{
}

fixture_entry::~fixture_entry()
{
}

namespace {
  void
  parse_identity(const std::vector<std::string> &fields, size_t start,
		 fixture_entry &e)
  {
    e.identity = component_identity
      (component_namespace_from_string(fields.at(start)),
       fields.at(start + 1), fields.at(start + 2), fields.at(start + 3));
    if (e.identity.name.empty() || e.identity.type.empty()
	|| e.identity.arch.empty()) {
      raise<query_error>("incomplete component identity");
    }
    if (!parse_evr(fields.at(start + 4), e.evr)) {
      raise<query_error>("invalid EVR: \"" + quote(fields.at(start + 4))
			 + "\"");
    }
  }

  void
  check_field_count(const std::vector<std::string> &fields,
		    size_t min, size_t max)
  {
    if (fields.size() < min || fields.size() > max) {
      raise<query_error>("wrong number of fields for \"" + fields.front()
			 + "\" line");
    }
  }
}

bool
compdb::parse_fixture_line(const std::string &line, fixture_entry &e)
{
  std::string stripped(strip(line));
  if (stripped.empty() || stripped[0] == '#') {
    return false;
  }
  std::vector<std::string> fields;
  split(stripped, '\t', fields);

  fixture_entry result;
  if (fields.front() == "node") {
    check_field_count(fields, 4, 5);
    result.kind = fixture_entry::node;
    result.scope = scope_type_from_string(fields[1]);
    result.ofuri = fields[2];
    result.node_name = fields[3];
    if (fields.size() == 5) {
      if (fields[4] != "inactive") {
	raise<query_error>("invalid node flag: \"" + quote(fields[4]) + "\"");
      }
      result.active = false;
    }
  } else if (fields.front() == "component") {
    check_field_count(fields, 6, 6);
    result.kind = fixture_entry::component;
    parse_identity(fields, 1, result);
  } else if (fields.front() == "member") {
    check_field_count(fields, 8, 8);
    result.kind = fixture_entry::member;
    result.scope = scope_type_from_string(fields[1]);
    result.ofuri = fields[2];
    parse_identity(fields, 3, result);
  } else {
    raise<query_error>("unknown fixture line type: \""
		       + quote(fields.front()) + "\"");
  }
  if (result.kind != fixture_entry::component && result.ofuri.empty()) {
    raise<query_error>("empty ofuri");
  }
  e = result;
  return true;
}

namespace {
  struct fixture_file {
    FILE *file;
    char *line;
    size_t length;

    fixture_file(const char *path)
      : file(fopen(path, "r")), line(NULL), length(0)
    {
      if (file == NULL) {
	raise<query_error>(std::string(path) + ": " + strerror(errno));
      }
    }

    ~fixture_file()
    {
      free(line);
      fclose(file);
    }

    bool getline()
    {
      return ::getline(&line, &length, file) >= 0;
    }
  };
}

void
compdb::read_fixture(const char *path, std::vector<fixture_entry> &result)
{
  fixture_file file(path);
  unsigned lineno = 0;
  fixture_entry e;
  while (file.getline()) {
    ++lineno;
    try {
      if (parse_fixture_line(file.line, e)) {
	result.push_back(e);
      }
    } catch (query_error &err) {
      char buf[32];
      snprintf(buf, sizeof(buf), ":%u: ", lineno);
      raise<query_error>(path + (buf + std::string(err.what())));
    }
  }
  if (ferror(file.file)) {
    raise<query_error>(std::string(path) + ": " + strerror(errno));
  }
}

void
compdb::load_fixture(database &db, const std::vector<fixture_entry> &entries)
{
  db.txn_begin();
  try {
    component_id id;
    for (std::vector<fixture_entry>::const_iterator
	   p = entries.begin(), end = entries.end(); p != end; ++p) {
      switch (p->kind) {
      case fixture_entry::node:
	db.intern_node(p->scope, p->ofuri, p->node_name, p->active);
	break;
      case fixture_entry::component:
	db.intern_component(p->identity, p->evr, id);
	break;
      case fixture_entry::member:
	db.intern_component(p->identity, p->evr, id);
	if (!db.add_membership(p->scope, p->ofuri, id)) {
	  raise<query_error>(std::string("unknown ") + to_string(p->scope)
			     + " node: " + quote(p->ofuri));
	}
	break;
      }
    }
  } catch (...) {
    // Leave the connection usable for the caller.
    db.txn_rollback();
    throw;
  }
  db.txn_commit();
}

void
compdb::load_fixture(memory_source &source,
		     const std::vector<fixture_entry> &entries)
{
  std::set<component_id> components;
  std::set<std::pair<std::string, component_id> > links;
  for (std::vector<fixture_entry>::const_iterator
	 p = entries.begin(), end = entries.end(); p != end; ++p) {
    if (p->kind == fixture_entry::node) {
      source.add_node(p->scope, p->ofuri, p->active);
      continue;
    }
    component_version c(component_id(), p->identity, p->evr);
    c.id = component_id(std::string(to_string(p->identity.ns)) + '/'
			+ p->identity.type + '/' + c.nevra());
    if (components.insert(c.id).second) {
      source.add_component(c);
    }
    if (p->kind == fixture_entry::member) {
      std::string node(to_string(p->scope));
      node += '/';
      node += p->ofuri;
      if (links.insert(std::make_pair(node, c.id)).second) {
	source.add_membership(p->scope, p->ofuri, c.id);
      }
    }
  }
}
