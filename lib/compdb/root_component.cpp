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

#include <compdb/root_component.hpp>
#include <compdb/component.hpp>

using namespace compdb;

const root_component_rule compdb::root_component_rules[] = {
  {"RPM", "src", NULL},
  {"RPMMOD", NULL, NULL},
  {"OCI", "noarch", NULL},
  {"GITHUB", "noarch", "REDHAT"},
  {NULL, NULL, NULL}
};

bool
compdb::is_root_component(const component_identity &ident)
{
  const char *ns = to_string(ident.ns);
  for (const root_component_rule *p = root_component_rules; p->type; ++p) {
    if (ident.type != p->type) {
      continue;
    }
    if (p->arch != NULL && ident.arch != p->arch) {
      continue;
    }
    if (p->ns != NULL && std::string(p->ns) != ns) {
      continue;
    }
    return true;
  }
  return false;
}

static void
append_column(std::string &sql, const char *alias, const char *column)
{
  if (alias != NULL) {
    sql += alias;
    sql += '.';
  }
  sql += column;
}

// The rule values are constants without quote characters, so they
// can be embedded directly.
static void
append_equals(std::string &sql, const char *alias, const char *column,
	      const char *value)
{
  append_column(sql, alias, column);
  sql += " = '";
  sql += value;
  sql += '\'';
}

std::string
compdb::root_component_condition(const char *alias)
{
  std::string sql("(");
  for (const root_component_rule *p = root_component_rules; p->type; ++p) {
    if (p != root_component_rules) {
      sql += " OR ";
    }
    sql += '(';
    append_equals(sql, alias, "type", p->type);
    if (p->arch != NULL) {
      sql += " AND ";
      append_equals(sql, alias, "arch", p->arch);
    }
    if (p->ns != NULL) {
      sql += " AND ";
      append_equals(sql, alias, "namespace", p->ns);
    }
    sql += ')';
  }
  sql += ')';
  return sql;
}
