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

#include <compdb/taxonomy_scope.hpp>
#include <compdb/query_error.hpp>
#include <compdb/string_support.hpp>
#include <compdb/raise.hpp>

#include <cstdio>

using namespace compdb;

// Indexed by scope_type::type.
static const scope_traits scope_table[] = {
  {scope_type::product, "Product",
   "compdb.product", "compdb.component_product", false},
  {scope_type::product_version, "ProductVersion",
   "compdb.product_version", "compdb.component_product_version", false},
  {scope_type::product_stream, "ProductStream",
   "compdb.product_stream", "compdb.component_product_stream", true},
  {scope_type::product_variant, "ProductVariant",
   "compdb.product_variant", "compdb.component_product_variant", false},
};

static const unsigned scope_count = sizeof(scope_table) / sizeof(scope_table[0]);

const scope_traits &
compdb::traits(scope_type::type type)
{
  unsigned index = static_cast<unsigned>(type);
  if (index >= scope_count) {
    char buf[64];
    snprintf(buf, sizeof(buf), "invalid scope type value: %d",
	     static_cast<int>(type));
    raise<query_error>(buf);
  }
  return scope_table[index];
}

const char *
compdb::to_string(scope_type::type type)
{
  return traits(type).name;
}

bool
compdb::parse_scope_type(const std::string &name, scope_type::type &type)
{
  for (unsigned i = 0; i < scope_count; ++i) {
    if (name == scope_table[i].name) {
      type = scope_table[i].type;
      return true;
    }
  }
  return false;
}

scope_type::type
compdb::scope_type_from_string(const std::string &name)
{
  scope_type::type type;
  if (!parse_scope_type(name, type)) {
    raise<query_error>("unknown scope type: \"" + quote(name) + "\"");
  }
  return type;
}

//////////////////////////////////////////////////////////////////////
// taxonomy_scope

taxonomy_scope::taxonomy_scope()
  : type(scope_type::product_stream), include_inactive_streams(false)
{
}

taxonomy_scope::taxonomy_scope(scope_type::type t, const std::string &uri,
			       bool include_inactive)
  : type(t), ofuri(uri), include_inactive_streams(include_inactive)
{
}

taxonomy_scope::~taxonomy_scope()
{
}

void
taxonomy_scope::check() const
{
  traits(type);
  if (ofuri.empty()) {
    raise<query_error>(std::string("empty ofuri for ") + to_string(type));
  }
}

bool
taxonomy_scope::active_only() const
{
  return traits(type).has_active && !include_inactive_streams;
}
