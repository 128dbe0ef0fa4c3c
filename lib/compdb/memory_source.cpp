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

#include <compdb/memory_source.hpp>
#include <compdb/root_component.hpp>
#include <compdb/string_support.hpp>
#include <compdb/raise.hpp>

#include <map>
#include <stdexcept>
#include <vector>

using namespace compdb;

namespace {
  typedef std::pair<scope_type::type, std::string> node_key;

  struct membership {
    node_key node;
    component_id component;

    membership(const node_key &n, const component_id &c)
      : node(n), component(c)
    {
    }
  };
}

struct memory_source::impl {
  std::map<node_key, bool> nodes; // value is the active flag
  std::map<component_id, component_version> components;
  std::vector<membership> memberships;
  unsigned cursors_opened;

  impl()
    : cursors_opened(0)
  {
  }
};

// Filters the membership list.  If identity is NULL, all root
// components are returned.
class memory_source::cursor_impl : public candidate_source::cursor {
  std::shared_ptr<memory_source::impl> impl_;
  node_key node_;
  bool has_identity_;
  component_identity identity_;
  size_t position_;
  bool visible_;
public:
  cursor_impl(const std::shared_ptr<memory_source::impl> &,
	      const taxonomy_scope &, const component_identity *);
  ~cursor_impl();
  bool next(component_version &);
};

memory_source::cursor_impl::cursor_impl
  (const std::shared_ptr<memory_source::impl> &i,
   const taxonomy_scope &scope, const component_identity *identity)
  : impl_(i), node_(scope.type, scope.ofuri),
    has_identity_(identity != NULL), position_(0), visible_(false)
{
  if (identity != NULL) {
    identity_ = *identity;
  }
  std::map<node_key, bool>::const_iterator p = impl_->nodes.find(node_);
  if (p != impl_->nodes.end()) {
    visible_ = p->second || !scope.active_only();
  }
}

memory_source::cursor_impl::~cursor_impl()
{
}

bool
memory_source::cursor_impl::next(component_version &result)
{
  if (!visible_) {
    return false;
  }
  const std::vector<membership> &members(impl_->memberships);
  while (position_ < members.size()) {
    const membership &m(members[position_]);
    ++position_;
    if (m.node != node_) {
      continue;
    }
    const component_version &c(impl_->components.find(m.component)->second);
    if (has_identity_) {
      if (c.identity != identity_) {
	continue;
      }
    } else if (!is_root_component(c.identity)) {
      continue;
    }
    result = c;
    return true;
  }
  return false;
}

//////////////////////////////////////////////////////////////////////
// memory_source

memory_source::memory_source()
  : impl_(new impl)
{
}

memory_source::~memory_source()
{
}

void
memory_source::add_node(scope_type::type type, const std::string &ofuri,
			bool active)
{
  node_key key(traits(type).type, ofuri);
  if (!impl_->nodes.insert(std::make_pair(key, active)).second) {
    raise<std::runtime_error>(std::string("duplicate ") + to_string(type)
			      + " node: " + quote(ofuri));
  }
}

void
memory_source::add_component(const component_version &c)
{
  if (!c.id.valid()) {
    raise<std::runtime_error>("component without id: " + c.nevra());
  }
  if (!impl_->components.insert(std::make_pair(c.id, c)).second) {
    raise<std::runtime_error>("duplicate component id: "
			      + quote(c.id.value()));
  }
}

void
memory_source::add_membership(scope_type::type type, const std::string &ofuri,
			      const component_id &id)
{
  node_key key(traits(type).type, ofuri);
  if (impl_->nodes.find(key) == impl_->nodes.end()) {
    raise<std::runtime_error>(std::string("unknown ") + to_string(type)
			      + " node: " + quote(ofuri));
  }
  if (impl_->components.find(id) == impl_->components.end()) {
    raise<std::runtime_error>("unknown component id: " + quote(id.value()));
  }
  impl_->memberships.push_back(membership(key, id));
}

unsigned
memory_source::cursors_opened() const
{
  return impl_->cursors_opened;
}

std::unique_ptr<candidate_source::cursor>
memory_source::candidates(const component_identity &identity,
			  const taxonomy_scope &scope)
{
  std::unique_ptr<cursor> result(new cursor_impl(impl_, scope, &identity));
  ++impl_->cursors_opened;
  return result;
}

std::unique_ptr<candidate_source::cursor>
memory_source::root_components(const taxonomy_scope &scope)
{
  std::unique_ptr<cursor> result(new cursor_impl(impl_, scope, NULL));
  ++impl_->cursors_opened;
  return result;
}
