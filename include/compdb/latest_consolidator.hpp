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
#include <compdb/tie_break.hpp>

#include <map>
#include <vector>

namespace compdb {

// Picks the latest component for each component identity.  Entries
// which lose are collected as superseded.
template <class T>
class latest_consolidator {
  struct value {
    component_version version;
    T data;

    value(const component_version &ver, const T &val)
      : version(ver), data(val)
    {
    }
  };

  typedef std::map<component_identity, value> identity_map;
  identity_map map;
  std::vector<T> superseded_;
  tie_break::type policy_;

public:
  explicit latest_consolidator(tie_break::type = tie_break::last_visited);
  ~latest_consolidator();

  void add(const component_version &, const T &value);

  // The latest entries, ordered by component identity.
  std::vector<T> values() const;

  // The entries which were replaced or rejected, in the order in
  // which this happened.
  const std::vector<T> &superseded() const;
};

template <class T>
latest_consolidator<T>::latest_consolidator(tie_break::type policy)
  : policy_(policy)
{
}

template <class T>
latest_consolidator<T>::~latest_consolidator()
{
}

template <class T>
void
latest_consolidator<T>::add(const component_version &ver, const T &v)
{
  typename identity_map::iterator p(map.find(ver.identity));
  if (p == map.end()) {
    map.insert(std::make_pair(ver.identity, value(ver, v)));
  } else {
    if (supersedes(ver, p->second.version, policy_)) {
      superseded_.push_back(p->second.data);
      p->second.version = ver;
      p->second.data = v;
    } else {
      superseded_.push_back(v);
    }
  }
}

template <class T>
std::vector<T>
latest_consolidator<T>::values() const
{
  std::vector<T> result;
  for (const typename identity_map::value_type &entry : map) {
    result.push_back(entry.second.data);
  }
  return result;
}

template <class T>
const std::vector<T> &
latest_consolidator<T>::superseded() const
{
  return superseded_;
}

} // namespace compdb
