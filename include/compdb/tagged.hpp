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

namespace compdb {

// Creates distinct types from a single type T.  A default-constructed
// value (T()) conventionally means "no object".
template <class T, class Tag>
class tagged {
  T value_;
public:
  typedef Tag tag;

  tagged()
    : value_()
  {
  }

  explicit tagged(const T &value)
    : value_(value)
  {
  }

  const T &value() const
  {
    return value_;
  }

  // True if this is not the default value.
  bool valid() const
  {
    return !(value_ == T());
  }

  bool operator==(const tagged &o) const { return value_ == o.value_; }
  bool operator!=(const tagged &o) const { return !(value_ == o.value_); }
  bool operator<(const tagged &o) const { return value_ < o.value_; }
  bool operator>(const tagged &o) const { return o.value_ < value_; }
};

} // namespace compdb
