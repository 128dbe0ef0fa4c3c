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

#include <stdexcept>
#include <string>

namespace compdb {

// Invalid caller input to a catalog query (unknown scope type, empty
// ofuri, incomplete component identity).  Retrying the same query
// cannot succeed.
class query_error : public std::exception {
  std::string what_;
public:
  explicit query_error(const std::string &);
  ~query_error() throw();
  const char *what() const throw();
};

} // namespace compdb
