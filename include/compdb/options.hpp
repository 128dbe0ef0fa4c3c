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

#include <compdb/tie_break.hpp>

#include <stdexcept>
#include <string>

namespace compdb {

class compdb_options {
public:
  enum {
    standard, verbose, quiet
  } output;

  // libpq connection string.  Empty means that the PG* environment
  // variables are used.
  std::string database;

  // Components of inactive product streams are considered, too.
  bool include_inactive;

  // Print the superseded components instead of the latest ones.
  bool superseded;

  tie_break::type tie;

  // statement_timeout in milliseconds, 0 for no timeout.
  unsigned timeout;

  compdb_options();
  ~compdb_options();

  // Sets the tie-break policy from its name.  Throws usage_error if
  // the name is invalid.
  void set_tie_break(const char *);

  // Sets the timeout from a decimal number of milliseconds.  Throws
  // usage_error if the number is invalid.
  void set_timeout(const char *);

  class usage_error : public std::exception {
    std::string what_;
  public:
    usage_error(const std::string &);
    ~usage_error() throw();
    const char *what() const throw();
  };
};

} // namespace compdb
