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

#include <string>

namespace compdb {

// Throws an exception of type E.  Kept out of line at the call site
// so that error paths do not bloat the callers.
template <class E> void raise() __attribute__((noreturn));
template <class E> void raise(const char *) __attribute__((noreturn));
template <class E> void raise(const std::string &) __attribute__((noreturn));

template <class E> void
raise()
{
  throw E();
}

template <class E> void
raise(const char *message)
{
  throw E(message);
}

template <class E> void
raise(const std::string &message)
{
  throw E(message);
}

} // namespace compdb
