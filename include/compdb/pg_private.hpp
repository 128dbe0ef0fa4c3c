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

// This header file contains only internal declarations.  Do not use
// directly.

#include <compdb/endian.hpp>
#include <compdb/pgconn_handle.hpp>
#include <compdb/pgresult_handle.hpp>

#include <cstring>
#include <string>

#include <libpq-fe.h>

namespace compdb {

// Not for direct use.
namespace pg_private {
  template <class T>
  struct dispatch {
  };

  template <>
  struct dispatch<bool> {
    static const Oid oid = 16;
    static const int storage = 1;
    static const char *store(char *, bool);
    static int length(bool) { return storage; }
    static void load(PGresult *, int row, int col, bool &);
  };

  template <>
  struct dispatch<const bool> : dispatch<bool> {
  };

  template <>
  struct dispatch<int> {
    static const Oid oid = 23;
    static const int storage = 4;
    static const char *store(char *, int);
    static int length(int) { return storage; }
    static void load(PGresult *, int row, int col, int &);
  };

  template <>
  struct dispatch<const int> : dispatch<int> {
  };

  template <>
  struct dispatch<const char *> {
    static const Oid oid = 25;
    static const int storage = 0;
    static const char *store(char *, const char *);
    static int length(const char *);
  };

  template <>
  struct dispatch<std::string> {
    static const Oid oid = 25;
    static const int storage = 0;
    static const char *store(char *, const std::string &);
    static int length(const std::string &);
    static void load(PGresult *, int row, int col, std::string &);
  };

  template <>
  struct dispatch<const std::string> : dispatch<std::string> {
  };

  // Throws pg_exception if the length is not representable.
  int length_check(size_t);

  // Parameter arrays for PQexecParams() and PQsendQueryParams().  All
  // parameters use the binary format.
  template <unsigned N>
  struct params {
    Oid types[N];
    const char *values[N];
    int lengths[N];
    int formats[N];
    char storage[N][8];

    template <class T> void
    set(unsigned i, const T &value)
    {
      types[i] = dispatch<T>::oid;
      values[i] = dispatch<T>::store(storage[i], value);
      lengths[i] = dispatch<T>::length(value);
      formats[i] = 1;
    }

    void
    exec(pgconn_handle &conn, pgresult_handle &res, const char *command,
	 int resultFormat)
    {
      res.execParamsCustom(conn, command, N, types, values, lengths, formats,
			   resultFormat);
    }

    void
    send(pgconn_handle &conn, const char *command, int resultFormat)
    {
      conn.sendQueryParams(command, N, types, values, lengths, formats,
			   resultFormat);
    }
  };

  inline const char *
  dispatch<bool>::store(char *buffer, bool val)
  {
    buffer[0] = val;
    return buffer;
  }

  inline const char *
  dispatch<int>::store(char *buffer, int val)
  {
    unsigned be = cpu_to_be_32(val);
    memcpy(buffer, &be, sizeof(be));
    return buffer;
  }

  inline int
  dispatch<const char *>::length(const char *str)
  {
    return length_check(str == NULL ? 0 : strlen(str));
  }

  inline const char *
  dispatch<const char *>::store(char *, const char *str)
  {
    return str;
  }

  inline const char *
  dispatch<std::string>::store(char *, const std::string &str)
  {
    return str.c_str();
  }
} // namespace pg_private

} // namespace compdb
