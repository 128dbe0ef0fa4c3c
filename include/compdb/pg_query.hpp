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

#include <compdb/pg_private.hpp>

namespace compdb {

// The pg_query functions execute COMMAND with the arguments as
// parameters ($1, $2, ...), passed in binary format.  The parameter
// types are derived from the argument types.  pg_query() requests
// results in text format, pg_query_binary() in binary format.
// pg_send_query_binary() sends the query without waiting for the
// result; use pgresult_handle::getresult() to retrieve it.

template <class T1> inline void
pg_query(pgconn_handle &conn, pgresult_handle &res, const char *command,
	 const T1 &t1)
{
  pg_private::params<1> p;
  p.set(0, t1);
  p.exec(conn, res, command, 0);
}

template <class T1, class T2> inline void
pg_query(pgconn_handle &conn, pgresult_handle &res, const char *command,
	 const T1 &t1, const T2 &t2)
{
  pg_private::params<2> p;
  p.set(0, t1);
  p.set(1, t2);
  p.exec(conn, res, command, 0);
}

template <class T1, class T2, class T3> inline void
pg_query(pgconn_handle &conn, pgresult_handle &res, const char *command,
	 const T1 &t1, const T2 &t2, const T3 &t3)
{
  pg_private::params<3> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.exec(conn, res, command, 0);
}

template <class T1, class T2, class T3, class T4> inline void
pg_query(pgconn_handle &conn, pgresult_handle &res, const char *command,
	 const T1 &t1, const T2 &t2, const T3 &t3, const T4 &t4)
{
  pg_private::params<4> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.set(3, t4);
  p.exec(conn, res, command, 0);
}

template <class T1, class T2, class T3, class T4, class T5> inline void
pg_query(pgconn_handle &conn, pgresult_handle &res, const char *command,
	 const T1 &t1, const T2 &t2, const T3 &t3, const T4 &t4,
	 const T5 &t5)
{
  pg_private::params<5> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.set(3, t4);
  p.set(4, t5);
  p.exec(conn, res, command, 0);
}

template <class T1, class T2, class T3, class T4, class T5,
	  class T6> inline void
pg_query(pgconn_handle &conn, pgresult_handle &res, const char *command,
	 const T1 &t1, const T2 &t2, const T3 &t3, const T4 &t4,
	 const T5 &t5, const T6 &t6)
{
  pg_private::params<6> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.set(3, t4);
  p.set(4, t5);
  p.set(5, t6);
  p.exec(conn, res, command, 0);
}

template <class T1, class T2, class T3, class T4, class T5,
	  class T6, class T7> inline void
pg_query(pgconn_handle &conn, pgresult_handle &res, const char *command,
	 const T1 &t1, const T2 &t2, const T3 &t3, const T4 &t4,
	 const T5 &t5, const T6 &t6, const T7 &t7)
{
  pg_private::params<7> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.set(3, t4);
  p.set(4, t5);
  p.set(5, t6);
  p.set(6, t7);
  p.exec(conn, res, command, 0);
}

template <class T1> inline void
pg_query_binary(pgconn_handle &conn, pgresult_handle &res, const char *command,
		const T1 &t1)
{
  pg_private::params<1> p;
  p.set(0, t1);
  p.exec(conn, res, command, 1);
}

template <class T1, class T2> inline void
pg_query_binary(pgconn_handle &conn, pgresult_handle &res, const char *command,
		const T1 &t1, const T2 &t2)
{
  pg_private::params<2> p;
  p.set(0, t1);
  p.set(1, t2);
  p.exec(conn, res, command, 1);
}

template <class T1, class T2, class T3> inline void
pg_query_binary(pgconn_handle &conn, pgresult_handle &res, const char *command,
		const T1 &t1, const T2 &t2, const T3 &t3)
{
  pg_private::params<3> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.exec(conn, res, command, 1);
}

template <class T1, class T2, class T3, class T4> inline void
pg_query_binary(pgconn_handle &conn, pgresult_handle &res, const char *command,
		const T1 &t1, const T2 &t2, const T3 &t3, const T4 &t4)
{
  pg_private::params<4> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.set(3, t4);
  p.exec(conn, res, command, 1);
}

template <class T1, class T2, class T3, class T4, class T5> inline void
pg_query_binary(pgconn_handle &conn, pgresult_handle &res, const char *command,
		const T1 &t1, const T2 &t2, const T3 &t3, const T4 &t4,
		const T5 &t5)
{
  pg_private::params<5> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.set(3, t4);
  p.set(4, t5);
  p.exec(conn, res, command, 1);
}

template <class T1, class T2, class T3, class T4, class T5,
	  class T6> inline void
pg_query_binary(pgconn_handle &conn, pgresult_handle &res, const char *command,
		const T1 &t1, const T2 &t2, const T3 &t3, const T4 &t4,
		const T5 &t5, const T6 &t6)
{
  pg_private::params<6> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.set(3, t4);
  p.set(4, t5);
  p.set(5, t6);
  p.exec(conn, res, command, 1);
}

template <class T1, class T2, class T3, class T4, class T5,
	  class T6, class T7> inline void
pg_query_binary(pgconn_handle &conn, pgresult_handle &res, const char *command,
		const T1 &t1, const T2 &t2, const T3 &t3, const T4 &t4,
		const T5 &t5, const T6 &t6, const T7 &t7)
{
  pg_private::params<7> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.set(3, t4);
  p.set(4, t5);
  p.set(5, t6);
  p.set(6, t7);
  p.exec(conn, res, command, 1);
}

template <class T1> inline void
pg_send_query_binary(pgconn_handle &conn, const char *command,
		     const T1 &t1)
{
  pg_private::params<1> p;
  p.set(0, t1);
  p.send(conn, command, 1);
}

template <class T1, class T2, class T3, class T4, class T5> inline void
pg_send_query_binary(pgconn_handle &conn, const char *command,
		     const T1 &t1, const T2 &t2, const T3 &t3, const T4 &t4,
		     const T5 &t5)
{
  pg_private::params<5> p;
  p.set(0, t1);
  p.set(1, t2);
  p.set(2, t3);
  p.set(3, t4);
  p.set(4, t5);
  p.send(conn, command, 1);
}

} // namespace compdb
