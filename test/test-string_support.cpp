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


#include <compdb/string_support.hpp>

#include "test.hpp"

using namespace compdb;

static void
test_quote()
{
  COMPARE_STRING(quote(""), "");
  COMPARE_STRING(quote("a"), "a");
  COMPARE_STRING(quote("a\t"), "a\\t");
  COMPARE_STRING(quote("a\r"), "a\\r");
  COMPARE_STRING(quote("a\n"), "a\\n");
  COMPARE_STRING(quote("a\tb"), "a\\tb");
  COMPARE_STRING(quote("a b"), "a b");
  COMPARE_STRING(quote("a\"b'c\\"), "a\\\"b\\'c\\\\");
  COMPARE_STRING(quote("a\377b"), "a\\xffb");
  COMPARE_STRING(quote("a\177b"), "a\\x7fb");
  COMPARE_STRING(quote("a\200b"), "a\\x80b");
  COMPARE_STRING(quote(std::string("a\000b\377c", 6)), "a\\x00b\\xffc\\x00");
}

static void
test_strip()
{
  COMPARE_STRING(strip(""), "");
  COMPARE_STRING(strip(" \t\n"), "");
  COMPARE_STRING(strip("abc"), "abc");
  COMPARE_STRING(strip("  a b\t\r\n"), "a b");
}

static void
test_parse_unsigned_long_long()
{
  unsigned long long value = 17;
  CHECK(parse_unsigned_long_long("0", value));
  COMPARE_NUMBER(value, 0ULL);
  CHECK(parse_unsigned_long_long(" 42\n", value));
  COMPARE_NUMBER(value, 42ULL);
  CHECK(parse_unsigned_long_long("18446744073709551615", value));
  COMPARE_NUMBER(value, 18446744073709551615ULL);
  value = 17;
  CHECK(!parse_unsigned_long_long("", value));
  CHECK(!parse_unsigned_long_long(" ", value));
  CHECK(!parse_unsigned_long_long("-1", value));
  CHECK(!parse_unsigned_long_long("+1", value));
  CHECK(!parse_unsigned_long_long("1x", value));
  CHECK(!parse_unsigned_long_long("1 2", value));
  CHECK(!parse_unsigned_long_long("18446744073709551616", value));
  COMPARE_NUMBER(value, 17ULL);
}

static void
test_split()
{
  std::vector<std::string> fields;
  split("", '\t', fields);
  COMPARE_NUMBER(fields.size(), 1U);
  COMPARE_STRING(fields.at(0), "");

  split("a\tb\t\tc\t", '\t', fields);
  COMPARE_NUMBER(fields.size(), 5U);
  if (fields.size() == 5) {
    COMPARE_STRING(fields[0], "a");
    COMPARE_STRING(fields[1], "b");
    COMPARE_STRING(fields[2], "");
    COMPARE_STRING(fields[3], "c");
    COMPARE_STRING(fields[4], "");
  }
}

static void
test_starts_with()
{
  CHECK(starts_with("ProductStream", "Product"));
  CHECK(starts_with("abc", ""));
  CHECK(!starts_with("Pro", "Product"));
  CHECK(!starts_with("product", "Product"));
}

static test_register t1("string_support/quote", test_quote);
static test_register t2("string_support/strip", test_strip);
static test_register t3("string_support/parse_unsigned_long_long",
			test_parse_unsigned_long_long);
static test_register t4("string_support/split", test_split);
static test_register t5("string_support/starts_with", test_starts_with);
