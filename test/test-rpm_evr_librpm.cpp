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


#include <compdb/rpm_evr.hpp>

#include "test.hpp"

#include <rpm/rpmlib.h>		// rpmvercmp

#include <vector>

using namespace compdb;

// Returns true if the first segment which differs between A and B is
// a '^' on one side and a letter run on the other.  librpm sorts the
// '^' side lower in this case, vercmp() sorts it higher.
static bool
caret_meets_letters(const char *a, const char *b)
{
  std::vector<version_token> one;
  std::vector<version_token> two;
  tokenize_version(a, one);
  tokenize_version(b, two);
  for (size_t i = 0; i < one.size() && i < two.size(); ++i) {
    const version_token &x(one[i]);
    const version_token &y(two[i]);
    if (x.kind != y.kind) {
      return (x.kind == version_token::caret && y.kind == version_token::alpha)
	|| (x.kind == version_token::alpha && y.kind == version_token::caret);
    }
    if (x.kind == version_token::numeric) {
      if (vercmp(x.text, y.text) != 0) {
	return false;
      }
    } else if (x.text != y.text) {
      return false;
    }
  }
  return false;
}

static void
test_known_divergences()
{
  static const char *const pairs[][2] = {
    {"1.0^git1", "1.0git"},
    {"1.0^a", "1.0a"},
    {"2^b", "2c"},
    {"1.0^", "1.0arc1"},
    {"^", "a"},
    {NULL, NULL}
  };
  for (const char *const (*p)[2] = pairs; (*p)[0]; ++p) {
    test_section ts(std::string((*p)[0]) + " <=> " + (*p)[1]);
    CHECK(caret_meets_letters((*p)[0], (*p)[1]));
    COMPARE_NUMBER(rpmvercmp((*p)[0], (*p)[1]), -1);
    COMPARE_NUMBER(vercmp((*p)[0], (*p)[1]), 1);
  }
}

// Compares vercmp() with the reference implementation in librpm on
// all pairs of a version corpus.  Pairs where '^' meets a letter run
// have the opposite result.
static void
test()
{
  test_known_divergences();
  static const char *const versions[] = {
    "", "0", "00", "1", "01", "1.0", "1.00", "1.0.0", "1.01", "1.1",
    "1.2", "1.2.3", "1.2.5", "1.3.5", "1.8.3", "1.9", "1.10", "1.1.1.1.1.1.1.1",
    "7.29.0", "8.3.0", "2.0", "2_0", "2.0.1", "2.0.1a", "5.5p1", "5.5p2",
    "5.5p10", "5.6p1", "6.5p1", "6.0", "6.0.rc1", "10a1", "10b2", "10xyz",
    "10.1xyz", "xyz10", "xyz10.1", "xyz.4", "a", "aa", "b", "A", "Z", "+",
    "_", "+a", "_a", "a+", "a_", "+_", "_+", "~", "~~", "~1", "1~",
    "1.0~rc1", "1.0~rc2", "1.0~rc1~git123", "1.0arc1", "^", "^1", "1^",
    "1.0^", "1.0^git1", "1.0^git2", "1.0^20160101", "1.0^20160101^git1",
    "1.0~rc1^git1", "1.0^git1~pre", "1.0.1", "20101121", "20101122",
    "4.999.9", "5.0", "10.0001", "10.0039", "13.el7", "10.el9", "19.el9",
    "3.el8_6", "3.el8_10", "1.fc38", "1.fc38.1", "0.rc1.fc38",
    "99999999999999999999", "100000000000000000000",
    NULL
  };
  for (const char *const *a = versions; *a; ++a) {
    for (const char *const *b = versions; *b; ++b) {
      int expected = rpmvercmp(*a, *b);
      if (caret_meets_letters(*a, *b)) {
	expected = -expected;
      }
      if (expected != vercmp(*a, *b)) {
	test_section ts(std::string(*a) + " <=> " + *b);
	COMPARE_NUMBER(vercmp(*a, *b), expected);
      } else {
	test_compare_number_success();
      }
    }
  }
}

static test_register t("rpm_evr/librpm", test);
