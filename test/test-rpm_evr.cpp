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

#include <vector>

using namespace compdb;

namespace {
  struct vercmp_case {
    const char *left;
    const char *right;
    int expected;
  };

  const vercmp_case vercmp_cases[] = {
    {"1.2.3", "1.2.5", -1},
    {"1.8.3", "1.3.5", 1},
    {"1.1.1.1.1.1.1.1", "1.3.5", -1},
    {"7.29.0", "8.3.0", -1},
    {"1.0", "1.0", 0},
    {"1.0", "2.0", -1},
    {"2.0.1", "2.0.1", 0},
    {"2.0", "2.0.1", -1},
    {"2.0.1a", "2.0.1a", 0},
    {"2.0.1a", "2.0.1", 1},
    {"5.5p1", "5.5p2", -1},
    {"5.5p10", "5.5p1", 1},
    {"10xyz", "10.1xyz", -1},
    {"xyz10", "xyz10.1", -1},
    {"xyz.4", "8", -1},
    {"xyz.4", "2", -1},
    {"5.5p2", "5.6p1", -1},
    {"5.6p1", "6.5p1", -1},
    {"6.0", "6.0.rc1", -1},
    {"10b2", "10a1", 1},
    {"1.0aa", "1.0a", 1},
    {"10.0001", "10.1", 0},
    {"10.0001", "10.0039", -1},
    {"4.999.9", "5.0", -1},
    {"20101121", "20101122", -1},
    {"2_0", "2_0", 0},
    {"2.0", "2_0", 0},
    {"a", "a", 0},
    {"a+", "a+", 0},
    {"a+", "a_", 0},
    {"+a", "+a", 0},
    {"+a", "_a", 0},
    {"+_", "_+", 0},
    {"+", "_", 0},
    {"1.0~rc1", "1.0~rc1", 0},
    {"1.0~rc1", "1.0", -1},
    {"1.0~rc1", "1.0~rc2", -1},
    {"1.0~rc1~git123", "1.0~rc1", -1},
    {"1.0~rc1", "1.0arc1", -1},
    {"1.0^git1", "1.0", 1},
    {"1.0^git1", "1.0^git2", -1},
    {"1.0^git1", "1.01", -1},
    {"1.0^20160101", "1.0.1", -1},
    {"1.0^20160101^git1", "1.0^20160101", 1},
    {"1.0~rc1^git1", "1.0~rc1", 1},
    {"1.0^git1~pre", "1.0^git1", -1},
    {"1.0^git1", "1.0git", 1},
    {"1.0^a", "1.0a", 1},
    {"2^b", "2c", 1},
    {"1.0^", "1.0arc1", 1},
    {"^", "a", 1},
    {"^", "~", 1},
    {"1.0^git1", "1.0.1", -1},
    {"", "", 0},
    {"", "0", -1},
    {"", "a", -1},
    {"", "~", 1},
    {"0", "00", 0},
    {"a", "1", -1},
    {NULL, NULL, 0}
  };
}

static void
test_vercmp_cases()
{
  for (const vercmp_case *p = vercmp_cases; p->left; ++p) {
    test_section ts(std::string(p->left) + " <=> " + p->right);
    COMPARE_NUMBER(vercmp(p->left, p->right), p->expected);
    COMPARE_NUMBER(vercmp(p->right, p->left), -p->expected);
  }
}

static void
test_vercmp_properties()
{
  std::vector<std::string> corpus;
  for (const vercmp_case *p = vercmp_cases; p->left; ++p) {
    corpus.push_back(p->left);
    corpus.push_back(p->right);
  }
  for (size_t i = 0; i < corpus.size(); ++i) {
    test_section ts(corpus[i]);
    COMPARE_NUMBER(vercmp(corpus[i], corpus[i]), 0);
    for (size_t j = 0; j < corpus.size(); ++j) {
      int ij = vercmp(corpus[i], corpus[j]);
      CHECK(ij == -1 || ij == 0 || ij == 1);
      COMPARE_NUMBER(vercmp(corpus[j], corpus[i]), -ij);
      for (size_t k = 0; k < corpus.size(); ++k) {
	int jk = vercmp(corpus[j], corpus[k]);
	if (ij <= 0 && jk <= 0) {
	  // Transitivity, including equivalence.
	  int ik = vercmp(corpus[i], corpus[k]);
	  CHECK(ik <= 0);
	  if (ij == 0 && jk == 0) {
	    COMPARE_NUMBER(ik, 0);
	  } else if (ij < 0 || jk < 0) {
	    COMPARE_NUMBER(ik, -1);
	  }
	}
      }
    }
  }
}

static void
test_evrcmp()
{
  COMPARE_NUMBER(evrcmp(2, "6.4.0", "13.el7", 3, "7.91", "10.el9"), -1);
  COMPARE_NUMBER(evrcmp(3, "6.4.0", "13.el7", 2, "7.91", "19.el9"), 1);
  COMPARE_NUMBER(evrcmp(0, "1.0", "1", 0, "1.0", "1"), 0);
  COMPARE_NUMBER(evrcmp(0, "1.0", "2", 0, "1.0", "10"), -1);
  COMPARE_NUMBER(evrcmp(0, "1.10", "1", 0, "1.9", "2"), 1);
  COMPARE_NUMBER(evrcmp(1, "0.1", "", 0, "99", "99"), 1);
  COMPARE_NUMBER(evrcmp(0, "1.0", "", 0, "1.0", "1"), -1);

  rpm_evr a(0, "1.2", "1");
  rpm_evr b(0, "1.10", "1");
  COMPARE_NUMBER(a.compare(b), -1);
  COMPARE_NUMBER(b.compare(a), 1);
  CHECK(a < b);
  CHECK(!(b < a));
  CHECK(!(a < a));
  COMPARE_STRING(a.to_string(), "1.2-1");
  COMPARE_STRING(rpm_evr(3, "7.91", "10.el9").to_string(), "3:7.91-10.el9");
  COMPARE_STRING(rpm_evr(0, "2.1", "").to_string(), "2.1");
}

static void
test_parse_evr()
{
  rpm_evr evr;
  CHECK(parse_evr("1.0", evr));
  COMPARE_NUMBER(evr.epoch, 0);
  COMPARE_STRING(evr.version, "1.0");
  COMPARE_STRING(evr.release, "");

  CHECK(parse_evr("2:6.4.0-13.el7", evr));
  COMPARE_NUMBER(evr.epoch, 2);
  COMPARE_STRING(evr.version, "6.4.0");
  COMPARE_STRING(evr.release, "13.el7");

  // The release starts after the last dash.
  CHECK(parse_evr("1.0-beta-3", evr));
  COMPARE_NUMBER(evr.epoch, 0);
  COMPARE_STRING(evr.version, "1.0-beta");
  COMPARE_STRING(evr.release, "3");

  CHECK(parse_evr("0:1-", evr));
  COMPARE_STRING(evr.version, "1");
  COMPARE_STRING(evr.release, "");

  evr = rpm_evr(7, "unchanged", "x");
  CHECK(!parse_evr("", evr));
  CHECK(!parse_evr(":1.0", evr));
  CHECK(!parse_evr("x:1.0", evr));
  CHECK(!parse_evr("-1:1.0", evr));
  CHECK(!parse_evr("1:", evr));
  CHECK(!parse_evr("1:-2", evr));
  CHECK(!parse_evr("99999999999:1.0", evr));
  COMPARE_NUMBER(evr.epoch, 7);
  COMPARE_STRING(evr.version, "unchanged");
  COMPARE_STRING(evr.release, "x");
}

static void
test_tokenize_version()
{
  std::vector<version_token> tokens;
  tokenize_version("1.02a~rc1^git_", tokens);
  COMPARE_NUMBER(tokens.size(), 8U);
  if (tokens.size() == 8) {
    CHECK(tokens[0] == version_token(version_token::numeric, "1"));
    CHECK(tokens[1] == version_token(version_token::numeric, "02"));
    CHECK(tokens[2] == version_token(version_token::alpha, "a"));
    CHECK(tokens[3] == version_token(version_token::tilde, "~"));
    CHECK(tokens[4] == version_token(version_token::alpha, "rc"));
    CHECK(tokens[5] == version_token(version_token::numeric, "1"));
    CHECK(tokens[6] == version_token(version_token::caret, "^"));
    CHECK(tokens[7] == version_token(version_token::alpha, "git"));
  }

  tokenize_version("", tokens);
  CHECK(tokens.empty());
  tokenize_version("+-_.", tokens);
  CHECK(tokens.empty());
}

static test_register t1("rpm_evr/vercmp", test_vercmp_cases);
static test_register t2("rpm_evr/vercmp_properties", test_vercmp_properties);
static test_register t3("rpm_evr/evrcmp", test_evrcmp);
static test_register t4("rpm_evr/parse_evr", test_parse_evr);
static test_register t5("rpm_evr/tokenize_version", test_tokenize_version);
