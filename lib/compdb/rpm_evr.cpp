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

#include <climits>
#include <cstdio>

using namespace compdb;

// Locale-independent character classes, as in rpmvercmp.c.
static inline bool
ascii_digit(char ch)
{
  return '0' <= ch && ch <= '9';
}

static inline bool
ascii_alpha(char ch)
{
  return ('a' <= ch && ch <= 'z') || ('A' <= ch && ch <= 'Z');
}

void
compdb::tokenize_version(const std::string &str,
			 std::vector<version_token> &result)
{
  result.clear();
  const char *p = str.data();
  const char *end = p + str.size();
  while (p != end) {
    char ch = *p;
    if (ch == '~') {
      result.push_back(version_token(version_token::tilde, "~"));
      ++p;
    } else if (ch == '^') {
      result.push_back(version_token(version_token::caret, "^"));
      ++p;
    } else if (ascii_digit(ch)) {
      const char *start = p;
      while (p != end && ascii_digit(*p)) {
	++p;
      }
      result.push_back(version_token(version_token::numeric,
				     std::string(start, p)));
    } else if (ascii_alpha(ch)) {
      const char *start = p;
      while (p != end && ascii_alpha(*p)) {
	++p;
      }
      result.push_back(version_token(version_token::alpha,
				     std::string(start, p)));
    } else {
      ++p;
    }
  }
}

static inline int
sign(int value)
{
  if (value < 0) {
    return -1;
  } else if (value > 0) {
    return 1;
  }
  return 0;
}

// Compares two digit strings by numeric value, without converting
// them (they can be arbitrarily long).
static int
compare_numeric(const std::string &a, const std::string &b)
{
  std::string::size_type a0 = a.find_first_not_of('0');
  std::string::size_type b0 = b.find_first_not_of('0');
  if (a0 == std::string::npos) {
    a0 = a.size();
  }
  if (b0 == std::string::npos) {
    b0 = b.size();
  }
  std::string::size_type alen = a.size() - a0;
  std::string::size_type blen = b.size() - b0;
  if (alen != blen) {
    return alen > blen ? 1 : -1;
  }
  return sign(a.compare(a0, alen, b, b0, blen));
}

// Position of a segment in the ordering at one index of the token
// sequences: '~' < end of string < letters < '^' < digits.
namespace {
  enum segment_rank {
    rank_tilde,
    rank_end,
    rank_alpha,
    rank_caret,
    rank_numeric,
  };
}

static segment_rank
rank(const std::vector<version_token> &tokens, size_t i)
{
  if (i >= tokens.size()) {
    return rank_end;
  }
  switch (tokens[i].kind) {
  case version_token::tilde:
    return rank_tilde;
  case version_token::caret:
    return rank_caret;
  case version_token::numeric:
    return rank_numeric;
  case version_token::alpha:
    break;
  }
  return rank_alpha;
}

int
compdb::vercmp(const std::string &a, const std::string &b)
{
  if (a == b) {
    return 0;
  }

  std::vector<version_token> one;
  std::vector<version_token> two;
  tokenize_version(a, one);
  tokenize_version(b, two);

  for (size_t i = 0; ; ++i) {
    segment_rank x = rank(one, i);
    segment_rank y = rank(two, i);
    if (x != y) {
      return x < y ? -1 : 1;
    }
    int rc = 0;
    switch (x) {
    case rank_end:
      return 0;
    case rank_numeric:
      rc = compare_numeric(one[i].text, two[i].text);
      break;
    case rank_alpha:
      rc = sign(one[i].text.compare(two[i].text));
      break;
    case rank_tilde:
    case rank_caret:
      break;
    }
    if (rc != 0) {
      return rc;
    }
  }
}

int
compdb::evrcmp(int epoch1, const std::string &version1,
	       const std::string &release1,
	       int epoch2, const std::string &version2,
	       const std::string &release2)
{
  if (epoch1 != epoch2) {
    return epoch1 < epoch2 ? -1 : 1;
  }
  int rc = vercmp(version1, version2);
  if (rc != 0) {
    return rc;
  }
  return vercmp(release1, release2);
}

//////////////////////////////////////////////////////////////////////
// rpm_evr

rpm_evr::rpm_evr()
  : epoch(0)
{
}

rpm_evr::rpm_evr(int e, const std::string &v, const std::string &r)
  : epoch(e), version(v), release(r)
{
}

rpm_evr::~rpm_evr()
{
}

int
rpm_evr::compare(const rpm_evr &other) const
{
  return evrcmp(epoch, version, release,
		other.epoch, other.version, other.release);
}

bool
rpm_evr::operator<(const rpm_evr &other) const
{
  return compare(other) < 0;
}

std::string
rpm_evr::to_string() const
{
  std::string result;
  if (epoch != 0) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%d:", epoch);
    result += buf;
  }
  result += version;
  if (!release.empty()) {
    result += '-';
    result += release;
  }
  return result;
}

bool
compdb::parse_evr(const std::string &str, rpm_evr &result)
{
  int epoch = 0;
  std::string::size_type start = 0;
  std::string::size_type colon = str.find(':');
  if (colon != std::string::npos) {
    if (colon == 0) {
      return false;
    }
    long long value = 0;
    for (std::string::size_type i = 0; i < colon; ++i) {
      if (!ascii_digit(str[i])) {
	return false;
      }
      value = value * 10 + (str[i] - '0');
      if (value > INT_MAX) {
	return false;
      }
    }
    epoch = static_cast<int>(value);
    start = colon + 1;
  }

  std::string version;
  std::string release;
  std::string::size_type dash = str.rfind('-');
  if (dash != std::string::npos && dash >= start) {
    version = str.substr(start, dash - start);
    release = str.substr(dash + 1);
  } else {
    version = str.substr(start);
  }
  if (version.empty()) {
    return false;
  }
  result.epoch = epoch;
  result.version.swap(version);
  result.release.swap(release);
  return true;
}
