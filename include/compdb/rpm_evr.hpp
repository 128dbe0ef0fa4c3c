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
#include <vector>

namespace compdb {

// A segment of a version or release string, as seen by vercmp().
struct version_token {
  enum kind_type {
    numeric,
    alpha,
    tilde,
    caret,
  } kind;

  // The characters of the segment.  For numeric tokens, leading
  // zeros are preserved.
  std::string text;

  version_token()
    : kind(alpha)
  {
  }

  version_token(kind_type k, const std::string &t)
    : kind(k), text(t)
  {
  }

  bool operator==(const version_token &other) const
  {
    return kind == other.kind && text == other.text;
  }
};

// Splits STR into runs of ASCII digits, runs of ASCII letters, and
// the '~' and '^' markers.  All other characters separate segments
// and are dropped.  Replaces the contents of RESULT.
void tokenize_version(const std::string &str,
		      std::vector<version_token> &result);

// Compares two version (or release) strings using the RPM ordering.
// Returns -1 if A is older than B, 0 if they are equivalent, and 1 if
// A is newer.  Any pair of strings (including empty strings) has a
// defined result.
int vercmp(const std::string &a, const std::string &b);

// Compares epoch first, then version, then release.
int evrcmp(int epoch1, const std::string &version1, const std::string &release1,
	   int epoch2, const std::string &version2, const std::string &release2);

// Epoch, version, release triple.  A missing epoch is stored as 0.
struct rpm_evr {
  int epoch;
  std::string version;
  std::string release;

  rpm_evr();
  rpm_evr(int epoch, const std::string &version, const std::string &release);
  ~rpm_evr();

  // Returns -1, 0, 1 as evrcmp().
  int compare(const rpm_evr &other) const;

  bool operator<(const rpm_evr &other) const;

  // "[EPOCH:]VERSION[-RELEASE]", with the epoch omitted if it is zero.
  std::string to_string() const;
};

// Parses "[EPOCH:]VERSION[-RELEASE]".  The release starts after the
// last '-'.  Returns false (leaving RESULT unchanged) if the epoch is
// not a non-negative decimal number or the version is empty.
bool parse_evr(const std::string &str, rpm_evr &result);

} // namespace compdb
