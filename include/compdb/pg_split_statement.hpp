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

// Splits a sequence of SQL statements at the ';' terminators.  '--'
// comments between statements are dropped.  Single-quoted strings and
// $$ strings are skipped.  Appends the statements (including the
// terminating ';') to RESULT.  Throws std::runtime_error on syntax
// errors, including a final statement without terminator.
void pg_split_statement(const char *sql, std::vector<std::string> &result);

} // namespace compdb
