/*
 *  Copyright (C) 2013 Daniel Pfeifer <daniel@pfeifer-mail.de>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef BRANCHCOV_OPTIONS_HPP
#define BRANCHCOV_OPTIONS_HPP

#include <string>

struct Options
  {
  std::string tree_file;
  std::string counters_file;   // empty: every tracker reads 0
  std::string source_file;     // empty: no content skipping
  bool runs;
  bool exit_success;

  Options() : runs(false), exit_success(false) {}
  };

extern Options options;

#endif /* BRANCHCOV_OPTIONS_HPP */
