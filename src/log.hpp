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

#ifndef BRANCHCOV_LOG_HPP
#define BRANCHCOV_LOG_HPP

#include <iostream>
#include <string>

// Diagnostics go to standard error unless redirected, so that the
// report on standard output stays machine readable.
namespace Log
{

enum Level
  {
  Warning,
  Info,
  Debug,
  Trace
  };

void set_level(Level value);
Level level();
void set_sink(std::ostream& os);

// Names the compiled unit whose report is being derived.  The name is
// printed once, ahead of the first message logged for that unit.
void set_unit(std::string const& name);

// Errors and warnings are always shown, and counted
std::ostream& error();
std::ostream& warn();
std::ostream& info();
std::ostream& debug();
std::ostream& trace();

std::size_t error_count();
std::size_t warning_count();

// EXIT_SUCCESS unless an error was logged
int result();

} // namespace Log

#endif /* BRANCHCOV_LOG_HPP */
