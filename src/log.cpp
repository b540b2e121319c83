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

#include "log.hpp"
#include <cstdlib>

namespace Log
{

static Level current_level = Log::Info;
static std::ostream* sink = &std::cerr;

static std::string unit;
static bool unit_reported = true;
static std::ostream dummy(0);
static std::size_t num_errors = 0;
static std::size_t num_warnings = 0;

void set_level(Level value)
  {
  current_level = value;
  }

Level level()
  {
  return current_level;
  }

void set_sink(std::ostream& os)
  {
  sink = &os;
  }

void set_unit(std::string const& name)
  {
  if (name == unit)
    {
    return;
    }
  unit = name;
  unit_reported = false;
  }

// Starts a message, naming the unit first if it has not been named yet
static std::ostream& emit(char const* prefix)
  {
  if (!unit_reported)
    {
    *sink << "\nUnit " << unit << std::endl;
    unit_reported = true;
    }
  return *sink << prefix;
  }

static std::ostream& emit(Level threshold, char const* prefix)
  {
  if (current_level < threshold)
    {
    return dummy;
    }
  return emit(prefix);
  }

std::ostream& error()
  {
  ++num_errors;
  return emit("++ ERROR: ");
  }

std::ostream& warn()
  {
  ++num_warnings;
  return emit("++ WARNING: ");
  }

std::ostream& info()
  {
  return emit(Log::Info, "-- ");
  }

std::ostream& debug()
  {
  return emit(Log::Debug, "-- ");
  }

std::ostream& trace()
  {
  return emit(Log::Trace, "-- ");
  }

std::size_t error_count()
  {
  return num_errors;
  }

std::size_t warning_count()
  {
  return num_warnings;
  }

int result()
  {
  if (num_errors == 0)
    {
    return EXIT_SUCCESS;
    }
  *sink << "\n" << num_errors << " Errors occured!" << std::endl;
  return EXIT_FAILURE;
  }

} // namespace Log
