/* Copyright (C) 2026 BCAT Authors
 *
 * This file is part of BCAT.
 *
 * BCAT is free software; you can redistribute it and/or modify it under the
 * terms of the GNU General Public License as published by the Free Software
 * Foundation; either version 3 of the License, or (at your option) any later
 * version.
 *
 * BCAT is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License
 * along with BCAT; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 */

#include "bcat/util/bcat_utilities.hh"

#include <algorithm>            // std::equal
#include <cstdarg>              // va_list, va_start(), va_end()
#include <cstdio>               // vsnprintf
#include <cstdlib>              // strtol(), strtod()

#include <gsl/gsl_version.h>    // GSL_VERSION
#include <udunits2.h>           // UT_VERSION_MAJOR, ...
#include <jansson.h>            // JANSSON_VERSION

#include "bcat/bcat_config.hh"  // version info

// netcdf.h checks MPI_INCLUDED
#ifndef MPI_INCLUDED
#define MPI_INCLUDED 1
#endif
#include <netcdf.h>             // nc_inq_libvers

#include "bcat/util/error_handling.hh"

namespace bcat {

std::string string_strip(const std::string &input) {
  const char *whitespace = " \t\n\r";

  size_t first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return "";
  }
  size_t last = input.find_last_not_of(whitespace);

  return input.substr(first, last - first + 1);
}

bool ends_with(const std::string &str, const std::string &suffix) {
  return (str.size() >= suffix.size() and
          std::equal(suffix.rbegin(), suffix.rend(), str.rbegin()));
}

std::string join(const std::vector<std::string> &strings, const std::string &separator) {
  std::string result;
  for (size_t k = 0; k < strings.size(); ++k) {
    if (k > 0) {
      result += separator;
    }
    result += strings[k];
  }
  return result;
}

//! Split `input` at each `separator`. Tokens are stripped; empty tokens are dropped.
std::vector<std::string> split(const std::string &input, char separator) {
  std::vector<std::string> result;

  size_t start = 0;
  while (start <= input.size()) {
    size_t end = input.find(separator, start);
    if (end == std::string::npos) {
      end = input.size();
    }

    std::string token = string_strip(input.substr(start, end - start));
    if (not token.empty()) {
      result.push_back(token);
    }

    start = end + 1;
  }

  return result;
}

std::set<std::string> set_split(const std::string &input, char separator) {
  auto tokens = split(input, separator);
  return std::set<std::string>(tokens.begin(), tokens.end());
}

//! True if `a` is strictly increasing.
bool is_increasing(const std::vector<double> &a) {
  for (size_t k = 1; k < a.size(); ++k) {
    if (not (a[k - 1] < a[k])) {
      return false;
    }
  }
  return true;
}

bool member(const std::string &string, const std::set<std::string> &set) {
  return set.count(string) > 0;
}

int GlobalSum(MPI_Comm comm, int input) {
  int result = 0;
  int err = MPI_Allreduce(&input, &result, 1, MPI_INT, MPI_SUM, comm);
  BCAT_C_CHK(err, MPI_SUCCESS, "MPI_Allreduce");
  return result;
}

//! BCAT and library versions, one per line.
std::string version() {
  return (printf("BCAT %s\n", bcat::revision) +
          printf("GSL %s\n", GSL_VERSION) +
          printf("NetCDF %s\n", nc_inq_libvers()) +
          printf("UDUNITS %d.%d.%d\n",
                 UT_VERSION_MAJOR, UT_VERSION_MINOR, UT_VERSION_PATCHLEVEL) +
          printf("Jansson %s\n", JANSSON_VERSION));
}

std::string printf(const char *format, ...) {
  va_list args;

  va_start(args, format);
  int length = vsnprintf(NULL, 0, format, args);
  va_end(args);

  if (length < 0) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "invalid format string '%s'", format);
  }

  std::string result(length + 1, '\0');

  va_start(args, format);
  vsnprintf(&result[0], result.size(), format, args);
  va_end(args);

  result.resize(length);
  return result;
}

double parse_number(const std::string &input) {
  char *end = NULL;
  double result = strtod(input.c_str(), &end);
  if (input.empty() or *end != '\0') {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "'%s' is not a number", input.c_str());
  }
  return result;
}

long int parse_integer(const std::string &input) {
  char *end = NULL;
  long int result = strtol(input.c_str(), &end, 10);
  if (input.empty() or *end != '\0') {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "'%s' is not an integer", input.c_str());
  }
  return result;
}

std::vector<int> parse_integer_list(const std::string &input) {
  std::vector<int> result;
  for (const auto &token : split(input, ',')) {
    result.push_back(static_cast<int>(parse_integer(token)));
  }
  return result;
}

} // end of namespace bcat
