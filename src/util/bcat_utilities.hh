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

#ifndef BCAT_UTILITIES_H
#define BCAT_UTILITIES_H

#include <algorithm>            // std::min, std::max
#include <set>
#include <string>
#include <vector>

#include <mpi.h>

namespace bcat {

#ifndef __GNUC__
#  define  __attribute__(x)  /* nothing */
#endif

bool is_increasing(const std::vector<double> &a);

// strings

bool ends_with(const std::string &str, const std::string &suffix);

std::string string_strip(const std::string &input);

std::string join(const std::vector<std::string> &strings, const std::string &separator);

std::vector<std::string> split(const std::string &input, char separator);

std::set<std::string> set_split(const std::string &input, char separator);

bool member(const std::string &string, const std::set<std::string> &set);

//! `printf`-style formatting into a std::string.
std::string printf(const char *format, ...) __attribute__((format(printf, 1, 2)));

double parse_number(const std::string &input);

long int parse_integer(const std::string &input);

//! Parse a comma-separated list of integers ("1, 2, 17").
std::vector<int> parse_integer_list(const std::string &input);

// numbers

//! Restrict `x` to `[a, b]`.
template<typename T>
inline T clip(T x, T a, T b) {
  return std::min(std::max(a, x), b);
}

// MPI

int GlobalSum(MPI_Comm comm, int input);

std::string version();

} // end of namespace bcat

#endif /* BCAT_UTILITIES_H */
