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

#ifndef BCAT_IO_FLAGS_H
#define BCAT_IO_FLAGS_H

namespace bcat {
namespace io {

//! Variable and attribute types BCAT writes.
enum Type : int {
  BCAT_NAT    = 0,              // not a type
  BCAT_CHAR   = 2,
  BCAT_INT    = 4,
  BCAT_FLOAT  = 5,
  BCAT_DOUBLE = 6
};

//! File modes. Values differ from NetCDF flags to catch accidental use of NetCDF constants.
enum Mode : int {
  BCAT_READONLY = 7,
  BCAT_READWRITE = 8,
  //! create a new file, replacing an existing one
  BCAT_READWRITE_CLOBBER = 9
};

//! Length of an unlimited dimension (NC_UNLIMITED).
enum Dim_Length : int { BCAT_UNLIMITED = 0 };

} // end of namespace io
} // end of namespace bcat

#endif /* BCAT_IO_FLAGS_H */
