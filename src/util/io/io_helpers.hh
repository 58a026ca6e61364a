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

#ifndef BCAT_IO_HELPERS_H
#define BCAT_IO_HELPERS_H

#include <string>

#include "bcat/util/GriddedTimeSeries.hh"
#include "bcat/util/Units.hh"

namespace bcat {

class File;

namespace io {

//! Value used to mark missing data in output files.
extern const double fill_value;

/*!
 * Read a (time, y, x) variable. Values equal to `_FillValue` or `missing_value` are replaced
 * with NaN; `scale_factor` and `add_offset` are applied.
 */
GriddedTimeSeries read_gridded_time_series(const File &file,
                                           const std::string &variable_name,
                                           units::System::Ptr unit_system);

//! Define and write coordinate variables and the variable itself. Masked cells and NaNs are
//! written as fill_value.
void write_gridded_time_series(const File &file, const GriddedTimeSeries &input);

} // end of namespace io
} // end of namespace bcat

#endif /* BCAT_IO_HELPERS_H */
