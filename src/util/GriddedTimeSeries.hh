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

#ifndef BCAT_GRIDDEDTIMESERIES_H
#define BCAT_GRIDDEDTIMESERIES_H

#include <string>
#include <vector>

#include "bcat/util/Calendar.hh"
#include "bcat/util/Units.hh"

namespace bcat {

//! Names and units of a variable.
struct VariableMetadata {
  std::string name;
  std::string standard_name;
  std::string long_name;
  std::string units;
};

//! A coordinate variable of a grid.
struct Axis {
  std::string name;
  std::string standard_name;
  std::string units;
  std::vector<double> values;
};

bool operator==(const Axis &a, const Axis &b);

//! \brief Missing-data mask of a grid (constant in time).
/*!
 * A default-constructed mask is *not defined*: no cell is masked. This is different from a
 * defined mask in which no cells happen to be masked only in how it is reported by `defined()`.
 */
class CellMask {
public:
  CellMask();
  CellMask(size_t ny, size_t nx);

  bool defined() const;
  bool masked(size_t j, size_t i) const;
  void set(size_t j, size_t i, bool flag);

  size_t n_masked() const;
private:
  size_t m_nx;
  std::vector<char> m_mask;
};

/*!
 * \brief A variable on a (time, y, x) grid.
 *
 * Values are stored in the "time-major" order (time index varies slowest). Missing values are
 * stored as NaN. The time axis is described by CF time units and a calendar; dates of all time
 * records are computed once.
 *
 * The one-dimensional time series of a grid cell ("cell series") is the unit of work of all
 * correction methods.
 */
class GriddedTimeSeries {
public:
  GriddedTimeSeries(const VariableMetadata &metadata,
                    const TimeUnits &time_units,
                    const std::vector<double> &time,
                    const Axis &y, const Axis &x);

  const VariableMetadata& metadata() const;
  void set_metadata(const VariableMetadata &metadata);

  const TimeUnits& time_units() const;
  const Calendar& calendar() const;
  const std::vector<double>& time() const;
  const std::vector<Date>& dates() const;

  const Axis& y() const;
  const Axis& x() const;

  size_t n_time() const;
  size_t ny() const;
  size_t nx() const;

  std::vector<double>& values();
  const std::vector<double>& values() const;

  double& operator()(size_t t, size_t j, size_t i);
  double operator()(size_t t, size_t j, size_t i) const;

  //! Time series of the cell `(j, i)`.
  std::vector<double> cell(size_t j, size_t i) const;
  void set_cell(size_t j, size_t i, const std::vector<double> &series);

  const CellMask& mask() const;
  void set_mask(const CellMask &mask);

  //! Mask cells with non-finite values in the first time record.
  CellMask mask_from_first_record() const;

  //! Records with given indexes (in the same order).
  GriddedTimeSeries subset(const std::vector<size_t> &time_indexes) const;

  //! Append records of `other` (same grid and calendar, later times).
  void append(const GriddedTimeSeries &other);

  //! Convert values to `units` (also updates metadata).
  void convert_units(units::System::Ptr system, const std::string &units);

  bool same_grid(const GriddedTimeSeries &other) const;
private:
  VariableMetadata m_metadata;
  TimeUnits m_time_units;
  std::vector<double> m_time;
  std::vector<Date> m_dates;
  Axis m_y, m_x;
  std::vector<double> m_values;
  CellMask m_mask;

  size_t index(size_t t, size_t j, size_t i) const;
};

} // end of namespace bcat

#endif /* BCAT_GRIDDEDTIMESERIES_H */
