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

#include <algorithm>
#include <cmath>

#include "bcat/util/GriddedTimeSeries.hh"
#include "bcat/util/error_handling.hh"

namespace bcat {

bool operator==(const Axis &a, const Axis &b) {
  return a.name == b.name and a.values == b.values;
}

CellMask::CellMask()
  : m_nx(0) {
  // empty
}

CellMask::CellMask(size_t ny, size_t nx)
  : m_nx(nx), m_mask(ny * nx, 0) {
  // empty
}

bool CellMask::defined() const {
  return not m_mask.empty();
}

bool CellMask::masked(size_t j, size_t i) const {
  if (m_mask.empty()) {
    return false;
  }
  return m_mask[j * m_nx + i] != 0;
}

void CellMask::set(size_t j, size_t i, bool flag) {
  m_mask.at(j * m_nx + i) = flag ? 1 : 0;
}

size_t CellMask::n_masked() const {
  size_t result = 0;
  for (auto m : m_mask) {
    result += (m != 0) ? 1 : 0;
  }
  return result;
}

GriddedTimeSeries::GriddedTimeSeries(const VariableMetadata &metadata,
                                     const TimeUnits &time_units,
                                     const std::vector<double> &time,
                                     const Axis &y, const Axis &x)
  : m_metadata(metadata),
    m_time_units(time_units),
    m_time(time),
    m_y(y),
    m_x(x) {

  m_dates.reserve(m_time.size());
  for (auto t : m_time) {
    m_dates.push_back(m_time_units.date(t));
  }

  m_values.resize(m_time.size() * m_y.values.size() * m_x.values.size(), 0.0);
}

const VariableMetadata& GriddedTimeSeries::metadata() const {
  return m_metadata;
}

void GriddedTimeSeries::set_metadata(const VariableMetadata &metadata) {
  m_metadata = metadata;
}

const TimeUnits& GriddedTimeSeries::time_units() const {
  return m_time_units;
}

const Calendar& GriddedTimeSeries::calendar() const {
  return m_time_units.calendar();
}

const std::vector<double>& GriddedTimeSeries::time() const {
  return m_time;
}

const std::vector<Date>& GriddedTimeSeries::dates() const {
  return m_dates;
}

const Axis& GriddedTimeSeries::y() const {
  return m_y;
}

const Axis& GriddedTimeSeries::x() const {
  return m_x;
}

size_t GriddedTimeSeries::n_time() const {
  return m_time.size();
}

size_t GriddedTimeSeries::ny() const {
  return m_y.values.size();
}

size_t GriddedTimeSeries::nx() const {
  return m_x.values.size();
}

std::vector<double>& GriddedTimeSeries::values() {
  return m_values;
}

const std::vector<double>& GriddedTimeSeries::values() const {
  return m_values;
}

size_t GriddedTimeSeries::index(size_t t, size_t j, size_t i) const {
  return (t * ny() + j) * nx() + i;
}

double& GriddedTimeSeries::operator()(size_t t, size_t j, size_t i) {
  return m_values[index(t, j, i)];
}

double GriddedTimeSeries::operator()(size_t t, size_t j, size_t i) const {
  return m_values[index(t, j, i)];
}

std::vector<double> GriddedTimeSeries::cell(size_t j, size_t i) const {
  std::vector<double> result(n_time());
  for (size_t t = 0; t < result.size(); ++t) {
    result[t] = m_values[index(t, j, i)];
  }
  return result;
}

void GriddedTimeSeries::set_cell(size_t j, size_t i, const std::vector<double> &series) {
  if (series.size() != n_time()) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "cell series of %s has %d records (expected %d)",
                                  m_metadata.name.c_str(),
                                  (int)series.size(), (int)n_time());
  }

  for (size_t t = 0; t < series.size(); ++t) {
    m_values[index(t, j, i)] = series[t];
  }
}

const CellMask& GriddedTimeSeries::mask() const {
  return m_mask;
}

void GriddedTimeSeries::set_mask(const CellMask &mask) {
  m_mask = mask;
}

CellMask GriddedTimeSeries::mask_from_first_record() const {
  if (n_time() == 0) {
    return CellMask();
  }

  CellMask result(ny(), nx());
  for (size_t j = 0; j < ny(); ++j) {
    for (size_t i = 0; i < nx(); ++i) {
      result.set(j, i, not std::isfinite((*this)(0, j, i)));
    }
  }
  return result;
}

GriddedTimeSeries GriddedTimeSeries::subset(const std::vector<size_t> &time_indexes) const {
  std::vector<double> time;
  time.reserve(time_indexes.size());
  for (auto k : time_indexes) {
    time.push_back(m_time.at(k));
  }

  GriddedTimeSeries result(m_metadata, m_time_units, time, m_y, m_x);
  result.set_mask(m_mask);

  const size_t slice_size = ny() * nx();
  for (size_t n = 0; n < time_indexes.size(); ++n) {
    auto begin = m_values.begin() + time_indexes[n] * slice_size;
    std::copy(begin, begin + slice_size, result.m_values.begin() + n * slice_size);
  }

  return result;
}

void GriddedTimeSeries::append(const GriddedTimeSeries &other) {
  if (not same_grid(other)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "cannot append records of %s: grids differ",
                                  other.metadata().name.c_str());
  }

  if (other.calendar().name() != calendar().name()) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "cannot append records of %s: calendars differ (%s and %s)",
                                  other.metadata().name.c_str(),
                                  calendar().name().c_str(),
                                  other.calendar().name().c_str());
  }

  for (size_t k = 0; k < other.n_time(); ++k) {
    double T = m_time_units.from_days(other.time_units().to_days(other.time()[k]));

    if (not m_time.empty() and T <= m_time.back()) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "cannot append records of %s: times have to be"
                                    " strictly increasing",
                                    other.metadata().name.c_str());
    }

    m_time.push_back(T);
    m_dates.push_back(other.dates()[k]);
  }

  m_values.insert(m_values.end(), other.values().begin(), other.values().end());
}

void GriddedTimeSeries::convert_units(units::System::Ptr system, const std::string &units) {
  if (units == m_metadata.units) {
    return;
  }

  try {
    units::Converter c(system, m_metadata.units, units);
    c.convert_doubles(m_values);
  } catch (RuntimeError &e) {
    e.add_context("converting %s from '%s' to '%s'",
                  m_metadata.name.c_str(), m_metadata.units.c_str(), units.c_str());
    throw;
  }

  m_metadata.units = units;
}

bool GriddedTimeSeries::same_grid(const GriddedTimeSeries &other) const {
  return m_y.values == other.m_y.values and m_x.values == other.m_x.values;
}

} // end of namespace bcat
