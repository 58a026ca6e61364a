// Copyright (C) 2026 BCAT Authors
//
// This file is part of BCAT.
//
// BCAT is free software; you can redistribute it and/or modify it under the
// terms of the GNU General Public License as published by the Free Software
// Foundation; either version 3 of the License, or (at your option) any later
// version.
//
// BCAT is distributed in the hope that it will be useful, but WITHOUT ANY
// WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
// FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
// details.
//
// You should have received a copy of the GNU General Public License
// along with BCAT; if not, write to the Free Software
// Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA

#include "bcat/correction/Dataset.hh"
#include "bcat/util/Context.hh"
#include "bcat/util/Logger.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"
#include "bcat/util/io/File.hh"
#include "bcat/util/io/io_helpers.hh"

namespace bcat {

static GriddedTimeSeries read_files(const Context &ctx,
                                    const std::vector<std::string> &files,
                                    const std::string &variable) {
  if (files.empty()) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "no input files for the variable '%s'", variable.c_str());
  }

  auto sys = ctx.unit_system();

  File first(files[0], io::BCAT_READONLY);
  GriddedTimeSeries result = io::read_gridded_time_series(first, variable, sys);
  first.close();

  for (size_t k = 1; k < files.size(); ++k) {
    File file(files[k], io::BCAT_READONLY);
    auto data = io::read_gridded_time_series(file, variable, sys);
    file.close();

    // all files have to use the same units
    data.convert_units(sys, result.metadata().units);

    try {
      result.append(data);
    } catch (RuntimeError &e) {
      e.add_context("concatenating '%s' from %s", variable.c_str(), join(files, ", ").c_str());
      throw;
    }
  }

  ctx.log()->message(3, "  read %d records of %s from %s\n",
                     (int)result.n_time(), variable.c_str(), join(files, ", ").c_str());

  return result;
}

static std::vector<size_t> all_records(size_t N) {
  std::vector<size_t> result(N);
  for (size_t k = 0; k < N; ++k) {
    result[k] = k;
  }
  return result;
}

Dataset::Dataset(std::shared_ptr<const Context> ctx,
                 const std::vector<std::string> &files,
                 const std::string &variable)
  : m_ctx(ctx),
    m_description(join(files, ",")),
    m_data(read_files(*ctx, files, variable)),
    m_period(all_records(m_data.n_time())),
    m_metadata(m_data.metadata()) {
  // empty
}

Dataset::Dataset(std::shared_ptr<const Context> ctx, const GriddedTimeSeries &data)
  : m_ctx(ctx),
    m_description("in-memory " + data.metadata().name),
    m_data(data),
    m_period(all_records(m_data.n_time())),
    m_metadata(m_data.metadata()) {
  // empty
}

const VariableMetadata& Dataset::metadata() const {
  return m_metadata;
}

const Calendar& Dataset::calendar() const {
  return m_data.calendar();
}

void Dataset::set_period(const std::string &start, const std::string &end) {
  const Calendar &calendar = m_data.calendar();

  try {
    bool
      has_start = not string_strip(start).empty(),
      has_end   = not string_strip(end).empty();

    Date
      start_date = has_start ? calendar.parse(start) : Date(),
      end_date   = has_end ? calendar.parse(end) : Date();

    if (has_start and has_end and not (start_date < end_date)) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "invalid period: %s is not before %s",
                                    start.c_str(), end.c_str());
    }

    const auto &dates = m_data.dates();

    m_period.clear();
    for (size_t k = 0; k < dates.size(); ++k) {
      if (has_start and dates[k] < start_date) {
        continue;
      }
      if (has_end and not (dates[k] < end_date)) {
        continue;
      }
      m_period.push_back(k);
    }

    if (m_period.empty()) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "no records in the period [%s, %s)",
                                    start.c_str(), end.c_str());
    }
  } catch (RuntimeError &e) {
    e.add_context("setting the period of %s (%s)",
                  m_data.metadata().name.c_str(), m_description.c_str());
    throw;
  }
}

void Dataset::set_adjustments(const VariableMetadata &metadata) {
  if (not metadata.units.empty() and not m_data.metadata().units.empty()) {
    units::Unit
      input(m_ctx->unit_system(), m_data.metadata().units),
      output(m_ctx->unit_system(), metadata.units);

    if (not units::are_convertible(input, output)) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "cannot convert %s (%s) from '%s' to '%s'",
                                    m_data.metadata().name.c_str(), m_description.c_str(),
                                    m_data.metadata().units.c_str(), metadata.units.c_str());
    }
  }

  m_metadata = metadata;
}

GriddedTimeSeries Dataset::extract(const DatePredicate &predicate) const {
  const auto &dates = m_data.dates();

  std::vector<size_t> records;
  for (auto k : m_period) {
    if (predicate(dates[k])) {
      records.push_back(k);
    }
  }

  GriddedTimeSeries result = m_data.subset(records);

  if (not m_metadata.units.empty() and not result.metadata().units.empty()) {
    result.convert_units(m_ctx->unit_system(), m_metadata.units);
  }
  result.set_metadata(m_metadata);

  return result;
}

size_t Dataset::n_records() const {
  return m_period.size();
}

std::string Dataset::description() const {
  return m_description;
}

} // end of namespace bcat
