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

#include <algorithm>
#include <cmath>

#include "bcat/util/io/io_helpers.hh"
#include "bcat/util/io/File.hh"
#include "bcat/util/Calendar.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"
#include "bcat/bcat_config.hh"

namespace bcat {
namespace io {

// same as NC_FILL_DOUBLE
const double fill_value = 9.9692099683868690e+36;

static Axis read_axis(const File &file, const std::string &dimension) {
  Axis result;
  result.name   = dimension;
  result.values = file.read_dimension(dimension);

  if (file.find_variable(dimension)) {
    result.standard_name = file.read_text_attribute(dimension, "standard_name");
    result.units         = file.read_text_attribute(dimension, "units");
  }

  if (not is_increasing(result.values)) {
    // decreasing coordinates (e.g. latitude from north to south) are allowed too
    std::vector<double> reversed(result.values.rbegin(), result.values.rend());
    if (not is_increasing(reversed)) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "coordinate '%s' in '%s' is not monotonic",
                                    dimension.c_str(), file.filename().c_str());
    }
  }

  return result;
}

static std::vector<double> read_double_attribute(const File &file,
                                                 const std::string &var_name,
                                                 const std::string &att_name,
                                                 double default_value) {
  auto values = file.read_double_attribute(var_name, att_name);
  if (values.empty()) {
    return {default_value};
  }
  return values;
}

GriddedTimeSeries read_gridded_time_series(const File &file,
                                           const std::string &variable_name,
                                           units::System::Ptr unit_system) {
  try {
    if (not file.find_variable(variable_name)) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "variable '%s' is missing",
                                    variable_name.c_str());
    }

    auto dims = file.dimensions(variable_name);
    if (dims.size() != 3) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "variable '%s' has %d dimensions (expected 3: time, y, x)",
                                    variable_name.c_str(), (int)dims.size());
    }

    const std::string &time_name = dims[0];

    // time
    std::vector<double> time = file.read_dimension(time_name);
    if (time.empty()) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "variable '%s' has no records",
                                    variable_name.c_str());
    }

    std::string time_units, calendar_name;
    if (file.find_variable(time_name)) {
      time_units    = file.read_text_attribute(time_name, "units");
      calendar_name = file.read_text_attribute(time_name, "calendar");
    }

    if (time_units.empty()) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "the time coordinate '%s' does not have units",
                                    time_name.c_str());
    }

    if (calendar_name.empty()) {
      calendar_name = "standard";
    }

    if (not is_increasing(time)) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "times in '%s' have to be strictly increasing",
                                    time_name.c_str());
    }

    TimeUnits units(unit_system, time_units, Calendar(calendar_name));

    Axis y = read_axis(file, dims[1]);
    Axis x = read_axis(file, dims[2]);

    VariableMetadata metadata;
    metadata.name          = variable_name;
    metadata.standard_name = file.read_text_attribute(variable_name, "standard_name");
    metadata.long_name     = file.read_text_attribute(variable_name, "long_name");
    metadata.units         = file.read_text_attribute(variable_name, "units");

    GriddedTimeSeries result(metadata, units, time, y, x);

    unsigned int
      nt = static_cast<unsigned int>(time.size()),
      ny = static_cast<unsigned int>(y.values.size()),
      nx = static_cast<unsigned int>(x.values.size());

    auto &values = result.values();
    if (not values.empty()) {
      file.read_variable(variable_name, {0, 0, 0}, {nt, ny, nx}, values.data());
    }

    std::vector<double> missing = file.read_double_attribute(variable_name, "_FillValue");
    {
      auto tmp = file.read_double_attribute(variable_name, "missing_value");
      missing.insert(missing.end(), tmp.begin(), tmp.end());
    }

    double
      scale_factor = read_double_attribute(file, variable_name, "scale_factor", 1.0)[0],
      add_offset   = read_double_attribute(file, variable_name, "add_offset", 0.0)[0];

    for (auto &v : values) {
      if (std::find(missing.begin(), missing.end(), v) != missing.end()) {
        v = NAN;
      } else {
        v = v * scale_factor + add_offset;
      }
    }

    return result;
  } catch (RuntimeError &e) {
    e.add_context("reading '%s' from '%s'", variable_name.c_str(), file.filename().c_str());
    throw;
  }
}

static void define_axis(const File &file, const Axis &axis, const std::string &axis_name) {
  file.define_dimension(axis.name, axis.values.size());
  file.define_variable(axis.name, BCAT_DOUBLE, {axis.name});

  if (not axis.units.empty()) {
    file.write_attribute(axis.name, "units", axis.units);
  }
  if (not axis.standard_name.empty()) {
    file.write_attribute(axis.name, "standard_name", axis.standard_name);
  }
  file.write_attribute(axis.name, "axis", axis_name);
}

void write_gridded_time_series(const File &file, const GriddedTimeSeries &input) {
  const auto &metadata = input.metadata();
  const std::string time_name = "time";

  try {
    // define
    file.define_dimension(time_name, BCAT_UNLIMITED);
    file.define_variable(time_name, BCAT_DOUBLE, {time_name});
    file.write_attribute(time_name, "units", input.time_units().spec());
    file.write_attribute(time_name, "calendar", input.calendar().name());
    file.write_attribute(time_name, "standard_name", "time");
    file.write_attribute(time_name, "axis", "T");

    define_axis(file, input.y(), "Y");
    define_axis(file, input.x(), "X");

    file.define_variable(metadata.name, BCAT_DOUBLE,
                         {time_name, input.y().name, input.x().name});
    file.write_attribute(metadata.name, "_FillValue", BCAT_DOUBLE, {fill_value});
    file.write_attribute(metadata.name, "missing_value", BCAT_DOUBLE, {fill_value});
    if (not metadata.units.empty()) {
      file.write_attribute(metadata.name, "units", metadata.units);
    }
    if (not metadata.standard_name.empty()) {
      file.write_attribute(metadata.name, "standard_name", metadata.standard_name);
    }
    if (not metadata.long_name.empty()) {
      file.write_attribute(metadata.name, "long_name", metadata.long_name);
    }

    file.write_attribute("BCAT_GLOBAL", "Conventions", "CF-1.6");
    file.write_attribute("BCAT_GLOBAL", "source", std::string("BCAT ") + revision);

    file.enddef();

    // write
    unsigned int
      nt = static_cast<unsigned int>(input.n_time()),
      ny = static_cast<unsigned int>(input.ny()),
      nx = static_cast<unsigned int>(input.nx());

    file.write_variable(time_name, {0}, {nt}, input.time().data());
    file.write_variable(input.y().name, {0}, {ny}, input.y().values.data());
    file.write_variable(input.x().name, {0}, {nx}, input.x().values.data());

    std::vector<double> values(input.values());
    const auto &mask = input.mask();
    for (unsigned int t = 0; t < nt; ++t) {
      for (unsigned int j = 0; j < ny; ++j) {
        for (unsigned int i = 0; i < nx; ++i) {
          double &v = values[(t * ny + j) * nx + i];
          if (mask.masked(j, i) or not std::isfinite(v)) {
            v = fill_value;
          }
        }
      }
    }

    if (not values.empty()) {
      file.write_variable(metadata.name, {0, 0, 0}, {nt, ny, nx}, values.data());
    }
  } catch (RuntimeError &e) {
    e.add_context("writing '%s' to '%s'", metadata.name.c_str(), file.filename().c_str());
    throw;
  }
}

} // end of namespace io
} // end of namespace bcat
