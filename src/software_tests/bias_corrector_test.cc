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

#include <cmath>
#include <cstdio>
#include <limits>
#include <memory>
#include <mpi.h>
#include <vector>

#include <gsl/gsl_errno.h>
#include <gsl/gsl_math.h>

#include "bcat/software_tests/bcat_tests.hh"
#include "bcat/correction/BiasCorrector.hh"
#include "bcat/correction/Dataset.hh"
#include "bcat/correction/statistics.hh"
#include "bcat/util/Config.hh"
#include "bcat/util/Context.hh"
#include "bcat/util/Logger.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"
#include "bcat/util/io/File.hh"
#include "bcat/util/io/io_helpers.hh"

using namespace bcat;

static Axis axis(const std::string &name, const std::vector<double> &values) {
  Axis result;
  result.name          = name;
  result.standard_name = (name == "x") ? "projection_x_coordinate" : "projection_y_coordinate";
  result.units         = "km";
  result.values        = values;
  return result;
}

/*!
 * Daily near-surface air temperature for `n_years` years starting on January 1 of `year`: a
 * seasonal cycle plus normally distributed noise (no randomness).
 */
static GriddedTimeSeries daily_temperature(units::System::Ptr sys, int year, int n_years,
                                           const Axis &y, const Axis &x,
                                           double mean, double sigma,
                                           const std::string &calendar_name = "standard") {
  VariableMetadata tas;
  tas.name          = "tas";
  tas.standard_name = "air_temperature";
  tas.long_name     = "near-surface air temperature";
  tas.units         = "K";

  Calendar calendar(calendar_name);
  Date start = {year, 1, 1}, end = {year + n_years, 1, 1};
  const size_t N = calendar.day_number(end) - calendar.day_number(start);

  TimeUnits time_units(sys, bcat::printf("days since %04d-01-01", year), calendar);

  std::vector<double> time(N);
  for (size_t k = 0; k < N; ++k) {
    time[k] = k;
  }

  GriddedTimeSeries result(tas, time_units, time, y, x);

  stats::NormalFit noise = {0.0, sigma};
  for (size_t t = 0; t < N; ++t) {
    // 7919 is prime, so this is a permutation of 0, ..., N - 1
    double
      p        = ((7919 * t) % N + 0.5) / N,
      seasonal = 10.0 * std::sin(2.0 * M_PI * t / 365.25);

    for (size_t j = 0; j < y.values.size(); ++j) {
      for (size_t i = 0; i < x.values.size(); ++i) {
        result(t, j, i) = mean + 0.1 * y.values[j] + seasonal + stats::normal_ppf(noise, p);
      }
    }
  }

  return result;
}

static void write(const std::string &filename, const GriddedTimeSeries &data) {
  File file(filename, io::BCAT_READWRITE_CLOBBER);
  io::write_gridded_time_series(file, data);
  file.close();
}

static GriddedTimeSeries read(const std::string &filename, units::System::Ptr sys) {
  File file(filename, io::BCAT_READONLY);
  return io::read_gridded_time_series(file, "tas", sys);
}

static bool exists(const std::string &filename) {
  FILE *f = fopen(filename.c_str(), "r");
  if (f != NULL) {
    fclose(f);
    return true;
  }
  return false;
}

static std::shared_ptr<Context> test_context(MPI_Comm com) {
  units::System::Ptr sys(new units::System);
  Config::Ptr config = config_from_file(sys, "");
  std::shared_ptr<Logger> log(new StringLogger(com, 3));
  return std::shared_ptr<Context>(new Context(com, sys, config, log));
}

static void write_inputs(units::System::Ptr sys) {
  Axis
    y       = axis("y", {0.0, 1.0}),
    x       = axis("x", {0.0, 1.0}),
    model_y = axis("y", {-0.5, 0.5, 1.5}),
    model_x = axis("x", {-0.5, 0.5, 1.5});

  auto observation = daily_temperature(sys, 2001, 10, y, x, 280.0, 1.5);
  // a cell without observations
  for (size_t t = 0; t < observation.n_time(); ++t) {
    observation(t, 1, 1) = std::numeric_limits<double>::quiet_NaN();
  }
  write("bct_observation.nc", observation);

  write("bct_model.nc", daily_temperature(sys, 2001, 10, model_y, model_x, 278.0, 1.5));

  // the scenario is split into two files
  write("bct_scenario_1.nc", daily_temperature(sys, 2021, 5, model_y, model_x, 281.0, 2.0));
  write("bct_scenario_2.nc", daily_temperature(sys, 2026, 5, model_y, model_x, 282.0, 2.0));

  // model data without leap days
  write("bct_model_noleap.nc",
        daily_temperature(sys, 2001, 10, model_y, model_x, 278.0, 1.5, "noleap"));
  write("bct_scenario_noleap.nc",
        daily_temperature(sys, 2021, 10, model_y, model_x, 281.0, 2.0, "noleap"));
}

static void configure(Config &config) {
  config.set_string("input.variable", "tas");
  config.set_string("input.observation.files", "bct_observation.nc");
  config.set_string("input.model.files", "bct_model.nc");
  config.set_string("input.scenario.files", "bct_scenario_1.nc,bct_scenario_2.nc");
  config.set_string("output.directory", ".");
  config.set_string("bias_correction.reference_period.start", "2001-01-01");
  config.set_string("bias_correction.reference_period.end", "2011-01-01");
  config.set_string("bias_correction.units", "1");
}

static void test_quantile_mapping(test::Checks &check, MPI_Comm com) {
  auto ctx = test_context(com);
  auto sys = ctx->unit_system();

  configure(*ctx->config());
  ctx->config()->set_flag("bias_correction.save_regridded", true);

  auto corrector = bias_corrector_from_config(ctx);
  check(corrector->time_unit() == DAY_OF_YEAR, "QM uses days of the year");
  check(corrector->method().name() == "quantile_mapping", "QM: method");

  const std::string
    corrected = "./quantile_mapping_tas_scenario-0_2021-2030_day-001.nc",
    regridded = "./regridded_tas_scenario-0_2021-2030_day-001.nc";

  remove(corrected.c_str());

  auto files = corrector->run();

  if (ctx->rank() == 0) {
    check(files.size() == 2, "QM: number of files written (%d)", (int)files.size());
    check(exists(corrected), "QM: %s exists", corrected.c_str());
    check(exists(regridded), "QM: %s exists", regridded.c_str());
  }

  // one regridder for model data and one for the scenario (the same grid)
  check(corrector->n_regridders() == 1, "QM: regridders are reused (%d)",
        (int)corrector->n_regridders());

  if (ctx->rank() == 0 and exists(corrected) and exists(regridded)) {
    auto result = read(corrected, sys);
    auto input  = read(regridded, sys);

    check(result.n_time() == 10, "QM: one record per year (%d)", (int)result.n_time());
    check(result.dates().front() == Date({2021, 1, 2}) and
          result.dates().back() == Date({2030, 1, 2}), "QM: dates");
    check(result.ny() == 2 and result.nx() == 2, "QM: observation grid");
    check(result.metadata().standard_name == "air_temperature", "QM: metadata");

    check(std::isnan(result(0, 1, 1)), "QM: masked cell");

    double bias = test::average(result.cell(0, 0)) - test::average(input.cell(0, 0));
    check(std::fabs(bias - 2.0) < 0.5, "QM: correction of the cell (0, 0): %f", bias);
  }

  // running again overwrites output files
  auto again = corrector->correct(1);
  if (ctx->rank() == 0) {
    check(again.size() == 2 and again[1] == corrected, "QM: second run");
    check(read(corrected, sys).n_time() == 10, "QM: output file is replaced");
  }

  check(corrector->output_filename("quantile_mapping", 1, 2021, 2030, 60) ==
        "quantile_mapping_tas_scenario-1_2021-2030_day-060.nc", "QM: output file name");
}

static void test_scaled_distribution_mapping(test::Checks &check, MPI_Comm com) {
  auto ctx = test_context(com);
  auto sys = ctx->unit_system();

  configure(*ctx->config());
  ctx->config()->set_string("bias_correction.method", "scaled_distribution_mapping");
  ctx->config()->set_string("bias_correction.interpolation", "nearest");

  auto corrector = bias_corrector_from_config(ctx);
  check(corrector->time_unit() == MONTH, "SDM uses months");
  check(corrector->units() == std::vector<int>({1}), "SDM: units");

  const std::string corrected = "./scaled_distribution_mapping_tas_scenario-0_2021-2030_month-01.nc";

  corrector->run();

  if (ctx->rank() == 0) {
    check(exists(corrected), "SDM: %s exists", corrected.c_str());

    if (exists(corrected)) {
      auto result = read(corrected, sys);
      check(result.n_time() == 310, "SDM: all days of January (%d)", (int)result.n_time());

      bool finite = true;
      for (auto v : result.cell(0, 0)) {
        finite = finite and std::isfinite(v);
      }
      check(finite, "SDM: corrected values are finite");
      check(std::isnan(result(0, 1, 1)), "SDM: masked cell");
    }
  }

  check(corrector->output_filename("scaled_distribution_mapping", 0, 2021, 2030, 1) ==
        "scaled_distribution_mapping_tas_scenario-0_2021-2030_month-01.nc",
        "SDM: output file name");

  ctx->config()->set_string("bias_correction.units", "13");
  check(test::throws([&corrector]() { corrector->units(); }), "SDM: month 13");
}

static void test_units_and_periods(test::Checks &check, MPI_Comm com) {
  auto ctx = test_context(com);
  auto sys = ctx->unit_system();

  auto tas = read("bct_observation.nc", sys);

  {
    Dataset d(ctx, tas);
    check(d.n_records() == 3652, "dataset: number of records");

    d.set_period("2003-01-01", "2005-01-01");
    check(d.n_records() == 731, "dataset: period (%d)", (int)d.n_records());

    d.set_period("2010-06-01", "");
    check(d.n_records() == 214, "dataset: open period (%d)", (int)d.n_records());

    auto january = d.extract(window_for_month(1));
    check(january.n_time() == 0, "dataset: no January records after June 2010");

    check(test::throws([&d]() { d.set_period("2005-01-01", "2003-01-01"); }),
          "dataset: reversed period");
    check(test::throws([&d]() { d.set_period("1990-01-01", "1991-01-01"); }),
          "dataset: empty period");

    VariableMetadata celsius = tas.metadata();
    celsius.units = "degC";
    d.set_period("", "");
    d.set_adjustments(celsius);
    auto converted = d.extract(window_for_month(7));
    check(converted.metadata().units == "degC", "dataset: adjusted units");
    check(converted(0, 0, 0) < 100.0, "dataset: values are converted (%f)", converted(0, 0, 0));

    celsius.units = "m";
    check(test::throws([&d, &celsius]() { d.set_adjustments(celsius); }),
          "dataset: incompatible units");
  }

  configure(*ctx->config());

  ctx->config()->set_string("bias_correction.units", "");
  auto corrector = bias_corrector_from_config(ctx);
  check(corrector->units().size() == 366, "all days of the year");

  ctx->config()->set_string("bias_correction.units", "366, 1");
  check(corrector->units() == std::vector<int>({366, 1}), "a list of days");

  ctx->config()->set_string("bias_correction.units", "367");
  check(test::throws([&corrector]() { corrector->units(); }), "day 367");

  // the reference period does not overlap model data
  ctx->config()->set_string("bias_correction.reference_period.start", "1961-01-01");
  ctx->config()->set_string("bias_correction.reference_period.end", "1991-01-01");
  check(test::throws([&ctx]() { bias_corrector_from_config(ctx); }), "empty reference period");

  configure(*ctx->config());
  ctx->config()->set_string("input.scenario.files", "");
  check(test::throws([&ctx]() { bias_corrector_from_config(ctx); }), "no scenarios");

  configure(*ctx->config());
  ctx->config()->set_string("input.variable", "pr");
  check(test::throws([&ctx]() { bias_corrector_from_config(ctx); }), "missing variable");
}

static void test_calendar_mismatch(test::Checks &check, MPI_Comm com) {
  auto ctx = test_context(com);
  auto sys = ctx->unit_system();

  configure(*ctx->config());
  ctx->config()->set_string("input.model.files", "bct_model_noleap.nc");
  ctx->config()->set_string("input.scenario.files", "bct_scenario_noleap.nc");
  ctx->config()->set_string("bias_correction.units", "364");

  auto corrector = bias_corrector_from_config(ctx);
  // units are counted in the model calendar
  check(corrector->units().front() == 364, "noleap: units");

  ctx->config()->set_string("bias_correction.units", "366");
  check(test::throws([&corrector]() { corrector->units(); }), "noleap: day 366");
  ctx->config()->set_string("bias_correction.units", "364");

  const std::string corrected = "./quantile_mapping_tas_scenario-0_2021-2030_day-364.nc";

  corrector->run();

  if (ctx->rank() == 0) {
    check(exists(corrected), "noleap: %s exists", corrected.c_str());

    if (exists(corrected)) {
      auto result = read(corrected, sys);
      check(result.n_time() == 10, "noleap: one record per year (%d)", (int)result.n_time());
      check(result.calendar().name() == "noleap", "noleap: calendar of the output");
      check(result.dates().front() == Date({2021, 12, 31}), "noleap: last day of the year");
      check(std::isfinite(result(0, 0, 0)), "noleap: corrected value is finite");
    }

    // day 364 of the model year maps to day 366 * 364 / 365 = 364 of the observation year
    auto log = std::dynamic_pointer_cast<const StringLogger>(ctx->log());
    const std::string
      text        = log ? log->get() : std::string(),
      observation = "observations: day 364 (12-30), window 12-15 to 01-14",
      model       = "model:        day 364 (12-31), window 12-16 to 01-15";

    check(text.find(observation) != std::string::npos,
          "noleap: observation window (log: '%s')", text.c_str());
    check(text.find(model) != std::string::npos, "noleap: model window");
  }
}

int main(int argc, char *argv[]) {
  MPI_Init(&argc, &argv);
  gsl_set_error_handler_off();

  MPI_Comm com = MPI_COMM_WORLD;
  test::Checks check("bias_corrector_test");

  try {
    int rank = 0;
    MPI_Comm_rank(com, &rank);

    units::System::Ptr sys(new units::System);
    if (rank == 0) {
      write_inputs(sys);
    }
    MPI_Barrier(com);

    test_quantile_mapping(check, com);
    test_scaled_distribution_mapping(check, com);
    test_units_and_periods(check, com);
    test_calendar_mismatch(check, com);
  } catch (...) {
    handle_fatal_errors(com);
    check.failure();
  }

  MPI_Finalize();

  return check.report();
}
