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
#include <limits>
#include <memory>
#include <mpi.h>
#include <vector>

#include <gsl/gsl_errno.h>

#include "bcat/software_tests/bcat_tests.hh"
#include "bcat/correction/CorrectionMethod.hh"
#include "bcat/correction/ScaledDistributionMapping.hh"
#include "bcat/correction/statistics.hh"
#include "bcat/util/Config.hh"
#include "bcat/util/Context.hh"
#include "bcat/util/Logger.hh"
#include "bcat/util/error_handling.hh"

using namespace bcat;

typedef std::vector<double> Series;

static std::shared_ptr<Context> test_context(MPI_Comm com, std::shared_ptr<StringLogger> log) {
  units::System::Ptr sys(new units::System);
  Config::Ptr config = config_from_file(sys, "");
  return std::shared_ptr<Context>(new Context(com, sys, config, log));
}

static VariableMetadata variable(const std::string &name, const std::string &standard_name,
                                 const std::string &units) {
  VariableMetadata result;
  result.name          = name;
  result.standard_name = standard_name;
  result.units         = units;
  return result;
}

//! Position of the `k`-th sample in a series of length `N` (a fixed shuffle).
static size_t position(size_t k, size_t N) {
  // 7 and N have to be relatively prime
  return (7 * k) % N;
}

//! A normally distributed series (no randomness) plus a linear trend.
static Series normal_series(size_t N, double mean, double sigma, double trend) {
  stats::NormalFit fit = {mean, sigma};

  Series result(N);
  for (size_t k = 0; k < N; ++k) {
    result[position(k, N)] = stats::normal_ppf(fit, (k + 0.5) / N);
  }
  for (size_t k = 0; k < N; ++k) {
    result[k] += trend * k;
  }
  return result;
}

//! A series with `N_wet` gamma-distributed values, all other values are zero.
static Series wet_series(size_t N, size_t N_wet, double shape, double scale) {
  stats::GammaFit fit = {shape, scale};

  Series result(N, 0.0);
  for (size_t k = 0; k < N_wet; ++k) {
    result[position(k, N)] = stats::gamma_ppf(fit, (k + 0.5) / N_wet);
  }
  return result;
}

static void test_quantile_mapping(test::Checks &check, std::shared_ptr<const Context> ctx) {
  MethodFactory factory(ctx);

  auto qm = factory.create(variable("tas", "air_temperature", "K"));
  check(qm->name() == "quantile_mapping", "default method: %s", qm->name().c_str());

  Series
    model    = normal_series(300, 280.0, 3.0, 0.0),
    scenario = normal_series(200, 282.0, 4.0, 0.01);

  // identical observations and model data: nothing changes
  {
    std::vector<Series> scenarios = {scenario};
    qm->correct(model, model, scenarios);
    for (size_t k = 0; k < scenario.size(); ++k) {
      check.close(scenarios[0][k], scenario[k], 1e-10, "QM: identical inputs");
    }
  }

  // observations are warmer by 2 K everywhere
  {
    Series observation = model;
    for (auto &v : observation) {
      v += 2.0;
    }

    std::vector<Series> scenarios = {scenario, Series()};
    qm->correct(observation, model, scenarios);
    for (size_t k = 0; k < scenario.size(); ++k) {
      check.close(scenarios[0][k], scenario[k] + 2.0, 1e-9, "QM: constant shift");
    }
    check(scenarios[1].empty(), "QM: an empty scenario");
  }

  std::vector<Series> scenarios = {scenario};
  check(test::throws([&]() { qm->correct(Series(), model, scenarios); }),
        "QM: no observations");
}

static void test_absolute_sdm(test::Checks &check, std::shared_ptr<const Context> ctx) {
  AbsoluteSDM sdm(ctx, variable("tas", "air_temperature", "K"));
  check(sdm.name() == "absolute_sdm", "absolute SDM: name");

  Series
    observation = normal_series(300, 285.0, 3.0, 0.0),
    model       = normal_series(300, 283.0, 4.0, 0.0),
    scenario    = normal_series(310, 287.0, 4.5, 0.02);

  std::vector<Series> scenarios = {scenario};
  sdm.correct(observation, model, scenarios);

  const Series &result = scenarios[0];
  check(result.size() == scenario.size(), "absolute SDM: length");

  bool finite = std::all_of(result.begin(), result.end(),
                            [](double v) { return std::isfinite(v); });
  check(finite, "absolute SDM: finite values");

  const double expected = (stats::mean(observation) + stats::mean(scenario) -
                           stats::mean(model));
  check.close(stats::mean(result), expected, 1e-8, "absolute SDM: mean");

  check(result != scenario, "absolute SDM: values are modified");

  // all series have the same shape: corrected anomalies are scenario anomalies scaled by
  // the ratio of standard deviations of observations and model data (3 / 4)
  {
    const size_t N = 200;
    Series base = normal_series(N, 0.0, 1.0, 0.0);
    Series obs(N), mod(N), sce(N);
    for (size_t k = 0; k < N; ++k) {
      obs[k] = 285.0 + 3.0 * base[k];
      mod[k] = 283.0 + 4.0 * base[k];
      sce[k] = 287.0 + 4.5 * base[k] + 0.02 * k;
    }

    std::vector<Series> s = {sce};
    sdm.correct(obs, mod, s);

    const Series anomaly = stats::detrend(sce);
    const double offset  = stats::mean(obs) - stats::mean(mod);

    double max_error = 0.0;
    for (size_t k = 0; k < N; ++k) {
      double expected = sce[k] + (0.75 - 1.0) * anomaly[k] + offset;
      max_error = std::max(max_error, std::fabs(s[0][k] - expected));
    }
    check(max_error < 1e-8, "absolute SDM: scaled anomalies (max. error %g)", max_error);

    const Series
      corrected = stats::sorted(stats::detrend(s[0])),
      original  = stats::sorted(anomaly);

    check.close(stats::fit_normal(corrected).std, 0.75 * stats::fit_normal(original).std, 1e-8,
                "absolute SDM: standard deviation");
    for (size_t k : {size_t(0), size_t(50), size_t(100), N - 1}) {
      check.close(corrected[k], 0.75 * original[k], 1e-8, "absolute SDM: quantiles");
    }
  }

  // zero variance in observations
  check(test::throws([&]() {
        std::vector<Series> s = {scenario};
        sdm.correct(Series(300, 285.0), model, s);
      }), "absolute SDM: constant observations");
}

static void test_relative_sdm(test::Checks &check, std::shared_ptr<const Context> ctx) {
  RelativeSDM sdm(ctx, variable("pr", "precipitation_amount", "kg m-2"));
  check(sdm.name() == "relative_sdm", "relative SDM: name");

  const size_t N = 300;
  Series
    observation = wet_series(N, 150, 2.0, 5.0),
    model       = wet_series(N, 200, 2.0, 4.0),
    scenario    = wet_series(N, 180, 2.0, 4.5),
    // fewer than min_samplesize wet days
    dry         = wet_series(N, 5, 2.0, 4.5);

  std::vector<Series> scenarios = {scenario, dry};
  sdm.correct(observation, model, scenarios);

  // 300 * (150 / 300) * (180 / 300) / (200 / 300)
  const int expected_wet_days = 135;

  const Series &result = scenarios[0];
  check(test::count_nonzero(result) == expected_wet_days,
        "relative SDM: %d wet days (expected %d)",
        test::count_nonzero(result), expected_wet_days);

  bool non_negative = std::all_of(result.begin(), result.end(),
                                  [](double v) { return std::isfinite(v) and v >= 0.0; });
  check(non_negative, "relative SDM: non-negative values");

  // wet days of the corrected series are the wettest days of the scenario
  Series sorted_scenario = stats::sorted(scenario);
  const double threshold = sorted_scenario[N - expected_wet_days];
  bool wettest = true;
  for (size_t k = 0; k < N; ++k) {
    if (result[k] > 0.0 and scenario[k] < threshold) {
      wettest = false;
    }
  }
  check(wettest, "relative SDM: the wettest days stay wet");

  check(scenarios[1] == dry, "relative SDM: a scenario with too few wet days is not modified");

  // too few wet days in observations: nothing changes
  {
    std::vector<Series> s = {scenario};
    sdm.correct(wet_series(N, 9, 2.0, 5.0), model, s);
    check(s[0] == scenario, "relative SDM: observations with too few wet days");
  }

  // wet days of all three series differ in scale only: corrected wet values are scenario
  // values times the ratio of observed and modeled scales (5 / 4)
  {
    Series
      obs = wet_series(N, 120, 2.0, 5.0),
      mod = wet_series(N, 120, 2.0, 4.0),
      sce = wet_series(N, 120, 2.0, 4.5);

    std::vector<Series> s = {sce};
    sdm.correct(obs, mod, s);

    check(test::count_nonzero(s[0]) == 120, "relative SDM: same number of wet days (%d)",
          test::count_nonzero(s[0]));

    double max_error = 0.0;
    for (size_t k = 0; k < N; ++k) {
      max_error = std::max(max_error, std::fabs(s[0][k] - 1.25 * sce[k]) / (1.0 + sce[k]));
    }
    check(max_error < 1e-6, "relative SDM: scaled wet values (max. error %g)", max_error);
  }

  // fewer wet days in the scenario than expected: missing wet days stay dry
  {
    Series sce = wet_series(N, 60, 2.0, 4.5);

    std::vector<Series> s = {sce};
    // 300 * (200 / 300) * (60 / 300) / (100 / 300) = 120 wet days expected
    sdm.correct(wet_series(N, 200, 2.0, 5.0), wet_series(N, 100, 2.0, 4.0), s);

    check(test::count_nonzero(s[0]) == 60, "relative SDM: padding (%d wet days)",
          test::count_nonzero(s[0]));

    bool same_days = true;
    for (size_t k = 0; k < N; ++k) {
      same_days = same_days and ((s[0][k] > 0.0) == (sce[k] > 0.0));
    }
    check(same_days, "relative SDM: padding keeps dry days dry");
  }

  // very few wet days expected: the corrected series is dry
  {
    std::vector<Series> s = {wet_series(N, 10, 2.0, 4.5)};
    sdm.correct(wet_series(N, 10, 2.0, 5.0), wet_series(N, 290, 2.0, 4.0), s);
    check(test::count_nonzero(s[0]) == 0, "relative SDM: no wet days expected");
  }
}

static void test_dispatch(test::Checks &check, MPI_Comm com) {
  std::shared_ptr<StringLogger> log(new StringLogger(com, 2));
  auto ctx = test_context(com, log);

  MethodFactory factory(ctx);

  {
    auto m = factory.create("scaled_distribution_mapping", variable("tas", "air_temperature", "K"));
    auto sdm = std::dynamic_pointer_cast<ScaledDistributionMapping>(m);
    check(sdm and sdm->implementation()->name() == "absolute_sdm", "SDM: air temperature");
  }

  for (auto name : {"precipitation_amount", "surface_downwelling_shortwave_flux_in_air"}) {
    auto m = factory.create("scaled_distribution_mapping", variable("v", name, "1"));
    auto sdm = std::dynamic_pointer_cast<ScaledDistributionMapping>(m);
    check(sdm and sdm->implementation()->name() == "relative_sdm", "SDM: %s", name);
  }

  // unsupported quantities are not corrected
  {
    log->reset();

    auto m = factory.create("scaled_distribution_mapping", variable("sfcWind", "wind_speed", "m s-1"));
    auto sdm = std::dynamic_pointer_cast<ScaledDistributionMapping>(m);
    check(sdm and not sdm->implementation(), "SDM: wind speed");
    check(log->get().find("SDM not implemented for wind_speed") != std::string::npos,
          "SDM: unsupported quantity message: '%s'", log->get().c_str());

    Series
      observation = normal_series(100, 5.0, 1.0, 0.0),
      model       = normal_series(100, 4.0, 1.0, 0.0),
      scenario    = normal_series(100, 6.0, 1.0, 0.0);
    std::vector<Series> scenarios = {scenario};
    m->correct(observation, model, scenarios);
    check(scenarios[0] == scenario, "SDM: wind speed is not modified");
  }

  ctx->config()->set_flag("bias_correction.sdm.unsupported_quantity_is_error", true);
  check(test::throws([&]() {
        factory.create("scaled_distribution_mapping", variable("sfcWind", "wind_speed", "m s-1"));
      }), "SDM: unsupported quantity is an error");

  check(test::throws([&]() { factory.create("delta_change", variable("tas", "air_temperature", "K")); }),
        "unknown method");
}

static void test_sdm_parameters(test::Checks &check, MPI_Comm com) {
  std::shared_ptr<StringLogger> log(new StringLogger(com, 2));
  auto ctx = test_context(com, log);
  auto config = ctx->config();

  VariableMetadata
    tas = variable("tas", "air_temperature", "K"),
    pr  = variable("pr", "precipitation_amount", "kg m-2");

  config->set_number("bias_correction.sdm.absolute.cdf_threshold", 0.4);
  check(test::throws([&]() { AbsoluteSDM sdm(ctx, tas); }), "absolute SDM: threshold below 0.5");

  config->set_number("bias_correction.sdm.absolute.cdf_threshold", 1.0);
  check(test::throws([&]() { AbsoluteSDM sdm(ctx, tas); }), "absolute SDM: threshold of 1");

  config->set_number("bias_correction.sdm.relative.cdf_threshold", 1.5);
  check(test::throws([&]() { RelativeSDM sdm(ctx, pr); }), "relative SDM: threshold above 1");

  config->set_number("bias_correction.sdm.relative.cdf_threshold", 0.99);
  config->set_number("bias_correction.sdm.relative.min_samplesize", -1);
  check(test::throws([&]() { RelativeSDM sdm(ctx, pr); }), "relative SDM: negative sample size");

  config->set_number("bias_correction.sdm.relative.min_samplesize", 0);
  check(not test::throws([&]() { RelativeSDM sdm(ctx, pr); }), "relative SDM: valid parameters");
}

static void test_grid(test::Checks &check, std::shared_ptr<const Context> ctx) {
  units::System::Ptr sys = ctx->unit_system();

  Axis y, x;
  y.name = "y";
  y.values = {0.0, 1.0};
  x.name = "x";
  x.values = {0.0, 1.0};

  VariableMetadata tas = variable("tas", "air_temperature", "K");
  TimeUnits time_units(sys, "days since 2000-01-01", Calendar("standard"));

  const size_t N = 50;
  std::vector<double> time(N);
  for (size_t k = 0; k < N; ++k) {
    time[k] = k;
  }

  GriddedTimeSeries
    observation(tas, time_units, time, y, x),
    model(tas, time_units, time, y, x),
    scenario(tas, time_units, time, y, x);

  Series
    mod = normal_series(N, 280.0, 2.0, 0.0),
    sce = normal_series(N, 281.0, 2.0, 0.0);
  Series obs = mod;
  for (auto &v : obs) {
    v += 1.5;
  }

  for (size_t j = 0; j < 2; ++j) {
    for (size_t i = 0; i < 2; ++i) {
      observation.set_cell(j, i, obs);
      model.set_cell(j, i, mod);
      scenario.set_cell(j, i, sce);
    }
  }

  // cell (0, 1) is masked, cell (1, 0) has a missing value in the first scenario only
  observation(0, 0, 1) = std::numeric_limits<double>::quiet_NaN();
  observation.set_mask(observation.mask_from_first_record());
  GriddedTimeSeries complete = scenario;
  scenario(10, 1, 0) = std::numeric_limits<double>::quiet_NaN();

  std::vector<GriddedTimeSeries> scenarios = {scenario, complete};

  MethodFactory factory(ctx);
  auto qm = factory.create("quantile_mapping", tas);
  CorrectionSummary summary = qm->correct(observation, model, scenarios);

  check(summary.corrected == 3 and summary.masked == 1 and summary.incomplete == 0,
        "grid: summary (%d corrected, %d masked, %d incomplete)",
        (int)summary.corrected, (int)summary.masked, (int)summary.incomplete);
  check(summary.skipped == std::vector<size_t>({1, 0}),
        "grid: cells skipped in each scenario");

  {
    const GriddedTimeSeries &result = scenarios[0];
    check.close(result(5, 0, 0), sce[5] + 1.5, 1e-9, "grid: corrected cell (0, 0)");
    check.close(result(5, 1, 1), sce[5] + 1.5, 1e-9, "grid: corrected cell (1, 1)");
    check(result.cell(0, 1) == sce, "grid: masked cell is not modified");
    check(result(5, 1, 0) == sce[5] and std::isnan(result(10, 1, 0)),
          "grid: a scenario with a missing value is not modified");
  }

  {
    const GriddedTimeSeries &result = scenarios[1];
    check.close(result(5, 1, 0), sce[5] + 1.5, 1e-9,
                "grid: other scenarios at a cell with a missing value are corrected");
    check.close(result(10, 1, 0), sce[10] + 1.5, 1e-9,
                "grid: other scenarios at a cell with a missing value are corrected");
    check(result.cell(0, 1) == sce, "grid: masked cell is not modified (second scenario)");
  }

  // a missing value in model data: no scenario is corrected at this cell
  {
    model(3, 1, 1) = std::numeric_limits<double>::quiet_NaN();

    std::vector<GriddedTimeSeries> s = {complete};
    CorrectionSummary summary2 = qm->correct(observation, model, s);
    check(summary2.corrected == 2 and summary2.incomplete == 1,
          "grid: missing model data (%d corrected, %d incomplete)",
          (int)summary2.corrected, (int)summary2.incomplete);
    check(s[0].cell(1, 1) == sce, "grid: cell with missing model data is not modified");
  }

  // grids have to match
  Axis x2 = x;
  x2.values = {0.0, 2.0};
  GriddedTimeSeries other(tas, time_units, time, y, x2);
  check(test::throws([&]() { qm->correct(observation, other, scenarios); }),
        "grid: different grids");
}

int main(int argc, char *argv[]) {
  MPI_Init(&argc, &argv);
  gsl_set_error_handler_off();

  MPI_Comm com = MPI_COMM_WORLD;
  test::Checks check("correction_test");

  try {
    std::shared_ptr<StringLogger> log(new StringLogger(com, 2));
    std::shared_ptr<const Context> ctx = test_context(com, log);

    test_quantile_mapping(check, ctx);
    test_absolute_sdm(check, ctx);
    test_relative_sdm(check, ctx);
    test_dispatch(check, com);
    test_sdm_parameters(check, com);
    test_grid(check, ctx);
  } catch (...) {
    handle_fatal_errors(com);
    check.failure();
  }

  MPI_Finalize();

  return check.report();
}
