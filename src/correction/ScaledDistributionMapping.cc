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

#include "bcat/correction/ScaledDistributionMapping.hh"
#include "bcat/correction/statistics.hh"
#include "bcat/util/Config.hh"
#include "bcat/util/Context.hh"
#include "bcat/util/Logger.hh"
#include "bcat/util/error_handling.hh"
#include "bcat/util/interpolation.hh"

namespace bcat {

static double sign(double x) {
  return (x > 0.0) - (x < 0.0);
}

static void check_finite(const std::vector<double> &x, const char *name) {
  for (auto v : x) {
    if (not std::isfinite(v)) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "scaled distribution mapping produced non-finite %s",
                                    name);
    }
  }
}

AbsoluteSDM::AbsoluteSDM(std::shared_ptr<const Context> ctx, const VariableMetadata &variable)
  : CorrectionMethod(ctx, variable, "absolute_sdm") {
  m_cdf_threshold = ctx->config()->get_number("bias_correction.sdm.absolute.cdf_threshold");

  // CDF values are clipped to [1 - threshold, threshold]
  if (not (m_cdf_threshold > 0.5 and m_cdf_threshold < 1.0)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "bias_correction.sdm.absolute.cdf_threshold = %f is invalid"
                                  " (has to be in (0.5, 1))", m_cdf_threshold);
  }
}

void AbsoluteSDM::correct_impl(const std::vector<double> &observation,
                               const std::vector<double> &model,
                               std::vector<std::vector<double> > &scenarios) const {
  using namespace stats;

  const double
    upper = m_cdf_threshold,
    lower = 1.0 - m_cdf_threshold;

  const double
    obs_mean = mean(observation),
    mod_mean = mean(model);

  auto obs_detrended = detrend(observation);
  auto mod_detrended = detrend(model);

  auto obs_fit = fit_normal(obs_detrended);
  auto mod_fit = fit_normal(mod_detrended);

  auto obs_cdf = evaluate(normal_cdf, obs_fit, sorted(obs_detrended));
  auto mod_cdf = evaluate(normal_cdf, mod_fit, sorted(mod_detrended));
  clip(obs_cdf, lower, upper);
  clip(mod_cdf, lower, upper);

  for (auto &scenario : scenarios) {
    const size_t N = scenario.size();
    if (N == 0) {
      continue;
    }

    const double sce_mean = mean(scenario);

    auto sce_detrended = detrend(scenario);
    auto order         = argsort(sce_detrended);

    auto sce_fit = fit_normal(sce_detrended);
    auto sce_cdf = evaluate(normal_cdf, sce_fit, sorted(sce_detrended));
    clip(sce_cdf, lower, upper);

    // CDF values of observations and model data at ranks of the scenario
    auto obs_cdf_N = interpolate_by_rank(obs_cdf, N);
    auto mod_cdf_N = interpolate_by_rank(mod_cdf, N);

    // adapt CDF values of observations, treating both tails separately
    std::vector<double> adapted(N);
    for (size_t k = 0; k < N; ++k) {
      double
        obs_shift   = obs_cdf_N[k] - 0.5,
        mod_shift   = mod_cdf_N[k] - 0.5,
        sce_shift   = sce_cdf[k] - 0.5,
        obs_inverse = 1.0 / (0.5 - std::fabs(obs_shift)),
        mod_inverse = 1.0 / (0.5 - std::fabs(mod_shift)),
        sce_inverse = 1.0 / (0.5 - std::fabs(sce_shift));

      adapted[k] = sign(obs_shift) * (1.0 - 1.0 / (obs_inverse * sce_inverse / mod_inverse));
      if (adapted[k] < 0.0) {
        adapted[k] += 1.0;
      }
    }
    clip(adapted, lower, upper);
    adapted = sorted(adapted);

    std::vector<double> xvals(N);
    for (size_t k = 0; k < N; ++k) {
      xvals[k] = (normal_ppf(obs_fit, adapted[k]) +
                  obs_fit.std / mod_fit.std * (normal_ppf(sce_fit, sce_cdf[k]) -
                                               normal_ppf(mod_fit, sce_cdf[k])));
    }
    check_finite(xvals, "quantiles");

    const double shift = obs_mean + (sce_mean - mod_mean) - mean(xvals);

    // put corrected values back in the original order and restore the trend
    std::vector<double> result(N);
    for (size_t k = 0; k < N; ++k) {
      result[order[k]] = xvals[k] + shift;
    }
    for (size_t k = 0; k < N; ++k) {
      result[k] += (scenario[k] - sce_detrended[k]) - sce_mean;
    }

    scenario = result;
  }
}

RelativeSDM::RelativeSDM(std::shared_ptr<const Context> ctx, const VariableMetadata &variable)
  : CorrectionMethod(ctx, variable, "relative_sdm") {
  auto config = ctx->config();

  m_cdf_threshold = config->get_number("bias_correction.sdm.relative.cdf_threshold");
  m_lower_limit   = config->get_number("bias_correction.sdm.relative.lower_limit");

  if (not (m_cdf_threshold > 0.0 and m_cdf_threshold < 1.0)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "bias_correction.sdm.relative.cdf_threshold = %f is invalid"
                                  " (has to be in (0, 1))", m_cdf_threshold);
  }

  double min_samplesize = config->get_number("bias_correction.sdm.relative.min_samplesize");
  if (min_samplesize < 0.0) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "bias_correction.sdm.relative.min_samplesize = %d is invalid"
                                  " (has to be non-negative)", (int)min_samplesize);
  }
  m_min_samplesize = static_cast<size_t>(min_samplesize);
}

void RelativeSDM::correct_impl(const std::vector<double> &observation,
                               const std::vector<double> &model,
                               std::vector<std::vector<double> > &scenarios) const {
  using namespace stats;

  auto obs_wet = at_least(observation, m_lower_limit);
  auto mod_wet = at_least(model, m_lower_limit);

  if (obs_wet.size() < m_min_samplesize or mod_wet.size() < m_min_samplesize) {
    return;
  }

  const double
    obs_frequency = double(obs_wet.size()) / observation.size(),
    mod_frequency = double(mod_wet.size()) / model.size();

  auto obs_fit = fit_gamma(obs_wet);
  auto mod_fit = fit_gamma(mod_wet);

  auto obs_cdf = evaluate(gamma_cdf, obs_fit, sorted(obs_wet));
  auto mod_cdf = evaluate(gamma_cdf, mod_fit, sorted(mod_wet));
  // the lower bound is zero, so clip from above only
  clip(obs_cdf, 0.0, m_cdf_threshold);
  clip(mod_cdf, 0.0, m_cdf_threshold);

  for (auto &scenario : scenarios) {
    auto sce_wet = at_least(scenario, m_lower_limit);

    if (sce_wet.size() < m_min_samplesize) {
      continue;
    }

    const size_t
      N     = scenario.size(),
      N_wet = sce_wet.size();

    const double sce_frequency = double(N_wet) / N;

    auto order   = argsort(scenario);
    auto sce_fit = fit_gamma(sce_wet);

    const size_t expected_wet_days =
      std::min(static_cast<size_t>(std::nearbyint(N * obs_frequency * sce_frequency / mod_frequency)),
               N);

    auto sce_cdf = evaluate(gamma_cdf, sce_fit, sorted(sce_wet));
    clip(sce_cdf, 0.0, m_cdf_threshold);

    // CDF values of observations and model data at ranks of scenario wet days
    auto obs_cdf_N = interpolate_by_rank(obs_cdf, N_wet);
    auto mod_cdf_N = interpolate_by_rank(mod_cdf, N_wet);

    std::vector<double> adapted(N_wet);
    for (size_t k = 0; k < N_wet; ++k) {
      double
        obs_inverse = 1.0 / (1.0 - obs_cdf_N[k]),
        mod_inverse = 1.0 / (1.0 - mod_cdf_N[k]),
        sce_inverse = 1.0 / (1.0 - sce_cdf[k]);

      adapted[k] = std::max(1.0 - 1.0 / (obs_inverse * sce_inverse / mod_inverse), 0.0);
    }
    adapted = sorted(adapted);

    std::vector<double> xvals(N_wet);
    for (size_t k = 0; k < N_wet; ++k) {
      xvals[k] = (gamma_ppf(obs_fit, adapted[k]) *
                  gamma_ppf(sce_fit, sce_cdf[k]) / gamma_ppf(mod_fit, sce_cdf[k]));
    }
    check_finite(xvals, "quantiles");

    // stretch or pad to get the expected number of wet days
    if (N_wet > expected_wet_days) {
      xvals = interpolate_by_rank(xvals, expected_wet_days);
    } else {
      xvals.insert(xvals.begin(), expected_wet_days - N_wet, 0.0);
    }

    // the wettest days of the scenario get corrected values, all others become dry
    std::vector<double> result(N, 0.0);
    for (size_t k = 0; k < expected_wet_days; ++k) {
      result[order[N - expected_wet_days + k]] = xvals[k];
    }

    scenario = result;
  }
}

ScaledDistributionMapping::ScaledDistributionMapping(std::shared_ptr<const Context> ctx,
                                                     const VariableMetadata &variable)
  : CorrectionMethod(ctx, variable, "scaled_distribution_mapping") {

  const std::string &quantity = variable.standard_name;

  if (quantity == "air_temperature") {
    m_implementation.reset(new AbsoluteSDM(ctx, variable));
  } else if (quantity == "precipitation_amount" or
             quantity == "surface_downwelling_shortwave_flux_in_air") {
    m_implementation.reset(new RelativeSDM(ctx, variable));
  } else {
    if (ctx->config()->get_flag("bias_correction.sdm.unsupported_quantity_is_error")) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "SDM not implemented for %s (variable %s)",
                                    quantity.c_str(), variable.name.c_str());
    }

    ctx->log()->error("SDM not implemented for %s (variable %s): data are not corrected\n",
                      quantity.c_str(), variable.name.c_str());
  }
}

CorrectionMethod::Ptr ScaledDistributionMapping::implementation() const {
  return m_implementation;
}

void ScaledDistributionMapping::correct_impl(const std::vector<double> &observation,
                                             const std::vector<double> &model,
                                             std::vector<std::vector<double> > &scenarios) const {
  if (m_implementation) {
    m_implementation->correct(observation, model, scenarios);
  }
}

} // end of namespace bcat
