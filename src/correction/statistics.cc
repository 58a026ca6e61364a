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
#include <numeric>

#include <gsl/gsl_cdf.h>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_fit.h>
#include <gsl/gsl_math.h>
#include <gsl/gsl_roots.h>
#include <gsl/gsl_sf_psi.h>
#include <gsl/gsl_statistics_double.h>

#include "bcat/correction/statistics.hh"
#include "bcat/util/error_handling.hh"

namespace bcat {
namespace stats {

static void check_sample(const std::vector<double> &x) {
  if (x.empty()) {
    throw RuntimeError(BCAT_ERROR_LOCATION, "empty sample");
  }
}

double mean(const std::vector<double> &x) {
  check_sample(x);
  return gsl_stats_mean(x.data(), 1, x.size());
}

std::vector<size_t> argsort(const std::vector<double> &x) {
  std::vector<size_t> result(x.size());
  std::iota(result.begin(), result.end(), 0);

  std::stable_sort(result.begin(), result.end(),
                   [&x](size_t a, size_t b) {
                     return x[a] < x[b];
                   });
  return result;
}

std::vector<double> sorted(const std::vector<double> &x) {
  std::vector<double> result(x);
  std::sort(result.begin(), result.end());
  return result;
}

std::vector<double> at_least(const std::vector<double> &x, double limit) {
  std::vector<double> result;
  for (auto v : x) {
    if (v >= limit) {
      result.push_back(v);
    }
  }
  return result;
}

double percentile(const std::vector<double> &x, double p) {
  check_sample(x);
  return gsl_stats_quantile_from_sorted_data(x.data(), 1, x.size(), p / 100.0);
}

std::vector<double> ecdf(const std::vector<double> &sample, const std::vector<double> &x) {
  check_sample(sample);

  auto s = sorted(sample);
  const double N = static_cast<double>(s.size());

  std::vector<double> result(x.size());
  for (size_t k = 0; k < x.size(); ++k) {
    auto n = std::upper_bound(s.begin(), s.end(), x[k]) - s.begin();
    result[k] = n / N;
  }
  return result;
}

std::vector<double> detrend(const std::vector<double> &x) {
  check_sample(x);

  const size_t N = x.size();
  std::vector<double> result(N);

  if (N < 2) {
    result[0] = 0.0;
    return result;
  }

  std::vector<double> t(N);
  std::iota(t.begin(), t.end(), 0.0);

  double c0 = 0.0, c1 = 0.0, cov00 = 0.0, cov01 = 0.0, cov11 = 0.0, sumsq = 0.0;
  int status = gsl_fit_linear(t.data(), 1, x.data(), 1, N,
                              &c0, &c1, &cov00, &cov01, &cov11, &sumsq);
  if (status != GSL_SUCCESS) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "linear regression failed: %s", gsl_strerror(status));
  }

  for (size_t k = 0; k < N; ++k) {
    result[k] = x[k] - (c0 + c1 * t[k]);
  }

  return result;
}

void clip(std::vector<double> &x, double lower, double upper) {
  for (auto &v : x) {
    v = std::min(std::max(v, lower), upper);
  }
}

NormalFit fit_normal(const std::vector<double> &x) {
  check_sample(x);

  NormalFit result;
  result.mean = gsl_stats_mean(x.data(), 1, x.size());
  // maximum likelihood estimate: divide by N, not N - 1
  result.std  = std::sqrt(gsl_stats_variance_with_fixed_mean(x.data(), 1, x.size(), result.mean));

  if (not (result.std > 0.0) or not std::isfinite(result.mean)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "cannot fit a normal distribution to a sample with"
                                  " zero variance (mean: %f, %d values)",
                                  result.mean, (int)x.size());
  }

  return result;
}

double normal_cdf(const NormalFit &fit, double x) {
  return gsl_cdf_gaussian_P(x - fit.mean, fit.std);
}

double normal_ppf(const NormalFit &fit, double p) {
  return fit.mean + gsl_cdf_gaussian_Pinv(p, fit.std);
}

namespace {

struct GammaParams {
  double s;
};

//! The maximum likelihood equation for the shape parameter.
double gamma_shape_equation(double a, void *params) {
  const GammaParams *p = reinterpret_cast<GammaParams*>(params);
  return std::log(a) - gsl_sf_psi(a) - p->s;
}

} // end of anonymous namespace

/*!
 * Maximum likelihood estimates of parameters of the gamma distribution with location fixed at
 * zero.
 *
 * The shape `a` solves
 *
 * log(a) - psi(a) = log(mean(x)) - mean(log(x)),
 *
 * and scale = mean(x) / a. The initial guess comes from Minka, "Estimating a Gamma
 * distribution" (2002).
 */
GammaFit fit_gamma(const std::vector<double> &x) {
  check_sample(x);

  double mean_log = 0.0;
  for (auto v : x) {
    if (not (v > 0.0)) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "cannot fit a gamma distribution: sample contains"
                                    " a non-positive value (%f)", v);
    }
    mean_log += std::log(v);
  }
  mean_log /= x.size();

  const double m = mean(x);

  GammaParams params;
  params.s = std::log(m) - mean_log;

  if (not (params.s > 0.0) or not std::isfinite(params.s)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "cannot fit a gamma distribution to a sample with"
                                  " zero variance (mean: %f, %d values)",
                                  m, (int)x.size());
  }

  const double
    s     = params.s,
    guess = (3.0 - s + std::sqrt((s - 3.0) * (s - 3.0) + 24.0 * s)) / (12.0 * s);

  gsl_function F;
  F.function = &gamma_shape_equation;
  F.params   = &params;

  // gamma_shape_equation() is decreasing: expand the bracket until it contains the root
  double
    lower = 0.6 * guess,
    upper = 1.4 * guess;
  while (gamma_shape_equation(lower, &params) < 0.0) {
    lower *= 0.5;
  }
  while (gamma_shape_equation(upper, &params) > 0.0) {
    upper *= 2.0;
  }

  gsl_root_fsolver *solver = gsl_root_fsolver_alloc(gsl_root_fsolver_brent);
  if (solver == NULL) {
    throw RuntimeError(BCAT_ERROR_LOCATION, "failed to allocate a root solver");
  }

  double shape = guess;
  int status = gsl_root_fsolver_set(solver, &F, lower, upper);

  const int max_iterations = 100;
  for (int k = 0; status == GSL_SUCCESS and k < max_iterations; ++k) {
    status = gsl_root_fsolver_iterate(solver);
    if (status != GSL_SUCCESS) {
      break;
    }

    shape = gsl_root_fsolver_root(solver);
    lower = gsl_root_fsolver_x_lower(solver);
    upper = gsl_root_fsolver_x_upper(solver);

    status = gsl_root_test_interval(lower, upper, 0.0, 1e-12);
    if (status == GSL_SUCCESS) {
      break;
    }
    if (status == GSL_CONTINUE) {
      status = GSL_SUCCESS;
    }
  }
  gsl_root_fsolver_free(solver);

  if (status != GSL_SUCCESS or not (shape > 0.0)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "failed to estimate the shape of a gamma distribution: %s",
                                  gsl_strerror(status));
  }

  GammaFit result;
  result.shape = shape;
  result.scale = m / shape;

  return result;
}

double gamma_cdf(const GammaFit &fit, double x) {
  return gsl_cdf_gamma_P(x, fit.shape, fit.scale);
}

double gamma_ppf(const GammaFit &fit, double p) {
  return gsl_cdf_gamma_Pinv(p, fit.shape, fit.scale);
}

} // end of namespace stats
} // end of namespace bcat
