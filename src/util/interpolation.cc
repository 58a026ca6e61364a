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

#include <gsl/gsl_interp.h>

#include "bcat/util/interpolation.hh"
#include "bcat/util/error_handling.hh"

namespace bcat {

InterpolationType interpolation_type(const std::string &name) {
  if (name == "linear") {
    return LINEAR;
  }
  if (name == "nearest") {
    return NEAREST;
  }
  throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                "unknown interpolation type '%s'", name.c_str());
}

Interpolation::Interpolation(InterpolationType type,
                             const std::vector<double> &source_x,
                             const std::vector<double> &target_x)
  : m_left(target_x.size(), 0),
    m_right(target_x.size(), 0),
    m_alpha(target_x.size(), 0.0) {

  const size_t N = source_x.size();

  if (N == 0) {
    throw RuntimeError(BCAT_ERROR_LOCATION, "cannot interpolate from an empty grid");
  }

  for (size_t j = 1; j < N; ++j) {
    if (not (source_x[j - 1] < source_x[j])) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "source grid is not strictly increasing"
                                    " (x[%d] = %f, x[%d] = %f)",
                                    (int)j - 1, source_x[j - 1], (int)j, source_x[j]);
    }
  }

  if (N == 1) {
    // all weights are zero and all indexes point to the only source point
    return;
  }

  const double *x = source_x.data();

  for (size_t k = 0; k < target_x.size(); ++k) {
    const double t = target_x[k];

    // the upper bound N (instead of N - 1) gives L = N - 1 to the right of the grid
    size_t L = gsl_interp_bsearch(x, t, 0, N);

    if (t <= x[L] or L == N - 1) {
      // on a source grid point or outside the source grid
      m_left[k]  = L;
      m_right[k] = L;
      continue;
    }

    double alpha = (t - x[L]) / (x[L + 1] - x[L]);
    if (type == NEAREST) {
      alpha = alpha > 0.5 ? 1.0 : 0.0;
    }

    m_left[k]  = L;
    m_right[k] = L + 1;
    m_alpha[k] = alpha;
  }
}

const std::vector<int>& Interpolation::left() const {
  return m_left;
}

const std::vector<int>& Interpolation::right() const {
  return m_right;
}

const std::vector<double>& Interpolation::alpha() const {
  return m_alpha;
}

std::vector<double> Interpolation::interpolate(const std::vector<double> &source_values) const {
  std::vector<double> result(m_alpha.size());

  for (size_t k = 0; k < result.size(); ++k) {
    const double
      a = source_values[m_left[k]],
      b = source_values[m_right[k]];
    result[k] = a + m_alpha[k] * (b - a);
  }

  return result;
}

std::vector<double> linspace(double a, double b, size_t n) {
  std::vector<double> result(n, a);

  if (n > 1) {
    const double dx = (b - a) / (n - 1);
    for (size_t k = 0; k < n; ++k) {
      result[k] = a + k * dx;
    }
    result[n - 1] = b;
  }

  return result;
}

std::vector<double> interpolate_by_rank(const std::vector<double> &values, size_t n) {
  if (n == 0) {
    return {};
  }

  if (values.empty()) {
    throw RuntimeError(BCAT_ERROR_LOCATION, "cannot resample an empty sample");
  }

  const double N = static_cast<double>(values.size());

  return Interpolation(LINEAR,
                       linspace(1.0, N, values.size()),
                       linspace(1.0, N, n)).interpolate(values);
}

} // end of namespace bcat
