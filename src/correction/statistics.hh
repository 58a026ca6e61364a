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

#ifndef BCAT_STATISTICS_H
#define BCAT_STATISTICS_H

#include <vector>

namespace bcat {
namespace stats {

double mean(const std::vector<double> &x);

//! Indexes that sort `x` in ascending order. Equal elements keep their relative order.
std::vector<size_t> argsort(const std::vector<double> &x);

std::vector<double> sorted(const std::vector<double> &x);

//! Elements of `x` greater than or equal to `limit` (in the original order).
std::vector<double> at_least(const std::vector<double> &x, double limit);

//! Percentile `p` (0 to 100) of the *sorted* sample `x`, using linear interpolation between
//! closest ranks.
double percentile(const std::vector<double> &x, double p);

//! Empirical CDF of `sample` evaluated at `x` (the fraction of samples less than or equal to x).
std::vector<double> ecdf(const std::vector<double> &sample, const std::vector<double> &x);

//! Remove the least-squares linear trend from `x`.
std::vector<double> detrend(const std::vector<double> &x);

//! Clip `x` to `[lower, upper]` in place.
void clip(std::vector<double> &x, double lower, double upper);

//! Normal distribution (maximum likelihood estimates of parameters).
struct NormalFit {
  double mean;
  double std;
};

NormalFit fit_normal(const std::vector<double> &x);

double normal_cdf(const NormalFit &fit, double x);
double normal_ppf(const NormalFit &fit, double p);

//! Gamma distribution with location zero.
struct GammaFit {
  double shape;
  double scale;
};

GammaFit fit_gamma(const std::vector<double> &x);

double gamma_cdf(const GammaFit &fit, double x);
double gamma_ppf(const GammaFit &fit, double p);

//! `function(fit, x[k])` for all elements of `x`.
template<class Fit, typename F>
std::vector<double> evaluate(F function, const Fit &fit, const std::vector<double> &x) {
  std::vector<double> result(x.size());
  for (size_t k = 0; k < x.size(); ++k) {
    result[k] = function(fit, x[k]);
  }
  return result;
}

} // end of namespace stats
} // end of namespace bcat

#endif /* BCAT_STATISTICS_H */
