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

#ifndef BCAT_INTERPOLATION_H
#define BCAT_INTERPOLATION_H

#include <string>
#include <vector>

namespace bcat {

enum InterpolationType {LINEAR, NEAREST};

//! Convert "linear" or "nearest" to an InterpolationType.
InterpolationType interpolation_type(const std::string &name);

//! Interpolation weights from one 1D grid to another.
/*!
 * Weights are computed once and then applied to any number of fields defined on the source grid
 * (each time record of a field, each dimension of a 2D regridding problem).
 *
 * The value at the target point `k` is
 * ~~~ c++
 * source[left[k]] + alpha[k] * (source[right[k]] - source[left[k]])
 * ~~~
 * Target points outside the source grid get the value at the closest end of the source grid.
 * NEAREST interpolation uses the same formula with `alpha` rounded to 0 or 1 (ties go left).
 */
class Interpolation {
public:
  //! `source_x` has to be strictly increasing. `target_x` may be in any order.
  Interpolation(InterpolationType type, const std::vector<double> &source_x,
                const std::vector<double> &target_x);

  const std::vector<int>& left() const;
  const std::vector<int>& right() const;
  const std::vector<double>& alpha() const;

  std::vector<double> interpolate(const std::vector<double> &source_values) const;
private:
  std::vector<int> m_left, m_right;
  std::vector<double> m_alpha;
};

//! `n` equally spaced points from `a` to `b` (both included).
std::vector<double> linspace(double a, double b, size_t n);

//! Resample `values` to `n` points by linear interpolation in rank space.
/*!
 * The ranks `1, ..., values.size()` are mapped onto `n` equally spaced points spanning the same
 * interval.
 */
std::vector<double> interpolate_by_rank(const std::vector<double> &values, size_t n);

} // end of namespace bcat

#endif /* BCAT_INTERPOLATION_H */
