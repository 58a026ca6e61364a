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

#include "bcat/correction/Regridder.hh"
#include "bcat/util/error_handling.hh"

namespace bcat {

Regridder::Weights Regridder::weights(InterpolationType type,
                                      const std::vector<double> &source,
                                      const std::vector<double> &target) {
  const int N = static_cast<int>(source.size());

  bool decreasing = N > 1 and source[0] > source[1];

  Weights result;

  if (not decreasing) {
    Interpolation I(type, source, target);
    result.left  = I.left();
    result.right = I.right();
    result.alpha = I.alpha();
  } else {
    std::vector<double> reversed(source.rbegin(), source.rend());
    Interpolation I(type, reversed, target);

    // map indexes in the reversed grid back to the original one
    result.alpha = I.alpha();
    for (size_t k = 0; k < target.size(); ++k) {
      result.left.push_back(N - 1 - I.left()[k]);
      result.right.push_back(N - 1 - I.right()[k]);
    }
  }

  return result;
}

Regridder::Regridder(InterpolationType type,
                     const Axis &source_y, const Axis &source_x,
                     const Axis &target_y, const Axis &target_x)
  : m_source_y(source_y),
    m_source_x(source_x),
    m_target_y(target_y),
    m_target_x(target_x) {

  m_identity = (source_y.values == target_y.values and
                source_x.values == target_x.values);

  try {
    m_y = weights(type, source_y.values, target_y.values);
    m_x = weights(type, source_x.values, target_x.values);
  } catch (RuntimeError &e) {
    e.add_context("initializing regridding from a %dx%d grid to a %dx%d grid",
                  (int)source_y.values.size(), (int)source_x.values.size(),
                  (int)target_y.values.size(), (int)target_x.values.size());
    throw;
  }
}

bool Regridder::identity() const {
  return m_identity;
}

bool Regridder::maps(const Axis &source_y, const Axis &source_x,
                     const Axis &target_y, const Axis &target_x) const {
  return (source_y.values == m_source_y.values and
          source_x.values == m_source_x.values and
          target_y.values == m_target_y.values and
          target_x.values == m_target_x.values);
}

// Zero weights do not propagate missing values (NaNs) from neighboring points.
static inline double lerp(double alpha, double left, double right) {
  if (alpha == 0.0) {
    return left;
  }
  if (alpha == 1.0) {
    return right;
  }
  return left + alpha * (right - left);
}

GriddedTimeSeries Regridder::apply(const GriddedTimeSeries &input) const {
  if (input.y().values != m_source_y.values or input.x().values != m_source_x.values) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "cannot regrid %s: it does not use the source grid",
                                  input.metadata().name.c_str());
  }

  if (m_identity) {
    return input;
  }

  GriddedTimeSeries result(input.metadata(), input.time_units(), input.time(),
                           m_target_y, m_target_x);

  const size_t
    nt = input.n_time(),
    ny = result.ny(),
    nx = result.nx();

  for (size_t t = 0; t < nt; ++t) {
    for (size_t j = 0; j < ny; ++j) {
      const int
        yl = m_y.left[j],
        yr = m_y.right[j];
      const double ay = m_y.alpha[j];

      for (size_t i = 0; i < nx; ++i) {
        const int
          xl = m_x.left[i],
          xr = m_x.right[i];
        const double ax = m_x.alpha[i];

        double
          bottom = lerp(ax, input(t, yl, xl), input(t, yl, xr)),
          top    = lerp(ax, input(t, yr, xl), input(t, yr, xr));

        result(t, j, i) = lerp(ay, bottom, top);
      }
    }
  }

  return result;
}

RegridderCache::RegridderCache(InterpolationType type)
  : m_type(type), m_n_built(0) {
  // empty
}

Regridder::ConstPtr RegridderCache::get(const GriddedTimeSeries &source,
                                        const GriddedTimeSeries &target) {
  std::vector<size_t> shape = {source.ny(), source.nx(), target.ny(), target.nx()};

  auto r = m_regridders.find(shape);
  if (r != m_regridders.end() and
      r->second->maps(source.y(), source.x(), target.y(), target.x())) {
    return r->second;
  }

  Regridder::ConstPtr result(new Regridder(m_type,
                                           source.y(), source.x(),
                                           target.y(), target.x()));
  m_regridders[shape] = result;
  m_n_built += 1;

  return result;
}

unsigned int RegridderCache::n_built() const {
  return m_n_built;
}

} // end of namespace bcat
