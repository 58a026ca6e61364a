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

#ifndef BCAT_REGRIDDER_H
#define BCAT_REGRIDDER_H

#include <map>
#include <memory>
#include <vector>

#include "bcat/util/GriddedTimeSeries.hh"
#include "bcat/util/interpolation.hh"

namespace bcat {

/*!
 * \brief Transfers gridded time series from one rectilinear grid to another.
 *
 * Uses bilinear (or nearest neighbor) interpolation computed as a product of 1D interpolations
 * along y and x. Points outside the source grid get values from the closest source grid point.
 * Coordinates of both grids may be increasing or decreasing.
 */
class Regridder {
public:
  typedef std::shared_ptr<const Regridder> ConstPtr;

  Regridder(InterpolationType type,
            const Axis &source_y, const Axis &source_x,
            const Axis &target_y, const Axis &target_x);

  //! True if the source and target grids are the same.
  bool identity() const;

  //! True if this regridder maps `source_y` by `source_x` onto `target_y` by `target_x`.
  bool maps(const Axis &source_y, const Axis &source_x,
            const Axis &target_y, const Axis &target_x) const;

  //! Interpolate all records of `input` (which has to use the source grid).
  GriddedTimeSeries apply(const GriddedTimeSeries &input) const;
private:
  //! 1D interpolation indexes and weights along one axis.
  struct Weights {
    std::vector<int> left, right;
    std::vector<double> alpha;
  };

  static Weights weights(InterpolationType type,
                         const std::vector<double> &source,
                         const std::vector<double> &target);

  Axis m_source_y, m_source_x;
  Axis m_target_y, m_target_x;
  Weights m_y, m_x;
  bool m_identity;
};

/*!
 * \brief Regridders reused across correction units.
 *
 * Regridders are indexed by shapes of source and target grids; a cached regridder is rebuilt
 * if coordinates of a grid with the same shape differ.
 */
class RegridderCache {
public:
  RegridderCache(InterpolationType type);

  //! Regridder mapping the grid of `source` onto the grid of `target`.
  Regridder::ConstPtr get(const GriddedTimeSeries &source, const GriddedTimeSeries &target);

  //! Number of regridders built so far.
  unsigned int n_built() const;
private:
  InterpolationType m_type;
  std::map<std::vector<size_t>, Regridder::ConstPtr> m_regridders;
  unsigned int m_n_built;
};

} // end of namespace bcat

#endif /* BCAT_REGRIDDER_H */
