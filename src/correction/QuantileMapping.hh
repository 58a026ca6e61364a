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

#ifndef BCAT_QUANTILEMAPPING_H
#define BCAT_QUANTILEMAPPING_H

#include "bcat/correction/CorrectionMethod.hh"

namespace bcat {

/*!
 * \brief Quantile mapping.
 *
 * Each scenario value `x` is ranked using the empirical CDF of model data:
 *
 * p = 100 * ECDF_model(x),
 *
 * then corrected by adding the difference of percentiles of observations and model data:
 *
 * x + percentile(observation, p) - percentile(model, p).
 *
 * No distribution is assumed and no extrapolation is performed beyond the range of the
 * reference sample.
 */
class QuantileMapping : public CorrectionMethod {
public:
  QuantileMapping(std::shared_ptr<const Context> ctx, const VariableMetadata &variable);
  virtual ~QuantileMapping() = default;
protected:
  void correct_impl(const std::vector<double> &observation,
                    const std::vector<double> &model,
                    std::vector<std::vector<double> > &scenarios) const;
};

} // end of namespace bcat

#endif /* BCAT_QUANTILEMAPPING_H */
