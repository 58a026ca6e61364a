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

#ifndef BCAT_SCALEDDISTRIBUTIONMAPPING_H
#define BCAT_SCALEDDISTRIBUTIONMAPPING_H

#include "bcat/correction/CorrectionMethod.hh"

namespace bcat {

/*!
 * \brief Scaled distribution mapping for variables without a lower bound (e.g. air temperature).
 *
 * Linear trends are removed from all series, the remaining anomalies are assumed to be normally
 * distributed. The trend of each scenario is added back after the correction.
 *
 * Parameters: `bias_correction.sdm.absolute.cdf_threshold`.
 */
class AbsoluteSDM : public CorrectionMethod {
public:
  AbsoluteSDM(std::shared_ptr<const Context> ctx, const VariableMetadata &variable);
  virtual ~AbsoluteSDM() = default;
protected:
  void correct_impl(const std::vector<double> &observation,
                    const std::vector<double> &model,
                    std::vector<std::vector<double> > &scenarios) const;

  double m_cdf_threshold;
};

/*!
 * \brief Scaled distribution mapping for variables bounded below by zero (e.g. precipitation).
 *
 * Values greater than or equal to the lower limit ("wet days") are assumed to follow a gamma
 * distribution. The number of wet days in a corrected scenario is adjusted using the ratio of wet
 * day frequencies in observations and model data, so the corrected series usually has a
 * different number of non-zero values.
 *
 * Cells (and scenarios) with fewer than `min_samplesize` wet days are not modified.
 *
 * Parameters: `bias_correction.sdm.relative.*`.
 */
class RelativeSDM : public CorrectionMethod {
public:
  RelativeSDM(std::shared_ptr<const Context> ctx, const VariableMetadata &variable);
  virtual ~RelativeSDM() = default;
protected:
  void correct_impl(const std::vector<double> &observation,
                    const std::vector<double> &model,
                    std::vector<std::vector<double> > &scenarios) const;

  double m_cdf_threshold;
  double m_lower_limit;
  size_t m_min_samplesize;
};

/*!
 * \brief Scaled distribution mapping: selects the absolute or the relative variant using the
 * standard name of the corrected variable.
 *
 * - air_temperature: AbsoluteSDM
 * - precipitation_amount, surface_downwelling_shortwave_flux_in_air: RelativeSDM
 *
 * Other variables are left unchanged (an error message is printed) unless
 * `bias_correction.sdm.unsupported_quantity_is_error` is set.
 */
class ScaledDistributionMapping : public CorrectionMethod {
public:
  ScaledDistributionMapping(std::shared_ptr<const Context> ctx, const VariableMetadata &variable);
  virtual ~ScaledDistributionMapping() = default;

  //! The variant used to correct this variable (NULL if there is none).
  CorrectionMethod::Ptr implementation() const;
protected:
  void correct_impl(const std::vector<double> &observation,
                    const std::vector<double> &model,
                    std::vector<std::vector<double> > &scenarios) const;

  CorrectionMethod::Ptr m_implementation;
};

} // end of namespace bcat

#endif /* BCAT_SCALEDDISTRIBUTIONMAPPING_H */
