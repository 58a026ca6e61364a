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

#include "bcat/correction/QuantileMapping.hh"
#include "bcat/correction/statistics.hh"

namespace bcat {

QuantileMapping::QuantileMapping(std::shared_ptr<const Context> ctx,
                                 const VariableMetadata &variable)
  : CorrectionMethod(ctx, variable, "quantile_mapping") {
  // empty
}

void QuantileMapping::correct_impl(const std::vector<double> &observation,
                                   const std::vector<double> &model,
                                   std::vector<std::vector<double> > &scenarios) const {
  auto obs = stats::sorted(observation);
  auto mod = stats::sorted(model);

  for (auto &scenario : scenarios) {
    auto p = stats::ecdf(mod, scenario);

    for (size_t k = 0; k < scenario.size(); ++k) {
      double P = 100.0 * p[k];
      scenario[k] += stats::percentile(obs, P) - stats::percentile(mod, P);
    }
  }
}

} // end of namespace bcat
