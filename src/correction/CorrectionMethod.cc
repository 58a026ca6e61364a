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

#include <cmath>

#include "bcat/correction/CorrectionMethod.hh"
#include "bcat/correction/QuantileMapping.hh"
#include "bcat/correction/ScaledDistributionMapping.hh"
#include "bcat/util/Config.hh"
#include "bcat/util/Context.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"

namespace bcat {

CorrectionSummary::CorrectionSummary()
  : corrected(0), masked(0), incomplete(0) {
  // empty
}

CorrectionMethod::CorrectionMethod(std::shared_ptr<const Context> ctx,
                                   const VariableMetadata &variable,
                                   const std::string &name)
  : m_ctx(ctx), m_variable(variable), m_name(name) {
  // empty
}

const std::string& CorrectionMethod::name() const {
  return m_name;
}

void CorrectionMethod::correct(const std::vector<double> &observation,
                               const std::vector<double> &model,
                               std::vector<std::vector<double> > &scenarios) const {
  if (observation.empty() or model.empty()) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "%s: no observations (%d) or model data (%d) to fit",
                                  m_name.c_str(), (int)observation.size(), (int)model.size());
  }

  this->correct_impl(observation, model, scenarios);
}

static bool all_finite(const std::vector<double> &x) {
  for (auto v : x) {
    if (not std::isfinite(v)) {
      return false;
    }
  }
  return true;
}

CorrectionSummary CorrectionMethod::correct(const GriddedTimeSeries &observation,
                                            const GriddedTimeSeries &model,
                                            std::vector<GriddedTimeSeries> &scenarios) const {
  if (not observation.same_grid(model)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "%s: observations and model data use different grids",
                                  m_name.c_str());
  }

  for (const auto &s : scenarios) {
    if (not observation.same_grid(s)) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "%s: observations and scenario data use different grids",
                                    m_name.c_str());
    }
  }

  CorrectionSummary result;
  result.skipped.resize(scenarios.size(), 0);

  const CellMask &mask = observation.mask();

  std::vector<std::vector<double> > cells;
  std::vector<size_t> index;

  for (size_t j = 0; j < observation.ny(); ++j) {
    for (size_t i = 0; i < observation.nx(); ++i) {
      if (mask.masked(j, i)) {
        result.masked += 1;
        continue;
      }

      try {
        auto obs = observation.cell(j, i);
        auto mod = model.cell(j, i);

        if (not (all_finite(obs) and all_finite(mod))) {
          result.incomplete += 1;
          continue;
        }

        // scenarios with missing values at this cell are left alone
        cells.clear();
        index.clear();
        for (size_t k = 0; k < scenarios.size(); ++k) {
          auto cell = scenarios[k].cell(j, i);
          if (all_finite(cell)) {
            cells.push_back(cell);
            index.push_back(k);
          } else {
            result.skipped[k] += 1;
          }
        }

        if (cells.empty()) {
          continue;
        }

        correct(obs, mod, cells);

        for (size_t k = 0; k < index.size(); ++k) {
          scenarios[index[k]].set_cell(j, i, cells[k]);
        }

        result.corrected += 1;
      } catch (RuntimeError &e) {
        e.add_context("correcting %s at grid cell (%d, %d) using %s",
                      m_variable.name.c_str(), (int)j, (int)i, m_name.c_str());
        throw;
      }
    }
  }

  return result;
}

MethodFactory::MethodFactory(std::shared_ptr<const Context> ctx)
  : m_ctx(ctx) {
  add_method<QuantileMapping>("quantile_mapping");
  add_method<ScaledDistributionMapping>("scaled_distribution_mapping");
}

std::string MethodFactory::key_list() const {
  std::vector<std::string> keys;

  for (const auto &m : m_methods) {
    keys.push_back(m.first);
  }

  return "[" + join(keys, ", ") + "]";
}

CorrectionMethod::Ptr MethodFactory::create(const VariableMetadata &variable) const {
  return create(m_ctx->config()->get_string("bias_correction.method"), variable);
}

CorrectionMethod::Ptr MethodFactory::create(const std::string &method,
                                            const VariableMetadata &variable) const {
  auto m = m_methods.find(method);
  if (m == m_methods.end()) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "cannot allocate correction method \"%s\".\n"
                                  "Available methods:    %s\n",
                                  method.c_str(), key_list().c_str());
  }

  return m->second->create(m_ctx, variable);
}

} // end of namespace bcat
