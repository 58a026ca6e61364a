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

#ifndef BCAT_CORRECTIONMETHOD_H
#define BCAT_CORRECTIONMETHOD_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "bcat/util/GriddedTimeSeries.hh"

namespace bcat {

class Context;

//! Numbers of grid cells processed by CorrectionMethod::correct().
struct CorrectionSummary {
  CorrectionSummary();

  //! cells passed to the method
  size_t corrected;
  //! cells masked in observations
  size_t masked;
  //! cells with missing values in observations or model data (left unchanged)
  size_t incomplete;
  //! for each scenario, cells with missing values in that scenario (left unchanged)
  std::vector<size_t> skipped;
};

/*!
 * \brief A bias correction method.
 *
 * A method corrects scenario data one grid cell at a time: it is given the time series of the
 * cell in observations and model data (reference period) and modifies time series of the same
 * cell in all scenarios.
 */
class CorrectionMethod {
public:
  typedef std::shared_ptr<CorrectionMethod> Ptr;

  CorrectionMethod(std::shared_ptr<const Context> ctx, const VariableMetadata &variable,
                   const std::string &name);
  virtual ~CorrectionMethod() = default;

  const std::string& name() const;

  //! Correct time series of one grid cell in all scenarios.
  void correct(const std::vector<double> &observation,
               const std::vector<double> &model,
               std::vector<std::vector<double> > &scenarios) const;

  /*!
   * Correct all scenarios. Observations, model data and scenarios have to be on the same grid.
   * Cells masked in observations are not modified. A scenario time series containing missing
   * values is not modified; other scenarios at the same cell are corrected.
   */
  CorrectionSummary correct(const GriddedTimeSeries &observation,
                            const GriddedTimeSeries &model,
                            std::vector<GriddedTimeSeries> &scenarios) const;
protected:
  virtual void correct_impl(const std::vector<double> &observation,
                            const std::vector<double> &model,
                            std::vector<std::vector<double> > &scenarios) const = 0;

  std::shared_ptr<const Context> m_ctx;
  VariableMetadata m_variable;
  std::string m_name;
};

//! Creates correction methods by name.
class MethodFactory {
public:
  MethodFactory(std::shared_ptr<const Context> ctx);

  //! Create the method selected using `bias_correction.method`.
  CorrectionMethod::Ptr create(const VariableMetadata &variable) const;

  CorrectionMethod::Ptr create(const std::string &method, const VariableMetadata &variable) const;
private:
  template <class M>
  void add_method(const std::string &name) {
    m_methods[name].reset(new SpecificMethodCreator<M>);
  }

  std::string key_list() const;

  // virtual base class that allows storing different method creators
  // in the same dictionary
  class MethodCreator {
  public:
    virtual CorrectionMethod::Ptr create(std::shared_ptr<const Context> ctx,
                                         const VariableMetadata &variable) = 0;
    virtual ~MethodCreator() = default;
  };

  // Creator for a specific method class M.
  template <class M>
  class SpecificMethodCreator : public MethodCreator {
  public:
    CorrectionMethod::Ptr create(std::shared_ptr<const Context> ctx,
                                 const VariableMetadata &variable) {
      return CorrectionMethod::Ptr(new M(ctx, variable));
    }
  };

  std::shared_ptr<const Context> m_ctx;
  std::map<std::string, std::shared_ptr<MethodCreator> > m_methods;
};

} // end of namespace bcat

#endif /* BCAT_CORRECTIONMETHOD_H */
