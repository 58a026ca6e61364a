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

#ifndef BCAT_BIASCORRECTOR_H
#define BCAT_BIASCORRECTOR_H

#include <memory>
#include <string>
#include <vector>

#include "bcat/correction/CorrectionMethod.hh"
#include "bcat/correction/Dataset.hh"
#include "bcat/correction/Regridder.hh"

namespace bcat {

class Context;

//! Temporal granularity of independent correction passes.
enum TimeUnitType {DAY_OF_YEAR, MONTH};

TimeUnitType time_unit_type(const std::string &name);

/*!
 * \brief Runs a bias correction.
 *
 * For each correction unit (a day of the year or a month) a BiasCorrector
 *
 * 1. selects observation and model records in the reference period, using a window of days
 *    around the unit (day units) or the whole month,
 * 2. selects scenario records for the unit itself,
 * 3. interpolates model and scenario data onto the observation grid,
 * 4. propagates the missing data mask of observations to scenarios,
 * 5. corrects scenarios and writes one file per scenario.
 *
 * Units are distributed among MPI ranks; each rank writes its own files.
 */
class BiasCorrector {
public:
  typedef std::shared_ptr<BiasCorrector> Ptr;

  BiasCorrector(std::shared_ptr<const Context> ctx,
                Dataset::Ptr observation,
                Dataset::Ptr model,
                const std::vector<Dataset::Ptr> &scenarios);

  TimeUnitType time_unit() const;

  //! Correction units processed by run().
  std::vector<int> units() const;

  //! Process all units, returning names of files written by this rank.
  std::vector<std::string> run();

  //! Process one unit, returning names of files written.
  std::vector<std::string> correct(int unit);

  //! Name of the output file (without the directory).
  std::string output_filename(const std::string &method, int scenario,
                              int start_year, int end_year, int unit) const;

  const CorrectionMethod& method() const;

  //! Number of regridders built so far.
  unsigned int n_regridders() const;
private:
  std::string save(const std::string &method, int scenario, int unit,
                   const GriddedTimeSeries &data) const;

  std::shared_ptr<const Context> m_ctx;
  Dataset::Ptr m_observation;
  Dataset::Ptr m_model;
  std::vector<Dataset::Ptr> m_scenarios;
  CorrectionMethod::Ptr m_method;
  TimeUnitType m_time_unit;
  int m_window;
  RegridderCache m_regridders;
};

//! Create a BiasCorrector using input files and periods from the configuration.
BiasCorrector::Ptr bias_corrector_from_config(std::shared_ptr<const Context> ctx);

} // end of namespace bcat

#endif /* BCAT_BIASCORRECTOR_H */
