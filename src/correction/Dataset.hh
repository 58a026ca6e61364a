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

#ifndef BCAT_DATASET_H
#define BCAT_DATASET_H

#include <memory>
#include <string>
#include <vector>

#include "bcat/correction/TimeWindow.hh"
#include "bcat/util/GriddedTimeSeries.hh"

namespace bcat {

class Context;

/*!
 * \brief A variable read from one or more NetCDF files (concatenated along time).
 *
 * A dataset can be restricted to a period. Adjustments (variable name, standard and long name,
 * units) are applied to all extracted data: this is how model and scenario data take over the
 * metadata of observations.
 */
class Dataset {
public:
  typedef std::shared_ptr<Dataset> Ptr;

  //! Read `variable` from `files` (in this order).
  Dataset(std::shared_ptr<const Context> ctx,
          const std::vector<std::string> &files,
          const std::string &variable);

  //! Use data already in memory.
  Dataset(std::shared_ptr<const Context> ctx, const GriddedTimeSeries &data);

  //! Metadata with adjustments applied.
  const VariableMetadata& metadata() const;

  const Calendar& calendar() const;

  //! Restrict to dates in `[start, end)` (YYYY-MM-DD; an empty string means "no limit").
  void set_period(const std::string &start, const std::string &end);

  //! Use `metadata` instead of the metadata in input files (converting units).
  void set_adjustments(const VariableMetadata &metadata);

  //! Records in the current period satisfying `predicate`, with adjustments applied.
  GriddedTimeSeries extract(const DatePredicate &predicate) const;

  //! Number of records in the current period.
  size_t n_records() const;

  std::string description() const;
private:
  std::shared_ptr<const Context> m_ctx;
  std::string m_description;
  GriddedTimeSeries m_data;
  //! indexes of records in the current period
  std::vector<size_t> m_period;
  //! adjusted metadata
  VariableMetadata m_metadata;
};

} // end of namespace bcat

#endif /* BCAT_DATASET_H */
