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

#include "bcat/correction/BiasCorrector.hh"
#include "bcat/correction/TimeWindow.hh"
#include "bcat/util/Config.hh"
#include "bcat/util/Context.hh"
#include "bcat/util/Logger.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"
#include "bcat/util/io/File.hh"
#include "bcat/util/io/io_helpers.hh"
#include "bcat/bcat_config.hh"

namespace bcat {

TimeUnitType time_unit_type(const std::string &name) {
  if (name == "day") {
    return DAY_OF_YEAR;
  }
  if (name == "month") {
    return MONTH;
  }
  throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "invalid time unit: '%s'", name.c_str());
}

static const char* unit_name(TimeUnitType type) {
  return type == DAY_OF_YEAR ? "day" : "month";
}

BiasCorrector::BiasCorrector(std::shared_ptr<const Context> ctx,
                             Dataset::Ptr observation,
                             Dataset::Ptr model,
                             const std::vector<Dataset::Ptr> &scenarios)
  : m_ctx(ctx),
    m_observation(observation),
    m_model(model),
    m_scenarios(scenarios),
    m_regridders(interpolation_type(ctx->config()->get_string("bias_correction.interpolation"))) {

  auto config = ctx->config();

  if (m_scenarios.empty()) {
    throw RuntimeError(BCAT_ERROR_LOCATION, "no scenarios to correct");
  }

  // periods
  {
    auto start = config->get_string("bias_correction.reference_period.start");
    auto end   = config->get_string("bias_correction.reference_period.end");

    m_observation->set_period(start, end);
    m_model->set_period(start, end);
  }
  {
    auto start = config->get_string("bias_correction.correction_period.start");
    auto end   = config->get_string("bias_correction.correction_period.end");

    for (auto &s : m_scenarios) {
      s->set_period(start, end);
    }
  }

  // model and scenario data use names and units of observations
  const VariableMetadata &variable = m_observation->metadata();
  m_model->set_adjustments(variable);
  for (auto &s : m_scenarios) {
    s->set_adjustments(variable);
  }

  m_method = MethodFactory(ctx).create(variable);

  auto time_unit = config->get_string("bias_correction.time_unit");
  if (time_unit == "auto") {
    m_time_unit = m_method->name() == "quantile_mapping" ? DAY_OF_YEAR : MONTH;
  } else {
    m_time_unit = time_unit_type(time_unit);
  }

  m_window = static_cast<int>(config->get_number("bias_correction.window"));
  if (m_window < 0) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "bias_correction.window has to be non-negative (got %d)",
                                  m_window);
  }

  m_ctx->log()->message(2,
                        "* Bias correction of %s (%s) using %s, %s units\n"
                        "  observations: %s (%s calendar)\n"
                        "  model:        %s (%s calendar)\n",
                        variable.name.c_str(), variable.standard_name.c_str(),
                        m_method->name().c_str(), unit_name(m_time_unit),
                        m_observation->description().c_str(),
                        m_observation->calendar().name().c_str(),
                        m_model->description().c_str(),
                        m_model->calendar().name().c_str());
  for (size_t k = 0; k < m_scenarios.size(); ++k) {
    m_ctx->log()->message(2, "  scenario %d:   %s\n", (int)k,
                          m_scenarios[k]->description().c_str());
  }
}

TimeUnitType BiasCorrector::time_unit() const {
  return m_time_unit;
}

std::vector<int> BiasCorrector::units() const {
  const int N = m_time_unit == DAY_OF_YEAR ? m_model->calendar().days_in_year() : 12;

  auto list = m_ctx->config()->get_string("bias_correction.units");

  std::vector<int> result;
  if (string_strip(list).empty()) {
    for (int k = 1; k <= N; ++k) {
      result.push_back(k);
    }
    return result;
  }

  result = parse_integer_list(list);
  for (auto u : result) {
    if (u < 1 or u > N) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "invalid correction unit: %s %d (has to be in [1, %d])",
                                    unit_name(m_time_unit), u, N);
    }
  }
  return result;
}

std::vector<std::string> BiasCorrector::run() {
  auto all_units = units();

  const int
    rank = m_ctx->rank(),
    size = m_ctx->size();

  std::vector<std::string> result;

  ParallelSection loop(m_ctx->com());
  try {
    for (size_t k = 0; k < all_units.size(); ++k) {
      if (static_cast<int>(k % size) != rank) {
        continue;
      }

      auto files = correct(all_units[k]);
      result.insert(result.end(), files.begin(), files.end());
    }
  } catch (...) {
    loop.failed();
  }
  loop.check();

  return result;
}

std::vector<std::string> BiasCorrector::correct(int unit) {
  auto log = m_ctx->log();

  std::vector<std::string> result;

  try {
    log->message(2, "* Correcting %s %d...\n", unit_name(m_time_unit), unit);

    DatePredicate obs_window, mod_window, sce_window;

    if (m_time_unit == DAY_OF_YEAR) {
      const Calendar
        &obs_calendar = m_observation->calendar(),
        &mod_calendar = m_model->calendar();

      TimeWindow mod = window_for_day(unit, m_window, mod_calendar);

      // units are days of the year in the model calendar
      int obs_day = convert_day_of_year(unit, mod_calendar, obs_calendar);
      TimeWindow obs = window_for_day(obs_day, m_window, obs_calendar);

      obs_window = obs.window;
      mod_window = mod.window;
      sce_window = mod.exact;

      log->message(3,
                   "  observations: %s\n"
                   "  model:        %s\n",
                   obs.description.c_str(), mod.description.c_str());
    } else {
      obs_window = window_for_month(unit);
      mod_window = obs_window;
      sce_window = obs_window;
    }

    GriddedTimeSeries observation = m_observation->extract(obs_window);
    GriddedTimeSeries model       = m_model->extract(mod_window);

    if (observation.n_time() == 0 or model.n_time() == 0) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "no observations (%d records) or model data (%d records)"
                                    " in the reference period",
                                    (int)observation.n_time(), (int)model.n_time());
    }

    observation.set_mask(observation.mask_from_first_record());

    const unsigned int n_regridders = m_regridders.n_built();

    model = m_regridders.get(model, observation)->apply(model);

    std::vector<GriddedTimeSeries> scenarios;
    std::vector<int> scenario_index;
    for (size_t k = 0; k < m_scenarios.size(); ++k) {
      GriddedTimeSeries scenario = m_scenarios[k]->extract(sce_window);

      if (scenario.n_time() == 0) {
        log->message(2, "  scenario %d has no records in the correction period: skipped\n",
                     (int)k);
        continue;
      }

      scenario = m_regridders.get(scenario, observation)->apply(scenario);
      scenario.set_mask(observation.mask());

      scenarios.push_back(scenario);
      scenario_index.push_back(static_cast<int>(k));
    }

    log->message(3,
                 "  samples: %d observations, %d model records\n"
                 "  regridders built: %d\n",
                 (int)observation.n_time(), (int)model.n_time(),
                 (int)(m_regridders.n_built() - n_regridders));

    if (m_ctx->config()->get_flag("bias_correction.save_regridded")) {
      for (size_t k = 0; k < scenarios.size(); ++k) {
        result.push_back(save("regridded", scenario_index[k], unit, scenarios[k]));
      }
    }

    CorrectionSummary summary = m_method->correct(observation, model, scenarios);

    log->message(3, "  corrected %d cells (%d masked, %d with missing values)\n",
                 (int)summary.corrected, (int)summary.masked, (int)summary.incomplete);

    for (size_t k = 0; k < scenarios.size(); ++k) {
      if (summary.skipped[k] > 0) {
        log->message(2, "  scenario %d: %d cells with missing values are not corrected\n",
                     scenario_index[k], (int)summary.skipped[k]);
      }
    }

    for (size_t k = 0; k < scenarios.size(); ++k) {
      result.push_back(save(m_method->name(), scenario_index[k], unit, scenarios[k]));
    }
  } catch (RuntimeError &e) {
    e.add_context("correcting %s %d", unit_name(m_time_unit), unit);
    throw;
  }

  return result;
}

std::string BiasCorrector::output_filename(const std::string &method, int scenario,
                                           int start_year, int end_year, int unit) const {
  const int padding = m_time_unit == DAY_OF_YEAR ? 3 : 2;

  return printf("%s_%s_scenario-%d_%d-%d_%s-%0*d.nc",
                method.c_str(), m_observation->metadata().name.c_str(),
                scenario, start_year, end_year, unit_name(m_time_unit), padding, unit);
}

std::string BiasCorrector::save(const std::string &method, int scenario, int unit,
                                const GriddedTimeSeries &data) const {
  auto config = m_ctx->config();

  const auto &dates = data.dates();

  std::string directory = config->get_string("output.directory");
  if (directory.empty()) {
    directory = ".";
  }

  std::string filename = (directory + "/" +
                          output_filename(method, scenario,
                                          dates.front().year, dates.back().year, unit));

  File file(filename, io::BCAT_READWRITE_CLOBBER,
            static_cast<int>(config->get_number("output.compression_level")));

  io::write_gridded_time_series(file, data);
  file.append_history(printf("bcat %s: %s, scenario %d, %s %d\n",
                             revision, method.c_str(), scenario,
                             unit_name(m_time_unit), unit));
  file.close();

  m_ctx->log()->message(2, "  wrote %s\n", filename.c_str());

  return filename;
}

const CorrectionMethod& BiasCorrector::method() const {
  return *m_method;
}

unsigned int BiasCorrector::n_regridders() const {
  return m_regridders.n_built();
}

static std::vector<std::string> file_list(const Config &config, const std::string &name) {
  auto result = split(config.get_string(name), ',');
  if (result.empty()) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "%s cannot be empty", name.c_str());
  }
  return result;
}

BiasCorrector::Ptr bias_corrector_from_config(std::shared_ptr<const Context> ctx) {
  auto config = ctx->config();

  auto variable = config->get_string("input.variable");
  if (variable.empty()) {
    throw RuntimeError(BCAT_ERROR_LOCATION, "input.variable cannot be empty");
  }

  Dataset::Ptr
    observation(new Dataset(ctx, file_list(*config, "input.observation.files"), variable)),
    model(new Dataset(ctx, file_list(*config, "input.model.files"), variable));

  std::vector<Dataset::Ptr> scenarios;
  for (const auto &files : split(config->get_string("input.scenario.files"), ';')) {
    scenarios.push_back(Dataset::Ptr(new Dataset(ctx, split(files, ','), variable)));
  }

  return BiasCorrector::Ptr(new BiasCorrector(ctx, observation, model, scenarios));
}

} // end of namespace bcat
