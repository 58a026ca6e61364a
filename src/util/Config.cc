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

#include <algorithm>
#include <cmath>

#include "bcat/util/Config.hh"
#include "bcat/util/ConfigJSON.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"
#include "bcat/util/Logger.hh"
#include "bcat/bcat_config.hh"

namespace bcat {

struct Config::Impl {
  Impl(units::System::Ptr sys)
    : unit_system(sys) {
    // empty
  }

  //! Record a `set_...()` call. Returns false if the new value should be discarded.
  bool accept(const std::string &name, ConfigSettingFlag flag) {
    if (flag == CONFIG_USER) {
      set_by_user.insert(name);
      return true;
    }
    return not (flag == CONFIG_DEFAULT and member(name, set_by_user));
  }

  units::System::Ptr unit_system;
  std::string filename;
  std::set<std::string> set_by_user;
  std::set<std::string> used;
};

Config::Config(units::System::Ptr system)
  : m_impl(new Impl(system)) {
  // empty
}

Config::~Config() {
  delete m_impl;
}

void Config::read(const std::string &filename) {
  read_impl(filename);
  m_impl->filename = filename;
}

std::string Config::filename() const {
  return m_impl->filename;
}

//! True for "X_doc", "X_type" and other strings describing a parameter "X".
static bool is_metadata(const std::string &name) {
  return (ends_with(name, "_doc") or ends_with(name, "_type") or
          ends_with(name, "_units") or ends_with(name, "_choices"));
}

void Config::import_from(const Config &other) {
  const std::set<std::string> known = keys();

  auto check = [&known, &other](const std::string &name) {
    if (not member(name, known)) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "%s: unrecognized parameter '%s'",
                                    other.filename().c_str(), name.c_str());
    }
  };

  for (const auto &p : other.all_doubles()) {
    check(p.first);
    set_number(p.first, p.second, CONFIG_USER);
  }

  for (const auto &p : other.all_strings()) {
    check(p.first);
    set_string(p.first, p.second, CONFIG_USER);
  }

  for (const auto &p : other.all_flags()) {
    check(p.first);
    set_flag(p.first, p.second, CONFIG_USER);
  }
}

const std::set<std::string>& Config::parameters_set_by_user() const {
  return m_impl->set_by_user;
}

const std::set<std::string>& Config::parameters_used() const {
  return m_impl->used;
}

bool Config::is_set(const std::string &name) const {
  return is_set_impl(name);
}

Config::Doubles Config::all_doubles() const {
  return all_doubles_impl();
}

Config::Strings Config::all_strings() const {
  return all_strings_impl();
}

Config::Flags Config::all_flags() const {
  return all_flags_impl();
}

double Config::get_number(const std::string &name, UseFlag flag) const {
  double result = get_number_impl(name);

  if (flag == REMEMBER_THIS_USE) {
    m_impl->used.insert(name);

    if (type(name) == "integer" and std::floor(result) != result) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "%s has to be an integer (got %f)",
                                    name.c_str(), result);
    }
  }

  return result;
}

double Config::get_number(const std::string &name, const std::string &units,
                          UseFlag flag) const {
  const std::string internal_units = this->units(name);

  try {
    return units::convert(m_impl->unit_system, get_number(name, flag),
                          internal_units, units);
  } catch (RuntimeError &e) {
    e.add_context("getting %s in '%s' (stored in '%s')",
                  name.c_str(), units.c_str(), internal_units.c_str());
    throw;
  }
}

std::string Config::get_string(const std::string &name, UseFlag flag) const {
  std::string result = get_string_impl(name);

  if (flag == REMEMBER_THIS_USE) {
    m_impl->used.insert(name);

    if (type(name) == "keyword" and
        not member(result, set_split(choices(name), ','))) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "%s = '%s' is not one of %s",
                                    name.c_str(), result.c_str(), choices(name).c_str());
    }
  }

  return result;
}

bool Config::get_flag(const std::string& name, UseFlag flag) const {
  bool result = get_flag_impl(name);

  if (flag == REMEMBER_THIS_USE) {
    m_impl->used.insert(name);
  }

  return result;
}

void Config::set_number(const std::string &name, double value, ConfigSettingFlag flag) {
  if (m_impl->accept(name, flag)) {
    set_number_impl(name, value);
  }
}

void Config::set_string(const std::string &name, const std::string &value,
                        ConfigSettingFlag flag) {
  if (m_impl->accept(name, flag)) {
    set_string_impl(name, value);
  }
}

void Config::set_flag(const std::string& name, bool value, ConfigSettingFlag flag) {
  if (m_impl->accept(name, flag)) {
    set_flag_impl(name, value);
  }
}

//! Returns the string `name` or an empty string if it is not set.
static std::string string_or_empty(const Config &config, const std::string &name) {
  return config.is_set(name) ? config.get_string(name, Config::FORGET_THIS_USE) : "";
}

std::string Config::doc(const std::string &parameter) const {
  return string_or_empty(*this, parameter + "_doc");
}

std::string Config::units(const std::string &parameter) const {
  return string_or_empty(*this, parameter + "_units");
}

std::string Config::type(const std::string &parameter) const {
  return string_or_empty(*this, parameter + "_type");
}

std::string Config::choices(const std::string &parameter) const {
  return string_or_empty(*this, parameter + "_choices");
}

std::set<std::string> Config::keys() const {
  std::set<std::string> result;

  for (const auto &p : all_doubles()) {
    result.insert(p.first);
  }
  for (const auto &p : all_strings()) {
    result.insert(p.first);
  }
  for (const auto &p : all_flags()) {
    result.insert(p.first);
  }

  return result;
}

Config::Ptr config_from_file(units::System::Ptr unit_system,
                             const std::string &override_filename) {
  std::shared_ptr<ConfigJSON> result(new ConfigJSON(unit_system));

  result->read(bcat::config_file);

  if (not override_filename.empty()) {
    ConfigJSON overrides(unit_system);
    overrides.read(override_filename);
    result->import_from(overrides);
  }

  return result;
}

//! Print one group of parameters, aligning values.
template<typename T, typename F>
static void print_group(const Logger &log, int threshold, const char *title,
                        const std::map<std::string, T> &parameters, F format) {
  size_t width = 0;
  for (const auto &p : parameters) {
    if (not is_metadata(p.first)) {
      width = std::max(width, p.first.size());
    }
  }

  log.message(threshold, "### %s:\n", title);
  for (const auto &p : parameters) {
    if (is_metadata(p.first)) {
      continue;
    }
    std::string padding(width - p.first.size(), ' ');
    log.message(threshold, "  %s%s = %s\n",
                p.first.c_str(), padding.c_str(), format(p.first, p.second).c_str());
  }
}

void print_config(const Logger &log, int verbosity_threshold, const Config &config) {

  print_group(log, verbosity_threshold, "Strings", config.all_strings(),
              [&config](const std::string &name, const std::string &value) -> std::string {
                if (config.type(name) == "keyword") {
                  return printf("\"%s\" (one of %s)", value.c_str(),
                                config.choices(name).c_str());
                }
                return printf("\"%s\"", value.c_str());
              });

  print_group(log, verbosity_threshold, "Numbers", config.all_doubles(),
              [&config](const std::string &name, double value) -> std::string {
                return printf("%g (%s)", value, config.units(name).c_str());
              });

  print_group(log, verbosity_threshold, "Flags", config.all_flags(),
              [](const std::string &, bool value) -> std::string {
                return std::string(value ? "true" : "false");
              });
}

void print_unused_parameters(const Logger &log, int verbosity_threshold,
                             const Config &config) {
  for (const auto &p : config.parameters_set_by_user()) {
    if (is_metadata(p) or member(p, config.parameters_used())) {
      continue;
    }
    log.message(verbosity_threshold,
                "BCAT WARNING: parameter '%s' was set but was not used\n", p.c_str());
  }
}

} // end of namespace bcat
