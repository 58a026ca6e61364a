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

#ifndef BCAT_CONFIG_H
#define BCAT_CONFIG_H

#include <memory>
#include <set>
#include <map>
#include <string>

#include "bcat/util/Units.hh"

namespace bcat {

class Logger;

//! Priority of a value passed to `Config::set_...()`.
/** - `CONFIG_DEFAULT`: ignored if the user already set this parameter
 *  - `CONFIG_FORCE`: replaces the current value
 *  - `CONFIG_USER`: replaces the current value and records the parameter as set by the user
 */
enum ConfigSettingFlag {CONFIG_DEFAULT = 0, CONFIG_FORCE = 1, CONFIG_USER = 2};

//! Run-time parameters of BCAT.
/*!
 * Parameters are addressed by dotted names ("bias_correction.window"). Each parameter "X" can
 * be described by the strings "X_doc", "X_type", "X_units" and "X_choices". Types are "number",
 * "integer", "string", "keyword" (one of the comma-separated "X_choices") and "flag".
 *
 * Storage is left to derived classes (see ConfigJSON).
 */
class Config {
public:
  typedef std::shared_ptr<Config> Ptr;
  typedef std::shared_ptr<const Config> ConstPtr;

  Config(units::System::Ptr unit_system);
  virtual ~Config();

  //! Whether a `get_...()` call counts as a use of a parameter.
  enum UseFlag {REMEMBER_THIS_USE = 0, FORGET_THIS_USE = 1};

  //! Copy all parameters of `other`, marking them as set by the user.
  /*! Throws RuntimeError if `other` contains a parameter this database does not know about. */
  void import_from(const Config &other);

  const std::set<std::string>& parameters_set_by_user() const;
  const std::set<std::string>& parameters_used() const;

  void read(const std::string &filename);
  std::string filename() const;

  bool is_set(const std::string &name) const;

  typedef std::map<std::string, double> Doubles;
  typedef std::map<std::string, std::string> Strings;
  typedef std::map<std::string, bool> Flags;

  Doubles all_doubles() const;
  Strings all_strings() const;
  Flags all_flags() const;

  double get_number(const std::string &name, UseFlag flag = REMEMBER_THIS_USE) const;
  //! Get a number converted to `units`.
  double get_number(const std::string &name, const std::string &units,
                    UseFlag flag = REMEMBER_THIS_USE) const;
  std::string get_string(const std::string &name, UseFlag flag = REMEMBER_THIS_USE) const;
  bool get_flag(const std::string& name, UseFlag flag = REMEMBER_THIS_USE) const;

  void set_number(const std::string &name, double value, ConfigSettingFlag flag = CONFIG_FORCE);
  void set_string(const std::string &name, const std::string &value,
                  ConfigSettingFlag flag = CONFIG_FORCE);
  void set_flag(const std::string& name, bool value, ConfigSettingFlag flag = CONFIG_FORCE);

  std::string doc(const std::string &parameter) const;
  std::string units(const std::string &parameter) const;
  std::string type(const std::string &parameter) const;
  std::string choices(const std::string &parameter) const;

  //! Names of all parameters, including "_doc", "_type" and similar.
  std::set<std::string> keys() const;

protected:
  virtual void read_impl(const std::string &filename) = 0;

  virtual bool is_set_impl(const std::string &name) const = 0;

  virtual Doubles all_doubles_impl() const = 0;
  virtual double get_number_impl(const std::string &name) const = 0;
  virtual void set_number_impl(const std::string &name, double value) = 0;

  virtual Strings all_strings_impl() const = 0;
  virtual std::string get_string_impl(const std::string &name) const = 0;
  virtual void set_string_impl(const std::string &name, const std::string &value) = 0;

  virtual Flags all_flags_impl() const = 0;
  virtual bool get_flag_impl(const std::string& name) const = 0;
  virtual void set_flag_impl(const std::string& name, bool value) = 0;
private:
  struct Impl;
  Impl *m_impl;

  Config(const Config&);
  Config& operator=(const Config&);
};

//! Read defaults from the installed `bcat_config.json`, then apply overrides (if any).
Config::Ptr config_from_file(units::System::Ptr unit_system,
                             const std::string &override_filename);

//! Log all parameters (documentation strings excluded).
void print_config(const Logger &log, int verbosity_threshold, const Config &config);

//! Warn about parameters set by the user that were never read.
void print_unused_parameters(const Logger &log, int verbosity_threshold,
                             const Config &config);

} // end of namespace bcat

#endif /* BCAT_CONFIG_H */
