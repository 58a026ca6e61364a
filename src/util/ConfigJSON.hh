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

#ifndef BCAT_CONFIGJSON_H
#define BCAT_CONFIGJSON_H

#include <jansson.h>

#include "bcat/util/Config.hh"

namespace bcat {

//! Config stored in a tree of JSON objects.
/*!
 * A parameter "a.b.c" is the key "c" of the object "b" in the object "a". Integers are read as
 * numbers.
 */
class ConfigJSON : public Config {
public:
  ConfigJSON(units::System::Ptr unit_system);
  virtual ~ConfigJSON();

  //! Replace all parameters with the contents of a JSON string.
  void load_string(const std::string &text);

private:
  virtual void read_impl(const std::string &filename);

  virtual bool is_set_impl(const std::string &name) const;

  virtual Doubles all_doubles_impl() const;
  virtual double get_number_impl(const std::string &name) const;
  virtual void set_number_impl(const std::string &name, double value);

  virtual Strings all_strings_impl() const;
  virtual std::string get_string_impl(const std::string &name) const;
  virtual void set_string_impl(const std::string &name, const std::string &value);

  virtual Flags all_flags_impl() const;
  virtual bool get_flag_impl(const std::string& name) const;
  virtual void set_flag_impl(const std::string& name, bool value);

  void replace(json_t *root, const json_error_t &error, const std::string &source);
  json_t* leaf(const std::string &name) const;
  void store(const std::string &name, json_t *value);

  json_t *m_root;
};

} // end of namespace bcat

#endif /* BCAT_CONFIGJSON_H */
