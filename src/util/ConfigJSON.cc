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

#include <vector>

#include "bcat/util/ConfigJSON.hh"
#include "bcat/util/error_handling.hh"
#include "bcat/util/bcat_utilities.hh"

namespace bcat {

//! Follow `path` starting at `root`. Returns NULL if any element is missing.
static json_t* lookup(json_t *root, const std::vector<std::string> &path) {
  json_t *node = root;
  for (const auto &key : path) {
    if (node == NULL or not json_is_object(node)) {
      return NULL;
    }
    node = json_object_get(node, key.c_str());
  }
  return node;
}

//! Call `visit(name, node)` for every non-object node in the tree rooted at `object`.
template<typename F>
static void for_each_leaf(json_t *object, const std::string &prefix, F visit) {
  const char *key = NULL;
  json_t *node = NULL;

  json_object_foreach(object, key, node) {
    std::string name = prefix.empty() ? key : prefix + "." + key;
    if (json_is_object(node)) {
      for_each_leaf(node, name, visit);
    } else {
      visit(name, node);
    }
  }
}

ConfigJSON::ConfigJSON(units::System::Ptr unit_system)
  : Config(unit_system), m_root(json_object()) {
  // empty
}

ConfigJSON::~ConfigJSON() {
  json_decref(m_root);
}

//! Take ownership of `root` (the result of a jansson "load" call) or report an error.
void ConfigJSON::replace(json_t *root, const json_error_t &error, const std::string &source) {
  if (root == NULL) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "failed to parse %s (line %d, column %d): %s",
                                  source.c_str(), error.line, error.column, error.text);
  }

  if (not json_is_object(root)) {
    json_decref(root);
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "%s does not contain a JSON object", source.c_str());
  }

  json_decref(m_root);
  m_root = root;
}

void ConfigJSON::read_impl(const std::string &filename) {
  json_error_t error;
  json_t *root = json_load_file(filename.c_str(), JSON_DECODE_INT_AS_REAL, &error);
  replace(root, error, "'" + filename + "'");
}

void ConfigJSON::load_string(const std::string &text) {
  json_error_t error;
  json_t *root = json_loads(text.c_str(), JSON_DECODE_INT_AS_REAL, &error);
  replace(root, error, "a configuration string");
}

json_t* ConfigJSON::leaf(const std::string &name) const {
  json_t *result = lookup(m_root, split(name, '.'));
  if (result == NULL) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "configuration parameter %s is not set", name.c_str());
  }
  return result;
}

//! Set `name` to `value`, stealing the reference. Only the last element of `name` may be new.
void ConfigJSON::store(const std::string &name, json_t *value) {
  std::vector<std::string> path = split(name, '.');

  if (value == NULL or path.empty()) {
    json_decref(value);
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "cannot set configuration parameter '%s'", name.c_str());
  }

  std::string key = path.back();
  path.pop_back();

  json_t *parent = lookup(m_root, path);
  if (parent == NULL or not json_is_object(parent)) {
    json_decref(value);
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "cannot set %s: group '%s' does not exist",
                                  name.c_str(), join(path, ".").c_str());
  }

  json_object_set_new(parent, key.c_str(), value);
}

bool ConfigJSON::is_set_impl(const std::string &name) const {
  return lookup(m_root, split(name, '.')) != NULL;
}

Config::Doubles ConfigJSON::all_doubles_impl() const {
  Doubles result;
  for_each_leaf(m_root, "", [&result](const std::string &name, json_t *node) {
      if (json_is_number(node)) {
        result[name] = json_number_value(node);
      }
    });
  return result;
}

Config::Strings ConfigJSON::all_strings_impl() const {
  Strings result;
  for_each_leaf(m_root, "", [&result](const std::string &name, json_t *node) {
      if (json_is_string(node)) {
        result[name] = json_string_value(node);
      }
    });
  return result;
}

Config::Flags ConfigJSON::all_flags_impl() const {
  Flags result;
  for_each_leaf(m_root, "", [&result](const std::string &name, json_t *node) {
      if (json_is_boolean(node)) {
        result[name] = json_is_true(node);
      }
    });
  return result;
}

double ConfigJSON::get_number_impl(const std::string &name) const {
  json_t *node = leaf(name);
  if (not json_is_number(node)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "%s is not a number", name.c_str());
  }
  return json_number_value(node);
}

std::string ConfigJSON::get_string_impl(const std::string &name) const {
  json_t *node = leaf(name);
  if (not json_is_string(node)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "%s is not a string", name.c_str());
  }
  return json_string_value(node);
}

bool ConfigJSON::get_flag_impl(const std::string &name) const {
  json_t *node = leaf(name);
  if (not json_is_boolean(node)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "%s is not a flag", name.c_str());
  }
  return json_is_true(node);
}

void ConfigJSON::set_number_impl(const std::string &name, double value) {
  store(name, json_real(value));
}

void ConfigJSON::set_string_impl(const std::string &name, const std::string &value) {
  store(name, json_string(value.c_str()));
}

void ConfigJSON::set_flag_impl(const std::string &name, bool value) {
  store(name, json_boolean(value));
}

} // end of namespace bcat
