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

#include "bcat/util/Units.hh"

#include <udunits2.h>

#include "bcat/util/error_handling.hh"

namespace bcat {

namespace units {

System::System(const std::string &path) {
  // errors are reported using exceptions below
  ut_set_error_message_handler(ut_ignore);

  ut_system *system = ut_read_xml(path.empty() ? NULL : path.c_str());
  if (system == NULL) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "failed to read the UDUNITS-2 database '%s'",
                                  path.empty() ? "(default)" : path.c_str());
  }

  m_system.reset(system, ut_free_system);
}

Unit::Unit(System::Ptr system, const std::string &spec)
  : m_system(system), m_spec(spec) {

  ut_unit *unit = ut_parse(system->m_system.get(), spec.c_str(), UT_ASCII);
  if (unit == NULL) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "'%s' is not a valid unit string", spec.c_str());
  }

  m_unit.reset(unit, ut_free);
}

bool Unit::is_convertible(const Unit &other) const {
  return ut_are_convertible(m_unit.get(), other.m_unit.get()) != 0;
}

std::string Unit::format() const {
  return m_spec;
}

bool are_convertible(const Unit &u1, const Unit &u2) {
  return u1.is_convertible(u2);
}

Converter::Converter(const Unit &from, const Unit &to) {
  if (not from.is_convertible(to)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "units '%s' and '%s' are not compatible",
                                  from.format().c_str(), to.format().c_str());
  }

  cv_converter *converter = ut_get_converter(from.m_unit.get(), to.m_unit.get());
  if (converter == NULL) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "ut_get_converter('%s', '%s') failed",
                                  from.format().c_str(), to.format().c_str());
  }

  m_converter.reset(converter, cv_free);
}

Converter::Converter(System::Ptr system, const std::string &from, const std::string &to)
  : Converter(Unit(system, from), Unit(system, to)) {
  // empty
}

double Converter::operator()(double input) const {
  return cv_convert_double(m_converter.get(), input);
}

void Converter::convert_doubles(std::vector<double> &data) const {
  if (not data.empty()) {
    cv_convert_doubles(m_converter.get(), data.data(), data.size(), data.data());
  }
}

double convert(System::Ptr system, double input,
               const std::string &from, const std::string &to) {
  return Converter(system, from, to)(input);
}

} // end of namespace units

} // end of namespace bcat
