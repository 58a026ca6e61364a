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

#ifndef BCAT_UNITS_H
#define BCAT_UNITS_H

#include <string>
#include <memory>
#include <vector>

// forward declarations of UDUNITS-2 types
struct ut_system;
union ut_unit;
union cv_converter;

namespace bcat {

//! UDUNITS-2 wrappers.
/*!
 * Units and converters keep a pointer to the System they were created with, so a System lives
 * as long as anything that uses it.
 */
namespace units {

class System {
public:
  typedef std::shared_ptr<System> Ptr;

  //! Read the unit database at `path` (empty: the database UDUNITS-2 was installed with).
  System(const std::string &path = "");
private:
  friend class Unit;
  std::shared_ptr<ut_system> m_system;

  System(const System &);
  System& operator=(System const &);
};

class Unit {
public:
  //! Parse `spec`. Throws RuntimeError if it is not a valid unit string.
  Unit(System::Ptr system, const std::string &spec);

  bool is_convertible(const Unit &other) const;

  //! The string this unit was created from.
  std::string format() const;
private:
  friend class Converter;
  System::Ptr m_system;
  std::string m_spec;
  std::shared_ptr<ut_unit> m_unit;
};

bool are_convertible(const Unit &u1, const Unit &u2);

//! Conversion from one unit to another. Throws RuntimeError if the units are incompatible.
class Converter {
public:
  Converter(const Unit &from, const Unit &to);
  Converter(System::Ptr system, const std::string &from, const std::string &to);

  double operator()(double input) const;

  //! Convert all elements of `data` in place.
  void convert_doubles(std::vector<double> &data) const;
private:
  std::shared_ptr<cv_converter> m_converter;
};

//! Convert one number from `from` to `to`, e.g. `convert(sys, 15.0, "days", "hours")`.
double convert(System::Ptr system, double input,
               const std::string &from, const std::string &to);

} // end of namespace units

} // end of namespace bcat

#endif /* BCAT_UNITS_H */
