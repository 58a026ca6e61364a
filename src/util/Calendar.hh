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

#ifndef BCAT_CALENDAR_H
#define BCAT_CALENDAR_H

#include <string>

#include "bcat/util/Units.hh"

namespace bcat {

//! A calendar date (no time of day).
struct Date {
  int year, month, day;
};

bool operator==(const Date &a, const Date &b);
bool operator<(const Date &a, const Date &b);

bool is_valid_calendar_name(const std::string &name);

//! \brief Date arithmetic in one of the CF calendars.
/*!
 * Supported calendars:
 *
 * - "standard", "gregorian", "proleptic_gregorian": the Gregorian calendar (extended to dates
 *   before 1582-10-15)
 * - "all_leap", "366_day": every year is a leap year
 * - "noleap", "no_leap", "365_day": no leap years
 * - "360_day": twelve 30-day months
 *
 * Dates are converted to and from "day numbers": consecutive integers, one per day. Day number
 * 0 corresponds to 1970-01-01 in Gregorian calendars and to January 1 of the year 0 otherwise.
 */
class Calendar {
public:
  Calendar(const std::string &name);

  const std::string& name() const;

  //! Nominal number of days in a year (366 for Gregorian calendars, 365 or 360 otherwise).
  int days_in_year() const;

  bool is_leap(int year) const;
  int year_length(int year) const;
  int month_length(int year, int month) const;

  bool is_valid(const Date &date) const;

  long day_number(const Date &date) const;
  Date date(long day_number) const;

  //! Date `offset` days after January 1 of `year` (`offset` may be negative or exceed the year).
  Date add_days(int year, long offset) const;

  //! Parse a date in the YYYY-MM-DD format. Throws RuntimeError if the date is invalid.
  Date parse(const std::string &input) const;
private:
  enum Type {GREGORIAN, ALL_LEAP, NO_LEAP, DAYS_360};
  std::string m_name;
  Type m_type;
};

//! \brief CF-style time units ("days since 1950-01-01 00:00:00").
/*!
 * Converts time values in a file to calendar dates. The interval part of the units string may be
 * any time unit UDUNITS-2 recognizes (seconds, hours, days, ...); "months" and "years" are not
 * supported because their lengths depend on the calendar.
 */
class TimeUnits {
public:
  TimeUnits(units::System::Ptr system, const std::string &spec, const Calendar &calendar);

  //! The date containing the time `T`.
  Date date(double T) const;

  //! Time (in these units) corresponding to the start of the day `date`.
  double time(const Date &date) const;

  //! Convert `T` to (fractional) days since the calendar's day number 0.
  double to_days(double T) const;
  //! Inverse of to_days().
  double from_days(double days) const;

  const std::string& spec() const;
  const Calendar& calendar() const;
private:
  std::string m_spec;
  Calendar m_calendar;
  //! reference date and time, in days since the calendar's day number 0
  double m_reference;
  //! length of one interval in days
  double m_interval;
};

} // end of namespace bcat

#endif /* BCAT_CALENDAR_H */
