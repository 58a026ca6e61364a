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

#include <cmath>
#include <limits>
#include <vector>

#include "bcat/util/Calendar.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"

namespace bcat {

bool operator==(const Date &a, const Date &b) {
  return a.year == b.year and a.month == b.month and a.day == b.day;
}

bool operator<(const Date &a, const Date &b) {
  if (a.year != b.year) {
    return a.year < b.year;
  }
  if (a.month != b.month) {
    return a.month < b.month;
  }
  return a.day < b.day;
}

bool is_valid_calendar_name(const std::string &name) {
  return member(name, {"standard", "gregorian", "proleptic_gregorian",
                       "all_leap", "366_day",
                       "noleap", "no_leap", "365_day",
                       "360_day"});
}

static const int month_lengths[2][12] = {
  {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31},
  {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31}
};

//! Integer division rounding towards negative infinity.
static long floor_div(long a, long b) {
  long q = a / b;
  if ((a % b != 0) and ((a < 0) != (b < 0))) {
    q -= 1;
  }
  return q;
}

/*!
 * Days since 1970-01-01 in the proleptic Gregorian calendar.
 *
 * See http://howardhinnant.github.io/date_algorithms.html
 */
static long days_from_civil(long y, int m, int d) {
  y -= (m <= 2) ? 1 : 0;
  const long era = floor_div(y, 400);
  const long yoe = y - era * 400;                                   // [0, 399]
  const long doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1; // [0, 365]
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
  return era * 146097 + doe - 719468;
}

//! Inverse of days_from_civil().
static Date civil_from_days(long z) {
  z += 719468;
  const long era = floor_div(z, 146097);
  const long doe = z - era * 146097;                                     // [0, 146096]
  const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365; // [0, 399]
  const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);              // [0, 365]
  const long mp  = (5 * doy + 2) / 153;                                  // [0, 11]

  Date result;
  result.day   = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  result.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  result.year  = static_cast<int>(yoe + era * 400 + (result.month <= 2 ? 1 : 0));
  return result;
}

Calendar::Calendar(const std::string &name)
  : m_name(name) {

  if (not is_valid_calendar_name(name)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "unsupported calendar: %s", name.c_str());
  }

  if (member(name, {"standard", "gregorian", "proleptic_gregorian"})) {
    m_type = GREGORIAN;
  } else if (member(name, {"all_leap", "366_day"})) {
    m_type = ALL_LEAP;
  } else if (member(name, {"noleap", "no_leap", "365_day"})) {
    m_type = NO_LEAP;
  } else {
    m_type = DAYS_360;
  }
}

const std::string& Calendar::name() const {
  return m_name;
}

int Calendar::days_in_year() const {
  switch (m_type) {
  case GREGORIAN:
  case ALL_LEAP:
    return 366;
  case NO_LEAP:
    return 365;
  case DAYS_360:
  default:
    return 360;
  }
}

bool Calendar::is_leap(int year) const {
  switch (m_type) {
  case GREGORIAN:
    return (year % 4 == 0 and year % 100 != 0) or (year % 400 == 0);
  case ALL_LEAP:
    return true;
  case NO_LEAP:
  case DAYS_360:
  default:
    return false;
  }
}

int Calendar::year_length(int year) const {
  if (m_type == DAYS_360) {
    return 360;
  }
  return is_leap(year) ? 366 : 365;
}

int Calendar::month_length(int year, int month) const {
  if (month < 1 or month > 12) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "invalid month: %d", month);
  }

  if (m_type == DAYS_360) {
    return 30;
  }
  return month_lengths[is_leap(year) ? 1 : 0][month - 1];
}

bool Calendar::is_valid(const Date &date) const {
  if (date.month < 1 or date.month > 12) {
    return false;
  }
  return date.day >= 1 and date.day <= month_length(date.year, date.month);
}

long Calendar::day_number(const Date &date) const {
  if (not is_valid(date)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "date %04d-%02d-%02d is invalid in the %s calendar",
                                  date.year, date.month, date.day, m_name.c_str());
  }

  if (m_type == GREGORIAN) {
    return days_from_civil(date.year, date.month, date.day);
  }

  long day_of_year = date.day - 1;
  for (int m = 1; m < date.month; ++m) {
    day_of_year += month_length(date.year, m);
  }

  return static_cast<long>(date.year) * year_length(date.year) + day_of_year;
}

Date Calendar::date(long day_number) const {
  if (m_type == GREGORIAN) {
    return civil_from_days(day_number);
  }

  // all years have the same length in the remaining calendars
  const long L = year_length(0);

  Date result;
  result.year = static_cast<int>(floor_div(day_number, L));

  long day_of_year = day_number - result.year * L;

  result.month = 1;
  while (day_of_year >= month_length(result.year, result.month)) {
    day_of_year -= month_length(result.year, result.month);
    result.month += 1;
  }
  result.day = static_cast<int>(day_of_year) + 1;

  return result;
}

Date Calendar::add_days(int year, long offset) const {
  Date january_first = {year, 1, 1};
  return date(day_number(january_first) + offset);
}

Date Calendar::parse(const std::string &input) const {
  std::string spec = string_strip(input);

  if (spec.empty()) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "got an empty date specification: '%s'",
                                  input.c_str());
  }

  // We need to remember if the year was negative in the input string: split() will ignore
  // empty tokens separated by "-", so "-1000-1-1" will produce ["1000", "1", "1"].
  bool year_is_negative = (spec[0] == '-');

  auto parts = split(spec, '-');

  if (parts.size() != 3) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "invalid date '%s' (expected YYYY-MM-DD)",
                                  spec.c_str());
  }

  std::vector<int> numbers;
  for (const auto &p : parts) {
    try {
      long int n = parse_integer(p);

      if (n > std::numeric_limits<int>::max() or
          n < std::numeric_limits<int>::min()) {
        throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                      "%ld does not fit in an 'int'",
                                      n);
      }

      numbers.push_back(static_cast<int>(n));
    } catch (RuntimeError &e) {
      e.add_context("parsing a date specification %s",
                    spec.c_str());
      throw;
    }
  }

  if (year_is_negative) {
    numbers[0] *= -1;
  }

  Date result = {numbers[0], numbers[1], numbers[2]};

  if (not is_valid(result)) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "date %s is invalid in the %s calendar",
                                  spec.c_str(), m_name.c_str());
  }

  return result;
}

//! Parse "HH:MM:SS" (or "HH:MM", "HH") and return the fraction of the day.
static double parse_time_of_day(const std::string &input) {
  std::string time = input;
  // UTC
  if (not time.empty() and time[time.size() - 1] == 'Z') {
    time.resize(time.size() - 1);
  }

  auto parts = split(time, ':');

  if (parts.empty() or parts.size() > 3) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "invalid time of day '%s'", input.c_str());
  }

  const double scale[] = {24.0, 24.0 * 60.0, 24.0 * 3600.0};

  double result = 0.0;
  for (size_t k = 0; k < parts.size(); ++k) {
    result += parse_number(parts[k]) / scale[k];
  }
  return result;
}

TimeUnits::TimeUnits(units::System::Ptr system, const std::string &spec,
                     const Calendar &calendar)
  : m_spec(spec), m_calendar(calendar), m_reference(0.0), m_interval(1.0) {
  try {
    size_t position = spec.find(" since ");
    if (position == std::string::npos) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "'%s' are not time units (expected '<interval> since <date>')",
                                    spec.c_str());
    }

    std::string interval  = string_strip(spec.substr(0, position));
    std::string reference = string_strip(spec.substr(position + std::string(" since ").size()));

    if (member(interval, {"month", "months", "year", "years", "common_year", "common_years"})) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "time units '%s' are not supported (the length of a %s"
                                    " depends on the calendar)",
                                    spec.c_str(), interval.c_str());
    }

    m_interval = units::convert(system, 1.0, interval, "day");

    // ISO 8601 style: "1950-01-01T12:00:00"
    for (auto &c : reference) {
      if (c == 'T') {
        c = ' ';
      }
    }

    auto words = split(reference, ' ');
    if (words.empty()) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "time units '%s' do not contain a reference date",
                                    spec.c_str());
    }

    m_reference = static_cast<double>(m_calendar.day_number(m_calendar.parse(words[0])));

    // time zones ("UTC", "Z", "+00:00") are ignored
    if (words.size() > 1 and words[1].find(':') != std::string::npos) {
      m_reference += parse_time_of_day(words[1]);
    }
  } catch (RuntimeError &e) {
    e.add_context("processing time units '%s' (calendar '%s')",
                  spec.c_str(), calendar.name().c_str());
    throw;
  }
}

double TimeUnits::to_days(double T) const {
  return m_reference + T * m_interval;
}

double TimeUnits::from_days(double days) const {
  return (days - m_reference) / m_interval;
}

Date TimeUnits::date(double T) const {
  // tolerance for round-off in unit conversions (e.g. hours to days)
  const double eps = 1e-9;
  return m_calendar.date(static_cast<long>(std::floor(to_days(T) + eps)));
}

double TimeUnits::time(const Date &date) const {
  return from_days(static_cast<double>(m_calendar.day_number(date)));
}

const std::string& TimeUnits::spec() const {
  return m_spec;
}

const Calendar& TimeUnits::calendar() const {
  return m_calendar;
}

} // end of namespace bcat
