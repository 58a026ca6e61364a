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

#ifndef BCAT_TIMEWINDOW_H
#define BCAT_TIMEWINDOW_H

#include <functional>
#include <string>
#include <vector>

#include "bcat/util/Calendar.hh"

namespace bcat {

//! A predicate selecting dates (regardless of the year).
typedef std::function<bool(const Date&)> DatePredicate;

//! Time predicates corresponding to a day-of-year correction unit.
struct TimeWindow {
  //! selects the day itself (one day per year)
  DatePredicate exact;
  //! selects all days within `day_of_year - window` and `day_of_year + window`
  DatePredicate window;
  //! human-readable description (for the log)
  std::string description;
};

//! Year used to convert days of the year to dates (a leap year for 366-day calendars).
int representative_year(const Calendar &calendar);

/*!
 * Build predicates for the day of the year `day_of_year` (the number of days since January 1 of
 * the representative year) and the half-width `window` (in days).
 *
 * Windows crossing the end of the year wrap around: December 30 plus two days selects dates
 * from December 28 to January 1.
 */
TimeWindow window_for_day(int day_of_year, int window, const Calendar &calendar);

/*!
 * Day of the year in the calendar `to` corresponding to the day `day_of_year` in the calendar
 * `from`: `day_of_year` scaled by the ratio of nominal year lengths, rounded down.
 */
int convert_day_of_year(int day_of_year, const Calendar &from, const Calendar &to);

//! Predicate selecting all days of the month `month` (1 to 12).
DatePredicate window_for_month(int month);

//! Indexes of dates that satisfy `predicate`.
std::vector<size_t> select(const std::vector<Date> &dates, const DatePredicate &predicate);

} // end of namespace bcat

#endif /* BCAT_TIMEWINDOW_H */
