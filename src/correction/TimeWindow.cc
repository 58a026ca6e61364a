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

#include "bcat/correction/TimeWindow.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"

namespace bcat {

namespace {

//! Month and day of a date, ignoring the year.
struct MonthDay {
  int month, day;

  MonthDay(const Date &d)
    : month(d.month), day(d.day) {
    // empty
  }
};

bool operator<=(const MonthDay &a, const MonthDay &b) {
  return (a.month < b.month) or (a.month == b.month and a.day <= b.day);
}

bool operator==(const MonthDay &a, const MonthDay &b) {
  return a.month == b.month and a.day == b.day;
}

std::string format(const MonthDay &d) {
  return printf("%02d-%02d", d.month, d.day);
}

} // end of anonymous namespace

int representative_year(const Calendar &calendar) {
  // in 365-day and 360-day calendars all years are the same
  return calendar.days_in_year() == 366 ? 2000 : 1999;
}

TimeWindow window_for_day(int day_of_year, int window, const Calendar &calendar) {
  if (window < 0) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                  "invalid window half-width: %d (has to be non-negative)",
                                  window);
  }

  const int year = representative_year(calendar);

  MonthDay
    mid   = calendar.add_days(year, day_of_year),
    begin = calendar.add_days(year, day_of_year - window),
    end   = calendar.add_days(year, day_of_year + window);

  TimeWindow result;

  result.exact = [mid](const Date &d) {
    return MonthDay(d) == mid;
  };

  if (2 * window + 1 >= calendar.days_in_year()) {
    // the window covers the whole year
    result.window = [](const Date &) {
      return true;
    };
    result.description = printf("day %d (%s), all days", day_of_year, format(mid).c_str());
    return result;
  }

  if (begin <= end) {
    result.window = [begin, end](const Date &d) {
      MonthDay md(d);
      return begin <= md and md <= end;
    };
  } else {
    // the window crosses the end of the year: [Jan 1, end] and [begin, Dec 31]
    result.window = [begin, end](const Date &d) {
      MonthDay md(d);
      return md <= end or begin <= md;
    };
  }

  result.description = printf("day %d (%s), window %s to %s",
                              day_of_year, format(mid).c_str(),
                              format(begin).c_str(), format(end).c_str());

  return result;
}

int convert_day_of_year(int day_of_year, const Calendar &from, const Calendar &to) {
  if (from.days_in_year() == to.days_in_year()) {
    return day_of_year;
  }
  return to.days_in_year() * day_of_year / from.days_in_year();
}

DatePredicate window_for_month(int month) {
  if (month < 1 or month > 12) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "invalid month: %d", month);
  }

  return [month](const Date &d) {
    return d.month == month;
  };
}

std::vector<size_t> select(const std::vector<Date> &dates, const DatePredicate &predicate) {
  std::vector<size_t> result;
  for (size_t k = 0; k < dates.size(); ++k) {
    if (predicate(dates[k])) {
      result.push_back(k);
    }
  }
  return result;
}

} // end of namespace bcat
