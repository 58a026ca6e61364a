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

#include <cstdio>
#include <stdarg.h>

#include "bcat/util/Logger.hh"

namespace bcat {

static std::string vformat(const char format[], va_list args) {
  char buffer[8192];
  vsnprintf(buffer, sizeof(buffer), format, args);
  return buffer;
}

Logger::Logger(MPI_Comm com, int threshold)
  : m_com(com), m_threshold(threshold) {
  // empty
}

Logger::~Logger() {
  // empty
}

bool Logger::is_rank_zero() const {
  int rank = 0;
  MPI_Comm_rank(m_com, &rank);
  return rank == 0;
}

void Logger::message(int threshold, const char format[], ...) const {
  if (threshold > m_threshold) {
    return;
  }

  va_list args;
  va_start(args, format);
  std::string text = vformat(format, args);
  va_end(args);

  message_impl(text);
}

void Logger::message(int threshold, const std::string &text) const {
  if (threshold <= m_threshold) {
    message_impl(text);
  }
}

void Logger::error(const char format[], ...) const {
  va_list args;
  va_start(args, format);
  std::string text = vformat(format, args);
  va_end(args);

  error_impl(text);
}

void Logger::message_impl(const std::string &text) const {
  if (is_rank_zero()) {
    fputs(text.c_str(), stdout);
    fflush(stdout);
  }
}

void Logger::error_impl(const std::string &text) const {
  if (is_rank_zero()) {
    fputs(text.c_str(), stderr);
    fflush(stderr);
  }
}

void Logger::set_threshold(int level) {
  m_threshold = level;
}

int Logger::get_threshold() const {
  return m_threshold;
}

StringLogger::StringLogger(MPI_Comm com, int threshold)
  : Logger(com, threshold) {
  // empty
}

void StringLogger::message_impl(const std::string &text) const {
  m_text += text;
}

void StringLogger::error_impl(const std::string &text) const {
  m_text += text;
}

std::string StringLogger::get() const {
  return m_text;
}

void StringLogger::reset() {
  m_text.clear();
}

} // end of namespace bcat
