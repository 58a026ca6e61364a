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

#include "bcat/util/error_handling.hh"

#include <cstdio>
#include <stdarg.h>

namespace bcat {

ErrorLocation::ErrorLocation()
  : filename(NULL), line_number(0) {
  // empty
}

ErrorLocation::ErrorLocation(const char *name, int line)
  : filename(name), line_number(line) {
  // empty
}

static std::string vformat(const char format[], va_list args) {
  char buffer[8192];
  vsnprintf(buffer, sizeof(buffer), format, args);
  return buffer;
}

RuntimeError::RuntimeError(const ErrorLocation &location, const std::string &message)
  : std::runtime_error(message), m_location(location) {
  // empty
}

RuntimeError::~RuntimeError() throw() {
  // empty
}

RuntimeError RuntimeError::formatted(const ErrorLocation &location, const char format[], ...) {
  va_list args;
  va_start(args, format);
  std::string message = vformat(format, args);
  va_end(args);

  return RuntimeError(location, message);
}

void RuntimeError::add_context(const std::string &message) {
  m_context.push_back(message);
}

void RuntimeError::add_context(const char format[], ...) {
  va_list args;
  va_start(args, format);
  std::string message = vformat(format, args);
  va_end(args);

  m_context.push_back(message);
}

//! Indent all lines of `text` except the first one.
static std::string indent(const std::string &text, size_t width) {
  std::string result;
  for (char c : text) {
    result += c;
    if (c == '\n') {
      result += std::string(width, ' ');
    }
  }
  return result;
}

void RuntimeError::print(MPI_Comm com) const {
  int rank = 0;
  MPI_Comm_rank(com, &rank);
  if (rank != 0) {
    return;
  }

  const std::string prefix = "BCAT ERROR: ";
  const std::string margin(prefix.size(), ' ');

  fprintf(stderr, "%s%s\n", prefix.c_str(), indent(what(), prefix.size()).c_str());

  for (const auto &message : m_context) {
    fprintf(stderr, "%swhile %s\n", margin.c_str(),
            indent(message, margin.size() + 6).c_str());
  }

  if (m_location.filename != NULL) {
    fprintf(stderr, "%s(%s:%d)\n", margin.c_str(),
            m_location.filename, m_location.line_number);
  }

  fflush(stderr);
}

void handle_fatal_errors(MPI_Comm com) {
  try {
    throw;
  } catch (RuntimeError &e) {
    e.print(com);
  } catch (std::exception &e) {
    fprintf(stderr,
            "BCAT ERROR: unexpected exception: \"%s\".\n"
            "            Please report this as a bug.\n",
            e.what());
  } catch (...) {
    fprintf(stderr,
            "BCAT ERROR: exception of unknown type.\n"
            "            Please report this as a bug.\n");
  }
}

void check_c_call(int errcode, int success,
                  const char* function_name, const char *file, int line) {
  if (errcode != success) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "%s failed (%s:%d)",
                                  function_name, file, line);
  }
}

ParallelSection::ParallelSection(MPI_Comm com)
  : m_failed(false), m_com(com) {
  // empty
}

void ParallelSection::failed() {
  int rank = 0;
  MPI_Comm_rank(m_com, &rank);

  fprintf(stderr, "BCAT ERROR: rank %d failed:\n", rank);
  handle_fatal_errors(MPI_COMM_SELF);

  m_failed = true;
}

void ParallelSection::check() {
  int ok = m_failed ? 0 : 1;
  int all_ok = 0;

  MPI_Allreduce(&ok, &all_ok, 1, MPI_INT, MPI_LAND, m_com);

  if (all_ok == 0) {
    throw RuntimeError(BCAT_ERROR_LOCATION, "parallel section failed (see messages above)");
  }
}

} // end of namespace bcat
