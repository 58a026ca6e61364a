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

#ifndef BCAT_ERROR_HANDLING_H
#define BCAT_ERROR_HANDLING_H

#include <mpi.h>                // MPI_Comm
#include <stdexcept>
#include <string>
#include <vector>

namespace bcat {

//! Source location of an error (recorded in debug builds only).
class ErrorLocation {
public:
  ErrorLocation();
  ErrorLocation(const char *name, int line);
  const char *filename;
  int line_number;
};

#if BCAT_DEBUG==1
#define BCAT_ERROR_LOCATION bcat::ErrorLocation(__FILE__, __LINE__)
#else
#define BCAT_ERROR_LOCATION bcat::ErrorLocation()
#endif

//! The exception thrown by all BCAT code.
/*!
 * Callers catch it (by reference), call add_context() to say what they were doing, and
 * re-throw. The resulting chain of messages is printed by handle_fatal_errors().
 */
class RuntimeError : public std::runtime_error {
public:
  RuntimeError(const ErrorLocation &location, const std::string &message);
  ~RuntimeError() throw();

  static RuntimeError formatted(const ErrorLocation &location, const char format[], ...)
    __attribute__((format(printf, 2, 3)));

  void add_context(const std::string &message);
  void add_context(const char format[], ...) __attribute__((format(printf, 2, 3)));

  //! Print the message and the context on rank 0 of `com`.
  void print(MPI_Comm com) const;
private:
  std::vector<std::string> m_context;
  ErrorLocation m_location;
};

//! Turns a failure on some ranks into a RuntimeError on all ranks.
/*!
 * ~~~ c++
 * ParallelSection loop(com);
 * try {
 *   // work that may fail on one rank only
 * } catch (...) {
 *   loop.failed();
 * }
 * loop.check();
 * ~~~
 */
class ParallelSection {
public:
  ParallelSection(MPI_Comm com);
  //! Report the current exception. Call from a `catch (...)` block only.
  void failed();
  //! Collective. Throws if `failed()` was called on any rank.
  void check();
private:
  bool m_failed;
  MPI_Comm m_com;
};

//! Report the current exception. Call from a `catch (...)` block only.
void handle_fatal_errors(MPI_Comm com);

//! Throw a RuntimeError if a C library call did not return `success`.
void check_c_call(int errcode, int success, const char* function_name,
                  const char *file, int line);

#define BCAT_C_CHK(errcode,success,name) do { bcat::check_c_call(errcode, success, name, __FILE__, __LINE__); } while (0)

} // end of namespace bcat

#endif /* BCAT_ERROR_HANDLING_H */
