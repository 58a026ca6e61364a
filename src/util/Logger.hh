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

#ifndef BCAT_LOGGER_H
#define BCAT_LOGGER_H

#include <string>
#include <memory>

#include <mpi.h>                // MPI_Comm

namespace bcat {

//! Progress and diagnostic messages.
/*!
 * Verbosity levels: 1 (warnings only), 2 (progress, the default), 3 (details), 4 (everything).
 *
 * The base class writes to `stdout` (messages) and `stderr` (errors) on rank 0 of its
 * communicator. Use MPI_COMM_SELF to report from every rank.
 */
class Logger {
public:
  typedef std::shared_ptr<Logger> Ptr;
  typedef std::shared_ptr<const Logger> ConstPtr;

  Logger(MPI_Comm com, int threshold);
  virtual ~Logger();

  //! Log a message if `threshold` does not exceed the current verbosity.
  void message(int threshold, const char format[], ...) const __attribute__((format(printf, 3, 4)));
  void message(int threshold, const std::string &text) const;

  //! Log an error message (regardless of verbosity).
  void error(const char format[], ...) const __attribute__((format(printf, 2, 3)));

  void set_threshold(int level);
  int get_threshold() const;
protected:
  virtual void message_impl(const std::string &text) const;
  virtual void error_impl(const std::string &text) const;
  bool is_rank_zero() const;
private:
  MPI_Comm m_com;
  int m_threshold;

  Logger(const Logger&);
  Logger & operator=(const Logger &);
};

//! Logger that keeps all messages in memory (for testing).
class StringLogger : public Logger {
public:
  StringLogger(MPI_Comm com, int threshold);

  //! Everything logged so far.
  std::string get() const;
  //! Discard logged messages.
  void reset();
protected:
  virtual void message_impl(const std::string &text) const;
  virtual void error_impl(const std::string &text) const;
private:
  mutable std::string m_text;
};

} // end of namespace bcat

#endif /* BCAT_LOGGER_H */
