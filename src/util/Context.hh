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

#ifndef BCAT_CONTEXT_H
#define BCAT_CONTEXT_H

#include <memory>
#include <string>

#include <mpi.h>

namespace bcat {

namespace units {
class System;
}

class Config;
class Logger;

//! The communicator, unit system, configuration and logger of a run.
class Context {
public:
  Context(MPI_Comm com, std::shared_ptr<units::System> unit_system,
          std::shared_ptr<Config> config, std::shared_ptr<Logger> log);

  MPI_Comm com() const;
  int size() const;
  int rank() const;

  std::shared_ptr<units::System> unit_system() const;

  std::shared_ptr<const Config> config() const;
  std::shared_ptr<Config> config();

  std::shared_ptr<const Logger> log() const;
  std::shared_ptr<Logger> log();
private:
  MPI_Comm m_com;
  int m_size, m_rank;
  std::shared_ptr<units::System> m_unit_system;
  std::shared_ptr<Config> m_config;
  std::shared_ptr<Logger> m_log;

  Context(const Context&);
  Context & operator=(const Context &);
};

//! Set up a run using default parameters overridden by the JSON file `filename`.
/*!
 * `filename` may be empty. The verbosity is set to `output.runtime.verbosity`. If `print` is
 * true, all parameters are logged at verbosity 3.
 */
std::shared_ptr<Context> context_from_file(MPI_Comm com,
                                           const std::string &filename,
                                           bool print = false);

} // end of namespace bcat

#endif /* BCAT_CONTEXT_H */
