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

#include "bcat/util/Context.hh"
#include "bcat/util/Units.hh"
#include "bcat/util/Config.hh"
#include "bcat/util/Logger.hh"

namespace bcat {

Context::Context(MPI_Comm com, std::shared_ptr<units::System> unit_system,
                 std::shared_ptr<Config> config, std::shared_ptr<Logger> log)
  : m_com(com), m_size(1), m_rank(0),
    m_unit_system(unit_system), m_config(config), m_log(log) {
  MPI_Comm_size(m_com, &m_size);
  MPI_Comm_rank(m_com, &m_rank);
}

MPI_Comm Context::com() const {
  return m_com;
}

int Context::size() const {
  return m_size;
}

int Context::rank() const {
  return m_rank;
}

std::shared_ptr<units::System> Context::unit_system() const {
  return m_unit_system;
}

std::shared_ptr<const Config> Context::config() const {
  return m_config;
}

std::shared_ptr<Config> Context::config() {
  return m_config;
}

std::shared_ptr<const Logger> Context::log() const {
  return m_log;
}

std::shared_ptr<Logger> Context::log() {
  return m_log;
}

std::shared_ptr<Context> context_from_file(MPI_Comm com,
                                           const std::string &filename,
                                           bool print) {
  auto sys = std::make_shared<units::System>();

  auto config = config_from_file(sys, filename);

  auto verbosity = static_cast<int>(config->get_number("output.runtime.verbosity"));
  auto log = std::make_shared<Logger>(com, verbosity);

  if (print) {
    print_config(*log, 3, *config);
  }

  return std::make_shared<Context>(com, sys, config, log);
}

} // end of namespace bcat
