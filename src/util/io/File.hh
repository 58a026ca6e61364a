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

#ifndef BCAT_FILE_H
#define BCAT_FILE_H

#include <vector>
#include <string>

#include "bcat/util/io/IO_Flags.hh"

namespace bcat {

//! Result of File::find_variable().
struct VariableLookupData {
  bool exists;
  bool found_using_standard_name;
  std::string name;
};

//! A NetCDF file opened by one process.
/*!
 * Each rank reads its inputs and writes its outputs independently (correction units are
 * distributed among ranks), so no parallel I/O is needed.
 *
 * Global attributes belong to the variable "BCAT_GLOBAL". Files are created in the NetCDF-4
 * format.
 */
class File
{
public:
  File(const std::string &filename, io::Mode mode, int compression_level = 0);
  ~File();

  void close();

  void redef() const;

  void enddef() const;

  std::string filename() const;

  // dimensions

  void define_dimension(const std::string &name, size_t length) const;

  unsigned int dimension_length(const std::string &name) const;

  std::vector<std::string> dimensions(const std::string &variable_name) const;

  bool find_dimension(const std::string &name) const;

  //! Read the coordinate variable of the dimension `name` (0, 1, ... if there is none).
  std::vector<double> read_dimension(const std::string &name) const;

  // variables

  unsigned int nvariables() const;

  std::string variable_name(unsigned int id) const;

  void define_variable(const std::string &name, io::Type nctype,
                       const std::vector<std::string> &dims) const;

  VariableLookupData find_variable(const std::string &short_name,
                                   const std::string &std_name) const;

  bool find_variable(const std::string &short_name) const;

  void read_variable(const std::string &variable_name,
                     const std::vector<unsigned int> &start,
                     const std::vector<unsigned int> &count,
                     double *ip) const;

  void write_variable(const std::string &variable_name,
                      const std::vector<unsigned int> &start,
                      const std::vector<unsigned int> &count,
                      const double *op) const;

  // attributes

  void write_attribute(const std::string &var_name, const std::string &att_name,
                       io::Type nctype, const std::vector<double> &values) const;

  void write_attribute(const std::string &var_name, const std::string &att_name,
                       const std::string &value) const;

  std::vector<double> read_double_attribute(const std::string &var_name,
                                            const std::string &att_name) const;

  std::string read_text_attribute(const std::string &var_name,
                                  const std::string &att_name) const;

  void append_history(const std::string &history) const;
private:
  struct Impl;
  Impl *m_impl;

  void open(const std::string &filename, io::Mode mode);
  int get_varid(const std::string &variable_name) const;

  // disable copying and assignments
  File(const File &other);
  File & operator=(const File &);
};

} // end of namespace bcat

#endif /* BCAT_FILE_H */
