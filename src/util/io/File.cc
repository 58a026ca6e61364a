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

#include <vector>
#include <cstring>

// netcdf.h checks MPI_INCLUDED
#ifndef MPI_INCLUDED
#define MPI_INCLUDED 1
#endif
#include <netcdf.h>

#include "bcat/util/io/File.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"

namespace bcat {

//! Convert a NetCDF error code into an exception.
static void check(const ErrorLocation &where, int return_code) {
  if (return_code != NC_NOERR) {
    throw RuntimeError(where, nc_strerror(return_code));
  }
}

static nc_type nc_type_of(io::Type input) {
  switch (input) {
  case io::BCAT_CHAR:
    return NC_CHAR;
  case io::BCAT_INT:
    return NC_INT;
  case io::BCAT_FLOAT:
    return NC_FLOAT;
  case io::BCAT_DOUBLE:
    return NC_DOUBLE;
  default:
    return NC_NAT;
  }
}

struct File::Impl {
  std::string filename;
  int ncid;
  int compression_level;
};

File::File(const std::string &filename, io::Mode mode, int compression_level)
  : m_impl(new Impl) {
  m_impl->ncid              = -1;
  m_impl->compression_level = compression_level;

  if (filename.empty()) {
    delete m_impl;
    throw RuntimeError(BCAT_ERROR_LOCATION, "cannot open file: provided file name is empty");
  }

  try {
    open(filename, mode);
  } catch (RuntimeError &e) {
    delete m_impl;
    e.add_context("opening or creating \"" + filename + "\"");
    throw;
  }
}

File::~File() {
  if (m_impl->ncid >= 0) {
    // A file is still open. We ignore the return value because this
    // destructor may be called during stack unwinding.
    nc_close(m_impl->ncid);
  }
  delete m_impl;
}

void File::open(const std::string &filename, io::Mode mode) {
  int stat = NC_NOERR;

  if (mode == io::BCAT_READONLY or mode == io::BCAT_READWRITE) {
    int nc_mode = (mode == io::BCAT_READONLY) ? NC_NOWRITE : NC_WRITE;
    stat = nc_open(filename.c_str(), nc_mode, &m_impl->ncid);
    check(BCAT_ERROR_LOCATION, stat);
  } else if (mode == io::BCAT_READWRITE_CLOBBER) {
    stat = nc_create(filename.c_str(), NC_NETCDF4 | NC_CLOBBER, &m_impl->ncid);
    check(BCAT_ERROR_LOCATION, stat);

    // variables are written in full, so pre-filling is a waste of time
    int old_fill_mode = 0;
    stat = nc_set_fill(m_impl->ncid, NC_NOFILL, &old_fill_mode);
    check(BCAT_ERROR_LOCATION, stat);
  } else {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "invalid mode: %d", (int)mode);
  }

  m_impl->filename = filename;
}

void File::close() {
  if (m_impl->ncid >= 0) {
    int stat = nc_close(m_impl->ncid);
    m_impl->ncid = -1;
    check(BCAT_ERROR_LOCATION, stat);
  }
  m_impl->filename.clear();
}

void File::redef() const {
  int stat = nc_redef(m_impl->ncid);
  // NetCDF-4 files are switched to "define mode" automatically
  if (stat != NC_EINDEFINE) {
    check(BCAT_ERROR_LOCATION, stat);
  }
}

void File::enddef() const {
  int stat = nc_enddef(m_impl->ncid);
  if (stat != NC_ENOTINDEFINE) {
    check(BCAT_ERROR_LOCATION, stat);
  }
}

std::string File::filename() const {
  return m_impl->filename;
}

int File::get_varid(const std::string &variable_name) const {
  if (variable_name == "BCAT_GLOBAL") {
    return NC_GLOBAL;
  }

  int result = 0;
  int stat = nc_inq_varid(m_impl->ncid, variable_name.c_str(), &result);
  if (stat != NC_NOERR) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "variable '%s' not found in '%s'",
                                  variable_name.c_str(), m_impl->filename.c_str());
  }

  return result;
}

// dimensions

void File::define_dimension(const std::string &name, size_t length) const {
  try {
    redef();

    int dimid = 0;
    int stat = nc_def_dim(m_impl->ncid, name.c_str(),
                          length == (size_t)io::BCAT_UNLIMITED ? NC_UNLIMITED : length,
                          &dimid);
    check(BCAT_ERROR_LOCATION, stat);
  } catch (RuntimeError &e) {
    e.add_context("defining dimension '%s' in '%s'", name.c_str(), m_impl->filename.c_str());
    throw;
  }
}

bool File::find_dimension(const std::string &name) const {
  int dimid = 0;
  int stat = nc_inq_dimid(m_impl->ncid, name.c_str(), &dimid);
  return stat == NC_NOERR;
}

unsigned int File::dimension_length(const std::string &name) const {
  int dimid = 0;
  int stat = nc_inq_dimid(m_impl->ncid, name.c_str(), &dimid);
  if (stat != NC_NOERR) {
    return 0;
  }

  size_t result = 0;
  stat = nc_inq_dimlen(m_impl->ncid, dimid, &result);
  check(BCAT_ERROR_LOCATION, stat);

  return static_cast<unsigned int>(result);
}

std::vector<std::string> File::dimensions(const std::string &variable_name) const {
  try {
    int varid = get_varid(variable_name);

    int ndims = 0;
    int stat = nc_inq_varndims(m_impl->ncid, varid, &ndims);
    check(BCAT_ERROR_LOCATION, stat);

    if (ndims == 0) {
      return {};
    }

    std::vector<int> dimids(ndims);
    stat = nc_inq_vardimid(m_impl->ncid, varid, dimids.data());
    check(BCAT_ERROR_LOCATION, stat);

    std::vector<std::string> result;
    for (int k = 0; k < ndims; ++k) {
      std::vector<char> name(NC_MAX_NAME + 1, 0);
      stat = nc_inq_dimname(m_impl->ncid, dimids[k], name.data());
      check(BCAT_ERROR_LOCATION, stat);
      result.push_back(name.data());
    }

    return result;
  } catch (RuntimeError &e) {
    e.add_context("getting dimensions of variable '%s' in '%s'", variable_name.c_str(),
                  m_impl->filename.c_str());
    throw;
  }
}

std::vector<double> File::read_dimension(const std::string &name) const {
  unsigned int length = dimension_length(name);

  std::vector<double> result(length);

  if (find_variable(name)) {
    if (length > 0) {
      read_variable(name, {0}, {length}, result.data());
    }
  } else {
    for (unsigned int k = 0; k < length; ++k) {
      result[k] = k;
    }
  }

  return result;
}

// variables

unsigned int File::nvariables() const {
  int result = 0;
  int stat = nc_inq_nvars(m_impl->ncid, &result); check(BCAT_ERROR_LOCATION, stat);
  return static_cast<unsigned int>(result);
}

std::string File::variable_name(unsigned int id) const {
  std::vector<char> name(NC_MAX_NAME + 1, 0);
  int stat = nc_inq_varname(m_impl->ncid, (int)id, name.data());
  check(BCAT_ERROR_LOCATION, stat);
  return name.data();
}

void File::define_variable(const std::string &name, io::Type nctype,
                           const std::vector<std::string> &dims) const {
  try {
    redef();

    std::vector<int> dimids;
    for (const auto &d : dims) {
      int dimid = -1;
      int stat = nc_inq_dimid(m_impl->ncid, d.c_str(), &dimid);
      check(BCAT_ERROR_LOCATION, stat);
      dimids.push_back(dimid);
    }

    int varid = -1;
    int stat = nc_def_var(m_impl->ncid, name.c_str(), nc_type_of(nctype),
                          static_cast<int>(dims.size()), dimids.data(), &varid);
    check(BCAT_ERROR_LOCATION, stat);

    // compress 2D and 3D variables only
    if (m_impl->compression_level > 0 and dims.size() > 1) {
      stat = nc_def_var_deflate(m_impl->ncid, varid, 0, 1, m_impl->compression_level);
      check(BCAT_ERROR_LOCATION, stat);
    }
  } catch (RuntimeError &e) {
    e.add_context("defining variable '%s' in '%s'", name.c_str(), m_impl->filename.c_str());
    throw;
  }
}

bool File::find_variable(const std::string &short_name) const {
  int varid = 0;
  return nc_inq_varid(m_impl->ncid, short_name.c_str(), &varid) == NC_NOERR;
}

//! \brief Find a variable using its short name or its standard name.
/*!
 * The standard name is checked first. If several variables share the same standard name an
 * exception is thrown.
 */
VariableLookupData File::find_variable(const std::string &short_name,
                                       const std::string &std_name) const {
  VariableLookupData result;
  result.exists                    = false;
  result.found_using_standard_name = false;

  try {
    if (not std_name.empty()) {
      unsigned int n = nvariables();
      for (unsigned int j = 0; j < n; ++j) {
        std::string name = variable_name(j);
        std::string attribute = read_text_attribute(name, "standard_name");

        if (attribute.empty() or attribute != std_name) {
          continue;
        }

        if (result.exists) {
          throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                        "variables '%s' and '%s' have the same standard_name (%s)",
                                        result.name.c_str(), name.c_str(), attribute.c_str());
        }

        result.exists                    = true;
        result.found_using_standard_name = true;
        result.name                      = name;
      }
    }

    if (not result.exists and find_variable(short_name)) {
      result.exists = true;
      result.name   = short_name;
    }
  } catch (RuntimeError &e) {
    e.add_context("searching for variable '%s' ('%s') in '%s'", short_name.c_str(),
                  std_name.c_str(), m_impl->filename.c_str());
    throw;
  }

  return result;
}

void File::read_variable(const std::string &variable_name,
                         const std::vector<unsigned int> &start,
                         const std::vector<unsigned int> &count,
                         double *ip) const {
  try {
    if (start.size() != count.size()) {
      throw RuntimeError(BCAT_ERROR_LOCATION, "start and count arrays have different sizes");
    }

    int varid = get_varid(variable_name);

    std::vector<size_t> nc_start(start.begin(), start.end()),
      nc_count(count.begin(), count.end());

    int stat = nc_get_vara_double(m_impl->ncid, varid, nc_start.data(), nc_count.data(), ip);
    check(BCAT_ERROR_LOCATION, stat);
  } catch (RuntimeError &e) {
    e.add_context("reading variable '%s' from '%s'", variable_name.c_str(),
                  m_impl->filename.c_str());
    throw;
  }
}

void File::write_variable(const std::string &variable_name,
                          const std::vector<unsigned int> &start,
                          const std::vector<unsigned int> &count,
                          const double *op) const {
  try {
    if (start.size() != count.size()) {
      throw RuntimeError(BCAT_ERROR_LOCATION, "start and count arrays have different sizes");
    }

    enddef();

    int varid = get_varid(variable_name);

    std::vector<size_t> nc_start(start.begin(), start.end()),
      nc_count(count.begin(), count.end());

    int stat = nc_put_vara_double(m_impl->ncid, varid, nc_start.data(), nc_count.data(), op);
    check(BCAT_ERROR_LOCATION, stat);
  } catch (RuntimeError &e) {
    e.add_context("writing variable '%s' to '%s'", variable_name.c_str(),
                  m_impl->filename.c_str());
    throw;
  }
}

// attributes

void File::write_attribute(const std::string &var_name, const std::string &att_name,
                           io::Type nctype, const std::vector<double> &values) const {
  try {
    redef();

    int stat = nc_put_att_double(m_impl->ncid, get_varid(var_name), att_name.c_str(),
                                 nc_type_of(nctype), values.size(), values.data());
    check(BCAT_ERROR_LOCATION, stat);
  } catch (RuntimeError &e) {
    e.add_context("writing double attribute '%s:%s' in '%s'",
                  var_name.c_str(), att_name.c_str(), m_impl->filename.c_str());
    throw;
  }
}

void File::write_attribute(const std::string &var_name, const std::string &att_name,
                           const std::string &value) const {
  try {
    redef();

    int stat = nc_put_att_text(m_impl->ncid, get_varid(var_name), att_name.c_str(),
                               value.size(), value.c_str());
    check(BCAT_ERROR_LOCATION, stat);
  } catch (RuntimeError &e) {
    e.add_context("writing text attribute '%s:%s' in '%s'",
                  var_name.c_str(), att_name.c_str(), m_impl->filename.c_str());
    throw;
  }
}

//! Returns an empty vector if the attribute is not present.
std::vector<double> File::read_double_attribute(const std::string &var_name,
                                                const std::string &att_name) const {
  try {
    int varid = get_varid(var_name);

    size_t attlen = 0;
    int stat = nc_inq_attlen(m_impl->ncid, varid, att_name.c_str(), &attlen);
    if (stat == NC_ENOTATT) {
      return {};
    }
    check(BCAT_ERROR_LOCATION, stat);

    nc_type type = NC_NAT;
    stat = nc_inq_atttype(m_impl->ncid, varid, att_name.c_str(), &type);
    check(BCAT_ERROR_LOCATION, stat);

    if (type == NC_CHAR or type == NC_STRING) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "the attribute %s:%s is a string",
                                    var_name.c_str(), att_name.c_str());
    }

    if (attlen == 0) {
      return {};
    }

    std::vector<double> result(attlen);
    stat = nc_get_att_double(m_impl->ncid, varid, att_name.c_str(), result.data());
    check(BCAT_ERROR_LOCATION, stat);

    return result;
  } catch (RuntimeError &e) {
    e.add_context("reading double attribute '%s:%s' from '%s'",
                  var_name.c_str(), att_name.c_str(), m_impl->filename.c_str());
    throw;
  }
}

// Get a string attribute. In "string array" attributes array elements are concatenated using
// "," as the separator.
static std::string get_att_string(int ncid, int varid, const std::string &att_name) {
  size_t attlen = 0;
  int stat = nc_inq_attlen(ncid, varid, att_name.c_str(), &attlen);
  check(BCAT_ERROR_LOCATION, stat);

  std::vector<char*> buffer(attlen + 1, 0);
  stat = nc_get_att_string(ncid, varid, att_name.c_str(), buffer.data());
  check(BCAT_ERROR_LOCATION, stat);

  std::vector<std::string> strings(attlen);
  for (size_t k = 0; k < attlen; ++k) {
    strings[k] = buffer[k] != NULL ? buffer[k] : "";
  }

  stat = nc_free_string(attlen, buffer.data());
  check(BCAT_ERROR_LOCATION, stat);

  return join(strings, ",");
}

//! Returns an empty string if the attribute is not present.
std::string File::read_text_attribute(const std::string &var_name,
                                      const std::string &att_name) const {
  try {
    int varid = get_varid(var_name);

    nc_type nctype = NC_NAT;
    int stat = nc_inq_atttype(m_impl->ncid, varid, att_name.c_str(), &nctype);
    if (stat == NC_ENOTATT) {
      return "";
    }
    check(BCAT_ERROR_LOCATION, stat);

    if (nctype == NC_STRING) {
      return get_att_string(m_impl->ncid, varid, att_name);
    }

    if (nctype != NC_CHAR) {
      throw RuntimeError::formatted(BCAT_ERROR_LOCATION,
                                    "the attribute %s:%s is not a string",
                                    var_name.c_str(), att_name.c_str());
    }

    size_t attlen = 0;
    stat = nc_inq_attlen(m_impl->ncid, varid, att_name.c_str(), &attlen);
    check(BCAT_ERROR_LOCATION, stat);

    std::vector<char> buffer(attlen + 1, 0);
    stat = nc_get_att_text(m_impl->ncid, varid, att_name.c_str(), buffer.data());
    check(BCAT_ERROR_LOCATION, stat);

    return buffer.data();
  } catch (RuntimeError &e) {
    e.add_context("reading text attribute '%s:%s' from '%s'",
                  var_name.c_str(), att_name.c_str(), m_impl->filename.c_str());
    throw;
  }
}

//! Prepends `history` to the global "history" attribute.
void File::append_history(const std::string &history) const {
  std::string old_history = read_text_attribute("BCAT_GLOBAL", "history");
  write_attribute("BCAT_GLOBAL", "history", history + old_history);
}

} // end of namespace bcat
