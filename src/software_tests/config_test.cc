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

#include <cstdio>
#include <mpi.h>
#include <string>

#include "bcat/software_tests/bcat_tests.hh"
#include "bcat/util/Config.hh"
#include "bcat/util/ConfigJSON.hh"
#include "bcat/util/Context.hh"
#include "bcat/util/Logger.hh"
#include "bcat/util/Units.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"

using namespace bcat;

static void write_file(const std::string &filename, const std::string &text) {
  FILE *f = fopen(filename.c_str(), "w");
  if (f == NULL) {
    throw RuntimeError::formatted(BCAT_ERROR_LOCATION, "failed to open %s", filename.c_str());
  }
  fprintf(f, "%s", text.c_str());
  fclose(f);
}

static void test_defaults(test::Checks &check) {
  units::System::Ptr sys(new units::System);
  auto config = config_from_file(sys, "");

  check(config->get_string("bias_correction.method") == "quantile_mapping", "default method");
  check(config->get_string("bias_correction.time_unit") == "auto", "default time unit");
  check(config->get_number("bias_correction.window") == 15.0, "default window");
  check.close(config->get_number("bias_correction.window", "hours"), 360.0, 1e-9,
              "window in hours");
  check(config->get_number("bias_correction.sdm.relative.min_samplesize") == 10.0,
        "default min_samplesize");
  check(config->get_number("bias_correction.sdm.absolute.cdf_threshold") == 0.99999,
        "default absolute cdf_threshold");
  check(config->get_number("bias_correction.sdm.relative.cdf_threshold") == 0.99999999,
        "default relative cdf_threshold");
  check(not config->get_flag("bias_correction.save_regridded"), "default save_regridded");
  check(config->get_string("output.directory") == ".", "default output directory");

  check(config->type("bias_correction.window") == "integer", "parameter type");
  check(config->units("bias_correction.window") == "days", "parameter units");
  check(not config->doc("bias_correction.method").empty(), "parameter documentation");

  check(test::throws([&config]() { config->get_number("bias_correction.nonexistent"); }),
        "missing parameter");
  check(test::throws([&config]() { config->get_flag("bias_correction.method"); }),
        "a string is not a flag");

  config->set_string("bias_correction.method", "delta_change");
  check(test::throws([&config]() { config->get_string("bias_correction.method"); }),
        "invalid keyword");

  config->set_number("bias_correction.window", 2.5);
  check(test::throws([&config]() { config->get_number("bias_correction.window"); }),
        "non-integer value of an integer parameter");

  check(test::throws([&config]() { config->set_number("nonexistent.window", 1.0); }),
        "setting a parameter in a missing group");
}

static void test_json_storage(test::Checks &check) {
  units::System::Ptr sys(new units::System);

  ConfigJSON config(sys);
  config.load_string("{\"a\": {\"b\": 1, \"c\": \"text\", \"d\": {\"e\": true}}}");

  check(config.all_doubles().size() == 1, "one number");
  check(config.all_strings().size() == 1, "one string");
  check(config.all_flags().size() == 1, "one flag");
  check(config.keys().count("a.d.e") == 1, "nested flag name");
  check(config.get_number("a.b") == 1.0, "integers are read as numbers");
  check(config.is_set("a.d") and not config.is_set("a.x"), "is_set");

  config.set_string("a.d.f", "new");
  check(config.get_string("a.d.f") == "new", "adding a parameter to an existing group");

  check(test::throws([&config]() { config.get_string("a.b"); }), "a number is not a string");
  check(test::throws([&config]() { config.load_string("[1, 2]"); }),
        "a JSON array is not a configuration");
  check(config.get_number("a.b") == 1.0, "a failed load keeps the old contents");
}

static void test_overrides(test::Checks &check, MPI_Comm com) {
  units::System::Ptr sys(new units::System);

  const std::string filename = "config_test_override.json";
  write_file(filename,
             "{\n"
             "  \"bias_correction\": {\n"
             "    \"window\": 5,\n"
             "    \"method\": \"scaled_distribution_mapping\",\n"
             "    \"save_regridded\": true\n"
             "  },\n"
             "  \"output\": {\"directory\": \"out\", \"runtime\": {\"verbosity\": 1}}\n"
             "}\n");

  auto config = config_from_file(sys, filename);

  check(config->get_number("bias_correction.window") == 5.0, "window override");
  check(config->get_string("bias_correction.method") == "scaled_distribution_mapping",
        "method override");
  check(config->get_flag("bias_correction.save_regridded"), "flag override");
  check(config->get_string("bias_correction.time_unit") == "auto", "default value is kept");

  check(member(std::string("bias_correction.window"), config->parameters_set_by_user()),
        "parameters set by user");

  config->set_number("bias_correction.window", 7.0, CONFIG_DEFAULT);
  check(config->get_number("bias_correction.window") == 5.0,
        "a default does not replace a value set by user");

  StringLogger log(com, 2);
  print_unused_parameters(log, 1, *config);
  check(log.get().find("output.directory") != std::string::npos,
        "unused parameter is reported: '%s'", log.get().c_str());
  check(log.get().find("bias_correction.window") == std::string::npos,
        "used parameter is not reported");

  auto ctx = context_from_file(com, filename);
  check(ctx->log()->get_threshold() == 1, "verbosity from the configuration file");
  check(ctx->config()->get_string("output.directory") == "out", "context configuration");
  check(ctx->rank() == 0 or ctx->size() > 1, "context rank and size");

  write_file(filename, "{\"bias_correction\": {\"windw\": 5}}\n");
  check(test::throws([sys, &filename]() { config_from_file(sys, filename); }),
        "unrecognized parameter");

  write_file(filename, "{\"bias_correction\": {\"window\": }\n");
  check(test::throws([sys, &filename]() { config_from_file(sys, filename); }),
        "malformed configuration file");

  check(test::throws([sys]() { config_from_file(sys, "no_such_file.json"); }),
        "missing configuration file");

  remove(filename.c_str());
}

int main(int argc, char *argv[]) {
  MPI_Init(&argc, &argv);

  MPI_Comm com = MPI_COMM_WORLD;
  test::Checks check("config_test");

  try {
    test_defaults(check);
    test_json_storage(check);
    test_overrides(check, com);
  } catch (...) {
    handle_fatal_errors(com);
    check.failure();
  }

  MPI_Finalize();

  return check.report();
}
