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

static char help[] =
  "Bias correction of climate model output.\n"
  "usage: bcat PARAMETERS.json\n"
  "  PARAMETERS.json is a JSON file overriding default configuration parameters.\n";

#include <cstdio>
#include <memory>

#include <mpi.h>
#include <gsl/gsl_errno.h>

#include "bcat/correction/BiasCorrector.hh"
#include "bcat/util/Config.hh"
#include "bcat/util/Context.hh"
#include "bcat/util/Logger.hh"
#include "bcat/util/bcat_utilities.hh"
#include "bcat/util/error_handling.hh"

using namespace bcat;

int main(int argc, char *argv[]) {

  MPI_Init(&argc, &argv);
  MPI_Comm com = MPI_COMM_WORLD;

  // errors are reported using return codes and checked by the caller
  gsl_set_error_handler_off();

  int exit_code = 0;
  try {
    if (argc != 2) {
      int rank = 0;
      MPI_Comm_rank(com, &rank);
      if (rank == 0) {
        fprintf(stderr, "%s", help);
      }
      exit_code = 1;
    } else {
      std::shared_ptr<Context> ctx = context_from_file(com, argv[1], true);

      Logger::Ptr log = ctx->log();

      log->message(2, "%s\n", version().c_str());

      BiasCorrector::Ptr corrector = bias_corrector_from_config(ctx);

      auto files = corrector->run();

      int n_files = GlobalSum(com, static_cast<int>(files.size()));
      log->message(2, "... done (%d files written)\n", n_files);

      print_unused_parameters(*log, 3, *ctx->config());
    }
  } catch (...) {
    handle_fatal_errors(com);
    exit_code = 1;
  }

  MPI_Finalize();

  return exit_code;
}
