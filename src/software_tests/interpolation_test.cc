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

#include <cmath>
#include <limits>
#include <mpi.h>
#include <vector>

#include "bcat/software_tests/bcat_tests.hh"
#include "bcat/correction/Regridder.hh"
#include "bcat/util/GriddedTimeSeries.hh"
#include "bcat/util/error_handling.hh"
#include "bcat/util/interpolation.hh"

using namespace bcat;

static void test_interpolation(test::Checks &check) {
  std::vector<double> x = {0.0, 1.0, 2.0}, values = {0.0, 10.0, 20.0};

  Interpolation linear(LINEAR, x, {-1.0, 0.5, 2.0, 3.0});
  check(linear.left() == std::vector<int>({0, 0, 2, 2}), "linear: left indexes");
  check(linear.alpha() == std::vector<double>({0.0, 0.5, 0.0, 0.0}), "linear: weights");
  check(linear.interpolate(values) == std::vector<double>({0.0, 5.0, 20.0, 20.0}),
        "linear: constant extrapolation");

  Interpolation nearest(NEAREST, x, {0.4, 0.6, 1.9});
  check(nearest.interpolate(values) == std::vector<double>({0.0, 10.0, 20.0}), "nearest");

  Interpolation single(LINEAR, {5.0}, {0.0, 10.0});
  check(single.interpolate({7.0}) == std::vector<double>({7.0, 7.0}), "one-point input grid");

  check(test::throws([]() { Interpolation I(LINEAR, {2.0, 1.0}, {1.5}); }),
        "decreasing input grid");
  check(test::throws([]() { Interpolation I(LINEAR, {}, {1.5}); }), "empty input grid");

  check(interpolation_type("linear") == LINEAR, "interpolation_type(linear)");
  check(interpolation_type("nearest") == NEAREST, "interpolation_type(nearest)");
  check(test::throws([]() { interpolation_type("cubic"); }), "interpolation_type(cubic)");
}

static void test_rank_interpolation(test::Checks &check) {
  check(linspace(0.0, 1.0, 5) == std::vector<double>({0.0, 0.25, 0.5, 0.75, 1.0}), "linspace");
  check(linspace(3.0, 7.0, 1) == std::vector<double>({3.0}), "linspace (one point)");

  auto stretched = interpolate_by_rank({1.0, 2.0, 3.0}, 5);
  auto expected  = std::vector<double>({1.0, 1.5, 2.0, 2.5, 3.0});
  for (size_t k = 0; k < expected.size(); ++k) {
    check.close(stretched[k], expected[k], 1e-12, "stretch");
  }

  auto shrunk = interpolate_by_rank({0.0, 1.0, 2.0, 3.0, 4.0}, 3);
  check(shrunk == std::vector<double>({0.0, 2.0, 4.0}), "shrink");

  check(interpolate_by_rank({7.0}, 3) == std::vector<double>({7.0, 7.0, 7.0}),
        "one value");
  check(interpolate_by_rank({1.0, 2.0}, 0).empty(), "zero points");
  check(test::throws([]() { interpolate_by_rank({}, 3); }), "empty sample");
}

static Axis axis(const std::string &name, const std::vector<double> &values) {
  Axis result;
  result.name          = name;
  result.standard_name = (name == "x") ? "projection_x_coordinate" : "projection_y_coordinate";
  result.units         = "km";
  result.values        = values;
  return result;
}

static GriddedTimeSeries field(units::System::Ptr sys, const Axis &y, const Axis &x) {
  VariableMetadata metadata;
  metadata.name  = "tas";
  metadata.units = "K";

  TimeUnits time_units(sys, "days since 2000-01-01", Calendar("standard"));

  GriddedTimeSeries result(metadata, time_units, {0.0, 1.0}, y, x);

  for (size_t j = 0; j < result.ny(); ++j) {
    for (size_t i = 0; i < result.nx(); ++i) {
      double Y = y.values[j], X = x.values[i];
      result(0, j, i) = 10.0 * Y + X;
      result(1, j, i) = 2.0 * X;
    }
  }
  return result;
}

static void test_regridder(test::Checks &check) {
  units::System::Ptr sys(new units::System);

  Axis
    y  = axis("y", {0.0, 1.0}),
    x  = axis("x", {0.0, 1.0, 2.0}),
    ty = axis("y", {0.5}),
    tx = axis("x", {0.5, 1.5});

  auto source = field(sys, y, x);

  {
    Regridder R(LINEAR, y, x, ty, tx);
    check(not R.identity(), "not an identity");

    auto result = R.apply(source);
    check(result.ny() == 1 and result.nx() == 2 and result.n_time() == 2, "regridded shape");
    check.close(result(0, 0, 0), 5.5, 1e-12, "bilinear (0, 0, 0)");
    check.close(result(0, 0, 1), 6.5, 1e-12, "bilinear (0, 0, 1)");
    check.close(result(1, 0, 1), 3.0, 1e-12, "bilinear (1, 0, 1)");

    check(test::throws([&R, &result]() { R.apply(result); }), "wrong source grid");
  }

  // decreasing source coordinates
  {
    Axis yd = axis("y", {1.0, 0.0});
    auto flipped = field(sys, yd, x);

    Regridder R(LINEAR, yd, x, ty, tx);
    auto result = R.apply(flipped);
    check.close(result(0, 0, 0), 5.5, 1e-12, "decreasing y (0, 0, 0)");
    check.close(result(0, 0, 1), 6.5, 1e-12, "decreasing y (0, 0, 1)");
  }

  // nearest neighbor
  {
    Regridder R(NEAREST, y, x, axis("y", {0.9}), axis("x", {0.4, 1.6}));
    auto result = R.apply(source);
    check(result(0, 0, 0) == 10.0 and result(0, 0, 1) == 12.0, "nearest neighbor");
  }

  // missing values do not spread to target points that coincide with source points
  {
    auto with_gap = source;
    with_gap(0, 0, 0) = std::numeric_limits<double>::quiet_NaN();

    Regridder R(LINEAR, y, x, axis("y", {0.0, 1.0}), axis("x", {1.0, 2.0}));
    auto result = R.apply(with_gap);
    check(result(0, 0, 0) == 1.0 and result(0, 1, 1) == 12.0, "missing value does not spread");
  }

  // the same grid
  {
    Regridder R(LINEAR, y, x, y, x);
    check(R.identity(), "identity");
    auto result = R.apply(source);
    check(result.values() == source.values(), "identity: values");
  }
}

static void test_regridder_cache(test::Checks &check) {
  units::System::Ptr sys(new units::System);

  Axis
    y = axis("y", {0.0, 1.0}),
    x = axis("x", {0.0, 1.0, 2.0});

  auto source = field(sys, y, x);
  auto target = field(sys, axis("y", {0.5}), axis("x", {0.5, 1.5}));
  auto other  = field(sys, axis("y", {0.25}), axis("x", {0.25, 1.75}));

  RegridderCache cache(LINEAR);

  auto r1 = cache.get(source, target);
  auto r2 = cache.get(source, target);
  check(r1 == r2 and cache.n_built() == 1, "cache: reuse");

  auto r3 = cache.get(source, other);
  check(r3 != r1 and cache.n_built() == 2, "cache: different coordinates, same shape");
  check(r3->maps(y, x, other.y(), other.x()), "cache: maps()");

  cache.get(source, source);
  check(cache.n_built() == 3, "cache: a different shape");
}

static void test_gridded_time_series(test::Checks &check) {
  units::System::Ptr sys(new units::System);

  Axis
    y = axis("y", {0.0, 1.0}),
    x = axis("x", {0.0, 1.0, 2.0});

  auto a = field(sys, y, x);

  check(a.dates()[1] == Date({2000, 1, 2}), "dates");
  check(a.cell(1, 2) == std::vector<double>({12.0, 4.0}), "cell series");

  a.set_cell(0, 0, {-1.0, -2.0});
  check(a(1, 0, 0) == -2.0, "set_cell");
  check(test::throws([&a]() { a.set_cell(0, 0, {1.0}); }), "set_cell: wrong length");

  auto s = a.subset({1});
  check(s.n_time() == 1 and s(0, 1, 2) == 4.0, "subset");

  // the next two days, in different time units
  VariableMetadata metadata = a.metadata();
  TimeUnits hours(sys, "hours since 2000-01-03", Calendar("standard"));
  GriddedTimeSeries b(metadata, hours, {0.0, 24.0}, y, x);
  a.append(b);
  check(a.n_time() == 4, "append: number of records");
  check.close(a.time()[3], 3.0, 1e-9, "append: time");
  check(a.dates()[3] == Date({2000, 1, 4}), "append: dates");

  check(test::throws([&a, &b]() { a.append(b); }), "append: overlapping times");

  GriddedTimeSeries c(metadata, TimeUnits(sys, "days since 2000-01-01", Calendar("noleap")),
                      {10.0}, y, x);
  check(test::throws([&a, &c]() { a.append(c); }), "append: different calendars");

  a(0, 1, 1) = std::numeric_limits<double>::quiet_NaN();
  auto mask = a.mask_from_first_record();
  check(mask.defined() and mask.masked(1, 1) and mask.n_masked() == 1, "mask");
  check(not CellMask().defined() and not CellMask().masked(0, 0), "undefined mask");

  a.convert_units(sys, "degC");
  check.close(a(1, 0, 0), -2.0 - 273.15, 1e-9, "convert_units");
  check(a.metadata().units == "degC", "convert_units: metadata");
  check(test::throws([&a, sys]() { a.convert_units(sys, "m"); }), "convert_units: kelvin to m");
}

int main(int argc, char *argv[]) {
  MPI_Init(&argc, &argv);

  MPI_Comm com = MPI_COMM_WORLD;
  test::Checks check("interpolation_test");

  try {
    test_interpolation(check);
    test_rank_interpolation(check);
    test_regridder(check);
    test_regridder_cache(check);
    test_gridded_time_series(check);
  } catch (...) {
    handle_fatal_errors(com);
    check.failure();
  }

  MPI_Finalize();

  return check.report();
}
