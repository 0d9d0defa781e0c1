#include "promol_test_utils.h"
#include <catch2/catch.hpp>
#include <cmath>
#include <memory>
#include <promol/core/parallel.h>
#include <promol/core/timings.h>
#include <promol/core/units.h>
#include <promol/sht/grid.h>
#include <promol/surface/sphere_radii.h>
#include <stdexcept>
#include <thread>

using promol::FMat3N;
using promol::Mat2N;
using promol::Vec;
using promol::Vec3;
using promol::density::PromoleculeDensity;
using promol::density::StockholderWeight;
using promol::surface::RayBracket;
using promol::testing::exponential_promolecule;

namespace {

// interior atom at the origin, exterior atom at (2, 0, 0): the w = 0.5
// surface is the plane x = 1
StockholderWeight two_atom_weight() {
  FMat3N b(3, 1);
  b << 2.0f, 0.0f, 0.0f;
  auto rho_a = std::make_shared<const PromoleculeDensity>(
      exponential_promolecule(FMat3N::Zero(3, 1)));
  auto rho_b = std::make_shared<const PromoleculeDensity>(
      exponential_promolecule(b));
  return StockholderWeight(rho_a, rho_b);
}

// directions that all cross the plane x = 1 within 5 Angstrom
Mat2N forward_grid() {
  const double thetas[] = {0.0, 0.5, -0.5, 1.0};
  const double phis[] = {promol::units::PI / 2, promol::units::PI / 3,
                         2 * promol::units::PI / 3, 1.0};
  Mat2N grid(2, 16);
  Eigen::Index idx = 0;
  for (double theta : thetas) {
    for (double phi : phis) {
      grid(0, idx) = theta;
      grid(1, idx) = phi;
      idx++;
    }
  }
  return grid;
}

RayBracket test_bracket() { return RayBracket{0.1, 5.0, 1e-6, 100}; }

bool identical(const Vec &a, const Vec &b) {
  return a.size() == b.size() && (a.array() == b.array()).all();
}

} // namespace

TEST_CASE("Stockholder radius along a single ray", "[radii]") {
  auto w = two_atom_weight();
  const Vec3 origin = Vec3::Zero();
  const Vec3 x_axis(1.0, 0.0, 0.0);

  auto root = promol::surface::find_stockholder_root(w, origin, x_axis,
                                                     test_bracket());
  REQUIRE(root.bracketed);
  REQUIRE(root.converged);
  REQUIRE(root.x == Approx(1.0).margin(1e-3));
  REQUIRE(std::abs(root.fx) < 1e-4);
  REQUIRE(promol::surface::stockholder_radius(w, origin, x_axis,
                                              test_bracket()) == root.x);

  SECTION("other isovalues") {
    // 1 / (1 + exp(r_a - r_b)) = 0.25 with r in bohr
    const double expected =
        1.0 + 0.5 * std::log(3.0) * promol::units::BOHR_TO_ANGSTROM;
    double r = promol::surface::stockholder_radius(w, origin, x_axis,
                                                   test_bracket(), 0.25);
    REQUIRE(r == Approx(expected).margin(1e-3));
  }

  SECTION("background density moves the surface inwards") {
    auto w_bg = two_atom_weight();
    w_bg.set_background_density(0.05f);
    double r = promol::surface::stockholder_radius(w_bg, origin, x_axis,
                                                   test_bracket());
    REQUIRE(r < root.x);
  }
}

TEST_CASE("Stockholder radii over a sphere", "[radii]") {
  auto w = two_atom_weight();
  Mat2N grid = forward_grid();
  auto result = promol::surface::sphere_stockholder_radii_detailed(
      w, Vec3::Zero(), grid, test_bracket());

  REQUIRE(result.size() == grid.cols());
  REQUIRE(result.num_unconverged() == 0);
  for (Eigen::Index i = 0; i < grid.cols(); i++) {
    Vec3 dir = promol::sht::direction(grid(0, i), grid(1, i));
    REQUIRE(result.radii(i) == Approx(1.0 / dir(0)).margin(1e-3));
  }

  Vec plain = promol::surface::sphere_stockholder_radii(w, Vec3::Zero(), grid,
                                                        test_bracket());
  REQUIRE(identical(plain, result.radii));

  Vec explicit_args = promol::surface::sphere_stockholder_radii(
      w, Vec3::Zero(), grid, 0.1, 5.0, 1e-6, 100);
  REQUIRE(identical(explicit_args, result.radii));
}

TEST_CASE("Sphere radii do not depend on grid order or threads", "[radii]") {
  auto w = two_atom_weight();
  Mat2N grid = promol::sht::spherical_grid(7);
  const Vec3 origin(-0.2, 0.1, 0.05);
  RayBracket bracket{0.1, 20.0, 1e-7, 30};

  promol::parallel::set_num_threads(1);
  Vec serial =
      promol::surface::sphere_stockholder_radii(w, origin, grid, bracket);

  promol::parallel::set_num_threads(4);
  Vec threaded =
      promol::surface::sphere_stockholder_radii(w, origin, grid, bracket);

  Mat2N reversed = grid.rowwise().reverse();
  Vec from_reversed =
      promol::surface::sphere_stockholder_radii(w, origin, reversed, bracket);
  promol::parallel::set_num_threads(1);

  const Eigen::Index n = grid.cols(), half = n / 2;
  Vec first = promol::surface::sphere_stockholder_radii(
      w, origin, grid.leftCols(half), bracket);
  Vec second = promol::surface::sphere_stockholder_radii(
      w, origin, grid.rightCols(n - half), bracket);
  Vec joined(n);
  joined << first, second;

  REQUIRE(identical(serial, threaded));
  REQUIRE(identical(serial, Vec(from_reversed.reverse())));
  REQUIRE(identical(serial, joined));
}

TEST_CASE("Concurrent sphere sampling", "[radii]") {
  auto w = two_atom_weight();
  Mat2N grid = forward_grid();
  const RayBracket bracket = test_bracket();
  Vec expected = promol::surface::sphere_stockholder_radii(w, Vec3::Zero(),
                                                           grid, bracket);

  promol::timing::clear_all();
  Vec a, b;
  std::thread first([&]() {
    a = promol::surface::sphere_stockholder_radii(w, Vec3::Zero(), grid,
                                                  bracket);
  });
  std::thread second([&]() {
    b = promol::surface::sphere_stockholder_radii(w, Vec3::Zero(), grid,
                                                  bracket);
  });
  first.join();
  second.join();

  REQUIRE(identical(a, expected));
  REQUIRE(identical(b, expected));
  // process timers are left to the driver
  REQUIRE(promol::timing::intervals(promol::timing::sampling) == 0);
}

TEST_CASE("Unconverged directions", "[radii]") {
  auto w = two_atom_weight();
  const Vec3 origin = Vec3::Zero();

  SECTION("no crossing inside the bracket") {
    // pointing away from the exterior atom, w > 0.5 everywhere
    auto root = promol::surface::find_stockholder_root(
        w, origin, Vec3(-1.0, 0.0, 0.0), test_bracket());
    REQUIRE_FALSE(root.bracketed);
    REQUIRE_FALSE(root.converged);
  }

  SECTION("iteration limit falls back to the upper bound") {
    RayBracket bracket{0.1, 5.0, 1e-12, 1};
    Vec3 x_axis(1.0, 0.0, 0.0);
    auto root =
        promol::surface::find_stockholder_root(w, origin, x_axis, bracket);
    REQUIRE_FALSE(root.converged);
    REQUIRE(root.x == 5.0);
    REQUIRE(promol::surface::stockholder_radius(w, origin, x_axis, bracket) ==
            5.0);
  }

  SECTION("counted over a sphere") {
    Mat2N grid(2, 2);
    grid << 0.0, promol::units::PI, promol::units::PI / 2,
        promol::units::PI / 2;
    auto result = promol::surface::sphere_stockholder_radii_detailed(
        w, origin, grid, test_bracket());
    REQUIRE(result.converged(0));
    REQUIRE_FALSE(result.converged(1));
    REQUIRE(result.num_unconverged() == 1);
  }
}

TEST_CASE("Ray bracket validation", "[radii]") {
  auto w = two_atom_weight();
  Mat2N grid = forward_grid();
  const Vec3 origin = Vec3::Zero();

  REQUIRE_NOTHROW(RayBracket{}.validate());
  REQUIRE_NOTHROW(promol::surface::promolecule_bracket().validate());
  REQUIRE_THROWS_AS(promol::surface::sphere_stockholder_radii(
                        w, origin, grid, 5.0, 0.1, 1e-6, 30),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(promol::surface::sphere_stockholder_radii(
                        w, origin, grid, 0.1, 5.0, 0.0, 30),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(promol::surface::sphere_stockholder_radii(
                        w, origin, grid, 0.1, 5.0, 1e-6, 0),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(promol::surface::sphere_stockholder_radii(
                        w, origin, grid, 0.1, INFINITY, 1e-6, 30),
                    std::invalid_argument);
}

TEST_CASE("Promolecule density radii", "[radii]") {
  auto rho = exponential_promolecule(FMat3N::Zero(3, 1));
  RayBracket bracket = promol::surface::promolecule_bracket();
  bracket.tolerance = 1e-6;
  bracket.max_iterations = 100;

  // exp(-r) = isovalue with r in bohr
  const double isovalue = 0.0002;
  const double expected = promol::units::angstroms(-std::log(isovalue));

  auto root = promol::surface::find_promolecule_root(
      rho, Vec3::Zero(), Vec3(0.0, 0.0, 1.0), bracket, isovalue);
  REQUIRE(root.converged);
  REQUIRE(root.x == Approx(expected).margin(1e-3));

  Mat2N grid = promol::sht::spherical_grid(5);
  auto result = promol::surface::sphere_promolecule_radii_detailed(
      rho, Vec3::Zero(), grid, bracket, isovalue);
  REQUIRE(result.num_unconverged() == 0);
  for (Eigen::Index i = 0; i < result.size(); i++) {
    REQUIRE(result.radii(i) == Approx(expected).margin(1e-3));
  }

  SECTION("offset origin") {
    // from (1, 0, 0) along +x the surface is 1 Angstrom closer
    double r = promol::surface::promolecule_radius(
        rho, Vec3(1.0, 0.0, 0.0), Vec3(1.0, 0.0, 0.0), bracket, isovalue);
    REQUIRE(r == Approx(expected - 1.0).margin(1e-3));
  }
}
