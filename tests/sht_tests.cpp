#include <catch2/catch.hpp>
#include <cmath>
#include <promol/core/units.h>
#include <promol/sht/grid.h>
#include <promol/sht/quadrature.h>
#include <stdexcept>

using promol::Mat2N;
using promol::Mat3N;
using promol::Vec;
using promol::units::PI;

TEST_CASE("Gauss-Legendre quadrature", "[quadrature]") {
  for (int n : {2, 8, 24}) {
    auto [roots, weights] = promol::sht::gauss_legendre_quadrature(n);
    REQUIRE(roots.size() == n);
    REQUIRE(weights.sum() == Approx(2.0));
    // exact for polynomials of degree < 2n
    REQUIRE(weights.dot(roots.array().square().matrix()) ==
            Approx(2.0 / 3.0));
    REQUIRE(std::abs(weights.dot(roots)) < 1e-12);
    REQUIRE((roots.array().abs() < 1.0).all());
  }
}

TEST_CASE("Smooth integer sizes", "[grid]") {
  using promol::sht::closest_int_with_only_prime_factors_up_to_fmax;
  REQUIRE(closest_int_with_only_prime_factors_up_to_fmax(7) == 7);
  REQUIRE(closest_int_with_only_prime_factors_up_to_fmax(11) == 12);
  REQUIRE(closest_int_with_only_prime_factors_up_to_fmax(35) == 36);
  REQUIRE(closest_int_with_only_prime_factors_up_to_fmax(37) == 40);
  REQUIRE(closest_int_with_only_prime_factors_up_to_fmax(63) == 64);
}

TEST_CASE("Spherical grid layout", "[grid]") {
  Mat2N grid = promol::sht::spherical_grid(17);
  // 36 azimuthal points x 24 polar points
  REQUIRE(grid.rows() == 2);
  REQUIRE(grid.cols() == 36 * 24);

  // polar index fastest
  REQUIRE(grid(0, 0) == 0.0);
  REQUIRE(grid(0, 23) == 0.0);
  REQUIRE(grid(0, 24) == Approx(2 * PI / 36));
  REQUIRE(grid(1, 0) == grid(1, 24));

  REQUIRE((grid.row(0).array() >= 0.0).all());
  REQUIRE((grid.row(0).array() < 2 * PI).all());
  REQUIRE((grid.row(1).array() > 0.0).all());
  REQUIRE((grid.row(1).array() < PI).all());

  Mat2N small = promol::sht::spherical_grid(3);
  REQUIRE(small.cols() == 7 * 8);
}

TEST_CASE("Equiangular grid", "[grid]") {
  Mat2N grid = promol::sht::equiangular_grid(4, 3);
  REQUIRE(grid.cols() == 12);
  REQUIRE(grid(1, 0) == Approx(PI / 6));
  REQUIRE(grid(1, 1) == Approx(PI / 2));
  REQUIRE(grid(1, 2) == Approx(5 * PI / 6));
  REQUIRE(grid(0, 3) == Approx(PI / 2));
  REQUIRE_THROWS_AS(promol::sht::equiangular_grid(0, 3),
                    std::invalid_argument);
}

TEST_CASE("Grid directions are unit vectors", "[grid]") {
  Mat2N grid = promol::sht::spherical_grid(8);
  Mat3N dirs = promol::sht::grid_directions(grid);
  REQUIRE(dirs.cols() == grid.cols());
  for (Eigen::Index i = 0; i < dirs.cols(); i++) {
    REQUIRE(dirs.col(i).norm() == Approx(1.0));
  }

  auto z = promol::sht::direction(1.3, 0.0);
  REQUIRE(z(2) == Approx(1.0));
  auto x = promol::sht::direction(0.0, PI / 2);
  REQUIRE(x(0) == Approx(1.0));
  auto y = promol::sht::direction(PI / 2, PI / 2);
  REQUIRE(y(1) == Approx(1.0));
}
