#pragma once
#include <cmath>
#include <promol/core/linear_algebra.h>
#include <promol/core/macros.h>

namespace promol::sht {

/*
 * Angular grids are stored as 2 x N matrices: row 0 holds the azimuthal
 * angle theta in [0, 2pi), row 1 the polar angle phi in [0, pi].
 */

/// Grid for a spherical harmonic transform with band limit lmax:
/// Gauss-Legendre polar nodes, equispaced azimuths, polar index fastest.
Mat2N spherical_grid(size_t lmax);

/// Midpoint grid in the polar angle, equispaced azimuths.
Mat2N equiangular_grid(size_t n_azimuth, size_t n_polar);

/// Smallest integer >= n with no prime factors above fmax.
int closest_int_with_only_prime_factors_up_to_fmax(int n, int fmax = 7);

PROMOL_ALWAYS_INLINE Vec3 direction(double theta, double phi) {
  const double sin_phi = std::sin(phi);
  return Vec3(sin_phi * std::cos(theta), sin_phi * std::sin(theta),
              std::cos(phi));
}

/// Unit vectors for each (theta, phi) column of grid.
Mat3N grid_directions(Eigen::Ref<const Mat2N> grid);

} // namespace promol::sht
