#include <fmt/core.h>
#include <promol/core/log.h>
#include <promol/core/units.h>
#include <promol/sht/grid.h>
#include <promol/sht/quadrature.h>
#include <stdexcept>

namespace promol::sht {

namespace {
int next_power_of_2(int n) {
  int i = 1;
  while (i < n)
    i *= 2;
  return i;
}

bool has_only_prime_factors_up_to(int n, int fmax) {
  for (int p = 2; p <= fmax && n > 1; p++) {
    while (n % p == 0)
      n /= p;
  }
  return n == 1;
}
} // namespace

int closest_int_with_only_prime_factors_up_to_fmax(int n, int fmax) {
  if (n <= fmax)
    return n;
  if (fmax < 2)
    return 0;
  if (fmax == 2)
    return next_power_of_2(n);

  // even sizes only
  int m = n + (n & 1);
  while (!has_only_prime_factors_up_to(m, fmax))
    m += 2;

  // a power of 2 within 3% is preferred
  const int p2 = next_power_of_2(m);
  return ((p2 - m) * 33 < m) ? p2 : m;
}

Mat2N spherical_grid(size_t lmax) {
  const int n_azimuth =
      closest_int_with_only_prime_factors_up_to_fmax(2 * lmax + 1);
  int n_polar = static_cast<int>(lmax) + 1;
  n_polar += (n_polar & 1);
  n_polar = ((n_polar + 7) / 8) * 8;

  Vec cos_phi = gauss_legendre_quadrature(n_polar).first;

  Mat2N grid(2, n_azimuth * n_polar);
  Eigen::Index idx = 0;
  for (int i = 0; i < n_azimuth; i++) {
    const double theta = (2 * promol::units::PI * i) / n_azimuth;
    for (int j = 0; j < n_polar; j++) {
      grid(0, idx) = theta;
      grid(1, idx) = std::acos(cos_phi(j));
      idx++;
    }
  }
  promol::log::debug("Spherical grid for lmax = {}: {} x {} = {} points", lmax,
                     n_azimuth, n_polar, grid.cols());
  return grid;
}

Mat2N equiangular_grid(size_t n_azimuth, size_t n_polar) {
  if (n_azimuth == 0 || n_polar == 0) {
    throw std::invalid_argument(
        fmt::format("Invalid angular grid dimensions: {} x {}", n_azimuth,
                    n_polar));
  }
  Mat2N grid(2, n_azimuth * n_polar);
  Eigen::Index idx = 0;
  for (size_t i = 0; i < n_azimuth; i++) {
    const double theta = (2 * promol::units::PI * i) / n_azimuth;
    for (size_t j = 0; j < n_polar; j++) {
      grid(0, idx) = theta;
      grid(1, idx) = promol::units::PI * (j + 0.5) / n_polar;
      idx++;
    }
  }
  return grid;
}

Mat3N grid_directions(Eigen::Ref<const Mat2N> grid) {
  Mat3N result(3, grid.cols());
  for (Eigen::Index i = 0; i < grid.cols(); i++) {
    result.col(i) = direction(grid(0, i), grid(1, i));
  }
  return result;
}

} // namespace promol::sht
