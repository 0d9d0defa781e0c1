#include <cmath>
#include <fmt/core.h>
#include <promol/core/log.h>
#include <promol/core/units.h>
#include <promol/sht/quadrature.h>
#include <stdexcept>

namespace promol::sht {

namespace {

struct LegendreValue {
  double p;  // P_n(z)
  double dp; // P_n'(z)
};

// upward recurrence: l P_l = (2l - 1) z P_{l-1} - (l - 1) P_{l-2}
LegendreValue legendre(int n, double z) {
  double p_prev = 1.0, p = z;
  for (int l = 2; l <= n; l++) {
    const double p_next = ((2 * l - 1) * z * p - (l - 1) * p_prev) / l;
    p_prev = p;
    p = p_next;
  }
  return {p, n * (z * p - p_prev) / (z * z - 1.0)};
}

} // namespace

std::pair<Vec, Vec> gauss_legendre_quadrature(int N) {
  Vec roots(N), weights(N);
  gauss_legendre_quadrature(roots, weights, N);
  return {roots, weights};
}

void gauss_legendre_quadrature(Vec &roots, Vec &weights, int N) {
  if (N < 1) {
    throw std::invalid_argument(
        fmt::format("Gauss-Legendre quadrature requires N >= 1, found {}", N));
  }
  roots.resize(N);
  weights.resize(N);

  constexpr int max_newton_steps = 16;
  constexpr double eps = 1e-15;
  const int half = (N + 1) / 2;

  // roots are symmetric about zero: solve for the non-negative half,
  // in decreasing order, and mirror
  for (int i = 0; i < half; i++) {
    double z = std::cos(promol::units::PI * (i + 0.75) / (N + 0.5));
    LegendreValue v{};
    bool converged = false;
    for (int step = 0; step < max_newton_steps; step++) {
      v = legendre(N, z);
      const double dz = v.p / v.dp;
      z -= dz;
      if (std::abs(dz) < eps) {
        converged = true;
        break;
      }
    }
    if (!converged) {
      promol::log::warn("Gauss-Legendre root {} of order {} not converged", i,
                        N);
    }
    v = legendre(N, z);
    const double w = 2.0 / ((1.0 - z * z) * v.dp * v.dp);
    roots(i) = z;
    roots(N - 1 - i) = -z;
    weights(i) = w;
    weights(N - 1 - i) = w;
  }
  if (N % 2 == 1) {
    roots(N / 2) = 0.0;
  }
}

} // namespace promol::sht
