#pragma once
#include <cmath>
#include <promol/core/linear_algebra.h>
#include <promol/density/promolecule.h>
#include <utility>

namespace promol::testing {

// exp(-r) sampled evenly in log(r) over [1e-4, 40] bohr
inline std::pair<FVec, FVec> exponential_table(size_t n = 4096,
                                               float scale = 1.0f) {
  FVec domain(n), values(n);
  const double l = std::log(1e-4), u = std::log(40.0);
  for (size_t i = 0; i < n; i++) {
    double r = std::exp(l + i * (u - l) / (n - 1));
    domain(i) = static_cast<float>(r);
    values(i) = scale * static_cast<float>(std::exp(-r));
  }
  return {domain, values};
}

inline density::RadialTablePtr exponential_radial_table(size_t n = 4096,
                                                        float scale = 1.0f) {
  auto [domain, values] = exponential_table(n, scale);
  return density::make_radial_table(domain, values);
}

inline density::PromoleculeDensity
exponential_promolecule(const FMat3N &positions) {
  auto [domain, values] = exponential_table();
  return density::PromoleculeDensity::from_shared_table(positions, domain,
                                                        values);
}

} // namespace promol::testing
