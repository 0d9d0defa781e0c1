#pragma once
#include <algorithm>
#include <cctype>
#include <promol/core/linear_algebra.h>
#include <string>

namespace promol::util {

/// Elementwise |a - b| <= atol + rtol * |b|, as numpy.allclose.
template <typename TA, typename TB>
bool all_close(const Eigen::DenseBase<TA> &a, const Eigen::DenseBase<TB> &b,
               const typename TA::RealScalar &rtol =
                   Eigen::NumTraits<typename TA::RealScalar>::dummy_precision(),
               const typename TA::RealScalar &atol =
                   Eigen::NumTraits<typename TA::RealScalar>::epsilon()) {
  if (a.rows() != b.rows() || a.cols() != b.cols())
    return false;
  const auto diff = (a.derived().array() - b.derived().array()).abs();
  return (diff <= atol + rtol * b.derived().array().abs()).all();
}

inline std::string to_lower_copy(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace promol::util
