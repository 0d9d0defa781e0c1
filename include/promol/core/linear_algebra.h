#pragma once
#include <Eigen/Dense>
#include <fmt/format.h>
#include <iterator>
#include <string>
#include <string_view>

namespace promol {

using MaskArray = Eigen::Array<bool, Eigen::Dynamic, 1>;

using Mat2N = Eigen::Matrix2Xd;
using Mat3N = Eigen::Matrix3Xd;

using FMat = Eigen::MatrixXf;
using FMat3N = Eigen::Matrix3Xf;

using Vec = Eigen::VectorXd;
using Vec3 = Eigen::Vector3d;

using FVec = Eigen::VectorXf;
using FVec3 = Eigen::Vector3f;

using IVec = Eigen::VectorXi;

/// Rows of matrix on separate lines, each value formatted with fmt_str.
/// Column vectors are written on one line.
template <typename Derived>
std::string format_matrix(const Eigen::DenseBase<Derived> &matrix,
                          std::string_view fmt_str = "{:12.5f}") {
  const auto &m = matrix.derived();
  const bool column_vector = m.cols() == 1;
  const Eigen::Index nr = column_vector ? 1 : m.rows();
  const Eigen::Index nc = column_vector ? m.rows() : m.cols();

  std::string result;
  auto out = std::back_inserter(result);
  for (Eigen::Index r = 0; r < nr; r++) {
    if (r > 0)
      result.push_back('\n');
    for (Eigen::Index c = 0; c < nc; c++) {
      if (c > 0)
        result.push_back(' ');
      fmt::format_to(out, fmt::runtime(fmt_str),
                     column_vector ? m(c, 0) : m(r, c));
    }
  }
  return result;
}

} // namespace promol
