#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <promol/core/linear_algebra.h>
#include <promol/surface/sphere_radii.h>
#include <string>

namespace promol::io {

/// Atomic numbers and positions (Angstrom) for one fragment.
struct Fragment {
  IVec atomic_numbers;
  FMat3N positions;

  inline Eigen::Index size() const { return atomic_numbers.rows(); }
};

/*
 * {
 *   "interior": {"elements": [6, 1, ...], "positions": [[x, y, z], ...]},
 *   "exterior": {...},          optional
 *   "origin": [x, y, z],        optional, defaults to interior centroid
 *   "points": [[x, y, z], ...]  optional, for point evaluation
 * }
 */
struct SystemInput {
  Fragment interior;
  std::optional<Fragment> exterior;
  std::optional<Vec3> origin;
  FMat3N points;
};

void from_json(const nlohmann::json &j, Fragment &);
void to_json(nlohmann::json &j, const Fragment &);

SystemInput system_input_from_json(const nlohmann::json &j);
SystemInput load_system_input(const std::string &filename);

nlohmann::json radii_to_json(Eigen::Ref<const Mat2N> grid,
                             const surface::SphereRadii &radii,
                             const Vec3 &origin);

void write_json(const std::string &filename, const nlohmann::json &j);

} // namespace promol::io
