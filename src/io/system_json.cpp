#include <array>
#include <fmt/core.h>
#include <fstream>
#include <promol/core/log.h>
#include <promol/io/system_json.h>
#include <stdexcept>
#include <vector>

namespace promol::io {

namespace {

FMat3N positions_from_json(const nlohmann::json &j) {
  auto positions = j.get<std::vector<std::array<float, 3>>>();
  FMat3N result(3, positions.size());
  for (size_t i = 0; i < positions.size(); i++) {
    result.col(i) = FVec3(positions[i][0], positions[i][1], positions[i][2]);
  }
  return result;
}

nlohmann::json positions_to_json(const FMat3N &positions) {
  nlohmann::json result = nlohmann::json::array();
  for (Eigen::Index i = 0; i < positions.cols(); i++) {
    result.push_back(
        {positions(0, i), positions(1, i), positions(2, i)});
  }
  return result;
}

} // namespace

void from_json(const nlohmann::json &j, Fragment &frag) {
  if (!j.contains("elements") || !j.contains("positions")) {
    throw std::runtime_error(
        "Fragment requires 'elements' and 'positions' entries");
  }
  std::vector<int> elements;
  try {
    elements = j.at("elements").get<std::vector<int>>();
    frag.positions = positions_from_json(j.at("positions"));
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(
        fmt::format("Invalid fragment entry: {}", e.what()));
  }
  frag.atomic_numbers =
      Eigen::Map<const IVec>(elements.data(), elements.size());
  if (frag.positions.cols() != frag.atomic_numbers.rows()) {
    throw std::runtime_error(fmt::format(
        "Fragment has {} elements but {} positions",
        frag.atomic_numbers.rows(), frag.positions.cols()));
  }
}

void to_json(nlohmann::json &j, const Fragment &frag) {
  j["elements"] = std::vector<int>(frag.atomic_numbers.data(),
                                   frag.atomic_numbers.data() +
                                       frag.atomic_numbers.size());
  j["positions"] = positions_to_json(frag.positions);
}

SystemInput system_input_from_json(const nlohmann::json &j) {
  SystemInput input;
  if (!j.contains("interior")) {
    throw std::runtime_error("Input requires an 'interior' fragment");
  }
  input.interior = j.at("interior").get<Fragment>();
  if (j.contains("exterior")) {
    input.exterior = j.at("exterior").get<Fragment>();
  }
  try {
    if (j.contains("origin")) {
      auto o = j.at("origin").get<std::array<double, 3>>();
      input.origin = Vec3(o[0], o[1], o[2]);
    }
    if (j.contains("points")) {
      input.points = positions_from_json(j.at("points"));
    }
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(
        fmt::format("Invalid 'origin' or 'points' entry: {}", e.what()));
  }
  return input;
}

SystemInput load_system_input(const std::string &filename) {
  std::ifstream in(filename);
  if (!in.good()) {
    throw std::runtime_error("Could not read input file " + filename);
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error(
        fmt::format("Failed to parse input file {}: {}", filename, e.what()));
  }
  auto input = system_input_from_json(j);
  promol::log::info("Read input '{}': {} interior atoms, {} exterior atoms",
                    filename, input.interior.size(),
                    input.exterior ? input.exterior->size() : 0);
  return input;
}

nlohmann::json radii_to_json(Eigen::Ref<const Mat2N> grid,
                             const surface::SphereRadii &radii,
                             const Vec3 &origin) {
  if (grid.cols() != radii.size() ||
      radii.converged.size() != radii.size()) {
    throw std::invalid_argument(fmt::format(
        "Radii output size mismatch: {} directions, {} radii, {} flags",
        grid.cols(), radii.size(), radii.converged.size()));
  }
  nlohmann::json j;
  j["origin"] = {origin(0), origin(1), origin(2)};
  nlohmann::json grid_json = nlohmann::json::array();
  nlohmann::json radii_json = nlohmann::json::array();
  nlohmann::json converged_json = nlohmann::json::array();
  for (Eigen::Index i = 0; i < grid.cols(); i++) {
    grid_json.push_back({grid(0, i), grid(1, i)});
    radii_json.push_back(radii.radii(i));
    converged_json.push_back(static_cast<bool>(radii.converged(i)));
  }
  j["grid"] = grid_json;
  j["radii"] = radii_json;
  j["converged"] = converged_json;
  return j;
}

void write_json(const std::string &filename, const nlohmann::json &j) {
  std::ofstream out(filename);
  if (!out.good()) {
    throw std::runtime_error("Could not open output file " + filename);
  }
  out << j.dump(2) << '\n';
  promol::log::info("Wrote '{}'", filename);
}

} // namespace promol::io
