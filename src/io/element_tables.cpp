#include <cstdlib>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <promol/core/log.h>
#include <promol/io/element_tables.h>
#include <stdexcept>
#include <string>

namespace promol::io {

void ElementTables::insert(int atomic_number, density::RadialTablePtr table) {
  if (!table) {
    throw std::invalid_argument(
        fmt::format("Null radial table for element {}", atomic_number));
  }
  m_tables[atomic_number] = std::move(table);
}

bool ElementTables::contains(int atomic_number) const {
  return m_tables.find(atomic_number) != m_tables.end();
}

const density::RadialTablePtr &ElementTables::at(int atomic_number) const {
  auto search = m_tables.find(atomic_number);
  if (search == m_tables.end()) {
    throw std::out_of_range(
        fmt::format("No radial table for element {}", atomic_number));
  }
  return search->second;
}

density::PromoleculeDensity
ElementTables::promolecule(Eigen::Ref<const IVec> atomic_numbers,
                           Eigen::Ref<const FMat3N> positions) const {
  if (atomic_numbers.rows() != positions.cols()) {
    throw std::invalid_argument(
        fmt::format("Number of atomic numbers ({}) does not match number of "
                    "positions ({})",
                    atomic_numbers.rows(), positions.cols()));
  }
  std::vector<density::RadialTablePtr> tables;
  tables.reserve(atomic_numbers.rows());
  for (Eigen::Index i = 0; i < atomic_numbers.rows(); i++) {
    tables.push_back(at(atomic_numbers(i)));
  }
  return density::PromoleculeDensity(positions, tables);
}

ElementTables ElementTables::from_json(const nlohmann::json &j) {
  if (!j.contains("domain") || !j.contains("tables")) {
    throw std::runtime_error(
        "Radial table data requires 'domain' and 'tables' entries");
  }
  if (!j.at("tables").is_object()) {
    throw std::runtime_error(
        "Radial table 'tables' entry must map element numbers to values");
  }
  std::vector<float> domain_values;
  try {
    domain_values = j.at("domain").get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(
        fmt::format("Invalid radial table domain: {}", e.what()));
  }
  FVec domain = Eigen::Map<const FVec>(domain_values.data(),
                                       domain_values.size());

  ElementTables result;
  for (const auto &item : j.at("tables").items()) {
    const std::string &key = item.key();
    int atomic_number{0};
    size_t pos{0};
    try {
      atomic_number = std::stoi(key, &pos);
    } catch (const std::logic_error &) {
      pos = 0;
    }
    if (pos == 0 || pos != key.size()) {
      throw std::runtime_error(
          fmt::format("Invalid element key '{}' in radial tables", key));
    }
    std::vector<float> values;
    try {
      values = item.value().get<std::vector<float>>();
    } catch (const nlohmann::json::exception &e) {
      throw std::runtime_error(fmt::format(
          "Invalid radial table for element {}: {}", atomic_number, e.what()));
    }
    FVec range = Eigen::Map<const FVec>(values.data(), values.size());
    try {
      result.insert(atomic_number,
                    density::make_radial_table(domain, range));
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error(fmt::format(
          "Invalid radial table for element {}: {}", atomic_number, e.what()));
    }
  }
  promol::log::debug("Loaded radial tables for {} elements ({} points each)",
                     result.size(), domain.size());
  return result;
}

ElementTables ElementTables::load(const std::string &filename) {
  namespace fs = std::filesystem;
  fs::path path(filename);
  if (!fs::exists(path)) {
    const char *data_path_env = std::getenv("PROMOL_DATA_PATH");
    if (data_path_env) {
      path = fs::path(data_path_env) / filename;
    }
  }
  if (!fs::exists(path)) {
    throw std::runtime_error("Could not locate radial table file " +
                             path.string());
  }
  std::ifstream in(path);
  if (!in.good()) {
    throw std::runtime_error("Could not read radial table file " +
                             path.string());
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error(fmt::format(
        "Failed to parse radial table file {}: {}", path.string(), e.what()));
  }
  promol::log::info("Loading radial tables from '{}'", path.string());
  return from_json(j);
}

} // namespace promol::io
