#include "categories.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

std::string read_categories(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open categories file: " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

std::vector<std::string> category_names(const std::string& document) {
  json j;
  try {
    j = json::parse(document);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("categories: invalid json: ") + e.what());
  }

  std::vector<std::string> names;
  if (j.is_array()) {
    for (auto& v : j) {
      if (!v.is_string()) throw std::runtime_error("categories: array entries must be strings");
      names.push_back(v.get<std::string>());
    }
  } else if (j.is_object()) {
    for (auto it = j.begin(); it != j.end(); ++it) names.push_back(it.key());
  } else {
    throw std::runtime_error("categories: expected an array or an object");
  }
  return names;
}
