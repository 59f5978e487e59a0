/* @file ConfigLoader.cpp
 * @brief read + parse the JSON config file
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// third-party headers
#include <nlohmann/json.hpp>

// VibeDJ headers
#include "core/ConfigLoader.hpp"

using namespace vibedj::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {
  if (path_.empty())
    throw std::invalid_argument("[ConfigLoader] empty config path");
}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
  if (!j.is_object())
    throw std::runtime_error("[ConfigLoader] " + path_ + ": top level is not an object");
  return j;
}
