/* @file CatalogFactory.cpp
 * @brief name -> backend creator registry
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// VibeDJ headers
#include "catalog/CatalogFactory.hpp"
#include "catalog/CatalogIndex.hpp"

using namespace vibedj::catalog;

bool CatalogFactory::registerBackend(const std::string& name, Creator maker) {
  if (!maker)
    throw std::invalid_argument("[CatalogFactory] creator for '" + name + "' is empty");
  return creators_.emplace(name, std::move(maker)).second;
}

std::shared_ptr<CatalogIndex> CatalogFactory::create(const std::string& name) const {
  const auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[CatalogFactory] unknown catalog backend: " + name);
  return it->second();
}

std::vector<std::string> CatalogFactory::names() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [name, _] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}
