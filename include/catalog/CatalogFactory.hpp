#pragma once
/** @file  CatalogFactory.hpp
 *  @brief Runtime registry that maps catalog backend names to creators.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace vibedj::catalog {

  class CatalogIndex;

  /**
 * @class CatalogFactory
 * @brief Register & instantiate catalog backends by string key ("memory", "sqlite").
 *
 *  * Keeps the composition root decoupled from concrete backends.
 *  * Creators are lambdas returning `shared_ptr<CatalogIndex>`.
 */
  class CatalogFactory {
  public:
    using Creator = std::function<std::shared_ptr<CatalogIndex>()>;

    /// Register a backend under \p name.  Returns false on duplicate.
    bool registerBackend(const std::string& name, Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::shared_ptr<CatalogIndex> create(const std::string& name) const;

    /// Registered names, sorted.
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace vibedj::catalog
