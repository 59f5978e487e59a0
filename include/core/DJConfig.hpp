#pragma once
/** @file  DJConfig.hpp
 *  @brief Typed, validated view of the JSON configuration.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// third-party headers
#include <nlohmann/json_fwd.hpp>

// VibeDJ headers
#include "catalog/ShortlistSampler.hpp"
#include "catalog/SqliteCatalog.hpp"
#include "core/DJCoordinator.hpp"
#include "core/VibePlanner.hpp"
#include "history/CooldownScorer.hpp"

namespace vibedj::core {

  struct CatalogConfig {
    std::string backend{ "sqlite" }; ///< name registered in CatalogFactory
    std::string csvPath;             ///< memory: loaded at start; sqlite: imported when the table is empty
    catalog::SqliteCatalogSettings sqlite;
  };

  struct EndpointConfig {
    std::string host{ "127.0.0.1" };
    std::uint16_t port{ 0 };
  };

  struct OracleConfig {
    EndpointConfig endpoint{ "127.0.0.1", 8766 };
    std::chrono::milliseconds timeout{ 60000 };
  };

  struct LoggingConfig {
    std::string level{ "info" };
    std::string journalPath; ///< empty disables the pick journal
  };

  /**
 * @struct DJConfig
 * @brief Every key is optional; missing keys keep the defaults below.
 *
 *  Wrong types and out-of-range values throw `ConfigError` naming the offending key.
 */
  struct DJConfig {
    std::string databasePath{ "vibedj.db" };
    std::string contextPath{ "context.json" };
    std::optional<std::uint32_t> selectorSeed; ///< fixed seed for reproducible runs
    CatalogConfig catalog;
    catalog::SamplerSettings sampling;
    CoordinatorSettings coordinator;
    PlannerSettings planner;
    history::CooldownPolicy cooldown;
    EndpointConfig player{ "127.0.0.1", 8765 };
    OracleConfig oracle;
    LoggingConfig logging;

    static DJConfig fromJson(const nlohmann::json& j);
  };

} // namespace vibedj::core
