// VibeDJ-Prod headers
#include "core/ConfigLoader.hpp"
#include "core/DJConfig.hpp"
#include "core/Errors.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace vibedj::test {

  using core::ConfigError;
  using core::DJConfig;
  using nlohmann::json;

  TEST(DJConfig, EmptyObjectKeepsDefaults) {
    const auto cfg = DJConfig::fromJson(json::object());
    EXPECT_EQ(cfg.databasePath, "vibedj.db");
    EXPECT_EQ(cfg.catalog.backend, "sqlite");
    EXPECT_EQ(cfg.catalog.sqlite.table, "music_tracks_spotify");
    EXPECT_EQ(cfg.sampling.matchPoolSize, 100u);
    EXPECT_EQ(cfg.coordinator.pickDebounce, std::chrono::seconds(5));
    EXPECT_EQ(cfg.coordinator.maxFromShortlist, 5u);
    EXPECT_EQ(cfg.coordinator.totalCandidates, 10u);
    EXPECT_EQ(cfg.player.port, 8765);
    EXPECT_EQ(cfg.oracle.endpoint.port, 8766);
    EXPECT_EQ(cfg.oracle.timeout, std::chrono::milliseconds(60000));
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_TRUE(cfg.logging.journalPath.empty());
    EXPECT_FALSE(cfg.selectorSeed);
  }

  TEST(DJConfig, OverridesAreApplied) {
    const auto j = json::parse(R"({
      "database_path": "/tmp/dj.db",
      "selector_seed": 42,
      "catalog": {"backend": "memory", "csv_path": "tracks.csv", "energy_window": 8},
      "sampling": {"match_pool_size": 50, "exclude_if_played_today": false, "boost_genres": ["jazz"]},
      "coordinator": {"pick_debounce_s": 1, "chat_poll_interval_ms": 500, "max_from_shortlist": 3},
      "planner": {"recheck_interval_min": 10, "default_plan_minutes": 20},
      "cooldown": {"track_recovery_per_day": 0.1},
      "player": {"host": "10.0.0.2", "port": 9000},
      "oracle": {"port": 9001, "timeout_ms": 5000},
      "logging": {"level": "debug", "journal_path": "picks.csv"}
    })");
    const auto cfg = DJConfig::fromJson(j);

    EXPECT_EQ(cfg.databasePath, "/tmp/dj.db");
    ASSERT_TRUE(cfg.selectorSeed);
    EXPECT_EQ(*cfg.selectorSeed, 42u);
    EXPECT_EQ(cfg.catalog.backend, "memory");
    EXPECT_EQ(cfg.catalog.csvPath, "tracks.csv");
    EXPECT_DOUBLE_EQ(cfg.catalog.sqlite.energyWindow, 8.0);
    EXPECT_EQ(cfg.sampling.matchPoolSize, 50u);
    EXPECT_FALSE(cfg.sampling.excludeIfPlayedToday);
    ASSERT_EQ(cfg.sampling.boostGenres.size(), 1u);
    EXPECT_EQ(cfg.sampling.boostGenres[0], "jazz");
    EXPECT_EQ(cfg.coordinator.pickDebounce, std::chrono::seconds(1));
    EXPECT_EQ(cfg.coordinator.chatPollInterval, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.coordinator.maxFromShortlist, 3u);
    EXPECT_EQ(cfg.planner.recheckInterval, std::chrono::minutes(10));
    EXPECT_EQ(cfg.planner.defaultPlanMinutes, 20);
    EXPECT_DOUBLE_EQ(cfg.cooldown.trackRecoveryPerDay, 0.1);
    EXPECT_EQ(cfg.player.host, "10.0.0.2");
    EXPECT_EQ(cfg.player.port, 9000);
    EXPECT_EQ(cfg.oracle.endpoint.host, "127.0.0.1");
    EXPECT_EQ(cfg.oracle.endpoint.port, 9001);
    EXPECT_EQ(cfg.oracle.timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.journalPath, "picks.csv");
  }

  TEST(DJConfig, NullValuesKeepDefaults) {
    const auto cfg = DJConfig::fromJson(json::parse(R"({"catalog": null, "selector_seed": null,
      "player": {"port": null}})"));
    EXPECT_EQ(cfg.catalog.backend, "sqlite");
    EXPECT_FALSE(cfg.selectorSeed);
    EXPECT_EQ(cfg.player.port, 8765);
  }

  TEST(DJConfig, WrongTypesThrow) {
    EXPECT_THROW(DJConfig::fromJson(json::array()), ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "catalog", 5 } }), ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "database_path", 5 } }), ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "database_path", "" } }), ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "sampling", { { "exclude_if_played_today", "yes" } } } }),
                 ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "sampling", { { "match_pool_size", 2.5 } } } }), ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "sampling", { { "boost_genres", { 1, 2 } } } } }), ConfigError);
  }

  TEST(DJConfig, OutOfRangeValuesThrow) {
    EXPECT_THROW(DJConfig::fromJson(json{ { "player", { { "port", 70000 } } } }), ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "oracle", { { "timeout_ms", 10 } } } }), ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "planner", { { "default_plan_minutes", 5 } } } }), ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "cooldown", { { "min_weight", 2.0 } } } }), ConfigError);
    EXPECT_THROW(DJConfig::fromJson(json{ { "sampling", { { "max_energy_delta", -1 } } } }), ConfigError);
  }

  TEST(DJConfig, ShortlistQuotaCannotExceedTotal) {
    EXPECT_THROW(
        DJConfig::fromJson(json{ { "coordinator", { { "max_from_shortlist", 8 }, { "total_candidates", 6 } } } }),
        ConfigError);
    EXPECT_NO_THROW(
        DJConfig::fromJson(json{ { "coordinator", { { "max_from_shortlist", 6 }, { "total_candidates", 6 } } } }));
  }

  TEST(DJConfig, UnknownLogLevelThrows) {
    EXPECT_THROW(DJConfig::fromJson(json{ { "logging", { { "level", "verbose" } } } }), ConfigError);
    EXPECT_NO_THROW(DJConfig::fromJson(json{ { "logging", { { "level", "warning" } } } }));
  }

  TEST(DJConfig, ErrorMessageNamesTheKey) {
    try {
      DJConfig::fromJson(json{ { "oracle", { { "port", "x" } } } });
      FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
      EXPECT_NE(std::string(e.what()).find("oracle.port"), std::string::npos);
    }
  }

  //---ConfigLoader-------------------------------------------------------

  class ConfigLoaderTest : public ::testing::Test {
  protected:
    void SetUp() override {
      path = ::testing::TempDir() + "vibedj_config_test.json";
      std::remove(path.c_str());
    }
    void TearDown() override { std::remove(path.c_str()); }

    void writeFile(const std::string& body) {
      std::ofstream out(path);
      out << body;
    }

    std::string path;
  };

  TEST_F(ConfigLoaderTest, LoadsObject) {
    writeFile(R"({"database_path": "x.db"})");
    core::ConfigLoader loader(path);
    EXPECT_EQ(loader.path(), path);
    const auto j = loader.load();
    EXPECT_EQ(j.at("database_path"), "x.db");
    EXPECT_EQ(DJConfig::fromJson(j).databasePath, "x.db");
  }

  TEST_F(ConfigLoaderTest, MissingFileThrows) {
    core::ConfigLoader loader(path);
    EXPECT_THROW(loader.load(), std::runtime_error);
  }

  TEST_F(ConfigLoaderTest, InvalidJsonThrows) {
    writeFile("{ broken");
    core::ConfigLoader loader(path);
    EXPECT_THROW(loader.load(), std::runtime_error);
  }

  TEST_F(ConfigLoaderTest, NonObjectThrows) {
    writeFile("[1, 2]");
    core::ConfigLoader loader(path);
    EXPECT_THROW(loader.load(), std::runtime_error);
  }

  TEST(ConfigLoader, EmptyPathIsRejected) { EXPECT_THROW(core::ConfigLoader{ "" }, std::invalid_argument); }

} // namespace vibedj::test
