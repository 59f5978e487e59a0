/* @file main.cpp
 * @brief composition root: config -> stores -> catalog -> oracles -> player -> coordinator
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

// third-party headers
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "catalog/CatalogFactory.hpp"
#include "catalog/InMemoryCatalog.hpp"
#include "catalog/ShortlistSampler.hpp"
#include "catalog/SqliteCatalog.hpp"
#include "core/CandidateSelector.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DJConfig.hpp"
#include "core/DJCoordinator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/FeatureScaler.hpp"
#include "core/Logging.hpp"
#include "core/PickJournal.hpp"
#include "core/PlaybackClient.hpp"
#include "core/RemoteOracle.hpp"
#include "core/VibePlanner.hpp"
#include "history/CooldownScorer.hpp"
#include "history/HistoryStore.hpp"
#include "history/WeightStore.hpp"
#include "io/JsonFileContextSource.hpp"
#include "io/SocketChannel.hpp"
#include "io/SqliteDatabase.hpp"

using namespace vibedj;

namespace {

  volatile std::sig_atomic_t gStopRequested = 0;

  void onSignal(int) { gStopRequested = 1; }

  void registerBackends(catalog::CatalogFactory& factory, const core::DJConfig& cfg,
                        const std::shared_ptr<io::SqliteDatabase>& db) {
    factory.registerBackend("memory", [&cfg, db]() -> std::shared_ptr<catalog::CatalogIndex> {
      auto mem = std::make_shared<catalog::InMemoryCatalog>(
          cfg.catalog.csvPath.empty() ? catalog::InMemoryCatalog{}
                                      : catalog::InMemoryCatalog::fromCsv(cfg.catalog.csvPath));
      mem->setWeights(history::WeightStore(db).loadAll());
      return mem;
    });

    factory.registerBackend("sqlite", [&cfg, db]() -> std::shared_ptr<catalog::CatalogIndex> {
      auto sql = std::make_shared<catalog::SqliteCatalog>(db, cfg.catalog.sqlite);
      if (sql->trackCount() == 0 && !cfg.catalog.csvPath.empty()) {
        const auto seed = catalog::InMemoryCatalog::fromCsv(cfg.catalog.csvPath);
        sql->importTracks(seed.tracks());
        sql->rebuildGenreStats();
      }
      return sql;
    });
  }

  /// Forwards player events to the coordinator; reconnects when the socket drops.
  void pumpPlayerEvents(core::PlaybackClient& player, core::DJCoordinator& coordinator, std::atomic<bool>& stop) {
    auto log = core::logging::get("playback");
    while (!stop) {
      if (!player.connected()) {
        try {
          player.connect();
        } catch (const std::exception& e) {
          log->warn("player reconnect failed: {}", e.what());
          std::this_thread::sleep_for(std::chrono::seconds(2));
          continue;
        }
      }

      const auto ev = player.awaitEvent(std::chrono::milliseconds(500));
      if (!ev)
        continue;
      switch (ev->kind) {
        case protocols::PlayerEventKind::TrackChanged:
          coordinator.onTrackChanged(ev->track());
          break;
        case protocols::PlayerEventKind::Queued:
          coordinator.onFrontendQueued(ev->data);
          break;
      }
    }
  }

} // namespace

int main(int argc, char** argv) {
  auto log = core::logging::get("app");
  if (argc < 2) {
    log->error("usage: {} <config.json>", argc > 0 ? argv[0] : "vibedj");
    return 2;
  }

  core::DJConfig cfg;
  try {
    cfg = core::DJConfig::fromJson(core::ConfigLoader(argv[1]).load());
  } catch (const std::exception& e) {
    log->critical("configuration rejected: {}", e.what());
    return 1;
  }
  core::logging::configure(cfg.logging.level);

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  try {
    auto errorMonitor = std::make_shared<core::ErrorMonitor>();
    errorMonitor->registerEscalation(
        [](const std::string& msg) { core::logging::get("app")->critical("escalated failure: {}", msg); });

    auto db = std::make_shared<io::SqliteDatabase>(cfg.databasePath);
    auto historyStore = std::make_shared<history::HistoryStore>(db);

    catalog::CatalogFactory factory;
    registerBackends(factory, cfg, db);
    auto index = factory.create(cfg.catalog.backend);
    log->info("catalog backend '{}' ready", index->name());

    auto rpc = std::make_shared<core::OracleRpcClient>(std::make_unique<io::SocketChannel>(),
                                                          cfg.oracle.endpoint.host, cfg.oracle.endpoint.port,
                                                          cfg.oracle.timeout);
    auto vibeOracle = std::make_shared<core::RemoteVibeOracle>(rpc);
    auto recommender = std::make_shared<core::RemoteRecommenderOracle>(rpc);

    auto playback = std::make_shared<core::PlaybackClient>(errorMonitor, std::make_unique<io::SocketChannel>(),
                                                           cfg.player.host, cfg.player.port);
    try {
      playback->connect();
    } catch (const std::exception& e) {
      log->warn("player not reachable yet, will retry: {}", e.what());
    }

    auto scorer = std::make_shared<history::CooldownScorer>(historyStore, cfg.cooldown);
    auto selector = std::make_shared<core::CandidateSelector>(
        [scorer](const std::string& title, const std::string& artist) { return scorer->score(title, artist); },
        cfg.selectorSeed.value_or(std::random_device{}()));

    std::shared_ptr<core::PickJournal> journal;
    if (!cfg.logging.journalPath.empty()) {
      journal = std::make_shared<core::PickJournal>();
      journal->startNewRun(cfg.logging.journalPath);
    }

    core::CoordinatorDeps deps;
    deps.planner = std::make_shared<core::VibePlanner>(vibeOracle, cfg.planner);
    deps.recommender = recommender;
    deps.sampler = std::make_shared<catalog::ShortlistSampler>(index, historyStore, cfg.sampling);
    deps.history = historyStore;
    deps.selector = selector;
    deps.playback = playback;
    deps.context = std::make_shared<io::JsonFileContextSource>(cfg.contextPath);
    deps.errorMonitor = errorMonitor;
    deps.journal = journal;

    core::DJCoordinator coordinator(deps, cfg.coordinator);
    coordinator.enable(true);

    std::atomic<bool> stopPump{ false };
    std::thread pump([&]() { pumpPlayerEvents(*playback, coordinator, stopPump); });

    log->info("vibedj running (player {}:{}, oracle {}:{})", cfg.player.host, cfg.player.port,
              cfg.oracle.endpoint.host, cfg.oracle.endpoint.port);
    while (!gStopRequested)
      std::this_thread::sleep_for(std::chrono::milliseconds(200));

    log->info("shutdown requested");
    stopPump = true;
    pump.join();
    coordinator.disable();
    if (!coordinator.stop(std::chrono::seconds(5)))
      log->warn("coordinator did not stop in time");
    if (journal)
      journal->finishRun();
  } catch (const std::exception& e) {
    log->critical("fatal: {}", e.what());
    return 1;
  }
  return 0;
}
