// VibeDJ-Prod headers
#include "core/TimeUtil.hpp"
#include "history/CooldownScorer.hpp"
#include "history/HistoryStore.hpp"
#include "history/WeightStore.hpp"
#include "io/SqliteDatabase.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <memory>

namespace vibedj::test {

  using core::parseIsoUtc;
  using core::TimePoint;
  using history::CooldownScorer;
  using history::HistoryRecord;
  using history::HistoryStore;
  using history::WeightScope;
  using history::WeightStore;

  namespace {
    TimePoint at(const char* iso) { return *parseIsoUtc(iso); }
  } // namespace

  class HistoryStoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
      db = std::make_shared<io::SqliteDatabase>(":memory:");
      store = std::make_shared<HistoryStore>(db);
    }

    std::shared_ptr<io::SqliteDatabase> db;
    std::shared_ptr<HistoryStore> store;
  };

  TEST_F(HistoryStoreTest, FirstPlayCreatesRowWithAllCountersAtOne) {
    core::AudioTargets targets;
    targets.energy = 72;
    const auto r = store->recordPlay("Teardrop", "Massive Attack", "Teardrop by Massive Attack", targets,
                                     at("2025-05-06T10:00:00Z"));
    EXPECT_GT(r.id, 0);
    EXPECT_EQ(r.playsToday, 1);
    EXPECT_EQ(r.playsAllTime, 1);
    EXPECT_EQ(r.lastResetDate, "2025-05-06");

    const auto found = store->find("  teardrop ", "MASSIVE ATTACK");
    ASSERT_TRUE(found);
    EXPECT_EQ(found->title, "Teardrop");
    EXPECT_EQ(found->lastTargets[core::index(core::Feature::Energy)], 72);
  }

  TEST_F(HistoryStoreTest, ReplayMatchesCaseInsensitivelyAndKeepsOriginalCasing) {
    store->recordPlay("Teardrop", "Massive Attack", std::nullopt, std::nullopt, at("2025-05-06T10:00:00Z"));
    const auto r = store->recordPlay("TEARDROP", "massive attack", std::nullopt, std::nullopt,
                                     at("2025-05-06T11:00:00Z"));
    EXPECT_EQ(r.title, "Teardrop");
    EXPECT_EQ(r.playsToday, 2);
    EXPECT_EQ(r.playsAllTime, 2);
    EXPECT_EQ(store->recentlyPlayed(10).size(), 1u);
  }

  TEST_F(HistoryStoreTest, NewDayResetsDailyButNotWeeklyCounter) {
    store->recordPlay("Angel", "Massive Attack", std::nullopt, std::nullopt, at("2025-05-06T22:00:00Z"));
    const auto r = store->recordPlay("Angel", "Massive Attack", std::nullopt, std::nullopt,
                                     at("2025-05-07T08:00:00Z"));
    EXPECT_EQ(r.playsToday, 1);
    EXPECT_EQ(r.playsWeek, 2);
    EXPECT_EQ(r.playsAllTime, 2);
  }

  TEST(HistoryPeriodResetTest, CrossingYearResetsEveryPeriod) {
    HistoryRecord r;
    r.playsToday = r.playsWeek = r.playsMonth = r.playsYear = 3;
    r.playsAllTime = 9;
    r.lastResetDate = "2024-12-31";
    HistoryStore::applyPeriodReset(r, at("2025-01-01T00:30:00Z"));
    EXPECT_EQ(r.playsToday, 0);
    EXPECT_EQ(r.playsWeek, 0); // same ISO week 1, but the calendar year changed
    EXPECT_EQ(r.playsMonth, 0);
    EXPECT_EQ(r.playsYear, 0);
    EXPECT_EQ(r.playsAllTime, 9);
    EXPECT_EQ(r.lastResetDate, "2025-01-01");
  }

  TEST(HistoryPeriodResetTest, EmptyResetDateOnlyStampsToday) {
    HistoryRecord r;
    r.playsToday = 4;
    HistoryStore::applyPeriodReset(r, at("2025-02-02T12:00:00Z"));
    EXPECT_EQ(r.playsToday, 4);
    EXPECT_EQ(r.lastResetDate, "2025-02-02");
  }

  TEST_F(HistoryStoreTest, RecentlyPlayedIsOldestFirstAndLimited) {
    store->recordPlay("A", "X", std::nullopt, std::nullopt, at("2025-05-06T10:00:00Z"));
    store->recordPlay("B", "Y", std::nullopt, std::nullopt, at("2025-05-06T10:05:00Z"));
    store->recordPlay("C", "Z", std::nullopt, std::nullopt, at("2025-05-06T10:10:00Z"));

    const auto recent = store->recentlyPlayed(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].title, "B");
    EXPECT_EQ(recent[1].title, "C");
    ASSERT_TRUE(store->lastPlayed());
    EXPECT_EQ(store->lastPlayed()->title, "C");
  }

  TEST_F(HistoryStoreTest, StatsAndArtistRecency) {
    const auto t0 = at("2025-05-06T10:00:00Z");
    store->recordPlay("A", "X", std::nullopt, std::nullopt, t0);
    store->recordPlay("B", "X", std::nullopt, std::nullopt, t0 + std::chrono::hours(2));

    const auto st = store->stats("A", "X", t0 + std::chrono::hours(6));
    ASSERT_TRUE(st.found);
    ASSERT_TRUE(st.hoursSinceLast);
    EXPECT_NEAR(*st.hoursSinceLast, 6.0, 1e-6);

    const auto artist = store->artistHoursSinceLast("x", t0 + std::chrono::hours(6));
    ASSERT_TRUE(artist);
    EXPECT_NEAR(*artist, 4.0, 1e-6);
    EXPECT_FALSE(store->artistHoursSinceLast("   ", t0));
    EXPECT_FALSE(store->stats("Nope", "X", t0).found);
  }

  // ---------------------------------------------------------------------------
  // cooldown
  // ---------------------------------------------------------------------------
  TEST_F(HistoryStoreTest, CooldownFloorsRightAfterAPlay) {
    const auto now = at("2025-05-06T10:00:00Z");
    CooldownScorer scorer(store);
    EXPECT_DOUBLE_EQ(scorer.score("Teardrop", "Massive Attack", now), 1.0);

    store->recordPlay("Teardrop", "Massive Attack", std::nullopt, std::nullopt, now);
    EXPECT_NEAR(scorer.score("Teardrop", "Massive Attack", now), 0.01, 1e-9);
  }

  TEST_F(HistoryStoreTest, CooldownRecoversLinearly) {
    const auto t0 = at("2025-05-01T10:00:00Z");
    store->recordPlay("Teardrop", "Massive Attack", std::nullopt, std::nullopt, t0);

    CooldownScorer scorer(store);
    // 10 days: track 0.5, artist 1.0
    EXPECT_NEAR(scorer.score("Teardrop", "Massive Attack", t0 + std::chrono::hours(240)), 0.5, 1e-9);
    // 25 days: fully recovered
    EXPECT_NEAR(scorer.score("Teardrop", "Massive Attack", t0 + std::chrono::hours(600)), 1.0, 1e-9);
  }

  TEST(CooldownComponentTest, UnknownElapsedCountsAsFullyRecovered) {
    history::CooldownPolicy policy;
    EXPECT_DOUBLE_EQ(CooldownScorer::component(0.05, std::nullopt, policy), 1.0);
    EXPECT_DOUBLE_EQ(CooldownScorer::component(0.05, -5.0, policy), policy.minWeight);
  }

  // ---------------------------------------------------------------------------
  // weight overrides
  // ---------------------------------------------------------------------------
  TEST_F(HistoryStoreTest, WeightOverridesCombineAcrossScopes) {
    WeightStore weights(db);
    EXPECT_DOUBLE_EQ(weights.factor(WeightScope::Genre, "trip-hop"), 1.0);

    weights.set(WeightScope::Genre, "Trip-Hop", 2.0);
    weights.set(WeightScope::Artist, "Massive Attack", 0.5);
    weights.set(WeightScope::Track, "Teardrop", 3.0, "Massive Attack");

    const auto table = weights.loadAll();
    EXPECT_DOUBLE_EQ(table.combined("teardrop", "massive attack", "trip-hop"), 3.0);
    EXPECT_DOUBLE_EQ(table.combined("Angel", "Massive Attack", "trip-hop"), 1.0);
    EXPECT_DOUBLE_EQ(table.combined("Angel", "Portishead", "rock"), 1.0);
  }

  TEST_F(HistoryStoreTest, NegativeAdjustNeverBans) {
    WeightStore weights(db);
    EXPECT_DOUBLE_EQ(weights.adjust(WeightScope::Artist, "Nickelback", -5.0), WeightStore::kMinWeightFactor);
    EXPECT_DOUBLE_EQ(weights.set(WeightScope::Artist, "Nickelback", -1.0), 0.0);
    EXPECT_DOUBLE_EQ(weights.adjust(WeightScope::Artist, "Nickelback", 0.25), 0.25);
  }

} // namespace vibedj::test
