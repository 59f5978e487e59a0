// VibeDJ-Prod headers
#include "catalog/InMemoryCatalog.hpp"
#include "catalog/ShortlistSampler.hpp"
#include "core/CandidateSelector.hpp"
#include "core/DJCoordinator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/PlaybackClient.hpp"
#include "core/VibePlanner.hpp"
#include "history/HistoryStore.hpp"
#include "io/SqliteDatabase.hpp"
#include "protocols/Command.hpp"

// VibeDJ-Fake headers
#include "FakeOracles.hpp"
#include "FakeSocketChannel.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace vibedj::test {

  using core::DJCoordinator;
  using protocols::Candidate;
  using protocols::ProvidedSong;
  using ::testing::HasSubstr;

  namespace {

    std::vector<ProvidedSong> shortlistOf(std::size_t n) {
      std::vector<ProvidedSong> out;
      for (std::size_t i = 0; i < n; ++i) {
        ProvidedSong p;
        p.title = "Listed " + std::to_string(i);
        p.artist = "Band " + std::to_string(i);
        out.push_back(p);
      }
      return out;
    }

    std::size_t countSource(const std::vector<Candidate>& cands, const std::string& source) {
      std::size_t n = 0;
      for (const auto& c : cands)
        n += c.source == source ? 1 : 0;
      return n;
    }

    catalog::CatalogTrack neutralTrack(const std::string& id, const std::string& title) {
      catalog::CatalogTrack t;
      t.id = id;
      t.title = title;
      t.artist = "Catalog Artist";
      t.genre = "rock";
      t.sliders = core::AudioTargets{}.toVector();
      return t;
    }

  } // namespace

  //---shortlist contract------------------------------------------------

  TEST(ShortlistContract, BackfillsProvidedAndTruncatesNovel) {
    const auto shortlist = shortlistOf(10);
    std::vector<Candidate> cands;
    for (int i = 0; i < 3; ++i)
      cands.push_back(FakeRecommenderOracle::candidate("Listed " + std::to_string(i), "Band " + std::to_string(i)));
    for (int i = 0; i < 7; ++i)
      cands.push_back(FakeRecommenderOracle::candidate("Fresh " + std::to_string(i), "Newcomer"));

    const auto out = DJCoordinator::enforceShortlistContract(cands, shortlist, 5, 10);
    ASSERT_EQ(out.size(), 10u);
    EXPECT_EQ(countSource(out, "provided"), 5u);
    EXPECT_EQ(countSource(out, "new"), 5u);

    // provided entries come first; the two backfilled ones are the next unused shortlist rows
    EXPECT_EQ(out[0].title, "Listed 0");
    EXPECT_EQ(out[3].title, "Listed 3");
    EXPECT_EQ(out[4].title, "Listed 4");
    EXPECT_THAT(out[3].reasoning, HasSubstr("server fill"));
    EXPECT_EQ(out[5].title, "Fresh 0");
    EXPECT_EQ(out[9].title, "Fresh 4");
  }

  TEST(ShortlistContract, ExtraProvidedAreCut) {
    const auto shortlist = shortlistOf(10);
    std::vector<Candidate> cands;
    for (int i = 0; i < 8; ++i)
      cands.push_back(FakeRecommenderOracle::candidate("Listed " + std::to_string(i), "Band " + std::to_string(i)));
    cands.push_back(FakeRecommenderOracle::candidate("Fresh", "Newcomer"));

    const auto out = DJCoordinator::enforceShortlistContract(cands, shortlist, 5, 10);
    EXPECT_EQ(countSource(out, "provided"), 5u);
    EXPECT_EQ(countSource(out, "new"), 1u);
  }

  TEST(ShortlistContract, MatchingIsExactOnTrimmedFields) {
    const auto shortlist = shortlistOf(1);
    std::vector<Candidate> cands{ FakeRecommenderOracle::candidate("  Listed 0 ", " Band 0"),
                                  FakeRecommenderOracle::candidate("listed 0", "band 0") };
    const auto out = DJCoordinator::enforceShortlistContract(cands, shortlist, 5, 10);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].title, "Listed 0");
    EXPECT_EQ(out[0].source, "provided");
    EXPECT_EQ(out[1].source, "new");
  }

  TEST(ShortlistContract, SearchQueryFillsMissingFields) {
    const auto shortlist = shortlistOf(1);
    Candidate c;
    c.searchQuery = "Listed 0 by Band 0";
    const auto out = DJCoordinator::enforceShortlistContract({ c }, shortlist, 5, 10);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].title, "Listed 0");
    EXPECT_EQ(out[0].artist, "Band 0");
    EXPECT_EQ(out[0].source, "provided");
  }

  TEST(ShortlistContract, EmptyShortlistLeavesCandidatesUntouched) {
    std::vector<Candidate> cands{ FakeRecommenderOracle::candidate(" A ", ""),
                                  FakeRecommenderOracle::candidate("B", "C") };
    const auto out = DJCoordinator::enforceShortlistContract(cands, {}, 5, 10);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].title, " A ");
    EXPECT_EQ(out[0].source, "");
  }

  //---coordinator loop--------------------------------------------------

  class DJCoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      nowMs = core::toUnixMillis(*core::parseIsoUtc("2025-06-01T12:00:00Z"));

      vibe = std::make_shared<FakeVibeOracle>();
      recommender = std::make_shared<FakeRecommenderOracle>();
      context = std::make_shared<FakeContextSource>();
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();

      db = std::make_shared<io::SqliteDatabase>(":memory:");
      historyStore = std::make_shared<history::HistoryStore>(db);
      memCatalog = std::make_shared<catalog::InMemoryCatalog>(); // empty: no shortlist backfill

      auto fake = std::make_unique<FakeSocketChannel>();
      channel = fake.get();
      playback = std::make_shared<core::PlaybackClient>(std::static_pointer_cast<core::ErrorMonitor>(errorMonitor),
                                                        std::move(fake), "127.0.0.1", 8765);
      playback->connect();

      recommender->next.candidates = { FakeRecommenderOracle::candidate("Teardrop", "Massive Attack") };

      settings.queueWait = std::chrono::milliseconds(20);
      settings.chatPollInterval = std::chrono::milliseconds(100000);
    }

    void TearDown() override {
      if (coordinator)
        coordinator->stop();
    }

    core::CoordinatorDeps deps() {
      core::CoordinatorDeps d;
      d.planner = std::make_shared<core::VibePlanner>(vibe);
      d.recommender = recommender;
      d.sampler = std::make_shared<catalog::ShortlistSampler>(memCatalog, historyStore);
      d.history = historyStore;
      d.selector = std::make_shared<core::CandidateSelector>([](const std::string&, const std::string&) { return 1.0; },
                                                             7u);
      d.playback = playback;
      d.context = context;
      d.errorMonitor = errorMonitor;
      return d;
    }

    void makeCoordinator() {
      coordinator = std::make_unique<DJCoordinator>(deps(), settings,
                                                    [this]() { return core::fromUnixMillis(nowMs.load()); });
    }

    /// Round-trips the queue so every earlier event has been handled.
    core::CoordinatorStatus drain() {
      auto s = coordinator->statusStrict();
      EXPECT_TRUE(s.has_value());
      return s.value_or(core::CoordinatorStatus{});
    }

    void advance(std::chrono::seconds by) { nowMs += std::chrono::duration_cast<std::chrono::milliseconds>(by).count(); }

    std::atomic<std::int64_t> nowMs{ 0 };
    std::shared_ptr<FakeVibeOracle> vibe;
    std::shared_ptr<FakeRecommenderOracle> recommender;
    std::shared_ptr<FakeContextSource> context;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::shared_ptr<io::SqliteDatabase> db;
    std::shared_ptr<history::HistoryStore> historyStore;
    std::shared_ptr<catalog::InMemoryCatalog> memCatalog;
    FakeSocketChannel* channel{ nullptr };
    std::shared_ptr<core::PlaybackClient> playback;
    core::CoordinatorSettings settings;
    std::unique_ptr<DJCoordinator> coordinator;
  };

  TEST_F(DJCoordinatorTest, MissingDependencyThrows) {
    auto d = deps();
    d.recommender.reset();
    EXPECT_THROW((DJCoordinator{ d, settings }), std::invalid_argument);

    auto noJournal = deps();
    EXPECT_NO_THROW((DJCoordinator{ noJournal, settings }));
  }

  TEST_F(DJCoordinatorTest, PickSongWhileDisabledReturnsNothing) {
    makeCoordinator();
    coordinator->start();
    EXPECT_FALSE(coordinator->pickSong("manual"));
    EXPECT_EQ(recommender->calls.load(), 0);
  }

  TEST_F(DJCoordinatorTest, PickSongReturnsChoiceWithoutQueueing) {
    makeCoordinator();
    coordinator->enable(true);
    const auto result = coordinator->pickSong("manual");
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->skipMusic);
    EXPECT_EQ(result->title, "Teardrop");
    EXPECT_EQ(result->artist, "Massive Attack");
    EXPECT_EQ(result->searchQuery(), "Teardrop by Massive Attack");
    EXPECT_EQ(result->targets.contextBlock, "deep_work");

    drain();
    EXPECT_TRUE(channel->written.empty());
    EXPECT_FALSE(historyStore->lastPlayed());
  }

  TEST_F(DJCoordinatorTest, RecommenderSeesShortlistAndHistory) {
    historyStore->recordPlay("Old Song", "Old Band", std::nullopt, std::nullopt,
                             core::fromUnixMillis(nowMs.load()) - std::chrono::hours(2));
    memCatalog->add(neutralTrack("1", "Catalog One"));
    memCatalog->add(neutralTrack("2", "Catalog Two"));
    makeCoordinator();
    coordinator->enable(true);
    ASSERT_TRUE(coordinator->pickSong("manual"));

    const auto reqs = recommender->requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].providedSongs.size(), 2u);
    ASSERT_EQ(reqs[0].recentlyPlayed.size(), 1u);
    EXPECT_EQ(reqs[0].recentlyPlayed[0].title, "Old Song");
    ASSERT_TRUE(reqs[0].lastPlayed);
    EXPECT_EQ(reqs[0].lastPlayed->artist, "Old Band");
    EXPECT_EQ(vibe->calls.load(), 1);
  }

  TEST_F(DJCoordinatorTest, PickAndQueueSendsQueueNextAndRecordsHistory) {
    makeCoordinator();
    coordinator->enable(true);
    coordinator->requestPickAndQueue("test");
    const auto status = drain();

    ASSERT_EQ(channel->written.size(), 1u);
    EXPECT_EQ(channel->lastWritten(), protocols::Command::queueNext("Teardrop by Massive Attack").toWire());
    EXPECT_TRUE(status.nextSongQueued);
    EXPECT_EQ(status.lastAction, "queue_next(test)");

    const auto last = historyStore->lastPlayed();
    ASSERT_TRUE(last);
    EXPECT_EQ(last->title, "Teardrop");
    EXPECT_EQ(last->playsAllTime, 1);
  }

  TEST_F(DJCoordinatorTest, PickAndQueueIsDebounced) {
    makeCoordinator();
    coordinator->enable(true);
    coordinator->requestPickAndQueue("first");
    coordinator->requestPickAndQueue("second");
    drain();
    EXPECT_EQ(recommender->calls.load(), 1);
    EXPECT_EQ(channel->written.size(), 1u);
  }

  TEST_F(DJCoordinatorTest, SkipMusicQueuesNothingAndArmsRetry) {
    recommender->next.skipMusic = true;
    recommender->next.skipReason = "meeting";
    makeCoordinator();
    coordinator->enable(true);

    const auto result = coordinator->pickSong("manual");
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->skipMusic);
    EXPECT_EQ(result->skipReason, "meeting");

    advance(std::chrono::seconds(10));
    coordinator->requestPickAndQueue("test");
    EXPECT_FALSE(drain().nextSongQueued);
    EXPECT_TRUE(channel->written.empty());
    EXPECT_EQ(recommender->calls.load(), 2);

    // still inside the retry cooldown
    advance(std::chrono::seconds(10));
    coordinator->requestPickAndQueue("test");
    drain();
    EXPECT_EQ(recommender->calls.load(), 2);
  }

  TEST_F(DJCoordinatorTest, ConcurrentPickRequestsRunOneAtATime) {
    std::atomic<bool> sawIdleFlag{ false };
    recommender->delay = std::chrono::milliseconds(15);
    recommender->duringCall = [this, &sawIdleFlag]() {
      if (!coordinator->pickInProgress())
        sawIdleFlag = true;
    };
    settings.pickDebounce = std::chrono::seconds(0);
    makeCoordinator();
    coordinator->enable(true);

    std::atomic<int> answered{ 0 };
    std::vector<std::thread> callers;
    for (int i = 0; i < 6; ++i) {
      callers.emplace_back([this, i, &answered]() {
        if (i % 3 == 0) {
          coordinator->requestPickAndQueue("burst");
          return;
        }
        const auto r = i % 3 == 1 ? coordinator->pickSong("burst", std::chrono::seconds(5))
                                  : coordinator->pickSongOnce("burst", std::chrono::seconds(5));
        if (r)
          ++answered;
      });
    }
    for (auto& t : callers)
      t.join();
    drain();

    EXPECT_EQ(recommender->peakInFlight.load(), 1);
    EXPECT_FALSE(sawIdleFlag.load());
    EXPECT_EQ(answered.load(), 4);
    EXPECT_GE(recommender->calls.load(), 4);
    EXPECT_FALSE(coordinator->pickInProgress());
  }

  TEST_F(DJCoordinatorTest, OracleFailureIsEscalated) {
    recommender->fail = true;
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("scripted failure"))).Times(::testing::AtLeast(1));
    makeCoordinator();
    coordinator->enable(true);
    EXPECT_FALSE(coordinator->pickSong("manual"));
    EXPECT_FALSE(coordinator->pickInProgress());
  }

  TEST_F(DJCoordinatorTest, SocketFailureStillRecordsPick) {
    channel->write_success = false;
    makeCoordinator();
    coordinator->enable(true);
    coordinator->requestPickAndQueue("test");
    EXPECT_FALSE(drain().nextSongQueued);
    EXPECT_TRUE(historyStore->lastPlayed());
  }

  TEST_F(DJCoordinatorTest, BackupsAreServedBestFirstAndRecorded) {
    recommender->next.candidates = { FakeRecommenderOracle::candidate("One", "A"),
                                     FakeRecommenderOracle::candidate("Two", "B"),
                                     FakeRecommenderOracle::candidate("Three", "C") };
    makeCoordinator();
    coordinator->enable(true);
    const auto picked = coordinator->pickSong("manual");
    ASSERT_TRUE(picked);
    EXPECT_EQ(drain().backupCandidates, 2u);

    const auto backup = coordinator->getBackupSong();
    ASSERT_TRUE(backup);
    EXPECT_NE(backup->title, picked->title);
    EXPECT_EQ(backup->searchQuery, backup->title + " by " + backup->artist);
    EXPECT_EQ(drain().backupCandidates, 1u);

    const auto last = historyStore->lastPlayed();
    ASSERT_TRUE(last);
    EXPECT_EQ(last->title, backup->title);

    EXPECT_TRUE(coordinator->getBackupSong());
    EXPECT_FALSE(coordinator->getBackupSong());
  }

  TEST_F(DJCoordinatorTest, DisableClearsState) {
    recommender->next.candidates = { FakeRecommenderOracle::candidate("One", "A"),
                                     FakeRecommenderOracle::candidate("Two", "B") };
    makeCoordinator();
    coordinator->enable(true);
    coordinator->requestPickAndQueue("test");
    auto status = drain();
    EXPECT_TRUE(status.nextSongQueued);
    EXPECT_EQ(status.backupCandidates, 1u);
    EXPECT_FALSE(status.vibePlan.is_null());

    coordinator->disable();
    status = drain();
    EXPECT_FALSE(status.enabled);
    EXPECT_FALSE(status.continuousMode);
    EXPECT_FALSE(status.nextSongQueued);
    EXPECT_EQ(status.backupCandidates, 0u);
    EXPECT_TRUE(status.vibePlan.is_null());
    EXPECT_FALSE(coordinator->pickSong("manual"));
  }

  TEST_F(DJCoordinatorTest, PickSongOnceIgnoresDisabledFlag) {
    makeCoordinator();
    const auto result = coordinator->pickSongOnce();
    ASSERT_TRUE(result);
    EXPECT_EQ(result->title, "Teardrop");
    EXPECT_FALSE(coordinator->enabled());
    EXPECT_TRUE(coordinator->running());
  }

  TEST_F(DJCoordinatorTest, TrackChangeResetsQueuedFlag) {
    makeCoordinator();
    coordinator->enable(true);
    coordinator->requestPickAndQueue("test");
    ASSERT_TRUE(drain().nextSongQueued);

    coordinator->onTrackChanged(protocols::TrackInfo{ "Teardrop", "Massive Attack" });
    auto status = drain();
    EXPECT_FALSE(status.nextSongQueued);
    ASSERT_TRUE(status.currentTrackId);
    EXPECT_EQ(*status.currentTrackId, "Teardrop-Massive Attack");

    coordinator->onTrackChanged(std::nullopt);
    status = drain();
    EXPECT_FALSE(status.currentTrackId);
  }

  TEST_F(DJCoordinatorTest, StatusJsonCarriesFlagsAndStats) {
    makeCoordinator();
    coordinator->enable(false);
    drain();
    const auto j = coordinator->status().toJson();
    EXPECT_EQ(j.at("enabled"), true);
    EXPECT_EQ(j.at("running"), true);
    EXPECT_EQ(j.at("thread_alive"), true);
    EXPECT_EQ(j.at("continuous_mode"), false);
    EXPECT_EQ(j.at("stats").at("started_at"), "2025-06-01T12:00:00Z");
    EXPECT_TRUE(j.at("current_track").is_null());
  }

  TEST_F(DJCoordinatorTest, MusicChatTriggersPick) {
    settings.chatPollInterval = std::chrono::milliseconds(10);
    makeCoordinator();
    coordinator->enable(true);
    drain();

    context->addChat(core::fromUnixMillis(nowMs.load()) + std::chrono::seconds(1), "play something upbeat");
    for (int i = 0; i < 100 && channel->written.empty(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      drain();
    }
    ASSERT_EQ(channel->written.size(), 1u);
    EXPECT_EQ(recommender->calls.load(), 1);
  }

  TEST_F(DJCoordinatorTest, StopJoinsLoop) {
    makeCoordinator();
    coordinator->start();
    EXPECT_TRUE(coordinator->stop());
    const auto status = coordinator->status();
    EXPECT_FALSE(status.running);
    EXPECT_FALSE(status.threadAlive);
    EXPECT_FALSE(coordinator->statusStrict());
    EXPECT_FALSE(coordinator->getBackupSong());
  }

} // namespace vibedj::test
