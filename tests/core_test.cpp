// VibeDJ-Prod headers
#include "core/AudioFeatures.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventQueue.hpp"
#include "core/FeatureScaler.hpp"
#include "core/SearchQuery.hpp"
#include "core/TimeUtil.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <limits>
#include <utility>
#include <string>
#include <thread>
#include <vector>

using namespace vibedj::core;
using vibedj::protocols::Command;
using vibedj::protocols::PlaybackVerb;
using vibedj::protocols::PlayerEventKind;
using vibedj::protocols::Response;

// ---------------------------------------------------------------------------
// sliders + scaler
// ---------------------------------------------------------------------------
TEST(AudioTargetsTest, SettersClampAndRound) {
  AudioTargets t;
  t.set(Feature::Energy, 140.0);
  t.set(Feature::Valence, -3.0);
  t.set(Feature::Tempo, 42.5); // ties to even
  EXPECT_EQ(t.energy, 100);
  EXPECT_EQ(t.valence, 0);
  EXPECT_EQ(t.tempo, 42);
  EXPECT_EQ(clampSlider(std::numeric_limits<double>::quiet_NaN()), 0);
}

TEST(FeatureScalerTest, UnitFeaturesMapLinearly) {
  FeatureScaler scaler;
  EXPECT_DOUBLE_EQ(scaler.sliderToNative(Feature::Energy, 50.0), 0.5);
  EXPECT_DOUBLE_EQ(scaler.nativeToSlider(Feature::Acousticness, 0.25), 25.0);
  EXPECT_DOUBLE_EQ(scaler.sliderToNative(Feature::Speechiness, 150.0), 1.0);
}

TEST(FeatureScalerTest, AnchoredScalesClampOutsideTheirRange) {
  FeatureScaler scaler;
  EXPECT_NEAR(scaler.sliderToNative(Feature::Loudness, 0.0), kLoudnessDbScale.lo, 1e-9);
  EXPECT_NEAR(scaler.sliderToNative(Feature::Tempo, 100.0), kTempoBpmScale.hi, 1e-9);
  EXPECT_DOUBLE_EQ(scaler.nativeToSlider(Feature::Loudness, -60.0), 0.0);
  EXPECT_DOUBLE_EQ(scaler.nativeToSlider(Feature::Tempo, 240.0), 100.0);
}

TEST(FeatureScalerTest, SliderRoundTripsThroughNativeForEveryFeature) {
  FeatureScaler scaler;
  for (auto f : kAllFeatures) {
    for (int step = 0; step <= 400; ++step) {
      const double slider = step * 0.25;
      EXPECT_NEAR(scaler.nativeToSlider(f, scaler.sliderToNative(f, slider)), slider, 1e-9)
          << toString(f) << " @ " << slider;
    }
  }
}

TEST(FeatureScalerTest, AnchoredNativeRoundTripsInsideAnchors) {
  FeatureScaler scaler;
  const std::pair<Feature, FeatureScale> anchored[] = { { Feature::Loudness, kLoudnessDbScale },
                                                        { Feature::Tempo, kTempoBpmScale } };
  for (const auto& [f, scale] : anchored) {
    for (int step = 0; step <= 100; ++step) {
      const double native = scale.lo + (scale.hi - scale.lo) * step / 100.0;
      EXPECT_NEAR(scaler.sliderToNative(f, scaler.nativeToSlider(f, native)), native, 1e-9)
          << toString(f) << " @ " << native;
    }
  }
}

TEST(FeatureScalerTest, MissingNativeBecomesNeutralSlider) {
  FeatureScaler scaler;
  std::array<std::optional<double>, kFeatureCount> native{};
  native[index(Feature::Energy)] = 0.8234;
  const auto sliders = scaler.toSliders(native);
  EXPECT_DOUBLE_EQ(sliders[index(Feature::Energy)], 82.3);
  EXPECT_DOUBLE_EQ(sliders[index(Feature::Valence)], 50.0);
}

TEST(FeatureScalerTest, SignedValence) {
  EXPECT_DOUBLE_EQ(FeatureScaler::valenceSliderToSigned(0.0), -1.0);
  EXPECT_DOUBLE_EQ(FeatureScaler::valenceSliderToSigned(50.0), 0.0);
  EXPECT_DOUBLE_EQ(FeatureScaler::signedValenceToSlider(1.0), 100.0);
}

// ---------------------------------------------------------------------------
// search query + time
// ---------------------------------------------------------------------------
TEST(SearchQueryTest, SplitsOnLastBy) {
  EXPECT_EQ(buildSearchQuery("Stand By Me", "Ben E. King"), "Stand By Me by Ben E. King");
  const auto [title, artist] = parseSearchQuery("  Stand By Me by Ben E. King ");
  EXPECT_EQ(title, "Stand By Me");
  EXPECT_EQ(artist, "Ben E. King");

  const auto [onlyTitle, none] = parseSearchQuery("Teardrop");
  EXPECT_EQ(onlyTitle, "Teardrop");
  EXPECT_TRUE(none.empty());
}

TEST(SearchQueryTest, NormalizationIsTrimAndLowercase) {
  EXPECT_EQ(normalizeKey("  Massive Attack "), "massive attack");
  EXPECT_EQ(trackKey("Teardrop", "Massive Attack"), "teardrop|||massive attack");
  EXPECT_EQ(asciiSafe("Beyonc\xc3\xa9"), "Beyonc");
}

TEST(TimeUtilTest, IsoRoundTripAndOffsets) {
  const auto tp = parseIsoUtc("2025-03-14T09:26:53Z");
  ASSERT_TRUE(tp);
  EXPECT_EQ(toIsoUtc(*tp), "2025-03-14T09:26:53Z");
  EXPECT_EQ(parseIsoUtc("2025-03-14T09:26:53.250+00:00").has_value(), true);
  EXPECT_FALSE(parseIsoUtc("yesterday"));
  EXPECT_EQ(toUnixMillis(fromUnixMillis(1700000000123)), 1700000000123);
}

TEST(TimeUtilTest, UtcDateFields) {
  const auto tp = parseIsoUtc("2024-12-30T12:00:00Z");
  ASSERT_TRUE(tp);
  const auto d = utcDate(*tp);
  EXPECT_EQ(d.year, 2024);
  EXPECT_EQ(d.month, 12);
  EXPECT_EQ(d.day, 30);
  EXPECT_EQ(d.isoWeek, 1); // Monday of ISO week 2025-W01
  EXPECT_EQ(utcDateString(*tp), "2024-12-30");
}

// ---------------------------------------------------------------------------
// error monitor
// ---------------------------------------------------------------------------
TEST(ErrorMonitorTest, EscalatesOncePerDistinctMessageUntilReset) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

  monitor.notifyFailure("player down");
  monitor.notifyFailure("player down");
  monitor.notifyFailure("oracle down");
  EXPECT_EQ(escalated.size(), 2u);
  EXPECT_EQ(monitor.distinctFailures(), 2u);

  monitor.reset();
  monitor.notifyFailure("player down");
  EXPECT_EQ(escalated.size(), 3u);
}

// ---------------------------------------------------------------------------
// event queue
// ---------------------------------------------------------------------------
TEST(BlockingQueueTest, PopForTimesOutWhenEmpty) {
  BlockingQueue<int> q;
  EXPECT_FALSE(q.popFor(std::chrono::milliseconds(10)));
}

TEST(BlockingQueueTest, DeliversInFifoOrderAcrossThreads) {
  BlockingQueue<int> q;
  std::thread producer([&] {
    for (int i = 0; i < 100; ++i)
      q.push(i);
  });
  for (int i = 0; i < 100; ++i) {
    auto v = q.popFor(std::chrono::seconds(1));
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, i);
  }
  producer.join();
  EXPECT_FALSE(q.popFor(std::chrono::milliseconds(0)));
}

// ---------------------------------------------------------------------------
// player wire format
// ---------------------------------------------------------------------------
TEST(PlayerWireTest, CommandsAreJsonLines) {
  const auto wire = Command::queueNext("Teardrop by Massive Attack").toWire();
  ASSERT_GE(wire.size(), 2u);
  EXPECT_EQ(wire.substr(wire.size() - 2), "\r\n");
  const auto j = nlohmann::json::parse(wire.substr(0, wire.size() - 2));
  EXPECT_EQ(j.at("command"), "queue_next");
  EXPECT_EQ(j.at("payload").at("query"), "Teardrop by Massive Attack");

  EXPECT_DOUBLE_EQ(Command::setVolume(3.0).payload.at("volume").get<double>(), 1.0);
  EXPECT_EQ(Command::simple(PlaybackVerb::Pause).payload, nlohmann::json::object());
}

TEST(PlayerWireTest, ParsesTrackChangedAndEnd) {
  const auto changed = Response::fromWire(R"({"event":"track_changed","data":{"title":"Angel","artist":"Massive Attack"}})");
  ASSERT_TRUE(changed);
  ASSERT_TRUE(changed->track());
  EXPECT_EQ(changed->track()->id(), "Angel-Massive Attack");

  const auto ended = Response::fromWire(R"({"event":"track_changed","data":null})");
  ASSERT_TRUE(ended);
  EXPECT_FALSE(ended->track());

  const auto queued = Response::fromWire(R"({"event":"queued","data":{"title":"Angel"}})");
  ASSERT_TRUE(queued);
  EXPECT_EQ(queued->kind, PlayerEventKind::Queued);
}

TEST(PlayerWireTest, RejectsMalformedOrUnknownEvents) {
  EXPECT_FALSE(Response::fromWire("not json"));
  EXPECT_FALSE(Response::fromWire(R"({"event":"volume_changed"})"));
  EXPECT_FALSE(Response::fromWire(R"([1,2,3])"));
}
