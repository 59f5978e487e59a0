// VibeDJ-Prod headers
#include "core/Errors.hpp"
#include "core/RemoteOracle.hpp"
#include "protocols/RecommenderOracle.hpp"
#include "protocols/VibeOracle.hpp"

// VibeDJ-Fake headers
#include "FakeSocketChannel.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace vibedj::test {

  using core::OracleError;
  using core::OracleRpcClient;
  using nlohmann::json;

  namespace {

    /// Answers every request with `result` under the request's own id.
    void answerWith(FakeSocketChannel& ch, json result) {
      ch.onWrite = [result](const std::string& line, std::deque<std::string>& reads) {
        const auto req = json::parse(line);
        reads.push_back(json{ { "id", req.at("id") }, { "result", result } }.dump());
      };
    }

    json planResult() {
      return json::parse(R"({"verbal_plan":"steady","current_context_block":"evening",
        "plan_duration_minutes":30,"phases":[{"duration_minutes":30,"targets":{"energy":40}}]})");
    }

  } // namespace

  class OracleRpcClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
      auto fake = std::make_unique<FakeSocketChannel>();
      channel = fake.get();
      client = std::make_shared<OracleRpcClient>(std::move(fake), "127.0.0.1", 8766, std::chrono::milliseconds(200));
    }

    FakeSocketChannel* channel{ nullptr };
    std::shared_ptr<OracleRpcClient> client;
  };

  TEST_F(OracleRpcClientTest, SendsIdMethodParamsAndReturnsResult) {
    answerWith(*channel, json{ { "ok", true } });
    const auto result = client->call("ping", json{ { "x", 1 } });
    EXPECT_TRUE(channel->open_called);
    EXPECT_EQ(result, (json{ { "ok", true } }));

    const auto sent = json::parse(channel->lastWritten());
    EXPECT_EQ(sent.at("method"), "ping");
    EXPECT_EQ(sent.at("params").at("x"), 1);
    EXPECT_TRUE(sent.at("id").is_number_unsigned());
  }

  TEST_F(OracleRpcClientTest, SkipsStaleAndMalformedReplies) {
    channel->onWrite = [](const std::string& line, std::deque<std::string>& reads) {
      const auto id = json::parse(line).at("id").get<std::uint64_t>();
      reads.push_back("{not json");
      reads.push_back(json{ { "id", id + 100 }, { "result", "stale" } }.dump());
      reads.push_back(json{ { "id", id }, { "result", "fresh" } }.dump());
    };
    EXPECT_EQ(client->call("ping", json::object()), "fresh");
  }

  TEST_F(OracleRpcClientTest, ErrorFieldBecomesOracleError) {
    channel->onWrite = [](const std::string& line, std::deque<std::string>& reads) {
      reads.push_back(json{ { "id", json::parse(line).at("id") }, { "error", "model overloaded" } }.dump());
    };
    try {
      client->call("recommend", json::object());
      FAIL() << "expected OracleError";
    } catch (const OracleError& e) {
      EXPECT_NE(std::string(e.what()).find("model overloaded"), std::string::npos);
    }
  }

  TEST_F(OracleRpcClientTest, MissingReplyTimesOut) {
    EXPECT_THROW(client->call("vibe_check", json::object()), OracleError);
  }

  TEST_F(OracleRpcClientTest, UnreachableOracleThrows) {
    channel->open_success = false;
    EXPECT_THROW(client->call("vibe_check", json::object()), OracleError);
    EXPECT_TRUE(channel->written.empty());
  }

  TEST_F(OracleRpcClientTest, VibeOracleParsesThePlan) {
    answerWith(*channel, planResult());
    core::RemoteVibeOracle oracle(client);
    protocols::VibeRequest req;
    req.dayOfWeek = "Friday";
    const auto plan = oracle.requestPlan(req);
    EXPECT_EQ(plan.contextBlock, "evening");
    ASSERT_EQ(plan.phases.size(), 1u);
    EXPECT_EQ(plan.phases[0].hold->energy, 40);

    const auto sent = json::parse(channel->lastWritten());
    EXPECT_EQ(sent.at("method"), "vibe_check");
    EXPECT_EQ(sent.at("params").at("day_of_week"), "Friday");
    EXPECT_FALSE(sent.at("params").contains("previous_state"));
  }

  TEST_F(OracleRpcClientTest, VibeOracleRejectsBrokenPlan) {
    answerWith(*channel, json{ { "phases", json::array() } });
    core::RemoteVibeOracle oracle(client);
    EXPECT_THROW(oracle.requestPlan(protocols::VibeRequest{}), OracleError);
  }

  TEST_F(OracleRpcClientTest, RecommenderRoundTrip) {
    answerWith(*channel, json::parse(R"({"candidates":[
        {"title":" Teardrop ","artist":"Massive Attack","reasoning":"calm"},
        {"search_query":"Angel by Massive Attack"},
        "not an object"]})"));
    core::RemoteRecommenderOracle oracle(client);

    protocols::RecommendRequest req;
    req.dayOfWeek = "Friday";
    protocols::ProvidedSong song;
    song.title = "Teardrop";
    song.artist = "Massive Attack";
    song.genre = "trip-hop";
    req.providedSongs.push_back(song);

    const auto rec = oracle.recommend(req);
    ASSERT_EQ(rec.candidates.size(), 2u);
    EXPECT_EQ(rec.candidates[0].title, "Teardrop");
    EXPECT_EQ(rec.candidates[1].searchQuery, "Angel by Massive Attack");
    EXPECT_FALSE(rec.skipMusic);

    const auto params = json::parse(channel->lastWritten()).at("params");
    EXPECT_EQ(params.at("provided_songs").size(), 1u);
    EXPECT_EQ(params.at("provided_songs")[0].at("genre"), "trip-hop");
    EXPECT_TRUE(params.at("last_played").is_null());
    EXPECT_TRUE(params.at("vibe_targets").is_object());
  }

  TEST(RecommendationParseTest, SkipWithoutReasonGetsDefault) {
    const auto rec = protocols::parseRecommendation(json{ { "skip_music", true } });
    EXPECT_TRUE(rec.skipMusic);
    EXPECT_EQ(rec.skipReason, "skip");
    EXPECT_THROW(protocols::parseRecommendation(json::array()), OracleError);
  }

} // namespace vibedj::test
