// VibeDJ-Prod headers
#include "core/ErrorMonitor.hpp"
#include "core/PlaybackClient.hpp"
#include "protocols/Command.hpp"

// VibeDJ-Fake headers
#include "FakeSocketChannel.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>

namespace vibedj::test {

  using core::ErrorMonitor;
  using core::PlaybackClient;
  using ::testing::HasSubstr;

  class PlaybackClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();

      auto fake = std::make_unique<FakeSocketChannel>();
      channel = fake.get(); // raw ptr for assertions
      client = std::make_unique<PlaybackClient>(std::static_pointer_cast<ErrorMonitor>(errorMonitor),
                                                std::move(fake), "127.0.0.1", 8765);
    }

    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    FakeSocketChannel* channel{ nullptr };
    std::unique_ptr<PlaybackClient> client;
  };

  TEST_F(PlaybackClientTest, ConnectOpensChannelOnce) {
    client->connect();
    EXPECT_TRUE(channel->open_called);
    EXPECT_TRUE(client->connected());

    channel->open_called = false;
    client->connect();
    EXPECT_FALSE(channel->open_called);
  }

  TEST_F(PlaybackClientTest, ConnectFailureThrowsAndEscalates) {
    channel->open_success = false;
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("connect failed"))).Times(1);
    EXPECT_THROW(client->connect(), std::runtime_error);
    EXPECT_FALSE(client->connected());
  }

  TEST_F(PlaybackClientTest, SendWithoutConnectionReturnsFalse) {
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("not connected"))).Times(1);
    EXPECT_FALSE(client->play());
    EXPECT_TRUE(channel->written.empty());
  }

  TEST_F(PlaybackClientTest, QueueNextWritesWireFormat) {
    client->connect();
    ASSERT_TRUE(client->queueNext("Teardrop by Massive Attack"));
    ASSERT_EQ(channel->written.size(), 1u);
    EXPECT_EQ(channel->lastWritten(),
              protocols::Command::queueNext("Teardrop by Massive Attack").toWire());
  }

  TEST_F(PlaybackClientTest, EmptyQueriesAreRejectedLocally) {
    client->connect();
    EXPECT_FALSE(client->queueNext(""));
    EXPECT_FALSE(client->searchAndPlay(""));
    EXPECT_TRUE(channel->written.empty());
  }

  TEST_F(PlaybackClientTest, WriteFailureIsReported) {
    client->connect();
    channel->write_success = false;
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("failed to write 'pause'"))).Times(1);
    EXPECT_FALSE(client->pause());
  }

  TEST_F(PlaybackClientTest, OversizedCommandIsDropped) {
    client->connect();
    EXPECT_FALSE(client->searchAndPlay(std::string(5000, 'x')));
    EXPECT_TRUE(channel->written.empty());
  }

  TEST_F(PlaybackClientTest, AwaitEventSkipsMalformedLines) {
    client->connect();
    channel->reads = { "garbage", R"({"event":"unknown"})",
                       R"({"event":"track_changed","data":{"title":"Angel","artist":"Massive Attack"}})" };
    const auto ev = client->awaitEvent(std::chrono::milliseconds(200));
    ASSERT_TRUE(ev);
    ASSERT_TRUE(ev->track());
    EXPECT_EQ(ev->track()->title, "Angel");
    EXPECT_FALSE(client->awaitEvent(std::chrono::milliseconds(10)));
  }

  TEST(PlaybackClientCtorTest, RejectsNullDependencies) {
    EXPECT_THROW(PlaybackClient(nullptr, std::make_unique<FakeSocketChannel>(), "h", 1), std::invalid_argument);
    EXPECT_THROW(PlaybackClient(std::make_shared<ErrorMonitor>(), nullptr, "h", 1), std::invalid_argument);
  }

} // namespace vibedj::test
