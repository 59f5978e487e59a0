#pragma once
/** @file  PlaybackClient.hpp
 *  @brief Command/event multiplexer for the remote player channel.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// VibeDJ headers
#include "core/ErrorMonitor.hpp" // PlaybackClient is a client to the error monitor
#include "io/SocketChannel.hpp"  // PlaybackClient owns its SocketChannel
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace vibedj {
  namespace core {

    /// How `playSong` hands a query to the player.
    enum class PlayMode : std::uint8_t { QueueNext, SearchAndPlay };

    inline const char* toString(PlayMode m) {
      switch (m) {
      case PlayMode::QueueNext:
        return "queue_next";
      case PlayMode::SearchAndPlay:
        return "search_and_play";
      default:
        return "unknown";
      }
    }

    /**
 * @class PlaybackClient
 * @brief Sends `{command, payload}` lines and reads player events from one socket.
 *
 *  * Writes are serialized by a mutex; `awaitEvent` is meant for a single reader thread.
 *  * Runtime send failures return false and are reported to the ErrorMonitor.
 */
    class PlaybackClient {
    public:
      PlaybackClient(std::shared_ptr<ErrorMonitor> errMonitor, std::unique_ptr<io::SocketChannel> channel,
                     std::string host, std::uint16_t port);
      virtual ~PlaybackClient() = default;

      //---public APIs------------------------------------------------------
      void connect(); ///<- opens the SocketChannel, throws std::runtime_error on failure
      bool connected() const;

      virtual bool sendCommand(const protocols::Command& cmd);

      bool play();
      bool pause();
      bool next();
      bool previous();
      bool searchAndPlay(const std::string& query);
      bool setVolume(double volume);
      bool queueNext(const std::string& query);

      /// Next well-formed player event, or nullopt on timeout / disconnect.
      std::optional<protocols::Response> awaitEvent(std::chrono::milliseconds timeout);

    protected:
      PlaybackClient() = default; ///< for mocks that never touch a socket

    private:
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::unique_ptr<io::SocketChannel> channel_;
      std::string host_;
      std::uint16_t port_{ 0 };
      std::mutex writeMtx_;
    };

  } // namespace core
} // namespace vibedj
