#pragma once
/** @file  Command.hpp
 *  @brief Outbound playback command envelope `{command, payload}` with toWire.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

namespace vibedj {
  namespace protocols {

    enum class PlaybackVerb : std::uint8_t {
      Play,
      Pause,
      Next,
      Previous,
      SearchAndPlay,
      SetVolume,
      QueueNext,
      Count
    };
    static_assert(static_cast<std::uint8_t>(PlaybackVerb::Count) == 7,
                  "PlaybackVerb count changed please update code that depends on it");

    inline const char* toString(PlaybackVerb v) {
      switch (v) {
      case PlaybackVerb::Play:
        return "play";
      case PlaybackVerb::Pause:
        return "pause";
      case PlaybackVerb::Next:
        return "next";
      case PlaybackVerb::Previous:
        return "previous";
      case PlaybackVerb::SearchAndPlay:
        return "search_and_play";
      case PlaybackVerb::SetVolume:
        return "set_volume";
      case PlaybackVerb::QueueNext:
        return "queue_next";
      default:
        return "unknown";
      }
    }

    struct Command {
      PlaybackVerb verb{ PlaybackVerb::Play };
      nlohmann::json payload = nlohmann::json::object();

      /// One JSON line terminated by "\r\n".
      std::string toWire() const;

      static Command simple(PlaybackVerb v) { return Command{ v, nlohmann::json::object() }; }
      static Command searchAndPlay(const std::string& query);
      static Command queueNext(const std::string& query);
      /// \p volume is clamped to [0,1].
      static Command setVolume(double volume);
    };

  } // namespace protocols
} // namespace vibedj
