#pragma once
/** @file  Response.hpp
 *  @brief Inbound player events (`track_changed`, `queued`) with fromWire.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

namespace vibedj {
  namespace protocols {

    /// Track currently reported by the remote player.
    struct TrackInfo {
      std::string title;
      std::string artist;

      /// Identity used for change detection: "<title>-<artist>".
      std::string id() const { return title + "-" + artist; }
    };

    enum class PlayerEventKind : std::uint8_t { TrackChanged, Queued };

    struct Response {
      PlayerEventKind kind{ PlayerEventKind::TrackChanged };
      nlohmann::json data;

      /// For TrackChanged: the new track, or nullopt when playback ended.
      std::optional<TrackInfo> track() const;

      /// Parses `{"event": "...", "data": {...}}`; nullopt on malformed JSON or unknown event.
      static std::optional<Response> fromWire(const std::string& line);
    };

  } // namespace protocols
} // namespace vibedj
