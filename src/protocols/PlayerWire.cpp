/* @file PlayerWire.cpp
 * @brief JSON-lines framing of playback commands and player events
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// VibeDJ headers
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

using namespace vibedj::protocols;

std::string Command::toWire() const {
  nlohmann::json j{ { "command", toString(verb) }, { "payload", payload } };
  return j.dump() + "\r\n";
}

Command Command::searchAndPlay(const std::string& query) {
  return Command{ PlaybackVerb::SearchAndPlay, { { "query", query } } };
}

Command Command::queueNext(const std::string& query) {
  return Command{ PlaybackVerb::QueueNext, { { "query", query } } };
}

Command Command::setVolume(double volume) {
  const double v = std::isfinite(volume) ? std::clamp(volume, 0.0, 1.0) : 0.0;
  return Command{ PlaybackVerb::SetVolume, { { "volume", v } } };
}

std::optional<TrackInfo> Response::track() const {
  if (kind != PlayerEventKind::TrackChanged || !data.is_object())
    return std::nullopt;
  const auto title = data.find("title");
  if (title == data.end() || !title->is_string() || title->get<std::string>().empty())
    return std::nullopt;

  TrackInfo info;
  info.title = title->get<std::string>();
  const auto artist = data.find("artist");
  if (artist != data.end() && artist->is_string())
    info.artist = artist->get<std::string>();
  return info;
}

std::optional<Response> Response::fromWire(const std::string& line) {
  auto j = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object())
    return std::nullopt;

  const auto event = j.find("event");
  if (event == j.end() || !event->is_string())
    return std::nullopt;

  Response r;
  const auto name = event->get<std::string>();
  if (name == "track_changed")
    r.kind = PlayerEventKind::TrackChanged;
  else if (name == "queued")
    r.kind = PlayerEventKind::Queued;
  else
    return std::nullopt;

  const auto data = j.find("data");
  if (data != j.end())
    r.data = *data;
  return r;
}
