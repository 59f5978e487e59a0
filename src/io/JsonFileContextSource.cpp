/* @file JsonFileContextSource.cpp
 * @brief file-backed calendar and chat context
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <fstream>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/Logging.hpp"
#include "io/JsonFileContextSource.hpp"

using namespace vibedj::io;

namespace {

  std::string stringField(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string{};
  }

} // namespace

JsonFileContextSource::JsonFileContextSource(std::string path) : path_(std::move(path)) {}

nlohmann::json JsonFileContextSource::load() const {
  std::ifstream in(path_);
  if (!in)
    return nlohmann::json::object();
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    vibedj::core::logging::get("app")->warn("context file {} is not a JSON object", path_);
    return nlohmann::json::object();
  }
  return j;
}

std::vector<vibedj::protocols::ChatMessage> JsonFileContextSource::recentChatSince(core::TimePoint cutoff,
                                                                                   std::size_t limit) {
  std::vector<protocols::ChatMessage> out;
  const auto j = load();
  const auto chat = j.find("chat");
  if (chat == j.end() || !chat->is_array())
    return out;

  for (const auto& m : *chat) {
    if (!m.is_object())
      continue;
    const auto ts = core::parseIsoUtc(stringField(m, "time_utc"));
    if (!ts || *ts <= cutoff)
      continue;
    protocols::ChatMessage msg;
    msg.timestamp = *ts;
    msg.sender = stringField(m, "sender");
    msg.content = stringField(m, "content");
    out.push_back(std::move(msg));
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const auto& a, const auto& b) { return a.timestamp < b.timestamp; });
  if (out.size() > limit)
    out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(limit));
  return out;
}

nlohmann::json JsonFileContextSource::calendarEvents() {
  const auto j = load();
  const auto events = j.find("calendar_events");
  if (events == j.end() || !events->is_array())
    return nlohmann::json::array();
  return *events;
}
