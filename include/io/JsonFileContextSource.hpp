#pragma once
/** @file  JsonFileContextSource.hpp
 *  @brief ContextSource backed by a JSON file that other processes rewrite.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

#include <string>

#include "protocols/ContextSource.hpp"

namespace vibedj {
  namespace io {

    /**
 * @class JsonFileContextSource
 * @brief Re-reads `{ "calendar_events": [...], "chat": [{time_utc, sender, content}] }` on every call.
 *
 *  A missing or malformed file reads as "no context".
 */
    class JsonFileContextSource : public protocols::ContextSource {
    public:
      explicit JsonFileContextSource(std::string path);

      std::vector<protocols::ChatMessage> recentChatSince(core::TimePoint cutoff, std::size_t limit) override;
      nlohmann::json calendarEvents() override;

    private:
      nlohmann::json load() const;

      std::string path_;
    };

  } // namespace io
} // namespace vibedj
