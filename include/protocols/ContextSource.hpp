#pragma once
/** @file  ContextSource.hpp
 *  @brief Read-only view of the assistant's calendar and chat, consumed by the planner.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <string>
#include <vector>

// third-party headers
#include <nlohmann/json.hpp>

// VibeDJ headers
#include "core/TimeUtil.hpp"

namespace vibedj::protocols {

  struct ChatMessage {
    core::TimePoint timestamp;
    std::string sender;
    std::string content;
  };

  /**
 * @class ContextSource
 * @brief Interface over the external collaborators that know about the user's day.
 *
 *  * Called from the coordinator thread only.
 *  * Implementations report unavailability by returning empty results, never by throwing.
 */
  class ContextSource {
  public:
    virtual ~ContextSource() = default;

    /// Music-scoped chat strictly newer than \p cutoff, oldest first, at most \p limit entries.
    virtual std::vector<ChatMessage> recentChatSince(core::TimePoint cutoff, std::size_t limit) = 0;

    /// Today's calendar events, passed to the Vibe Oracle verbatim.
    virtual nlohmann::json calendarEvents() = 0;
  };

} // namespace vibedj::protocols
