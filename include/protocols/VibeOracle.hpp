#pragma once
/** @file  VibeOracle.hpp
 *  @brief Abstract base class for the black-box planner that turns context into a VibePlan.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// third-party headers
#include <nlohmann/json.hpp>

// VibeDJ headers
#include "core/VibePlan.hpp"
#include "protocols/ContextSource.hpp"

namespace vibedj::protocols {

  /// Snapshot of the running plan so the oracle can decide to continue or replace it.
  struct PreviousPlanState {
    std::string verbalPlan;
    std::string contextBlock;
    int planDurationMinutes{ 0 };
    double elapsedMinutes{ 0.0 };
    core::AudioTargets currentTargets;
    std::string currentPhaseNote;
    std::optional<core::MusicFilters> musicFilters;
  };

  struct VibeRequest {
    std::string dayOfWeek;
    nlohmann::json calendarEvents = nlohmann::json::array();
    std::vector<ChatMessage> recentChat;
    std::optional<PreviousPlanState> previousState;
  };

  /**
 * @class VibeOracle
 * @brief Common polymorphic interface for every plan source (remote RPC, scripted fakes).
 *
 *  * Runs synchronously on the caller's thread (the coordinator loop).
 *  * Treated as a pure function: same request, same kind of answer.
 */
  class VibeOracle {
  public:
    virtual ~VibeOracle() = default;

    /**
     * @brief Ask for a fresh plan.
     * @throws core::OracleError when the oracle is unreachable or violates its contract.
     */
    virtual core::VibePlan requestPlan(const VibeRequest& request) = 0;
  };

  /// Wire form: {day_of_week, calendar_events[], recent_chat[], previous_state?}
  nlohmann::json toJson(const VibeRequest& request);

} // namespace vibedj::protocols
