#pragma once
/** @file  VibePlanner.hpp
 *  @brief Owns the active VibePlan: recheck policy, chat signature and phase interpolation.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

// third-party headers
#include <nlohmann/json_fwd.hpp>

// VibeDJ headers
#include "core/TimeUtil.hpp"
#include "core/VibePlan.hpp"
#include "protocols/VibeOracle.hpp"

namespace vibedj::core {

  struct PlannerSettings {
    std::chrono::minutes recheckInterval{ 30 };
    std::chrono::seconds failureBackoff{ 60 };
    int defaultPlanMinutes{ 60 };
    std::size_t signatureWindow{ 5 };    ///< trailing chat messages hashed into the signature
    std::size_t signatureContentChars{ 200 };
  };

  /**
 * @class VibePlanner
 * @brief Decides when to ask the Vibe Oracle for a new plan and interpolates "now" targets.
 *
 *  * Not thread-safe: owned and driven by the coordinator thread.
 *  * Every time-dependent call takes `now` explicitly so tests control the clock.
 *  * Oracle failures are absorbed here: the previous plan (or defaults) stays in effect.
 */
  class VibePlanner {
  public:
    explicit VibePlanner(std::shared_ptr<protocols::VibeOracle> oracle, PlannerSettings settings = {});

    //---public API------------------------------------------------------
    /// Forget the plan, the check timestamps, the chat markers and any failure backoff.
    void clear();

    /**
     * @brief Ask the oracle for a new plan when one is due.
     *
     * A recheck is due when the chat signature changed since the last check, there is no plan,
     * the recheck interval elapsed, or the plan duration elapsed. A recent failure suppresses
     * the call for `failureBackoff`. The chat marker advances even when the oracle fails.
     *
     * @param request day/calendar/chat context; `previousState` is filled in here.
     * @returns true when a new plan was adopted.
     */
    bool ensureFreshPlan(protocols::VibeRequest request, TimePoint now);

    VibeTargets targets(TimePoint now) const;

    /// Null when there is no plan.
    nlohmann::json planDebug(TimePoint now) const;

    bool hasPlan() const { return plan_.has_value(); }
    const std::optional<VibePlan>& plan() const { return plan_; }

    //---pure helpers----------------------------------------------------
    /// FNV-1a 64 over the trailing window of messages; nullopt for an empty window.
    static std::optional<std::uint64_t> chatSignature(const std::vector<protocols::ChatMessage>& chat,
                                                      std::size_t window = 5,
                                                      std::size_t contentChars = 200);

    /// Hold phases are constant; gradients interpolate each slider; anything else yields defaults.
    static AudioTargets interpolate(const Phase& phase, double progress);

    /// Adds the legacy scalars to \p audio.
    static VibeTargets decorate(const AudioTargets& audio);

  private:
    bool needsRecheck(TimePoint now) const;

    std::shared_ptr<protocols::VibeOracle> oracle_;
    PlannerSettings settings_;

    std::optional<VibePlan> plan_;
    std::optional<TimePoint> planStart_;
    std::optional<TimePoint> lastCheck_;
    std::optional<TimePoint> lastFailure_;
    std::optional<std::uint64_t> lastChatSigSeen_; ///< advances even on failure
  };

} // namespace vibedj::core
