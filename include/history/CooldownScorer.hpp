#pragma once
/** @file  CooldownScorer.hpp
 *  @brief Decay-recovered anti-repetition weight for a (title, artist) candidate.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <memory>
#include <optional>
#include <string>

// VibeDJ headers
#include "core/TimeUtil.hpp"

namespace vibedj::history {

  class HistoryStore;

  /**
 * @struct CooldownPolicy
 * @brief Linear recovery rates. A track fully recovers in ~20 days, an artist in ~10.
 */
  struct CooldownPolicy {
    double trackRecoveryPerDay{ 0.05 };
    double artistRecoveryPerDay{ 0.10 };
    double minWeight{ 0.01 };          ///< floor for each component and for the product
    double unknownElapsedDays{ 9999.0 }; ///< elapsed time assumed when there is no timestamp
  };

  /**
 * @class CooldownScorer
 * @brief score = max(floor, min(1, track * artist)); never-played tracks score 1.0.
 */
  class CooldownScorer {
  public:
    explicit CooldownScorer(std::shared_ptr<HistoryStore> history, CooldownPolicy policy = {},
                            core::ClockFn clock = core::systemNow);

    double score(const std::string& title, const std::string& artist) const;
    double score(const std::string& title, const std::string& artist, core::TimePoint now) const;

    /// clamp01(rate * days), floored at `policy.minWeight`.
    static double component(double ratePerDay, std::optional<double> hoursSince,
                            const CooldownPolicy& policy);

    const CooldownPolicy& policy() const { return policy_; }

  private:
    std::shared_ptr<HistoryStore> history_;
    CooldownPolicy policy_;
    core::ClockFn clock_;
  };

} // namespace vibedj::history
