/* @file CooldownScorer.cpp
 * @brief track x artist cooldown weights from play history
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <stdexcept>

// VibeDJ headers
#include "history/CooldownScorer.hpp"
#include "history/HistoryStore.hpp"

using namespace vibedj::history;

CooldownScorer::CooldownScorer(std::shared_ptr<HistoryStore> history, CooldownPolicy policy,
                               core::ClockFn clock)
    : history_(std::move(history)), policy_(policy), clock_(std::move(clock)) {
  if (!history_)
    throw std::invalid_argument("[CooldownScorer] history store is nullptr");
  if (!clock_)
    clock_ = core::systemNow;
}

double CooldownScorer::component(double ratePerDay, std::optional<double> hoursSince,
                                 const CooldownPolicy& policy) {
  double days = policy.unknownElapsedDays;
  if (hoursSince && std::isfinite(*hoursSince))
    days = std::max(0.0, *hoursSince) / 24.0;

  const double w = std::clamp(ratePerDay * days, 0.0, 1.0);
  return std::max(w, policy.minWeight);
}

double CooldownScorer::score(const std::string& title, const std::string& artist) const {
  return score(title, artist, clock_());
}

double CooldownScorer::score(const std::string& title, const std::string& artist,
                             core::TimePoint now) const {
  const auto stats = history_->stats(title, artist, now);
  if (!stats.found)
    return 1.0;

  const double track = component(policy_.trackRecoveryPerDay, stats.hoursSinceLast, policy_);
  const double art =
      component(policy_.artistRecoveryPerDay, history_->artistHoursSinceLast(artist, now), policy_);
  return std::max(policy_.minWeight, std::min(1.0, track * art));
}
