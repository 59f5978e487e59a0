/* @file VibePlanner.cpp
 * @brief plan lifecycle (recheck, backoff) and per-phase slider interpolation
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/Errors.hpp"
#include "core/Logging.hpp"
#include "core/VibePlanner.hpp"

using namespace vibedj::core;

namespace {

  constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
  constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

  double round2(double v) { return std::nearbyint(v * 100.0) / 100.0; }
  double round1(double v) { return std::nearbyint(v * 10.0) / 10.0; }

  struct PhasePosition {
    const Phase* phase{ nullptr };
    double progress{ 0.0 };
  };

  /// Phase containing \p elapsedMinutes; past the end the last phase is held at its own offset.
  PhasePosition locate(const std::vector<Phase>& phases, double elapsedMinutes) {
    PhasePosition pos;
    if (phases.empty())
      return pos;

    double phaseStart = 0.0;
    for (const auto& p : phases) {
      if (elapsedMinutes < phaseStart + p.durationMinutes) {
        pos.phase = &p;
        break;
      }
      phaseStart += p.durationMinutes;
    }
    if (pos.phase == nullptr) {
      pos.phase = &phases.back();
      phaseStart -= phases.back().durationMinutes;
    }

    const double duration = pos.phase->durationMinutes;
    if (duration > 0)
      pos.progress = std::clamp((elapsedMinutes - phaseStart) / duration, 0.0, 1.0);
    return pos;
  }

} // namespace

VibePlanner::VibePlanner(std::shared_ptr<protocols::VibeOracle> oracle, PlannerSettings settings)
    : oracle_(std::move(oracle)), settings_(settings) {
  if (!oracle_)
    throw std::invalid_argument("[VibePlanner] vibe oracle is nullptr");
}

void VibePlanner::clear() {
  plan_.reset();
  planStart_.reset();
  lastCheck_.reset();
  lastFailure_.reset();
  lastChatSigSeen_.reset();
}

bool VibePlanner::needsRecheck(TimePoint now) const {
  if (!plan_ || !planStart_ || !lastCheck_)
    return true;
  if (now - *lastCheck_ >= settings_.recheckInterval)
    return true;

  const int duration =
      plan_->planDurationMinutes > 0 ? plan_->planDurationMinutes : settings_.defaultPlanMinutes;
  return minutesBetween(*planStart_, now) >= duration;
}

bool VibePlanner::ensureFreshPlan(protocols::VibeRequest request, TimePoint now) {
  auto log = logging::get("planner");

  const auto chatSig =
      chatSignature(request.recentChat, settings_.signatureWindow, settings_.signatureContentChars);
  if (chatSig && chatSig != lastChatSigSeen_) {
    log->info("recheck triggered by new chat");
  } else if (!needsRecheck(now)) {
    return false;
  }

  if (lastFailure_ && now - *lastFailure_ < settings_.failureBackoff)
    return false;

  lastChatSigSeen_ = chatSig;
  lastCheck_ = now;

  if (plan_ && planStart_) {
    const auto current = targets(now);
    protocols::PreviousPlanState prev;
    prev.verbalPlan = plan_->verbalPlan;
    prev.contextBlock = plan_->contextBlock;
    prev.planDurationMinutes = plan_->planDurationMinutes;
    prev.elapsedMinutes = round1(minutesBetween(*planStart_, now));
    prev.currentTargets = current.audio;
    prev.currentPhaseNote = current.phaseNote;
    prev.musicFilters = plan_->musicFilters;
    request.previousState = std::move(prev);
  }

  try {
    VibePlan fresh = oracle_->requestPlan(request);
    if (fresh.phaseMinutesTotal() != fresh.planDurationMinutes) {
      log->warn("phase durations sum to {} min but plan_duration_minutes={}; using phases as given",
                fresh.phaseMinutesTotal(), fresh.planDurationMinutes);
    }
    log->info("new plan context_block='{}' duration={}min phases={} continuation={}",
              fresh.contextBlock, fresh.planDurationMinutes, fresh.phases.size(),
              fresh.isContinuation);
    plan_ = std::move(fresh);
    planStart_ = now;
    lastFailure_.reset();
    return true;
  } catch (const OracleError& e) {
    log->warn("vibe check failed, backing off {}s: {}", settings_.failureBackoff.count(), e.what());
  } catch (const std::exception& e) {
    log->error("vibe check raised unexpectedly, backing off: {}", e.what());
  }
  lastFailure_ = now;
  return false;
}

VibeTargets VibePlanner::targets(TimePoint now) const {
  if (!plan_ || !planStart_ || plan_->phases.empty())
    return decorate(AudioTargets{});

  const auto pos = locate(plan_->phases, minutesBetween(*planStart_, now));
  VibeTargets out = decorate(interpolate(*pos.phase, pos.progress));
  out.phaseNote = pos.phase->note;
  out.phaseProgress = round2(pos.progress);
  out.contextBlock = plan_->contextBlock.empty() ? "unknown" : plan_->contextBlock;
  out.verbalPlan = plan_->verbalPlan;
  out.currentMood = plan_->currentMood;
  out.currentEnergy = plan_->currentEnergy;
  out.anxietyLevel = plan_->anxietyLevel;
  out.musicFilters = plan_->musicFilters;
  return out;
}

nlohmann::json VibePlanner::planDebug(TimePoint now) const {
  if (!plan_)
    return nullptr;

  const double elapsed = planStart_ ? minutesBetween(*planStart_, now) : 0.0;
  nlohmann::json j{ { "verbal_plan", plan_->verbalPlan },
                    { "context_block", plan_->contextBlock },
                    { "plan_duration_minutes", plan_->planDurationMinutes },
                    { "elapsed_minutes", round1(elapsed) },
                    { "phases", plan_->phases.size() } };
  j["last_vibe_check"] = lastCheck_ ? nlohmann::json(toIsoUtc(*lastCheck_)) : nlohmann::json();
  j["music_filters"] = plan_->musicFilters ? nlohmann::json(*plan_->musicFilters) : nlohmann::json();
  return j;
}

std::optional<std::uint64_t> VibePlanner::chatSignature(const std::vector<protocols::ChatMessage>& chat,
                                                        std::size_t window, std::size_t contentChars) {
  if (chat.empty() || window == 0)
    return std::nullopt;

  std::string joined;
  const std::size_t first = chat.size() > window ? chat.size() - window : 0;
  for (std::size_t i = first; i < chat.size(); ++i) {
    const auto& m = chat[i];
    if (!joined.empty())
      joined += '\n';
    joined += toIsoUtc(m.timestamp);
    joined += '|';
    joined += m.sender;
    joined += '|';
    joined += m.content.substr(0, contentChars);
  }

  std::uint64_t h = kFnvOffset;
  for (unsigned char c : joined) {
    h ^= c;
    h *= kFnvPrime;
  }
  return h;
}

AudioTargets VibePlanner::interpolate(const Phase& phase, double progress) {
  if (phase.hold)
    return *phase.hold;
  if (!phase.start || !phase.end)
    return AudioTargets{};

  const double p = std::isfinite(progress) ? std::clamp(progress, 0.0, 1.0) : 0.0;
  AudioTargets out;
  for (auto f : kAllFeatures) {
    const double a = phase.start->get(f);
    const double b = phase.end->get(f);
    out.set(f, a + (b - a) * p);
  }
  return out;
}

VibeTargets VibePlanner::decorate(const AudioTargets& audio) {
  VibeTargets t;
  t.audio = audio;

  const double energy = std::clamp(static_cast<double>(audio.energy), 0.0, 100.0);
  const double valence = std::clamp(static_cast<double>(audio.valence), 0.0, 100.0);
  const double instr = std::clamp(static_cast<double>(audio.instrumentalness), 0.0, 100.0);

  t.energyTarget = static_cast<int>(std::nearbyint(1.0 + energy / 100.0 * 9.0));
  t.valenceTarget = round2(valence / 100.0 * 2.0 - 1.0);
  t.vocalTolerance = std::clamp(static_cast<int>(std::nearbyint(1.0 + (100.0 - instr) / 100.0 * 9.0)), 1, 10);
  return t;
}
