#pragma once
/** @file  VibePlan.hpp
 *  @brief Multi-phase target plan produced by the Vibe Oracle, plus its JSON contract.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// third-party headers
#include <nlohmann/json_fwd.hpp>

// VibeDJ headers
#include "core/AudioFeatures.hpp"

namespace vibedj::core {

  /// User-requested selection constraints ("play blues for a while").
  struct MusicFilters {
    std::vector<std::string> includeGenres;
    std::vector<std::string> excludeGenres;
    std::vector<std::string> includeArtists;
    std::vector<std::string> excludeArtists;
    std::vector<std::string> includeKeywords;
    std::string note;

    bool empty() const {
      return includeGenres.empty() && excludeGenres.empty() && includeArtists.empty() &&
             excludeArtists.empty() && includeKeywords.empty();
    }
  };

  /**
 * @struct Phase
 * @brief One segment of a plan: either a hold (`hold`) or a gradient (`start` -> `end`).
 */
  struct Phase {
    int durationMinutes{ 30 };
    std::optional<AudioTargets> hold;
    std::optional<AudioTargets> start;
    std::optional<AudioTargets> end;
    std::string note;

    bool isHold() const { return hold.has_value(); }
    bool isGradient() const { return !hold && start && end; }
  };

  struct VibePlan {
    std::string verbalPlan;
    std::string contextBlock;
    std::string contextBlockEnds;
    int planDurationMinutes{ 60 };
    std::vector<Phase> phases;
    std::optional<MusicFilters> musicFilters;
    std::string currentMood;
    std::string currentEnergy;
    std::string anxietyLevel;
    bool isContinuation{ false };
    std::string changeReason;
    std::string reasoning;

    /// Sum of phase durations; may differ from planDurationMinutes (oracle is trusted).
    int phaseMinutesTotal() const;
  };

  /**
 * @struct VibeTargets
 * @brief Interpolated targets for "now", plus the legacy scalars and plan context.
 *
 *  Legacy scalars are pure functions of the sliders:
 *  * energyTarget   = round(1 + energy/100 * 9)                       (1..10)
 *  * valenceTarget  = round2(valence/100 * 2 - 1)                     (-1..+1)
 *  * vocalTolerance = clamp(round(1 + (100-instrumentalness)/100 * 9), 1, 10)
 */
  struct VibeTargets {
    AudioTargets audio;
    int energyTarget{ 0 };
    double valenceTarget{ 0.0 };
    int vocalTolerance{ 0 };
    std::string contextBlock{ "unknown" };
    std::string verbalPlan;
    std::string phaseNote;
    double phaseProgress{ 0.0 };
    std::string currentMood{ "unknown" };
    std::string currentEnergy{ "unknown" };
    std::string anxietyLevel{ "calm" };
    std::optional<MusicFilters> musicFilters;
  };

  inline constexpr int kMinPlanMinutes = 15;
  inline constexpr int kMaxPlanMinutes = 60;
  inline constexpr int kMinPhaseMinutes = 5;
  inline constexpr int kMaxPhaseMinutes = 60;
  inline constexpr std::size_t kMaxPhases = 3;

  /// Parses a Vibe Oracle response. Throws `OracleError` on a contract violation.
  VibePlan parseVibePlan(const nlohmann::json& j);

  void to_json(nlohmann::json& j, const AudioTargets& t);
  /// Missing or malformed sliders keep their default value; present values are clamped.
  void from_json(const nlohmann::json& j, AudioTargets& t);

  void to_json(nlohmann::json& j, const MusicFilters& f);
  void from_json(const nlohmann::json& j, MusicFilters& f);

  void to_json(nlohmann::json& j, const Phase& p);
  void to_json(nlohmann::json& j, const VibePlan& p);
  void to_json(nlohmann::json& j, const VibeTargets& t);

} // namespace vibedj::core
