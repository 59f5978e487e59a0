/* @file VibePlan.cpp
 * @brief Vibe Oracle response parsing and JSON serialization of plan types
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <numeric>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// VibeDJ headers
#include "core/Errors.hpp"
#include "core/VibePlan.hpp"

namespace vibedj::core {

  namespace {

    std::vector<std::string> stringList(const nlohmann::json& j, const char* key) {
      std::vector<std::string> out;
      const auto it = j.find(key);
      if (it == j.end() || !it->is_array())
        return out;
      for (const auto& v : *it) {
        if (v.is_string() && !v.get<std::string>().empty())
          out.push_back(v.get<std::string>());
      }
      return out;
    }

    std::string stringOr(const nlohmann::json& j, const char* key, const std::string& fallback) {
      const auto it = j.find(key);
      if (it == j.end() || !it->is_string())
        return fallback;
      return it->get<std::string>();
    }

    int requireInt(const nlohmann::json& j, const char* key, int lo, int hi) {
      const auto it = j.find(key);
      if (it == j.end() || !it->is_number())
        throw OracleError(std::string("[VibePlan] missing numeric field: ") + key);
      const double v = it->get<double>();
      if (v < lo || v > hi)
        throw OracleError(std::string("[VibePlan] ") + key + " out of range: " + std::to_string(v));
      return static_cast<int>(v);
    }

    std::optional<AudioTargets> targetsAt(const nlohmann::json& j, const char* key) {
      const auto it = j.find(key);
      if (it == j.end() || !it->is_object())
        return std::nullopt;
      return it->get<AudioTargets>();
    }

  } // namespace

  int VibePlan::phaseMinutesTotal() const {
    return std::accumulate(phases.begin(), phases.end(), 0,
                           [](int acc, const Phase& p) { return acc + p.durationMinutes; });
  }

  void to_json(nlohmann::json& j, const AudioTargets& t) {
    j = nlohmann::json::object();
    for (auto f : kAllFeatures)
      j[toString(f)] = t.get(f);
  }

  void from_json(const nlohmann::json& j, AudioTargets& t) {
    if (!j.is_object())
      return;
    for (auto f : kAllFeatures) {
      const auto it = j.find(toString(f));
      if (it != j.end() && it->is_number())
        t.set(f, it->get<double>());
    }
  }

  void to_json(nlohmann::json& j, const MusicFilters& f) {
    j = nlohmann::json{ { "include_genres", f.includeGenres },
                        { "exclude_genres", f.excludeGenres },
                        { "include_artists", f.includeArtists },
                        { "exclude_artists", f.excludeArtists },
                        { "include_keywords", f.includeKeywords } };
    if (!f.note.empty())
      j["note"] = f.note;
  }

  void from_json(const nlohmann::json& j, MusicFilters& f) {
    f.includeGenres = stringList(j, "include_genres");
    f.excludeGenres = stringList(j, "exclude_genres");
    f.includeArtists = stringList(j, "include_artists");
    f.excludeArtists = stringList(j, "exclude_artists");
    f.includeKeywords = stringList(j, "include_keywords");
    f.note = stringOr(j, "note", "");
  }

  void to_json(nlohmann::json& j, const Phase& p) {
    j = nlohmann::json{ { "duration_minutes", p.durationMinutes }, { "note", p.note } };
    if (p.hold)
      j["targets"] = *p.hold;
    if (p.start)
      j["targets_start"] = *p.start;
    if (p.end)
      j["targets_end"] = *p.end;
  }

  void to_json(nlohmann::json& j, const VibePlan& p) {
    j = nlohmann::json{ { "verbal_plan", p.verbalPlan },
                        { "current_context_block", p.contextBlock },
                        { "context_block_ends", p.contextBlockEnds },
                        { "plan_duration_minutes", p.planDurationMinutes },
                        { "phases", p.phases },
                        { "current_mood", p.currentMood },
                        { "current_energy", p.currentEnergy },
                        { "anxiety_level", p.anxietyLevel },
                        { "is_continuation", p.isContinuation },
                        { "reasoning", p.reasoning } };
    j["music_filters"] = p.musicFilters ? nlohmann::json(*p.musicFilters) : nlohmann::json();
    if (!p.changeReason.empty())
      j["change_reason"] = p.changeReason;
  }

  void to_json(nlohmann::json& j, const VibeTargets& t) {
    j = nlohmann::json{ { "audio_targets", t.audio },
                        { "energy_target", t.energyTarget },
                        { "valence_target", t.valenceTarget },
                        { "vocal_tolerance", t.vocalTolerance },
                        { "context_block", t.contextBlock },
                        { "verbal_plan", t.verbalPlan },
                        { "phase_note", t.phaseNote },
                        { "phase_progress", t.phaseProgress },
                        { "current_mood", t.currentMood },
                        { "current_energy", t.currentEnergy },
                        { "anxiety_level", t.anxietyLevel } };
    j["music_filters"] = t.musicFilters ? nlohmann::json(*t.musicFilters) : nlohmann::json();
  }

  VibePlan parseVibePlan(const nlohmann::json& j) {
    if (!j.is_object())
      throw OracleError("[VibePlan] response is not an object");

    VibePlan plan;
    plan.verbalPlan = stringOr(j, "verbal_plan", "");
    plan.contextBlock = stringOr(j, "current_context_block", "");
    plan.contextBlockEnds = stringOr(j, "context_block_ends", "");
    plan.planDurationMinutes = requireInt(j, "plan_duration_minutes", kMinPlanMinutes, kMaxPlanMinutes);

    const auto phases = j.find("phases");
    if (phases == j.end() || !phases->is_array() || phases->empty() || phases->size() > kMaxPhases)
      throw OracleError("[VibePlan] phases must be an array of 1-3 entries");

    for (const auto& pj : *phases) {
      if (!pj.is_object())
        throw OracleError("[VibePlan] phase is not an object");
      Phase phase;
      phase.durationMinutes = requireInt(pj, "duration_minutes", kMinPhaseMinutes, kMaxPhaseMinutes);
      phase.hold = targetsAt(pj, "targets");
      phase.start = targetsAt(pj, "targets_start");
      phase.end = targetsAt(pj, "targets_end");
      phase.note = stringOr(pj, "note", "");
      plan.phases.push_back(std::move(phase));
    }

    const auto filters = j.find("music_filters");
    if (filters != j.end() && filters->is_object())
      plan.musicFilters = filters->get<MusicFilters>();

    plan.currentMood = stringOr(j, "current_mood", "unknown");
    plan.currentEnergy = stringOr(j, "current_energy", "unknown");
    plan.anxietyLevel = stringOr(j, "anxiety_level", "calm");
    const auto cont = j.find("is_continuation");
    plan.isContinuation = cont != j.end() && cont->is_boolean() && cont->get<bool>();
    plan.changeReason = stringOr(j, "change_reason", "");
    plan.reasoning = stringOr(j, "reasoning", "");
    return plan;
  }

} // namespace vibedj::core
