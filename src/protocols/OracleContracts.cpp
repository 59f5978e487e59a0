/* @file OracleContracts.cpp
 * @brief request serialization and response parsing for the Vibe and Recommender oracles
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// VibeDJ headers
#include "core/Errors.hpp"
#include "core/SearchQuery.hpp"
#include "core/TimeUtil.hpp"
#include "protocols/RecommenderOracle.hpp"
#include "protocols/VibeOracle.hpp"

namespace vibedj::protocols {

  namespace {

    nlohmann::json chatToJson(const std::vector<ChatMessage>& chat) {
      auto out = nlohmann::json::array();
      for (const auto& m : chat) {
        out.push_back({ { "time_utc", core::toIsoUtc(m.timestamp) },
                        { "sender", m.sender },
                        { "content", m.content } });
      }
      return out;
    }

    nlohmann::json snapshotToJson(const core::SliderSnapshot& s) {
      auto out = nlohmann::json::object();
      for (auto f : core::kAllFeatures) {
        const auto& v = s[core::index(f)];
        out[core::toString(f)] = v ? nlohmann::json(*v) : nlohmann::json();
      }
      return out;
    }

    nlohmann::json playedToJson(const PlayedSong& p) {
      nlohmann::json j{ { "title", p.title },
                        { "artist", p.artist },
                        { "search_query", p.searchQuery },
                        { "play_count_today", p.playsToday },
                        { "play_count_all_time", p.playsAllTime },
                        { "audio_targets", snapshotToJson(p.targets) } };
      j["last_played_utc"] = p.lastPlayed ? nlohmann::json(core::toIsoUtc(*p.lastPlayed)) : nlohmann::json();
      return j;
    }

    std::string trimmedString(const nlohmann::json& j, const char* key) {
      const auto it = j.find(key);
      if (it == j.end() || !it->is_string())
        return {};
      return core::trim(it->get<std::string>());
    }

  } // namespace

  nlohmann::json toJson(const VibeRequest& request) {
    nlohmann::json j{ { "day_of_week", request.dayOfWeek },
                      { "calendar_events", request.calendarEvents.is_array() ? request.calendarEvents
                                                                             : nlohmann::json::array() },
                      { "recent_chat", chatToJson(request.recentChat) } };
    if (request.previousState) {
      const auto& p = *request.previousState;
      nlohmann::json prev{ { "verbal_plan", p.verbalPlan },
                           { "current_context_block", p.contextBlock },
                           { "plan_duration_minutes", p.planDurationMinutes },
                           { "elapsed_minutes", p.elapsedMinutes },
                           { "current_targets", p.currentTargets },
                           { "current_phase_note", p.currentPhaseNote } };
      prev["music_filters"] = p.musicFilters ? nlohmann::json(*p.musicFilters) : nlohmann::json();
      j["previous_state"] = std::move(prev);
    }
    return j;
  }

  nlohmann::json toJson(const RecommendRequest& request) {
    auto recent = nlohmann::json::array();
    for (const auto& p : request.recentlyPlayed)
      recent.push_back(playedToJson(p));

    auto provided = nlohmann::json::array();
    for (const auto& s : request.providedSongs) {
      auto sliders = nlohmann::json::object();
      for (auto f : core::kAllFeatures)
        sliders[core::toString(f)] = s.sliders[core::index(f)];
      provided.push_back({ { "title", s.title },
                           { "artist", s.artist },
                           { "genre", s.genre },
                           { "sliders", std::move(sliders) },
                           { "prob_factor", s.probabilityFactor } });
    }

    nlohmann::json j{ { "day_of_week", request.dayOfWeek },
                      { "vibe_targets", request.vibeTargets },
                      { "recently_played", std::move(recent) },
                      { "provided_songs", std::move(provided) } };
    j["last_played"] = request.lastPlayed ? playedToJson(*request.lastPlayed) : nlohmann::json();
    return j;
  }

  Recommendation parseRecommendation(const nlohmann::json& j) {
    if (!j.is_object())
      throw core::OracleError("[Recommender] response is not an object");

    Recommendation rec;
    const auto skip = j.find("skip_music");
    rec.skipMusic = skip != j.end() && skip->is_boolean() && skip->get<bool>();
    rec.skipReason = trimmedString(j, "skip_reason");
    if (rec.skipMusic && rec.skipReason.empty())
      rec.skipReason = "skip";

    const auto cands = j.find("candidates");
    if (cands == j.end() || !cands->is_array())
      return rec;

    for (const auto& c : *cands) {
      if (!c.is_object())
        continue;
      Candidate cand;
      cand.title = trimmedString(c, "title");
      cand.artist = trimmedString(c, "artist");
      cand.searchQuery = trimmedString(c, "search_query");
      cand.reasoning = trimmedString(c, "reasoning");
      rec.candidates.push_back(std::move(cand));
    }
    return rec;
  }

} // namespace vibedj::protocols
