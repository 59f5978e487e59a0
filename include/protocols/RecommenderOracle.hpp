#pragma once
/** @file  RecommenderOracle.hpp
 *  @brief Black-box ranker that turns a shortlist plus history into candidate picks.
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
#include "core/AudioFeatures.hpp"
#include "core/TimeUtil.hpp"
#include "core/VibePlan.hpp"

namespace vibedj::protocols {

  /// One shortlist entry offered to the oracle.
  struct ProvidedSong {
    std::string title;
    std::string artist;
    std::string genre;
    core::FeatureVector sliders{};
    double probabilityFactor{ 1.0 };
  };

  struct PlayedSong {
    std::string title;
    std::string artist;
    std::string searchQuery;
    std::optional<core::TimePoint> lastPlayed;
    int playsToday{ 0 };
    int playsAllTime{ 0 };
    core::SliderSnapshot targets{};
  };

  struct RecommendRequest {
    std::string dayOfWeek;
    core::VibeTargets vibeTargets;
    std::vector<PlayedSong> recentlyPlayed; ///< oldest first, at most 10
    std::optional<PlayedSong> lastPlayed;
    std::vector<ProvidedSong> providedSongs; ///< at most 10
  };

  /// Candidate as returned by the oracle; title/artist may be empty when only a search string came back.
  struct Candidate {
    std::string title;
    std::string artist;
    std::string searchQuery;
    std::string reasoning;
    std::string source; ///< "provided" | "new" after contract enforcement
  };

  struct Recommendation {
    std::vector<Candidate> candidates;
    bool skipMusic{ false };
    std::string skipReason;
  };

  /**
 * @class RecommenderOracle
 * @brief Interface for the recommender; implementations throw `core::OracleError` on failure.
 */
  class RecommenderOracle {
  public:
    virtual ~RecommenderOracle() = default;
    virtual Recommendation recommend(const RecommendRequest& request) = 0;
  };

  /// Wire form: {day_of_week, vibe_targets, recently_played[], last_played?, provided_songs[]}
  nlohmann::json toJson(const RecommendRequest& request);

  /// Parses {candidates[], skip_music?, skip_reason?}. Throws `core::OracleError` if not an object.
  Recommendation parseRecommendation(const nlohmann::json& j);

} // namespace vibedj::protocols
