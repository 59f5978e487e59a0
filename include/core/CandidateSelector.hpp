#pragma once
/** @file  CandidateSelector.hpp
 *  @brief Cooldown-weighted random choice among oracle candidates, keeping the rest as backups.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

// VibeDJ headers
#include "protocols/RecommenderOracle.hpp"

namespace vibedj::core {

  struct ScoredCandidate {
    std::string title;
    std::string artist;
    std::string searchQuery;
    std::string reasoning;
    double score{ 1.0 };
    double probability{ 0.0 }; ///< percent of the total score, display only
  };

  struct Selection {
    ScoredCandidate chosen;
    std::size_t backupCount{ 0 };
  };

  /**
 * @class CandidateSelector
 * @brief Scores candidates, draws one proportionally to score, stores the rest best-first.
 *
 *  * Candidates without a title are dropped; a missing artist becomes "Unknown".
 *  * A throwing scorer yields score 1.0 for that candidate.
 *  * When every score is zero the first candidate wins.
 *  * Owned by the coordinator thread.
 */
  class CandidateSelector {
  public:
    using Scorer = std::function<double(const std::string& title, const std::string& artist)>;

    explicit CandidateSelector(Scorer scorer, std::uint32_t seed = std::random_device{}());

    /// nullopt when no usable candidate remains; backups are replaced only on success.
    std::optional<Selection> choose(const std::vector<protocols::Candidate>& candidates);

    std::optional<ScoredCandidate> popBackup();
    void clearBackups() { backups_.clear(); }
    bool hasBackups() const { return !backups_.empty(); }
    std::size_t backupCount() const { return backups_.size(); }

  private:
    Scorer scorer_;
    std::mt19937 rng_;
    std::vector<ScoredCandidate> backups_;
  };

} // namespace vibedj::core
