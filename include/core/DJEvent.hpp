#pragma once
/** @file  DJEvent.hpp
 *  @brief Closed set of events consumed by the DJCoordinator loop, and their reply payloads.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>

// third-party headers
#include <nlohmann/json.hpp>

// VibeDJ headers
#include "core/SearchQuery.hpp"
#include "core/TimeUtil.hpp"
#include "core/VibePlan.hpp"
#include "protocols/Response.hpp"

namespace vibedj::core {

  /// Outcome of a synchronous pick.
  struct PickResult {
    std::string title;
    std::string artist;
    std::string reasoning;
    bool skipMusic{ false };
    std::string skipReason;
    VibeTargets targets;

    std::string searchQuery() const { return buildSearchQuery(title, artist); }
  };

  /// A consumed backup candidate.
  struct BackupSong {
    std::string title;
    std::string artist;
    std::string searchQuery;
    std::string reasoning;
  };

  /// Coordinator state as seen from outside the loop.
  struct CoordinatorStatus {
    bool enabled{ false };
    bool running{ false };
    bool threadAlive{ false };
    bool continuousMode{ false };
    bool nextSongQueued{ false };
    bool pickInProgress{ false };
    std::size_t backupCandidates{ 0 };
    std::optional<std::string> currentTrackId;
    nlohmann::json vibePlan; ///< null without a plan
    std::optional<TimePoint> startedAt;
    std::string lastAction;
    std::optional<TimePoint> lastActionTime;

    nlohmann::json toJson() const;
  };

  namespace events {

    struct Enable {
      bool continuous{ true };
    };
    struct Disable {};
    struct SetContinuousMode {
      bool enabled{ false };
    };
    /// nullopt means playback ended.
    struct TrackChanged {
      std::optional<protocols::TrackInfo> track;
    };
    struct RequestPickAndQueue {
      std::string reason;
    };
    struct PickSong {
      std::string reason;
      bool allowWhenDisabled{ false };
      std::shared_ptr<std::promise<std::optional<PickResult>>> reply;
    };
    struct PickBackup {
      std::shared_ptr<std::promise<std::optional<BackupSong>>> reply;
    };
    struct FrontendQueued {
      nlohmann::json data;
    };
    struct StatusRequest {
      std::shared_ptr<std::promise<CoordinatorStatus>> reply;
    };
    struct Stop {};

  } // namespace events

  using DJEvent = std::variant<events::Enable, events::Disable, events::SetContinuousMode, events::TrackChanged,
                               events::RequestPickAndQueue, events::PickSong, events::PickBackup,
                               events::FrontendQueued, events::StatusRequest, events::Stop>;

  /// Event name for logs.
  const char* eventName(const DJEvent& event);

} // namespace vibedj::core
