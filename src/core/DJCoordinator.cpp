/* @file DJCoordinator.cpp
 * @brief consumer loop, pick-and-queue flow, shortlist contract and backups
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <random>
#include <set>
#include <stdexcept>
#include <utility>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "catalog/ShortlistSampler.hpp"
#include "core/CandidateSelector.hpp"
#include "core/DJCoordinator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logging.hpp"
#include "core/PickJournal.hpp"
#include "core/SearchQuery.hpp"
#include "core/VibePlanner.hpp"
#include "history/HistoryStore.hpp"
#include "protocols/ContextSource.hpp"

using namespace vibedj::core;

namespace {

  constexpr const char* kServerFillReason = "Selected from provided list (server fill)";

  template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
  };
  template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

  /// Clears the in-progress flag on every exit path.
  class PickGuard {
  public:
    explicit PickGuard(std::atomic<bool>& flag) : flag_(flag) { flag_ = true; }
    ~PickGuard() { flag_ = false; }
    PickGuard(const PickGuard&) = delete;
    PickGuard& operator=(const PickGuard&) = delete;

  private:
    std::atomic<bool>& flag_;
  };

  vibedj::protocols::PlayedSong toPlayed(const vibedj::history::HistoryRecord& r) {
    vibedj::protocols::PlayedSong p;
    p.title = r.title;
    p.artist = r.artist;
    p.searchQuery = r.searchQuery;
    p.lastPlayed = r.lastPlayed;
    p.playsToday = r.playsToday;
    p.playsAllTime = r.playsAllTime;
    p.targets = r.lastTargets;
    return p;
  }

  template <typename T>
  std::optional<T> awaitReply(std::future<T>& fut, std::chrono::milliseconds timeout) {
    if (fut.wait_for(timeout) != std::future_status::ready)
      return std::nullopt;
    return fut.get();
  }

} // namespace

const char* vibedj::core::eventName(const DJEvent& event) {
  return std::visit(Overloaded{ [](const events::Enable&) { return "Enable"; },
                                [](const events::Disable&) { return "Disable"; },
                                [](const events::SetContinuousMode&) { return "SetContinuousMode"; },
                                [](const events::TrackChanged&) { return "TrackChanged"; },
                                [](const events::RequestPickAndQueue&) { return "RequestPickAndQueue"; },
                                [](const events::PickSong&) { return "PickSong"; },
                                [](const events::PickBackup&) { return "PickBackup"; },
                                [](const events::FrontendQueued&) { return "FrontendQueued"; },
                                [](const events::StatusRequest&) { return "StatusRequest"; },
                                [](const events::Stop&) { return "Stop"; } },
                    event);
}

nlohmann::json CoordinatorStatus::toJson() const {
  const auto optTime = [](const std::optional<TimePoint>& t) {
    return t ? nlohmann::json(toIsoUtc(*t)) : nlohmann::json();
  };
  return nlohmann::json{ { "enabled", enabled },
                         { "running", running },
                         { "thread_alive", threadAlive },
                         { "continuous_mode", continuousMode },
                         { "next_song_queued", nextSongQueued },
                         { "pick_in_progress", pickInProgress },
                         { "backup_candidates", backupCandidates },
                         { "current_track", currentTrackId ? nlohmann::json(*currentTrackId) : nlohmann::json() },
                         { "vibe_plan", vibePlan },
                         { "stats",
                           { { "started_at", optTime(startedAt) },
                             { "last_action", lastAction.empty() ? nlohmann::json() : nlohmann::json(lastAction) },
                             { "last_action_time", optTime(lastActionTime) } } } };
}

DJCoordinator::DJCoordinator(CoordinatorDeps deps, CoordinatorSettings settings, ClockFn clock)
    : deps_(std::move(deps)), settings_(std::move(settings)), clock_(std::move(clock)) {
  if (!deps_.planner)
    throw std::invalid_argument("[DJCoordinator] vibe planner is nullptr");
  if (!deps_.recommender)
    throw std::invalid_argument("[DJCoordinator] recommender oracle is nullptr");
  if (!deps_.sampler)
    throw std::invalid_argument("[DJCoordinator] shortlist sampler is nullptr");
  if (!deps_.history)
    throw std::invalid_argument("[DJCoordinator] history store is nullptr");
  if (!deps_.selector)
    throw std::invalid_argument("[DJCoordinator] candidate selector is nullptr");
  if (!deps_.playback)
    throw std::invalid_argument("[DJCoordinator] playback client is nullptr");
  if (!deps_.context)
    throw std::invalid_argument("[DJCoordinator] context source is nullptr");
  if (!deps_.errorMonitor)
    throw std::invalid_argument("[DJCoordinator] error monitor is nullptr");
  if (!clock_)
    clock_ = systemNow;
}

DJCoordinator::~DJCoordinator() {
  stop();
  if (thread_.joinable())
    thread_.join();
}

// ---------------------------------------------------------------------------
// lifecycle
// ---------------------------------------------------------------------------
void DJCoordinator::start() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (running_)
    return;
  if (thread_.joinable())
    thread_.join(); // a previous loop that outlived its stop() timeout

  {
    std::lock_guard<std::mutex> snap(snapshotMtx_);
    snapshot_.startedAt = clock_();
  }
  std::promise<void> done;
  loopDone_ = done.get_future();
  running_ = true;
  loopAlive_ = true;
  thread_ = std::thread([this, done = std::move(done)]() mutable {
    loop();
    loopAlive_ = false;
    done.set_value();
  });
  logging::get("coordinator")->info("coordinator thread started");
}

bool DJCoordinator::stop(std::chrono::milliseconds joinTimeout) {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (!running_)
    return true;

  queue_.push(events::Stop{});
  const bool exited = loopDone_.valid() && loopDone_.wait_for(joinTimeout) == std::future_status::ready;
  running_ = false;
  if (exited) {
    thread_.join();
    logging::get("coordinator")->info("coordinator thread stopped");
  } else {
    logging::get("coordinator")->warn("coordinator thread did not exit within {}ms", joinTimeout.count());
  }
  return exited;
}

// ---------------------------------------------------------------------------
// control
// ---------------------------------------------------------------------------
void DJCoordinator::enable(bool continuous) {
  start();
  queue_.push(events::Enable{ continuous });
}

void DJCoordinator::disable() { queue_.push(events::Disable{}); }

void DJCoordinator::setContinuousMode(bool enabled) { queue_.push(events::SetContinuousMode{ enabled }); }

void DJCoordinator::onTrackChanged(std::optional<protocols::TrackInfo> track) {
  queue_.push(events::TrackChanged{ std::move(track) });
}

void DJCoordinator::requestPickAndQueue(std::string reason) {
  queue_.push(events::RequestPickAndQueue{ std::move(reason) });
}

void DJCoordinator::onFrontendQueued(nlohmann::json data) { queue_.push(events::FrontendQueued{ std::move(data) }); }

std::optional<PickResult> DJCoordinator::pickSong(std::string reason) {
  return pickSong(std::move(reason), settings_.syncPickTimeout);
}

std::optional<PickResult> DJCoordinator::pickSong(std::string reason, std::chrono::milliseconds timeout) {
  if (!enabled_)
    return std::nullopt;
  auto reply = std::make_shared<std::promise<std::optional<PickResult>>>();
  auto fut = reply->get_future();
  queue_.push(events::PickSong{ std::move(reason), false, reply });
  return awaitReply(fut, timeout).value_or(std::nullopt);
}

std::optional<PickResult> DJCoordinator::pickSongOnce(std::string reason) {
  return pickSongOnce(std::move(reason), settings_.syncPickTimeout);
}

std::optional<PickResult> DJCoordinator::pickSongOnce(std::string reason, std::chrono::milliseconds timeout) {
  start();
  auto reply = std::make_shared<std::promise<std::optional<PickResult>>>();
  auto fut = reply->get_future();
  queue_.push(events::PickSong{ std::move(reason), true, reply });
  return awaitReply(fut, timeout).value_or(std::nullopt);
}

std::optional<BackupSong> DJCoordinator::getBackupSong(std::chrono::milliseconds timeout) {
  if (!running_)
    return std::nullopt;
  auto reply = std::make_shared<std::promise<std::optional<BackupSong>>>();
  auto fut = reply->get_future();
  queue_.push(events::PickBackup{ reply });
  return awaitReply(fut, timeout).value_or(std::nullopt);
}

// ---------------------------------------------------------------------------
// status
// ---------------------------------------------------------------------------
CoordinatorStatus DJCoordinator::status() const {
  CoordinatorStatus s;
  {
    std::lock_guard<std::mutex> lock(snapshotMtx_);
    s = snapshot_;
  }
  s.enabled = enabled_;
  s.running = running_;
  s.threadAlive = loopAlive_;
  s.continuousMode = continuous_;
  s.nextSongQueued = nextSongQueued_;
  s.pickInProgress = pickInProgress_;
  return s;
}

std::optional<CoordinatorStatus> DJCoordinator::statusStrict(std::chrono::milliseconds timeout) {
  if (!running_)
    return std::nullopt;
  auto reply = std::make_shared<std::promise<CoordinatorStatus>>();
  auto fut = reply->get_future();
  queue_.push(events::StatusRequest{ reply });
  return awaitReply(fut, timeout);
}

CoordinatorStatus DJCoordinator::buildStatus() const {
  CoordinatorStatus s;
  {
    std::lock_guard<std::mutex> lock(snapshotMtx_);
    s.startedAt = snapshot_.startedAt;
  }
  s.enabled = enabled_;
  s.running = running_;
  s.threadAlive = true;
  s.continuousMode = continuous_;
  s.nextSongQueued = nextSongQueued_;
  s.pickInProgress = pickInProgress_;
  s.backupCandidates = deps_.selector->backupCount();
  s.currentTrackId = currentTrackId_;
  s.vibePlan = deps_.planner->planDebug(clock_());
  s.lastAction = lastAction_;
  s.lastActionTime = lastActionTime_;
  return s;
}

void DJCoordinator::publishSnapshot() {
  auto s = buildStatus();
  std::lock_guard<std::mutex> lock(snapshotMtx_);
  snapshot_ = std::move(s);
}

// ---------------------------------------------------------------------------
// playback passthroughs
// ---------------------------------------------------------------------------
bool DJCoordinator::play() { return deps_.playback->play(); }
bool DJCoordinator::pause() { return deps_.playback->pause(); }
bool DJCoordinator::next() { return deps_.playback->next(); }
bool DJCoordinator::previous() { return deps_.playback->previous(); }
bool DJCoordinator::searchAndPlay(const std::string& query) { return deps_.playback->searchAndPlay(query); }
bool DJCoordinator::setVolume(double volume) { return deps_.playback->setVolume(volume); }
bool DJCoordinator::queueNext(const std::string& query) { return deps_.playback->queueNext(query); }

bool DJCoordinator::playSong(const std::string& query, PlayMode mode) {
  const auto q = trim(query);
  if (q.empty())
    return false;
  return mode == PlayMode::SearchAndPlay ? searchAndPlay(q) : queueNext(q);
}

// ---------------------------------------------------------------------------
// consumer loop
// ---------------------------------------------------------------------------
void DJCoordinator::loop() {
  auto log = logging::get("coordinator");
  publishSnapshot();

  while (true) {
    pollMusicChat();

    auto event = queue_.popFor(settings_.queueWait);
    if (!event)
      continue;
    if (std::holds_alternative<events::Stop>(*event))
      break;

    try {
      handle(*event);
    } catch (const std::exception& e) {
      log->error("error handling {}: {}", eventName(*event), e.what());
    }

    try {
      publishSnapshot();
    } catch (const std::exception& e) {
      log->warn("status snapshot failed: {}", e.what());
    }
  }
}

void DJCoordinator::pollMusicChat() {
  if (!enabled_ || !continuous_)
    return;

  const auto mono = std::chrono::steady_clock::now();
  if (mono - lastChatPoll_ < settings_.chatPollInterval)
    return;
  lastChatPoll_ = mono;

  auto log = logging::get("coordinator");
  try {
    const auto now = clock_();
    const auto cutoff = lastSeenChat_.value_or(now - settings_.chatLookback) - std::chrono::seconds(1);
    const auto msgs = deps_.context->recentChatSince(cutoff, settings_.chatPollLimit);
    if (msgs.empty())
      return;

    const auto newest = std::max_element(msgs.begin(), msgs.end(), [](const auto& a, const auto& b) {
      return a.timestamp < b.timestamp;
    });
    if (lastSeenChat_ && newest->timestamp <= *lastSeenChat_)
      return;
    lastSeenChat_ = newest->timestamp;

    if (lastChatTrigger_ && now - *lastChatTrigger_ < settings_.chatTriggerDebounce)
      return;
    lastChatTrigger_ = now;

    log->info("new music instruction -> triggering pick (preview='{}')", trim(newest->content).substr(0, 120));
    queue_.push(events::RequestPickAndQueue{ "music_chat" });
  } catch (const std::exception& e) {
    log->debug("music chat poll failed: {}", e.what());
  }
}

void DJCoordinator::handle(DJEvent& event) {
  auto log = logging::get("coordinator");
  std::visit(
      Overloaded{
          [&](events::Enable& ev) {
            enabled_ = true;
            continuous_ = ev.continuous;
            nextSongQueued_ = false;
            deps_.selector->clearBackups();
            log->info("enabled continuous_mode={}", ev.continuous);
          },
          [&](events::Disable&) {
            enabled_ = false;
            continuous_ = false;
            nextSongQueued_ = false;
            pickInProgress_ = false;
            deps_.planner->clear();
            deps_.selector->clearBackups();
            log->info("disabled");
          },
          [&](events::SetContinuousMode& ev) {
            continuous_ = ev.enabled;
            if (!ev.enabled)
              nextSongQueued_ = false;
            log->info("continuous_mode={}", ev.enabled);
          },
          [&](events::TrackChanged& ev) { onTrackChangedImpl(ev.track); },
          [&](events::RequestPickAndQueue& ev) { pickAndQueue(ev.reason); },
          [&](events::PickSong& ev) {
            std::optional<PickResult> result;
            try {
              result = doPick(false, ev.allowWhenDisabled);
            } catch (const std::exception& e) {
              log->error("pick ({}) failed: {}", ev.reason, e.what());
            }
            if (ev.reply)
              ev.reply->set_value(std::move(result));
          },
          [&](events::PickBackup& ev) {
            std::optional<BackupSong> result;
            try {
              result = takeBackup();
            } catch (const std::exception& e) {
              log->error("backup pick failed: {}", e.what());
            }
            if (ev.reply)
              ev.reply->set_value(std::move(result));
          },
          [&](events::FrontendQueued& ev) {
            const auto& d = ev.data;
            const auto title = d.is_object() ? d.value("title", std::string{}) : std::string{};
            const auto artist = d.is_object() ? d.value("artist", std::string{}) : std::string{};
            log->debug("player confirmed queue: '{}' by {}", title, artist);
          },
          [&](events::StatusRequest& ev) {
            if (ev.reply)
              ev.reply->set_value(buildStatus());
          },
          [&](events::Stop&) {},
      },
      event);
}

void DJCoordinator::onTrackChangedImpl(const std::optional<protocols::TrackInfo>& track) {
  auto log = logging::get("coordinator");
  if (track) {
    const auto id = track->id();
    if (id != currentTrackId_) {
      log->info("track changed '{}' -> '{}', queue flag reset", currentTrackId_.value_or(""), id);
      currentTrackId_ = id;
      nextSongQueued_ = false;
    }
  } else if (currentTrackId_) {
    log->info("track ended (was '{}')", *currentTrackId_);
    currentTrackId_.reset();
    nextSongQueued_ = false;
  }
}

// ---------------------------------------------------------------------------
// pick flow
// ---------------------------------------------------------------------------
void DJCoordinator::scheduleRetry(const std::string& why) {
  nextSongQueued_ = false;
  retryAfter_ = clock_() + settings_.queueRetryCooldown;
  logging::get("coordinator")->info("queue retry in {}s (reason: {})", settings_.queueRetryCooldown.count(), why);
}

void DJCoordinator::pickAndQueue(const std::string& reason) {
  auto log = logging::get("coordinator");
  if (retryAfter_ && clock_() < *retryAfter_) {
    log->debug("pick request '{}' ignored during retry cooldown", reason);
    return;
  }

  try {
    // Pick requests from the player are authoritative, so the enabled flag is not required here.
    const auto picked = doPick(true, true);
    if (!picked) {
      scheduleRetry("no_pick_result");
      return;
    }
    if (picked->skipMusic) {
      scheduleRetry("skip_music");
      return;
    }

    std::string title = trim(picked->title);
    std::string artist = trim(picked->artist);
    if (title.empty()) {
      scheduleRetry("empty_query");
      return;
    }
    if (artist.empty())
      artist = "Unknown";

    const auto query = buildSearchQuery(title, artist);
    recordPick(title, artist, query, picked->targets.audio);

    if (!playSong(query, PlayMode::QueueNext)) {
      scheduleRetry("socket_failed");
      return;
    }

    nextSongQueued_ = true;
    retryAfter_.reset();
    lastAction_ = "queue_next(" + reason + ")";
    lastActionTime_ = clock_();
    deps_.errorMonitor->reset();
    journal("selector", title, artist, query, picked->reasoning, 1.0, picked->targets);
    log->info("queued '{}' ({})", query, reason);
  } catch (const std::exception& e) {
    log->error("pick and queue failed: {}", e.what());
    scheduleRetry("exception");
  }
}

std::optional<PickResult> DJCoordinator::doPick(bool debounce, bool allowWhenDisabled) {
  auto log = logging::get("coordinator");
  if (!allowWhenDisabled && !enabled_)
    return std::nullopt;
  if (pickInProgress_)
    return std::nullopt;

  const auto now = clock_();
  if (debounce && lastPick_ && now - *lastPick_ < settings_.pickDebounce) {
    log->debug("debounced pick ({:.1f}s since last)", std::chrono::duration<double>(now - *lastPick_).count());
    return std::nullopt;
  }

  PickGuard guard(pickInProgress_);
  lastPick_ = now;

  try {
    // 1) plan
    protocols::VibeRequest vibeReq;
    vibeReq.dayOfWeek = localDayOfWeek(now);
    vibeReq.calendarEvents = deps_.context->calendarEvents();
    vibeReq.recentChat = deps_.context->recentChatSince(now - settings_.planningChatWindow, settings_.planningChatLimit);
    log->info("planning with recent_chat(music)={}", vibeReq.recentChat.size());
    deps_.planner->ensureFreshPlan(vibeReq, now);
    const auto targets = deps_.planner->targets(now);

    // 2) history
    protocols::RecommendRequest req;
    req.dayOfWeek = vibeReq.dayOfWeek;
    req.vibeTargets = targets;
    for (const auto& r : deps_.history->recentlyPlayed(settings_.recentlyPlayedWindow))
      req.recentlyPlayed.push_back(toPlayed(r));
    if (const auto last = deps_.history->lastPlayed())
      req.lastPlayed = toPlayed(*last);

    // 3) shortlist
    try {
      std::mt19937 rng(static_cast<std::uint32_t>(toUnixMillis(now) & 0xFFFFFFFF));
      const auto* filters = targets.musicFilters ? &*targets.musicFilters : nullptr;
      const auto shortlist = deps_.sampler->sample(targets.audio.toVector(), filters, rng, now);
      for (const auto& t : shortlist.sample) {
        protocols::ProvidedSong p;
        p.title = t.title;
        p.artist = t.artist;
        p.genre = t.genre;
        p.sliders = t.sliders;
        p.probabilityFactor = t.probabilityFactor;
        req.providedSongs.push_back(std::move(p));
      }
      log->info("prepared provided_songs={}", req.providedSongs.size());
    } catch (const std::exception& e) {
      log->warn("could not prepare provided songs: {}", e.what());
    }

    // 4) oracle
    const auto rec = deps_.recommender->recommend(req);
    if (rec.skipMusic) {
      PickResult skip;
      skip.skipMusic = true;
      skip.skipReason = rec.skipReason.empty() ? "skip" : rec.skipReason;
      skip.targets = targets;
      log->info("recommender asked to skip music: {}", skip.skipReason);
      return skip;
    }

    // 5) contract + choice
    const auto candidates = enforceShortlistContract(rec.candidates, req.providedSongs, settings_.maxFromShortlist,
                                                     settings_.totalCandidates);
    const auto selection = deps_.selector->choose(candidates);
    if (!selection)
      return std::nullopt;

    PickResult out;
    out.title = selection->chosen.title;
    out.artist = selection->chosen.artist;
    out.reasoning = selection->chosen.reasoning;
    out.targets = targets;
    log->info("picked '{}' by {} phase='{}'", out.title, out.artist,
              targets.phaseNote.empty() ? "n/a" : targets.phaseNote);
    return out;
  } catch (const OracleError& e) {
    deps_.errorMonitor->notifyFailure(e.what());
    log->warn("recommender unavailable: {}", e.what());
  } catch (const StoreError& e) {
    deps_.errorMonitor->notifyFailure(e.what());
    log->error("history store failed during pick: {}", e.what());
  }
  return std::nullopt;
}

std::vector<vibedj::protocols::Candidate>
DJCoordinator::enforceShortlistContract(const std::vector<protocols::Candidate>& candidates,
                                        const std::vector<protocols::ProvidedSong>& shortlist,
                                        std::size_t maxFromShortlist, std::size_t total) {
  using Key = std::pair<std::string, std::string>;
  auto log = logging::get("coordinator");

  std::set<Key> shortlistKeys;
  for (const auto& s : shortlist) {
    const auto t = trim(s.title);
    const auto a = trim(s.artist);
    if (!t.empty() && !a.empty())
      shortlistKeys.emplace(t, a);
  }

  std::vector<protocols::Candidate> provided;
  std::vector<protocols::Candidate> novel;
  for (const auto& c : candidates) {
    std::string t = trim(c.title);
    std::string a = trim(c.artist);
    if ((t.empty() || a.empty()) && !trim(c.searchQuery).empty()) {
      const auto [t2, a2] = parseSearchQuery(c.searchQuery);
      if (t.empty())
        t = t2;
      if (a.empty())
        a = a2;
    }
    if (t.empty())
      continue;
    if (a.empty())
      a = "Unknown";

    protocols::Candidate norm = c;
    norm.title = t;
    norm.artist = a;
    if (shortlistKeys.count({ t, a })) {
      norm.source = "provided";
      provided.push_back(std::move(norm));
    } else {
      norm.source = "new";
      novel.push_back(std::move(norm));
    }
  }

  const std::size_t desired = std::min(maxFromShortlist, shortlist.size());
  if (shortlist.empty() || desired == 0)
    return candidates;

  if (provided.size() < desired) {
    std::set<Key> used;
    for (const auto& c : provided)
      used.emplace(c.title, c.artist);
    for (const auto& c : novel)
      used.emplace(c.title, c.artist);

    for (const auto& s : shortlist) {
      const auto t = trim(s.title);
      const auto a = trim(s.artist);
      if (t.empty() || a.empty() || used.count({ t, a }))
        continue;
      protocols::Candidate fill;
      fill.title = t;
      fill.artist = a;
      fill.reasoning = kServerFillReason;
      fill.source = "provided";
      used.emplace(t, a);
      provided.push_back(std::move(fill));
      if (provided.size() >= desired)
        break;
    }
  }

  if (provided.size() > desired)
    provided.resize(desired);
  const std::size_t remaining = total > provided.size() ? total - provided.size() : 0;
  if (novel.size() > remaining)
    novel.resize(remaining);

  if (desired >= maxFromShortlist && (provided.size() != desired || provided.size() + novel.size() != total))
    log->warn("shortlist contract mismatch after enforcement: provided={} new={}", provided.size(), novel.size());

  provided.insert(provided.end(), std::make_move_iterator(novel.begin()), std::make_move_iterator(novel.end()));
  return provided;
}

// ---------------------------------------------------------------------------
// backups, history, journal
// ---------------------------------------------------------------------------
std::optional<BackupSong> DJCoordinator::takeBackup() {
  auto log = logging::get("coordinator");
  const auto backup = deps_.selector->popBackup();
  if (!backup) {
    log->info("no backup candidates available");
    return std::nullopt;
  }

  const auto targets = deps_.planner->targets(clock_());
  recordPick(backup->title, backup->artist, backup->searchQuery, targets.audio);
  journal("backup", backup->title, backup->artist, backup->searchQuery, backup->reasoning, backup->score, targets);
  log->info("using backup '{}' by {} (score={:.3f})", backup->title, backup->artist, backup->score);
  return BackupSong{ backup->title, backup->artist, backup->searchQuery, backup->reasoning };
}

void DJCoordinator::recordPick(const std::string& title, const std::string& artist, const std::string& searchQuery,
                               const AudioTargets& targets) {
  const auto t = trim(title);
  if (t.empty())
    return;
  auto a = trim(artist);
  if (a.empty())
    a = "Unknown";
  const auto q = trim(searchQuery).empty() ? buildSearchQuery(t, a) : trim(searchQuery);
  try {
    deps_.history->recordPlay(t, a, q, targets, clock_());
  } catch (const StoreError& e) {
    deps_.errorMonitor->notifyFailure(e.what());
    logging::get("coordinator")->error("failed to record pick '{}': {}", q, e.what());
  }
}

void DJCoordinator::journal(const std::string& source, const std::string& title, const std::string& artist,
                            const std::string& searchQuery, const std::string& reasoning, double score,
                            const VibeTargets& targets) {
  if (!deps_.journal)
    return;
  PickEvent ev;
  ev.when = clock_();
  ev.source = source;
  ev.title = title;
  ev.artist = artist;
  ev.searchQuery = searchQuery;
  ev.reasoning = reasoning;
  ev.score = score;
  ev.contextBlock = targets.contextBlock;
  ev.targets = targets.audio;
  deps_.journal->log(std::move(ev));
}
