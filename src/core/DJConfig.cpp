/* @file DJConfig.cpp
 * @brief JSON -> DJConfig with per-key type and range validation
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <limits>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// VibeDJ headers
#include "core/DJConfig.hpp"
#include "core/Errors.hpp"

using namespace vibedj::core;

namespace {

  using nlohmann::json;

  [[noreturn]] void fail(const std::string& key, const std::string& what) {
    throw ConfigError("[DJConfig] " + key + ": " + what);
  }

  const json* section(const json& root, const char* key) {
    const auto it = root.find(key);
    if (it == root.end() || it->is_null())
      return nullptr;
    if (!it->is_object())
      fail(key, "expected an object");
    return &*it;
  }

  void readString(const json& obj, const std::string& prefix, const char* key, std::string& out,
                  bool allowEmpty = true) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return;
    if (!it->is_string())
      fail(prefix + key, "expected a string");
    auto v = it->get<std::string>();
    if (!allowEmpty && v.empty())
      fail(prefix + key, "must not be empty");
    out = std::move(v);
  }

  void readBool(const json& obj, const std::string& prefix, const char* key, bool& out) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return;
    if (!it->is_boolean())
      fail(prefix + key, "expected a boolean");
    out = it->get<bool>();
  }

  double readNumber(const json& obj, const std::string& prefix, const char* key, double current, double lo,
                    double hi) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return current;
    if (!it->is_number())
      fail(prefix + key, "expected a number");
    const double v = it->get<double>();
    if (!std::isfinite(v) || v < lo || v > hi)
      fail(prefix + key, "out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    return v;
  }

  template <typename Int>
  void readInt(const json& obj, const std::string& prefix, const char* key, Int& out, double lo, double hi) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return;
    if (!it->is_number_integer() && !it->is_number_unsigned())
      fail(prefix + key, "expected an integer");
    out = static_cast<Int>(readNumber(obj, prefix, key, static_cast<double>(out), lo, hi));
  }

  template <typename Duration>
  void readDuration(const json& obj, const std::string& prefix, const char* key, Duration& out, double lo,
                    double hi) {
    auto count = static_cast<long long>(out.count());
    readInt(obj, prefix, key, count, lo, hi);
    out = Duration(count);
  }

  void readEndpoint(const json& obj, const std::string& prefix, EndpointConfig& out) {
    readString(obj, prefix, "host", out.host, false);
    readInt(obj, prefix, "port", out.port, 1, 65535);
  }

  constexpr double kMaxCount = 1e9;

} // namespace

DJConfig DJConfig::fromJson(const json& j) {
  if (!j.is_object())
    throw ConfigError("[DJConfig] top level is not an object");

  DJConfig cfg;
  readString(j, "", "database_path", cfg.databasePath, false);
  readString(j, "", "context_path", cfg.contextPath, false);
  if (j.contains("selector_seed") && !j.at("selector_seed").is_null()) {
    std::uint32_t seed = 0;
    readInt(j, "", "selector_seed", seed, 0, std::numeric_limits<std::uint32_t>::max());
    cfg.selectorSeed = seed;
  }

  if (const auto* c = section(j, "catalog")) {
    const std::string p = "catalog.";
    readString(*c, p, "backend", cfg.catalog.backend, false);
    readString(*c, p, "csv_path", cfg.catalog.csvPath);
    auto& s = cfg.catalog.sqlite;
    readString(*c, p, "table", s.table, false);
    s.energyWindow = readNumber(*c, p, "energy_window", s.energyWindow, 0, 100);
    s.valenceWindow = readNumber(*c, p, "valence_window", s.valenceWindow, 0, 100);
    readInt(*c, p, "prefilter_limit", s.prefilterLimit, 1, kMaxCount);
    readInt(*c, p, "candidate_limit_factor", s.candidateLimitFactor, 1, 1000);
    readInt(*c, p, "refine_limit", s.refineLimit, 1, kMaxCount);
  }

  if (const auto* s = section(j, "sampling")) {
    const std::string p = "sampling.";
    auto& out = cfg.sampling;
    readInt(*s, p, "match_pool_size", out.matchPoolSize, 1, kMaxCount);
    readInt(*s, p, "base_pool_size", out.basePoolSize, 0, kMaxCount);
    readInt(*s, p, "prompt_pick_count", out.promptPickCount, 1, 1000);
    out.excludePlayedWithinHours =
        readNumber(*s, p, "exclude_played_within_hours", out.excludePlayedWithinHours, 0, 24 * 365);
    readBool(*s, p, "exclude_if_played_today", out.excludeIfPlayedToday);
    out.boostFactor = readNumber(*s, p, "boost_factor", out.boostFactor, 0, 1000);
    out.maxEnergyDelta = readNumber(*s, p, "max_energy_delta", out.maxEnergyDelta, 0, 100);
    out.maxValenceDelta = readNumber(*s, p, "max_valence_delta", out.maxValenceDelta, 0, 100);
    if (const auto it = s->find("boost_genres"); it != s->end() && !it->is_null()) {
      if (!it->is_array())
        fail(p + "boost_genres", "expected an array of strings");
      out.boostGenres.clear();
      for (const auto& g : *it) {
        if (!g.is_string())
          fail(p + "boost_genres", "expected an array of strings");
        out.boostGenres.push_back(g.get<std::string>());
      }
    }
  }

  if (const auto* c = section(j, "coordinator")) {
    const std::string p = "coordinator.";
    auto& out = cfg.coordinator;
    readDuration(*c, p, "pick_debounce_s", out.pickDebounce, 0, 3600);
    readDuration(*c, p, "queue_retry_cooldown_s", out.queueRetryCooldown, 0, 3600);
    readDuration(*c, p, "sync_pick_timeout_s", out.syncPickTimeout, 1, 3600);
    readDuration(*c, p, "chat_poll_interval_ms", out.chatPollInterval, 100, 3600000);
    readDuration(*c, p, "chat_lookback_h", out.chatLookback, 1, 24 * 7);
    readDuration(*c, p, "chat_trigger_debounce_ms", out.chatTriggerDebounce, 0, 3600000);
    readInt(*c, p, "chat_poll_limit", out.chatPollLimit, 1, 1000);
    readDuration(*c, p, "planning_chat_window_h", out.planningChatWindow, 1, 24 * 7);
    readInt(*c, p, "planning_chat_limit", out.planningChatLimit, 1, 1000);
    readInt(*c, p, "recently_played_window", out.recentlyPlayedWindow, 0, 1000);
    readInt(*c, p, "max_from_shortlist", out.maxFromShortlist, 0, 1000);
    readInt(*c, p, "total_candidates", out.totalCandidates, 1, 1000);
    if (out.maxFromShortlist > out.totalCandidates)
      fail(p + "max_from_shortlist", "exceeds total_candidates");
  }

  if (const auto* c = section(j, "planner")) {
    const std::string p = "planner.";
    auto& out = cfg.planner;
    readDuration(*c, p, "recheck_interval_min", out.recheckInterval, 1, 24 * 60);
    readDuration(*c, p, "failure_backoff_s", out.failureBackoff, 0, 3600);
    readInt(*c, p, "default_plan_minutes", out.defaultPlanMinutes, kMinPlanMinutes, kMaxPlanMinutes);
    readInt(*c, p, "signature_window", out.signatureWindow, 1, 1000);
    readInt(*c, p, "signature_content_chars", out.signatureContentChars, 1, 100000);
  }

  if (const auto* c = section(j, "cooldown")) {
    const std::string p = "cooldown.";
    auto& out = cfg.cooldown;
    out.trackRecoveryPerDay = readNumber(*c, p, "track_recovery_per_day", out.trackRecoveryPerDay, 0, 100);
    out.artistRecoveryPerDay = readNumber(*c, p, "artist_recovery_per_day", out.artistRecoveryPerDay, 0, 100);
    out.minWeight = readNumber(*c, p, "min_weight", out.minWeight, 0, 1);
  }

  if (const auto* c = section(j, "player"))
    readEndpoint(*c, "player.", cfg.player);

  if (const auto* c = section(j, "oracle")) {
    readEndpoint(*c, "oracle.", cfg.oracle.endpoint);
    readDuration(*c, "oracle.", "timeout_ms", cfg.oracle.timeout, 100, 600000);
  }

  if (const auto* c = section(j, "logging")) {
    readString(*c, "logging.", "level", cfg.logging.level, false);
    static const char* kLevels[] = { "trace", "debug", "info", "warn", "warning", "error", "critical", "off" };
    bool known = false;
    for (const auto* l : kLevels)
      known = known || cfg.logging.level == l;
    if (!known)
      fail("logging.level", "unknown level '" + cfg.logging.level + "'");
    readString(*c, "logging.", "journal_path", cfg.logging.journalPath);
  }

  return cfg;
}
