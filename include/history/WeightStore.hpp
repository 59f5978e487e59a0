#pragma once
/** @file  WeightStore.hpp
 *  @brief Multiplicative genre/artist/track probability overrides.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace vibedj::io {
  class SqliteDatabase;
}

namespace vibedj::history {

  enum class WeightScope : std::uint8_t { Genre, Artist, Track };

  const char* toString(WeightScope s);

  /// All overrides keyed by normalized key; a missing key means factor 1.0.
  struct WeightTable {
    std::unordered_map<std::string, double> genre;
    std::unordered_map<std::string, double> artist;
    std::unordered_map<std::string, double> track; ///< key "<title>|||<artist>"

    /// Product of the three scopes for one catalog row (each clamped at >= 0).
    double combined(const std::string& title, const std::string& artist, const std::string& genre) const;
  };

  /**
 * @class WeightStore
 * @brief CRUD over `music_genre_weights`, `music_artist_weights`, `music_track_weights`.
 *
 *  * Keys are normalized here; callers pass raw names.
 *  * `adjust()` with a negative delta never goes below kMinWeightFactor; only `set()` can ban (0).
 */
  class WeightStore {
  public:
    static constexpr double kMinWeightFactor = 0.05;

    /// Creates the schema if needed. Throws `core::StoreError`.
    explicit WeightStore(std::shared_ptr<io::SqliteDatabase> db);

    //---public API------------------------------------------------------
    /// Track scope: \p name is the title and \p artist is required. Other scopes ignore \p artist.
    double factor(WeightScope scope, const std::string& name, const std::string& artist = {}) const;

    /// Stores max(0, factor) and returns it.
    double set(WeightScope scope, const std::string& name, double factor, const std::string& artist = {});

    /// Adds \p delta to the current factor and returns the stored value.
    double adjust(WeightScope scope, const std::string& name, double delta, const std::string& artist = {});

    WeightTable loadAll() const;

  private:
    void initSchema();

    std::shared_ptr<io::SqliteDatabase> db_;
  };

} // namespace vibedj::history
