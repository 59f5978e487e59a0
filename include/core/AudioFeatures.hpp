#pragma once
/** @file  AudioFeatures.hpp
 *  @brief Audio feature keys, slider vectors and the 8-slider AudioTargets record.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace vibedj::core {

  enum class Feature : std::uint8_t {
    Energy,
    Valence,
    Loudness,
    Speechiness,
    Acousticness,
    Instrumentalness,
    Liveness,
    Tempo,
    Count
  };

  inline constexpr std::size_t kFeatureCount = static_cast<std::size_t>(Feature::Count);
  static_assert(kFeatureCount == 8, "Feature count changed please update code that depends on it");

  /// Dense per-feature vector, indexed by `Feature`. Slider or native units depending on context.
  using FeatureVector = std::array<double, kFeatureCount>;

  /// Per-slider snapshot where any slider may be unknown (history rows written before a plan existed).
  using SliderSnapshot = std::array<std::optional<int>, kFeatureCount>;

  inline constexpr std::array<Feature, kFeatureCount> kAllFeatures{
    Feature::Energy,       Feature::Valence,          Feature::Loudness, Feature::Speechiness,
    Feature::Acousticness, Feature::Instrumentalness, Feature::Liveness, Feature::Tempo
  };

  constexpr std::size_t index(Feature f) { return static_cast<std::size_t>(f); }

  inline const char* toString(Feature f) {
    switch (f) {
    case Feature::Energy:
      return "energy";
    case Feature::Valence:
      return "valence";
    case Feature::Loudness:
      return "loudness";
    case Feature::Speechiness:
      return "speechiness";
    case Feature::Acousticness:
      return "acousticness";
    case Feature::Instrumentalness:
      return "instrumentalness";
    case Feature::Liveness:
      return "liveness";
    case Feature::Tempo:
      return "tempo";
    default:
      return "unknown";
    }
  }

  /// Rounds (ties to even) and clamps any slider value into the integer range [0,100].
  inline int clampSlider(double v) {
    if (!std::isfinite(v))
      return 0;
    return static_cast<int>(std::nearbyint(std::clamp(v, 0.0, 100.0)));
  }

  /**
 * @struct AudioTargets
 * @brief Eight human-facing 0-100 sliders describing the desired audio character.
 *
 *  * Every setter clamps, so a stored value is always inside [0,100].
 *  * Default-constructed targets are the neutral "focus" vibe used when no plan exists.
 */
  struct AudioTargets {
    int energy{ 55 };
    int valence{ 50 };
    int loudness{ 55 };
    int speechiness{ 10 };
    int acousticness{ 40 };
    int instrumentalness{ 70 };
    int liveness{ 15 };
    int tempo{ 45 };

    int get(Feature f) const {
      switch (f) {
      case Feature::Energy:
        return energy;
      case Feature::Valence:
        return valence;
      case Feature::Loudness:
        return loudness;
      case Feature::Speechiness:
        return speechiness;
      case Feature::Acousticness:
        return acousticness;
      case Feature::Instrumentalness:
        return instrumentalness;
      case Feature::Liveness:
        return liveness;
      case Feature::Tempo:
        return tempo;
      default:
        return 50;
      }
    }

    void set(Feature f, double value) {
      const int v = clampSlider(value);
      switch (f) {
      case Feature::Energy:
        energy = v;
        break;
      case Feature::Valence:
        valence = v;
        break;
      case Feature::Loudness:
        loudness = v;
        break;
      case Feature::Speechiness:
        speechiness = v;
        break;
      case Feature::Acousticness:
        acousticness = v;
        break;
      case Feature::Instrumentalness:
        instrumentalness = v;
        break;
      case Feature::Liveness:
        liveness = v;
        break;
      case Feature::Tempo:
        tempo = v;
        break;
      default:
        break;
      }
    }

    FeatureVector toVector() const {
      FeatureVector out{};
      for (auto f : kAllFeatures)
        out[index(f)] = static_cast<double>(get(f));
      return out;
    }

    SliderSnapshot toSnapshot() const {
      SliderSnapshot out{};
      for (auto f : kAllFeatures)
        out[index(f)] = get(f);
      return out;
    }

    bool operator==(const AudioTargets&) const = default;
  };

} // namespace vibedj::core
