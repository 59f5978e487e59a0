#pragma once
/** @file  FeatureScaler.hpp
 *  @brief Deterministic slider (0-100) <-> native unit conversion for audio features.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <optional>

// VibeDJ headers
#include "core/AudioFeatures.hpp"

namespace vibedj::core {

  /**
 * @struct FeatureScale
 * @brief Linear map between a 0-100 slider and a native [lo, hi] range.
 *
 *  Native values outside [lo, hi] clamp to slider 0 or 100.
 */
  struct FeatureScale {
    double lo;
    double hi;

    double sliderToNative(double slider) const;
    double nativeToSlider(double native) const;
  };

  /// Loudness in dB anchored at the reference corpus p5..p95.
  inline constexpr FeatureScale kLoudnessDbScale{ -19.464, -3.433 };
  /// Tempo in BPM anchored at the reference corpus p5..p95.
  inline constexpr FeatureScale kTempoBpmScale{ 76.783, 175.797 };

  /**
 * @class FeatureScaler
 * @brief Stateless bidirectional mapping used by the catalog and the oracle contracts.
 *
 *  * energy, valence, speechiness, acousticness, instrumentalness, liveness: 0-100 <-> 0.0-1.0
 *  * loudness (dB) and tempo (BPM): robust anchored scales
 */
  class FeatureScaler {
  public:
    explicit FeatureScaler(FeatureScale loudness = kLoudnessDbScale,
                           FeatureScale tempo = kTempoBpmScale);

    double sliderToNative(Feature f, double slider) const;
    double nativeToSlider(Feature f, double native) const;

    FeatureVector toNative(const FeatureVector& sliders) const;

    /// Native row -> sliders rounded to one decimal. Missing natives map to slider 50.
    FeatureVector toSliders(const std::array<std::optional<double>, kFeatureCount>& native) const;

    /// 0 => -1.0, 50 => 0.0, 100 => +1.0
    static double valenceSliderToSigned(double slider);
    static double signedValenceToSlider(double signedValence);

  private:
    FeatureScale loudness_;
    FeatureScale tempo_;
  };

} // namespace vibedj::core
