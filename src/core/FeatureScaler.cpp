/* @file FeatureScaler.cpp
 * @brief slider <-> native unit conversion
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// VibeDJ headers
#include "core/FeatureScaler.hpp"

using namespace vibedj::core;

namespace {

  double slider01(double slider) { return std::clamp(slider, 0.0, 100.0) / 100.0; }

  double from01ToSlider(double x01) { return std::clamp(x01, 0.0, 1.0) * 100.0; }

  double round1(double v) { return std::round(v * 10.0) / 10.0; }

} // namespace

double FeatureScale::sliderToNative(double slider) const {
  return lo + (hi - lo) * slider01(slider);
}

double FeatureScale::nativeToSlider(double native) const {
  if (hi == lo)
    return 0.0;
  return from01ToSlider((native - lo) / (hi - lo));
}

FeatureScaler::FeatureScaler(FeatureScale loudness, FeatureScale tempo)
    : loudness_(loudness), tempo_(tempo) {}

double FeatureScaler::sliderToNative(Feature f, double slider) const {
  switch (f) {
  case Feature::Loudness:
    return loudness_.sliderToNative(slider);
  case Feature::Tempo:
    return tempo_.sliderToNative(slider);
  default:
    return slider01(slider);
  }
}

double FeatureScaler::nativeToSlider(Feature f, double native) const {
  switch (f) {
  case Feature::Loudness:
    return loudness_.nativeToSlider(native);
  case Feature::Tempo:
    return tempo_.nativeToSlider(native);
  default:
    return from01ToSlider(native);
  }
}

FeatureVector FeatureScaler::toNative(const FeatureVector& sliders) const {
  FeatureVector out{};
  for (auto f : kAllFeatures)
    out[index(f)] = sliderToNative(f, sliders[index(f)]);
  return out;
}

FeatureVector
FeatureScaler::toSliders(const std::array<std::optional<double>, kFeatureCount>& native) const {
  FeatureVector out{};
  for (auto f : kAllFeatures) {
    const auto& v = native[index(f)];
    out[index(f)] = (v && std::isfinite(*v)) ? round1(nativeToSlider(f, *v)) : 50.0;
  }
  return out;
}

double FeatureScaler::valenceSliderToSigned(double slider) { return slider01(slider) * 2.0 - 1.0; }

double FeatureScaler::signedValenceToSlider(double signedValence) {
  return from01ToSlider((std::clamp(signedValence, -1.0, 1.0) + 1.0) / 2.0);
}
