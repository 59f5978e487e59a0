#pragma once
/** @file  WeightedSampling.hpp
 *  @brief One-pass weighted sampling without replacement (Efraimidis-Spirakis keys).
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <random>
#include <utility>
#include <vector>

namespace vibedj::catalog {

  /**
   * @brief Draws \p k items, each with probability proportional to `weight(item)`.
   *
   * Every positive-weight item gets the key log(U)/w with U uniform in (0,1]; the k largest keys
   * win. When fewer than k items have positive weight, or a key is not finite, the draw falls
   * back to a uniform sample. Results are ordered most likely first.
   */
  template <typename T, typename WeightFn, typename Rng>
  std::vector<T> weightedSample(const std::vector<T>& items, std::size_t k, WeightFn&& weight, Rng& rng) {
    if (items.size() <= k)
      return items;

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::vector<std::pair<double, std::size_t>> keyed;
    keyed.reserve(items.size());
    bool finite = true;
    for (std::size_t i = 0; i < items.size(); ++i) {
      const double w = std::max(0.0, static_cast<double>(weight(items[i])));
      if (!(w > 0.0))
        continue;
      const double u = std::max(1e-12, unit(rng));
      const double key = std::log(u) / w;
      if (!std::isfinite(key)) {
        finite = false;
        break;
      }
      keyed.emplace_back(key, i);
    }

    std::vector<T> out;
    out.reserve(k);
    if (finite && keyed.size() >= k) {
      std::partial_sort(keyed.begin(), keyed.begin() + static_cast<std::ptrdiff_t>(k), keyed.end(),
                        [](const auto& a, const auto& b) { return a.first > b.first; });
      for (std::size_t i = 0; i < k; ++i)
        out.push_back(items[keyed[i].second]);
      return out;
    }

    std::vector<std::size_t> order(items.size());
    for (std::size_t i = 0; i < order.size(); ++i)
      order[i] = i;
    std::shuffle(order.begin(), order.end(), rng);
    for (std::size_t i = 0; i < k; ++i)
      out.push_back(items[order[i]]);
    return out;
  }

} // namespace vibedj::catalog
