/* @file SearchQuery.cpp
 * @brief search-string building/parsing and key normalization
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// VibeDJ headers
#include "core/SearchQuery.hpp"

namespace vibedj::core {

  std::string buildSearchQuery(const std::string& title, const std::string& artist) {
    return title + " by " + artist;
  }

  std::pair<std::string, std::string> parseSearchQuery(const std::string& query) {
    const std::string q = trim(query);
    std::string lower = q;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto pos = lower.rfind(" by ");
    if (pos == std::string::npos)
      return { q, "" };
    return { trim(q.substr(0, pos)), trim(q.substr(pos + 4)) };
  }

  std::string trim(const std::string& s) {
    const auto first = std::find_if_not(s.begin(), s.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(),
                                       [](unsigned char c) { return std::isspace(c); })
                          .base();
    return first < last ? std::string(first, last) : std::string{};
  }

  std::string normalizeKey(const std::string& s) {
    std::string out = trim(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
  }

  std::string trackKey(const std::string& title, const std::string& artist) {
    return normalizeKey(title) + "|||" + normalizeKey(artist);
  }

  std::string asciiSafe(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
      if (c < 0x80)
        out.push_back(static_cast<char>(c));
    }
    return out;
  }

} // namespace vibedj::core
