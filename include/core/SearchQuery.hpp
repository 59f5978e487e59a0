#pragma once
/** @file  SearchQuery.hpp
 *  @brief "Title by Artist" search strings and the key normalization shared by stores.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <string>
#include <utility>

namespace vibedj::core {

  /// "<title> by <artist>"
  std::string buildSearchQuery(const std::string& title, const std::string& artist);

  /// Splits on the last " by " (case-insensitive). Returns {query, ""} when there is none.
  std::pair<std::string, std::string> parseSearchQuery(const std::string& query);

  std::string trim(const std::string& s);

  /// trim + lowercase; conservative so that distinct songs never merge.
  std::string normalizeKey(const std::string& s);

  /// "<norm title>|||<norm artist>", the key of track-scope weight overrides.
  std::string trackKey(const std::string& title, const std::string& artist);

  /// Drops every non-ASCII byte so prompts and logs stay 7-bit clean.
  std::string asciiSafe(const std::string& s);

} // namespace vibedj::core
