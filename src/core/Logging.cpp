/* @file Logging.cpp
 * @brief spdlog registry wrapper
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <mutex>

// third-party headers
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/Logging.hpp"

namespace vibedj::core::logging {

  namespace {
    std::mutex& registryMutex() {
      static std::mutex mtx;
      return mtx;
    }

    constexpr const char* kPattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] [%n] %v";
  } // namespace

  void configure(const std::string& level) {
    std::lock_guard<std::mutex> lock(registryMutex());
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern(kPattern);
  }

  std::shared_ptr<spdlog::logger> get(const std::string& component) {
    std::lock_guard<std::mutex> lock(registryMutex());
    if (auto existing = spdlog::get(component))
      return existing;
    auto created = spdlog::stdout_color_mt(component);
    created->set_pattern(kPattern);
    return created;
  }

} // namespace vibedj::core::logging
