#pragma once
/** @file  Logging.hpp
 *  @brief Per-component spdlog loggers ("coordinator", "catalog", ...).
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace vibedj::core::logging {

  /// Sets the level of every existing and future component logger ("trace".."off").
  void configure(const std::string& level);

  /// Returns the named logger, creating a colored stdout logger on first use. Thread-safe.
  std::shared_ptr<spdlog::logger> get(const std::string& component);

} // namespace vibedj::core::logging
