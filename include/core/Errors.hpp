#pragma once
/** @file  Errors.hpp
 *  @brief Exception types thrown across subsystem boundaries.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

#include <stdexcept>

namespace vibedj::core {

  /// Oracle unreachable, timed out, or returned a response that breaks its contract.
  class OracleError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// SQLite open/prepare/step failure.
  class StoreError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// Invalid configuration value.
  class ConfigError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

} // namespace vibedj::core
