// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file logging.h
 * @brief Named spdlog loggers shared across the makoto libraries.
 */

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace makoto::common {

struct LoggingOptions {
  spdlog::level::level_enum level = spdlog::level::warn;

  std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

  // When true, SPDLOG_LEVEL (e.g. "debug" or "makoto:merkle=trace") overrides @p level.
  bool load_env_levels = true;
};

/**
 * @brief Returns the logger registered under @p name, creating a stderr logger on first use.
 *
 * Loggers are registered with spdlog, so the same instance is returned for the same name.
 */
std::shared_ptr<spdlog::logger> GetLogger(const std::string& name);

/**
 * @brief Applies @p options to all "makoto:" loggers, including ones created later.
 *
 * Other loggers and the spdlog registry defaults (global level, pattern, default logger) are left
 * untouched, as are SPDLOG_LEVEL entries that name loggers outside the "makoto:" prefix.
 */
void ConfigureLogging(const LoggingOptions& options);

} // namespace makoto::common
