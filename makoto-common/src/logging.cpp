#include "makoto/common/logging.h"

#include <cstdlib>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace makoto::common {

namespace {

constexpr std::string_view kLoggerPrefix = "makoto:";

std::mutex g_logging_mutex;
bool g_configured = false;
LoggingOptions g_options;

// Parsed SPDLOG_LEVEL entries that apply to makoto loggers.
std::optional<spdlog::level::level_enum> g_env_default_level;
std::map<std::string, spdlog::level::level_enum, std::less<>> g_env_named_levels;

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view text) {
  const auto level = spdlog::level::from_str(std::string(text));
  if (level == spdlog::level::off && text != "off") {
    return std::nullopt;
  }
  return level;
}

// Reads SPDLOG_LEVEL ("info", "makoto:merkle=trace,warn", ...). Entries naming loggers outside
// the makoto prefix are ignored.
void LoadEnvLevelsLocked() {
  g_env_default_level.reset();
  g_env_named_levels.clear();

  const char* env = std::getenv("SPDLOG_LEVEL");
  if (!env) {
    return;
  }

  std::string_view rest(env);
  while (!rest.empty()) {
    const std::size_t comma = rest.find(',');
    const std::string_view entry = rest.substr(0, comma);
    rest = comma == std::string_view::npos ? std::string_view() : rest.substr(comma + 1);

    const std::size_t eq = entry.find('=');
    if (eq == std::string_view::npos) {
      if (auto level = ParseLevel(entry)) {
        g_env_default_level = *level;
      }
      continue;
    }

    const std::string_view name = entry.substr(0, eq);
    if (!name.starts_with(kLoggerPrefix)) {
      continue;
    }
    if (auto level = ParseLevel(entry.substr(eq + 1))) {
      g_env_named_levels[std::string(name)] = *level;
    }
  }
}

void SetOptionsLocked(const LoggingOptions& options) {
  g_options = options;
  if (options.load_env_levels) {
    LoadEnvLevelsLocked();
  } else {
    g_env_default_level.reset();
    g_env_named_levels.clear();
  }
  g_configured = true;
}

// Caller holds g_logging_mutex. Only touches @p logger, never the spdlog registry defaults.
void ApplyOptionsLocked(spdlog::logger& logger) {
  auto level = g_env_default_level.value_or(g_options.level);
  if (const auto it = g_env_named_levels.find(logger.name()); it != g_env_named_levels.end()) {
    level = it->second;
  }
  logger.set_level(level);
  logger.set_pattern(g_options.pattern);
}

} // namespace

std::shared_ptr<spdlog::logger> GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_logging_mutex);

  if (!g_configured) {
    SetOptionsLocked(LoggingOptions{});
  }

  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  auto logger = spdlog::stderr_color_mt(name);
  ApplyOptionsLocked(*logger);
  return logger;
}

void ConfigureLogging(const LoggingOptions& options) {
  std::lock_guard<std::mutex> lock(g_logging_mutex);
  SetOptionsLocked(options);

  spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
    if (std::string_view(logger->name()).starts_with(kLoggerPrefix)) {
      ApplyOptionsLocked(*logger);
    }
  });
}

} // namespace makoto::common
