#include "logging.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace camlbin::driver {

namespace {

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 6>
    kLevels = {{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off", spdlog::level::off},
    }};

}  // namespace

auto ParseLogLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum> {
  for (const auto& [level_name, level] : kLevels) {
    if (level_name == name) {
      return level;
    }
  }
  return std::nullopt;
}

void ConfigureLogging(spdlog::level::level_enum level) {
  auto logger = spdlog::get("camlbin");
  if (!logger) {
    logger = spdlog::stderr_color_mt("camlbin");
  }
  logger->set_pattern("%n: %^%l%$: %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(level);
}

auto ApplyVerbosity(spdlog::level::level_enum base, int verbosity)
    -> spdlog::level::level_enum {
  if (base == spdlog::level::off && verbosity > 0) {
    base = spdlog::level::warn;
  }
  int lowered = std::max(
      static_cast<int>(spdlog::level::trace),
      static_cast<int>(base) - verbosity);
  return static_cast<spdlog::level::level_enum>(lowered);
}

}  // namespace camlbin::driver
