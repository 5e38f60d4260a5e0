#pragma once

#include <optional>
#include <string_view>

#include <spdlog/common.h>

namespace camlbin::driver {

// Accepts trace, debug, info, warn, error, off.
auto ParseLogLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum>;

// Installs a stderr logger named "camlbin" as the spdlog default, so the
// library's log calls never mix with dump output on stdout.
void ConfigureLogging(spdlog::level::level_enum level);

// Each -v lowers the level one step from `base`, down to trace.
auto ApplyVerbosity(spdlog::level::level_enum base, int verbosity)
    -> spdlog::level::level_enum;

}  // namespace camlbin::driver
