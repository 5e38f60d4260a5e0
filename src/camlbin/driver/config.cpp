#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>

#include <toml++/toml.hpp>

#include "logging.hpp"

namespace camlbin::driver {

namespace fs = std::filesystem;

namespace {

auto ReadCount(
    toml::node_view<toml::node> node, const fs::path& config_path,
    const char* key) -> std::expected<std::optional<size_t>, std::string> {
  if (!node) {
    return std::nullopt;
  }
  std::optional<int64_t> value;
  if (node.is_integer()) {
    value = node.value<int64_t>();
  }
  if (!value || *value < 0) {
    return std::unexpected(
        std::format(
            "{}: '{}' must be a non-negative integer", config_path.string(),
            key));
  }
  return static_cast<size_t>(*value);
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path)
    -> std::expected<ToolConfig, std::string> {
  ToolConfig config;

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        std::format("failed to parse {}: {}", config_path.string(), e.what()));
  }

  // [decode] section (optional)
  auto max_depth =
      ReadCount(tbl["decode"]["max_depth"], config_path, "decode.max_depth");
  if (!max_depth) {
    return std::unexpected(max_depth.error());
  }
  if (*max_depth) {
    config.max_depth = **max_depth;
  }

  if (auto node = tbl["decode"]["check_object_count"]) {
    if (!node.is_boolean()) {
      return std::unexpected(
          std::format(
              "{}: 'decode.check_object_count' must be a boolean",
              config_path.string()));
    }
    config.check_object_count = node.value_or(true);
  }

  // [output] section (optional)
  auto preview =
      ReadCount(tbl["output"]["preview"], config_path, "output.preview");
  if (!preview) {
    return std::unexpected(preview.error());
  }
  if (*preview) {
    config.preview = **preview;
  }

  // [log] section (optional)
  if (auto node = tbl["log"]["level"]) {
    auto level = node.value<std::string>();
    if (!node.is_string() || !level || !ParseLogLevel(*level)) {
      return std::unexpected(
          std::format(
              "{}: 'log.level' must be one of trace, debug, info, warn, "
              "error, off",
              config_path.string()));
    }
    config.log_level = *level;
  }

  return config;
}

}  // namespace camlbin::driver
