#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace camlbin::driver {

inline constexpr const char* kConfigFileName = "camlbin.toml";

// Deep enough for any ordinary list or tree, shallow enough to fail before
// the decoder or printer exhausts the stack.
inline constexpr size_t kDefaultMaxDepth = 10000;

struct ToolConfig {
  // [decode]
  size_t max_depth = kDefaultMaxDepth;  // 0 = unbounded
  bool check_object_count = true;

  // [output]
  size_t preview = 64;

  // [log]
  std::string log_level = "warn";
};

// Search for camlbin.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse camlbin.toml. Every section and key is optional; unknown keys are
// ignored. Returns an error message on parse errors or ill-typed values.
auto LoadConfig(const std::filesystem::path& config_path)
    -> std::expected<ToolConfig, std::string>;

}  // namespace camlbin::driver
