#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace camlbin::driver {

// Reads a whole file, then drops the first `offset` bytes. Used to skip a
// prefix (e.g. a container format) in front of the marshal header.
auto ReadInputFile(const std::filesystem::path& path, size_t offset = 0)
    -> std::expected<std::vector<uint8_t>, std::string>;

}  // namespace camlbin::driver
