#include "input.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace camlbin::driver {

namespace fs = std::filesystem;

auto ReadInputFile(const fs::path& path, size_t offset)
    -> std::expected<std::vector<uint8_t>, std::string> {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::unexpected(
        std::format("cannot open '{}': not a regular file", path.string()));
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(std::format("cannot open '{}'", path.string()));
  }
  std::vector<uint8_t> bytes(
      (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::unexpected(std::format("error reading '{}'", path.string()));
  }

  if (offset > bytes.size()) {
    return std::unexpected(
        std::format(
            "offset {} is past the end of '{}' ({} bytes)", offset,
            path.string(), bytes.size()));
  }
  bytes.erase(bytes.begin(), bytes.begin() + static_cast<ptrdiff_t>(offset));
  return bytes;
}

}  // namespace camlbin::driver
