#pragma once

#include <cstddef>
#include <cstdint>

#include "camlbin/reader/byte_cursor.hpp"
#include "camlbin/reader/decode_error.hpp"

namespace camlbin::reader {

// Header markers defined by the format. Only the small header is decoded.
constexpr uint32_t kMagicSmall = 0x8495A6BE;
constexpr uint32_t kMagicBig = 0x8495A6BF;
constexpr uint32_t kMagicCompressed = 0x8495A6BD;

constexpr size_t kSmallHeaderSize = 20;

struct Header {
  uint32_t magic = 0;
  // Length in bytes of the value stream following the header.
  uint32_t data_length = 0;
  // Number of sharable objects the producer recorded.
  uint32_t object_count = 0;
  // Heap size hints in words for 32-bit and 64-bit readers. Informational.
  uint32_t size_32 = 0;
  uint32_t size_64 = 0;

  auto operator==(const Header&) const -> bool = default;
};

// Reads the fixed-size header prefix. Validates the marker only.
auto ParseHeader(ByteCursor& cursor) -> Result<Header>;

}  // namespace camlbin::reader
