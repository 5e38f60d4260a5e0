#include "camlbin/reader/header.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>

#include <spdlog/spdlog.h>

namespace camlbin::reader {

auto ParseHeader(ByteCursor& cursor) -> Result<Header> {
  size_t start = cursor.Position();
  auto magic = cursor.ReadU32();
  if (!magic) {
    return std::unexpected(magic.error());
  }

  switch (*magic) {
    case kMagicSmall:
      break;
    case kMagicBig:
      return std::unexpected(
          DecodeError::Make(
              DecodeErrorKind::kUnsupportedFeature, start,
              "big header (payloads over 4 GiB) is not supported"));
    case kMagicCompressed:
      return std::unexpected(
          DecodeError::Make(
              DecodeErrorKind::kUnsupportedFeature, start,
              "compressed marshal data is not supported"));
    default:
      return std::unexpected(
          DecodeError::Make(
              DecodeErrorKind::kUnsupportedMagic, start,
              std::format("bad magic number 0x{:08X}", *magic)));
  }

  Header header{.magic = *magic};
  uint32_t* fields[] = {
      &header.data_length, &header.object_count, &header.size_32,
      &header.size_64};
  for (uint32_t* field : fields) {
    auto value = cursor.ReadU32();
    if (!value) {
      return std::unexpected(value.error());
    }
    *field = *value;
  }

  spdlog::debug(
      "header: data_length={} object_count={} size_32={} size_64={}",
      header.data_length, header.object_count, header.size_32, header.size_64);
  return header;
}

}  // namespace camlbin::reader
