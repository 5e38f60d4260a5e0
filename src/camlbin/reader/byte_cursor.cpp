#include "camlbin/reader/byte_cursor.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <span>

namespace camlbin::reader {

auto ByteCursor::Claim(size_t count) -> Result<size_t> {
  if (failed_) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kTruncatedInput, position_,
            "read after an earlier truncated read"));
  }
  size_t remaining = buffer_.size() - position_;
  if (count > remaining) {
    failed_ = true;
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kTruncatedInput, position_,
            std::format(
                "need {} byte(s), only {} remaining", count, remaining)));
  }
  size_t start = position_;
  position_ += count;
  return start;
}

auto ByteCursor::ReadUnsignedBe(size_t width) -> Result<uint64_t> {
  auto start = Claim(width);
  if (!start) {
    return std::unexpected(start.error());
  }
  uint64_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    value = (value << 8) | buffer_[*start + i];
  }
  return value;
}

auto ByteCursor::ReadUnsignedLe(size_t width) -> Result<uint64_t> {
  auto start = Claim(width);
  if (!start) {
    return std::unexpected(start.error());
  }
  uint64_t value = 0;
  for (size_t i = width; i > 0; --i) {
    value = (value << 8) | buffer_[*start + i - 1];
  }
  return value;
}

auto ByteCursor::ReadBytes(size_t count) -> Result<std::span<const uint8_t>> {
  auto start = Claim(count);
  if (!start) {
    return std::unexpected(start.error());
  }
  return buffer_.subspan(*start, count);
}

auto ByteCursor::PeekU8() const -> Result<uint8_t> {
  if (failed_ || position_ >= buffer_.size()) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kTruncatedInput, position_,
            "need 1 byte, none remaining"));
  }
  return buffer_[position_];
}

auto ByteCursor::ReadU8() -> Result<uint8_t> {
  return ReadUnsignedBe(1).transform(
      [](uint64_t v) { return static_cast<uint8_t>(v); });
}

auto ByteCursor::ReadU16() -> Result<uint16_t> {
  return ReadUnsignedBe(2).transform(
      [](uint64_t v) { return static_cast<uint16_t>(v); });
}

auto ByteCursor::ReadU32() -> Result<uint32_t> {
  return ReadUnsignedBe(4).transform(
      [](uint64_t v) { return static_cast<uint32_t>(v); });
}

auto ByteCursor::ReadU64() -> Result<uint64_t> {
  return ReadUnsignedBe(8);
}

auto ByteCursor::ReadI8() -> Result<int8_t> {
  return ReadU8().transform([](uint8_t v) { return std::bit_cast<int8_t>(v); });
}

auto ByteCursor::ReadI16() -> Result<int16_t> {
  return ReadU16().transform(
      [](uint16_t v) { return std::bit_cast<int16_t>(v); });
}

auto ByteCursor::ReadI32() -> Result<int32_t> {
  return ReadU32().transform(
      [](uint32_t v) { return std::bit_cast<int32_t>(v); });
}

auto ByteCursor::ReadI64() -> Result<int64_t> {
  return ReadU64().transform(
      [](uint64_t v) { return std::bit_cast<int64_t>(v); });
}

auto ByteCursor::ReadU32Le() -> Result<uint32_t> {
  return ReadUnsignedLe(4).transform(
      [](uint64_t v) { return static_cast<uint32_t>(v); });
}

auto ByteCursor::ReadU64Le() -> Result<uint64_t> {
  return ReadUnsignedLe(8);
}

auto ByteCursor::ReadF64Be() -> Result<double> {
  return ReadU64().transform(
      [](uint64_t bits) { return std::bit_cast<double>(bits); });
}

auto ByteCursor::ReadF64Le() -> Result<double> {
  return ReadU64Le().transform(
      [](uint64_t bits) { return std::bit_cast<double>(bits); });
}

}  // namespace camlbin::reader
