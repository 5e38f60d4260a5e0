#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "camlbin/reader/decode_error.hpp"

namespace camlbin::reader {

// Sequential, bounds-checked reader over an immutable byte buffer.
//
// Multi-byte reads are big-endian unless the method name says otherwise.
// A read that would run past the end fails with kTruncatedInput, consumes
// nothing, and poisons the cursor: every later read fails the same way.
// The position never moves backwards.
class ByteCursor {
 public:
  explicit ByteCursor(std::span<const uint8_t> buffer) : buffer_(buffer) {
  }

  [[nodiscard]] auto Position() const -> size_t {
    return position_;
  }
  [[nodiscard]] auto Remaining() const -> size_t {
    return failed_ ? 0 : buffer_.size() - position_;
  }
  [[nodiscard]] auto Failed() const -> bool {
    return failed_;
  }

  // Returns a view into the underlying buffer; valid as long as the buffer.
  auto ReadBytes(size_t count) -> Result<std::span<const uint8_t>>;

  auto PeekU8() const -> Result<uint8_t>;

  auto ReadU8() -> Result<uint8_t>;
  auto ReadU16() -> Result<uint16_t>;
  auto ReadU32() -> Result<uint32_t>;
  auto ReadU64() -> Result<uint64_t>;

  auto ReadI8() -> Result<int8_t>;
  auto ReadI16() -> Result<int16_t>;
  auto ReadI32() -> Result<int32_t>;
  auto ReadI64() -> Result<int64_t>;

  auto ReadU32Le() -> Result<uint32_t>;
  auto ReadU64Le() -> Result<uint64_t>;

  auto ReadF64Be() -> Result<double>;
  auto ReadF64Le() -> Result<double>;

 private:
  // Checks and claims `count` bytes, returning the offset of the first one.
  auto Claim(size_t count) -> Result<size_t>;

  auto ReadUnsignedBe(size_t width) -> Result<uint64_t>;
  auto ReadUnsignedLe(size_t width) -> Result<uint64_t>;

  std::span<const uint8_t> buffer_;
  size_t position_ = 0;
  bool failed_ = false;
};

}  // namespace camlbin::reader
