#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "camlbin/reader/byte_cursor.hpp"
#include "camlbin/reader/decode_error.hpp"
#include "camlbin/reader/document.hpp"
#include "camlbin/reader/object_table.hpp"
#include "camlbin/reader/opcode.hpp"

namespace camlbin::reader {

struct DecodeOptions {
  // Maximum structural nesting depth; the root is depth 1. 0 = unbounded.
  size_t max_depth = 0;
  // Fail when the number of allocated objects differs from the header. A
  // header count of 0 marks data written without sharing and is not checked.
  bool check_object_count = true;
};

// Decodes one marshaled value from a byte buffer.
//
// Construction performs no parsing. Decode() reads the header and exactly
// one top-level value and consumes the decoder; each decoder owns its own
// cursor and object table. The buffer must outlive the decoder but not the
// returned Document.
//
// Usage:
//   auto doc = Decoder(bytes).Decode();
//   if (!doc) { ... doc.error() ... }
class Decoder {
 public:
  explicit Decoder(std::span<const uint8_t> buffer, DecodeOptions options = {})
      : cursor_(buffer), options_(options) {
  }

  auto Decode() && -> Result<Document>;

 private:
  auto DecodeValue(size_t depth) -> Result<Value>;

  auto DecodeString(uint64_t length) -> Result<Value>;
  auto DecodeBlock(uint8_t tag, uint64_t size, size_t depth) -> Result<Value>;
  auto DecodeDouble(bool little_endian) -> Result<Value>;
  auto DecodeDoubleArray(uint64_t length, bool little_endian) -> Result<Value>;
  auto DecodeShared(uint64_t offset, size_t tag_position) -> Result<Value>;
  auto DecodeCustom(Opcode opcode, size_t tag_position) -> Result<Value>;

  // Fails with kTruncatedInput when fewer than `count` elements of
  // `element_size` bytes remain, before anything is allocated for them.
  auto CheckAvailable(uint64_t count, uint64_t element_size) const
      -> Result<void>;

  ByteCursor cursor_;
  ObjectTable table_;
  DecodeOptions options_;
  // False when the header declares no objects: the producer kept no sharing
  // table, so no back-reference can be valid.
  bool sharing_ = true;
};

// Convenience wrapper around Decoder(buffer, options).Decode().
auto DecodeBuffer(std::span<const uint8_t> buffer, DecodeOptions options = {})
    -> Result<Document>;

}  // namespace camlbin::reader
