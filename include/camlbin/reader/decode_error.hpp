#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace camlbin::reader {

// Classification of a failed decode. Every kind aborts the whole decode.
enum class DecodeErrorKind : uint8_t {
  kUnsupportedMagic,        // Header marker not recognized
  kTruncatedInput,          // Cursor ran out of bytes mid-read
  kUnknownTag,              // Tag byte outside every recognized code
  kInvalidSharedReference,  // Back-offset outside the allocated range
  kUnsupportedFeature,      // Recognized but deliberately not implemented
  kIdentifierTooLong,       // Custom identifier exceeds the scratch bound
  kMalformedCustom,         // Built-in custom payload is ill-formed
  kHeaderMismatch,          // Decoded stream disagrees with header counts
  kDepthLimitExceeded,      // Caller-imposed nesting cap reached
};

struct DecodeError {
  DecodeErrorKind kind;
  // Byte offset into the input buffer where the failure was detected.
  size_t offset = 0;
  std::string detail;

  auto operator==(const DecodeError&) const -> bool = default;

  static auto Make(DecodeErrorKind kind, size_t offset, std::string detail)
      -> DecodeError {
    return DecodeError{
        .kind = kind, .offset = offset, .detail = std::move(detail)};
  }
};

template <typename T>
using Result = std::expected<T, DecodeError>;

// Short, stable name for an error kind ("truncated input", ...).
auto ToString(DecodeErrorKind kind) -> const char*;

// Single-line rendering: "<kind>: <detail> (at offset N)".
auto FormatError(const DecodeError& error) -> std::string;

}  // namespace camlbin::reader
