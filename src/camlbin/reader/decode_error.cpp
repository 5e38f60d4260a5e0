#include "camlbin/reader/decode_error.hpp"

#include <format>
#include <string>

namespace camlbin::reader {

auto ToString(DecodeErrorKind kind) -> const char* {
  switch (kind) {
    case DecodeErrorKind::kUnsupportedMagic:
      return "unsupported magic";
    case DecodeErrorKind::kTruncatedInput:
      return "truncated input";
    case DecodeErrorKind::kUnknownTag:
      return "unknown tag";
    case DecodeErrorKind::kInvalidSharedReference:
      return "invalid shared reference";
    case DecodeErrorKind::kUnsupportedFeature:
      return "unsupported feature";
    case DecodeErrorKind::kIdentifierTooLong:
      return "identifier too long";
    case DecodeErrorKind::kMalformedCustom:
      return "malformed custom block";
    case DecodeErrorKind::kHeaderMismatch:
      return "header mismatch";
    case DecodeErrorKind::kDepthLimitExceeded:
      return "depth limit exceeded";
  }
  return "unknown error";
}

auto FormatError(const DecodeError& error) -> std::string {
  return std::format(
      "{}: {} (at offset {})", ToString(error.kind), error.detail,
      error.offset);
}

}  // namespace camlbin::reader
