#include "camlbin/reader/custom.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace camlbin::reader {

namespace {

constexpr uint8_t kNativeIntMarker32 = 1;
constexpr uint8_t kNativeIntMarker64 = 2;

auto Malformed(const Custom& custom, std::string detail) -> DecodeError {
  return DecodeError::Make(
      DecodeErrorKind::kMalformedCustom, 0,
      std::format("custom '{}': {}", custom.identifier, detail));
}

auto ExpectIdentifier(const Custom& custom, std::string_view expected)
    -> Result<void> {
  if (custom.identifier != expected) {
    return std::unexpected(
        Malformed(custom, std::format("expected identifier '{}'", expected)));
  }
  return {};
}

auto ExpectLength(const Custom& custom, size_t expected) -> Result<void> {
  if (custom.payload.size() != expected) {
    return std::unexpected(
        Malformed(
            custom, std::format(
                        "payload is {} byte(s), expected {}",
                        custom.payload.size(), expected)));
  }
  return {};
}

}  // namespace

auto LookupBuiltinCustom(std::string_view identifier)
    -> std::optional<BuiltinCustom> {
  if (identifier == kInt32Identifier) {
    return BuiltinCustom::kInt32;
  }
  if (identifier == kInt64Identifier) {
    return BuiltinCustom::kInt64;
  }
  if (identifier == kNativeIntIdentifier) {
    return BuiltinCustom::kNativeInt;
  }
  return std::nullopt;
}

auto InMemorySize(BuiltinCustom kind) -> uint64_t {
  switch (kind) {
    case BuiltinCustom::kInt32:
      return 4;
    case BuiltinCustom::kInt64:
    case BuiltinCustom::kNativeInt:
      return 8;
  }
  return 0;
}

auto ReadCustomIdentifier(ByteCursor& cursor) -> Result<std::string> {
  size_t start = cursor.Position();
  std::string identifier;
  while (true) {
    auto byte = cursor.ReadU8();
    if (!byte) {
      return std::unexpected(byte.error());
    }
    if (*byte == 0) {
      return identifier;
    }
    if (identifier.size() == kMaxCustomIdentifierLength) {
      return std::unexpected(
          DecodeError::Make(
              DecodeErrorKind::kIdentifierTooLong, start,
              std::format(
                  "custom identifier longer than {} bytes",
                  kMaxCustomIdentifierLength)));
    }
    identifier.push_back(static_cast<char>(*byte));
  }
}

auto ReadCustomPayload(ByteCursor& cursor, BuiltinCustom kind)
    -> Result<std::vector<uint8_t>> {
  std::vector<uint8_t> payload;
  size_t width = 0;
  switch (kind) {
    case BuiltinCustom::kInt32:
      width = 4;
      break;
    case BuiltinCustom::kInt64:
      width = 8;
      break;
    case BuiltinCustom::kNativeInt: {
      size_t marker_position = cursor.Position();
      auto marker = cursor.ReadU8();
      if (!marker) {
        return std::unexpected(marker.error());
      }
      if (*marker == kNativeIntMarker32) {
        width = 4;
      } else if (*marker == kNativeIntMarker64) {
        width = 8;
      } else {
        return std::unexpected(
            DecodeError::Make(
                DecodeErrorKind::kMalformedCustom, marker_position,
                std::format("ill-formed native integer marker {}", *marker)));
      }
      payload.push_back(*marker);
      break;
    }
  }

  auto bytes = cursor.ReadBytes(width);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  payload.insert(payload.end(), bytes->begin(), bytes->end());
  return payload;
}

auto AsInt32(const Custom& custom) -> Result<int32_t> {
  if (auto ok = ExpectIdentifier(custom, kInt32Identifier); !ok) {
    return std::unexpected(ok.error());
  }
  if (auto ok = ExpectLength(custom, 4); !ok) {
    return std::unexpected(ok.error());
  }
  ByteCursor cursor(std::span<const uint8_t>(custom.payload));
  return cursor.ReadI32();
}

auto AsInt64(const Custom& custom) -> Result<int64_t> {
  if (auto ok = ExpectIdentifier(custom, kInt64Identifier); !ok) {
    return std::unexpected(ok.error());
  }
  if (auto ok = ExpectLength(custom, 8); !ok) {
    return std::unexpected(ok.error());
  }
  ByteCursor cursor(std::span<const uint8_t>(custom.payload));
  return cursor.ReadI64();
}

auto AsNativeInt(const Custom& custom) -> Result<int64_t> {
  if (auto ok = ExpectIdentifier(custom, kNativeIntIdentifier); !ok) {
    return std::unexpected(ok.error());
  }
  if (custom.payload.empty()) {
    return std::unexpected(Malformed(custom, "missing width marker"));
  }
  // The integer follows the one-byte width marker.
  ByteCursor cursor(std::span<const uint8_t>(custom.payload).subspan(1));
  switch (custom.payload[0]) {
    case kNativeIntMarker32:
      if (auto ok = ExpectLength(custom, 5); !ok) {
        return std::unexpected(ok.error());
      }
      return cursor.ReadI32().transform(
          [](int32_t v) { return static_cast<int64_t>(v); });
    case kNativeIntMarker64:
      if (auto ok = ExpectLength(custom, 9); !ok) {
        return std::unexpected(ok.error());
      }
      return cursor.ReadI64();
    default:
      return std::unexpected(
          Malformed(
              custom,
              std::format("unknown width marker {}", custom.payload[0])));
  }
}

}  // namespace camlbin::reader
