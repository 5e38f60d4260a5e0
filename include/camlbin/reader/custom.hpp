#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "camlbin/reader/byte_cursor.hpp"
#include "camlbin/reader/decode_error.hpp"
#include "camlbin/reader/value.hpp"

namespace camlbin::reader {

// Longest identifier accepted, not counting the terminating NUL.
constexpr size_t kMaxCustomIdentifierLength = 63;

constexpr std::string_view kInt32Identifier = "_i";
constexpr std::string_view kInt64Identifier = "_j";
constexpr std::string_view kNativeIntIdentifier = "_n";

// Custom blocks whose layout the reader knows. Anything else is an
// application-defined serializer and is rejected.
enum class BuiltinCustom : uint8_t {
  kInt32,
  kInt64,
  kNativeInt,
};

auto LookupBuiltinCustom(std::string_view identifier)
    -> std::optional<BuiltinCustom>;

// Size of the value in the producer's heap, as declared by CUSTOM_LEN's
// size_64 field.
auto InMemorySize(BuiltinCustom kind) -> uint64_t;

// Reads a NUL-terminated identifier. Fails with kIdentifierTooLong once more
// than kMaxCustomIdentifierLength bytes are seen without a terminator.
auto ReadCustomIdentifier(ByteCursor& cursor) -> Result<std::string>;

// Reads the serialized payload of a built-in custom block. The stream length
// is fixed by the identifier; nativeint carries a width marker byte
// (1 = 32-bit, 2 = 64-bit) which is kept as the first payload byte.
auto ReadCustomPayload(ByteCursor& cursor, BuiltinCustom kind)
    -> Result<std::vector<uint8_t>>;

// Consumer-side interpretation of built-in payloads. Fail with
// kMalformedCustom on identifier or length mismatch.
auto AsInt32(const Custom& custom) -> Result<int32_t>;
auto AsInt64(const Custom& custom) -> Result<int64_t>;
auto AsNativeInt(const Custom& custom) -> Result<int64_t>;

}  // namespace camlbin::reader
