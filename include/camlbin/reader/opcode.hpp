#pragma once

#include <cstdint>

namespace camlbin::reader {

// Packed prefixes. A tag byte at or above a prefix carries its payload in
// the low bits.
constexpr uint8_t kPrefixSmallBlock = 0x80;
constexpr uint8_t kPrefixSmallInt = 0x40;
constexpr uint8_t kPrefixSmallString = 0x20;

// Explicit codes.
constexpr uint8_t kCodeInt8 = 0x00;
constexpr uint8_t kCodeInt16 = 0x01;
constexpr uint8_t kCodeInt32 = 0x02;
constexpr uint8_t kCodeInt64 = 0x03;
constexpr uint8_t kCodeShared8 = 0x04;
constexpr uint8_t kCodeShared16 = 0x05;
constexpr uint8_t kCodeShared32 = 0x06;
constexpr uint8_t kCodeDoubleArray32Little = 0x07;
constexpr uint8_t kCodeBlock32 = 0x08;
constexpr uint8_t kCodeString8 = 0x09;
constexpr uint8_t kCodeString32 = 0x0A;
constexpr uint8_t kCodeDoubleBig = 0x0B;
constexpr uint8_t kCodeDoubleLittle = 0x0C;
constexpr uint8_t kCodeDoubleArray8Big = 0x0D;
constexpr uint8_t kCodeDoubleArray8Little = 0x0E;
constexpr uint8_t kCodeDoubleArray32Big = 0x0F;
constexpr uint8_t kCodeCodePointer = 0x10;
constexpr uint8_t kCodeInfixPointer = 0x11;
constexpr uint8_t kCodeCustom = 0x12;
constexpr uint8_t kCodeBlock64 = 0x13;
constexpr uint8_t kCodeShared64 = 0x14;
constexpr uint8_t kCodeString64 = 0x15;
constexpr uint8_t kCodeDoubleArray64Big = 0x16;
constexpr uint8_t kCodeDoubleArray64Little = 0x17;
constexpr uint8_t kCodeCustomLen = 0x18;
constexpr uint8_t kCodeCustomFixed = 0x19;

// Closed set of construction rules a tag byte can select.
enum class Opcode : uint8_t {
  kSmallInt,
  kSmallString,
  kSmallBlock,
  kInt8,
  kInt16,
  kInt32,
  kInt64,
  kString8,
  kString32,
  kBlock32,
  kDoubleBig,
  kDoubleLittle,
  kDoubleArray8Big,
  kDoubleArray8Little,
  kDoubleArray32Big,
  kDoubleArray32Little,
  kShared8,
  kShared16,
  kShared32,
  kCustom,
  kCustomFixed,
  kCustomLen,
  kBigHeaderOnly,  // BLOCK64, SHARED64, STRING64, DOUBLE_ARRAY64_*
  kCodePointer,    // CODEPOINTER, INFIXPOINTER
  kUnknown,
};

// Result of classifying one tag byte. For the packed forms the parameters
// are unpacked here, so call sites never re-derive them from the byte.
struct DecodedOp {
  Opcode opcode = Opcode::kUnknown;
  uint8_t byte = 0;
  // kSmallInt: the value. kSmallString: the length. kSmallBlock: field count.
  uint32_t size = 0;
  // kSmallBlock only.
  uint8_t tag = 0;
};

auto Classify(uint8_t byte) -> DecodedOp;

auto ToString(Opcode opcode) -> const char*;

}  // namespace camlbin::reader
