#include "camlbin/reader/opcode.hpp"

#include <cstdint>

namespace camlbin::reader {

auto Classify(uint8_t byte) -> DecodedOp {
  if (byte >= kPrefixSmallBlock) {
    uint8_t packed = byte - kPrefixSmallBlock;
    return DecodedOp{
        .opcode = Opcode::kSmallBlock,
        .byte = byte,
        .size = static_cast<uint32_t>(packed >> 4),
        .tag = static_cast<uint8_t>(packed & 0x0F)};
  }
  if (byte >= kPrefixSmallInt) {
    return DecodedOp{
        .opcode = Opcode::kSmallInt,
        .byte = byte,
        .size = static_cast<uint32_t>(byte - kPrefixSmallInt)};
  }
  if (byte >= kPrefixSmallString) {
    return DecodedOp{
        .opcode = Opcode::kSmallString,
        .byte = byte,
        .size = static_cast<uint32_t>(byte - kPrefixSmallString)};
  }

  Opcode opcode = Opcode::kUnknown;
  switch (byte) {
    case kCodeInt8:
      opcode = Opcode::kInt8;
      break;
    case kCodeInt16:
      opcode = Opcode::kInt16;
      break;
    case kCodeInt32:
      opcode = Opcode::kInt32;
      break;
    case kCodeInt64:
      opcode = Opcode::kInt64;
      break;
    case kCodeShared8:
      opcode = Opcode::kShared8;
      break;
    case kCodeShared16:
      opcode = Opcode::kShared16;
      break;
    case kCodeShared32:
      opcode = Opcode::kShared32;
      break;
    case kCodeDoubleArray32Little:
      opcode = Opcode::kDoubleArray32Little;
      break;
    case kCodeBlock32:
      opcode = Opcode::kBlock32;
      break;
    case kCodeString8:
      opcode = Opcode::kString8;
      break;
    case kCodeString32:
      opcode = Opcode::kString32;
      break;
    case kCodeDoubleBig:
      opcode = Opcode::kDoubleBig;
      break;
    case kCodeDoubleLittle:
      opcode = Opcode::kDoubleLittle;
      break;
    case kCodeDoubleArray8Big:
      opcode = Opcode::kDoubleArray8Big;
      break;
    case kCodeDoubleArray8Little:
      opcode = Opcode::kDoubleArray8Little;
      break;
    case kCodeDoubleArray32Big:
      opcode = Opcode::kDoubleArray32Big;
      break;
    case kCodeCodePointer:
    case kCodeInfixPointer:
      opcode = Opcode::kCodePointer;
      break;
    case kCodeCustom:
      opcode = Opcode::kCustom;
      break;
    case kCodeBlock64:
    case kCodeShared64:
    case kCodeString64:
    case kCodeDoubleArray64Big:
    case kCodeDoubleArray64Little:
      opcode = Opcode::kBigHeaderOnly;
      break;
    case kCodeCustomLen:
      opcode = Opcode::kCustomLen;
      break;
    case kCodeCustomFixed:
      opcode = Opcode::kCustomFixed;
      break;
    default:
      break;
  }
  return DecodedOp{.opcode = opcode, .byte = byte};
}

auto ToString(Opcode opcode) -> const char* {
  switch (opcode) {
    case Opcode::kSmallInt:
      return "small_int";
    case Opcode::kSmallString:
      return "small_string";
    case Opcode::kSmallBlock:
      return "small_block";
    case Opcode::kInt8:
      return "int8";
    case Opcode::kInt16:
      return "int16";
    case Opcode::kInt32:
      return "int32";
    case Opcode::kInt64:
      return "int64";
    case Opcode::kString8:
      return "string8";
    case Opcode::kString32:
      return "string32";
    case Opcode::kBlock32:
      return "block32";
    case Opcode::kDoubleBig:
      return "double_big";
    case Opcode::kDoubleLittle:
      return "double_little";
    case Opcode::kDoubleArray8Big:
      return "double_array8_big";
    case Opcode::kDoubleArray8Little:
      return "double_array8_little";
    case Opcode::kDoubleArray32Big:
      return "double_array32_big";
    case Opcode::kDoubleArray32Little:
      return "double_array32_little";
    case Opcode::kShared8:
      return "shared8";
    case Opcode::kShared16:
      return "shared16";
    case Opcode::kShared32:
      return "shared32";
    case Opcode::kCustom:
      return "custom";
    case Opcode::kCustomFixed:
      return "custom_fixed";
    case Opcode::kCustomLen:
      return "custom_len";
    case Opcode::kBigHeaderOnly:
      return "big_header_only";
    case Opcode::kCodePointer:
      return "code_pointer";
    case Opcode::kUnknown:
      return "unknown";
  }
  return "unknown";
}

}  // namespace camlbin::reader
