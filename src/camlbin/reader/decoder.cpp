#include "camlbin/reader/decoder.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "camlbin/common/internal_error.hpp"
#include "camlbin/reader/custom.hpp"
#include "camlbin/reader/header.hpp"

namespace camlbin::reader {

namespace {

// BLOCK32 carries the producer's block header word: size in the upper 22
// bits, two color bits, tag in the low 8 bits.
constexpr uint32_t kHeaderTagMask = 0xFF;
constexpr unsigned kHeaderSizeShift = 10;

auto ToValue(int64_t v) -> Value {
  return Value::Int(v);
}

}  // namespace

auto Decoder::Decode() && -> Result<Document> {
  auto header = ParseHeader(cursor_);
  if (!header) {
    return std::unexpected(header.error());
  }

  size_t stream_start = cursor_.Position();
  if (header->data_length > cursor_.Remaining()) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kTruncatedInput, stream_start,
            std::format(
                "header declares {} data byte(s), {} available",
                header->data_length, cursor_.Remaining())));
  }

  sharing_ = header->object_count != 0;
  auto root = DecodeValue(1);
  if (!root) {
    return std::unexpected(root.error());
  }

  size_t consumed = cursor_.Position() - stream_start;
  if (consumed != header->data_length) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kHeaderMismatch, cursor_.Position(),
            std::format(
                "value used {} data byte(s), header declares {}", consumed,
                header->data_length)));
  }
  if (options_.check_object_count && sharing_ &&
      table_.Size() != header->object_count) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kHeaderMismatch, cursor_.Position(),
            std::format(
                "decoded {} object(s), header declares {}", table_.Size(),
                header->object_count)));
  }

  spdlog::debug(
      "decoded {} object(s) from {} data byte(s)", table_.Size(), consumed);
  return Document(*header, *root, table_.Release(), cursor_.Position());
}

auto Decoder::DecodeValue(size_t depth) -> Result<Value> {
  size_t tag_position = cursor_.Position();
  if (options_.max_depth != 0 && depth > options_.max_depth) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kDepthLimitExceeded, tag_position,
            std::format("nesting deeper than {}", options_.max_depth)));
  }

  auto byte = cursor_.ReadU8();
  if (!byte) {
    return std::unexpected(byte.error());
  }
  DecodedOp op = Classify(*byte);
  spdlog::trace(
      "offset {}: 0x{:02X} {}", tag_position, op.byte, ToString(op.opcode));

  switch (op.opcode) {
    case Opcode::kSmallInt:
      return Value::Int(op.size);
    case Opcode::kSmallString:
      return DecodeString(op.size);
    case Opcode::kSmallBlock:
      return DecodeBlock(op.tag, op.size, depth);

    case Opcode::kInt8:
      return cursor_.ReadI8().transform(ToValue);
    case Opcode::kInt16:
      return cursor_.ReadI16().transform(ToValue);
    case Opcode::kInt32:
      return cursor_.ReadI32().transform(ToValue);
    case Opcode::kInt64:
      return cursor_.ReadI64().transform(ToValue);

    case Opcode::kString8: {
      auto length = cursor_.ReadU8();
      if (!length) {
        return std::unexpected(length.error());
      }
      return DecodeString(*length);
    }
    case Opcode::kString32: {
      auto length = cursor_.ReadU32();
      if (!length) {
        return std::unexpected(length.error());
      }
      return DecodeString(*length);
    }

    case Opcode::kBlock32: {
      auto word = cursor_.ReadU32();
      if (!word) {
        return std::unexpected(word.error());
      }
      return DecodeBlock(
          static_cast<uint8_t>(*word & kHeaderTagMask),
          *word >> kHeaderSizeShift, depth);
    }

    case Opcode::kDoubleBig:
      return DecodeDouble(false);
    case Opcode::kDoubleLittle:
      return DecodeDouble(true);

    case Opcode::kDoubleArray8Big:
    case Opcode::kDoubleArray8Little: {
      auto length = cursor_.ReadU8();
      if (!length) {
        return std::unexpected(length.error());
      }
      return DecodeDoubleArray(
          *length, op.opcode == Opcode::kDoubleArray8Little);
    }
    case Opcode::kDoubleArray32Big:
    case Opcode::kDoubleArray32Little: {
      auto length = cursor_.ReadU32();
      if (!length) {
        return std::unexpected(length.error());
      }
      return DecodeDoubleArray(
          *length, op.opcode == Opcode::kDoubleArray32Little);
    }

    case Opcode::kShared8: {
      auto offset = cursor_.ReadU8();
      if (!offset) {
        return std::unexpected(offset.error());
      }
      return DecodeShared(*offset, tag_position);
    }
    case Opcode::kShared16: {
      auto offset = cursor_.ReadU16();
      if (!offset) {
        return std::unexpected(offset.error());
      }
      return DecodeShared(*offset, tag_position);
    }
    case Opcode::kShared32: {
      auto offset = cursor_.ReadU32();
      if (!offset) {
        return std::unexpected(offset.error());
      }
      return DecodeShared(*offset, tag_position);
    }

    case Opcode::kCustom:
    case Opcode::kCustomFixed:
    case Opcode::kCustomLen:
      return DecodeCustom(op.opcode, tag_position);

    case Opcode::kBigHeaderOnly:
      return std::unexpected(
          DecodeError::Make(
              DecodeErrorKind::kUnsupportedFeature, tag_position,
              std::format(
                  "code 0x{:02X} requires the big header, which is not "
                  "supported",
                  op.byte)));
    case Opcode::kCodePointer:
      return std::unexpected(
          DecodeError::Make(
              DecodeErrorKind::kUnsupportedFeature, tag_position,
              "code pointers (closures) are not supported"));
    case Opcode::kUnknown:
      return std::unexpected(
          DecodeError::Make(
              DecodeErrorKind::kUnknownTag, tag_position,
              std::format("unknown code 0x{:02X}", op.byte)));
  }
  common::ThrowInternalError(
      "Decoder::DecodeValue",
      std::format("unhandled opcode {}", ToString(op.opcode)));
}

auto Decoder::DecodeString(uint64_t length) -> Result<Value> {
  ObjectId id = table_.Reserve();
  auto bytes = cursor_.ReadBytes(length);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  table_.Finalize(
      id, Bytes{.data = std::vector<uint8_t>(bytes->begin(), bytes->end())});
  return Value::Ref(id);
}

auto Decoder::DecodeBlock(uint8_t tag, uint64_t size, size_t depth)
    -> Result<Value> {
  if (size == 0) {
    return Value::MakeAtom(tag);
  }
  // Every field takes at least one byte.
  if (auto ok = CheckAvailable(size, 1); !ok) {
    return std::unexpected(ok.error());
  }

  // The slot is taken before the children are read, so a child may refer
  // back to this block while it is still pending.
  ObjectId id = table_.Reserve();
  Block block{.tag = tag, .fields = {}};
  block.fields.reserve(size);
  for (uint64_t i = 0; i < size; ++i) {
    auto field = DecodeValue(depth + 1);
    if (!field) {
      return std::unexpected(field.error());
    }
    block.fields.push_back(*field);
  }
  table_.Finalize(id, std::move(block));
  return Value::Ref(id);
}

auto Decoder::DecodeDouble(bool little_endian) -> Result<Value> {
  ObjectId id = table_.Reserve();
  auto value = little_endian ? cursor_.ReadF64Le() : cursor_.ReadF64Be();
  if (!value) {
    return std::unexpected(value.error());
  }
  table_.Finalize(id, Float{.value = *value});
  return Value::Ref(id);
}

auto Decoder::DecodeDoubleArray(uint64_t length, bool little_endian)
    -> Result<Value> {
  if (auto ok = CheckAvailable(length, sizeof(double)); !ok) {
    return std::unexpected(ok.error());
  }

  ObjectId id = table_.Reserve();
  FloatArray array;
  array.values.reserve(length);
  for (uint64_t i = 0; i < length; ++i) {
    auto value = little_endian ? cursor_.ReadF64Le() : cursor_.ReadF64Be();
    if (!value) {
      return std::unexpected(value.error());
    }
    array.values.push_back(*value);
  }
  table_.Finalize(id, std::move(array));
  return Value::Ref(id);
}

auto Decoder::DecodeShared(uint64_t offset, size_t tag_position)
    -> Result<Value> {
  if (!sharing_) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kInvalidSharedReference, tag_position,
            "shared reference in data marshaled without sharing"));
  }
  auto id = table_.ResolveBackOffset(offset, tag_position);
  if (!id) {
    return std::unexpected(id.error());
  }
  spdlog::trace(
      "shared offset {} -> object {} ({})", offset, id->value,
      KindName(table_.Resolve(*id)));
  return Value::Ref(*id);
}

auto Decoder::DecodeCustom(Opcode opcode, size_t tag_position)
    -> Result<Value> {
  auto identifier = ReadCustomIdentifier(cursor_);
  if (!identifier) {
    return std::unexpected(identifier.error());
  }
  auto kind = LookupBuiltinCustom(*identifier);
  if (!kind) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kUnsupportedFeature, tag_position,
            std::format(
                "custom block '{}' has no built-in deserializer",
                *identifier)));
  }

  std::optional<CustomSizes> declared;
  if (opcode == Opcode::kCustomLen) {
    size_t sizes_position = cursor_.Position();
    auto size_32 = cursor_.ReadU32();
    if (!size_32) {
      return std::unexpected(size_32.error());
    }
    auto size_64 = cursor_.ReadU64();
    if (!size_64) {
      return std::unexpected(size_64.error());
    }
    if (*size_64 != InMemorySize(*kind)) {
      return std::unexpected(
          DecodeError::Make(
              DecodeErrorKind::kMalformedCustom, sizes_position,
              std::format(
                  "custom block '{}' declares size {}, expected {}",
                  *identifier, *size_64, InMemorySize(*kind))));
    }
    declared = CustomSizes{.size_32 = *size_32, .size_64 = *size_64};
  }

  ObjectId id = table_.Reserve();
  auto payload = ReadCustomPayload(cursor_, *kind);
  if (!payload) {
    return std::unexpected(payload.error());
  }
  table_.Finalize(
      id, Custom{
              .identifier = std::move(*identifier),
              .payload = std::move(*payload),
              .declared_sizes = declared});
  return Value::Ref(id);
}

auto Decoder::CheckAvailable(uint64_t count, uint64_t element_size) const
    -> Result<void> {
  uint64_t available = cursor_.Remaining() / element_size;
  if (count > available) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kTruncatedInput, cursor_.Position(),
            std::format(
                "declared {} element(s) of {} byte(s), {} byte(s) remaining",
                count, element_size, cursor_.Remaining())));
  }
  return {};
}

auto DecodeBuffer(std::span<const uint8_t> buffer, DecodeOptions options)
    -> Result<Document> {
  return Decoder(buffer, options).Decode();
}

}  // namespace camlbin::reader
