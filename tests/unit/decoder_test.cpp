#include <gtest/gtest.h>

#include <bit>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "camlbin/common/internal_error.hpp"
#include "camlbin/reader/decoder.hpp"
#include "camlbin/reader/document.hpp"
#include "tests/common/marshal_builder.hpp"

namespace camlbin::reader {
namespace {

using test::MarshalBuilder;

constexpr uint64_t kOnePointFive = 0x3FF8000000000000;
constexpr uint64_t kMinusTwo = 0xC000000000000000;

auto BytesOf(const std::string& text) -> std::vector<uint8_t> {
  return {text.begin(), text.end()};
}

class DecoderTest : public ::testing::Test {
 protected:
  static auto Decode(
      const std::vector<uint8_t>& bytes, DecodeOptions options = {})
      -> Result<Document> {
    return DecodeBuffer(bytes, options);
  }

  static auto DecodeOk(
      const std::vector<uint8_t>& bytes, DecodeOptions options = {})
      -> Document {
    auto doc = DecodeBuffer(bytes, options);
    if (!doc) {
      ADD_FAILURE() << FormatError(doc.error());
      return Document({}, Value::Int(0), {}, 0);
    }
    return std::move(*doc);
  }

  static auto DecodeFailure(
      const std::vector<uint8_t>& bytes, DecodeOptions options = {})
      -> reader::DecodeError {
    auto doc = DecodeBuffer(bytes, options);
    if (doc) {
      ADD_FAILURE() << "decode unexpectedly succeeded";
      return {};
    }
    return doc.error();
  }

  static auto Field(const Document& doc, Value value, size_t index) -> Value {
    const auto* block = doc.Get<Block>(value);
    if (block == nullptr || index >= block->fields.size()) {
      ADD_FAILURE() << "no field " << index;
      return Value::Int(0);
    }
    return block->fields[index];
  }
};

TEST_F(DecoderTest, EverySmallInteger) {
  for (uint8_t n = 0; n < 64; ++n) {
    auto doc = DecodeOk(MarshalBuilder().Byte(0x40 + n).Build(0));
    ASSERT_TRUE(doc.Root().IsInt());
    EXPECT_EQ(doc.Root().AsInt(), n);
    EXPECT_EQ(doc.ObjectCount(), 0U);
  }
}

TEST_F(DecoderTest, EverySmallBlockShape) {
  for (uint8_t size = 0; size < 8; ++size) {
    for (uint8_t tag = 0; tag < 16; ++tag) {
      MarshalBuilder builder;
      builder.Byte(0x80 + (size << 4) + tag);
      for (uint8_t i = 0; i < size; ++i) {
        builder.Byte(0x40 + i);
      }
      auto doc = DecodeOk(builder.Build(size == 0 ? 0 : 1));

      if (size == 0) {
        ASSERT_TRUE(doc.Root().IsAtom());
        EXPECT_EQ(doc.Root().AsAtom().tag, tag);
        EXPECT_EQ(doc.ObjectCount(), 0U);
        continue;
      }
      const auto* block = doc.Get<Block>(doc.Root());
      ASSERT_NE(block, nullptr);
      EXPECT_EQ(block->tag, tag);
      ASSERT_EQ(block->fields.size(), size);
      for (uint8_t i = 0; i < size; ++i) {
        EXPECT_EQ(block->fields[i], Value::Int(i));
      }
    }
  }
}

TEST_F(DecoderTest, SingleSmallInt) {
  auto doc = DecodeOk(MarshalBuilder().Byte(0x41).Build(0));
  EXPECT_EQ(doc.Root(), Value::Int(1));
  EXPECT_EQ(doc.BytesConsumed(), 21U);

  auto answer = DecodeOk(MarshalBuilder().Byte(0x6A).Build(0));
  EXPECT_EQ(answer.Root(), Value::Int(42));
}

TEST_F(DecoderTest, PairOfInts) {
  auto doc = DecodeOk(MarshalBuilder().Bytes({0xA0, 0x41, 0x42}).Build(1));

  const auto* block = doc.Get<Block>(doc.Root());
  ASSERT_NE(block, nullptr);
  EXPECT_EQ(block->tag, 0);
  EXPECT_EQ(
      block->fields, (std::vector<Value>{Value::Int(1), Value::Int(2)}));
  EXPECT_EQ(doc.ObjectCount(), 1U);
}

TEST_F(DecoderTest, FixedCustomInt32) {
  auto doc = DecodeOk(
      MarshalBuilder()
          .Bytes({0x19, 0x5F, 0x69, 0x00, 0x00, 0x00, 0x00, 0x2A})
          .Build(1));

  const auto* custom = doc.Get<Custom>(doc.Root());
  ASSERT_NE(custom, nullptr);
  EXPECT_EQ(custom->identifier, "_i");
  EXPECT_FALSE(custom->declared_sizes.has_value());
  EXPECT_EQ(AsInt32(*custom).value(), 42);
}

TEST_F(DecoderTest, SharedStringAliasesOneObject) {
  auto doc = DecodeOk(
      MarshalBuilder()
          .Bytes({0xA0, 0x26})
          .Text("shared")
          .Bytes({0x04, 0x01})
          .Build(2));

  Value first = Field(doc, doc.Root(), 0);
  Value second = Field(doc, doc.Root(), 1);
  ASSERT_TRUE(first.IsRef());
  EXPECT_EQ(first.AsRef(), second.AsRef());
  EXPECT_EQ(doc.Get<Bytes>(first)->data, BytesOf("shared"));
  EXPECT_EQ(doc.ObjectCount(), 2U);
}

TEST_F(DecoderTest, MutationIsVisibleThroughEveryAlias) {
  auto doc = DecodeOk(
      MarshalBuilder()
          .Bytes({0xA0, 0x26})
          .Text("shared")
          .Bytes({0x04, 0x01})
          .Build(2));

  Value first = Field(doc, doc.Root(), 0);
  Value second = Field(doc, doc.Root(), 1);
  std::get<Bytes>(doc.Mutable(first.AsRef())).data[0] = 'S';

  EXPECT_EQ(doc.Get<Bytes>(second)->data, BytesOf("Shared"));
}

TEST_F(DecoderTest, BlockMayReferToItself) {
  auto doc =
      DecodeOk(MarshalBuilder().Bytes({0xA0, 0x41, 0x04, 0x01}).Build(1));

  ASSERT_TRUE(doc.Root().IsRef());
  EXPECT_EQ(Field(doc, doc.Root(), 0), Value::Int(1));
  EXPECT_EQ(Field(doc, doc.Root(), 1), doc.Root());
}

TEST_F(DecoderTest, FloatOccupiesSlotButAtomDoesNot) {
  auto with_float = DecodeOk(
      MarshalBuilder()
          .Bytes({0xA0, 0x0B})
          .U64(kOnePointFive)
          .Bytes({0x04, 0x01})
          .Build(2));
  Value f = Field(with_float, with_float.Root(), 1);
  ASSERT_NE(with_float.Get<Float>(f), nullptr);
  EXPECT_EQ(with_float.Get<Float>(f)->value, 1.5);

  // The atom takes no slot, so offset 1 lands on the enclosing block.
  auto with_atom =
      DecodeOk(MarshalBuilder().Bytes({0xA0, 0x80, 0x04, 0x01}).Build(1));
  EXPECT_EQ(Field(with_atom, with_atom.Root(), 0), Value::MakeAtom(0));
  EXPECT_EQ(Field(with_atom, with_atom.Root(), 1), with_atom.Root());
}

TEST_F(DecoderTest, ExplicitIntegerWidths) {
  EXPECT_EQ(
      DecodeOk(MarshalBuilder().Bytes({0x00, 0xFF}).Build(0)).Root(),
      Value::Int(-1));
  EXPECT_EQ(
      DecodeOk(MarshalBuilder().Bytes({0x01, 0xFF, 0x00}).Build(0)).Root(),
      Value::Int(-256));
  EXPECT_EQ(
      DecodeOk(MarshalBuilder().Byte(0x02).U32(0x80000000).Build(0)).Root(),
      Value::Int(std::numeric_limits<int32_t>::min()));
  EXPECT_EQ(
      DecodeOk(MarshalBuilder().Byte(0x03).U64(1ULL << 32).Build(0)).Root(),
      Value::Int(int64_t{1} << 32));
  EXPECT_EQ(
      DecodeOk(MarshalBuilder().Byte(0x03).U64(~0ULL).Build(0)).Root(),
      Value::Int(-1));
}

TEST_F(DecoderTest, ExplicitStringLengths) {
  auto short_form =
      DecodeOk(MarshalBuilder().Bytes({0x09, 0x03}).Text("abc").Build(1));
  EXPECT_EQ(short_form.Get<Bytes>(short_form.Root())->data, BytesOf("abc"));

  auto long_form =
      DecodeOk(MarshalBuilder().Byte(0x0A).U32(2).Text("hi").Build(1));
  EXPECT_EQ(long_form.Get<Bytes>(long_form.Root())->data, BytesOf("hi"));

  auto empty = DecodeOk(MarshalBuilder().Byte(0x20).Build(1));
  ASSERT_NE(empty.Get<Bytes>(empty.Root()), nullptr);
  EXPECT_TRUE(empty.Get<Bytes>(empty.Root())->data.empty());
}

TEST_F(DecoderTest, StringsAreNotTreatedAsText) {
  auto doc = DecodeOk(
      MarshalBuilder().Bytes({0x23, 0x00, 0xFF, 0x0A}).Build(1));
  EXPECT_EQ(
      doc.Get<Bytes>(doc.Root())->data,
      (std::vector<uint8_t>{0x00, 0xFF, 0x0A}));
}

TEST_F(DecoderTest, Block32UnpacksHeaderWord) {
  auto doc = DecodeOk(
      MarshalBuilder().Byte(0x08).U32(0x00000800).Bytes({0x41, 0x42}).Build(1));
  const auto* block = doc.Get<Block>(doc.Root());
  ASSERT_NE(block, nullptr);
  EXPECT_EQ(block->tag, 0);
  EXPECT_EQ(block->fields.size(), 2U);

  auto high_tag =
      DecodeOk(MarshalBuilder().Byte(0x08).U32(0x000004F5).Byte(0x41).Build(1));
  EXPECT_EQ(high_tag.Get<Block>(high_tag.Root())->tag, 0xF5);

  // Color bits are ignored.
  auto colored = DecodeOk(
      MarshalBuilder().Byte(0x08).U32(0x00000B00).Bytes({0x41, 0x42}).Build(1));
  EXPECT_EQ(colored.Get<Block>(colored.Root())->fields.size(), 2U);

  auto empty = DecodeOk(MarshalBuilder().Byte(0x08).U32(0x00000007).Build(0));
  EXPECT_EQ(empty.Root(), Value::MakeAtom(7));
}

TEST_F(DecoderTest, DoublesInBothByteOrders) {
  auto big = DecodeOk(MarshalBuilder().Byte(0x0B).U64(kOnePointFive).Build(1));
  EXPECT_EQ(big.Get<Float>(big.Root())->value, 1.5);

  auto little =
      DecodeOk(MarshalBuilder().Byte(0x0C).U64Le(kOnePointFive).Build(1));
  EXPECT_EQ(little.Get<Float>(little.Root())->value, 1.5);
}

TEST_F(DecoderTest, NanPayloadIsPreserved) {
  constexpr uint64_t kQuietNan = 0x7FF8000000000123;
  auto doc = DecodeOk(MarshalBuilder().Byte(0x0B).U64(kQuietNan).Build(1));
  EXPECT_EQ(
      std::bit_cast<uint64_t>(doc.Get<Float>(doc.Root())->value), kQuietNan);
}

TEST_F(DecoderTest, DoubleArraysInEveryForm) {
  std::vector<double> expected = {1.5, -2.0};

  auto small_big = DecodeOk(
      MarshalBuilder().Bytes({0x0D, 0x02}).U64(kOnePointFive).U64(kMinusTwo)
          .Build(1));
  EXPECT_EQ(small_big.Get<FloatArray>(small_big.Root())->values, expected);

  auto small_little = DecodeOk(
      MarshalBuilder().Bytes({0x0E, 0x02}).U64Le(kOnePointFive)
          .U64Le(kMinusTwo).Build(1));
  EXPECT_EQ(
      small_little.Get<FloatArray>(small_little.Root())->values, expected);

  auto large_big = DecodeOk(
      MarshalBuilder().Byte(0x0F).U32(2).U64(kOnePointFive).U64(kMinusTwo)
          .Build(1));
  EXPECT_EQ(large_big.Get<FloatArray>(large_big.Root())->values, expected);

  auto large_little = DecodeOk(
      MarshalBuilder().Byte(0x07).U32(2).U64Le(kOnePointFive)
          .U64Le(kMinusTwo).Build(1));
  EXPECT_EQ(
      large_little.Get<FloatArray>(large_little.Root())->values, expected);
}

TEST_F(DecoderTest, LengthPrefixedCustomRecordsDeclaredSizes) {
  auto doc = DecodeOk(
      MarshalBuilder()
          .Byte(0x18)
          .Text("_n")
          .Byte(0x00)
          .U32(4)
          .U64(8)
          .Byte(0x02)
          .U64(1ULL << 40)
          .Build(1));

  const auto* custom = doc.Get<Custom>(doc.Root());
  ASSERT_NE(custom, nullptr);
  ASSERT_TRUE(custom->declared_sizes.has_value());
  EXPECT_EQ(custom->declared_sizes->size_32, 4U);
  EXPECT_EQ(custom->declared_sizes->size_64, 8U);
  EXPECT_EQ(AsNativeInt(*custom).value(), int64_t{1} << 40);
}

TEST_F(DecoderTest, LengthPrefixedCustomWithWrongSizeIsMalformed) {
  auto error = DecodeFailure(
      MarshalBuilder()
          .Byte(0x18)
          .Text("_j")
          .Byte(0x00)
          .U32(8)
          .U64(7)
          .U64(0)
          .Build(1));
  EXPECT_EQ(error.kind, DecodeErrorKind::kMalformedCustom);
  EXPECT_EQ(error.offset, 24U);
}

TEST_F(DecoderTest, LegacyCustomCode) {
  auto doc = DecodeOk(
      MarshalBuilder().Byte(0x12).Text("_j").Byte(0x00).U64(0xFFFFFFFFFFFFFFFF)
          .Build(1));
  EXPECT_EQ(AsInt64(*doc.Get<Custom>(doc.Root())).value(), -1);
}

TEST_F(DecoderTest, UnknownCustomIdentifierIsUnsupported) {
  auto error = DecodeFailure(
      MarshalBuilder().Byte(0x19).Text("_bigarr02").Byte(0x00).Build(1));
  EXPECT_EQ(error.kind, DecodeErrorKind::kUnsupportedFeature);
  EXPECT_EQ(error.offset, 20U);
}

TEST_F(DecoderTest, OverlongCustomIdentifier) {
  auto error = DecodeFailure(
      MarshalBuilder().Byte(0x19).Text(std::string(80, 'a')).Byte(0x00)
          .Build(1));
  EXPECT_EQ(error.kind, DecodeErrorKind::kIdentifierTooLong);
  EXPECT_EQ(error.offset, 21U);
}

TEST_F(DecoderTest, SharedOffsetOutOfRange) {
  auto at_root = DecodeFailure(MarshalBuilder().Bytes({0x04, 0x01}).Build(0));
  EXPECT_EQ(at_root.kind, DecodeErrorKind::kInvalidSharedReference);
  EXPECT_EQ(at_root.offset, 20U);

  auto zero =
      DecodeFailure(MarshalBuilder().Bytes({0x90, 0x04, 0x00}).Build(1));
  EXPECT_EQ(zero.kind, DecodeErrorKind::kInvalidSharedReference);
  EXPECT_EQ(zero.offset, 21U);

  auto wide = DecodeFailure(MarshalBuilder().Byte(0x90).Byte(0x05).U16(2)
                              .Build(1));
  EXPECT_EQ(wide.kind, DecodeErrorKind::kInvalidSharedReference);

  auto widest = DecodeFailure(MarshalBuilder().Byte(0x90).Byte(0x06).U32(9)
                                .Build(1));
  EXPECT_EQ(widest.kind, DecodeErrorKind::kInvalidSharedReference);
}

TEST_F(DecoderTest, WideSharedOffsetsResolve) {
  auto doc = DecodeOk(
      MarshalBuilder().Bytes({0xA0, 0x21, 'x', 0x05, 0x00, 0x01}).Build(2));
  EXPECT_EQ(Field(doc, doc.Root(), 1), Field(doc, doc.Root(), 0));

  auto doc32 = DecodeOk(
      MarshalBuilder().Bytes({0xA0, 0x21, 'x', 0x06}).U32(2).Build(2));
  EXPECT_EQ(Field(doc32, doc32.Root(), 1), doc32.Root());
}

TEST_F(DecoderTest, UnknownTagReportsItsOffset) {
  auto at_root = DecodeFailure(MarshalBuilder().Byte(0x1A).Build(0));
  EXPECT_EQ(at_root.kind, DecodeErrorKind::kUnknownTag);
  EXPECT_EQ(at_root.offset, 20U);

  auto nested =
      DecodeFailure(MarshalBuilder().Bytes({0xA0, 0x41, 0x1F}).Build(1));
  EXPECT_EQ(nested.kind, DecodeErrorKind::kUnknownTag);
  EXPECT_EQ(nested.offset, 22U);
}

TEST_F(DecoderTest, BigHeaderCodesAreUnsupported) {
  for (uint8_t code : {0x13, 0x14, 0x15, 0x16, 0x17}) {
    auto error = DecodeFailure(
        MarshalBuilder().Byte(code).U64(0).U64(0).Build(0));
    EXPECT_EQ(error.kind, DecodeErrorKind::kUnsupportedFeature)
        << "code " << static_cast<int>(code);
    EXPECT_EQ(error.offset, 20U);
  }
}

TEST_F(DecoderTest, CodePointersAreUnsupported) {
  for (uint8_t code : {0x10, 0x11}) {
    auto error = DecodeFailure(
        MarshalBuilder().Byte(code).U32(0).U64(0).U64(0).Build(0));
    EXPECT_EQ(error.kind, DecodeErrorKind::kUnsupportedFeature);
  }
}

TEST_F(DecoderTest, ObjectCountMismatch) {
  auto bytes = MarshalBuilder().Bytes({0xA0, 0x41, 0x42}).Build(2);

  auto error = DecodeFailure(bytes);
  EXPECT_EQ(error.kind, DecodeErrorKind::kHeaderMismatch);

  auto doc = DecodeOk(bytes, DecodeOptions{.check_object_count = false});
  EXPECT_EQ(doc.ObjectCount(), 1U);
}

TEST_F(DecoderTest, ZeroObjectCountMeansNoSharing) {
  auto doc = DecodeOk(
      MarshalBuilder().Bytes({0xA0, 0x21, 'x', 0x21, 'x'}).Build(0));
  EXPECT_EQ(doc.ObjectCount(), 3U);
  EXPECT_NE(Field(doc, doc.Root(), 0), Field(doc, doc.Root(), 1));

  auto error = DecodeFailure(
      MarshalBuilder().Bytes({0xA0, 0x21, 'x', 0x04, 0x01}).Build(0));
  EXPECT_EQ(error.kind, DecodeErrorKind::kInvalidSharedReference);
  EXPECT_EQ(error.offset, 23U);
}

TEST_F(DecoderTest, DataLengthShorterThanValue) {
  auto bytes = MarshalBuilder()
                   .U32(kMagicSmall)
                   .U32(1)
                   .U32(1)
                   .U32(0)
                   .U32(0)
                   .Bytes({0xA0, 0x41, 0x42})
                   .Stream();
  EXPECT_EQ(DecodeFailure(bytes).kind, DecodeErrorKind::kHeaderMismatch);
}

TEST_F(DecoderTest, DataLengthLongerThanValue) {
  auto bytes = MarshalBuilder().Bytes({0x41, 0x00, 0x00}).Build(0);
  EXPECT_EQ(DecodeFailure(bytes).kind, DecodeErrorKind::kHeaderMismatch);
}

TEST_F(DecoderTest, DataLengthBeyondBuffer) {
  auto bytes = MarshalBuilder()
                   .U32(kMagicSmall)
                   .U32(10)
                   .U32(1)
                   .U32(0)
                   .U32(0)
                   .Bytes({0xA0, 0x41, 0x42})
                   .Stream();
  auto error = DecodeFailure(bytes);
  EXPECT_EQ(error.kind, DecodeErrorKind::kTruncatedInput);
  EXPECT_EQ(error.offset, 20U);
}

TEST_F(DecoderTest, EveryStrictPrefixIsTruncated) {
  auto full = MarshalBuilder()
                  .Bytes({0xC0, 0x26})
                  .Text("shared")
                  .Byte(0x0B)
                  .U64(kOnePointFive)
                  .Bytes({0x04, 0x02})
                  .Bytes({0x19, 0x5F, 0x69, 0x00})
                  .U32(7)
                  .Build(4);
  ASSERT_TRUE(Decode(full).has_value());

  for (size_t cut = 0; cut < full.size(); ++cut) {
    std::vector<uint8_t> prefix(full.begin(), full.begin() + cut);
    auto result = Decode(prefix);
    ASSERT_FALSE(result.has_value()) << "cut at " << cut;
    EXPECT_EQ(result.error().kind, DecodeErrorKind::kTruncatedInput)
        << "cut at " << cut;
  }
}

TEST_F(DecoderTest, DecodingIsDeterministic) {
  auto bytes = MarshalBuilder()
                   .Bytes({0xA0, 0x26})
                   .Text("shared")
                   .Bytes({0x04, 0x01})
                   .Build(2);
  auto first = DecodeOk(bytes);
  auto second = DecodeOk(bytes);

  EXPECT_EQ(first.Root(), second.Root());
  ASSERT_EQ(first.ObjectCount(), second.ObjectCount());
  for (uint32_t i = 0; i < first.ObjectCount(); ++i) {
    EXPECT_EQ(first[ObjectId{i}], second[ObjectId{i}]);
  }
}

TEST_F(DecoderTest, DepthLimit) {
  auto bytes = MarshalBuilder().Bytes({0x90, 0x90, 0x90, 0x41}).Build(3);

  auto error = DecodeFailure(bytes, DecodeOptions{.max_depth = 3});
  EXPECT_EQ(error.kind, DecodeErrorKind::kDepthLimitExceeded);
  EXPECT_EQ(error.offset, 23U);

  EXPECT_TRUE(Decode(bytes, DecodeOptions{.max_depth = 4}).has_value());
  EXPECT_TRUE(Decode(bytes).has_value());
}

TEST_F(DecoderTest, BlockOfTreatsAtomsAsEmptyBlocks) {
  auto doc = DecodeOk(MarshalBuilder().Bytes({0xA2, 0x83, 0x41}).Build(1));

  auto outer = doc.BlockOf(doc.Root());
  ASSERT_TRUE(outer.has_value());
  EXPECT_EQ(outer->tag, 2);
  ASSERT_EQ(outer->fields.size(), 2U);

  auto empty = doc.BlockOf(outer->fields[0]);
  ASSERT_TRUE(empty.has_value());
  EXPECT_EQ(empty->tag, 3);
  EXPECT_TRUE(empty->fields.empty());
  EXPECT_EQ(doc.Get<Block>(outer->fields[0]), nullptr);

  EXPECT_FALSE(doc.BlockOf(outer->fields[1]).has_value());
}

TEST_F(DecoderTest, OversizedCountsFailBeforeAllocating) {
  auto block =
      DecodeFailure(MarshalBuilder().Byte(0x08).U32(0xFFFFFC00).Build(1));
  EXPECT_EQ(block.kind, DecodeErrorKind::kTruncatedInput);

  auto string =
      DecodeFailure(MarshalBuilder().Byte(0x0A).U32(0xFFFFFFFF).Build(1));
  EXPECT_EQ(string.kind, DecodeErrorKind::kTruncatedInput);

  auto array =
      DecodeFailure(MarshalBuilder().Byte(0x0F).U32(0xFFFFFFFF).Build(1));
  EXPECT_EQ(array.kind, DecodeErrorKind::kTruncatedInput);
}

TEST_F(DecoderTest, LinkedList) {
  auto doc = DecodeOk(
      MarshalBuilder().Bytes({0xA0, 0x41, 0xA0, 0x42, 0xA0, 0x43, 0x40})
          .Build(3));

  std::vector<int64_t> items;
  Value cell = doc.Root();
  while (cell.IsRef()) {
    items.push_back(Field(doc, cell, 0).AsInt());
    cell = Field(doc, cell, 1);
  }
  EXPECT_EQ(items, (std::vector<int64_t>{1, 2, 3}));
  EXPECT_EQ(cell, Value::Int(0));
}

TEST_F(DecoderTest, TrailingBytesAreNotConsumed) {
  auto bytes = MarshalBuilder().Byte(0x41).Build(0);
  bytes.push_back(0xEE);
  bytes.push_back(0xEE);

  auto doc = DecodeOk(bytes);
  EXPECT_EQ(doc.BytesConsumed(), 21U);
}

TEST_F(DecoderTest, DocumentIndexOutOfRangeIsInternalError) {
  auto doc = DecodeOk(MarshalBuilder().Byte(0x41).Build(0));
  EXPECT_THROW(static_cast<void>(doc[ObjectId{0}]), common::InternalError);
}

}  // namespace
}  // namespace camlbin::reader
