#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace camlbin::reader {

// Index of a slot in the object table, in allocation order.
struct ObjectId {
  uint32_t value = 0;

  auto operator==(const ObjectId&) const -> bool = default;
  auto operator<=>(const ObjectId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, ObjectId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

// A block with no fields. The producer never allocates these, so they are
// immediate like integers and occupy no object slot.
struct Atom {
  uint8_t tag = 0;

  auto operator==(const Atom&) const -> bool = default;
};

// A field of a block, or the root of a document: an inline integer, an
// empty block, or a reference to a sharable object. Two values referring to
// the same ObjectId alias one object.
class Value {
 public:
  static auto Int(int64_t v) -> Value {
    return Value(Repr(std::in_place_type<int64_t>, v));
  }
  static auto MakeAtom(uint8_t tag) -> Value {
    return Value(Repr(std::in_place_type<Atom>, Atom{.tag = tag}));
  }
  static auto Ref(ObjectId id) -> Value {
    return Value(Repr(std::in_place_type<ObjectId>, id));
  }

  [[nodiscard]] auto IsInt() const -> bool {
    return std::holds_alternative<int64_t>(repr_);
  }
  [[nodiscard]] auto IsAtom() const -> bool {
    return std::holds_alternative<Atom>(repr_);
  }
  [[nodiscard]] auto IsRef() const -> bool {
    return std::holds_alternative<ObjectId>(repr_);
  }

  // Precondition: the matching Is*(). Throws std::bad_variant_access
  // otherwise.
  [[nodiscard]] auto AsInt() const -> int64_t {
    return std::get<int64_t>(repr_);
  }
  [[nodiscard]] auto AsAtom() const -> Atom {
    return std::get<Atom>(repr_);
  }
  [[nodiscard]] auto AsRef() const -> ObjectId {
    return std::get<ObjectId>(repr_);
  }

  auto operator==(const Value&) const -> bool = default;

 private:
  using Repr = std::variant<int64_t, Atom, ObjectId>;

  explicit Value(Repr repr) : repr_(repr) {
  }

  Repr repr_;
};

// Placeholder for a reserved slot whose construction has not finished.
struct Pending {
  auto operator==(const Pending&) const -> bool = default;
};

// Opaque byte string. Not assumed to be text.
struct Bytes {
  std::vector<uint8_t> data;

  auto operator==(const Bytes&) const -> bool = default;
};

struct Float {
  double value = 0.0;

  auto operator==(const Float&) const -> bool = default;
};

struct FloatArray {
  std::vector<double> values;

  auto operator==(const FloatArray&) const -> bool = default;
};

// Tuples, records and variant constructors. Interpretation of the tag is
// left to the consumer.
struct Block {
  uint8_t tag = 0;
  std::vector<Value> fields;

  auto operator==(const Block&) const -> bool = default;
};

// Sizes a length-prefixed custom block declares for the producer's heap.
struct CustomSizes {
  uint32_t size_32 = 0;
  uint64_t size_64 = 0;

  auto operator==(const CustomSizes&) const -> bool = default;
};

// Identifier-tagged payload. The payload is the serialized stream bytes,
// uninterpreted; see custom.hpp for the built-in interpretations.
struct Custom {
  std::string identifier;
  std::vector<uint8_t> payload;
  std::optional<CustomSizes> declared_sizes;

  auto operator==(const Custom&) const -> bool = default;
};

using Object = std::variant<Pending, Bytes, Float, FloatArray, Block, Custom>;

// Short kind name for diagnostics and dumps ("block", "bytes", ...).
auto KindName(const Object& object) -> const char*;

}  // namespace camlbin::reader
