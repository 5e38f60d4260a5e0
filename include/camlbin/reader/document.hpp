#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <variant>
#include <vector>

#include "camlbin/reader/header.hpp"
#include "camlbin/reader/value.hpp"

namespace camlbin::reader {

// Constructor view shared by blocks and atoms.
struct BlockShape {
  uint8_t tag = 0;
  std::span<const Value> fields;
};

// Result of one decode: the header, the top-level value, and the arena that
// owns every sharable object. Object ids in the tree index this arena, in
// the same order the decoder allocated them.
class Document final {
 public:
  Document(
      Header header, Value root, std::vector<Object> objects,
      size_t bytes_consumed)
      : header_(header),
        root_(root),
        objects_(std::move(objects)),
        bytes_consumed_(bytes_consumed) {
  }
  ~Document() = default;

  Document(const Document&) = delete;
  auto operator=(const Document&) -> Document& = delete;

  Document(Document&&) = default;
  auto operator=(Document&&) -> Document& = default;

  [[nodiscard]] auto GetHeader() const -> const Header& {
    return header_;
  }
  [[nodiscard]] auto Root() const -> Value {
    return root_;
  }
  [[nodiscard]] auto ObjectCount() const -> size_t {
    return objects_.size();
  }
  // Header plus value stream.
  [[nodiscard]] auto BytesConsumed() const -> size_t {
    return bytes_consumed_;
  }

  [[nodiscard]] auto operator[](ObjectId id) const -> const Object&;

  // In-place access. Changes are visible through every alias of `id`.
  auto Mutable(ObjectId id) -> Object&;

  // Typed access: nullptr when `value` is not a reference to a T. A
  // zero-field block decodes to an atom, not a Block, so Get<Block> is
  // nullptr for it; use BlockOf to handle both.
  template <typename T>
  [[nodiscard]] auto Get(Value value) const -> const T* {
    if (!value.IsRef()) {
      return nullptr;
    }
    return std::get_if<T>(&(*this)[value.AsRef()]);
  }

  // Tag and fields of a block, or the tag and no fields of an atom. The
  // span is invalidated by Mutable on the same object.
  [[nodiscard]] auto BlockOf(Value value) const -> std::optional<BlockShape>;

 private:
  Header header_;
  Value root_;
  std::vector<Object> objects_;
  size_t bytes_consumed_;
};

}  // namespace camlbin::reader
