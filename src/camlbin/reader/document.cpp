#include "camlbin/reader/document.hpp"

#include <format>
#include <optional>

#include "camlbin/common/internal_error.hpp"

namespace camlbin::reader {

auto Document::operator[](ObjectId id) const -> const Object& {
  if (id.value >= objects_.size()) {
    common::ThrowInternalError(
        "Document::operator[]",
        std::format(
            "object {} out of range (size {})", id.value, objects_.size()));
  }
  return objects_[id.value];
}

auto Document::Mutable(ObjectId id) -> Object& {
  if (id.value >= objects_.size()) {
    common::ThrowInternalError(
        "Document::Mutable",
        std::format(
            "object {} out of range (size {})", id.value, objects_.size()));
  }
  return objects_[id.value];
}

auto Document::BlockOf(Value value) const -> std::optional<BlockShape> {
  if (value.IsAtom()) {
    return BlockShape{.tag = value.AsAtom().tag, .fields = {}};
  }
  if (const auto* block = Get<Block>(value)) {
    return BlockShape{.tag = block->tag, .fields = block->fields};
  }
  return std::nullopt;
}

}  // namespace camlbin::reader
