#include "camlbin/reader/object_table.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <utility>
#include <variant>
#include <vector>

#include "camlbin/common/internal_error.hpp"

namespace camlbin::reader {

auto ObjectTable::Reserve() -> ObjectId {
  if (objects_.size() >= UINT32_MAX) {
    common::ThrowInternalError(
        "ObjectTable::Reserve", "object table exceeds 32-bit index space");
  }
  ObjectId id{static_cast<uint32_t>(objects_.size())};
  objects_.emplace_back(Pending{});
  return id;
}

void ObjectTable::Finalize(ObjectId id, Object object) {
  if (id.value >= objects_.size()) {
    common::ThrowInternalError(
        "ObjectTable::Finalize",
        std::format(
            "slot {} out of range (size {})", id.value, objects_.size()));
  }
  Object& slot = objects_[id.value];
  if (!std::holds_alternative<Pending>(slot)) {
    common::ThrowInternalError(
        "ObjectTable::Finalize",
        std::format("slot {} finalized twice", id.value));
  }
  slot = std::move(object);
}

auto ObjectTable::Resolve(ObjectId id) const -> const Object& {
  if (id.value >= objects_.size()) {
    common::ThrowInternalError(
        "ObjectTable::Resolve",
        std::format(
            "slot {} out of range (size {})", id.value, objects_.size()));
  }
  return objects_[id.value];
}

auto ObjectTable::ResolveBackOffset(
    uint64_t offset, size_t offset_position) const -> Result<ObjectId> {
  uint64_t counter = objects_.size();
  if (offset == 0 || offset > counter) {
    return std::unexpected(
        DecodeError::Make(
            DecodeErrorKind::kInvalidSharedReference, offset_position,
            std::format(
                "back-offset {} with {} object(s) allocated", offset,
                counter)));
  }
  return ObjectId{static_cast<uint32_t>(counter - offset)};
}

auto ObjectTable::Release() -> std::vector<Object> {
  std::vector<Object> released = std::move(objects_);
  objects_.clear();
  return released;
}

}  // namespace camlbin::reader
