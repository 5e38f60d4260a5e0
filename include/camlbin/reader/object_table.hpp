#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "camlbin/reader/decode_error.hpp"
#include "camlbin/reader/value.hpp"

namespace camlbin::reader {

// Append-only registry of sharable objects, indexed by allocation order.
//
// A slot is reserved when the object's tag is read and finalized once its
// contents are decoded. Resolve() works on reserved-but-pending slots too,
// since a cyclic reference may target a block still under construction.
// The table grows on demand; it is never pre-sized from the header.
class ObjectTable final {
 public:
  ObjectTable() = default;
  ~ObjectTable() = default;

  ObjectTable(const ObjectTable&) = delete;
  auto operator=(const ObjectTable&) -> ObjectTable& = delete;

  ObjectTable(ObjectTable&&) = default;
  auto operator=(ObjectTable&&) -> ObjectTable& = default;

  // Appends a Pending slot. The returned id equals the allocation counter
  // before the call.
  auto Reserve() -> ObjectId;

  // Replaces the placeholder at `id`. Finalizing a slot that is not pending
  // is a decoder bug and throws InternalError.
  void Finalize(ObjectId id, Object object);

  [[nodiscard]] auto Resolve(ObjectId id) const -> const Object&;

  // Maps a SHARED back-offset to a slot: index = counter - offset.
  // `offset_position` is the input offset used when reporting failure.
  [[nodiscard]] auto ResolveBackOffset(
      uint64_t offset, size_t offset_position) const -> Result<ObjectId>;

  // The allocation counter.
  [[nodiscard]] auto Size() const -> size_t {
    return objects_.size();
  }

  // Moves the slots out. The table is empty afterwards.
  auto Release() -> std::vector<Object>;

 private:
  std::vector<Object> objects_;
};

}  // namespace camlbin::reader
