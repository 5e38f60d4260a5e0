#include "camlbin/reader/equivalence.hpp"

#include <algorithm>
#include <bit>
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_set.h"

namespace camlbin::reader {

namespace {

auto SameBits(double x, double y) -> bool {
  return std::bit_cast<uint64_t>(x) == std::bit_cast<uint64_t>(y);
}

using ObjectPair = std::pair<ObjectId, ObjectId>;

class Comparator {
 public:
  Comparator(const Document& a, const Document& b) : a_(a), b_(b) {
  }

  auto Run(Value va, Value vb) -> bool {
    if (!CompareValues(va, vb)) {
      return false;
    }
    while (!worklist_.empty()) {
      auto [ia, ib] = worklist_.back();
      worklist_.pop_back();
      if (!CompareObjects(a_[ia], b_[ib])) {
        return false;
      }
    }
    return true;
  }

 private:
  // Immediates compare here; reference pairs are queued.
  auto CompareValues(Value va, Value vb) -> bool {
    if (va.IsInt() || vb.IsInt()) {
      return va.IsInt() && vb.IsInt() && va.AsInt() == vb.AsInt();
    }
    if (va.IsAtom() || vb.IsAtom()) {
      return va.IsAtom() && vb.IsAtom() && va.AsAtom() == vb.AsAtom();
    }
    ObjectPair pair{va.AsRef(), vb.AsRef()};
    if (assumed_.insert(pair).second) {
      worklist_.push_back(pair);
    }
    return true;
  }

  auto CompareObjects(const Object& oa, const Object& ob) -> bool {
    if (oa.index() != ob.index()) {
      return false;
    }
    if (const auto* fa = std::get_if<Float>(&oa)) {
      return SameBits(fa->value, std::get<Float>(ob).value);
    }
    if (const auto* arr = std::get_if<FloatArray>(&oa)) {
      const auto& brr = std::get<FloatArray>(ob);
      return std::ranges::equal(arr->values, brr.values, SameBits);
    }
    if (const auto* ba = std::get_if<Block>(&oa)) {
      const auto& bb = std::get<Block>(ob);
      if (ba->tag != bb.tag || ba->fields.size() != bb.fields.size()) {
        return false;
      }
      for (size_t i = 0; i < ba->fields.size(); ++i) {
        if (!CompareValues(ba->fields[i], bb.fields[i])) {
          return false;
        }
      }
      return true;
    }
    // Pending, Bytes and Custom hold no references.
    return oa == ob;
  }

  const Document& a_;
  const Document& b_;
  absl::flat_hash_set<ObjectPair> assumed_;
  std::vector<ObjectPair> worklist_;
};

}  // namespace

auto Equivalent(const Document& a, Value va, const Document& b, Value vb)
    -> bool {
  return Comparator(a, b).Run(va, vb);
}

auto Equivalent(const Document& a, const Document& b) -> bool {
  return Equivalent(a, a.Root(), b, b.Root());
}

}  // namespace camlbin::reader
