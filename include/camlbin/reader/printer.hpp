#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "camlbin/reader/document.hpp"
#include "camlbin/reader/value.hpp"

namespace camlbin::reader {

struct PrintOptions {
  // Bytes shown per string before truncating with "...".
  size_t preview = 64;
};

// Renders a decoded document as an indented tree, one value per line.
//
// An object reached more than once is labeled "#N=" where it is first
// printed (N is its slot index); later occurrences print "#N#". Cycles
// therefore print finitely.
class Printer {
 public:
  Printer(const Document* document, std::ostream* out, PrintOptions options);

  void Print();
  void Print(Value value);

 private:
  void CountReferences(Value root);

  void PrintValue(Value value);
  void PrintObject(ObjectId id);

  void PrintIndent();
  void Indent();
  void Dedent();

  [[nodiscard]] auto FormatBytes(const Bytes& bytes) const -> std::string;
  [[nodiscard]] auto FormatCustom(const Custom& custom) const -> std::string;

  const Document* document_;
  std::ostream* out_;
  PrintOptions options_;
  int indent_ = 0;

  absl::flat_hash_map<ObjectId, uint32_t> reference_counts_;
  absl::flat_hash_set<ObjectId> printed_;
};

auto FormatDocument(const Document& document, PrintOptions options = {})
    -> std::string;

}  // namespace camlbin::reader
