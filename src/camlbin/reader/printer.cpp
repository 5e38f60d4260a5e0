#include "camlbin/reader/printer.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <format>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "camlbin/common/overloaded.hpp"
#include "camlbin/reader/custom.hpp"

namespace camlbin::reader {

namespace {

auto HexPayload(const std::vector<uint8_t>& payload) -> std::string {
  std::string hex = "<";
  for (uint8_t byte : payload) {
    hex += std::format("{:02x}", byte);
  }
  hex += ">";
  return hex;
}

}  // namespace

Printer::Printer(
    const Document* document, std::ostream* out, PrintOptions options)
    : document_(document), out_(out), options_(options) {
}

void Printer::Print() {
  Print(document_->Root());
}

void Printer::Print(Value value) {
  reference_counts_.clear();
  printed_.clear();
  CountReferences(value);
  PrintValue(value);
}

void Printer::CountReferences(Value root) {
  std::vector<Value> worklist = {root};
  while (!worklist.empty()) {
    Value value = worklist.back();
    worklist.pop_back();
    if (!value.IsRef()) {
      continue;
    }
    ObjectId id = value.AsRef();
    if (++reference_counts_[id] > 1) {
      continue;
    }
    if (const auto* block = std::get_if<Block>(&(*document_)[id])) {
      worklist.insert(
          worklist.end(), block->fields.rbegin(), block->fields.rend());
    }
  }
}

void Printer::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Printer::Indent() {
  ++indent_;
}

void Printer::Dedent() {
  assert(indent_ > 0);
  --indent_;
}

void Printer::PrintValue(Value value) {
  if (value.IsInt()) {
    PrintIndent();
    *out_ << value.AsInt() << "\n";
    return;
  }
  if (value.IsAtom()) {
    PrintIndent();
    *out_ << std::format("atom tag={}\n", value.AsAtom().tag);
    return;
  }
  PrintObject(value.AsRef());
}

void Printer::PrintObject(ObjectId id) {
  PrintIndent();
  if (printed_.contains(id)) {
    *out_ << std::format("#{}#\n", id.value);
    return;
  }

  std::string label;
  auto it = reference_counts_.find(id);
  if (it != reference_counts_.end() && it->second > 1) {
    printed_.insert(id);
    label = std::format("#{}= ", id.value);
  }

  std::visit(
      common::Overloaded{
          [&](const Pending&) { *out_ << label << "<pending>\n"; },
          [&](const Bytes& bytes) {
            *out_ << label << FormatBytes(bytes) << "\n";
          },
          [&](const Float& f) {
            *out_ << label << std::format("{}", f.value) << "\n";
          },
          [&](const FloatArray& array) {
            *out_ << label << std::format("float[{}] [", array.values.size());
            for (size_t i = 0; i < array.values.size(); ++i) {
              *out_ << (i == 0 ? "" : ", ")
                    << std::format("{}", array.values[i]);
            }
            *out_ << "]\n";
          },
          [&](const Custom& custom) {
            *out_ << label << FormatCustom(custom) << "\n";
          },
          [&](const Block& block) {
            *out_ << label
                  << std::format(
                         "block tag={} size={} {{\n", block.tag,
                         block.fields.size());
            Indent();
            for (Value field : block.fields) {
              PrintValue(field);
            }
            Dedent();
            PrintIndent();
            *out_ << "}\n";
          },
      },
      (*document_)[id]);
}

auto Printer::FormatBytes(const Bytes& bytes) const -> std::string {
  size_t shown = std::min(bytes.data.size(), options_.preview);
  std::string text = "\"";
  for (size_t i = 0; i < shown; ++i) {
    uint8_t c = bytes.data[i];
    switch (c) {
      case '"':
        text += "\\\"";
        break;
      case '\\':
        text += "\\\\";
        break;
      case '\n':
        text += "\\n";
        break;
      case '\t':
        text += "\\t";
        break;
      case '\r':
        text += "\\r";
        break;
      default:
        if (c >= 0x20 && c < 0x7F) {
          text.push_back(static_cast<char>(c));
        } else {
          text += std::format("\\x{:02x}", c);
        }
    }
  }
  if (shown < bytes.data.size()) {
    return std::format("{}...\" ({} bytes)", text, bytes.data.size());
  }
  return text + "\"";
}

auto Printer::FormatCustom(const Custom& custom) const -> std::string {
  auto kind = LookupBuiltinCustom(custom.identifier);
  if (kind) {
    Result<int64_t> interpreted = std::unexpected(DecodeError{});
    switch (*kind) {
      case BuiltinCustom::kInt32:
        interpreted = AsInt32(custom).transform(
            [](int32_t v) { return static_cast<int64_t>(v); });
        break;
      case BuiltinCustom::kInt64:
        interpreted = AsInt64(custom);
        break;
      case BuiltinCustom::kNativeInt:
        interpreted = AsNativeInt(custom);
        break;
    }
    if (interpreted) {
      return std::format("custom {} {}", custom.identifier, *interpreted);
    }
  }
  return std::format(
      "custom {} {}", custom.identifier, HexPayload(custom.payload));
}

auto FormatDocument(const Document& document, PrintOptions options)
    -> std::string {
  std::ostringstream out;
  Printer printer(&document, &out, options);
  printer.Print();
  return out.str();
}

}  // namespace camlbin::reader
