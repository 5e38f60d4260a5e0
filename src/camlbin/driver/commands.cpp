#include "commands.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "camlbin/reader/byte_cursor.hpp"
#include "camlbin/reader/document.hpp"
#include "camlbin/reader/header.hpp"
#include "input.hpp"
#include "print.hpp"

namespace camlbin::driver {

namespace {

auto LoadBytes(const CommandInput& input)
    -> std::optional<std::vector<uint8_t>> {
  auto bytes = ReadInputFile(input.file, input.offset);
  if (!bytes) {
    PrintError(bytes.error());
    return std::nullopt;
  }
  spdlog::info("read {} byte(s) from {}", bytes->size(), input.file);
  return std::move(*bytes);
}

auto DecodeInput(const CommandInput& input)
    -> std::optional<reader::Document> {
  auto bytes = LoadBytes(input);
  if (!bytes) {
    return std::nullopt;
  }
  auto document = reader::DecodeBuffer(*bytes, input.decode);
  if (!document) {
    PrintDecodeError(input.file, document.error());
    return std::nullopt;
  }
  if (document->BytesConsumed() < bytes->size()) {
    PrintWarning(
        std::format(
            "{}: {} trailing byte(s) after the value", input.file,
            bytes->size() - document->BytesConsumed()));
  }
  return std::move(*document);
}

}  // namespace

auto HeaderCommand(const CommandInput& input, std::ostream& out) -> int {
  auto bytes = LoadBytes(input);
  if (!bytes) {
    return 1;
  }
  reader::ByteCursor cursor(*bytes);
  auto header = reader::ParseHeader(cursor);
  if (!header) {
    PrintDecodeError(input.file, header.error());
    return 1;
  }
  out << std::format("magic        0x{:08X}\n", header->magic);
  out << std::format("data_length  {}\n", header->data_length);
  out << std::format("object_count {}\n", header->object_count);
  out << std::format("size_32      {}\n", header->size_32);
  out << std::format("size_64      {}\n", header->size_64);
  return 0;
}

auto DumpCommand(const CommandInput& input, std::ostream& out) -> int {
  auto document = DecodeInput(input);
  if (!document) {
    return 1;
  }
  reader::Printer printer(&*document, &out, input.print);
  printer.Print();
  return 0;
}

auto CheckCommand(const CommandInput& input) -> int {
  return DecodeInput(input) ? 0 : 1;
}

}  // namespace camlbin::driver
