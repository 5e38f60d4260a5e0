#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

#include "camlbin/reader/decoder.hpp"
#include "camlbin/reader/printer.hpp"

namespace camlbin::driver {

struct CommandInput {
  std::string file;
  size_t offset = 0;
  reader::DecodeOptions decode;
  reader::PrintOptions print;
};

// Each command writes its result to `out` and errors to stderr, and returns
// the process exit code.
auto HeaderCommand(const CommandInput& input, std::ostream& out) -> int;
auto DumpCommand(const CommandInput& input, std::ostream& out) -> int;
auto CheckCommand(const CommandInput& input) -> int;

}  // namespace camlbin::driver
