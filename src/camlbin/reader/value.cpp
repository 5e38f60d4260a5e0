#include "camlbin/reader/value.hpp"

#include <variant>

#include "camlbin/common/overloaded.hpp"

namespace camlbin::reader {

auto KindName(const Object& object) -> const char* {
  return std::visit(
      common::Overloaded{
          [](const Pending&) { return "pending"; },
          [](const Bytes&) { return "bytes"; },
          [](const Float&) { return "float"; },
          [](const FloatArray&) { return "float array"; },
          [](const Block&) { return "block"; },
          [](const Custom&) { return "custom"; },
      },
      object);
}

}  // namespace camlbin::reader
