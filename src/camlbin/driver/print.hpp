#pragma once

#include <string>

#include "camlbin/reader/decode_error.hpp"

namespace camlbin::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDecodeError(
    const std::string& file, const reader::DecodeError& error);

}  // namespace camlbin::driver
