#pragma once

#include "camlbin/reader/document.hpp"
#include "camlbin/reader/value.hpp"

namespace camlbin::reader {

// Structural equality between a value of one document and a value of
// another (or the same) document. Cycles are handled: a pair of objects
// already under comparison is assumed equal. Floats compare by bit
// pattern, so NaN payloads decoded from the same bytes are equal.
// Sharing is not compared; a shared and an unshared copy of the same
// contents are equivalent.
auto Equivalent(const Document& a, Value va, const Document& b, Value vb)
    -> bool;

// Compares the two roots.
auto Equivalent(const Document& a, const Document& b) -> bool;

}  // namespace camlbin::reader
