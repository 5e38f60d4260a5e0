#pragma once

namespace camlbin::common {

// Builds a std::visit visitor from a set of lambdas, one per alternative.
// A missing alternative is a compile error rather than a silent fallthrough.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace camlbin::common
