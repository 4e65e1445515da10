#pragma once

namespace actorkit {

// Visitor helper for std::visit with multiple lambdas.
//
// Usage:
//   std::visit(Overloaded{
//       [](const EmptyMethodName&) { ... },
//       [](const DuplicateSelector& e) { ... },
//   }, error);

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace actorkit
