#pragma once

namespace lumen {

// Visitor helper for std::visit over the IR variants (Operation, LValue,
// AccessPattern, builtin Implementation).
//
//   std::visit(Overloaded{
//       [](const ir::SsaHeld& ssa) { ... },
//       [](const ir::PointerBased& ptr) { ... },
//   }, lvalue);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace lumen
