#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lumen::ir {

struct LocalId {
  uint32_t value = 0;
  auto operator==(const LocalId&) const -> bool = default;
};

struct TempId {
  uint32_t value = 0;
  auto operator==(const TempId&) const -> bool = default;
};

// Every component of the pointee, starting at the (element) base.
struct Direct {
  uint8_t count = 1;
  auto operator==(const Direct&) const -> bool = default;
};

// Only the listed component offsets (swizzles, partial writes). The i-th
// value read/written maps to component indices[i].
struct Component {
  std::vector<uint8_t> indices;
  auto operator==(const Component&) const -> bool = default;
};

// One array element (or matrix column). The index is a constant or an Int
// temp; runtime indices are not bounds-checked. With components unset the
// whole element is accessed (Direct semantics), otherwise only the listed
// components (Component semantics).
struct ArrayElement {
  std::variant<uint32_t, TempId> index;
  std::optional<std::vector<uint8_t>> components;
  auto operator==(const ArrayElement&) const -> bool = default;
};

using AccessPattern = std::variant<Direct, Component, ArrayElement>;

// A local kept in a register. components lists the accessed lanes; empty
// means all of them.
struct SsaHeld {
  LocalId local;
  std::vector<uint8_t> components;
  auto operator==(const SsaHeld&) const -> bool = default;
};

// A local addressed through memory: stack arrays or caller-supplied
// pointers (out/inout parameters).
struct PointerBased {
  LocalId base;
  AccessPattern access;
  auto operator==(const PointerBased&) const -> bool = default;
};

// Where a value lives. Resolved once by the frontend and consumed by a
// single read or write.
using LValue = std::variant<SsaHeld, PointerBased>;

auto ToString(const LValue& lvalue) -> std::string;

}  // namespace lumen::ir
