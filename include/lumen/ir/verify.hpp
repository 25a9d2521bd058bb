#pragma once

#include <cstdint>

#include "lumen/common/diagnostic.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/value_type.hpp"

namespace lumen::ir {

// Scalar kind and component count of a value in flight.
struct Shape {
  ScalarKind kind = ScalarKind::kFloat;
  uint8_t components = 1;

  auto operator==(const Shape&) const -> bool = default;
};

// Shape of the value an lvalue denotes. Accesses outside the declared
// shape of the local (or of the wrong storage variant) are
// InvalidLValueAccess.
auto ShapeOf(const Function& func, const LValue& lvalue) -> Result<Shape>;

auto ShapeOf(const Function& func, const Operand& operand) -> Result<Shape>;

auto ShapeOf(const Function& func, const Destination& dest) -> Result<Shape>;

// Shape a Compute produces from its operand shapes, or MalformedIr if the
// operation does not accept them.
auto ResultShape(const Function& func, const Compute& compute)
    -> Result<Shape>;

// Structural checks on frontend output, run before lowering:
// - parameter storage matches mode (In: register; Out/InOut: pointer)
// - operation arity and operand kinds
// - component counts agree (scalars broadcast)
// - temps assigned at most once, and every temp read in a reachable
//   block is assigned before it along every path from the entry
// - lanes written through an lvalue are distinct
// - block targets exist; return value matches the declared result
auto VerifyFunction(const Function& func) -> Result<void>;

}  // namespace lumen::ir
