#pragma once

#include "lumen/ir/lvalue.hpp"
#include "lumen/llvm_backend/context.hpp"

namespace lumen::llvm_backend {

// Unified read/write over every storage variant. The transform calls these
// without knowing whether a value lives in registers, in a stack array or
// behind a caller-supplied pointer.
//
//   SsaHeld                 -> per-component register slots
//   PointerBased/Direct     -> base[0 .. count)
//   PointerBased/Component  -> base[i] for each listed i
//   PointerBased/ArrayElement
//                           -> base[index * components + lane]
//
// Throws DiagnosticException(InvalidLValueAccess) when the access does not
// fit the local's storage or shape, or when a write supplies the wrong
// number of values.

// One lane per accessed component, in access order.
auto ReadLValue(Context& context, const ir::LValue& lvalue) -> Lanes;

// Stores values[i] into the i-th accessed component. Components not named by
// the access are left unchanged.
void WriteLValue(
    Context& context, const ir::LValue& lvalue, const Lanes& values);

}  // namespace lumen::llvm_backend
