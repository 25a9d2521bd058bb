#pragma once

#include <cstdint>

#include "lumen/ir/function.hpp"
#include "lumen/ir/verify.hpp"
#include "lumen/llvm_backend/context.hpp"

namespace lumen::llvm_backend {

// Lower an operand to its lanes: constants are encoded (Float to Q16.16),
// temps are looked up, lvalues are read through ReadLValue.
auto LowerOperand(Context& context, const ir::Operand& operand) -> Lanes;

// Shape of an operand; throws DiagnosticException if it is malformed.
auto OperandShape(Context& context, const ir::Operand& operand) -> ir::Shape;

// Repeat a single lane to the given width. Wider inputs are returned as-is.
auto Broadcast(const Lanes& lanes, uint8_t width) -> Lanes;

}  // namespace lumen::llvm_backend
