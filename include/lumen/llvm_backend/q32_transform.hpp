#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/IR/Value.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/value_type.hpp"
#include "lumen/llvm_backend/context.hpp"

namespace lumen::llvm_backend {

// Rewrites one abstract Compute into instruction sequences and returns the
// result lanes. Float operations become Q16.16 arithmetic:
//
//   add/sub     sadd.sat/ssub.sat (precise) or wrapping add/sub (fast)
//   mul         inline 64-bit multiply, shift and clamp when the target has
//               a wide multiply, otherwise the registry's mul builtin
//   div, mod, fma, round, roundeven, transcendentals
//               registry builtin calls
//   min/max/sign/floor/ceil/trunc/fract/compare/select
//               inline
//
// Int and Uint operations lower to native instructions (division by zero
// yields 0). Bool operations lower to i1 logic. Library calls become one
// call to the __lpfx_* builtin for the operand width, with vector results
// read back from an entry-block buffer.
auto LowerCompute(Context& context, const ir::Compute& compute) -> Lanes;

auto EmitQ32Add(Context& context, llvm::Value* a, llvm::Value* b)
    -> llvm::Value*;
auto EmitQ32Sub(Context& context, llvm::Value* a, llvm::Value* b)
    -> llvm::Value*;
auto EmitQ32Mul(Context& context, llvm::Value* a, llvm::Value* b)
    -> llvm::Value*;

// Resolves a builtin through the registry and emits it: a native intrinsic
// sequence or a call to the Local or External symbol. Throws
// DiagnosticException(UnresolvedBuiltin) when nothing is registered.
auto EmitBuiltinCall(
    Context& context, builtins::BuiltinId id,
    llvm::ArrayRef<llvm::Value*> args) -> llvm::Value*;

// Calls the host log builtin with the record's level, module and text.
void EmitHostLog(Context& context, const ir::HostLog& log);

// Constant lanes: Float components are encoded to Q16.16 (saturating).
auto EmitConstant(Context& context, const ir::Constant& constant) -> Lanes;

// Scalar conversion between kinds. Float to Int truncates toward zero; Int
// to Float clamps to [-32768, 32767]; Float to Uint clamps negatives to 0.
auto EmitConvert(
    Context& context, ir::ScalarKind from, ir::ScalarKind to,
    llvm::Value* value) -> llvm::Value*;

}  // namespace lumen::llvm_backend
