#include <cstdint>

#include <fmt/core.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Intrinsics.h>
#include <llvm/IR/Value.h>

#include "lumen/common/internal_error.hpp"
#include "lumen/fixed/q32.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/value_type.hpp"
#include "lumen/llvm_backend/context.hpp"
#include "lumen/llvm_backend/q32_transform.hpp"

namespace lumen::llvm_backend {

namespace {

using ir::ScalarKind;

auto EncodeComponent(Context& context, ScalarKind kind, double value)
    -> llvm::Constant* {
  auto* i32 = context.GetComponentType();
  switch (kind) {
    case ScalarKind::kFloat:
      return llvm::ConstantInt::getSigned(i32, fixed::FromDouble(value));
    case ScalarKind::kInt:
      return llvm::ConstantInt::getSigned(
          i32, static_cast<int32_t>(static_cast<int64_t>(value)));
    case ScalarKind::kUint:
      return llvm::ConstantInt::get(
          i32, static_cast<uint32_t>(static_cast<int64_t>(value)));
    case ScalarKind::kBool:
      return llvm::ConstantInt::getBool(context.GetLlvmContext(), value != 0.0);
  }
  throw common::InternalError("EncodeComponent", "unknown scalar kind");
}

auto FromFloat(Context& context, ScalarKind to, llvm::Value* x)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  auto* i32 = context.GetComponentType();
  llvm::Value* zero = llvm::ConstantInt::get(i32, 0);
  switch (to) {
    case ScalarKind::kInt: {
      // Bias negatives by 0xFFFF so the arithmetic shift truncates toward
      // zero instead of toward negative infinity.
      llvm::Value* bias = builder.CreateSelect(
          builder.CreateICmpSLT(x, zero),
          llvm::ConstantInt::get(i32, fixed::kFracMask), zero);
      return builder.CreateAShr(
          builder.CreateAdd(x, bias), fixed::kFracBits, "q32.toint");
    }
    case ScalarKind::kUint: {
      llvm::Value* whole = builder.CreateLShr(x, fixed::kFracBits);
      return builder.CreateSelect(
          builder.CreateICmpSLT(x, zero), zero, whole, "q32.touint");
    }
    case ScalarKind::kBool:
      return builder.CreateICmpNE(x, zero);
    case ScalarKind::kFloat:
      return x;
  }
  throw common::InternalError("FromFloat", "unknown scalar kind");
}

auto ToFloat(Context& context, ScalarKind from, llvm::Value* x)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  auto* i32 = context.GetComponentType();
  switch (from) {
    case ScalarKind::kInt: {
      llvm::Value* upper = builder.CreateBinaryIntrinsic(
          llvm::Intrinsic::smin, x,
          llvm::ConstantInt::getSigned(i32, fixed::kMaxIntForFixed));
      llvm::Value* clamped = builder.CreateBinaryIntrinsic(
          llvm::Intrinsic::smax, upper,
          llvm::ConstantInt::getSigned(i32, fixed::kMinIntForFixed));
      return builder.CreateShl(clamped, fixed::kFracBits, "q32.fromint");
    }
    case ScalarKind::kUint: {
      llvm::Value* clamped = builder.CreateBinaryIntrinsic(
          llvm::Intrinsic::umin, x,
          llvm::ConstantInt::get(i32, fixed::kMaxIntForFixed));
      return builder.CreateShl(clamped, fixed::kFracBits, "q32.fromuint");
    }
    case ScalarKind::kBool:
      return builder.CreateSelect(
          x, llvm::ConstantInt::get(i32, fixed::kOne),
          llvm::ConstantInt::get(i32, 0));
    case ScalarKind::kFloat:
      return x;
  }
  throw common::InternalError("ToFloat", "unknown scalar kind");
}

}  // namespace

auto EmitConstant(Context& context, const ir::Constant& constant) -> Lanes {
  Lanes lanes;
  for (double value : constant.components) {
    lanes.push_back(EncodeComponent(context, constant.kind, value));
  }
  return lanes;
}

auto EmitConvert(
    Context& context, ScalarKind from, ScalarKind to, llvm::Value* value)
    -> llvm::Value* {
  if (from == to) {
    return value;
  }
  if (from == ScalarKind::kFloat) {
    return FromFloat(context, to, value);
  }
  if (to == ScalarKind::kFloat) {
    return ToFloat(context, from, value);
  }
  auto& builder = context.GetBuilder();
  if (to == ScalarKind::kBool) {
    return builder.CreateICmpNE(
        value, llvm::ConstantInt::get(context.GetComponentType(), 0));
  }
  if (from == ScalarKind::kBool) {
    return builder.CreateZExt(value, context.GetComponentType());
  }
  // Int <-> Uint reinterprets the bits.
  return value;
}

}  // namespace lumen::llvm_backend
