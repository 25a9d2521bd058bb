#include "lumen/llvm_backend/q32_transform.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Intrinsics.h>
#include <llvm/IR/Value.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/overloaded.hpp"
#include "lumen/fixed/q32.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/operation.hpp"
#include "lumen/ir/value_type.hpp"
#include "lumen/ir/verify.hpp"
#include "lumen/llvm_backend/context.hpp"
#include "lumen/llvm_backend/operand.hpp"

namespace lumen::llvm_backend {

namespace {

using ir::ScalarKind;

auto Int32(Context& context, int64_t value) -> llvm::Constant* {
  return llvm::ConstantInt::getSigned(context.GetComponentType(), value);
}

// -x: saturating in precise mode, wrapping in fast mode.
auto EmitQ32Negate(Context& context, llvm::Value* x) -> llvm::Value* {
  return EmitQ32Sub(context, Int32(context, 0), x);
}

auto EmitFloor(Context& context, llvm::Value* x) -> llvm::Value* {
  return context.GetBuilder().CreateAnd(
      x, Int32(context, ~static_cast<int64_t>(fixed::kFracMask)), "q32.floor");
}

auto EmitQ32Binary(
    Context& context, ir::BinaryOp op, llvm::Value* a, llvm::Value* b)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  switch (op) {
    case ir::BinaryOp::kAdd:
      return EmitQ32Add(context, a, b);
    case ir::BinaryOp::kSubtract:
      return EmitQ32Sub(context, a, b);
    case ir::BinaryOp::kMultiply:
      return EmitQ32Mul(context, a, b);
    case ir::BinaryOp::kDivide:
      return EmitBuiltinCall(context, builtins::BuiltinId::kDiv, {a, b});
    case ir::BinaryOp::kModulo:
      return EmitBuiltinCall(context, builtins::BuiltinId::kMod, {a, b});
    case ir::BinaryOp::kMin:
      return builder.CreateBinaryIntrinsic(llvm::Intrinsic::smin, a, b);
    case ir::BinaryOp::kMax:
      return builder.CreateBinaryIntrinsic(llvm::Intrinsic::smax, a, b);
  }
  throw common::InternalError("EmitQ32Binary", "unknown binary op");
}

// Division and remainder by zero yield 0; INT_MIN / -1 yields INT_MIN and
// INT_MIN % -1 yields 0.
auto EmitGuardedDivRem(
    Context& context, bool is_signed, bool is_rem, llvm::Value* a,
    llvm::Value* b) -> llvm::Value* {
  auto& builder = context.GetBuilder();
  llvm::Value* zero = Int32(context, 0);
  llvm::Value* one = Int32(context, 1);
  llvm::Value* by_zero = builder.CreateICmpEQ(b, zero);
  llvm::Value* trap = by_zero;
  if (is_signed) {
    llvm::Value* overflow = builder.CreateAnd(
        builder.CreateICmpEQ(a, Int32(context, INT32_MIN)),
        builder.CreateICmpEQ(b, Int32(context, -1)));
    trap = builder.CreateOr(by_zero, overflow);
  }
  llvm::Value* divisor = builder.CreateSelect(trap, one, b);
  llvm::Value* result = nullptr;
  if (is_rem) {
    result = is_signed ? builder.CreateSRem(a, divisor)
                       : builder.CreateURem(a, divisor);
  } else {
    result = is_signed ? builder.CreateSDiv(a, divisor)
                       : builder.CreateUDiv(a, divisor);
  }
  return builder.CreateSelect(by_zero, zero, result);
}

auto EmitIntBinary(
    Context& context, ScalarKind kind, ir::BinaryOp op, llvm::Value* a,
    llvm::Value* b) -> llvm::Value* {
  auto& builder = context.GetBuilder();
  bool is_signed = kind == ScalarKind::kInt;
  switch (op) {
    case ir::BinaryOp::kAdd:
      return builder.CreateAdd(a, b);
    case ir::BinaryOp::kSubtract:
      return builder.CreateSub(a, b);
    case ir::BinaryOp::kMultiply:
      return builder.CreateMul(a, b);
    case ir::BinaryOp::kDivide:
      return EmitGuardedDivRem(context, is_signed, false, a, b);
    case ir::BinaryOp::kModulo:
      return EmitGuardedDivRem(context, is_signed, true, a, b);
    case ir::BinaryOp::kMin:
      return builder.CreateBinaryIntrinsic(
          is_signed ? llvm::Intrinsic::smin : llvm::Intrinsic::umin, a, b);
    case ir::BinaryOp::kMax:
      return builder.CreateBinaryIntrinsic(
          is_signed ? llvm::Intrinsic::smax : llvm::Intrinsic::umax, a, b);
  }
  throw common::InternalError("EmitIntBinary", "unknown binary op");
}

// Shared by Float and Int: one_value is kOne for Q16.16 and 1 for Int.
auto EmitSign(Context& context, llvm::Value* x, int64_t one_value)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  llvm::Value* zero = Int32(context, 0);
  llvm::Value* negative = builder.CreateSelect(
      builder.CreateICmpSLT(x, zero), Int32(context, -one_value), zero);
  return builder.CreateSelect(
      builder.CreateICmpSGT(x, zero), Int32(context, one_value), negative,
      "sign");
}

auto EmitQ32Unary(Context& context, ir::UnaryOp op, llvm::Value* x)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  switch (op) {
    case ir::UnaryOp::kNegate:
      return EmitQ32Negate(context, x);
    case ir::UnaryOp::kAbsoluteValue:
      return builder.CreateBinaryIntrinsic(
          llvm::Intrinsic::smax, x, EmitQ32Negate(context, x));
    case ir::UnaryOp::kSign:
      return EmitSign(context, x, fixed::kOne);
    case ir::UnaryOp::kFloor:
      return EmitFloor(context, x);
    case ir::UnaryOp::kCeil: {
      llvm::Value* biased = builder.CreateBinaryIntrinsic(
          llvm::Intrinsic::sadd_sat, x, Int32(context, fixed::kFracMask));
      return EmitFloor(context, biased);
    }
    case ir::UnaryOp::kTrunc: {
      // Negative values with a fraction round up toward zero.
      llvm::Value* lower = EmitFloor(context, x);
      llvm::Value* has_fraction = builder.CreateICmpNE(
          builder.CreateAnd(x, Int32(context, fixed::kFracMask)),
          Int32(context, 0));
      llvm::Value* adjust = builder.CreateAnd(
          builder.CreateICmpSLT(x, Int32(context, 0)), has_fraction);
      return builder.CreateSelect(
          adjust, builder.CreateAdd(lower, Int32(context, fixed::kOne)), lower,
          "q32.trunc");
    }
    case ir::UnaryOp::kFract:
      return builder.CreateAnd(
          x, Int32(context, fixed::kFracMask), "q32.fract");
    case ir::UnaryOp::kRound:
      return EmitBuiltinCall(context, builtins::BuiltinId::kRound, {x});
    case ir::UnaryOp::kRoundEven:
      return EmitBuiltinCall(context, builtins::BuiltinId::kRoundEven, {x});
  }
  throw common::InternalError("EmitQ32Unary", "unknown unary op");
}

auto EmitIntUnary(Context& context, ir::UnaryOp op, llvm::Value* x)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  switch (op) {
    case ir::UnaryOp::kNegate:
      return builder.CreateNeg(x);
    case ir::UnaryOp::kAbsoluteValue:
      return builder.CreateBinaryIntrinsic(
          llvm::Intrinsic::abs, x, builder.getFalse());
    case ir::UnaryOp::kSign:
      return EmitSign(context, x, 1);
    default:
      throw common::InternalError(
          "EmitIntUnary",
          fmt::format("{} is not an integer operation", ir::ToString(op)));
  }
}

auto EmitCompare(
    Context& context, ScalarKind kind, ir::ComparePredicate pred,
    llvm::Value* a, llvm::Value* b) -> llvm::Value* {
  bool is_unsigned = kind == ScalarKind::kUint;
  llvm::CmpInst::Predicate p = llvm::CmpInst::ICMP_EQ;
  switch (pred) {
    case ir::ComparePredicate::kEq:
      p = llvm::CmpInst::ICMP_EQ;
      break;
    case ir::ComparePredicate::kNe:
      p = llvm::CmpInst::ICMP_NE;
      break;
    case ir::ComparePredicate::kLt:
      p = is_unsigned ? llvm::CmpInst::ICMP_ULT : llvm::CmpInst::ICMP_SLT;
      break;
    case ir::ComparePredicate::kLe:
      p = is_unsigned ? llvm::CmpInst::ICMP_ULE : llvm::CmpInst::ICMP_SLE;
      break;
    case ir::ComparePredicate::kGt:
      p = is_unsigned ? llvm::CmpInst::ICMP_UGT : llvm::CmpInst::ICMP_SGT;
      break;
    case ir::ComparePredicate::kGe:
      p = is_unsigned ? llvm::CmpInst::ICMP_UGE : llvm::CmpInst::ICMP_SGE;
      break;
  }
  return context.GetBuilder().CreateICmp(p, a, b);
}

auto EmitLogical(
    Context& context, ir::LogicalOp op, const std::vector<llvm::Value*>& args)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  switch (op) {
    case ir::LogicalOp::kAnd:
      return builder.CreateAnd(args[0], args[1]);
    case ir::LogicalOp::kOr:
      return builder.CreateOr(args[0], args[1]);
    case ir::LogicalOp::kNot:
      return builder.CreateNot(args[0]);
  }
  throw common::InternalError("EmitLogical", "unknown logical op");
}

// One result lane from the matching lane of every operand.
auto EmitLane(
    Context& context, const ir::Operation& operation,
    const std::vector<ir::Shape>& shapes,
    const std::vector<llvm::Value*>& args) -> llvm::Value* {
  ScalarKind kind = shapes.front().kind;
  return std::visit(
      Overloaded{
          [&](const ir::Binary& b) {
            if (kind == ScalarKind::kFloat) {
              return EmitQ32Binary(context, b.op, args[0], args[1]);
            }
            return EmitIntBinary(context, kind, b.op, args[0], args[1]);
          },
          [&](const ir::Unary& u) {
            if (kind == ScalarKind::kFloat) {
              return EmitQ32Unary(context, u.op, args[0]);
            }
            return EmitIntUnary(context, u.op, args[0]);
          },
          [&](const ir::FusedMultiplyAdd&) {
            return EmitBuiltinCall(context, builtins::BuiltinId::kFma, args);
          },
          [&](const ir::Compare& c) {
            return EmitCompare(context, kind, c.predicate, args[0], args[1]);
          },
          [&](const ir::Transcendental& t) {
            return EmitBuiltinCall(context, ir::ToBuiltin(t.kind), args);
          },
          [&](const ir::Convert& c) {
            return EmitConvert(context, kind, c.to, args[0]);
          },
          [&](const ir::Select&) {
            return context.GetBuilder().CreateSelect(args[0], args[1], args[2]);
          },
          [&](const ir::Logical& l) {
            return EmitLogical(context, l.op, args);
          },
          [](const ir::LibraryCall& c) -> llvm::Value* {
            throw common::InternalError(
                "EmitLane",
                fmt::format(
                    "{} is not component-wise", ir::ToString(c.function)));
          },
      },
      operation);
}

// Vector operands travel as consecutive i32 arguments. Vector results come
// back through an entry-block buffer; psrdnoise returns the noise value and
// writes its gradient.
auto LowerLibraryCall(
    Context& context, const ir::Compute& compute, const ir::LibraryCall& call,
    const ir::Shape& result) -> Lanes {
  uint8_t width = OperandShape(context, compute.operands.front()).components;
  auto id = ir::ToBuiltin(call.function, width);
  if (!id) {
    throw common::InternalError(
        "LowerLibraryCall",
        fmt::format(
            "{} has no overload for width {}", ir::ToString(call.function),
            width));
  }

  llvm::SmallVector<llvm::Value*, 10> args;
  for (const auto& operand : compute.operands) {
    Lanes lanes = LowerOperand(context, operand);
    args.append(lanes.begin(), lanes.end());
  }

  auto& builder = context.GetBuilder();
  auto* i32 = context.GetComponentType();
  auto load = [&](llvm::Value* buffer, uint8_t count, Lanes& out) {
    for (uint8_t i = 0; i < count; ++i) {
      llvm::Value* slot = builder.CreateConstInBoundsGEP1_32(i32, buffer, i);
      out.push_back(builder.CreateLoad(i32, slot));
    }
  };

  switch (builtins::GetBuiltinInfo(*id).abi) {
    case builtins::BuiltinAbi::kScalar:
      return Lanes{EmitBuiltinCall(context, *id, args)};
    case builtins::BuiltinAbi::kResultPointer: {
      llvm::Value* buffer =
          context.CreateResultBuffer(result.components, "lpfx.out");
      args.insert(args.begin(), buffer);
      EmitBuiltinCall(context, *id, args);
      Lanes lanes;
      load(buffer, result.components, lanes);
      return lanes;
    }
    case builtins::BuiltinAbi::kGradientOut: {
      auto gradient_width = static_cast<uint8_t>(result.components - 1);
      llvm::Value* buffer =
          context.CreateResultBuffer(gradient_width, "lpfx.gradient");
      args.push_back(buffer);
      args.push_back(Int32(context, 0));  // seed
      Lanes lanes{EmitBuiltinCall(context, *id, args)};
      load(buffer, gradient_width, lanes);
      return lanes;
    }
    default:
      break;
  }
  throw common::InternalError(
      "LowerLibraryCall",
      fmt::format("{} has a per-lane ABI", builtins::ToString(*id)));
}

}  // namespace

auto LowerCompute(Context& context, const ir::Compute& compute) -> Lanes {
  auto result_shape = ir::ResultShape(context.GetIrFunction(), compute);
  if (!result_shape) {
    throw DiagnosticException(std::move(result_shape).error());
  }
  if (const auto* call = std::get_if<ir::LibraryCall>(&compute.operation)) {
    return LowerLibraryCall(context, compute, *call, *result_shape);
  }
  uint8_t width = result_shape->components;

  std::vector<ir::Shape> shapes;
  std::vector<Lanes> operands;
  shapes.reserve(compute.operands.size());
  operands.reserve(compute.operands.size());
  for (const auto& operand : compute.operands) {
    shapes.push_back(OperandShape(context, operand));
    operands.push_back(Broadcast(LowerOperand(context, operand), width));
  }

  Lanes result;
  std::vector<llvm::Value*> args(operands.size());
  for (uint8_t lane = 0; lane < width; ++lane) {
    for (size_t i = 0; i < operands.size(); ++i) {
      args[i] = operands[i][lane];
    }
    result.push_back(EmitLane(context, compute.operation, shapes, args));
  }
  return result;
}

}  // namespace lumen::llvm_backend
