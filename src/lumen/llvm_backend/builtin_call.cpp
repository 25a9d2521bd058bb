#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/DataLayout.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Intrinsics.h>
#include <llvm/IR/Value.h>
#include <spdlog/spdlog.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/overloaded.hpp"
#include "lumen/fixed/q32.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/llvm_backend/context.hpp"
#include "lumen/llvm_backend/q32_transform.hpp"

namespace lumen::llvm_backend {

namespace {

// (sext a * sext b) >> 16, clamped to the Q16.16 range.
auto EmitWideMultiply(Context& context, llvm::Value* a, llvm::Value* b)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  auto* i64 = builder.getInt64Ty();
  llvm::Value* wide = builder.CreateMul(
      builder.CreateSExt(a, i64), builder.CreateSExt(b, i64), "q32.wide");
  llvm::Value* scaled =
      builder.CreateAShr(wide, fixed::kFracBits, "q32.scaled");
  llvm::Value* upper = builder.CreateBinaryIntrinsic(
      llvm::Intrinsic::smin, scaled,
      llvm::ConstantInt::getSigned(i64, fixed::kMaxFixed));
  llvm::Value* clamped = builder.CreateBinaryIntrinsic(
      llvm::Intrinsic::smax, upper,
      llvm::ConstantInt::getSigned(i64, fixed::kMinFixed));
  return builder.CreateTrunc(clamped, context.GetComponentType(), "q32.mul");
}

auto EmitIntrinsic(
    Context& context, builtins::NativeIntrinsic intrinsic,
    llvm::ArrayRef<llvm::Value*> args) -> llvm::Value* {
  if (args.size() != 2) {
    throw common::InternalError(
        "EmitIntrinsic",
        fmt::format(
            "{} takes 2 operands, got {}", builtins::ToString(intrinsic),
            args.size()));
  }
  auto& builder = context.GetBuilder();
  switch (intrinsic) {
    case builtins::NativeIntrinsic::kSaturatingAdd:
      return builder.CreateBinaryIntrinsic(
          llvm::Intrinsic::sadd_sat, args[0], args[1], nullptr, "q32.add");
    case builtins::NativeIntrinsic::kSaturatingSub:
      return builder.CreateBinaryIntrinsic(
          llvm::Intrinsic::ssub_sat, args[0], args[1], nullptr, "q32.sub");
    case builtins::NativeIntrinsic::kWideMultiply:
      return EmitWideMultiply(context, args[0], args[1]);
  }
  throw common::InternalError("EmitIntrinsic", "unknown native intrinsic");
}

auto ResolveOrThrow(Context& context, builtins::BuiltinId id, uint8_t arity)
    -> builtins::Resolution {
  auto resolution =
      context.GetRegistry().Resolve(id, arity, context.GetTarget());
  if (!resolution) {
    throw DiagnosticException(std::move(resolution).error().WithNote(
        fmt::format(
            "while lowering function '{}'", context.GetIrFunction().name)));
  }
  return *resolution;
}

}  // namespace

auto EmitBuiltinCall(
    Context& context, builtins::BuiltinId id,
    llvm::ArrayRef<llvm::Value*> args) -> llvm::Value* {
  auto arity = static_cast<uint8_t>(args.size());
  builtins::Resolution resolution = ResolveOrThrow(context, id, arity);

  auto call_symbol = [&](std::string_view symbol) -> llvm::Value* {
    llvm::Function* callee = context.GetBuiltinFunction(id, symbol);
    if (callee->getReturnType()->isVoidTy()) {
      return context.GetBuilder().CreateCall(callee, args);
    }
    return context.GetBuilder().CreateCall(
        callee, args, fmt::format("{}.r", builtins::ToString(id)));
  };
  return std::visit(
      Overloaded{
          [&](builtins::NativeIntrinsic intrinsic) {
            return EmitIntrinsic(context, intrinsic, args);
          },
          [&](const builtins::LocalImpl& local) {
            return call_symbol(local.symbol);
          },
          [&](const builtins::ExternalImpl& external) {
            return call_symbol(external.symbol);
          },
      },
      resolution);
}

auto EmitQ32Add(Context& context, llvm::Value* a, llvm::Value* b)
    -> llvm::Value* {
  if (context.GetOptions().arith_mode == fixed::ArithMode::kFast) {
    return context.GetBuilder().CreateAdd(a, b, "q32.add");
  }
  return EmitBuiltinCall(context, builtins::BuiltinId::kAdd, {a, b});
}

auto EmitQ32Sub(Context& context, llvm::Value* a, llvm::Value* b)
    -> llvm::Value* {
  if (context.GetOptions().arith_mode == fixed::ArithMode::kFast) {
    return context.GetBuilder().CreateSub(a, b, "q32.sub");
  }
  return EmitBuiltinCall(context, builtins::BuiltinId::kSub, {a, b});
}

auto EmitQ32Mul(Context& context, llvm::Value* a, llvm::Value* b)
    -> llvm::Value* {
  return EmitBuiltinCall(context, builtins::BuiltinId::kMul, {a, b});
}

void EmitHostLog(Context& context, const ir::HostLog& log) {
  const auto& info = builtins::GetBuiltinInfo(builtins::BuiltinId::kHostLog);
  builtins::Resolution resolution =
      ResolveOrThrow(context, info.id, info.arity);

  std::string_view symbol = std::visit(
      Overloaded{
          [](builtins::NativeIntrinsic) -> std::string_view {
            throw common::InternalError(
                "EmitHostLog", "host log resolved to a native intrinsic");
          },
          [](const builtins::LocalImpl& local) { return local.symbol; },
          [](const builtins::ExternalImpl& external) {
            return external.symbol;
          },
      },
      resolution);

  auto& builder = context.GetBuilder();
  auto* size_type = context.GetModule().getDataLayout().getIntPtrType(
      context.GetLlvmContext());
  llvm::Value* module =
      builder.CreateGlobalStringPtr(log.module, "log.module");
  llvm::Value* message =
      builder.CreateGlobalStringPtr(log.message, "log.message");
  llvm::Value* args[] = {
      builder.getInt8(log.level),
      module,
      llvm::ConstantInt::get(size_type, log.module.size()),
      message,
      llvm::ConstantInt::get(size_type, log.message.size()),
  };
  builder.CreateCall(context.GetBuiltinFunction(info.id, symbol), args);
  spdlog::trace(
      "lowered host log call to {} in '{}'", symbol,
      context.GetIrFunction().name);
}

}  // namespace lumen::llvm_backend
