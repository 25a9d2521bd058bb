#include "lumen/llvm_backend/lower.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/PassManager.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Passes/OptimizationLevel.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/Transforms/Utils/Mem2Reg.h>
#include <spdlog/spdlog.h>

#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/opt_level.hpp"
#include "lumen/common/overloaded.hpp"
#include "lumen/ir/cfg.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/lvalue.hpp"
#include "lumen/ir/value_type.hpp"
#include "lumen/ir/verify.hpp"
#include "lumen/llvm_backend/context.hpp"
#include "lumen/llvm_backend/isa_validator.hpp"
#include "lumen/llvm_backend/lvalue_access.hpp"
#include "lumen/llvm_backend/operand.hpp"
#include "lumen/llvm_backend/q32_transform.hpp"
#include "lumen/llvm_backend/target_machine.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::llvm_backend {

namespace {

auto ReturnsThroughPointer(const ir::Function& func) -> bool {
  return func.result.has_value() && func.result->components > 1;
}

// Build the LLVM signature for an IR function (see lower.hpp).
auto DeclareFunction(Context& context, const ir::Function& func)
    -> llvm::Function* {
  auto* i32 = context.GetComponentType();
  auto* ptr = context.GetComponentPointerType();

  std::vector<llvm::Type*> params;
  if (ReturnsThroughPointer(func)) {
    params.push_back(ptr);
  }
  for (const auto& param : func.params) {
    const ir::Local& local = func.GetLocal(param.local);
    if (param.mode == ir::ParamMode::kIn) {
      params.insert(params.end(), local.type.components, i32);
    } else {
      params.push_back(ptr);
    }
  }

  llvm::Type* ret = context.GetBuilder().getVoidTy();
  if (func.result.has_value() && !ReturnsThroughPointer(func)) {
    ret = i32;
  }
  auto* fn_type = llvm::FunctionType::get(ret, params, false);
  auto* fn = llvm::Function::Create(
      fn_type, llvm::Function::ExternalLinkage, func.name,
      context.GetModule());
  fn->setDoesNotThrow();

  const auto& target = context.GetTarget();
  if (target.Kind() == target::TargetKind::kEmbeddedIsa) {
    fn->addFnAttr("target-features", target.FeatureString());
  }

  unsigned arg_index = 0;
  if (ReturnsThroughPointer(func)) {
    fn->getArg(arg_index)->setName("result");
    fn->addParamAttr(arg_index, llvm::Attribute::NoAlias);
    ++arg_index;
  }
  for (const auto& param : func.params) {
    const ir::Local& local = func.GetLocal(param.local);
    if (param.mode == ir::ParamMode::kIn) {
      for (uint8_t i = 0; i < local.type.components; ++i) {
        fn->getArg(arg_index++)->setName(
            local.type.components == 1 ? local.name
                                       : fmt::format("{}.{}", local.name, i));
      }
    } else {
      fn->getArg(arg_index++)->setName(local.name);
    }
  }
  return fn;
}

// Move incoming arguments into their locals.
void BindArguments(Context& context, const ir::Function& func) {
  llvm::Function& fn = context.GetLlvmFunction();
  auto& builder = context.GetBuilder();
  auto* i32 = context.GetComponentType();

  unsigned arg_index = 0;
  if (ReturnsThroughPointer(func)) {
    context.SetResultPointer(fn.getArg(arg_index++));
  }
  for (const auto& param : func.params) {
    const ir::Local& local = func.GetLocal(param.local);
    if (param.mode != ir::ParamMode::kIn) {
      context.BindPointerParam(param.local, fn.getArg(arg_index++));
      continue;
    }
    Lanes lanes;
    for (uint8_t i = 0; i < local.type.components; ++i) {
      llvm::Value* arg = fn.getArg(arg_index++);
      if (local.type.scalar == ir::ScalarKind::kBool) {
        arg = builder.CreateICmpNE(arg, llvm::ConstantInt::get(i32, 0));
      }
      lanes.push_back(arg);
    }
    WriteLValue(context, ir::SsaHeld{.local = param.local}, lanes);
  }
}

void StoreDestination(
    Context& context, const ir::Destination& dest, Lanes values) {
  std::visit(
      Overloaded{
          [&](ir::TempId temp) { context.SetTemp(temp, std::move(values)); },
          [&](const ir::LValue& lvalue) {
            WriteLValue(context, lvalue, values);
          },
      },
      dest);
}

void LowerInstruction(Context& context, const ir::Instruction& instruction) {
  std::visit(
      Overloaded{
          [&](const ir::Compute& compute) {
            StoreDestination(
                context, compute.dest, LowerCompute(context, compute));
          },
          [&](const ir::Assign& assign) {
            StoreDestination(
                context, assign.dest, LowerOperand(context, assign.source));
          },
          [&](const ir::HostLog& log) { EmitHostLog(context, log); },
      },
      instruction);
}

// Widen a lane to its register return/storage form (bool as i32 0/1).
auto ToStorage(Context& context, llvm::Value* lane) -> llvm::Value* {
  if (lane->getType()->isIntegerTy(1)) {
    return context.GetBuilder().CreateZExt(lane, context.GetComponentType());
  }
  return lane;
}

void LowerReturn(Context& context, const ir::Return& ret) {
  auto& builder = context.GetBuilder();
  if (!ret.value) {
    builder.CreateRetVoid();
    return;
  }
  Lanes lanes = LowerOperand(context, *ret.value);
  if (lanes.size() == 1) {
    builder.CreateRet(ToStorage(context, lanes[0]));
    return;
  }
  llvm::Value* result = context.GetResultPointer();
  if (result == nullptr) {
    throw common::InternalError(
        "LowerReturn", "vector result without a result pointer");
  }
  auto* i32 = context.GetComponentType();
  for (size_t i = 0; i < lanes.size(); ++i) {
    llvm::Value* slot = builder.CreateConstInBoundsGEP1_32(
        i32, result, static_cast<unsigned>(i));
    builder.CreateStore(ToStorage(context, lanes[i]), slot);
  }
  builder.CreateRetVoid();
}

void LowerTerminator(Context& context, const ir::Terminator& terminator) {
  auto& builder = context.GetBuilder();
  std::visit(
      Overloaded{
          [&](const ir::Jump& jump) {
            builder.CreateBr(context.GetBlock(jump.target));
          },
          [&](const ir::Branch& branch) {
            Lanes cond = LowerOperand(context, branch.condition);
            builder.CreateCondBr(
                cond[0], context.GetBlock(branch.then_target),
                context.GetBlock(branch.else_target));
          },
          [&](const ir::Return& ret) { LowerReturn(context, ret); },
      },
      terminator);
}

auto LowerFunction(Context& context, const ir::Function& func)
    -> llvm::Function* {
  llvm::Function* fn = DeclareFunction(context, func);
  context.BeginFunction(func, *fn);

  // Arguments are bound in the entry block before its own instructions.
  context.GetBuilder().SetInsertPoint(context.GetBlock(ir::BlockId{0}));
  BindArguments(context, func);

  // Dominators first, so every temp is bound before a block reads it.
  ir::DominatorTree dominators(func);
  for (ir::BlockId id : dominators.ReversePostOrder()) {
    const ir::BasicBlock& block = func.blocks[id.value];
    context.GetBuilder().SetInsertPoint(context.GetBlock(id));
    for (const auto& instruction : block.instructions) {
      LowerInstruction(context, instruction);
    }
    LowerTerminator(context, block.terminator);
  }
  for (uint32_t b = 0; b < func.blocks.size(); ++b) {
    if (!dominators.IsReachable(ir::BlockId{b})) {
      context.GetBuilder().SetInsertPoint(context.GetBlock(ir::BlockId{b}));
      context.GetBuilder().CreateUnreachable();
    }
  }
  context.EndFunction();

  std::string errors;
  llvm::raw_string_ostream stream(errors);
  if (llvm::verifyFunction(*fn, &stream)) {
    throw common::InternalError(
        "LowerFunction",
        fmt::format("invalid LLVM IR for '{}': {}", func.name, stream.str()));
  }
  return fn;
}

auto ToOptimizationLevel(OptLevel level) -> llvm::OptimizationLevel {
  switch (level) {
    case OptLevel::kO0:
      return llvm::OptimizationLevel::O0;
    case OptLevel::kO1:
      return llvm::OptimizationLevel::O1;
    case OptLevel::kO2:
      return llvm::OptimizationLevel::O2;
    case OptLevel::kO3:
      return llvm::OptimizationLevel::O3;
  }
  throw common::InternalError("ToOptimizationLevel", "unknown OptLevel");
}

// mem2reg always runs so register-held locals become SSA values. The full
// pipeline is reserved for targets with a native multiply, since it may
// introduce mul/div where the source had none.
void OptimizeModule(
    llvm::Module& module, llvm::TargetMachine& machine,
    const target::TargetDescriptor& target, OptLevel level) {
  llvm::LoopAnalysisManager lam;
  llvm::FunctionAnalysisManager fam;
  llvm::CGSCCAnalysisManager cgam;
  llvm::ModuleAnalysisManager mam;

  llvm::PassBuilder pb(&machine);
  pb.registerModuleAnalyses(mam);
  pb.registerCGSCCAnalyses(cgam);
  pb.registerFunctionAnalyses(fam);
  pb.registerLoopAnalyses(lam);
  pb.crossRegisterProxies(lam, fam, cgam, mam);

  if (level == OptLevel::kO0 || !target.HasWideMultiply()) {
    llvm::FunctionPassManager fpm;
    fpm.addPass(llvm::PromotePass());
    llvm::ModulePassManager mpm;
    mpm.addPass(llvm::createModuleToFunctionPassAdaptor(std::move(fpm)));
    mpm.run(module, mam);
    return;
  }
  llvm::ModulePassManager mpm =
      pb.buildPerModuleDefaultPipeline(ToOptimizationLevel(level));
  mpm.run(module, mam);
}

}  // namespace

auto LowerToLlvm(
    const std::vector<ir::Function>& functions,
    const target::TargetDescriptor& target,
    const builtins::BuiltinRegistry& registry, const CompileOptions& options)
    -> Result<LoweringResult> {
  for (const auto& func : functions) {
    if (auto verified = ir::VerifyFunction(func); !verified) {
      return std::unexpected(std::move(verified).error().WithNote(
          fmt::format("in function '{}'", func.name)));
    }
  }

  auto machine = CreateTargetMachine(target, options.opt_level);
  if (!machine) {
    return std::unexpected(std::move(machine).error());
  }

  auto llvm_ctx = std::make_unique<llvm::LLVMContext>();
  auto module = std::make_unique<llvm::Module>("lumen_module", *llvm_ctx);

  // DataLayout must be set before any IR that depends on type sizes.
  ConfigureModule(*module, **machine);

  Context context(
      target, registry, options, std::move(llvm_ctx), std::move(module));

  try {
    for (const auto& func : functions) {
      llvm::Function* fn = LowerFunction(context, func);
      if (auto valid = ValidateFunction(*fn, target, registry); !valid) {
        return std::unexpected(std::move(valid).error());
      }
      spdlog::debug(
          "lowered '{}' for {} ({} blocks)", func.name, target.Name(),
          func.blocks.size());
    }
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }

  OptimizeModule(context.GetModule(), **machine, target, options.opt_level);

  // The optimizer may form calls or intrinsics (memset from a store loop)
  // that the per-function check never saw.
  if (target.Kind() != target::TargetKind::kHostExecution) {
    auto valid = ValidateModule(context.GetModule(), target, registry);
    if (!valid) {
      return std::unexpected(std::move(valid).error().WithNote(fmt::format(
          "introduced by optimization at -O{}",
          static_cast<int>(options.opt_level))));
    }
  }

  if (options.dump_ir) {
    context.GetModule().print(llvm::errs(), nullptr);
  }

  auto [result_ctx, result_mod] = context.TakeOwnership();
  return LoweringResult{
      .context = std::move(result_ctx),
      .module = std::move(result_mod),
      .target = target,
  };
}

auto DumpLlvmIr(const LoweringResult& result) -> std::string {
  std::string ir;
  llvm::raw_string_ostream stream(ir);
  result.module->print(stream, nullptr);
  return ir;
}

}  // namespace lumen::llvm_backend
