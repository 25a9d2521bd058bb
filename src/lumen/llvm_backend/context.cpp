#include "lumen/llvm_backend/context.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/DataLayout.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/Type.h>
#include <llvm/Support/Casting.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/ir/function.hpp"

namespace lumen::llvm_backend {

Context::Context(
    const target::TargetDescriptor& target,
    const builtins::BuiltinRegistry& registry, CompileOptions options,
    std::unique_ptr<llvm::LLVMContext> llvm_ctx,
    std::unique_ptr<llvm::Module> module)
    : target_(target),
      registry_(registry),
      options_(options),
      llvm_context_(std::move(llvm_ctx)),
      llvm_module_(std::move(module)),
      builder_(*llvm_context_) {
}

auto Context::GetComponentType() -> llvm::IntegerType* {
  return llvm::Type::getInt32Ty(*llvm_context_);
}

auto Context::GetLaneType(ir::ScalarKind kind) -> llvm::Type* {
  if (kind == ir::ScalarKind::kBool) {
    return llvm::Type::getInt1Ty(*llvm_context_);
  }
  return GetComponentType();
}

auto Context::GetComponentPointerType() -> llvm::PointerType* {
  return GetComponentType()->getPointerTo();
}

void Context::BeginFunction(const ir::Function& ir_func, llvm::Function& func) {
  ir_function_ = &ir_func;
  current_function_ = &func;

  blocks_.clear();
  blocks_.reserve(ir_func.blocks.size());
  for (size_t i = 0; i < ir_func.blocks.size(); ++i) {
    blocks_.push_back(llvm::BasicBlock::Create(
        *llvm_context_, i == 0 ? "entry" : fmt::format("bb{}", i), &func));
  }
  temps_.assign(ir_func.temps.size(), std::nullopt);

  // Allocas are grouped at the top of the entry block so they dominate all
  // uses and stay promotable.
  llvm::BasicBlock* entry = blocks_.front();
  alloca_builder_ =
      std::make_unique<llvm::IRBuilder<>>(entry, entry->begin());
  builder_.SetInsertPoint(entry);
}

void Context::EndFunction() {
  ir_function_ = nullptr;
  current_function_ = nullptr;
  alloca_builder_.reset();
  blocks_.clear();
  register_slots_.clear();
  memory_bases_.clear();
  temps_.clear();
  result_pointer_ = nullptr;
}

auto Context::GetIrFunction() const -> const ir::Function& {
  if (ir_function_ == nullptr) {
    throw common::InternalError("GetIrFunction", "no function in scope");
  }
  return *ir_function_;
}

auto Context::GetLlvmFunction() -> llvm::Function& {
  if (current_function_ == nullptr) {
    throw common::InternalError("GetLlvmFunction", "no function in scope");
  }
  return *current_function_;
}

auto Context::GetBlock(ir::BlockId id) -> llvm::BasicBlock* {
  if (id.value >= blocks_.size()) {
    throw common::InternalError(
        "GetBlock", fmt::format("block {} out of range", id.value));
  }
  return blocks_[id.value];
}

auto Context::CreateEntryAlloca(
    llvm::Type* type, llvm::Value* count, std::string_view name)
    -> llvm::AllocaInst* {
  if (alloca_builder_ == nullptr) {
    throw common::InternalError(
        "CreateEntryAlloca",
        "must call BeginFunction before creating local storage");
  }
  llvm::BasicBlock* entry = blocks_.front();
  auto insert_point = entry->begin();
  while (insert_point != entry->end() &&
         llvm::isa<llvm::AllocaInst>(&*insert_point)) {
    ++insert_point;
  }
  alloca_builder_->SetInsertPoint(entry, insert_point);
  return alloca_builder_->CreateAlloca(
      type, count, llvm::StringRef(name.data(), name.size()));
}

auto Context::GetRegisterSlots(ir::LocalId id)
    -> const std::vector<llvm::AllocaInst*>& {
  auto it = register_slots_.find(id.value);
  if (it != register_slots_.end()) {
    return it->second;
  }
  const ir::Local& local = GetIrFunction().GetLocal(id);
  if (local.storage != ir::Storage::kRegister) {
    throw common::InternalError(
        "GetRegisterSlots",
        fmt::format("local '{}' is not register-held", local.name));
  }
  std::vector<llvm::AllocaInst*> slots;
  slots.reserve(local.type.components);
  for (uint8_t i = 0; i < local.type.components; ++i) {
    slots.push_back(CreateEntryAlloca(
        GetLaneType(local.type.scalar), nullptr,
        fmt::format("{}.{}", local.name, i)));
  }
  return register_slots_.emplace(id.value, std::move(slots)).first->second;
}

auto Context::GetMemoryBase(ir::LocalId id) -> llvm::Value* {
  auto it = memory_bases_.find(id.value);
  if (it != memory_bases_.end()) {
    return it->second;
  }
  const ir::Local& local = GetIrFunction().GetLocal(id);
  if (local.storage == ir::Storage::kPointerParam) {
    throw common::InternalError(
        "GetMemoryBase",
        fmt::format("pointer parameter '{}' was never bound", local.name));
  }
  if (local.storage != ir::Storage::kStack) {
    throw common::InternalError(
        "GetMemoryBase",
        fmt::format("local '{}' is not memory-backed", local.name));
  }
  auto* count = llvm::ConstantInt::get(
      GetComponentType(), local.type.TotalComponents());
  llvm::Value* base = CreateEntryAlloca(GetComponentType(), count, local.name);
  memory_bases_.emplace(id.value, base);
  return base;
}

void Context::BindPointerParam(ir::LocalId id, llvm::Value* pointer) {
  memory_bases_[id.value] = pointer;
}

void Context::SetTemp(ir::TempId id, Lanes values) {
  if (id.value >= temps_.size()) {
    throw common::InternalError(
        "SetTemp", fmt::format("temp t{} out of range", id.value));
  }
  temps_[id.value] = std::move(values);
}

auto Context::GetTemp(ir::TempId id) const -> const Lanes& {
  if (id.value >= temps_.size() || !temps_[id.value]) {
    throw common::InternalError(
        "GetTemp", fmt::format("temp t{} used before definition", id.value));
  }
  return *temps_[id.value];
}

auto Context::GetBuiltinFunction(
    builtins::BuiltinId id, std::string_view symbol) -> llvm::Function* {
  llvm::StringRef name(symbol.data(), symbol.size());
  if (auto* existing = llvm_module_->getFunction(name)) {
    return existing;
  }

  auto* i32 = GetComponentType();
  llvm::FunctionType* type = nullptr;
  const auto& info = builtins::GetBuiltinInfo(id);
  switch (info.abi) {
    case builtins::BuiltinAbi::kFixedUnary:
      type = llvm::FunctionType::get(i32, {i32}, false);
      break;
    case builtins::BuiltinAbi::kFixedBinary:
      type = llvm::FunctionType::get(i32, {i32, i32}, false);
      break;
    case builtins::BuiltinAbi::kFixedTernary:
      type = llvm::FunctionType::get(i32, {i32, i32, i32}, false);
      break;
    case builtins::BuiltinAbi::kHostLog: {
      auto* bytes = llvm::Type::getInt8PtrTy(*llvm_context_);
      auto* size = llvm_module_->getDataLayout().getIntPtrType(*llvm_context_);
      type = llvm::FunctionType::get(
          llvm::Type::getVoidTy(*llvm_context_),
          {llvm::Type::getInt8Ty(*llvm_context_), bytes, size, bytes, size},
          false);
      break;
    }
    case builtins::BuiltinAbi::kScalar:
      type = llvm::FunctionType::get(
          i32, std::vector<llvm::Type*>(info.arity, i32), false);
      break;
    case builtins::BuiltinAbi::kResultPointer: {
      std::vector<llvm::Type*> params(info.arity, i32);
      params.front() = llvm::PointerType::getUnqual(i32);
      type = llvm::FunctionType::get(
          llvm::Type::getVoidTy(*llvm_context_), params, false);
      break;
    }
    case builtins::BuiltinAbi::kGradientOut: {
      std::vector<llvm::Type*> params(info.arity, i32);
      params[info.arity - 2] = llvm::PointerType::getUnqual(i32);
      type = llvm::FunctionType::get(i32, params, false);
      break;
    }
  }
  if (type == nullptr) {
    throw common::InternalError("GetBuiltinFunction", "unknown builtin ABI");
  }

  auto* func = llvm::Function::Create(
      type, llvm::Function::ExternalLinkage, name, llvm_module_.get());
  func->setDoesNotThrow();
  switch (info.abi) {
    case builtins::BuiltinAbi::kHostLog:
      break;
    case builtins::BuiltinAbi::kResultPointer:
    case builtins::BuiltinAbi::kGradientOut:
      func->setOnlyAccessesArgMemory();
      break;
    default:
      func->setDoesNotAccessMemory();
      break;
  }
  return func;
}

auto Context::CreateResultBuffer(uint8_t components, std::string_view name)
    -> llvm::Value* {
  auto* count = llvm::ConstantInt::get(GetComponentType(), components);
  return CreateEntryAlloca(GetComponentType(), count, name);
}

auto Context::TakeOwnership() -> std::pair<
    std::unique_ptr<llvm::LLVMContext>, std::unique_ptr<llvm::Module>> {
  return {std::move(llvm_context_), std::move(llvm_module_)};
}

}  // namespace lumen::llvm_backend
