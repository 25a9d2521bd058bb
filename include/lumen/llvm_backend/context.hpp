#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/opt_level.hpp"
#include "lumen/fixed/q32.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::llvm_backend {

struct CompileOptions {
  fixed::ArithMode arith_mode = fixed::ArithMode::kPrecise;
  OptLevel opt_level = OptLevel::kO2;
  bool dump_ir = false;
};

// Component values of an IR value in flight. Float, Int and Uint lanes are
// i32 (Float holding Q16.16); Bool lanes are i1.
using Lanes = llvm::SmallVector<llvm::Value*, 4>;

// Shared state for lowering abstract IR functions into one LLVM module.
class Context {
 public:
  Context(
      const target::TargetDescriptor& target,
      const builtins::BuiltinRegistry& registry, CompileOptions options,
      std::unique_ptr<llvm::LLVMContext> llvm_ctx,
      std::unique_ptr<llvm::Module> module);

  [[nodiscard]] auto GetLlvmContext() -> llvm::LLVMContext& {
    return *llvm_context_;
  }
  [[nodiscard]] auto GetModule() -> llvm::Module& {
    return *llvm_module_;
  }
  [[nodiscard]] auto GetBuilder() -> llvm::IRBuilder<>& {
    return builder_;
  }
  [[nodiscard]] auto GetTarget() const -> const target::TargetDescriptor& {
    return target_;
  }
  [[nodiscard]] auto GetRegistry() const -> const builtins::BuiltinRegistry& {
    return registry_;
  }
  [[nodiscard]] auto GetOptions() const -> const CompileOptions& {
    return options_;
  }

  // Storage type of every component (i32).
  [[nodiscard]] auto GetComponentType() -> llvm::IntegerType*;
  // Register type of one lane of the given kind (i32, or i1 for bool).
  [[nodiscard]] auto GetLaneType(ir::ScalarKind kind) -> llvm::Type*;
  [[nodiscard]] auto GetComponentPointerType() -> llvm::PointerType*;

  // Function scope management. BeginFunction creates one LLVM block per IR
  // block and sets up the alloca insertion point in the entry block.
  void BeginFunction(const ir::Function& ir_func, llvm::Function& func);
  void EndFunction();

  [[nodiscard]] auto GetIrFunction() const -> const ir::Function&;
  [[nodiscard]] auto GetLlvmFunction() -> llvm::Function&;
  [[nodiscard]] auto GetBlock(ir::BlockId id) -> llvm::BasicBlock*;

  // One entry-block alloca per component of a register-held local. Reads and
  // writes go through these; mem2reg turns them back into SSA values.
  auto GetRegisterSlots(ir::LocalId id)
      -> const std::vector<llvm::AllocaInst*>&;

  // Base pointer (i32*) of a memory-backed local: an entry-block array for
  // kStack, the bound argument for kPointerParam.
  auto GetMemoryBase(ir::LocalId id) -> llvm::Value*;
  void BindPointerParam(ir::LocalId id, llvm::Value* pointer);

  // Caller-supplied storage for a multi-component result.
  void SetResultPointer(llvm::Value* pointer) {
    result_pointer_ = pointer;
  }
  [[nodiscard]] auto GetResultPointer() const -> llvm::Value* {
    return result_pointer_;
  }

  void SetTemp(ir::TempId id, Lanes values);
  [[nodiscard]] auto GetTemp(ir::TempId id) const -> const Lanes&;

  // Declaration of a builtin's symbol in this module, created on first use
  // with the signature of the builtin's ABI.
  auto GetBuiltinFunction(builtins::BuiltinId id, std::string_view symbol)
      -> llvm::Function*;

  // Entry-block scratch for builtins that write their result through a
  // pointer.
  auto CreateResultBuffer(uint8_t components, std::string_view name)
      -> llvm::Value*;

  auto TakeOwnership() -> std::pair<
      std::unique_ptr<llvm::LLVMContext>, std::unique_ptr<llvm::Module>>;

 private:
  auto CreateEntryAlloca(
      llvm::Type* type, llvm::Value* count, std::string_view name)
      -> llvm::AllocaInst*;

  const target::TargetDescriptor& target_;
  const builtins::BuiltinRegistry& registry_;
  CompileOptions options_;

  std::unique_ptr<llvm::LLVMContext> llvm_context_;
  std::unique_ptr<llvm::Module> llvm_module_;
  llvm::IRBuilder<> builder_;

  // Per-function state
  const ir::Function* ir_function_ = nullptr;
  llvm::Function* current_function_ = nullptr;
  std::unique_ptr<llvm::IRBuilder<>> alloca_builder_;
  std::vector<llvm::BasicBlock*> blocks_;
  absl::flat_hash_map<uint32_t, std::vector<llvm::AllocaInst*>>
      register_slots_;
  absl::flat_hash_map<uint32_t, llvm::Value*> memory_bases_;
  std::vector<std::optional<Lanes>> temps_;
  llvm::Value* result_pointer_ = nullptr;
};

}  // namespace lumen::llvm_backend
