#pragma once

#include <memory>
#include <string>
#include <vector>

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/llvm_backend/context.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::llvm_backend {

struct LoweringResult {
  std::unique_ptr<llvm::LLVMContext> context;
  std::unique_ptr<llvm::Module> module;
  target::TargetDescriptor target;
};

// Calling convention of a lowered function (all values i32, Float as
// Q16.16, Bool as 0/1):
//
//   result          scalar -> returned in a register
//                   vector -> caller-supplied i32* (sret), return void
//   In param        one i32 argument per component
//   Out/InOut param i32* to the caller's storage
//
// Each function is verified, lowered, checked by the ISA validator and
// optimized. For embedded targets the optimized module is validated
// again. Nothing is returned unless every function passes.
auto LowerToLlvm(
    const std::vector<ir::Function>& functions,
    const target::TargetDescriptor& target,
    const builtins::BuiltinRegistry& registry, const CompileOptions& options)
    -> Result<LoweringResult>;

// Dump LLVM IR to string (for debugging)
auto DumpLlvmIr(const LoweringResult& result) -> std::string;

}  // namespace lumen::llvm_backend
