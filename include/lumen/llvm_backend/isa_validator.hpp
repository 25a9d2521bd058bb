#pragma once

#include <llvm/IR/Function.h>
#include <llvm/IR/Module.h>

#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::llvm_backend {

// Checks generated code against the capabilities of the target before
// anything is emitted. Fails with UnsupportedInstruction naming the first
// offending instruction and the extension that would make it legal, or
// with UnresolvedBuiltin for calls to symbols the registry cannot bind on
// this target.
//
// Rules:
//   mul/div/rem            -> requires M
//   atomics and fences     -> requires A
//   f32 / f64 values       -> requires F / D
//   function features      -> every "+x" must be in the extension set
//   integers wider than MaxIntegerWidth() are never legal
auto ValidateFunction(
    const llvm::Function& func, const target::TargetDescriptor& target,
    const builtins::BuiltinRegistry& registry) -> Result<void>;

// ValidateFunction over every defined function of the module.
auto ValidateModule(
    const llvm::Module& module, const target::TargetDescriptor& target,
    const builtins::BuiltinRegistry& registry) -> Result<void>;

}  // namespace lumen::llvm_backend
