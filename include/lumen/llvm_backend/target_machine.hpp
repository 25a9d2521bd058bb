#pragma once

#include <memory>

#include <llvm/IR/Module.h>
#include <llvm/Target/TargetMachine.h>

#include "lumen/common/diagnostic.hpp"
#include "lumen/common/opt_level.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::llvm_backend {

// Register the native and RISC-V targets with LLVM (once per process).
void InitializeLlvmTargets();

// Host: the process triple and CPU. Embedded: riscv32 with the descriptor's
// extensions as subtarget features and a PIC or static relocation model.
auto CreateTargetMachine(
    const target::TargetDescriptor& target, OptLevel opt_level)
    -> Result<std::unique_ptr<llvm::TargetMachine>>;

// Set triple and DataLayout before any IR is generated.
void ConfigureModule(llvm::Module& module, llvm::TargetMachine& machine);

}  // namespace lumen::llvm_backend
