#include "lumen/llvm_backend/target_machine.hpp"

#include <expected>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/core.h>
#include <llvm/ADT/Optional.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/MC/SubtargetFeature.h>
#include <llvm/MC/TargetRegistry.h>
#include <llvm/Support/CodeGen.h>
#include <llvm/Support/Host.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/Target/TargetOptions.h>
#include <spdlog/spdlog.h>

#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/opt_level.hpp"
#include "lumen/target/target_descriptor.hpp"

extern "C" {
void LLVMInitializeRISCVTargetInfo();
void LLVMInitializeRISCVTarget();
void LLVMInitializeRISCVTargetMC();
void LLVMInitializeRISCVAsmPrinter();
}

namespace lumen::llvm_backend {

namespace {

constexpr const char* kEmbeddedTriple = "riscv32-unknown-elf";
constexpr const char* kEmbeddedCpu = "generic-rv32";

auto ToCodeGenOpt(OptLevel level) -> llvm::CodeGenOpt::Level {
  switch (level) {
    case OptLevel::kO0:
      return llvm::CodeGenOpt::None;
    case OptLevel::kO1:
      return llvm::CodeGenOpt::Less;
    case OptLevel::kO2:
      return llvm::CodeGenOpt::Default;
    case OptLevel::kO3:
      return llvm::CodeGenOpt::Aggressive;
  }
  throw common::InternalError("ToCodeGenOpt", "unknown OptLevel");
}

auto HostFeatures() -> std::string {
  llvm::StringMap<bool> feature_map;
  llvm::SubtargetFeatures features;
  if (llvm::sys::getHostCPUFeatures(feature_map)) {
    for (const auto& kv : feature_map) {
      if (kv.getValue()) {
        features.AddFeature(kv.getKey().str());
      }
    }
  }
  return features.getString();
}

}  // namespace

void InitializeLlvmTargets() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    llvm::InitializeNativeTarget();
    llvm::InitializeNativeTargetAsmPrinter();
    llvm::InitializeNativeTargetAsmParser();
    LLVMInitializeRISCVTargetInfo();
    LLVMInitializeRISCVTarget();
    LLVMInitializeRISCVTargetMC();
    LLVMInitializeRISCVAsmPrinter();
  });
}

auto CreateTargetMachine(
    const target::TargetDescriptor& target, OptLevel opt_level)
    -> Result<std::unique_ptr<llvm::TargetMachine>> {
  InitializeLlvmTargets();

  bool host = target.Kind() == target::TargetKind::kHostExecution;
  std::string triple = host ? llvm::sys::getProcessTriple() : kEmbeddedTriple;
  std::string cpu = host ? llvm::sys::getHostCPUName().str() : kEmbeddedCpu;
  std::string features = host ? HostFeatures() : target.FeatureString();

  std::string error;
  const llvm::Target* llvm_target =
      llvm::TargetRegistry::lookupTarget(triple, error);
  if (llvm_target == nullptr) {
    return std::unexpected(Diagnostic::HostError(
        fmt::format("failed to look up target '{}': {}", triple, error)));
  }

  llvm::Optional<llvm::Reloc::Model> reloc;
  if (!host) {
    reloc = target.IsPositionIndependent() ? llvm::Reloc::PIC_
                                           : llvm::Reloc::Static;
  }
  std::unique_ptr<llvm::TargetMachine> machine(
      llvm_target->createTargetMachine(
          triple, cpu, features, llvm::TargetOptions(), reloc, llvm::None,
          ToCodeGenOpt(opt_level)));
  if (machine == nullptr) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "failed to create a target machine for '{}' ({})", triple,
        target.Name())));
  }
  spdlog::debug(
      "target machine {} cpu={} features='{}'", triple, cpu, features);
  return machine;
}

void ConfigureModule(llvm::Module& module, llvm::TargetMachine& machine) {
  module.setTargetTriple(machine.getTargetTriple().str());
  module.setDataLayout(machine.createDataLayout());
}

}  // namespace lumen::llvm_backend
