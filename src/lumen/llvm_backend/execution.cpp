#include "lumen/llvm_backend/execution.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <llvm/ExecutionEngine/JITSymbol.h>
#include <llvm/ExecutionEngine/Orc/Core.h>
#include <llvm/ExecutionEngine/Orc/ExecutionUtils.h>
#include <llvm/ExecutionEngine/Orc/JITTargetMachineBuilder.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Module.h>
#include <llvm/Support/CodeGen.h>
#include <llvm/Support/Error.h>
#include <spdlog/spdlog.h>

#include "lumen/builtins/external_symbols.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/overloaded.hpp"
#include "lumen/llvm_backend/target_machine.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::llvm_backend {

struct JitSession::Impl {
  std::unique_ptr<llvm::orc::LLJIT> jit;
};

JitSession::JitSession() = default;
JitSession::~JitSession() = default;
JitSession::JitSession(JitSession&&) noexcept = default;
auto JitSession::operator=(JitSession&&) noexcept -> JitSession& = default;

auto JitSession::Lookup(std::string_view name) const -> Result<void*> {
  if (impl_ == nullptr || impl_->jit == nullptr) {
    throw common::InternalError("JitSession::Lookup", "empty session");
  }
  auto symbol = impl_->jit->lookup(llvm::StringRef(name.data(), name.size()));
  if (!symbol) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "failed to look up '{}': {}", name,
        llvm::toString(symbol.takeError()))));
  }
  return llvm::jitTargetAddressToPointer<void*>(symbol->getAddress());
}

namespace {

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

// Address for one declared builtin symbol, or the reason it has none.
auto BindBuiltin(
    std::string_view symbol, const builtins::BuiltinRegistry& registry,
    target::TargetMode mode, const builtins::ExternalSymbolTable* supplied)
    -> Result<void*> {
  const builtins::BuiltinEntry* entry = registry.FindBySymbol(symbol, mode);
  if (entry == nullptr) {
    return std::unexpected(Diagnostic::UnresolvedBuiltin(
        std::string(symbol), std::string(target::ToString(mode)),
        fmt::format("no builtin is registered under '{}'", symbol)));
  }
  return std::visit(
      Overloaded{
          [](const builtins::LocalImpl& local) -> Result<void*> {
            return local.address;
          },
          [&](const builtins::ExternalImpl& external) -> Result<void*> {
            if (supplied == nullptr) {
              return std::unexpected(Diagnostic::UnlinkedExternalSymbol(
                  std::string(external.symbol),
                  fmt::format(
                      "external builtin '{}' has not been supplied",
                      external.symbol)));
            }
            return supplied->Address(external.symbol);
          },
      },
      entry->impl);
}

}  // namespace

auto CompileJit(
    LoweringResult& result, const builtins::BuiltinRegistry& registry,
    const builtins::ExternalSymbolTable* supplied, OptLevel opt_level)
    -> Result<JitSession> {
  if (result.target.Kind() != target::TargetKind::kHostExecution) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "cannot run code for {} in-process; emit an object instead",
        result.target.Name())));
  }
  if (result.module == nullptr) {
    throw common::InternalError("CompileJit", "module already consumed");
  }

  InitializeLlvmTargets();

  auto jtmb = llvm::orc::JITTargetMachineBuilder::detectHost();
  if (!jtmb) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "failed to detect host: {}", llvm::toString(jtmb.takeError()))));
  }
  jtmb->setCodeGenOptLevel(ToCodeGenOpt(opt_level));
  auto jit = llvm::orc::LLJITBuilder()
                 .setJITTargetMachineBuilder(std::move(*jtmb))
                 .create();
  if (!jit) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "failed to create JIT: {}", llvm::toString(jit.takeError()))));
  }

  // DataLayout is fixed during lowering; mutating it here would invalidate
  // layout-dependent constants already in the IR.
  const auto& module_dl = result.module->getDataLayout();
  const auto& jit_dl = (*jit)->getDataLayout();
  if (module_dl != jit_dl) {
    throw common::InternalError(
        "CompileJit", fmt::format(
                          "module DataLayout mismatch: module='{}', jit='{}'",
                          module_dl.getStringRepresentation(),
                          jit_dl.getStringRepresentation()));
  }

  // Bind every builtin the module declares before anything is materialized,
  // so an unlinked symbol fails here instead of at first call.
  auto mode = result.target.Mode();
  llvm::orc::SymbolMap builtins_map;
  for (const llvm::Function& fn : *result.module) {
    if (!fn.isDeclaration() || fn.isIntrinsic()) {
      continue;
    }
    std::string_view symbol(fn.getName().data(), fn.getName().size());
    auto address = BindBuiltin(symbol, registry, mode, supplied);
    if (!address) {
      return std::unexpected(std::move(address).error());
    }
    builtins_map[(*jit)->mangleAndIntern(fn.getName())] =
        llvm::JITEvaluatedSymbol(
            llvm::pointerToJITTargetAddress(*address),
            llvm::JITSymbolFlags::Exported);
    spdlog::trace("bound builtin {} -> {}", symbol, *address);
  }

  auto& dylib = (*jit)->getMainJITDylib();
  if (!builtins_map.empty()) {
    auto err = dylib.define(llvm::orc::absoluteSymbols(builtins_map));
    if (err) {
      return std::unexpected(Diagnostic::HostError(fmt::format(
          "failed to define builtin symbols: {}",
          llvm::toString(std::move(err)))));
    }
  }

  // Library calls the optimizer introduces (memset, memcpy) come from the
  // host process.
  auto gen = llvm::orc::DynamicLibrarySearchGenerator::GetForCurrentProcess(
      jit_dl.getGlobalPrefix());
  if (!gen) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "failed to get host process symbols: {}",
        llvm::toString(gen.takeError()))));
  }
  dylib.addGenerator(std::move(*gen));

  llvm::orc::ThreadSafeContext tsc(std::move(result.context));
  auto tsm = llvm::orc::ThreadSafeModule(std::move(result.module), tsc);
  if (auto err = (*jit)->addIRModule(std::move(tsm))) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "failed to add module: {}", llvm::toString(std::move(err)))));
  }
  spdlog::debug("JIT session ready ({} builtins bound)", builtins_map.size());

  JitSession session;
  session.impl_ = std::make_unique<JitSession::Impl>();
  session.impl_->jit = std::move(*jit);
  return session;
}

}  // namespace lumen::llvm_backend
