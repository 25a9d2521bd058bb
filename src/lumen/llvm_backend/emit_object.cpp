#include "lumen/llvm_backend/emit_object.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/IR/LegacyPassManager.h>
#include <llvm/Object/ObjectFile.h>
#include <llvm/Object/SymbolicFile.h>
#include <llvm/Support/CodeGen.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/Target/TargetMachine.h>
#include <spdlog/spdlog.h>

#include "lumen/builtins/external_symbols.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/llvm_backend/target_machine.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::llvm_backend {

namespace {

// Fill the symbol lists from the emitted object.
auto ScanSymbols(ObjectCode& object) -> Result<void> {
  llvm::MemoryBufferRef buffer(
      llvm::StringRef(
          reinterpret_cast<const char*>(object.bytes.data()),
          object.bytes.size()),
      "lumen_object");
  auto parsed = llvm::object::ObjectFile::createObjectFile(buffer);
  if (!parsed) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "failed to read emitted object: {}",
        llvm::toString(parsed.takeError()))));
  }

  for (const llvm::object::SymbolRef& symbol : (*parsed)->symbols()) {
    auto flags = symbol.getFlags();
    auto name = symbol.getName();
    auto type = symbol.getType();
    if (!flags || !name || !type) {
      llvm::consumeError(flags.takeError());
      llvm::consumeError(name.takeError());
      llvm::consumeError(type.takeError());
      return std::unexpected(
          Diagnostic::HostError("emitted object has an unreadable symbol"));
    }
    if (name->empty()) {
      continue;
    }
    if ((*flags & llvm::object::SymbolRef::SF_Undefined) != 0) {
      object.undefined_symbols.push_back(name->str());
    } else if (
        (*flags & llvm::object::SymbolRef::SF_Global) != 0 &&
        *type == llvm::object::SymbolRef::ST_Function) {
      object.defined_functions.push_back(name->str());
    }
  }
  std::ranges::sort(object.undefined_symbols);
  std::ranges::sort(object.defined_functions);
  return {};
}

}  // namespace

auto EmitObject(LoweringResult& result, OptLevel opt_level)
    -> Result<ObjectCode> {
  if (result.module == nullptr) {
    throw common::InternalError("EmitObject", "module already consumed");
  }
  auto machine = CreateTargetMachine(result.target, opt_level);
  if (!machine) {
    return std::unexpected(std::move(machine).error());
  }
  if (result.module->getDataLayout() != (*machine)->createDataLayout()) {
    throw common::InternalError(
        "EmitObject", "module was lowered for a different target");
  }

  llvm::SmallVector<char, 0> buffer;
  {
    llvm::raw_svector_ostream stream(buffer);
    llvm::legacy::PassManager passes;
    if ((*machine)->addPassesToEmitFile(
            passes, stream, nullptr, llvm::CGFT_ObjectFile)) {
      return std::unexpected(Diagnostic::HostError(fmt::format(
          "target {} cannot emit object files", result.target.Name())));
    }
    passes.run(*result.module);
  }
  // Codegen passes leave the module unfit for reuse.
  result.module.reset();
  result.context.reset();

  ObjectCode object;
  object.bytes.assign(buffer.begin(), buffer.end());
  if (auto scanned = ScanSymbols(object); !scanned) {
    return std::unexpected(std::move(scanned).error());
  }
  spdlog::debug(
      "emitted {} bytes for {} ({} functions, {} undefined symbols)",
      object.bytes.size(), result.target.Name(),
      object.defined_functions.size(), object.undefined_symbols.size());
  return object;
}

auto WriteObjectFile(
    const ObjectCode& object, const std::filesystem::path& path)
    -> Result<void> {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return std::unexpected(Diagnostic::HostError(
        fmt::format("cannot open '{}' for writing", path.string())));
  }
  out.write(
      reinterpret_cast<const char*>(object.bytes.data()),
      static_cast<std::streamsize>(object.bytes.size()));
  if (!out) {
    return std::unexpected(Diagnostic::HostError(
        fmt::format("failed to write '{}'", path.string())));
  }
  return {};
}

auto VerifyLinkedBuiltins(
    const ObjectCode& object, const builtins::BuiltinRegistry& registry,
    target::TargetMode mode, const builtins::ExternalSymbolTable& supplied)
    -> Result<void> {
  for (const std::string& symbol : object.undefined_symbols) {
    const builtins::BuiltinEntry* entry = registry.FindBySymbol(symbol, mode);
    if (entry == nullptr ||
        !std::holds_alternative<builtins::ExternalImpl>(entry->impl)) {
      return std::unexpected(Diagnostic::UnresolvedBuiltin(
          symbol, std::string(target::ToString(mode)),
          fmt::format(
              "object references '{}', which is not an external builtin",
              symbol)));
    }
    if (!supplied.IsProvided(symbol)) {
      return std::unexpected(
          Diagnostic::UnlinkedExternalSymbol(
              symbol,
              fmt::format(
                  "external builtin '{}' has not been supplied", symbol))
              .WithNote(fmt::format(
                  "'{}' takes {} argument(s)",
                  builtins::ToString(entry->id), entry->arity)));
    }
  }
  return {};
}

}  // namespace lumen::llvm_backend
