#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "lumen/builtins/external_symbols.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/common/opt_level.hpp"
#include "lumen/llvm_backend/lower.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::llvm_backend {

// Relocatable object for the target, kept in memory.
struct ObjectCode {
  std::vector<uint8_t> bytes;
  // Symbols the object references but does not define, sorted.
  std::vector<std::string> undefined_symbols;
  // Global functions the object defines, sorted.
  std::vector<std::string> defined_functions;
};

// Emit the lowered module as an ELF object for its target. The module and
// its context are released once code generation has run; a second call on
// the same result is an InternalError.
auto EmitObject(LoweringResult& result, OptLevel opt_level = OptLevel::kO2)
    -> Result<ObjectCode>;

auto WriteObjectFile(
    const ObjectCode& object, const std::filesystem::path& path)
    -> Result<void>;

// Checks that the object will link on a target of the given mode: every
// undefined symbol must be a registered External builtin (UnresolvedBuiltin
// otherwise) that the embedding application has supplied
// (UnlinkedExternalSymbol otherwise).
auto VerifyLinkedBuiltins(
    const ObjectCode& object, const builtins::BuiltinRegistry& registry,
    target::TargetMode mode, const builtins::ExternalSymbolTable& supplied)
    -> Result<void>;

}  // namespace lumen::llvm_backend
