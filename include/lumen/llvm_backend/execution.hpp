#pragma once

#include <expected>
#include <memory>
#include <string_view>
#include <utility>

#include "lumen/builtins/external_symbols.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/common/opt_level.hpp"
#include "lumen/llvm_backend/lower.hpp"

namespace lumen::llvm_backend {

// Holds compiled JIT state. Must stay alive while compiled functions are
// called (LLJIT owns the code memory).
class JitSession {
 public:
  JitSession();
  ~JitSession();
  JitSession(const JitSession&) = delete;
  auto operator=(const JitSession&) -> JitSession& = delete;
  JitSession(JitSession&&) noexcept;
  auto operator=(JitSession&&) noexcept -> JitSession&;

  // Address of a compiled function.
  [[nodiscard]] auto Lookup(std::string_view name) const -> Result<void*>;

  // Typed convenience over Lookup.
  template <typename Fn>
  [[nodiscard]] auto LookupAs(std::string_view name) const -> Result<Fn*> {
    auto address = Lookup(name);
    if (!address) {
      return std::unexpected(std::move(address).error());
    }
    return reinterpret_cast<Fn*>(*address);
  }

 private:
  friend auto CompileJit(
      LoweringResult&, const builtins::BuiltinRegistry&,
      const builtins::ExternalSymbolTable*, OptLevel) -> Result<JitSession>;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Compile a host-target module in-process with ORC JIT.
// Takes ownership of result.context and result.module.
//
// Every builtin the module calls is bound before code generation: Local
// entries to their in-process address, External entries to the address in
// supplied. An External symbol that has not been supplied (or no table at
// all) fails with UnlinkedExternalSymbol.
auto CompileJit(
    LoweringResult& result, const builtins::BuiltinRegistry& registry,
    const builtins::ExternalSymbolTable* supplied = nullptr,
    OptLevel opt_level = OptLevel::kO2) -> Result<JitSession>;

}  // namespace lumen::llvm_backend
