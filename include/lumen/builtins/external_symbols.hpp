#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::builtins {

// Addresses the embedding application supplies for External builtins.
// This is the one synchronization point between compilation and the
// embedder: entries may be provided from any thread while compiled code
// resolves them.
class ExternalSymbolTable {
 public:
  ExternalSymbolTable() = default;
  ExternalSymbolTable(const ExternalSymbolTable&) = delete;
  auto operator=(const ExternalSymbolTable&) -> ExternalSymbolTable& = delete;
  ExternalSymbolTable(ExternalSymbolTable&&) = delete;
  auto operator=(ExternalSymbolTable&&) -> ExternalSymbolTable& = delete;

  // Supply (or replace) the implementation of a symbol. address must be
  // non-null.
  void Provide(std::string symbol, void* address);

  [[nodiscard]] auto IsProvided(std::string_view symbol) const -> bool;

  // UnlinkedExternalSymbol until the symbol has been provided.
  [[nodiscard]] auto Address(std::string_view symbol) const -> Result<void*>;

  [[nodiscard]] auto Snapshot() const
      -> std::vector<std::pair<std::string, void*>>;

 private:
  mutable std::mutex mutex_;
  absl::flat_hash_map<std::string, void*> symbols_;
};

// Callable address of a builtin for the given mode. Local entries resolve
// immediately; External entries only once the embedder has provided them.
auto ResolveCallable(
    const BuiltinRegistry& registry, BuiltinId id, uint8_t arity,
    target::TargetMode mode, const ExternalSymbolTable& supplied)
    -> Result<void*>;

// Supply every External symbol of the freestanding table with the matching
// hosted Local implementation. Used by emulator hosts and tests that run
// freestanding code in-process. Returns the number of symbols provided.
auto ProvideHostImplementations(
    const BuiltinRegistry& registry, ExternalSymbolTable& table) -> size_t;

}  // namespace lumen::builtins
