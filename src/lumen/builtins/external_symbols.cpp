#include "lumen/builtins/external_symbols.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <absl/strings/string_view.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/overloaded.hpp"

namespace lumen::builtins {

void ExternalSymbolTable::Provide(std::string symbol, void* address) {
  if (address == nullptr) {
    common::ThrowInternalError(
        "ExternalSymbolTable::Provide",
        fmt::format("null address for '{}'", symbol));
  }
  spdlog::debug("external symbol '{}' provided", symbol);
  std::lock_guard lock(mutex_);
  symbols_.insert_or_assign(std::move(symbol), address);
}

auto ExternalSymbolTable::IsProvided(std::string_view symbol) const -> bool {
  std::lock_guard lock(mutex_);
  return symbols_.contains(absl::string_view(symbol.data(), symbol.size()));
}

auto ExternalSymbolTable::Address(std::string_view symbol) const
    -> Result<void*> {
  std::lock_guard lock(mutex_);
  auto it = symbols_.find(absl::string_view(symbol.data(), symbol.size()));
  if (it == symbols_.end()) {
    return std::unexpected(
        Diagnostic::UnlinkedExternalSymbol(
            std::string(symbol),
            fmt::format(
                "external builtin '{}' has not been supplied by the "
                "embedding application",
                symbol)));
  }
  return it->second;
}

auto ExternalSymbolTable::Snapshot() const
    -> std::vector<std::pair<std::string, void*>> {
  std::lock_guard lock(mutex_);
  std::vector<std::pair<std::string, void*>> result(
      symbols_.begin(), symbols_.end());
  return result;
}

auto ResolveCallable(
    const BuiltinRegistry& registry, BuiltinId id, uint8_t arity,
    target::TargetMode mode, const ExternalSymbolTable& supplied)
    -> Result<void*> {
  const Implementation* impl = registry.Lookup(id, arity, mode);
  if (impl == nullptr) {
    return std::unexpected(
        Diagnostic::UnresolvedBuiltin(
            std::string(ToString(id)), std::string(target::ToString(mode)),
            fmt::format(
                "no registry entry for '{}' with arity {} ({})", ToString(id),
                arity, target::ToString(mode))));
  }
  return std::visit(
      Overloaded{
          [](const LocalImpl& local) -> Result<void*> {
            return local.address;
          },
          [&](const ExternalImpl& external) -> Result<void*> {
            auto address = supplied.Address(external.symbol);
            if (!address) {
              return std::unexpected(
                  std::move(address.error())
                      .WithOperation(std::string(ToString(id)))
                      .WithNote(
                          "call ExternalSymbolTable::Provide before "
                          "invoking freestanding code"));
            }
            return *address;
          },
      },
      *impl);
}

auto ProvideHostImplementations(
    const BuiltinRegistry& registry, ExternalSymbolTable& table) -> size_t {
  size_t provided = 0;
  for (const BuiltinEntry* entry :
       registry.ExternalEntries(target::TargetMode::kFreestanding)) {
    const Implementation* host =
        registry.Lookup(entry->id, entry->arity, target::TargetMode::kHosted);
    if (host == nullptr) {
      continue;
    }
    const auto* local = std::get_if<LocalImpl>(host);
    if (local == nullptr) {
      continue;
    }
    table.Provide(std::string(SymbolOf(entry->impl)), local->address);
    ++provided;
  }
  return provided;
}

}  // namespace lumen::builtins
