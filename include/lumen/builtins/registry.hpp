#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/inlined_vector.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::builtins {

// Code compiled into the current image.
struct LocalImpl {
  std::string_view symbol;
  void* address = nullptr;

  auto operator==(const LocalImpl&) const -> bool = default;
};

// A fixed symbol the embedding application must supply at link/load time.
struct ExternalImpl {
  std::string_view symbol;

  auto operator==(const ExternalImpl&) const -> bool = default;
};

using Implementation = std::variant<LocalImpl, ExternalImpl>;

struct BuiltinEntry {
  BuiltinId id;
  uint8_t arity;
  target::TargetMode mode;
  Implementation impl;
};

// Instruction sequences the backend emits in place of a call.
enum class NativeIntrinsic : uint8_t {
  kSaturatingAdd,  // llvm.sadd.sat
  kSaturatingSub,  // llvm.ssub.sat
  kWideMultiply,   // 64-bit multiply, shift, clamp
};

auto ToString(NativeIntrinsic intrinsic) -> std::string_view;

using Resolution = std::variant<NativeIntrinsic, LocalImpl, ExternalImpl>;

auto SymbolOf(const Implementation& impl) -> std::string_view;

// Immutable table from {builtin, arity, target mode} to implementations.
// Built once; all queries are const and safe from any thread.
class BuiltinRegistry {
 public:
  explicit BuiltinRegistry(std::vector<BuiltinEntry> entries);

  // The process-wide registry: every builtin Local for hosted targets,
  // External for freestanding ones. Initialized on first use.
  static auto Default() -> const BuiltinRegistry&;

  // Returns the Local implementation if one is registered for the mode,
  // otherwise the External one, otherwise nullptr.
  [[nodiscard]] auto Lookup(
      BuiltinId id, uint8_t arity, target::TargetMode mode) const
      -> const Implementation*;

  // Full resolution order: target-native intrinsic, Local, External,
  // UnresolvedBuiltin.
  [[nodiscard]] auto Resolve(
      BuiltinId id, uint8_t arity, const target::TargetDescriptor& target) const
      -> Result<Resolution>;

  // Reverse lookup used when verifying linked objects.
  [[nodiscard]] auto FindBySymbol(
      std::string_view symbol, target::TargetMode mode) const
      -> const BuiltinEntry*;

  [[nodiscard]] auto Entries() const -> std::span<const BuiltinEntry> {
    return entries_;
  }

  // Entries of one kind for a mode, in table order.
  [[nodiscard]] auto ExternalEntries(target::TargetMode mode) const
      -> std::vector<const BuiltinEntry*>;
  [[nodiscard]] auto LocalEntries(target::TargetMode mode) const
      -> std::vector<const BuiltinEntry*>;

 private:
  using Key = std::tuple<BuiltinId, uint8_t, target::TargetMode>;

  std::vector<BuiltinEntry> entries_;
  absl::flat_hash_map<Key, absl::InlinedVector<size_t, 2>> index_;
};

// The fixed table behind BuiltinRegistry::Default().
auto DefaultBuiltinEntries() -> std::vector<BuiltinEntry>;

}  // namespace lumen::builtins
