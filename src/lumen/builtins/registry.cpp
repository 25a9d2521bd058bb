#include "lumen/builtins/registry.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/builtins/lpfx_builtins.hpp"
#include "lumen/builtins/q32_builtins.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::builtins {

namespace {

template <typename Fn>
auto AddressOf(Fn* fn) -> void* {
  return reinterpret_cast<void*>(fn);
}

// Host address of the Local implementation for each builtin.
auto LocalAddress(BuiltinId id) -> void* {
  switch (id) {
    case BuiltinId::kAdd:
      return AddressOf(&LumenQ32Add);
    case BuiltinId::kSub:
      return AddressOf(&LumenQ32Sub);
    case BuiltinId::kMul:
      return AddressOf(&LumenQ32Mul);
    case BuiltinId::kDiv:
      return AddressOf(&LumenQ32Div);
    case BuiltinId::kMod:
      return AddressOf(&LumenQ32Mod);
    case BuiltinId::kFma:
      return AddressOf(&LumenQ32Fma);
    case BuiltinId::kRound:
      return AddressOf(&LumenQ32Round);
    case BuiltinId::kRoundEven:
      return AddressOf(&LumenQ32RoundEven);
    case BuiltinId::kSin:
      return AddressOf(&LumenQ32Sin);
    case BuiltinId::kCos:
      return AddressOf(&LumenQ32Cos);
    case BuiltinId::kTan:
      return AddressOf(&LumenQ32Tan);
    case BuiltinId::kAsin:
      return AddressOf(&LumenQ32Asin);
    case BuiltinId::kAcos:
      return AddressOf(&LumenQ32Acos);
    case BuiltinId::kAtan:
      return AddressOf(&LumenQ32Atan);
    case BuiltinId::kAtan2:
      return AddressOf(&LumenQ32Atan2);
    case BuiltinId::kSinh:
      return AddressOf(&LumenQ32Sinh);
    case BuiltinId::kCosh:
      return AddressOf(&LumenQ32Cosh);
    case BuiltinId::kTanh:
      return AddressOf(&LumenQ32Tanh);
    case BuiltinId::kAsinh:
      return AddressOf(&LumenQ32Asinh);
    case BuiltinId::kAcosh:
      return AddressOf(&LumenQ32Acosh);
    case BuiltinId::kAtanh:
      return AddressOf(&LumenQ32Atanh);
    case BuiltinId::kExp:
      return AddressOf(&LumenQ32Exp);
    case BuiltinId::kExp2:
      return AddressOf(&LumenQ32Exp2);
    case BuiltinId::kLog:
      return AddressOf(&LumenQ32Log);
    case BuiltinId::kLog2:
      return AddressOf(&LumenQ32Log2);
    case BuiltinId::kPow:
      return AddressOf(&LumenQ32Pow);
    case BuiltinId::kSqrt:
      return AddressOf(&LumenQ32Sqrt);
    case BuiltinId::kInverseSqrt:
      return AddressOf(&LumenQ32InverseSqrt);
    case BuiltinId::kLdexp:
      return AddressOf(&LumenQ32Ldexp);
    case BuiltinId::kHostLog:
      return AddressOf(&LumenHostLog);
    case BuiltinId::kLpfxHash1:
      return AddressOf(&LumenLpfxHash1);
    case BuiltinId::kLpfxHash2:
      return AddressOf(&LumenLpfxHash2);
    case BuiltinId::kLpfxHash3:
      return AddressOf(&LumenLpfxHash3);
    case BuiltinId::kLpfxSimplex2:
    case BuiltinId::kLpfxSnoise2:
      return AddressOf(&LumenLpfxSimplex2);
    case BuiltinId::kLpfxSimplex3:
    case BuiltinId::kLpfxSnoise3:
      return AddressOf(&LumenLpfxSimplex3);
    case BuiltinId::kLpfxWorley3:
      return AddressOf(&LumenLpfxWorley3);
    case BuiltinId::kLpfxPsrdnoise2:
      return AddressOf(&LumenLpfxPsrdnoise2);
    case BuiltinId::kLpfxPsrdnoise3:
      return AddressOf(&LumenLpfxPsrdnoise3);
    case BuiltinId::kLpfxSaturate:
      return AddressOf(&LumenLpfxSaturate);
    case BuiltinId::kLpfxSaturateVec3:
      return AddressOf(&LumenLpfxSaturateVec3);
    case BuiltinId::kLpfxSaturateVec4:
      return AddressOf(&LumenLpfxSaturateVec4);
    case BuiltinId::kLpfxHue2rgb:
      return AddressOf(&LumenLpfxHue2rgb);
    case BuiltinId::kLpfxRgb2hsv:
      return AddressOf(&LumenLpfxRgb2hsv);
    case BuiltinId::kLpfxRgb2hsvVec4:
      return AddressOf(&LumenLpfxRgb2hsvVec4);
  }
  throw common::InternalError("LocalAddress", "unknown builtin id");
}

}  // namespace

auto ToString(NativeIntrinsic intrinsic) -> std::string_view {
  switch (intrinsic) {
    case NativeIntrinsic::kSaturatingAdd:
      return "llvm.sadd.sat";
    case NativeIntrinsic::kSaturatingSub:
      return "llvm.ssub.sat";
    case NativeIntrinsic::kWideMultiply:
      return "wide-multiply";
  }
  return "unknown";
}

auto SymbolOf(const Implementation& impl) -> std::string_view {
  return std::visit([](const auto& i) { return i.symbol; }, impl);
}

auto DefaultBuiltinEntries() -> std::vector<BuiltinEntry> {
  std::vector<BuiltinEntry> entries;
  entries.reserve(AllBuiltins().size() * 2);
  for (const BuiltinInfo& info : AllBuiltins()) {
    std::string_view local_symbol = info.id == BuiltinId::kHostLog
                                        ? kHostLogLocalSymbol
                                        : Q32SymbolName(info.id);
    std::string_view external_symbol = info.id == BuiltinId::kHostLog
                                           ? kHostLogExternalSymbol
                                           : Q32SymbolName(info.id);
    entries.push_back(
        BuiltinEntry{
            .id = info.id,
            .arity = info.arity,
            .mode = target::TargetMode::kHosted,
            .impl =
                LocalImpl{
                    .symbol = local_symbol,
                    .address = LocalAddress(info.id),
                },
        });
    entries.push_back(
        BuiltinEntry{
            .id = info.id,
            .arity = info.arity,
            .mode = target::TargetMode::kFreestanding,
            .impl = ExternalImpl{.symbol = external_symbol},
        });
  }
  return entries;
}

BuiltinRegistry::BuiltinRegistry(std::vector<BuiltinEntry> entries)
    : entries_(std::move(entries)) {
  for (size_t i = 0; i < entries_.size(); ++i) {
    const BuiltinEntry& entry = entries_[i];
    if (const auto* local = std::get_if<LocalImpl>(&entry.impl);
        local != nullptr && local->address == nullptr) {
      throw common::InternalError(
          "BuiltinRegistry",
          fmt::format("Local entry '{}' has no address", local->symbol));
    }
    index_[Key{entry.id, entry.arity, entry.mode}].push_back(i);
  }
}

auto BuiltinRegistry::Default() -> const BuiltinRegistry& {
  static const BuiltinRegistry kRegistry = [] {
    BuiltinRegistry registry(DefaultBuiltinEntries());
    spdlog::debug(
        "builtin registry initialized with {} entries",
        registry.entries_.size());
    return registry;
  }();
  return kRegistry;
}

auto BuiltinRegistry::Lookup(
    BuiltinId id, uint8_t arity, target::TargetMode mode) const
    -> const Implementation* {
  auto it = index_.find(Key{id, arity, mode});
  if (it == index_.end()) {
    return nullptr;
  }
  const Implementation* external = nullptr;
  for (size_t index : it->second) {
    const Implementation& impl = entries_[index].impl;
    if (std::holds_alternative<LocalImpl>(impl)) {
      return &impl;
    }
    if (external == nullptr) {
      external = &impl;
    }
  }
  return external;
}

auto BuiltinRegistry::Resolve(
    BuiltinId id, uint8_t arity, const target::TargetDescriptor& target) const
    -> Result<Resolution> {
  // Target-native intrinsics first. Saturating add/sub expand to plain
  // integer code on every target; the wide multiply needs hardware support.
  if (arity == 2) {
    if (id == BuiltinId::kAdd) {
      return NativeIntrinsic::kSaturatingAdd;
    }
    if (id == BuiltinId::kSub) {
      return NativeIntrinsic::kSaturatingSub;
    }
    if (id == BuiltinId::kMul && target.HasWideMultiply()) {
      return NativeIntrinsic::kWideMultiply;
    }
  }

  const Implementation* impl = Lookup(id, arity, target.Mode());
  if (impl == nullptr) {
    return std::unexpected(
        Diagnostic::UnresolvedBuiltin(
            std::string(ToString(id)), target.Name(),
            fmt::format(
                "no implementation of '{}' with arity {} for {} target '{}'",
                ToString(id), arity, target::ToString(target.Mode()),
                target.Name())));
  }
  return std::visit(
      [](const auto& i) -> Resolution { return i; }, *impl);
}

auto BuiltinRegistry::FindBySymbol(
    std::string_view symbol, target::TargetMode mode) const
    -> const BuiltinEntry* {
  for (const BuiltinEntry& entry : entries_) {
    if (entry.mode == mode && SymbolOf(entry.impl) == symbol) {
      return &entry;
    }
  }
  return nullptr;
}

auto BuiltinRegistry::ExternalEntries(target::TargetMode mode) const
    -> std::vector<const BuiltinEntry*> {
  std::vector<const BuiltinEntry*> result;
  for (const BuiltinEntry& entry : entries_) {
    if (entry.mode == mode &&
        std::holds_alternative<ExternalImpl>(entry.impl)) {
      result.push_back(&entry);
    }
  }
  return result;
}

auto BuiltinRegistry::LocalEntries(target::TargetMode mode) const
    -> std::vector<const BuiltinEntry*> {
  std::vector<const BuiltinEntry*> result;
  for (const BuiltinEntry& entry : entries_) {
    if (entry.mode == mode && std::holds_alternative<LocalImpl>(entry.impl)) {
      result.push_back(&entry);
    }
  }
  return result;
}

}  // namespace lumen::builtins
