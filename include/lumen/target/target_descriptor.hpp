#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "lumen/common/diagnostic.hpp"

namespace lumen::target {

enum class TargetKind : uint8_t {
  kHostExecution,  // JIT into the compiler's own process
  kEmbeddedIsa,    // 32-bit RISC-V object code for flashing
};

// Whether the target can host builtin bodies itself. Selects Local vs.
// External registry entries.
enum class TargetMode : uint8_t {
  kHosted,
  kFreestanding,
};

// Optional instruction-set capabilities.
enum class Extension : uint8_t {
  kMultiplyDivide,  // "m"
  kAtomics,         // "a"
  kCompressed,      // "c"
  kSingleFloat,     // "f"
  kDoubleFloat,     // "d"
};

inline constexpr Extension kAllExtensions[] = {
    Extension::kMultiplyDivide, Extension::kAtomics, Extension::kCompressed,
    Extension::kSingleFloat,    Extension::kDoubleFloat,
};

// Single-letter ISA name ("m", "a", ...). Used in diagnostics as the
// required extension.
auto ExtensionLetter(Extension ext) -> std::string_view;

auto ToString(TargetKind kind) -> std::string_view;
auto ToString(TargetMode mode) -> std::string_view;

class ExtensionSet {
 public:
  constexpr ExtensionSet() = default;

  static constexpr auto All() -> ExtensionSet {
    ExtensionSet set;
    for (Extension ext : kAllExtensions) {
      set = set.With(ext);
    }
    return set;
  }

  [[nodiscard]] constexpr auto Has(Extension ext) const -> bool {
    return (bits_ & Bit(ext)) != 0;
  }
  [[nodiscard]] constexpr auto With(Extension ext) const -> ExtensionSet {
    ExtensionSet result = *this;
    result.bits_ = static_cast<uint8_t>(bits_ | Bit(ext));
    return result;
  }
  [[nodiscard]] constexpr auto Without(Extension ext) const -> ExtensionSet {
    ExtensionSet result = *this;
    result.bits_ = static_cast<uint8_t>(bits_ & ~Bit(ext));
    return result;
  }

  auto operator==(const ExtensionSet&) const -> bool = default;

 private:
  static constexpr auto Bit(Extension ext) -> uint8_t {
    return static_cast<uint8_t>(1U << static_cast<unsigned>(ext));
  }

  uint8_t bits_ = 0;
};

// Describes the execution target of one compilation unit. Immutable; safe
// to share across threads compiling different functions.
class TargetDescriptor {
 public:
  // Host JIT: all extensions, absolute code.
  static auto Host() -> TargetDescriptor;

  // 32-bit RISC-V with the given extensions (the base integer ISA is
  // always present).
  static auto Embedded(ExtensionSet extensions, bool position_independent)
      -> TargetDescriptor;

  // rv32imac, position independent: the default controller target.
  static auto DefaultEmbedded() -> TargetDescriptor;

  // "host" or "rv32i" followed by any of "m", "a", "c", "f", "d" in
  // canonical order (e.g. "rv32imac"). "g" is not accepted.
  static auto Parse(std::string_view isa) -> Result<TargetDescriptor>;

  [[nodiscard]] auto Kind() const -> TargetKind {
    return kind_;
  }
  [[nodiscard]] auto Extensions() const -> ExtensionSet {
    return extensions_;
  }
  [[nodiscard]] auto Has(Extension ext) const -> bool {
    return extensions_.Has(ext);
  }
  [[nodiscard]] auto IsPositionIndependent() const -> bool {
    return position_independent_;
  }

  [[nodiscard]] auto Mode() const -> TargetMode;

  // A native 32x32->64 multiply is available, so the Q32 multiply can be
  // inlined instead of called.
  [[nodiscard]] auto HasWideMultiply() const -> bool;

  // Widest integer operand the backend can legalize inline.
  [[nodiscard]] auto MaxIntegerWidth() const -> unsigned;

  // Pointer width in bits.
  [[nodiscard]] auto PointerWidth() const -> unsigned;

  // "host" or the canonical ISA string ("rv32imac").
  [[nodiscard]] auto Name() const -> std::string;

  // LLVM subtarget feature string, e.g. "+m,+a,+c,-f,-d". Empty for host.
  [[nodiscard]] auto FeatureString() const -> std::string;

  [[nodiscard]] auto WithPositionIndependence(bool pic) const
      -> TargetDescriptor;

  auto operator==(const TargetDescriptor&) const -> bool = default;

 private:
  TargetDescriptor(
      TargetKind kind, ExtensionSet extensions, bool position_independent)
      : kind_(kind),
        extensions_(extensions),
        position_independent_(position_independent) {
  }

  TargetKind kind_;
  ExtensionSet extensions_;
  bool position_independent_;
};

}  // namespace lumen::target
