#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace lumen::builtins {

// Operations implemented as callable functions rather than inline
// instruction sequences.
enum class BuiltinId : uint8_t {
  kAdd,
  kSub,
  kMul,
  kDiv,
  kMod,
  kFma,
  kRound,
  kRoundEven,
  kSin,
  kCos,
  kTan,
  kAsin,
  kAcos,
  kAtan,
  kAtan2,
  kSinh,
  kCosh,
  kTanh,
  kAsinh,
  kAcosh,
  kAtanh,
  kExp,
  kExp2,
  kLog,
  kLog2,
  kPow,
  kSqrt,
  kInverseSqrt,
  kLdexp,
  kHostLog,
  kLpfxHash1,
  kLpfxHash2,
  kLpfxHash3,
  kLpfxSimplex2,
  kLpfxSimplex3,
  kLpfxSnoise2,
  kLpfxSnoise3,
  kLpfxWorley3,
  kLpfxPsrdnoise2,
  kLpfxPsrdnoise3,
  kLpfxSaturate,
  kLpfxSaturateVec3,
  kLpfxSaturateVec4,
  kLpfxHue2rgb,
  kLpfxRgb2hsv,
  kLpfxRgb2hsvVec4,
};

// Shape of a builtin's native signature.
enum class BuiltinAbi : uint8_t {
  kFixedUnary,     // i32 (i32)
  kFixedBinary,    // i32 (i32, i32)
  kFixedTernary,   // i32 (i32, i32, i32)
  kHostLog,        // void (u8 level, ptr, usize, ptr, usize)
  kScalar,         // i32 (i32 x arity)
  kResultPointer,  // void (i32* out, i32 x (arity - 1))
  kGradientOut,    // i32 (i32 x (arity - 2), i32* gradient, u32 seed)
};

struct BuiltinInfo {
  BuiltinId id;
  std::string_view name;  // GLSL-facing name, e.g. "sin"
  uint8_t arity;
  BuiltinAbi abi;
};

// Every builtin known to the compiler, in BuiltinId order.
auto AllBuiltins() -> std::span<const BuiltinInfo>;

auto GetBuiltinInfo(BuiltinId id) -> const BuiltinInfo&;

auto ToString(BuiltinId id) -> std::string_view;

// Look up by GLSL-facing name ("sin", "roundeven", ...).
auto FindBuiltinByName(std::string_view name) -> std::optional<BuiltinId>;

// Library builtins ("__lpfx_*"): noise, hashing and color helpers with
// fixed-point or integer arguments rather than one lane per call.
auto IsLibraryBuiltin(BuiltinId id) -> bool;

// Fixed symbol names. Part of the documented freestanding surface: an
// embedding application links implementations under exactly these names.
auto Q32SymbolName(BuiltinId id) -> std::string_view;  // "__lp_q32_sin"
inline constexpr std::string_view kHostLogLocalSymbol = "__host_log";
inline constexpr std::string_view kHostLogExternalSymbol = "lp_jit_host_log";

}  // namespace lumen::builtins
