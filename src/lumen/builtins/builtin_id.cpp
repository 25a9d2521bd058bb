#include "lumen/builtins/builtin_id.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "lumen/common/internal_error.hpp"

namespace lumen::builtins {

namespace {

constexpr std::array kBuiltinTable = {
    BuiltinInfo{BuiltinId::kAdd, "add", 2, BuiltinAbi::kFixedBinary},
    BuiltinInfo{BuiltinId::kSub, "sub", 2, BuiltinAbi::kFixedBinary},
    BuiltinInfo{BuiltinId::kMul, "mul", 2, BuiltinAbi::kFixedBinary},
    BuiltinInfo{BuiltinId::kDiv, "div", 2, BuiltinAbi::kFixedBinary},
    BuiltinInfo{BuiltinId::kMod, "mod", 2, BuiltinAbi::kFixedBinary},
    BuiltinInfo{BuiltinId::kFma, "fma", 3, BuiltinAbi::kFixedTernary},
    BuiltinInfo{BuiltinId::kRound, "round", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{
        BuiltinId::kRoundEven, "roundeven", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kSin, "sin", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kCos, "cos", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kTan, "tan", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kAsin, "asin", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kAcos, "acos", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kAtan, "atan", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kAtan2, "atan2", 2, BuiltinAbi::kFixedBinary},
    BuiltinInfo{BuiltinId::kSinh, "sinh", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kCosh, "cosh", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kTanh, "tanh", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kAsinh, "asinh", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kAcosh, "acosh", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kAtanh, "atanh", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kExp, "exp", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kExp2, "exp2", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kLog, "log", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kLog2, "log2", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kPow, "pow", 2, BuiltinAbi::kFixedBinary},
    BuiltinInfo{BuiltinId::kSqrt, "sqrt", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{
        BuiltinId::kInverseSqrt, "inversesqrt", 1, BuiltinAbi::kFixedUnary},
    BuiltinInfo{BuiltinId::kLdexp, "ldexp", 2, BuiltinAbi::kFixedBinary},
    BuiltinInfo{BuiltinId::kHostLog, "host_log", 5, BuiltinAbi::kHostLog},
    BuiltinInfo{BuiltinId::kLpfxHash1, "lpfx_hash1", 2, BuiltinAbi::kScalar},
    BuiltinInfo{BuiltinId::kLpfxHash2, "lpfx_hash2", 3, BuiltinAbi::kScalar},
    BuiltinInfo{BuiltinId::kLpfxHash3, "lpfx_hash3", 4, BuiltinAbi::kScalar},
    BuiltinInfo{
        BuiltinId::kLpfxSimplex2, "lpfx_simplex2", 3, BuiltinAbi::kScalar},
    BuiltinInfo{
        BuiltinId::kLpfxSimplex3, "lpfx_simplex3", 4, BuiltinAbi::kScalar},
    BuiltinInfo{
        BuiltinId::kLpfxSnoise2, "lpfx_snoise2", 3, BuiltinAbi::kScalar},
    BuiltinInfo{
        BuiltinId::kLpfxSnoise3, "lpfx_snoise3", 4, BuiltinAbi::kScalar},
    BuiltinInfo{
        BuiltinId::kLpfxWorley3, "lpfx_worley3", 4, BuiltinAbi::kScalar},
    BuiltinInfo{
        BuiltinId::kLpfxPsrdnoise2, "lpfx_psrdnoise2", 7,
        BuiltinAbi::kGradientOut},
    BuiltinInfo{
        BuiltinId::kLpfxPsrdnoise3, "lpfx_psrdnoise3", 9,
        BuiltinAbi::kGradientOut},
    BuiltinInfo{
        BuiltinId::kLpfxSaturate, "lpfx_saturate", 1, BuiltinAbi::kScalar},
    BuiltinInfo{
        BuiltinId::kLpfxSaturateVec3, "lpfx_saturate_vec3", 4,
        BuiltinAbi::kResultPointer},
    BuiltinInfo{
        BuiltinId::kLpfxSaturateVec4, "lpfx_saturate_vec4", 5,
        BuiltinAbi::kResultPointer},
    BuiltinInfo{
        BuiltinId::kLpfxHue2rgb, "lpfx_hue2rgb", 2,
        BuiltinAbi::kResultPointer},
    BuiltinInfo{
        BuiltinId::kLpfxRgb2hsv, "lpfx_rgb2hsv", 4,
        BuiltinAbi::kResultPointer},
    BuiltinInfo{
        BuiltinId::kLpfxRgb2hsvVec4, "lpfx_rgb2hsv_vec4", 5,
        BuiltinAbi::kResultPointer},
};

// Symbol names must outlive every caller, so they are spelled out rather
// than assembled at runtime.
constexpr std::array<std::string_view, kBuiltinTable.size()> kQ32Symbols = {
    "__lp_q32_add",         "__lp_q32_sub",   "__lp_q32_mul",
    "__lp_q32_div",         "__lp_q32_mod",   "__lp_q32_fma",
    "__lp_q32_round",       "__lp_q32_roundeven",
    "__lp_q32_sin",         "__lp_q32_cos",   "__lp_q32_tan",
    "__lp_q32_asin",        "__lp_q32_acos",  "__lp_q32_atan",
    "__lp_q32_atan2",       "__lp_q32_sinh",  "__lp_q32_cosh",
    "__lp_q32_tanh",        "__lp_q32_asinh", "__lp_q32_acosh",
    "__lp_q32_atanh",       "__lp_q32_exp",   "__lp_q32_exp2",
    "__lp_q32_log",         "__lp_q32_log2",  "__lp_q32_pow",
    "__lp_q32_sqrt",        "__lp_q32_inversesqrt",
    "__lp_q32_ldexp",       "",
    "__lpfx_hash_1",        "__lpfx_hash_2",  "__lpfx_hash_3",
    "__lpfx_simplex2_q32",  "__lpfx_simplex3_q32",
    "__lpfx_snoise2_q32",   "__lpfx_snoise3_q32",
    "__lpfx_worley3_q32",
    "__lpfx_psrdnoise2_q32",
    "__lpfx_psrdnoise3_q32",
    "__lpfx_saturate_q32",
    "__lpfx_saturate_vec3_q32",
    "__lpfx_saturate_vec4_q32",
    "__lpfx_hue2rgb_q32",
    "__lpfx_rgb2hsv_q32",
    "__lpfx_rgb2hsv_vec4_q32",
};

constexpr auto TableIsOrdered() -> bool {
  for (size_t i = 0; i < kBuiltinTable.size(); ++i) {
    if (static_cast<size_t>(kBuiltinTable[i].id) != i) {
      return false;
    }
  }
  return true;
}
static_assert(TableIsOrdered(), "kBuiltinTable must follow BuiltinId order");

}  // namespace

auto AllBuiltins() -> std::span<const BuiltinInfo> {
  return kBuiltinTable;
}

auto GetBuiltinInfo(BuiltinId id) -> const BuiltinInfo& {
  auto index = static_cast<size_t>(id);
  if (index >= kBuiltinTable.size()) {
    common::ThrowInternalError(
        "GetBuiltinInfo", "builtin id " + std::to_string(index));
  }
  return kBuiltinTable[index];
}

auto ToString(BuiltinId id) -> std::string_view {
  return GetBuiltinInfo(id).name;
}

auto FindBuiltinByName(std::string_view name) -> std::optional<BuiltinId> {
  for (const auto& info : kBuiltinTable) {
    if (info.name == name) {
      return info.id;
    }
  }
  return std::nullopt;
}

auto IsLibraryBuiltin(BuiltinId id) -> bool {
  return static_cast<size_t>(id) >= static_cast<size_t>(BuiltinId::kLpfxHash1);
}

auto Q32SymbolName(BuiltinId id) -> std::string_view {
  if (id == BuiltinId::kHostLog) {
    common::ThrowInternalError(
        "Q32SymbolName", "host_log has no q32 symbol");
  }
  return kQ32Symbols[static_cast<size_t>(GetBuiltinInfo(id).id)];
}

}  // namespace lumen::builtins
