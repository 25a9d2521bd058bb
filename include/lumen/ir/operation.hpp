#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/ir/value_type.hpp"

namespace lumen::ir {

enum class BinaryOp : uint8_t {
  kAdd,
  kSubtract,
  kMultiply,
  kDivide,
  kModulo,
  kMin,
  kMax,
};

enum class UnaryOp : uint8_t {
  kNegate,
  kAbsoluteValue,
  kSign,
  kFloor,
  kCeil,
  kTrunc,
  kFract,
  kRound,
  kRoundEven,
};

enum class ComparePredicate : uint8_t { kEq, kNe, kLt, kLe, kGt, kGe };

enum class LogicalOp : uint8_t { kAnd, kOr, kNot };

enum class TranscendentalKind : uint8_t {
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
};

// Noise, hashing and color helpers backed by the __lpfx_* builtins. The
// overload is picked by the width of the first operand.
enum class LibraryFunction : uint8_t {
  kHash,       // uint (uint|uvec2|uvec3 p, uint seed)
  kSimplex,    // float (vec2|vec3 p, uint seed)
  kSnoise,     // float (vec2|vec3 p, uint seed)
  kWorley,     // float (vec3 p, uint seed)
  kPsrdnoise,  // vec3|vec4 (vec2|vec3 p, period, float alpha)
  kSaturate,   // float|vec3|vec4 (same)
  kHue2rgb,    // vec3 (float hue)
  kRgb2hsv,    // vec3|vec4 (same)
};

struct Binary {
  BinaryOp op;
  auto operator==(const Binary&) const -> bool = default;
};
struct Unary {
  UnaryOp op;
  auto operator==(const Unary&) const -> bool = default;
};
// a * b + c
struct FusedMultiplyAdd {
  auto operator==(const FusedMultiplyAdd&) const -> bool = default;
};
struct Compare {
  ComparePredicate predicate;
  auto operator==(const Compare&) const -> bool = default;
};
struct Transcendental {
  TranscendentalKind kind;
  auto operator==(const Transcendental&) const -> bool = default;
};
struct Convert {
  ScalarKind to;
  auto operator==(const Convert&) const -> bool = default;
};
// cond ? a : b, component-wise
struct Select {
  auto operator==(const Select&) const -> bool = default;
};
struct Logical {
  LogicalOp op;
  auto operator==(const Logical&) const -> bool = default;
};
// Whole-vector call, not component-wise. psrdnoise yields the noise value
// in component 0 followed by its gradient.
struct LibraryCall {
  LibraryFunction function;
  auto operator==(const LibraryCall&) const -> bool = default;
};

// Abstract real-valued (or integer/boolean) operation. Applies
// component-wise, except LibraryCall; scalar operands broadcast against
// vectors.
using Operation = std::variant<
    Binary, Unary, FusedMultiplyAdd, Compare, Transcendental, Convert, Select,
    Logical, LibraryCall>;

// Declared operand count.
auto Arity(const Operation& op) -> uint8_t;

auto ToString(BinaryOp op) -> std::string_view;
auto ToString(UnaryOp op) -> std::string_view;
auto ToString(ComparePredicate pred) -> std::string_view;
auto ToString(LogicalOp op) -> std::string_view;
auto ToString(TranscendentalKind kind) -> std::string_view;
auto ToString(LibraryFunction function) -> std::string_view;
auto ToString(const Operation& op) -> std::string;

// Builtin backing a transcendental.
auto ToBuiltin(TranscendentalKind kind) -> builtins::BuiltinId;

// Overload of a library function for a first operand of `width`
// components, or nullopt if there is none.
auto ToBuiltin(LibraryFunction function, uint8_t width)
    -> std::optional<builtins::BuiltinId>;

}  // namespace lumen::ir
