#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace lumen::fixed {

// Q16.16 fixed-point value: 16 integer bits, 16 fractional bits, stored in
// a 32-bit two's-complement integer.
using Fixed = int32_t;

inline constexpr int kFracBits = 16;
inline constexpr Fixed kOne = 0x00010000;
inline constexpr Fixed kHalf = 0x00008000;
inline constexpr Fixed kFracMask = 0x0000FFFF;
inline constexpr Fixed kMaxFixed = std::numeric_limits<int32_t>::max();
inline constexpr Fixed kMinFixed = std::numeric_limits<int32_t>::min();

// Integer range that survives conversion to fixed without clamping.
inline constexpr int32_t kMaxIntForFixed = 32767;
inline constexpr int32_t kMinIntForFixed = -32768;

inline constexpr Fixed kPi = 205887;      // 3.14159
inline constexpr Fixed kHalfPi = 102944;  // 1.57080
inline constexpr Fixed kTwoPi = 411775;   // 6.28318
inline constexpr Fixed kE = 178145;       // 2.71828
inline constexpr Fixed kLn2 = 45426;      // 0.69315

// Overflow behavior of add/subtract. Multiply and divide always widen to a
// 64-bit intermediate and saturate, regardless of mode.
enum class ArithMode : uint8_t {
  kPrecise,  // Clamp to [kMinFixed, kMaxFixed]
  kFast,     // Wrap (two's complement)
};

constexpr auto SaturateToFixed(int64_t value) -> Fixed {
  if (value > kMaxFixed) {
    return kMaxFixed;
  }
  if (value < kMinFixed) {
    return kMinFixed;
  }
  return static_cast<Fixed>(value);
}

constexpr auto WrapToFixed(int64_t value) -> Fixed {
  return static_cast<Fixed>(static_cast<uint32_t>(value));
}

// Arithmetic
auto Add(Fixed a, Fixed b, ArithMode mode = ArithMode::kPrecise) -> Fixed;
auto Sub(Fixed a, Fixed b, ArithMode mode = ArithMode::kPrecise) -> Fixed;
auto Mul(Fixed a, Fixed b) -> Fixed;
// Division by zero saturates toward the sign of the dividend.
auto Div(Fixed a, Fixed b) -> Fixed;
// x - y * floor(x / y); returns 0 when y == 0.
auto Mod(Fixed x, Fixed y) -> Fixed;
// a * b + c with a single widening step.
auto Fma(Fixed a, Fixed b, Fixed c) -> Fixed;
// -MIN saturates to MAX, so Abs never returns a negative value.
auto Negate(Fixed x) -> Fixed;
auto Abs(Fixed x) -> Fixed;

// Rounding
auto Floor(Fixed x) -> Fixed;
auto Ceil(Fixed x) -> Fixed;
auto Trunc(Fixed x) -> Fixed;
auto Fract(Fixed x) -> Fixed;
// Half away from zero.
auto Round(Fixed x) -> Fixed;
// Half to even.
auto RoundEven(Fixed x) -> Fixed;

// Conversions
auto FromInt(int32_t value) -> Fixed;
auto FromUint(uint32_t value) -> Fixed;
// Truncates toward zero.
auto ToInt(Fixed x) -> int32_t;
// Negative values clamp to 0.
auto ToUint(Fixed x) -> uint32_t;
// Rounds to nearest and saturates; NaN maps to 0.
auto FromDouble(double value) -> Fixed;
auto ToDouble(Fixed x) -> double;

// "0x00018000 (1.50000)"
auto Describe(Fixed x) -> std::string;

}  // namespace lumen::fixed
