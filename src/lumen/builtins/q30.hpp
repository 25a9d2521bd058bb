#pragma once

#include <cstdint>

#include "lumen/fixed/q32.hpp"

// Q2.30 working precision shared by the transcendental builtins. Series and
// range reduction run on int64 Q30 values so the final Q16.16 result keeps
// all 16 fractional bits.
namespace lumen::builtins::detail {

inline constexpr int kQ30Bits = 30;
inline constexpr int64_t kQ30One = int64_t{1} << kQ30Bits;
inline constexpr int kQ30ToQ16Shift = kQ30Bits - fixed::kFracBits;

constexpr auto ToQ30(double value) -> int64_t {
  double scaled = value * static_cast<double>(kQ30One);
  return static_cast<int64_t>(scaled < 0 ? scaled - 0.5 : scaled + 0.5);
}

inline constexpr int64_t kQ30Pi = ToQ30(3.14159265358979323846);
inline constexpr int64_t kQ30HalfPi = ToQ30(1.57079632679489661923);
inline constexpr int64_t kQ30TwoPi = ToQ30(6.28318530717958647692);
inline constexpr int64_t kQ30Ln2 = ToQ30(0.69314718055994530942);

constexpr auto FixedToQ30(fixed::Fixed x) -> int64_t {
  return static_cast<int64_t>(x) * (int64_t{1} << kQ30ToQ16Shift);
}

// Round-to-nearest narrowing with saturation.
constexpr auto Q30ToFixed(int64_t value) -> fixed::Fixed {
  constexpr int64_t kRound = int64_t{1} << (kQ30ToQ16Shift - 1);
  return fixed::SaturateToFixed((value + kRound) >> kQ30ToQ16Shift);
}

constexpr auto MulQ30(int64_t a, int64_t b) -> int64_t {
  return (a * b) >> kQ30Bits;
}

// Integer square root of a 64-bit value, rounded to nearest.
auto ISqrt64(uint64_t value) -> uint64_t;

// e^r for |r| < 1 in Q30.
auto ExpSeriesQ30(int64_t r) -> int64_t;

// Multiply a Q30 value by 2^k and narrow to Q16.16 with saturation.
auto ScaleQ30ByPow2(int64_t value, int k) -> fixed::Fixed;

// sin of an arbitrary Q30 angle.
auto SinQ30(int64_t angle) -> int64_t;

// atan for 0 <= t <= 1 in Q30.
auto AtanUnitQ30(int64_t t) -> int64_t;

}  // namespace lumen::builtins::detail
