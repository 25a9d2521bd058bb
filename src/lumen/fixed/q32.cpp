#include "lumen/fixed/q32.hpp"

#include <cmath>
#include <cstdint>
#include <string>

#include <fmt/core.h>

namespace lumen::fixed {

auto Add(Fixed a, Fixed b, ArithMode mode) -> Fixed {
  int64_t sum = static_cast<int64_t>(a) + static_cast<int64_t>(b);
  return mode == ArithMode::kPrecise ? SaturateToFixed(sum) : WrapToFixed(sum);
}

auto Sub(Fixed a, Fixed b, ArithMode mode) -> Fixed {
  int64_t diff = static_cast<int64_t>(a) - static_cast<int64_t>(b);
  return mode == ArithMode::kPrecise ? SaturateToFixed(diff)
                                     : WrapToFixed(diff);
}

auto Mul(Fixed a, Fixed b) -> Fixed {
  int64_t product = static_cast<int64_t>(a) * static_cast<int64_t>(b);
  return SaturateToFixed(product >> kFracBits);
}

auto Div(Fixed a, Fixed b) -> Fixed {
  if (b == 0) {
    return a >= 0 ? kMaxFixed : kMinFixed;
  }
  int64_t dividend = static_cast<int64_t>(a) * (int64_t{1} << kFracBits);
  return SaturateToFixed(dividend / b);
}

auto Mod(Fixed x, Fixed y) -> Fixed {
  if (y == 0) {
    return 0;
  }
  // Exact in 64 bits: floor(x / y) as an integer, then x - y * q.
  int64_t q = static_cast<int64_t>(x) / y;
  if ((static_cast<int64_t>(x) % y != 0) && ((x < 0) != (y < 0))) {
    --q;
  }
  return SaturateToFixed(static_cast<int64_t>(x) - q * y);
}

auto Fma(Fixed a, Fixed b, Fixed c) -> Fixed {
  int64_t product = static_cast<int64_t>(a) * static_cast<int64_t>(b);
  return SaturateToFixed((product >> kFracBits) + c);
}

auto Negate(Fixed x) -> Fixed {
  return x == kMinFixed ? kMaxFixed : -x;
}

auto Abs(Fixed x) -> Fixed {
  return x < 0 ? Negate(x) : x;
}

auto Floor(Fixed x) -> Fixed {
  return static_cast<Fixed>(
      static_cast<uint32_t>(x) & ~static_cast<uint32_t>(kFracMask));
}

auto Ceil(Fixed x) -> Fixed {
  return Floor(Add(x, kFracMask));
}

auto Trunc(Fixed x) -> Fixed {
  if (x >= 0 || (x & kFracMask) == 0) {
    return Floor(x);
  }
  return Floor(x) + kOne;
}

auto Fract(Fixed x) -> Fixed {
  return x & kFracMask;
}

auto Round(Fixed x) -> Fixed {
  Fixed lower = Floor(x);
  Fixed frac = x & kFracMask;
  if (frac > kHalf || (frac == kHalf && x >= 0)) {
    return Add(lower, kOne);
  }
  return lower;
}

auto RoundEven(Fixed x) -> Fixed {
  if ((x & kFracMask) != kHalf) {
    return Floor(Add(x, kHalf));
  }
  // Exactly halfway: pick the even neighbor.
  Fixed lower = Floor(x);
  if (((lower >> kFracBits) & 1) == 0) {
    return lower;
  }
  return Add(lower, kOne);
}

auto FromInt(int32_t value) -> Fixed {
  if (value > kMaxIntForFixed) {
    value = kMaxIntForFixed;
  } else if (value < kMinIntForFixed) {
    value = kMinIntForFixed;
  }
  return static_cast<Fixed>(static_cast<uint32_t>(value) << kFracBits);
}

auto FromUint(uint32_t value) -> Fixed {
  if (value > static_cast<uint32_t>(kMaxIntForFixed)) {
    value = kMaxIntForFixed;
  }
  return static_cast<Fixed>(value << kFracBits);
}

auto ToInt(Fixed x) -> int32_t {
  // Bias negative values so the arithmetic shift truncates toward zero.
  int64_t biased = x < 0 ? static_cast<int64_t>(x) + kFracMask : x;
  return static_cast<int32_t>(biased >> kFracBits);
}

auto ToUint(Fixed x) -> uint32_t {
  return x < 0 ? 0U : static_cast<uint32_t>(x) >> kFracBits;
}

auto FromDouble(double value) -> Fixed {
  if (std::isnan(value)) {
    return 0;
  }
  double scaled = std::round(value * static_cast<double>(kOne));
  if (scaled >= static_cast<double>(kMaxFixed)) {
    return kMaxFixed;
  }
  if (scaled <= static_cast<double>(kMinFixed)) {
    return kMinFixed;
  }
  return static_cast<Fixed>(scaled);
}

auto ToDouble(Fixed x) -> double {
  return static_cast<double>(x) / static_cast<double>(kOne);
}

auto Describe(Fixed x) -> std::string {
  return fmt::format(
      "0x{:08X} ({:.5f})", static_cast<uint32_t>(x), ToDouble(x));
}

}  // namespace lumen::fixed
