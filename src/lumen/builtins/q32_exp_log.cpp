#include <bit>
#include <cstdint>

#include "lumen/builtins/q32_builtins.hpp"
#include "lumen/fixed/q32.hpp"
#include "q30.hpp"

namespace lumen::builtins::detail {

using fixed::Fixed;

auto ISqrt64(uint64_t value) -> uint64_t {
  uint64_t op = value;
  uint64_t res = 0;
  uint64_t one = uint64_t{1} << 62;
  while (one > op) {
    one >>= 2;
  }
  while (one != 0) {
    if (op >= res + one) {
      op -= res + one;
      res = (res >> 1) + one;
    } else {
      res >>= 1;
    }
    one >>= 2;
  }
  if (op > res) {
    ++res;
  }
  return res;
}

auto ExpSeriesQ30(int64_t r) -> int64_t {
  int64_t sum = kQ30One;
  int64_t term = kQ30One;
  for (int64_t i = 1; i <= 16; ++i) {
    term = MulQ30(term, r) / i;
    if (term == 0) {
      break;
    }
    sum += term;
  }
  return sum;
}

auto ScaleQ30ByPow2(int64_t value, int k) -> Fixed {
  int shift = kQ30ToQ16Shift - k;
  if (shift <= 0) {
    if (-shift > 30) {
      if (value == 0) {
        return 0;
      }
      return value > 0 ? fixed::kMaxFixed : fixed::kMinFixed;
    }
    return fixed::SaturateToFixed(value * (int64_t{1} << -shift));
  }
  if (shift >= 62) {
    return 0;
  }
  int64_t rounding = int64_t{1} << (shift - 1);
  return fixed::SaturateToFixed((value + rounding) >> shift);
}

}  // namespace lumen::builtins::detail

namespace {

using lumen::fixed::Fixed;
namespace fixed = lumen::fixed;
namespace detail = lumen::builtins::detail;

// exp(x) saturates at or above this input and flushes to zero at or below
// kExpFlushToZero.
constexpr Fixed kExpSaturate = 681391;      // ~10.3972
constexpr Fixed kExpFlushToZero = -772243;  // ~-11.7835

// Beyond this magnitude x*x no longer fits; asinh/acosh use log(2x).
constexpr Fixed kLargeHyperbolicArg = 128 << fixed::kFracBits;

// tanh is exactly +-1 in Q16.16 past this point.
constexpr Fixed kTanhSaturate = 8 << fixed::kFracBits;

// Below this magnitude sinh uses its series (avoids exp cancellation).
constexpr Fixed kSinhSeriesLimit = fixed::kHalf;

auto ExpImpl(Fixed x) -> Fixed {
  if (x == 0) {
    return fixed::kOne;
  }
  if (x >= kExpSaturate) {
    return fixed::kMaxFixed;
  }
  if (x <= kExpFlushToZero) {
    return 0;
  }
  // x = k*ln2 + r with |r| < ln2, so e^x = 2^k * e^r.
  int64_t x30 = detail::FixedToQ30(x);
  auto k = static_cast<int>(x30 / detail::kQ30Ln2);
  int64_t r = x30 - (static_cast<int64_t>(k) * detail::kQ30Ln2);
  return detail::ScaleQ30ByPow2(detail::ExpSeriesQ30(r), k);
}

auto Exp2Impl(Fixed x) -> Fixed {
  if (x >= (15 << fixed::kFracBits)) {
    return fixed::kMaxFixed;
  }
  if (x <= -(17 << fixed::kFracBits)) {
    return 0;
  }
  int n = x >> fixed::kFracBits;
  int64_t frac = x & fixed::kFracMask;
  int64_t r = (frac * detail::kQ30Ln2) >> fixed::kFracBits;
  return detail::ScaleQ30ByPow2(detail::ExpSeriesQ30(r), n);
}

// Binary logarithm by repeated squaring of the normalized mantissa; each
// squaring yields one fractional bit.
auto Log2Impl(Fixed x) -> Fixed {
  if (x <= 0) {
    return fixed::kMinFixed;
  }
  auto v = static_cast<uint32_t>(x);
  int msb = 31 - std::countl_zero(v);
  uint64_t mantissa = static_cast<uint64_t>(v) << (30 - msb);
  constexpr uint64_t kTwo = uint64_t{1} << 31;

  int64_t frac = 0;
  for (int i = 0; i < fixed::kFracBits; ++i) {
    mantissa = (mantissa * mantissa) >> 30;
    frac <<= 1;
    if (mantissa >= kTwo) {
      frac |= 1;
      mantissa >>= 1;
    }
  }
  mantissa = (mantissa * mantissa) >> 30;
  if (mantissa >= kTwo) {
    ++frac;
  }
  int64_t integer_part = msb - fixed::kFracBits;
  return fixed::SaturateToFixed((integer_part << fixed::kFracBits) + frac);
}

auto LogImpl(Fixed x) -> Fixed {
  if (x <= 0) {
    return fixed::kMinFixed;
  }
  int64_t log2 = Log2Impl(x);
  constexpr int64_t kRound = int64_t{1} << (detail::kQ30Bits - 1);
  return fixed::SaturateToFixed(
      (log2 * detail::kQ30Ln2 + kRound) >> detail::kQ30Bits);
}

auto SqrtImpl(Fixed x) -> Fixed {
  if (x <= 0) {
    return 0;
  }
  uint64_t widened = static_cast<uint64_t>(x) << fixed::kFracBits;
  return static_cast<Fixed>(detail::ISqrt64(widened));
}

auto PowImpl(Fixed x, Fixed y) -> Fixed {
  if (y == 0) {
    return fixed::kOne;
  }
  if (x == 0) {
    return y > 0 ? 0 : fixed::kMaxFixed;
  }
  bool negate = false;
  if (x < 0) {
    // Negative base only has a real result for integral exponents.
    if ((y & fixed::kFracMask) != 0) {
      return 0;
    }
    negate = ((y >> fixed::kFracBits) & 1) != 0;
    x = x == fixed::kMinFixed ? fixed::kMaxFixed : -x;
  }
  int64_t exponent =
      (static_cast<int64_t>(Log2Impl(x)) * y) >> fixed::kFracBits;
  Fixed result = Exp2Impl(fixed::SaturateToFixed(exponent));
  return negate ? fixed::Negate(result) : result;
}

auto SinhImpl(Fixed x) -> Fixed {
  if (x > -kSinhSeriesLimit && x < kSinhSeriesLimit) {
    // x + x^3/6 + x^5/120
    int64_t x30 = detail::FixedToQ30(x);
    int64_t x2 = detail::MulQ30(x30, x30);
    int64_t x3 = detail::MulQ30(x30, x2);
    int64_t x5 = detail::MulQ30(x3, x2);
    return detail::Q30ToFixed(x30 + (x3 / 6) + (x5 / 120));
  }
  int64_t pos = ExpImpl(x);
  int64_t neg = ExpImpl(fixed::Negate(x));
  return fixed::SaturateToFixed((pos - neg) / 2);
}

auto CoshImpl(Fixed x) -> Fixed {
  int64_t pos = ExpImpl(x);
  int64_t neg = ExpImpl(fixed::Negate(x));
  return fixed::SaturateToFixed((pos + neg) / 2);
}

auto TanhImpl(Fixed x) -> Fixed {
  if (x >= kTanhSaturate) {
    return fixed::kOne;
  }
  if (x <= -kTanhSaturate) {
    return -fixed::kOne;
  }
  if (x > -kSinhSeriesLimit && x < kSinhSeriesLimit) {
    return fixed::Div(SinhImpl(x), CoshImpl(x));
  }
  Fixed e2 = ExpImpl(x * 2);
  return fixed::Div(
      fixed::Sub(e2, fixed::kOne), fixed::Add(e2, fixed::kOne));
}

auto AsinhImpl(Fixed x) -> Fixed {
  bool negative = x < 0;
  Fixed a = negative ? fixed::Abs(x) : x;
  if (a < 0) {
    a = fixed::kMaxFixed;
  }
  Fixed result = 0;
  if (a > kLargeHyperbolicArg) {
    result = fixed::Add(LogImpl(a), fixed::kLn2);
  } else {
    Fixed root = SqrtImpl(fixed::Add(fixed::Mul(a, a), fixed::kOne));
    result = LogImpl(fixed::Add(a, root));
  }
  return negative ? -result : result;
}

auto AcoshImpl(Fixed x) -> Fixed {
  if (x < fixed::kOne) {
    return 0;
  }
  if (x > kLargeHyperbolicArg) {
    return fixed::Add(LogImpl(x), fixed::kLn2);
  }
  Fixed root = SqrtImpl(fixed::Sub(fixed::Mul(x, x), fixed::kOne));
  return LogImpl(fixed::Add(x, root));
}

auto AtanhImpl(Fixed x) -> Fixed {
  if (x >= fixed::kOne) {
    return fixed::kMaxFixed;
  }
  if (x <= -fixed::kOne) {
    return fixed::kMinFixed;
  }
  Fixed ratio = fixed::Div(fixed::kOne + x, fixed::kOne - x);
  return LogImpl(ratio) / 2;
}

}  // namespace

extern "C" {

auto LumenQ32Exp(int32_t x) -> int32_t {
  return ExpImpl(x);
}

auto LumenQ32Exp2(int32_t x) -> int32_t {
  return Exp2Impl(x);
}

auto LumenQ32Log(int32_t x) -> int32_t {
  return LogImpl(x);
}

auto LumenQ32Log2(int32_t x) -> int32_t {
  return Log2Impl(x);
}

auto LumenQ32Pow(int32_t x, int32_t y) -> int32_t {
  return PowImpl(x, y);
}

auto LumenQ32Sqrt(int32_t x) -> int32_t {
  return SqrtImpl(x);
}

auto LumenQ32InverseSqrt(int32_t x) -> int32_t {
  if (x <= 0) {
    return fixed::kMaxFixed;
  }
  // sqrt(x) with 24 fractional bits keeps precision for small inputs.
  uint64_t root = detail::ISqrt64(static_cast<uint64_t>(x) << 32);
  if (root == 0) {
    return fixed::kMaxFixed;
  }
  constexpr uint64_t kNumerator = uint64_t{1} << 40;
  uint64_t result = (kNumerator + (root / 2)) / root;
  return result > static_cast<uint64_t>(fixed::kMaxFixed)
             ? fixed::kMaxFixed
             : static_cast<int32_t>(result);
}

auto LumenQ32Ldexp(int32_t x, int32_t exponent) -> int32_t {
  if (x == 0) {
    return 0;
  }
  if (exponent >= 31) {
    return x > 0 ? fixed::kMaxFixed : fixed::kMinFixed;
  }
  if (exponent >= 0) {
    return fixed::SaturateToFixed(
        static_cast<int64_t>(x) * (int64_t{1} << exponent));
  }
  int shift = exponent <= -31 ? 31 : -exponent;
  return x >> shift;
}

auto LumenQ32Sinh(int32_t x) -> int32_t {
  return SinhImpl(x);
}

auto LumenQ32Cosh(int32_t x) -> int32_t {
  return CoshImpl(x);
}

auto LumenQ32Tanh(int32_t x) -> int32_t {
  return TanhImpl(x);
}

auto LumenQ32Asinh(int32_t x) -> int32_t {
  return AsinhImpl(x);
}

auto LumenQ32Acosh(int32_t x) -> int32_t {
  return AcoshImpl(x);
}

auto LumenQ32Atanh(int32_t x) -> int32_t {
  return AtanhImpl(x);
}

}  // extern "C"
