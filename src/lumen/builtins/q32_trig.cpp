#include <cstdint>

#include "lumen/builtins/q32_builtins.hpp"
#include "lumen/fixed/q32.hpp"
#include "q30.hpp"

namespace lumen::builtins::detail {

namespace {

// Minimax coefficients for atan on [0, 1], max error ~1e-5 rad.
constexpr int64_t kAtanC1 = ToQ30(0.9998660);
constexpr int64_t kAtanC3 = ToQ30(-0.3302995);
constexpr int64_t kAtanC5 = ToQ30(0.1801410);
constexpr int64_t kAtanC7 = ToQ30(-0.0851330);
constexpr int64_t kAtanC9 = ToQ30(0.0208351);

constexpr int kSinSeriesTerms = 6;

}  // namespace

auto SinQ30(int64_t angle) -> int64_t {
  // Reduce to [-pi, pi], then fold into [-pi/2, pi/2] where the series
  // converges fastest.
  int64_t a = angle % kQ30TwoPi;
  if (a > kQ30Pi) {
    a -= kQ30TwoPi;
  } else if (a < -kQ30Pi) {
    a += kQ30TwoPi;
  }
  if (a > kQ30HalfPi) {
    a = kQ30Pi - a;
  } else if (a < -kQ30HalfPi) {
    a = -kQ30Pi - a;
  }

  int64_t a2 = MulQ30(a, a);
  int64_t term = a;
  int64_t sum = a;
  for (int64_t n = 1; n <= kSinSeriesTerms; ++n) {
    term = -MulQ30(term, a2) / ((2 * n) * (2 * n + 1));
    sum += term;
  }
  return sum;
}

auto AtanUnitQ30(int64_t t) -> int64_t {
  int64_t t2 = MulQ30(t, t);
  int64_t poly = kAtanC9;
  poly = kAtanC7 + MulQ30(poly, t2);
  poly = kAtanC5 + MulQ30(poly, t2);
  poly = kAtanC3 + MulQ30(poly, t2);
  poly = kAtanC1 + MulQ30(poly, t2);
  return MulQ30(poly, t);
}

}  // namespace lumen::builtins::detail

namespace {

using lumen::fixed::Fixed;
namespace fixed = lumen::fixed;
namespace detail = lumen::builtins::detail;

auto Atan2Impl(Fixed y, Fixed x) -> Fixed {
  if (x == 0 && y == 0) {
    return 0;
  }
  int64_t ay = y < 0 ? -static_cast<int64_t>(y) : y;
  int64_t ax = x < 0 ? -static_cast<int64_t>(x) : x;

  int64_t angle = 0;
  if (ay <= ax) {
    angle = detail::AtanUnitQ30((ay << detail::kQ30Bits) / ax);
  } else {
    angle = detail::kQ30HalfPi -
            detail::AtanUnitQ30((ax << detail::kQ30Bits) / ay);
  }
  if (x < 0) {
    angle = detail::kQ30Pi - angle;
  }
  if (y < 0) {
    angle = -angle;
  }
  return detail::Q30ToFixed(angle);
}

// sqrt(1 - x^2) for |x| <= 1.
auto Complement(Fixed x) -> Fixed {
  Fixed square = fixed::Mul(x, x);
  Fixed remainder = fixed::kOne - square;
  if (remainder <= 0) {
    return 0;
  }
  return LumenQ32Sqrt(remainder);
}

// asin/acos are only defined on [-1, 1]; out-of-range inputs clamp.
auto ClampUnit(Fixed x) -> Fixed {
  if (x > fixed::kOne) {
    return fixed::kOne;
  }
  if (x < -fixed::kOne) {
    return -fixed::kOne;
  }
  return x;
}

}  // namespace

extern "C" {

auto LumenQ32Sin(int32_t x) -> int32_t {
  return detail::Q30ToFixed(detail::SinQ30(detail::FixedToQ30(x)));
}

auto LumenQ32Cos(int32_t x) -> int32_t {
  return detail::Q30ToFixed(
      detail::SinQ30(detail::FixedToQ30(x) + detail::kQ30HalfPi));
}

auto LumenQ32Tan(int32_t x) -> int32_t {
  int64_t angle = detail::FixedToQ30(x);
  int64_t sine = detail::SinQ30(angle);
  int64_t cosine = detail::SinQ30(angle + detail::kQ30HalfPi);
  if (cosine == 0) {
    return sine >= 0 ? fixed::kMaxFixed : fixed::kMinFixed;
  }
  return fixed::SaturateToFixed((sine * fixed::kOne) / cosine);
}

auto LumenQ32Asin(int32_t x) -> int32_t {
  Fixed clamped = ClampUnit(x);
  return Atan2Impl(clamped, Complement(clamped));
}

auto LumenQ32Acos(int32_t x) -> int32_t {
  Fixed clamped = ClampUnit(x);
  return Atan2Impl(Complement(clamped), clamped);
}

auto LumenQ32Atan(int32_t x) -> int32_t {
  return Atan2Impl(x, fixed::kOne);
}

auto LumenQ32Atan2(int32_t y, int32_t x) -> int32_t {
  return Atan2Impl(y, x);
}

}  // extern "C"
