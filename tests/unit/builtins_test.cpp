#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <numbers>
#include <string_view>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/builtins/q32_builtins.hpp"
#include "lumen/fixed/q32.hpp"

namespace lumen::builtins {
namespace {

using fixed::FromDouble;
using fixed::ToDouble;

// One hundredth in Q16.16.
constexpr int32_t kTolerance = 655;

class BuiltinsTest : public ::testing::Test {
 protected:
  static void ExpectNear(int32_t actual, double expected, double tolerance) {
    EXPECT_NEAR(ToDouble(actual), expected, tolerance)
        << fixed::Describe(actual);
  }
};

// =============================================================================
// Table
// =============================================================================

TEST_F(BuiltinsTest, TableFollowsIdOrder) {
  auto all = AllBuiltins();
  ASSERT_FALSE(all.empty());
  for (size_t i = 0; i < all.size(); ++i) {
    EXPECT_EQ(static_cast<size_t>(all[i].id), i);
  }
}

TEST_F(BuiltinsTest, FindByName) {
  EXPECT_EQ(FindBuiltinByName("sin"), BuiltinId::kSin);
  EXPECT_EQ(FindBuiltinByName("inversesqrt"), BuiltinId::kInverseSqrt);
  EXPECT_EQ(FindBuiltinByName("roundeven"), BuiltinId::kRoundEven);
  EXPECT_FALSE(FindBuiltinByName("noise").has_value());
}

TEST_F(BuiltinsTest, SymbolNames) {
  EXPECT_EQ(Q32SymbolName(BuiltinId::kSin), "__lp_q32_sin");
  EXPECT_EQ(Q32SymbolName(BuiltinId::kMul), "__lp_q32_mul");
  EXPECT_EQ(Q32SymbolName(BuiltinId::kInverseSqrt), "__lp_q32_inversesqrt");
}

TEST_F(BuiltinsTest, Arity) {
  EXPECT_EQ(GetBuiltinInfo(BuiltinId::kSin).arity, 1);
  EXPECT_EQ(GetBuiltinInfo(BuiltinId::kAtan2).arity, 2);
  EXPECT_EQ(GetBuiltinInfo(BuiltinId::kFma).arity, 3);
  EXPECT_EQ(GetBuiltinInfo(BuiltinId::kHostLog).abi, BuiltinAbi::kHostLog);
}

// =============================================================================
// Trigonometry
// =============================================================================

TEST_F(BuiltinsTest, SineOfHalfPiIsOne) {
  EXPECT_NEAR(LumenQ32Sin(fixed::kHalfPi), fixed::kOne, kTolerance);
  EXPECT_NEAR(LumenQ32Sin(0x0001921F), fixed::kOne, kTolerance);
}

TEST_F(BuiltinsTest, SineOfOneAndAHalfIsNearOne) {
  EXPECT_NEAR(LumenQ32Sin(0x00018000), fixed::kOne, kTolerance);
}

TEST_F(BuiltinsTest, SineTracksReferenceAcrossPeriods) {
  for (double x = -20.0; x <= 20.0; x += 0.37) {
    ExpectNear(LumenQ32Sin(FromDouble(x)), std::sin(x), 0.005);
  }
}

TEST_F(BuiltinsTest, SineIsOddAndZeroAtZero) {
  EXPECT_EQ(LumenQ32Sin(0), 0);
  for (double x = 0.1; x < 3.0; x += 0.4) {
    int32_t pos = LumenQ32Sin(FromDouble(x));
    int32_t neg = LumenQ32Sin(FromDouble(-x));
    EXPECT_NEAR(pos, -neg, 2);
  }
}

TEST_F(BuiltinsTest, CosineAndTangent) {
  ExpectNear(LumenQ32Cos(0), 1.0, 0.005);
  ExpectNear(LumenQ32Cos(fixed::kPi), -1.0, 0.005);
  ExpectNear(LumenQ32Tan(FromDouble(0.5)), std::tan(0.5), 0.005);
  ExpectNear(LumenQ32Tan(FromDouble(-1.0)), std::tan(-1.0), 0.005);
}

TEST_F(BuiltinsTest, InverseTrig) {
  ExpectNear(LumenQ32Asin(FromDouble(0.5)), std::asin(0.5), 0.005);
  ExpectNear(LumenQ32Acos(FromDouble(0.5)), std::acos(0.5), 0.005);
  ExpectNear(LumenQ32Atan(FromDouble(2.0)), std::atan(2.0), 0.005);
  ExpectNear(LumenQ32Atan2(FromDouble(-1.0), FromDouble(-1.0)),
             std::atan2(-1.0, -1.0), 0.005);
}

TEST_F(BuiltinsTest, AsinClampsOutOfRangeInput) {
  ExpectNear(LumenQ32Asin(FromDouble(3.0)), std::numbers::pi / 2, 0.005);
  ExpectNear(LumenQ32Acos(FromDouble(-3.0)), std::numbers::pi, 0.005);
}

// =============================================================================
// Exponential / logarithm
// =============================================================================

TEST_F(BuiltinsTest, ExpAndLog) {
  EXPECT_EQ(LumenQ32Exp(0), fixed::kOne);
  ExpectNear(LumenQ32Exp(fixed::kOne), std::numbers::e, 0.005);
  ExpectNear(LumenQ32Exp(FromDouble(-2.5)), std::exp(-2.5), 0.005);
  ExpectNear(LumenQ32Log(FromDouble(10.0)), std::log(10.0), 0.005);
  ExpectNear(LumenQ32Log2(FromDouble(8.0)), 3.0, 0.001);
  ExpectNear(LumenQ32Exp2(FromDouble(3.5)), std::exp2(3.5), 0.01);
}

TEST_F(BuiltinsTest, ExpSaturatesAndFlushes) {
  EXPECT_EQ(LumenQ32Exp(FromDouble(20.0)), fixed::kMaxFixed);
  EXPECT_EQ(LumenQ32Exp(FromDouble(-20.0)), 0);
}

TEST_F(BuiltinsTest, LogOfNonPositiveIsMin) {
  EXPECT_EQ(LumenQ32Log(0), fixed::kMinFixed);
  EXPECT_EQ(LumenQ32Log2(-fixed::kOne), fixed::kMinFixed);
}

TEST_F(BuiltinsTest, Pow) {
  ExpectNear(LumenQ32Pow(FromDouble(2.0), FromDouble(10.0)), 1024.0, 2.0);
  ExpectNear(LumenQ32Pow(FromDouble(-2.0), FromDouble(3.0)), -8.0, 0.05);
  EXPECT_EQ(LumenQ32Pow(FromDouble(-2.0), FromDouble(0.5)), 0);
  EXPECT_EQ(LumenQ32Pow(FromDouble(7.0), 0), fixed::kOne);
}

TEST_F(BuiltinsTest, SqrtAndInverseSqrt) {
  EXPECT_EQ(LumenQ32Sqrt(FromDouble(4.0)), FromDouble(2.0));
  ExpectNear(LumenQ32Sqrt(FromDouble(2.0)), std::numbers::sqrt2, 0.001);
  EXPECT_EQ(LumenQ32Sqrt(-fixed::kOne), 0);
  ExpectNear(LumenQ32InverseSqrt(FromDouble(4.0)), 0.5, 0.001);
  EXPECT_EQ(LumenQ32InverseSqrt(0), fixed::kMaxFixed);
}

TEST_F(BuiltinsTest, LdexpTakesPlainIntegerExponent) {
  EXPECT_EQ(LumenQ32Ldexp(FromDouble(1.5), 2), FromDouble(6.0));
  EXPECT_EQ(LumenQ32Ldexp(FromDouble(6.0), -2), FromDouble(1.5));
  EXPECT_EQ(LumenQ32Ldexp(fixed::kOne, 40), fixed::kMaxFixed);
  EXPECT_EQ(LumenQ32Ldexp(-fixed::kOne, 40), fixed::kMinFixed);
}

// =============================================================================
// Hyperbolic
// =============================================================================

TEST_F(BuiltinsTest, Hyperbolic) {
  for (double x : {-2.0, -0.3, 0.2, 1.0, 3.0}) {
    ExpectNear(LumenQ32Sinh(FromDouble(x)), std::sinh(x), 0.01);
    ExpectNear(LumenQ32Cosh(FromDouble(x)), std::cosh(x), 0.01);
    ExpectNear(LumenQ32Tanh(FromDouble(x)), std::tanh(x), 0.005);
  }
  EXPECT_EQ(LumenQ32Tanh(FromDouble(9.0)), fixed::kOne);
  EXPECT_EQ(LumenQ32Tanh(FromDouble(-9.0)), -fixed::kOne);
}

TEST_F(BuiltinsTest, InverseHyperbolic) {
  ExpectNear(LumenQ32Asinh(FromDouble(2.0)), std::asinh(2.0), 0.005);
  ExpectNear(LumenQ32Asinh(FromDouble(-2.0)), std::asinh(-2.0), 0.005);
  ExpectNear(LumenQ32Acosh(FromDouble(3.0)), std::acosh(3.0), 0.005);
  EXPECT_EQ(LumenQ32Acosh(FromDouble(0.5)), 0);
  ExpectNear(LumenQ32Atanh(FromDouble(0.5)), std::atanh(0.5), 0.005);
  EXPECT_EQ(LumenQ32Atanh(fixed::kOne), fixed::kMaxFixed);
}

// =============================================================================
// Arithmetic entry points
// =============================================================================

TEST_F(BuiltinsTest, ArithmeticMatchesFixedHelpers) {
  int32_t a = FromDouble(12.5);
  int32_t b = FromDouble(-3.25);
  EXPECT_EQ(LumenQ32Add(a, b), fixed::Add(a, b));
  EXPECT_EQ(LumenQ32Sub(a, b), fixed::Sub(a, b));
  EXPECT_EQ(LumenQ32Mul(a, b), fixed::Mul(a, b));
  EXPECT_EQ(LumenQ32Div(a, b), fixed::Div(a, b));
  EXPECT_EQ(LumenQ32Mod(a, b), fixed::Mod(a, b));
  EXPECT_EQ(LumenQ32Fma(a, b, a), fixed::Fma(a, b, a));
  EXPECT_EQ(LumenQ32Round(a), fixed::Round(a));
  EXPECT_EQ(LumenQ32RoundEven(a), fixed::RoundEven(a));
}

TEST_F(BuiltinsTest, HostLogAcceptsUnterminatedStrings) {
  constexpr std::string_view kModule = "shader::main";
  constexpr std::string_view kMessage = "frame done";
  LumenHostLog(
      2, kModule.data(), kModule.size(), kMessage.data(), kMessage.size());
  LumenHostLog(0, nullptr, 0, nullptr, 0);
}

}  // namespace
}  // namespace lumen::builtins
