#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <set>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/builtins/lpfx_builtins.hpp"
#include "lumen/fixed/q32.hpp"
#include "tests/common/jit_util.hpp"

namespace lumen::builtins {
namespace {

using fixed::kOne;
using test::Q;

// Two hundredths in Q16.16.
constexpr int32_t kColorTolerance = 1311;

class LpfxTest : public ::testing::Test {
 protected:
  // Points spread over a few cells, away from the origin.
  static auto Samples() -> std::array<int32_t, 9> {
    return {Q(-7.3), Q(-2.75), Q(-0.4), Q(0.15), Q(0.6),
            Q(1.33), Q(2.9),   Q(5.05), Q(11.7)};
  }
};

// =============================================================================
// Table
// =============================================================================

TEST_F(LpfxTest, LibrarySymbols) {
  EXPECT_EQ(Q32SymbolName(BuiltinId::kLpfxHash1), "__lpfx_hash_1");
  EXPECT_EQ(Q32SymbolName(BuiltinId::kLpfxHash3), "__lpfx_hash_3");
  EXPECT_EQ(Q32SymbolName(BuiltinId::kLpfxSnoise2), "__lpfx_snoise2_q32");
  EXPECT_EQ(Q32SymbolName(BuiltinId::kLpfxWorley3), "__lpfx_worley3_q32");
  EXPECT_EQ(
      Q32SymbolName(BuiltinId::kLpfxPsrdnoise3), "__lpfx_psrdnoise3_q32");
  EXPECT_EQ(
      Q32SymbolName(BuiltinId::kLpfxSaturateVec4),
      "__lpfx_saturate_vec4_q32");
  EXPECT_EQ(Q32SymbolName(BuiltinId::kLpfxHue2rgb), "__lpfx_hue2rgb_q32");
  EXPECT_EQ(
      Q32SymbolName(BuiltinId::kLpfxRgb2hsvVec4), "__lpfx_rgb2hsv_vec4_q32");
}

TEST_F(LpfxTest, AbiAndArity) {
  const auto& hash2 = GetBuiltinInfo(BuiltinId::kLpfxHash2);
  EXPECT_EQ(hash2.abi, BuiltinAbi::kScalar);
  EXPECT_EQ(hash2.arity, 3);

  // out pointer + three channels
  const auto& rgb2hsv = GetBuiltinInfo(BuiltinId::kLpfxRgb2hsv);
  EXPECT_EQ(rgb2hsv.abi, BuiltinAbi::kResultPointer);
  EXPECT_EQ(rgb2hsv.arity, 4);

  // x, y, period x, period y, alpha, gradient pointer, seed
  const auto& psrd2 = GetBuiltinInfo(BuiltinId::kLpfxPsrdnoise2);
  EXPECT_EQ(psrd2.abi, BuiltinAbi::kGradientOut);
  EXPECT_EQ(psrd2.arity, 7);
}

TEST_F(LpfxTest, OnlyLibraryIdsAreLibraryBuiltins) {
  EXPECT_FALSE(IsLibraryBuiltin(BuiltinId::kSin));
  EXPECT_FALSE(IsLibraryBuiltin(BuiltinId::kHostLog));
  EXPECT_TRUE(IsLibraryBuiltin(BuiltinId::kLpfxHash1));
  EXPECT_TRUE(IsLibraryBuiltin(BuiltinId::kLpfxRgb2hsvVec4));
}

// =============================================================================
// Hashes
// =============================================================================

TEST_F(LpfxTest, HashOfZero) {
  EXPECT_EQ(LumenLpfxHash1(0, 0), 0U);
  // Only the seed survives the first mixing round.
  EXPECT_EQ(LumenLpfxHash1(0, 1), 249222277U);
}

TEST_F(LpfxTest, HashIsDeterministic) {
  EXPECT_EQ(LumenLpfxHash1(42, 7), LumenLpfxHash1(42, 7));
  EXPECT_EQ(LumenLpfxHash2(3, 9, 7), LumenLpfxHash2(3, 9, 7));
  EXPECT_EQ(LumenLpfxHash3(3, 9, 27, 7), LumenLpfxHash3(3, 9, 27, 7));
}

// The seed enters before a multiply by an odd constant, so it always
// changes the result.
TEST_F(LpfxTest, SeedChangesHash) {
  for (uint32_t x : {0U, 1U, 17U, 0xFFFFFFFFU}) {
    EXPECT_NE(LumenLpfxHash1(x, 1), LumenLpfxHash1(x, 2)) << x;
  }
}

TEST_F(LpfxTest, HashSpreadsNeighboringInputs) {
  std::set<uint32_t> one;
  std::set<uint32_t> two;
  std::set<uint32_t> three;
  for (uint32_t i = 0; i < 256; ++i) {
    one.insert(LumenLpfxHash1(i, 0));
    two.insert(LumenLpfxHash2(i % 16, i / 16, 0));
    three.insert(LumenLpfxHash3(i % 8, (i / 8) % 8, i / 64, 0));
  }
  EXPECT_GE(one.size(), 250U);
  EXPECT_GE(two.size(), 250U);
  EXPECT_GE(three.size(), 250U);
}

// =============================================================================
// Simplex / Worley
// =============================================================================

// Every kernel but the origin's lies outside its radius at a lattice point,
// and the origin's contributes dot(g, 0).
TEST_F(LpfxTest, SimplexVanishesAtOrigin) {
  for (uint32_t seed : {0U, 5U, 1234U}) {
    EXPECT_EQ(LumenLpfxSimplex2(0, 0, seed), 0) << seed;
    EXPECT_EQ(LumenLpfxSimplex3(0, 0, 0, seed), 0) << seed;
  }
}

TEST_F(LpfxTest, SimplexStaysBounded) {
  for (int32_t x : Samples()) {
    for (int32_t y : Samples()) {
      int32_t n2 = LumenLpfxSimplex2(x, y, 3);
      EXPECT_LE(n2, 3 * kOne);
      EXPECT_GE(n2, -3 * kOne);
      int32_t n3 = LumenLpfxSimplex3(x, y, Q(0.37), 3);
      EXPECT_LE(n3, 3 * kOne);
      EXPECT_GE(n3, -3 * kOne);
    }
  }
}

TEST_F(LpfxTest, SimplexDependsOnSeed) {
  int differing = 0;
  for (int32_t x : Samples()) {
    for (int32_t y : Samples()) {
      if (LumenLpfxSimplex2(x, y, 1) != LumenLpfxSimplex2(x, y, 2)) {
        ++differing;
      }
    }
  }
  EXPECT_GT(differing, 0);
}

// A lattice point is at most half a cell diagonal from its own feature
// point, so the squared distance is at most 0.25.
TEST_F(LpfxTest, WorleyNearItsOwnFeaturePoint) {
  for (uint32_t seed : {0U, 9U, 77U}) {
    EXPECT_LE(LumenLpfxWorley3(0, 0, 0, seed), Q(-0.8)) << seed;
    EXPECT_LE(LumenLpfxWorley3(3 * kOne, -kOne, 0, seed), Q(-0.8))
        << seed;
  }
}

TEST_F(LpfxTest, WorleyStaysInRange) {
  for (int32_t x : Samples()) {
    for (int32_t y : Samples()) {
      int32_t w = LumenLpfxWorley3(x, y, Q(-1.6), 11);
      EXPECT_GE(w, -kOne);
      EXPECT_LE(w, kOne);
    }
  }
}

// =============================================================================
// psrdnoise
// =============================================================================

TEST_F(LpfxTest, Psrdnoise2TilesAlongItsPeriod) {
  const int32_t period = 4 * kOne;
  for (int32_t x : {Q(0.3), Q(1.85), Q(-2.2)}) {
    for (int32_t y : {Q(0.7), Q(-1.1)}) {
      std::array<int32_t, 2> base{};
      std::array<int32_t, 2> shifted{};
      int32_t n0 =
          LumenLpfxPsrdnoise2(x, y, period, 0, 0, base.data(), 0);
      int32_t n1 = LumenLpfxPsrdnoise2(
          x + period, y, period, 0, 0, shifted.data(), 0);
      EXPECT_EQ(n0, n1);
      EXPECT_EQ(base, shifted);
    }
  }
}

// The analytic gradient agrees with a central difference.
TEST_F(LpfxTest, Psrdnoise2GradientMatchesDifference) {
  const int32_t x = Q(0.41);
  const int32_t y = Q(0.23);
  const int32_t alpha = Q(0.5);
  const int32_t h = Q(0.01);
  std::array<int32_t, 2> gradient{};
  std::array<int32_t, 2> scratch{};
  LumenLpfxPsrdnoise2(x, y, 0, 0, alpha, gradient.data(), 0);

  auto at = [&](int32_t px, int32_t py) {
    return fixed::ToDouble(
        LumenLpfxPsrdnoise2(px, py, 0, 0, alpha, scratch.data(), 0));
  };
  double step = fixed::ToDouble(h);
  double dx = (at(x + h, y) - at(x - h, y)) / (2 * step);
  double dy = (at(x, y + h) - at(x, y - h)) / (2 * step);
  EXPECT_NEAR(fixed::ToDouble(gradient[0]), dx, 0.3);
  EXPECT_NEAR(fixed::ToDouble(gradient[1]), dy, 0.3);
}

TEST_F(LpfxTest, Psrdnoise3WritesGradientAndStaysBounded) {
  bool any_gradient = false;
  for (int32_t x : Samples()) {
    std::array<int32_t, 3> gradient{};
    int32_t n = LumenLpfxPsrdnoise3(
        x, Q(0.3), Q(-0.9), 0, 0, 0, Q(1.0), gradient.data(), 0);
    EXPECT_LE(n, 2 * kOne);
    EXPECT_GE(n, -2 * kOne);
    any_gradient = any_gradient || gradient != std::array<int32_t, 3>{};
  }
  EXPECT_TRUE(any_gradient);
}

TEST_F(LpfxTest, PsrdnoiseRotationChangesValue) {
  int differing = 0;
  for (int32_t x : Samples()) {
    std::array<int32_t, 2> gradient{};
    int32_t still =
        LumenLpfxPsrdnoise2(x, Q(0.45), 0, 0, 0, gradient.data(), 0);
    int32_t turned = LumenLpfxPsrdnoise2(
        x, Q(0.45), 0, 0, fixed::kHalfPi, gradient.data(), 0);
    if (still != turned) {
      ++differing;
    }
  }
  EXPECT_GT(differing, 0);
}

// =============================================================================
// Color
// =============================================================================

TEST_F(LpfxTest, SaturateClamps) {
  EXPECT_EQ(LumenLpfxSaturate(Q(-0.5)), 0);
  EXPECT_EQ(LumenLpfxSaturate(Q(0.25)), Q(0.25));
  EXPECT_EQ(LumenLpfxSaturate(Q(7.0)), kOne);

  std::array<int32_t, 4> out{};
  LumenLpfxSaturateVec4(out.data(), Q(-1.0), Q(0.5), Q(1.5), kOne);
  EXPECT_EQ(out, (std::array<int32_t, 4>{0, Q(0.5), kOne, kOne}));
}

TEST_F(LpfxTest, HueToRgbPrimaries) {
  std::array<int32_t, 3> red{};
  LumenLpfxHue2rgb(red.data(), 0);
  EXPECT_EQ(red, (std::array<int32_t, 3>{kOne, 0, 0}));

  std::array<int32_t, 3> green{};
  LumenLpfxHue2rgb(green.data(), Q(1.0 / 3.0));
  EXPECT_NEAR(green[0], 0, kColorTolerance);
  EXPECT_EQ(green[1], kOne);
  EXPECT_NEAR(green[2], 0, kColorTolerance);
}

TEST_F(LpfxTest, RgbToHsvPrimaries) {
  std::array<int32_t, 3> red{};
  LumenLpfxRgb2hsv(red.data(), kOne, 0, 0);
  EXPECT_EQ(red[0], 0);
  EXPECT_NEAR(red[1], kOne, kColorTolerance);
  EXPECT_EQ(red[2], kOne);

  std::array<int32_t, 3> green{};
  LumenLpfxRgb2hsv(green.data(), 0, kOne, 0);
  EXPECT_NEAR(green[0], Q(1.0 / 3.0), kColorTolerance);

  std::array<int32_t, 3> blue{};
  LumenLpfxRgb2hsv(blue.data(), 0, 0, kOne);
  EXPECT_NEAR(blue[0], Q(2.0 / 3.0), kColorTolerance);
}

TEST_F(LpfxTest, GrayHasNoSaturation) {
  std::array<int32_t, 3> gray{};
  LumenLpfxRgb2hsv(gray.data(), Q(0.5), Q(0.5), Q(0.5));
  EXPECT_EQ(gray[0], 0);
  EXPECT_EQ(gray[1], 0);
  EXPECT_EQ(gray[2], Q(0.5));
}

TEST_F(LpfxTest, RgbToHsvPassesAlphaThrough) {
  std::array<int32_t, 4> out{};
  LumenLpfxRgb2hsvVec4(out.data(), kOne, 0, 0, Q(0.25));
  EXPECT_EQ(out[2], kOne);
  EXPECT_EQ(out[3], Q(0.25));
}

}  // namespace
}  // namespace lumen::builtins
