#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

#include "lumen/builtins/lpfx_builtins.hpp"
#include "lumen/builtins/q32_builtins.hpp"
#include "lumen/fixed/q32.hpp"

// Periodic rotating simplex noise with analytic derivatives, after Gustavson
// and McEwan's psrdnoise, evaluated in Q16.16.

namespace {

using lumen::fixed::Add;
using lumen::fixed::Fixed;
using lumen::fixed::Floor;
using lumen::fixed::Fract;
using lumen::fixed::FromInt;
using lumen::fixed::kFracBits;
using lumen::fixed::kHalf;
using lumen::fixed::kOne;
using lumen::fixed::Mod;
using lumen::fixed::Mul;
using lumen::fixed::Sub;

// Lattice hashes run on exact integers; the permutation polynomials exceed
// the Q16.16 range long before the final reduction.
auto Mod289(int64_t x) -> int64_t {
  int64_t r = x % 289;
  return r < 0 ? r + 289 : r;
}

auto Vec(Fixed x, Fixed y, Fixed z) -> std::array<Fixed, 3> {
  return {x, y, z};
}

template <size_t N>
auto Dot(const std::array<Fixed, N>& a, const std::array<Fixed, N>& b)
    -> Fixed {
  Fixed sum = 0;
  for (size_t i = 0; i < N; ++i) {
    sum = Add(sum, Mul(a[i], b[i]));
  }
  return sum;
}

template <size_t N>
auto Minus(const std::array<Fixed, N>& a, const std::array<Fixed, N>& b)
    -> std::array<Fixed, N> {
  std::array<Fixed, N> out{};
  for (size_t i = 0; i < N; ++i) {
    out[i] = Sub(a[i], b[i]);
  }
  return out;
}

// sum += v * w, component-wise.
template <size_t N>
void Accumulate(
    std::array<Fixed, N>& sum, const std::array<Fixed, N>& v, Fixed w) {
  for (size_t i = 0; i < N; ++i) {
    sum[i] = Add(sum[i], Mul(v[i], w));
  }
}

namespace plane {

constexpr Fixed kHashScale = 4904;     // 0.07482
constexpr Fixed kDecay = 52429;        // 0.8
constexpr Fixed kNoiseScale = 714342;  // 10.9

using Vec2 = std::array<Fixed, 2>;

// Lattice hash of a wrapped corner, in [0, 289).
auto Hash(int32_t iu, int32_t iv) -> Fixed {
  int64_t h = Mod289(iu);
  h = Mod289((h * 51 + 2) * h + iv);
  h = Mod289((h * 34 + 10) * h);
  return FromInt(static_cast<int32_t>(h));
}

auto Noise(Vec2 x, Vec2 period, Fixed alpha, Fixed* gradient) -> Fixed {
  // Skewed grid with a 60 degree lattice.
  Vec2 uv{Add(x[0], Mul(x[1], kHalf)), x[1]};
  Vec2 i0{Floor(uv[0]), Floor(uv[1])};
  Vec2 f0{Fract(uv[0]), Fract(uv[1])};
  Fixed step = f0[1] <= f0[0] ? kOne : 0;
  Vec2 o1{step, Sub(kOne, step)};

  std::array<Vec2, 3> cells = {
      i0, Vec2{Add(i0[0], o1[0]), Add(i0[1], o1[1])},
      Vec2{Add(i0[0], kOne), Add(i0[1], kOne)}};

  Vec2 v0{Sub(i0[0], Mul(i0[1], kHalf)), i0[1]};
  std::array<Vec2, 3> corners = {
      v0,
      Vec2{Sub(Add(v0[0], o1[0]), Mul(o1[1], kHalf)), Add(v0[1], o1[1])},
      Vec2{Add(v0[0], kHalf), Add(v0[1], kOne)}};

  bool wrap = period[0] > 0 || period[1] > 0;
  Fixed n = 0;
  Vec2 dn{0, 0};
  for (size_t k = 0; k < corners.size(); ++k) {
    Vec2 d = Minus(x, corners[k]);

    int32_t iu = cells[k][0] >> kFracBits;
    int32_t iv = cells[k][1] >> kFracBits;
    if (wrap) {
      Fixed xw = period[0] > 0 ? Mod(corners[k][0], period[0]) : corners[k][0];
      Fixed yw = period[1] > 0 ? Mod(corners[k][1], period[1]) : corners[k][1];
      iu = Add(Add(xw, Mul(yw, kHalf)), kHalf) >> kFracBits;
      iv = Add(yw, kHalf) >> kFracBits;
    }

    Fixed psi = Add(Mul(Hash(iu, iv), kHashScale), alpha);
    Vec2 g{LumenQ32Cos(psi), LumenQ32Sin(psi)};

    Fixed w = Sub(kDecay, Dot(d, d));
    if (w < 0) {
      w = 0;
    }
    Fixed w2 = Mul(w, w);
    Fixed w4 = Mul(w2, w2);
    Fixed gdotx = Dot(g, d);
    n = Add(n, Mul(w4, gdotx));

    Fixed dw = Mul(Mul(-8 * kOne, Mul(w2, w)), gdotx);
    Accumulate(dn, g, w4);
    Accumulate(dn, d, dw);
  }

  gradient[0] = Mul(dn[0], kNoiseScale);
  gradient[1] = Mul(dn[1], kNoiseScale);
  return Mul(kNoiseScale, n);
}

}  // namespace plane

namespace volume {

constexpr Fixed kDecay = 32768;         // 0.5
constexpr Fixed kNoiseScale = 2588672;  // 39.5
constexpr Fixed kThetaScale = 254545;   // 3.883222077
constexpr Fixed kHeightScale = -454;    // -0.006920415
constexpr Fixed kHeightBias = 65296;    // 0.996539792
constexpr Fixed kPsiScale = 7124;       // 0.108705628
constexpr Fixed kOneThird = 21845;
constexpr Fixed kOneSixth = 10923;

using Vec3 = std::array<Fixed, 3>;

auto Permute(int64_t v) -> int64_t {
  return Mod289((v * 34 + 1) * v);
}

// Nested permutation of the wrapped lattice coordinates, in [0, 289).
auto Hash(const std::array<int32_t, 3>& cell) -> Fixed {
  int64_t h = Permute(Mod289(cell[2]));
  h = Permute(h + Mod289(cell[1]));
  h = Permute(h + Mod289(cell[0]));
  return FromInt(static_cast<int32_t>(h));
}

auto Sum(const Vec3& v) -> Fixed {
  return Add(Add(v[0], v[1]), v[2]);
}

auto Noise(Vec3 x, Vec3 period, Fixed alpha, Fixed* gradient) -> Fixed {
  Fixed skew = Mul(Sum(x), kOneThird);
  Vec3 uvw{Add(x[0], skew), Add(x[1], skew), Add(x[2], skew)};
  Vec3 i0{Floor(uvw[0]), Floor(uvw[1]), Floor(uvw[2])};
  Vec3 f0{Fract(uvw[0]), Fract(uvw[1]), Fract(uvw[2])};

  // Corner order from the ranking of the fractional parts.
  auto step = [](Fixed edge, Fixed v) { return v >= edge ? kOne : 0; };
  Vec3 g_{step(f0[0], f0[1]), step(f0[1], f0[2]), step(f0[0], f0[2])};
  Vec3 l_{Sub(kOne, g_[0]), Sub(kOne, g_[1]), Sub(kOne, g_[2])};
  Vec3 g{l_[2], g_[0], g_[1]};
  Vec3 l{l_[0], l_[1], g_[2]};

  std::array<Vec3, 4> cells{};
  for (size_t a = 0; a < 3; ++a) {
    cells[0][a] = i0[a];
    cells[1][a] = Add(i0[a], std::min(g[a], l[a]));
    cells[2][a] = Add(i0[a], std::max(g[a], l[a]));
    cells[3][a] = Add(i0[a], kOne);
  }

  bool wrap = period[0] > 0 || period[1] > 0 || period[2] > 0;
  Fixed n = 0;
  Vec3 dn{0, 0, 0};
  for (const Vec3& cell : cells) {
    Fixed unskew = Mul(Sum(cell), kOneSixth);
    Vec3 corner{
        Sub(cell[0], unskew), Sub(cell[1], unskew), Sub(cell[2], unskew)};
    Vec3 d = Minus(x, corner);

    std::array<int32_t, 3> index{};
    if (wrap) {
      Vec3 vw = corner;
      for (size_t a = 0; a < 3; ++a) {
        if (period[a] > 0) {
          vw[a] = Mod(vw[a], period[a]);
        }
      }
      Fixed reskew = Mul(Sum(vw), kOneThird);
      for (size_t a = 0; a < 3; ++a) {
        index[a] = Add(Add(vw[a], reskew), kHalf) >> kFracBits;
      }
    } else {
      for (size_t a = 0; a < 3; ++a) {
        index[a] = cell[a] >> kFracBits;
      }
    }

    // Gradient on a Fibonacci sphere, rotated about the radius by psi.
    Fixed h = Hash(index);
    Fixed theta = Mul(h, kThetaScale);
    Fixed sz = Add(Mul(h, kHeightScale), kHeightBias);
    Fixed psi = Add(Mul(h, kPsiScale), alpha);
    Fixed ct = LumenQ32Cos(theta);
    Fixed st = LumenQ32Sin(theta);
    Fixed sz_prime = LumenQ32Sqrt(Sub(kOne, Mul(sz, sz)));
    Vec3 q{st, -ct, 0};
    Vec3 p{Mul(sz, q[1]), -Mul(sz, q[0]), sz_prime};
    Fixed sa = LumenQ32Sin(psi);
    Fixed ca = LumenQ32Cos(psi);
    Vec3 grad{};
    for (size_t a = 0; a < 3; ++a) {
      grad[a] = Add(Mul(ca, p[a]), Mul(sa, q[a]));
    }

    Fixed w = Sub(kDecay, Dot(d, d));
    if (w < 0) {
      w = 0;
    }
    Fixed w2 = Mul(w, w);
    Fixed w3 = Mul(w2, w);
    Fixed gdotx = Dot(grad, d);
    n = Add(n, Mul(w3, gdotx));

    Fixed dw = Mul(Mul(w2, gdotx), -6 * kOne);
    Accumulate(dn, grad, w3);
    Accumulate(dn, d, dw);
  }

  for (size_t a = 0; a < 3; ++a) {
    gradient[a] = Mul(dn[a], kNoiseScale);
  }
  return Mul(kNoiseScale, n);
}

}  // namespace volume

}  // namespace

extern "C" {

auto LumenLpfxPsrdnoise2(
    int32_t x, int32_t y, int32_t period_x, int32_t period_y, int32_t alpha,
    int32_t* gradient, uint32_t /*seed*/) -> int32_t {
  return plane::Noise({x, y}, {period_x, period_y}, alpha, gradient);
}

auto LumenLpfxPsrdnoise3(
    int32_t x, int32_t y, int32_t z, int32_t period_x, int32_t period_y,
    int32_t period_z, int32_t alpha, int32_t* gradient, uint32_t /*seed*/)
    -> int32_t {
  return volume::Noise(
      Vec(x, y, z), Vec(period_x, period_y, period_z), alpha, gradient);
}

}  // extern "C"
