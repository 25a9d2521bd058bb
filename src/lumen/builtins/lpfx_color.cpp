#include <algorithm>
#include <cstdint>

#include "lumen/builtins/lpfx_builtins.hpp"
#include "lumen/fixed/q32.hpp"

namespace {

using lumen::fixed::Abs;
using lumen::fixed::Add;
using lumen::fixed::Div;
using lumen::fixed::Fixed;
using lumen::fixed::kOne;
using lumen::fixed::Mul;
using lumen::fixed::Sub;

constexpr Fixed kTwo = 2 * kOne;
constexpr Fixed kThree = 3 * kOne;
constexpr Fixed kFour = 4 * kOne;
constexpr Fixed kSix = 6 * kOne;

// Keeps the hue and saturation divisions finite for black and gray.
constexpr Fixed kEpsilon = 1;

constexpr Fixed kMinusOneThird = -21845;
constexpr Fixed kTwoThirds = 43690;

auto Saturate(Fixed x) -> Fixed {
  return std::clamp(x, Fixed{0}, kOne);
}

// Hue, saturation and value from the two largest channels (Sam Hocevar's
// branchless formulation).
void RgbToHsv(Fixed r, Fixed g, Fixed b, int32_t* out) {
  struct Quad {
    Fixed x;
    Fixed y;
    Fixed z;
    Fixed w;
  };
  Quad p = g < b ? Quad{b, g, -kOne, kTwoThirds}
                 : Quad{g, b, 0, kMinusOneThird};
  Quad q = r < p.x ? Quad{p.x, p.y, p.w, r} : Quad{r, p.y, p.z, p.x};

  Fixed chroma = Sub(q.x, std::min(q.w, q.y));
  out[0] = Abs(Add(
      q.z, Div(Sub(q.w, q.y), Add(Mul(kSix, chroma), kEpsilon))));
  out[1] = Div(chroma, Add(q.x, kEpsilon));
  out[2] = q.x;
}

}  // namespace

extern "C" {

auto LumenLpfxSaturate(int32_t x) -> int32_t {
  return Saturate(x);
}

void LumenLpfxSaturateVec3(int32_t* out, int32_t x, int32_t y, int32_t z) {
  out[0] = Saturate(x);
  out[1] = Saturate(y);
  out[2] = Saturate(z);
}

void LumenLpfxSaturateVec4(
    int32_t* out, int32_t x, int32_t y, int32_t z, int32_t w) {
  out[0] = Saturate(x);
  out[1] = Saturate(y);
  out[2] = Saturate(z);
  out[3] = Saturate(w);
}

void LumenLpfxHue2rgb(int32_t* out, int32_t hue) {
  Fixed h6 = Mul(hue, kSix);
  LumenLpfxSaturateVec3(
      out, Sub(Abs(Sub(h6, kThree)), kOne), Sub(kTwo, Abs(Sub(h6, kTwo))),
      Sub(kTwo, Abs(Sub(h6, kFour))));
}

void LumenLpfxRgb2hsv(int32_t* out, int32_t r, int32_t g, int32_t b) {
  RgbToHsv(r, g, b, out);
}

void LumenLpfxRgb2hsvVec4(
    int32_t* out, int32_t r, int32_t g, int32_t b, int32_t a) {
  RgbToHsv(r, g, b, out);
  out[3] = a;
}

}  // extern "C"
