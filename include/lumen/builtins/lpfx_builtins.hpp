#pragma once

#include <cstdint>

// Local implementations of the library builtins, bound to the __lpfx_*
// symbols on hosted targets. Q16.16 values travel as raw int32_t; hashes
// and seeds are plain uint32_t. Vector results are written through `out`
// in component order.

extern "C" {

// Integer hashes. Wrapping arithmetic; identical on every target.
auto LumenLpfxHash1(uint32_t x, uint32_t seed) -> uint32_t;
auto LumenLpfxHash2(uint32_t x, uint32_t y, uint32_t seed) -> uint32_t;
auto LumenLpfxHash3(uint32_t x, uint32_t y, uint32_t z, uint32_t seed)
    -> uint32_t;

// Simplex noise, roughly in [-1, 1]. Also bound to the snoise symbols.
auto LumenLpfxSimplex2(int32_t x, int32_t y, uint32_t seed) -> int32_t;
auto LumenLpfxSimplex3(int32_t x, int32_t y, int32_t z, uint32_t seed)
    -> int32_t;

// Distance to the nearest cell feature point, mapped to [-1, 1].
auto LumenLpfxWorley3(int32_t x, int32_t y, int32_t z, uint32_t seed)
    -> int32_t;

// Periodic rotating simplex noise. A period of 0 disables wrapping on that
// axis. The analytic gradient is written to gradient[0..N). The seed is
// accepted for symbol compatibility and ignored.
auto LumenLpfxPsrdnoise2(
    int32_t x, int32_t y, int32_t period_x, int32_t period_y, int32_t alpha,
    int32_t* gradient, uint32_t seed) -> int32_t;
auto LumenLpfxPsrdnoise3(
    int32_t x, int32_t y, int32_t z, int32_t period_x, int32_t period_y,
    int32_t period_z, int32_t alpha, int32_t* gradient, uint32_t seed)
    -> int32_t;

// Clamp to [0, 1].
auto LumenLpfxSaturate(int32_t x) -> int32_t;
void LumenLpfxSaturateVec3(int32_t* out, int32_t x, int32_t y, int32_t z);
void LumenLpfxSaturateVec4(
    int32_t* out, int32_t x, int32_t y, int32_t z, int32_t w);

// Hue in [0, 1] to a fully saturated RGB color.
void LumenLpfxHue2rgb(int32_t* out, int32_t hue);
// RGB to HSV, all channels in [0, 1]. The vec4 form passes alpha through.
void LumenLpfxRgb2hsv(int32_t* out, int32_t r, int32_t g, int32_t b);
void LumenLpfxRgb2hsvVec4(
    int32_t* out, int32_t r, int32_t g, int32_t b, int32_t a);

}  // extern "C"
