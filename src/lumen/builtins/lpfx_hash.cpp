#include <cstdint>

#include "lumen/builtins/lpfx_builtins.hpp"

namespace {

constexpr uint32_t kHashKey = 249222277;
constexpr uint32_t kSaltX = 983742189;
constexpr uint32_t kSaltY = 102983473;
constexpr uint32_t kSaltZ = 189203473;

constexpr auto RotateLeft(uint32_t x, int n) -> uint32_t {
  return (x << n) | (x >> (32 - n));
}

constexpr auto RotateRight(uint32_t x, int n) -> uint32_t {
  return (x >> n) | (x << (32 - n));
}

constexpr auto Mix(uint32_t x, uint32_t seed) -> uint32_t {
  x ^= RotateRight(x, 17);
  x *= kHashKey;
  x ^= RotateRight(x, 11) ^ seed;
  x *= kHashKey;
  return x;
}

}  // namespace

extern "C" {

auto LumenLpfxHash1(uint32_t x, uint32_t seed) -> uint32_t {
  return Mix(x, seed);
}

auto LumenLpfxHash2(uint32_t x, uint32_t y, uint32_t seed) -> uint32_t {
  return Mix((x ^ kSaltX) + RotateLeft(y ^ kSaltY, 8), seed);
}

auto LumenLpfxHash3(uint32_t x, uint32_t y, uint32_t z, uint32_t seed)
    -> uint32_t {
  return Mix(
      (x ^ kSaltX) + RotateLeft(y ^ kSaltY, 8) + RotateLeft(z ^ kSaltZ, 16),
      seed);
}

}  // extern "C"
