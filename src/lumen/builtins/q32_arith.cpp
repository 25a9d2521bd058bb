#include <cstdint>

#include "lumen/builtins/q32_builtins.hpp"
#include "lumen/fixed/q32.hpp"

// Thin C-ABI wrappers over the value model. Add/sub saturate: a call only
// happens in precise mode.

extern "C" {

auto LumenQ32Add(int32_t a, int32_t b) -> int32_t {
  return lumen::fixed::Add(a, b, lumen::fixed::ArithMode::kPrecise);
}

auto LumenQ32Sub(int32_t a, int32_t b) -> int32_t {
  return lumen::fixed::Sub(a, b, lumen::fixed::ArithMode::kPrecise);
}

auto LumenQ32Mul(int32_t a, int32_t b) -> int32_t {
  return lumen::fixed::Mul(a, b);
}

auto LumenQ32Div(int32_t a, int32_t b) -> int32_t {
  return lumen::fixed::Div(a, b);
}

auto LumenQ32Mod(int32_t x, int32_t y) -> int32_t {
  return lumen::fixed::Mod(x, y);
}

auto LumenQ32Fma(int32_t a, int32_t b, int32_t c) -> int32_t {
  return lumen::fixed::Fma(a, b, c);
}

auto LumenQ32Round(int32_t x) -> int32_t {
  return lumen::fixed::Round(x);
}

auto LumenQ32RoundEven(int32_t x) -> int32_t {
  return lumen::fixed::RoundEven(x);
}

}  // extern "C"
