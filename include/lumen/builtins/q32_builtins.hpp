#pragma once

#include <cstddef>
#include <cstdint>

// Local builtin implementations. Compiled into the host image and bound to
// the __lp_q32_* symbols when the target has a hosted environment. All
// Q16.16 arguments and results travel as raw int32_t.
//
// The same functions serve as reference implementations in tests and as
// ready-made External implementations an embedding application may supply.

extern "C" {

auto LumenQ32Add(int32_t a, int32_t b) -> int32_t;
auto LumenQ32Sub(int32_t a, int32_t b) -> int32_t;
auto LumenQ32Mul(int32_t a, int32_t b) -> int32_t;
auto LumenQ32Div(int32_t a, int32_t b) -> int32_t;
auto LumenQ32Mod(int32_t x, int32_t y) -> int32_t;
auto LumenQ32Fma(int32_t a, int32_t b, int32_t c) -> int32_t;
auto LumenQ32Round(int32_t x) -> int32_t;
auto LumenQ32RoundEven(int32_t x) -> int32_t;

auto LumenQ32Sin(int32_t x) -> int32_t;
auto LumenQ32Cos(int32_t x) -> int32_t;
auto LumenQ32Tan(int32_t x) -> int32_t;
auto LumenQ32Asin(int32_t x) -> int32_t;
auto LumenQ32Acos(int32_t x) -> int32_t;
auto LumenQ32Atan(int32_t x) -> int32_t;
auto LumenQ32Atan2(int32_t y, int32_t x) -> int32_t;
auto LumenQ32Sinh(int32_t x) -> int32_t;
auto LumenQ32Cosh(int32_t x) -> int32_t;
auto LumenQ32Tanh(int32_t x) -> int32_t;
auto LumenQ32Asinh(int32_t x) -> int32_t;
auto LumenQ32Acosh(int32_t x) -> int32_t;
auto LumenQ32Atanh(int32_t x) -> int32_t;

auto LumenQ32Exp(int32_t x) -> int32_t;
auto LumenQ32Exp2(int32_t x) -> int32_t;
auto LumenQ32Log(int32_t x) -> int32_t;
auto LumenQ32Log2(int32_t x) -> int32_t;
auto LumenQ32Pow(int32_t x, int32_t y) -> int32_t;
auto LumenQ32Sqrt(int32_t x) -> int32_t;
auto LumenQ32InverseSqrt(int32_t x) -> int32_t;
// exponent is a plain integer, not Q16.16.
auto LumenQ32Ldexp(int32_t x, int32_t exponent) -> int32_t;

// Log record from compiled code. level: 0=error 1=warn 2=info 3=debug
// 4=trace. Strings are not NUL-terminated.
void LumenHostLog(
    uint8_t level, const char* module_path, size_t module_len,
    const char* message, size_t message_len);

}  // extern "C"
