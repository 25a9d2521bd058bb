#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace lumen::ir {

// Every scalar occupies 4 bytes in memory. kFloat is Q16.16 after lowering;
// kBool is stored as an i32 holding 0 or 1.
enum class ScalarKind : uint8_t { kFloat, kInt, kUint, kBool };

inline constexpr uint32_t kComponentSize = 4;
inline constexpr uint8_t kMaxComponents = 4;

auto ToString(ScalarKind kind) -> std::string_view;

// Shape of a value: a scalar or vector of up to four components, optionally
// an array of those. A matrix is an array of column vectors
// (components = rows, array_length = columns).
struct ValueType {
  ScalarKind scalar = ScalarKind::kFloat;
  uint8_t components = 1;
  uint32_t array_length = 0;  // 0 = not an array

  auto operator==(const ValueType&) const -> bool = default;

  static auto Scalar(ScalarKind kind) -> ValueType {
    return ValueType{.scalar = kind, .components = 1, .array_length = 0};
  }
  static auto Vector(ScalarKind kind, uint8_t n) -> ValueType {
    return ValueType{.scalar = kind, .components = n, .array_length = 0};
  }
  static auto Matrix(uint8_t columns, uint8_t rows) -> ValueType {
    return ValueType{
        .scalar = ScalarKind::kFloat,
        .components = rows,
        .array_length = columns};
  }
  static auto Array(ValueType element, uint32_t length) -> ValueType {
    element.array_length = length;
    return element;
  }

  [[nodiscard]] auto IsArray() const -> bool {
    return array_length != 0;
  }
  // Components per array element (or of the whole value if not an array).
  [[nodiscard]] auto ElementComponents() const -> uint32_t {
    return components;
  }
  [[nodiscard]] auto TotalComponents() const -> uint32_t {
    return components * (array_length == 0 ? 1 : array_length);
  }
  [[nodiscard]] auto ElementSizeBytes() const -> uint32_t {
    return components * kComponentSize;
  }
};

// "vec3", "int", "float[4]", "mat2"-style rendering for diagnostics.
auto ToString(const ValueType& type) -> std::string;

}  // namespace lumen::ir
