#include <array>
#include <cstdint>

#include "lumen/builtins/lpfx_builtins.hpp"
#include "lumen/fixed/q32.hpp"

namespace {

using lumen::fixed::Add;
using lumen::fixed::Div;
using lumen::fixed::Fixed;
using lumen::fixed::FromInt;
using lumen::fixed::kHalf;
using lumen::fixed::kOne;
using lumen::fixed::Mul;
using lumen::fixed::Sub;

constexpr Fixed kTwo = 2 * kOne;
constexpr Fixed kThree = 3 * kOne;

constexpr Fixed kSkew2 = 23967;    // (sqrt(3) - 1) / 2
constexpr Fixed kUnskew2 = 13853;  // (3 - sqrt(3)) / 6
constexpr Fixed kSkew3 = 21845;    // 1/3
constexpr Fixed kUnskew3 = 10923;  // 1/6

constexpr Fixed kInvSqrt2 = 0xB505;
constexpr Fixed kInvSqrt3 = 0x93CD;

struct Vec2 {
  Fixed x;
  Fixed y;
};

struct Vec3 {
  Fixed x;
  Fixed y;
  Fixed z;
};

struct Cell3 {
  int32_t x;
  int32_t y;
  int32_t z;
};

// floor(x) as an integer.
constexpr auto CellOf(Fixed x) -> int32_t {
  return x >> lumen::fixed::kFracBits;
}

auto Dot(Vec2 a, Vec2 b) -> Fixed {
  return Add(Mul(a.x, b.x), Mul(a.y, b.y));
}

auto Dot(Vec3 a, Vec3 b) -> Fixed {
  return Add(Add(Mul(a.x, b.x), Mul(a.y, b.y)), Mul(a.z, b.z));
}

auto Gradient2(uint32_t hash) -> Vec2 {
  switch (hash % 8) {
    case 0:
      return {kOne, 0};
    case 1:
      return {-kOne, 0};
    case 2:
      return {0, kOne};
    case 3:
      return {0, -kOne};
    case 4:
      return {kInvSqrt2, kInvSqrt2};
    case 5:
      return {-kInvSqrt2, kInvSqrt2};
    case 6:
      return {kInvSqrt2, -kInvSqrt2};
    default:
      return {-kInvSqrt2, -kInvSqrt2};
  }
}

// 12 cube edge midpoints (listed twice) and 8 corners.
auto Gradient3(uint32_t hash) -> Vec3 {
  uint32_t index = hash % 32;
  if (index >= 24) {
    return {
        (index & 1) != 0 ? -kInvSqrt3 : kInvSqrt3,
        (index & 2) != 0 ? -kInvSqrt3 : kInvSqrt3,
        (index & 4) != 0 ? -kInvSqrt3 : kInvSqrt3,
    };
  }
  index %= 12;
  Fixed a = (index & 1) != 0 ? -kInvSqrt2 : kInvSqrt2;
  Fixed b = (index & 2) != 0 ? -kInvSqrt2 : kInvSqrt2;
  switch (index / 4) {
    case 0:
      return {a, b, 0};
    case 1:
      return {a, 0, b};
    default:
      return {0, a, b};
  }
}

// (2t^2 + t^4) * dot(g, d) with t = 1 - 2|d|^2; zero outside the kernel.
auto Falloff(Fixed dist_sq, Fixed dot) -> Fixed {
  Fixed t = Sub(kOne, Mul(dist_sq, kTwo));
  if (t <= 0) {
    return 0;
  }
  Fixed t2 = Mul(t, t);
  return Mul(dot, Add(Mul(kTwo, t2), Mul(t2, t2)));
}

auto Surflet2(uint32_t hash, Vec2 d) -> Fixed {
  return Falloff(Dot(d, d), Dot(Gradient2(hash), d));
}

auto Surflet3(uint32_t hash, Vec3 d) -> Fixed {
  return Falloff(Dot(d, d), Dot(Gradient3(hash), d));
}

auto HashCell(Cell3 cell, uint32_t seed) -> uint32_t {
  return LumenLpfxHash3(
      static_cast<uint32_t>(cell.x), static_cast<uint32_t>(cell.y),
      static_cast<uint32_t>(cell.z), seed);
}

// Feature point of a cell: the upper bits of the hash pick a distance in
// [0, 0.5], the lower ones one of 18 directions.
auto FeaturePoint(uint32_t hash, Cell3 cell) -> Vec3 {
  Fixed length = Div(
      Mul(FromInt(static_cast<int32_t>((hash & 0xE0) >> 5)), kHalf),
      FromInt(7));
  Fixed diag = Mul(length, kInvSqrt2);
  Vec3 offset{0, 0, 0};
  switch (hash % 18) {
    case 0:
      offset = {diag, diag, 0};
      break;
    case 1:
      offset = {diag, -diag, 0};
      break;
    case 2:
      offset = {-diag, diag, 0};
      break;
    case 3:
      offset = {-diag, -diag, 0};
      break;
    case 4:
      offset = {diag, 0, diag};
      break;
    case 5:
      offset = {diag, 0, -diag};
      break;
    case 6:
      offset = {-diag, 0, diag};
      break;
    case 7:
      offset = {-diag, 0, -diag};
      break;
    case 8:
      offset = {0, diag, diag};
      break;
    case 9:
      offset = {0, diag, -diag};
      break;
    case 10:
      offset = {0, -diag, diag};
      break;
    case 11:
      offset = {0, -diag, -diag};
      break;
    case 12:
      offset = {length, 0, 0};
      break;
    case 13:
      offset = {0, length, 0};
      break;
    case 14:
      offset = {0, 0, length};
      break;
    case 15:
      offset = {-length, 0, 0};
      break;
    case 16:
      offset = {0, -length, 0};
      break;
    default:
      offset = {0, 0, -length};
      break;
  }
  return {
      Add(FromInt(cell.x), offset.x),
      Add(FromInt(cell.y), offset.y),
      Add(FromInt(cell.z), offset.z),
  };
}

auto DistanceSquared(Vec3 p, uint32_t seed, Cell3 cell) -> Fixed {
  Vec3 point = FeaturePoint(HashCell(cell, seed), cell);
  Vec3 d{Sub(p.x, point.x), Sub(p.y, point.y), Sub(p.z, point.z)};
  return Dot(d, d);
}

}  // namespace

extern "C" {

auto LumenLpfxSimplex2(int32_t x, int32_t y, uint32_t seed) -> int32_t {
  Fixed skew = Mul(Add(x, y), kSkew2);
  int32_t cell_x = CellOf(Add(x, skew));
  int32_t cell_y = CellOf(Add(y, skew));

  Fixed unskew = Mul(Add(FromInt(cell_x), FromInt(cell_y)), kUnskew2);
  Vec2 d0{Sub(x, Sub(FromInt(cell_x), unskew)),
          Sub(y, Sub(FromInt(cell_y), unskew))};

  // Lower triangle steps x first, upper triangle y first.
  int32_t step_x = d0.x > d0.y ? 1 : 0;
  int32_t step_y = 1 - step_x;

  Vec2 d1{Add(Sub(d0.x, FromInt(step_x)), kUnskew2),
          Add(Sub(d0.y, FromInt(step_y)), kUnskew2)};
  Fixed twice_unskew = Mul(kTwo, kUnskew2);
  Vec2 d2{Add(Sub(d0.x, kOne), twice_unskew),
          Add(Sub(d0.y, kOne), twice_unskew)};

  auto hash = [seed](int32_t cx, int32_t cy) {
    return LumenLpfxHash2(
        static_cast<uint32_t>(cx), static_cast<uint32_t>(cy), seed);
  };
  Fixed n0 = Surflet2(hash(cell_x, cell_y), d0);
  Fixed n1 = Surflet2(hash(cell_x + step_x, cell_y + step_y), d1);
  Fixed n2 = Surflet2(hash(cell_x + 1, cell_y + 1), d2);
  return Add(Add(n0, n1), n2);
}

auto LumenLpfxSimplex3(int32_t x, int32_t y, int32_t z, uint32_t seed)
    -> int32_t {
  Fixed skew = Mul(Add(Add(x, y), z), kSkew3);
  Cell3 cell{CellOf(Add(x, skew)), CellOf(Add(y, skew)), CellOf(Add(z, skew))};

  Fixed unskew = Mul(
      Add(Add(FromInt(cell.x), FromInt(cell.y)), FromInt(cell.z)), kUnskew3);
  Vec3 d0{Sub(x, Sub(FromInt(cell.x), unskew)),
          Sub(y, Sub(FromInt(cell.y), unskew)),
          Sub(z, Sub(FromInt(cell.z), unskew))};

  // Traversal order of the tetrahedron containing the point.
  Cell3 first{0, 0, 0};
  Cell3 second{0, 0, 0};
  if (d0.x >= d0.y) {
    if (d0.y >= d0.z) {
      first = {1, 0, 0};
      second = {1, 1, 0};
    } else if (d0.x >= d0.z) {
      first = {1, 0, 0};
      second = {1, 0, 1};
    } else {
      first = {0, 0, 1};
      second = {1, 0, 1};
    }
  } else {
    if (d0.y < d0.z) {
      first = {0, 0, 1};
      second = {0, 1, 1};
    } else if (d0.x < d0.z) {
      first = {0, 1, 0};
      second = {0, 1, 1};
    } else {
      first = {0, 1, 0};
      second = {1, 1, 0};
    }
  }

  auto corner = [&d0](Cell3 step, Fixed bias) {
    return Vec3{
        Add(Sub(d0.x, FromInt(step.x)), bias),
        Add(Sub(d0.y, FromInt(step.y)), bias),
        Add(Sub(d0.z, FromInt(step.z)), bias),
    };
  };
  auto offset = [&cell](Cell3 step) {
    return Cell3{cell.x + step.x, cell.y + step.y, cell.z + step.z};
  };

  Vec3 d1 = corner(first, kUnskew3);
  Vec3 d2 = corner(second, Mul(kTwo, kUnskew3));
  Vec3 d3 = corner(Cell3{1, 1, 1}, Mul(kThree, kUnskew3));

  Fixed n0 = Surflet3(HashCell(cell, seed), d0);
  Fixed n1 = Surflet3(HashCell(offset(first), seed), d1);
  Fixed n2 = Surflet3(HashCell(offset(second), seed), d2);
  Fixed n3 = Surflet3(HashCell(offset(Cell3{1, 1, 1}), seed), d3);
  return Add(Add(n0, n1), Add(n2, n3));
}

auto LumenLpfxWorley3(int32_t x, int32_t y, int32_t z, uint32_t seed)
    -> int32_t {
  Vec3 p{x, y, z};
  Cell3 cell{CellOf(x), CellOf(y), CellOf(z)};
  Vec3 frac{
      Sub(x, FromInt(cell.x)), Sub(y, FromInt(cell.y)),
      Sub(z, FromInt(cell.z))};

  // The nearer neighbor along each axis, and the other one.
  Cell3 nearest{
      frac.x > kHalf ? cell.x + 1 : cell.x,
      frac.y > kHalf ? cell.y + 1 : cell.y,
      frac.z > kHalf ? cell.z + 1 : cell.z};
  Cell3 farther{
      frac.x > kHalf ? cell.x : cell.x + 1,
      frac.y > kHalf ? cell.y : cell.y + 1,
      frac.z > kHalf ? cell.z : cell.z + 1};

  Fixed distance = DistanceSquared(p, seed, nearest);

  auto squared_gap = [](Fixed f) {
    Fixed gap = Sub(kHalf, f);
    return Mul(gap, gap);
  };
  std::array<Fixed, 3> range = {
      squared_gap(frac.x), squared_gap(frac.y), squared_gap(frac.z)};

  // Neighbors across one, two and three cell faces, visited only while the
  // face is closer than the best distance so far.
  constexpr std::array<uint8_t, 7> kNeighbors = {
      0b001, 0b010, 0b100, 0b011, 0b101, 0b110, 0b111};
  for (uint8_t axes : kNeighbors) {
    bool reachable = true;
    for (int axis = 0; axis < 3; ++axis) {
      if ((axes & (1U << axis)) != 0 && range[axis] >= distance) {
        reachable = false;
      }
    }
    if (!reachable) {
      continue;
    }
    Cell3 candidate{
        (axes & 0b001) != 0 ? farther.x : nearest.x,
        (axes & 0b010) != 0 ? farther.y : nearest.y,
        (axes & 0b100) != 0 ? farther.z : nearest.z};
    Fixed d = DistanceSquared(p, seed, candidate);
    if (d < distance) {
      distance = d;
    }
  }

  return Sub(Mul(Div(distance, kThree), kTwo), kOne);
}

}  // extern "C"
