#include "lumen/ir/operation.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/core.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/overloaded.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/lvalue.hpp"
#include "lumen/ir/value_type.hpp"

namespace lumen::ir {

auto ToString(ScalarKind kind) -> std::string_view {
  switch (kind) {
    case ScalarKind::kFloat:
      return "float";
    case ScalarKind::kInt:
      return "int";
    case ScalarKind::kUint:
      return "uint";
    case ScalarKind::kBool:
      return "bool";
  }
  return "unknown";
}

auto ToString(const ValueType& type) -> std::string {
  std::string base;
  if (type.components == 1) {
    base = std::string(ToString(type.scalar));
  } else {
    std::string_view prefix;
    switch (type.scalar) {
      case ScalarKind::kFloat:
        prefix = "vec";
        break;
      case ScalarKind::kInt:
        prefix = "ivec";
        break;
      case ScalarKind::kUint:
        prefix = "uvec";
        break;
      case ScalarKind::kBool:
        prefix = "bvec";
        break;
    }
    base = fmt::format("{}{}", prefix, type.components);
  }
  if (type.IsArray()) {
    return fmt::format("{}[{}]", base, type.array_length);
  }
  return base;
}

auto Arity(const Operation& op) -> uint8_t {
  return std::visit(
      Overloaded{
          [](const Binary&) -> uint8_t { return 2; },
          [](const Unary&) -> uint8_t { return 1; },
          [](const FusedMultiplyAdd&) -> uint8_t { return 3; },
          [](const Compare&) -> uint8_t { return 2; },
          [](const Transcendental& t) -> uint8_t {
            return builtins::GetBuiltinInfo(ToBuiltin(t.kind)).arity;
          },
          [](const Convert&) -> uint8_t { return 1; },
          [](const Select&) -> uint8_t { return 3; },
          [](const Logical& l) -> uint8_t {
            return l.op == LogicalOp::kNot ? 1 : 2;
          },
          [](const LibraryCall& c) -> uint8_t {
            switch (c.function) {
              case LibraryFunction::kHash:
              case LibraryFunction::kSimplex:
              case LibraryFunction::kSnoise:
              case LibraryFunction::kWorley:
                return 2;
              case LibraryFunction::kPsrdnoise:
                return 3;
              case LibraryFunction::kSaturate:
              case LibraryFunction::kHue2rgb:
              case LibraryFunction::kRgb2hsv:
                return 1;
            }
            throw common::InternalError("Arity", "unknown library function");
          },
      },
      op);
}

auto ToString(BinaryOp op) -> std::string_view {
  switch (op) {
    case BinaryOp::kAdd:
      return "add";
    case BinaryOp::kSubtract:
      return "sub";
    case BinaryOp::kMultiply:
      return "mul";
    case BinaryOp::kDivide:
      return "div";
    case BinaryOp::kModulo:
      return "mod";
    case BinaryOp::kMin:
      return "min";
    case BinaryOp::kMax:
      return "max";
  }
  return "unknown";
}

auto ToString(UnaryOp op) -> std::string_view {
  switch (op) {
    case UnaryOp::kNegate:
      return "neg";
    case UnaryOp::kAbsoluteValue:
      return "abs";
    case UnaryOp::kSign:
      return "sign";
    case UnaryOp::kFloor:
      return "floor";
    case UnaryOp::kCeil:
      return "ceil";
    case UnaryOp::kTrunc:
      return "trunc";
    case UnaryOp::kFract:
      return "fract";
    case UnaryOp::kRound:
      return "round";
    case UnaryOp::kRoundEven:
      return "roundeven";
  }
  return "unknown";
}

auto ToString(ComparePredicate pred) -> std::string_view {
  switch (pred) {
    case ComparePredicate::kEq:
      return "eq";
    case ComparePredicate::kNe:
      return "ne";
    case ComparePredicate::kLt:
      return "lt";
    case ComparePredicate::kLe:
      return "le";
    case ComparePredicate::kGt:
      return "gt";
    case ComparePredicate::kGe:
      return "ge";
  }
  return "unknown";
}

auto ToString(LogicalOp op) -> std::string_view {
  switch (op) {
    case LogicalOp::kAnd:
      return "and";
    case LogicalOp::kOr:
      return "or";
    case LogicalOp::kNot:
      return "not";
  }
  return "unknown";
}

auto ToBuiltin(TranscendentalKind kind) -> builtins::BuiltinId {
  using builtins::BuiltinId;
  switch (kind) {
    case TranscendentalKind::kSin:
      return BuiltinId::kSin;
    case TranscendentalKind::kCos:
      return BuiltinId::kCos;
    case TranscendentalKind::kTan:
      return BuiltinId::kTan;
    case TranscendentalKind::kAsin:
      return BuiltinId::kAsin;
    case TranscendentalKind::kAcos:
      return BuiltinId::kAcos;
    case TranscendentalKind::kAtan:
      return BuiltinId::kAtan;
    case TranscendentalKind::kAtan2:
      return BuiltinId::kAtan2;
    case TranscendentalKind::kSinh:
      return BuiltinId::kSinh;
    case TranscendentalKind::kCosh:
      return BuiltinId::kCosh;
    case TranscendentalKind::kTanh:
      return BuiltinId::kTanh;
    case TranscendentalKind::kAsinh:
      return BuiltinId::kAsinh;
    case TranscendentalKind::kAcosh:
      return BuiltinId::kAcosh;
    case TranscendentalKind::kAtanh:
      return BuiltinId::kAtanh;
    case TranscendentalKind::kExp:
      return BuiltinId::kExp;
    case TranscendentalKind::kExp2:
      return BuiltinId::kExp2;
    case TranscendentalKind::kLog:
      return BuiltinId::kLog;
    case TranscendentalKind::kLog2:
      return BuiltinId::kLog2;
    case TranscendentalKind::kPow:
      return BuiltinId::kPow;
    case TranscendentalKind::kSqrt:
      return BuiltinId::kSqrt;
    case TranscendentalKind::kInverseSqrt:
      return BuiltinId::kInverseSqrt;
    case TranscendentalKind::kLdexp:
      return BuiltinId::kLdexp;
  }
  throw common::InternalError("ToBuiltin", "unknown transcendental kind");
}

auto ToString(TranscendentalKind kind) -> std::string_view {
  return builtins::ToString(ToBuiltin(kind));
}

auto ToString(LibraryFunction function) -> std::string_view {
  switch (function) {
    case LibraryFunction::kHash:
      return "lpfx_hash";
    case LibraryFunction::kSimplex:
      return "lpfx_simplex";
    case LibraryFunction::kSnoise:
      return "lpfx_snoise";
    case LibraryFunction::kWorley:
      return "lpfx_worley";
    case LibraryFunction::kPsrdnoise:
      return "lpfx_psrdnoise";
    case LibraryFunction::kSaturate:
      return "lpfx_saturate";
    case LibraryFunction::kHue2rgb:
      return "lpfx_hue2rgb";
    case LibraryFunction::kRgb2hsv:
      return "lpfx_rgb2hsv";
  }
  return "unknown";
}

auto ToBuiltin(LibraryFunction function, uint8_t width)
    -> std::optional<builtins::BuiltinId> {
  using builtins::BuiltinId;
  switch (function) {
    case LibraryFunction::kHash:
      if (width == 1) {
        return BuiltinId::kLpfxHash1;
      }
      if (width == 2) {
        return BuiltinId::kLpfxHash2;
      }
      if (width == 3) {
        return BuiltinId::kLpfxHash3;
      }
      break;
    case LibraryFunction::kSimplex:
      if (width == 2) {
        return BuiltinId::kLpfxSimplex2;
      }
      if (width == 3) {
        return BuiltinId::kLpfxSimplex3;
      }
      break;
    case LibraryFunction::kSnoise:
      if (width == 2) {
        return BuiltinId::kLpfxSnoise2;
      }
      if (width == 3) {
        return BuiltinId::kLpfxSnoise3;
      }
      break;
    case LibraryFunction::kWorley:
      if (width == 3) {
        return BuiltinId::kLpfxWorley3;
      }
      break;
    case LibraryFunction::kPsrdnoise:
      if (width == 2) {
        return BuiltinId::kLpfxPsrdnoise2;
      }
      if (width == 3) {
        return BuiltinId::kLpfxPsrdnoise3;
      }
      break;
    case LibraryFunction::kSaturate:
      if (width == 1) {
        return BuiltinId::kLpfxSaturate;
      }
      if (width == 3) {
        return BuiltinId::kLpfxSaturateVec3;
      }
      if (width == 4) {
        return BuiltinId::kLpfxSaturateVec4;
      }
      break;
    case LibraryFunction::kHue2rgb:
      if (width == 1) {
        return BuiltinId::kLpfxHue2rgb;
      }
      break;
    case LibraryFunction::kRgb2hsv:
      if (width == 3) {
        return BuiltinId::kLpfxRgb2hsv;
      }
      if (width == 4) {
        return BuiltinId::kLpfxRgb2hsvVec4;
      }
      break;
  }
  return std::nullopt;
}

auto ToString(const Operation& op) -> std::string {
  return std::visit(
      Overloaded{
          [](const Binary& b) { return std::string(ToString(b.op)); },
          [](const Unary& u) { return std::string(ToString(u.op)); },
          [](const FusedMultiplyAdd&) { return std::string("fma"); },
          [](const Compare& c) {
            return fmt::format("cmp.{}", ToString(c.predicate));
          },
          [](const Transcendental& t) { return std::string(ToString(t.kind)); },
          [](const Convert& c) {
            return fmt::format("convert.{}", ToString(c.to));
          },
          [](const Select&) { return std::string("select"); },
          [](const Logical& l) { return std::string(ToString(l.op)); },
          [](const LibraryCall& c) {
            return std::string(ToString(c.function));
          },
      },
      op);
}

auto ToString(const LValue& lvalue) -> std::string {
  auto lanes = [](const std::vector<uint8_t>& indices) {
    std::string out;
    for (uint8_t index : indices) {
      out += fmt::format("{}{}", out.empty() ? "" : ",", index);
    }
    return out;
  };
  return std::visit(
      Overloaded{
          [&](const SsaHeld& ssa) {
            if (ssa.components.empty()) {
              return fmt::format("ssa(%{})", ssa.local.value);
            }
            return fmt::format(
                "ssa(%{}).[{}]", ssa.local.value, lanes(ssa.components));
          },
          [&](const PointerBased& ptr) {
            return std::visit(
                Overloaded{
                    [&](const Direct& d) {
                      return fmt::format(
                          "ptr(%{}).direct({})", ptr.base.value, d.count);
                    },
                    [&](const Component& c) {
                      return fmt::format(
                          "ptr(%{}).[{}]", ptr.base.value, lanes(c.indices));
                    },
                    [&](const ArrayElement& e) {
                      std::string index = std::visit(
                          Overloaded{
                              [](uint32_t i) { return fmt::format("{}", i); },
                              [](TempId t) {
                                return fmt::format("t{}", t.value);
                              },
                          },
                          e.index);
                      if (!e.components) {
                        return fmt::format(
                            "ptr(%{})[{}]", ptr.base.value, index);
                      }
                      return fmt::format(
                          "ptr(%{})[{}].[{}]", ptr.base.value, index,
                          lanes(*e.components));
                    },
                },
                ptr.access);
          },
      },
      lvalue);
}

auto ToString(Storage storage) -> std::string_view {
  switch (storage) {
    case Storage::kRegister:
      return "register";
    case Storage::kStack:
      return "stack";
    case Storage::kPointerParam:
      return "pointer-param";
  }
  return "unknown";
}

auto ToString(ParamMode mode) -> std::string_view {
  switch (mode) {
    case ParamMode::kIn:
      return "in";
    case ParamMode::kOut:
      return "out";
    case ParamMode::kInOut:
      return "inout";
  }
  return "unknown";
}

}  // namespace lumen::ir
