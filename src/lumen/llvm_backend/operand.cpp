#include "lumen/llvm_backend/operand.hpp"

#include <cstdint>
#include <utility>
#include <variant>

#include "lumen/common/diagnostic.hpp"
#include "lumen/common/overloaded.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/verify.hpp"
#include "lumen/llvm_backend/context.hpp"
#include "lumen/llvm_backend/lvalue_access.hpp"
#include "lumen/llvm_backend/q32_transform.hpp"

namespace lumen::llvm_backend {

auto LowerOperand(Context& context, const ir::Operand& operand) -> Lanes {
  return std::visit(
      Overloaded{
          [&](const ir::Constant& c) { return EmitConstant(context, c); },
          [&](const ir::TempId& t) { return context.GetTemp(t); },
          [&](const ir::LValue& lv) { return ReadLValue(context, lv); },
      },
      operand);
}

auto OperandShape(Context& context, const ir::Operand& operand) -> ir::Shape {
  auto shape = ir::ShapeOf(context.GetIrFunction(), operand);
  if (!shape) {
    throw DiagnosticException(std::move(shape).error());
  }
  return *shape;
}

auto Broadcast(const Lanes& lanes, uint8_t width) -> Lanes {
  if (lanes.size() != 1 || width == 1) {
    return lanes;
  }
  return Lanes(width, lanes.front());
}

}  // namespace lumen::llvm_backend
