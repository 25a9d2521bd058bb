#include "call_program.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/lvalue.hpp"
#include "lumen/ir/operation.hpp"
#include "lumen/ir/value_type.hpp"

namespace lumen::driver {

namespace {

using builtins::BuiltinId;

auto OperationFor(BuiltinId id) -> std::optional<ir::Operation> {
  switch (id) {
    case BuiltinId::kAdd:
      return ir::Binary{ir::BinaryOp::kAdd};
    case BuiltinId::kSub:
      return ir::Binary{ir::BinaryOp::kSubtract};
    case BuiltinId::kMul:
      return ir::Binary{ir::BinaryOp::kMultiply};
    case BuiltinId::kDiv:
      return ir::Binary{ir::BinaryOp::kDivide};
    case BuiltinId::kMod:
      return ir::Binary{ir::BinaryOp::kModulo};
    case BuiltinId::kFma:
      return ir::FusedMultiplyAdd{};
    case BuiltinId::kRound:
      return ir::Unary{ir::UnaryOp::kRound};
    case BuiltinId::kRoundEven:
      return ir::Unary{ir::UnaryOp::kRoundEven};
    case BuiltinId::kHostLog:
      return std::nullopt;
    default:
      break;
  }
  // The remaining builtins are transcendentals, in matching order.
  for (uint8_t k = 0; k <= static_cast<uint8_t>(ir::TranscendentalKind::kLdexp);
       ++k) {
    auto kind = static_cast<ir::TranscendentalKind>(k);
    if (ir::ToBuiltin(kind) == id) {
      return ir::Transcendental{kind};
    }
  }
  return std::nullopt;
}

}  // namespace

auto BuildCallFunction(BuiltinId id) -> Result<ir::Function> {
  const auto& info = builtins::GetBuiltinInfo(id);
  if (builtins::IsLibraryBuiltin(id)) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "'{}' is a library builtin; eval runs per-lane builtins only",
        info.name)));
  }
  auto operation = OperationFor(id);
  if (!operation) {
    return std::unexpected(Diagnostic::HostError(
        fmt::format("'{}' does not produce a value", info.name)));
  }

  ir::Function func{
      .name = fmt::format("call_{}", info.name),
      .locals = {},
      .params = {},
      .result = ir::ValueType::Scalar(ir::ScalarKind::kFloat),
      .temps = {ir::ValueType::Scalar(ir::ScalarKind::kFloat)},
      .blocks = {},
  };

  std::vector<ir::Operand> operands;
  for (uint8_t i = 0; i < info.arity; ++i) {
    bool exponent = id == BuiltinId::kLdexp && i == 1;
    ir::LocalId local{static_cast<uint32_t>(func.locals.size())};
    func.locals.push_back(ir::Local{
        .name = fmt::format("a{}", i),
        .type = ir::ValueType::Scalar(
            exponent ? ir::ScalarKind::kInt : ir::ScalarKind::kFloat),
        .storage = ir::Storage::kRegister,
    });
    func.params.push_back(
        ir::Param{.local = local, .mode = ir::ParamMode::kIn});
    operands.emplace_back(ir::LValue{ir::SsaHeld{.local = local}});
  }

  ir::TempId result{0};
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {ir::Compute{
          .dest = result,
          .operation = *operation,
          .operands = std::move(operands),
      }},
      .terminator = ir::Return{.value = ir::Operand{result}},
  });
  return func;
}

}  // namespace lumen::driver
