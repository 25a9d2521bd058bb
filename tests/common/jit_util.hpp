#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

#include "lumen/builtins/external_symbols.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/fixed/q32.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/lvalue.hpp"
#include "lumen/ir/value_type.hpp"
#include "lumen/llvm_backend/context.hpp"
#include "lumen/llvm_backend/execution.hpp"
#include "lumen/llvm_backend/lower.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::test {

inline auto Q(double value) -> int32_t {
  return fixed::FromDouble(value);
}

inline auto FloatType(uint8_t components = 1) -> ir::ValueType {
  return ir::ValueType::Vector(ir::ScalarKind::kFloat, components);
}

inline auto NewFunction(std::string name) -> ir::Function {
  ir::Function func;
  func.name = std::move(name);
  return func;
}

inline auto AddLocal(
    ir::Function& func, std::string name, ir::ValueType type,
    ir::Storage storage = ir::Storage::kRegister) -> ir::LocalId {
  ir::LocalId id{static_cast<uint32_t>(func.locals.size())};
  func.locals.push_back(
      ir::Local{.name = std::move(name), .type = type, .storage = storage});
  return id;
}

// In params live in registers; Out/InOut params behind a caller pointer.
inline auto AddParam(
    ir::Function& func, std::string name, ir::ValueType type,
    ir::ParamMode mode = ir::ParamMode::kIn) -> ir::LocalId {
  auto storage = mode == ir::ParamMode::kIn ? ir::Storage::kRegister
                                            : ir::Storage::kPointerParam;
  ir::LocalId id = AddLocal(func, std::move(name), type, storage);
  func.params.push_back(ir::Param{.local = id, .mode = mode});
  return id;
}

inline auto AddTemp(ir::Function& func, ir::ValueType type) -> ir::TempId {
  ir::TempId id{static_cast<uint32_t>(func.temps.size())};
  func.temps.push_back(type);
  return id;
}

inline auto Ssa(ir::LocalId local, std::vector<uint8_t> components = {})
    -> ir::LValue {
  return ir::SsaHeld{.local = local, .components = std::move(components)};
}

inline auto Ptr(ir::LocalId local, ir::AccessPattern access) -> ir::LValue {
  return ir::PointerBased{.base = local, .access = std::move(access)};
}

// Lower for the host and JIT-compile in one step.
inline auto CompileForHost(
    std::vector<ir::Function> functions,
    llvm_backend::CompileOptions options = {},
    const builtins::BuiltinRegistry& registry =
        builtins::BuiltinRegistry::Default(),
    const builtins::ExternalSymbolTable* supplied = nullptr)
    -> Result<llvm_backend::JitSession> {
  auto lowered = llvm_backend::LowerToLlvm(
      functions, target::TargetDescriptor::Host(), registry, options);
  if (!lowered) {
    return std::unexpected(std::move(lowered).error());
  }
  return llvm_backend::CompileJit(
      *lowered, registry, supplied, options.opt_level);
}

}  // namespace lumen::test
