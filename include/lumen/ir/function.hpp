#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "lumen/ir/lvalue.hpp"
#include "lumen/ir/operation.hpp"
#include "lumen/ir/value_type.hpp"

namespace lumen::ir {

// Storage class chosen by the frontend during variable resolution.
enum class Storage : uint8_t {
  kRegister,      // SSA-held
  kStack,         // Addressable local memory (arrays, matrices)
  kPointerParam,  // Caller-supplied pointer (out/inout parameters)
};

enum class ParamMode : uint8_t { kIn, kOut, kInOut };

struct Local {
  std::string name;
  ValueType type;
  Storage storage = Storage::kRegister;
};

struct Param {
  LocalId local;
  ParamMode mode = ParamMode::kIn;
};

// Literal operand. Float values are real numbers, encoded to Q16.16 when
// lowered; Int/Uint/Bool values must be integral.
struct Constant {
  ScalarKind kind = ScalarKind::kFloat;
  std::vector<double> components;

  static auto Float(double value) -> Constant {
    return Constant{.kind = ScalarKind::kFloat, .components = {value}};
  }
  static auto Int(int32_t value) -> Constant {
    return Constant{
        .kind = ScalarKind::kInt,
        .components = {static_cast<double>(value)}};
  }
  static auto Bool(bool value) -> Constant {
    return Constant{
        .kind = ScalarKind::kBool, .components = {value ? 1.0 : 0.0}};
  }
};

using Operand = std::variant<Constant, TempId, LValue>;
using Destination = std::variant<TempId, LValue>;

struct Compute {
  Destination dest;
  Operation operation;
  std::vector<Operand> operands;
};

struct Assign {
  Destination dest;
  Operand source;
};

// Emits a log record through the host log builtin. level is 0 (error)
// through 4 (trace).
struct HostLog {
  uint8_t level = 2;
  std::string module;
  std::string message;
};

using Instruction = std::variant<Compute, Assign, HostLog>;

struct BlockId {
  uint32_t value = 0;
  auto operator==(const BlockId&) const -> bool = default;
};

struct Jump {
  BlockId target;
};

struct Branch {
  Operand condition;
  BlockId then_target;
  BlockId else_target;
};

struct Return {
  std::optional<Operand> value;
};

using Terminator = std::variant<Jump, Branch, Return>;

struct BasicBlock {
  std::vector<Instruction> instructions;
  Terminator terminator;
};

// Abstract IR for one function as handed over by the frontend. Block 0 is
// the entry block. Temps are single-assignment.
struct Function {
  std::string name;
  std::vector<Local> locals;
  std::vector<Param> params;
  std::optional<ValueType> result;
  std::vector<ValueType> temps;
  std::vector<BasicBlock> blocks;

  [[nodiscard]] auto GetLocal(LocalId id) const -> const Local& {
    return locals.at(id.value);
  }
  [[nodiscard]] auto GetTempType(TempId id) const -> const ValueType& {
    return temps.at(id.value);
  }
};

auto ToString(Storage storage) -> std::string_view;
auto ToString(ParamMode mode) -> std::string_view;

}  // namespace lumen::ir
