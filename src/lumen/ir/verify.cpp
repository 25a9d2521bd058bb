#include "lumen/ir/verify.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/overloaded.hpp"
#include "lumen/ir/cfg.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/lvalue.hpp"
#include "lumen/ir/operation.hpp"
#include "lumen/ir/value_type.hpp"

namespace lumen::ir {

namespace {

constexpr uint8_t kMaxHostLogLevel = 4;

auto IsNumeric(ScalarKind kind) -> bool {
  return kind != ScalarKind::kBool;
}

auto LocalOf(const Function& func, LocalId id) -> Result<const Local*> {
  if (id.value >= func.locals.size()) {
    return std::unexpected(Diagnostic::MalformedIr(
        fmt::format("reference to undeclared local %{}", id.value)));
  }
  return &func.locals[id.value];
}

auto CheckLanes(
    const Local& local, const std::vector<uint8_t>& lanes, uint32_t limit)
    -> Result<void> {
  if (lanes.size() > kMaxComponents) {
    return std::unexpected(Diagnostic::InvalidLValueAccess(fmt::format(
        "access to '{}' names {} components; at most {} allowed", local.name,
        lanes.size(), kMaxComponents)));
  }
  for (uint8_t lane : lanes) {
    if (lane >= limit) {
      return std::unexpected(Diagnostic::InvalidLValueAccess(fmt::format(
          "component {} out of range for '{}' of type {}", lane, local.name,
          ToString(local.type))));
    }
  }
  return {};
}

auto ShapeOfSsa(const Function& func, const SsaHeld& ssa) -> Result<Shape> {
  auto local = LocalOf(func, ssa.local);
  if (!local) {
    return std::unexpected(std::move(local).error());
  }
  const Local& l = **local;
  if (l.storage != Storage::kRegister) {
    return std::unexpected(Diagnostic::InvalidLValueAccess(fmt::format(
        "'{}' lives in memory ({}); SSA access is not possible", l.name,
        ToString(l.storage))));
  }
  if (l.type.IsArray()) {
    return std::unexpected(Diagnostic::InvalidLValueAccess(
        fmt::format("array '{}' cannot be held in registers", l.name)));
  }
  auto lanes = CheckLanes(l, ssa.components, l.type.components);
  if (!lanes) {
    return std::unexpected(std::move(lanes).error());
  }
  auto count = ssa.components.empty()
                   ? l.type.components
                   : static_cast<uint8_t>(ssa.components.size());
  return Shape{.kind = l.type.scalar, .components = count};
}

auto ShapeOfPointer(const Function& func, const PointerBased& ptr)
    -> Result<Shape> {
  auto local = LocalOf(func, ptr.base);
  if (!local) {
    return std::unexpected(std::move(local).error());
  }
  const Local& l = **local;
  if (l.storage == Storage::kRegister) {
    return std::unexpected(Diagnostic::InvalidLValueAccess(fmt::format(
        "'{}' is register-held; pointer access is not possible", l.name)));
  }

  return std::visit(
      Overloaded{
          [&](const Direct& d) -> Result<Shape> {
            if (d.count == 0 || d.count > kMaxComponents ||
                d.count > l.type.TotalComponents()) {
              return std::unexpected(Diagnostic::InvalidLValueAccess(
                  fmt::format(
                      "direct access of {} components exceeds '{}' of type {}",
                      d.count, l.name, ToString(l.type))));
            }
            return Shape{.kind = l.type.scalar, .components = d.count};
          },
          [&](const Component& c) -> Result<Shape> {
            if (c.indices.empty()) {
              return std::unexpected(Diagnostic::InvalidLValueAccess(
                  fmt::format("empty component access on '{}'", l.name)));
            }
            auto lanes = CheckLanes(l, c.indices, l.type.TotalComponents());
            if (!lanes) {
              return std::unexpected(std::move(lanes).error());
            }
            return Shape{
                .kind = l.type.scalar,
                .components = static_cast<uint8_t>(c.indices.size())};
          },
          [&](const ArrayElement& e) -> Result<Shape> {
            if (!l.type.IsArray()) {
              return std::unexpected(Diagnostic::InvalidLValueAccess(
                  fmt::format(
                      "element access on non-array '{}' of type {}", l.name,
                      ToString(l.type))));
            }
            if (const auto* constant = std::get_if<uint32_t>(&e.index)) {
              if (*constant >= l.type.array_length) {
                return std::unexpected(Diagnostic::InvalidLValueAccess(
                    fmt::format(
                        "index {} out of bounds for '{}' of type {}",
                        *constant, l.name, ToString(l.type))));
              }
            } else {
              auto temp = std::get<TempId>(e.index);
              if (temp.value >= func.temps.size()) {
                return std::unexpected(Diagnostic::MalformedIr(fmt::format(
                    "index temp t{} is not declared", temp.value)));
              }
              const auto& type = func.temps[temp.value];
              if (type.components != 1 || type.IsArray() ||
                  (type.scalar != ScalarKind::kInt &&
                   type.scalar != ScalarKind::kUint)) {
                return std::unexpected(Diagnostic::MalformedIr(fmt::format(
                    "array index t{} must be a scalar integer, got {}",
                    temp.value, ToString(type))));
              }
            }
            if (!e.components) {
              return Shape{
                  .kind = l.type.scalar, .components = l.type.components};
            }
            if (e.components->empty()) {
              return std::unexpected(Diagnostic::InvalidLValueAccess(
                  fmt::format("empty component access on '{}'", l.name)));
            }
            auto lanes = CheckLanes(l, *e.components, l.type.components);
            if (!lanes) {
              return std::unexpected(std::move(lanes).error());
            }
            return Shape{
                .kind = l.type.scalar,
                .components = static_cast<uint8_t>(e.components->size())};
          },
      },
      ptr.access);
}

auto ShapeOfType(const ValueType& type) -> Shape {
  return Shape{.kind = type.scalar, .components = type.components};
}

auto CheckConstant(const Constant& c) -> Result<Shape> {
  if (c.components.empty() || c.components.size() > kMaxComponents) {
    return std::unexpected(Diagnostic::MalformedIr(fmt::format(
        "constant has {} components; expected 1 to {}", c.components.size(),
        kMaxComponents)));
  }
  if (c.kind != ScalarKind::kFloat) {
    for (double value : c.components) {
      if (!std::isfinite(value) || std::trunc(value) != value) {
        return std::unexpected(Diagnostic::MalformedIr(fmt::format(
            "{} constant {} is not integral", ToString(c.kind), value)));
      }
    }
  }
  return Shape{
      .kind = c.kind, .components = static_cast<uint8_t>(c.components.size())};
}

auto Malformed(const Compute& compute, std::string msg) -> Diagnostic {
  return Diagnostic::MalformedIr(std::move(msg))
      .WithOperation(ToString(compute.operation));
}

auto JoinWidths(const std::vector<Shape>& shapes) -> Result<uint8_t> {
  uint8_t width = 1;
  for (const auto& s : shapes) {
    if (s.components == 1) {
      continue;
    }
    if (width != 1 && width != s.components) {
      return std::unexpected(Diagnostic::MalformedIr(fmt::format(
          "operand widths {} and {} do not agree", width, s.components)));
    }
    width = s.components;
  }
  return width;
}

auto RequireSameKind(
    const Compute& compute, const std::vector<Shape>& shapes,
    size_t first, size_t last) -> Result<ScalarKind> {
  ScalarKind kind = shapes[first].kind;
  for (size_t i = first + 1; i < last; ++i) {
    if (shapes[i].kind != kind) {
      return std::unexpected(Malformed(
          compute, fmt::format(
                       "operand kinds {} and {} differ", ToString(kind),
                       ToString(shapes[i].kind))));
    }
  }
  return kind;
}

auto ResultKind(
    const Compute& compute, const std::vector<Shape>& shapes)
    -> Result<ScalarKind> {
  auto bad_kind = [&](ScalarKind kind) {
    return std::unexpected(Malformed(
        compute,
        fmt::format("operand kind {} not accepted", ToString(kind))));
  };

  return std::visit(
      Overloaded{
          [&](const Binary&) -> Result<ScalarKind> {
            auto kind = RequireSameKind(compute, shapes, 0, 2);
            if (kind && !IsNumeric(*kind)) {
              return bad_kind(*kind);
            }
            return kind;
          },
          [&](const Unary& u) -> Result<ScalarKind> {
            ScalarKind kind = shapes[0].kind;
            switch (u.op) {
              case UnaryOp::kNegate:
              case UnaryOp::kAbsoluteValue:
              case UnaryOp::kSign:
                if (kind != ScalarKind::kFloat && kind != ScalarKind::kInt) {
                  return bad_kind(kind);
                }
                return kind;
              default:
                if (kind != ScalarKind::kFloat) {
                  return bad_kind(kind);
                }
                return kind;
            }
          },
          [&](const FusedMultiplyAdd&) -> Result<ScalarKind> {
            auto kind = RequireSameKind(compute, shapes, 0, 3);
            if (kind && *kind != ScalarKind::kFloat) {
              return bad_kind(*kind);
            }
            return kind;
          },
          [&](const Compare& c) -> Result<ScalarKind> {
            auto kind = RequireSameKind(compute, shapes, 0, 2);
            if (!kind) {
              return kind;
            }
            bool equality = c.predicate == ComparePredicate::kEq ||
                            c.predicate == ComparePredicate::kNe;
            if (*kind == ScalarKind::kBool && !equality) {
              return bad_kind(*kind);
            }
            return ScalarKind::kBool;
          },
          [&](const Transcendental& t) -> Result<ScalarKind> {
            if (shapes[0].kind != ScalarKind::kFloat) {
              return bad_kind(shapes[0].kind);
            }
            if (shapes.size() == 2) {
              auto expected = t.kind == TranscendentalKind::kLdexp
                                  ? ScalarKind::kInt
                                  : ScalarKind::kFloat;
              if (shapes[1].kind != expected) {
                return bad_kind(shapes[1].kind);
              }
            }
            return ScalarKind::kFloat;
          },
          [&](const Convert& c) -> Result<ScalarKind> { return c.to; },
          [&](const Select&) -> Result<ScalarKind> {
            if (shapes[0].kind != ScalarKind::kBool) {
              return bad_kind(shapes[0].kind);
            }
            return RequireSameKind(compute, shapes, 1, 3);
          },
          [&](const Logical&) -> Result<ScalarKind> {
            auto kind = RequireSameKind(compute, shapes, 0, shapes.size());
            if (kind && *kind != ScalarKind::kBool) {
              return bad_kind(*kind);
            }
            return kind;
          },
          [](const LibraryCall&) -> Result<ScalarKind> {
            throw common::InternalError(
                "ResultKind", "library calls are shaped by LibraryShape");
          },
      },
      compute.operation);
}

// Library calls take whole vectors: every operand has one exact shape once
// the overload is known.
auto LibraryShape(
    const Compute& compute, const LibraryCall& call,
    const std::vector<Shape>& shapes) -> Result<Shape> {
  uint8_t width = shapes.front().components;
  if (!ToBuiltin(call.function, width)) {
    return std::unexpected(Malformed(
        compute,
        fmt::format("no overload for a {}-component argument", width)));
  }

  auto of = [](ScalarKind kind, uint8_t components) {
    return Shape{.kind = kind, .components = components};
  };
  std::vector<Shape> expected;
  Shape result;
  switch (call.function) {
    case LibraryFunction::kHash:
      expected = {of(ScalarKind::kUint, width), of(ScalarKind::kUint, 1)};
      result = of(ScalarKind::kUint, 1);
      break;
    case LibraryFunction::kSimplex:
    case LibraryFunction::kSnoise:
    case LibraryFunction::kWorley:
      expected = {of(ScalarKind::kFloat, width), of(ScalarKind::kUint, 1)};
      result = of(ScalarKind::kFloat, 1);
      break;
    case LibraryFunction::kPsrdnoise:
      expected = {
          of(ScalarKind::kFloat, width), of(ScalarKind::kFloat, width),
          of(ScalarKind::kFloat, 1)};
      result = of(ScalarKind::kFloat, static_cast<uint8_t>(width + 1));
      break;
    case LibraryFunction::kSaturate:
    case LibraryFunction::kRgb2hsv:
      expected = {of(ScalarKind::kFloat, width)};
      result = of(ScalarKind::kFloat, width);
      break;
    case LibraryFunction::kHue2rgb:
      expected = {of(ScalarKind::kFloat, 1)};
      result = of(ScalarKind::kFloat, 3);
      break;
  }

  for (size_t i = 0; i < shapes.size(); ++i) {
    if (shapes[i] != expected[i]) {
      return std::unexpected(Malformed(
          compute, fmt::format(
                       "operand {} must be {}x{}, got {}x{}", i,
                       ToString(expected[i].kind), expected[i].components,
                       ToString(shapes[i].kind), shapes[i].components)));
    }
  }
  return result;
}

// Lanes a write names explicitly, or nullptr when it covers the whole
// value.
auto WrittenLanes(const LValue& lvalue) -> const std::vector<uint8_t>* {
  using Lanes = const std::vector<uint8_t>*;
  return std::visit(
      Overloaded{
          [](const SsaHeld& ssa) -> Lanes { return &ssa.components; },
          [](const PointerBased& ptr) -> Lanes {
            return std::visit(
                Overloaded{
                    [](const Direct&) -> Lanes { return nullptr; },
                    [](const Component& c) -> Lanes { return &c.indices; },
                    [](const ArrayElement& e) -> Lanes {
                      return e.components ? &*e.components : nullptr;
                    },
                },
                ptr.access);
          },
      },
      lvalue);
}

auto CheckDistinctLanes(const LValue& lvalue) -> Result<void> {
  const auto* lanes = WrittenLanes(lvalue);
  if (lanes == nullptr) {
    return {};
  }
  for (size_t i = 0; i < lanes->size(); ++i) {
    for (size_t j = i + 1; j < lanes->size(); ++j) {
      if ((*lanes)[i] == (*lanes)[j]) {
        return std::unexpected(Diagnostic::InvalidLValueAccess(fmt::format(
            "component {} written more than once through {}", (*lanes)[i],
            ToString(lvalue))));
      }
    }
  }
  return {};
}

void CollectTemps(const LValue& lvalue, std::vector<TempId>* out) {
  const auto* ptr = std::get_if<PointerBased>(&lvalue);
  if (ptr == nullptr) {
    return;
  }
  const auto* element = std::get_if<ArrayElement>(&ptr->access);
  if (element == nullptr) {
    return;
  }
  if (const auto* index = std::get_if<TempId>(&element->index)) {
    out->push_back(*index);
  }
}

void CollectTemps(const Operand& operand, std::vector<TempId>* out) {
  if (const auto* temp = std::get_if<TempId>(&operand)) {
    out->push_back(*temp);
  } else if (const auto* lvalue = std::get_if<LValue>(&operand)) {
    CollectTemps(*lvalue, out);
  }
}

// Temps read by an instruction, including runtime array indices of the
// lvalue it writes.
auto TempsReadBy(const Instruction& instruction) -> std::vector<TempId> {
  std::vector<TempId> temps;
  std::visit(
      Overloaded{
          [&](const Compute& c) {
            for (const auto& operand : c.operands) {
              CollectTemps(operand, &temps);
            }
            if (const auto* lvalue = std::get_if<LValue>(&c.dest)) {
              CollectTemps(*lvalue, &temps);
            }
          },
          [&](const Assign& a) {
            CollectTemps(a.source, &temps);
            if (const auto* lvalue = std::get_if<LValue>(&a.dest)) {
              CollectTemps(*lvalue, &temps);
            }
          },
          [](const HostLog&) {},
      },
      instruction);
  return temps;
}

auto TempsReadBy(const Terminator& term) -> std::vector<TempId> {
  std::vector<TempId> temps;
  if (const auto* branch = std::get_if<Branch>(&term)) {
    CollectTemps(branch->condition, &temps);
  } else if (const auto* ret = std::get_if<Return>(&term)) {
    if (ret->value) {
      CollectTemps(*ret->value, &temps);
    }
  }
  return temps;
}

auto AssignedTemp(const Instruction& instruction) -> std::optional<TempId> {
  const Destination* dest = nullptr;
  if (const auto* c = std::get_if<Compute>(&instruction)) {
    dest = &c->dest;
  } else if (const auto* a = std::get_if<Assign>(&instruction)) {
    dest = &a->dest;
  }
  if (dest == nullptr) {
    return std::nullopt;
  }
  if (const auto* temp = std::get_if<TempId>(dest)) {
    return *temp;
  }
  return std::nullopt;
}

class FunctionVerifier {
 public:
  explicit FunctionVerifier(const Function& func)
      : func_(func), assigned_(func.temps.size(), false) {
  }

  auto Run() -> Result<void> {
    if (auto r = CheckSignature(); !r) {
      return r;
    }
    if (func_.blocks.empty()) {
      return std::unexpected(Diagnostic::MalformedIr(
          fmt::format("function '{}' has no blocks", func_.name)));
    }
    for (const auto& block : func_.blocks) {
      for (const auto& instruction : block.instructions) {
        auto r = std::visit(
            Overloaded{
                [&](const Compute& c) { return CheckCompute(c); },
                [&](const Assign& a) { return CheckAssign(a); },
                [&](const HostLog& l) { return CheckHostLog(l); },
            },
            instruction);
        if (!r) {
          return r;
        }
      }
      if (auto r = CheckTerminator(block.terminator); !r) {
        return r;
      }
    }
    return CheckTempUses();
  }

 private:
  auto CheckSignature() -> Result<void> {
    for (const auto& local : func_.locals) {
      if (local.type.components == 0 ||
          local.type.components > kMaxComponents) {
        return std::unexpected(Diagnostic::MalformedIr(fmt::format(
            "local '{}' has {} components", local.name,
            local.type.components)));
      }
      if (local.type.IsArray() && local.storage == Storage::kRegister) {
        return std::unexpected(Diagnostic::MalformedIr(fmt::format(
            "array local '{}' must be memory-backed", local.name)));
      }
    }

    std::vector<bool> is_pointer_param(func_.locals.size(), false);
    for (const auto& param : func_.params) {
      auto local = LocalOf(func_, param.local);
      if (!local) {
        return std::unexpected(std::move(local).error());
      }
      const Local& l = **local;
      if (param.mode == ParamMode::kIn) {
        if (l.storage != Storage::kRegister) {
          return std::unexpected(Diagnostic::MalformedIr(fmt::format(
              "in parameter '{}' must be register-held, got {}", l.name,
              ToString(l.storage))));
        }
      } else {
        if (l.storage != Storage::kPointerParam) {
          return std::unexpected(Diagnostic::MalformedIr(fmt::format(
              "{} parameter '{}' must be passed by pointer",
              ToString(param.mode), l.name)));
        }
        is_pointer_param[param.local.value] = true;
      }
    }
    for (size_t i = 0; i < func_.locals.size(); ++i) {
      if (func_.locals[i].storage == Storage::kPointerParam &&
          !is_pointer_param[i]) {
        return std::unexpected(Diagnostic::MalformedIr(fmt::format(
            "local '{}' has pointer-param storage but is not an out/inout "
            "parameter",
            func_.locals[i].name)));
      }
    }

    if (func_.result) {
      const auto& r = *func_.result;
      if (r.IsArray() || r.components == 0 || r.components > kMaxComponents) {
        return std::unexpected(Diagnostic::MalformedIr(fmt::format(
            "function '{}' returns unsupported type {}", func_.name,
            ToString(r))));
      }
    }
    for (const auto& temp : func_.temps) {
      if (temp.IsArray() || temp.components == 0 ||
          temp.components > kMaxComponents) {
        return std::unexpected(Diagnostic::MalformedIr(
            fmt::format("temp of type {} is not a value", ToString(temp))));
      }
    }
    return {};
  }

  auto CheckDestination(const Destination& dest, Shape produced)
      -> Result<void> {
    if (const auto* temp = std::get_if<TempId>(&dest)) {
      if (temp->value >= func_.temps.size()) {
        return std::unexpected(Diagnostic::MalformedIr(
            fmt::format("temp t{} is not declared", temp->value)));
      }
      if (assigned_[temp->value]) {
        return std::unexpected(Diagnostic::MalformedIr(
            fmt::format("temp t{} assigned more than once", temp->value)));
      }
      assigned_[temp->value] = true;
    }
    auto shape = ShapeOf(func_, dest);
    if (!shape) {
      return std::unexpected(std::move(shape).error());
    }
    if (const auto* lvalue = std::get_if<LValue>(&dest)) {
      if (auto r = CheckDistinctLanes(*lvalue); !r) {
        return r;
      }
    }
    if (*shape != produced) {
      return std::unexpected(Diagnostic::MalformedIr(fmt::format(
          "destination expects {}x{} but value is {}x{}",
          ToString(shape->kind), shape->components, ToString(produced.kind),
          produced.components)));
    }
    return {};
  }

  auto CheckCompute(const Compute& compute) -> Result<void> {
    auto produced = ResultShape(func_, compute);
    if (!produced) {
      return std::unexpected(std::move(produced).error());
    }
    auto r = CheckDestination(compute.dest, *produced);
    if (!r) {
      return std::unexpected(
          std::move(r).error().WithOperation(ToString(compute.operation)));
    }
    return {};
  }

  auto CheckAssign(const Assign& assign) -> Result<void> {
    auto source = ShapeOf(func_, assign.source);
    if (!source) {
      return std::unexpected(std::move(source).error());
    }
    return CheckDestination(assign.dest, *source);
  }

  static auto CheckHostLog(const HostLog& log) -> Result<void> {
    if (log.level > kMaxHostLogLevel) {
      return std::unexpected(Diagnostic::MalformedIr(fmt::format(
          "host log level {} out of range (0..{})", log.level,
          kMaxHostLogLevel)));
    }
    return {};
  }

  auto CheckTarget(BlockId target) -> Result<void> {
    if (target.value >= func_.blocks.size()) {
      return std::unexpected(Diagnostic::MalformedIr(
          fmt::format("branch to missing block {}", target.value)));
    }
    if (target.value == 0) {
      return std::unexpected(
          Diagnostic::MalformedIr("the entry block cannot be a branch target"));
    }
    return {};
  }

  auto CheckTerminator(const Terminator& term) -> Result<void> {
    return std::visit(
        Overloaded{
            [&](const Jump& j) { return CheckTarget(j.target); },
            [&](const Branch& b) -> Result<void> {
              auto cond = ShapeOf(func_, b.condition);
              if (!cond) {
                return std::unexpected(std::move(cond).error());
              }
              if (cond->kind != ScalarKind::kBool || cond->components != 1) {
                return std::unexpected(Diagnostic::MalformedIr(
                    "branch condition must be a scalar bool"));
              }
              if (auto r = CheckTarget(b.then_target); !r) {
                return r;
              }
              return CheckTarget(b.else_target);
            },
            [&](const Return& ret) -> Result<void> {
              if (ret.value.has_value() != func_.result.has_value()) {
                return std::unexpected(Diagnostic::MalformedIr(fmt::format(
                    "return in '{}' does not match its declared result",
                    func_.name)));
              }
              if (!ret.value) {
                return {};
              }
              auto shape = ShapeOf(func_, *ret.value);
              if (!shape) {
                return std::unexpected(std::move(shape).error());
              }
              if (*shape != ShapeOfType(*func_.result)) {
                return std::unexpected(Diagnostic::MalformedIr(fmt::format(
                    "'{}' returns {} but declares {}", func_.name,
                    shape->components, ToString(*func_.result))));
              }
              return {};
            },
        },
        term);
  }

  // Position of an instruction; the terminator sits at index
  // instructions.size().
  struct Site {
    uint32_t block;
    size_t index;
  };

  // Every temp read in a reachable block must be assigned earlier in the
  // same block or in a block that dominates it.
  auto CheckTempUses() -> Result<void> {
    DominatorTree tree(func_);
    std::vector<std::optional<Site>> defs(func_.temps.size());
    for (uint32_t b = 0; b < func_.blocks.size(); ++b) {
      const auto& instructions = func_.blocks[b].instructions;
      for (size_t i = 0; i < instructions.size(); ++i) {
        if (auto temp = AssignedTemp(instructions[i])) {
          defs[temp->value] = Site{.block = b, .index = i};
        }
      }
    }

    for (BlockId block : tree.ReversePostOrder()) {
      const BasicBlock& bb = func_.blocks[block.value];
      for (size_t i = 0; i <= bb.instructions.size(); ++i) {
        auto temps = i < bb.instructions.size()
                         ? TempsReadBy(bb.instructions[i])
                         : TempsReadBy(bb.terminator);
        for (TempId temp : temps) {
          Site use{.block = block.value, .index = i};
          if (auto r = CheckUse(tree, defs[temp.value], temp, use); !r) {
            return r;
          }
        }
      }
    }
    return {};
  }

  auto CheckUse(
      const DominatorTree& tree, const std::optional<Site>& def, TempId temp,
      Site use) -> Result<void> {
    if (!def) {
      return std::unexpected(Diagnostic::MalformedIr(fmt::format(
          "temp t{} read in block {} of '{}' is never assigned", temp.value,
          use.block, func_.name)));
    }
    if (def->block == use.block) {
      if (def->index < use.index) {
        return {};
      }
      return std::unexpected(Diagnostic::MalformedIr(fmt::format(
          "temp t{} read in block {} of '{}' before its assignment",
          temp.value, use.block, func_.name)));
    }
    if (!tree.Dominates(BlockId{def->block}, BlockId{use.block})) {
      return std::unexpected(Diagnostic::MalformedIr(fmt::format(
          "assignment of temp t{} in block {} does not dominate its read in "
          "block {} of '{}'",
          temp.value, def->block, use.block, func_.name)));
    }
    return {};
  }

  const Function& func_;
  std::vector<bool> assigned_;
};

}  // namespace

auto ShapeOf(const Function& func, const LValue& lvalue) -> Result<Shape> {
  return std::visit(
      Overloaded{
          [&](const SsaHeld& ssa) { return ShapeOfSsa(func, ssa); },
          [&](const PointerBased& ptr) { return ShapeOfPointer(func, ptr); },
      },
      lvalue);
}

auto ShapeOf(const Function& func, const Operand& operand) -> Result<Shape> {
  return std::visit(
      Overloaded{
          [&](const Constant& c) { return CheckConstant(c); },
          [&](const TempId& t) -> Result<Shape> {
            if (t.value >= func.temps.size()) {
              return std::unexpected(Diagnostic::MalformedIr(
                  fmt::format("temp t{} is not declared", t.value)));
            }
            return ShapeOfType(func.temps[t.value]);
          },
          [&](const LValue& lv) { return ShapeOf(func, lv); },
      },
      operand);
}

auto ShapeOf(const Function& func, const Destination& dest) -> Result<Shape> {
  return std::visit(
      Overloaded{
          [&](const TempId& t) -> Result<Shape> {
            if (t.value >= func.temps.size()) {
              return std::unexpected(Diagnostic::MalformedIr(
                  fmt::format("temp t{} is not declared", t.value)));
            }
            return ShapeOfType(func.temps[t.value]);
          },
          [&](const LValue& lv) { return ShapeOf(func, lv); },
      },
      dest);
}

auto ResultShape(const Function& func, const Compute& compute)
    -> Result<Shape> {
  if (compute.operands.size() != Arity(compute.operation)) {
    return std::unexpected(Malformed(
        compute, fmt::format(
                     "expected {} operands, got {}", Arity(compute.operation),
                     compute.operands.size())));
  }

  std::vector<Shape> shapes;
  shapes.reserve(compute.operands.size());
  for (const auto& operand : compute.operands) {
    auto shape = ShapeOf(func, operand);
    if (!shape) {
      return std::unexpected(
          std::move(shape).error().WithOperation(ToString(compute.operation)));
    }
    shapes.push_back(*shape);
  }

  if (const auto* call = std::get_if<LibraryCall>(&compute.operation)) {
    return LibraryShape(compute, *call, shapes);
  }
  auto width = JoinWidths(shapes);
  if (!width) {
    return std::unexpected(
        std::move(width).error().WithOperation(ToString(compute.operation)));
  }
  auto kind = ResultKind(compute, shapes);
  if (!kind) {
    return std::unexpected(std::move(kind).error());
  }
  return Shape{.kind = *kind, .components = *width};
}

auto VerifyFunction(const Function& func) -> Result<void> {
  return FunctionVerifier(func).Run();
}

}  // namespace lumen::ir
