#include "lumen/llvm_backend/lvalue_access.hpp"

#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Value.h>

#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/overloaded.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/lvalue.hpp"
#include "lumen/ir/value_type.hpp"
#include "lumen/ir/verify.hpp"
#include "lumen/llvm_backend/context.hpp"

namespace lumen::llvm_backend {

namespace {

// Resolved memory access: the pointer to the first component of the
// addressed element plus the offsets of the accessed components.
struct MemoryAccess {
  llvm::Value* base = nullptr;
  llvm::SmallVector<uint32_t, 4> offsets;
};

auto CheckedShape(Context& context, const ir::LValue& lvalue) -> ir::Shape {
  auto shape = ir::ShapeOf(context.GetIrFunction(), lvalue);
  if (!shape) {
    throw DiagnosticException(
        std::move(shape).error().WithNote(
            fmt::format("accessing {}", ir::ToString(lvalue))));
  }
  return *shape;
}

// index * components using shifts and adds only, so element addressing
// never needs the multiply extension.
auto ScaleIndex(Context& context, llvm::Value* index, uint32_t components)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  switch (components) {
    case 1:
      return index;
    case 2:
      return builder.CreateShl(index, 1, "elem.off");
    case 3:
      return builder.CreateAdd(
          builder.CreateShl(index, 1), index, "elem.off");
    case 4:
      return builder.CreateShl(index, 2, "elem.off");
    default:
      throw common::InternalError(
          "ScaleIndex",
          fmt::format("element of {} components", components));
  }
}

auto Sequence(uint32_t count) -> llvm::SmallVector<uint32_t, 4> {
  llvm::SmallVector<uint32_t, 4> offsets;
  for (uint32_t i = 0; i < count; ++i) {
    offsets.push_back(i);
  }
  return offsets;
}

auto ResolveMemory(Context& context, const ir::PointerBased& ptr)
    -> MemoryAccess {
  const ir::Local& local = context.GetIrFunction().GetLocal(ptr.base);
  llvm::Value* base = context.GetMemoryBase(ptr.base);
  auto& builder = context.GetBuilder();

  return std::visit(
      Overloaded{
          [&](const ir::Direct& d) {
            return MemoryAccess{.base = base, .offsets = Sequence(d.count)};
          },
          [&](const ir::Component& c) {
            return MemoryAccess{
                .base = base,
                .offsets = llvm::SmallVector<uint32_t, 4>(
                    c.indices.begin(), c.indices.end())};
          },
          [&](const ir::ArrayElement& e) {
            uint32_t stride = local.type.components;
            llvm::Value* element = nullptr;
            if (const auto* constant = std::get_if<uint32_t>(&e.index)) {
              element = builder.CreateConstInBoundsGEP1_32(
                  context.GetComponentType(), base, *constant * stride,
                  "elem");
            } else {
              const Lanes& index =
                  context.GetTemp(std::get<ir::TempId>(e.index));
              llvm::Value* offset = ScaleIndex(context, index.front(), stride);
              element = builder.CreateGEP(
                  context.GetComponentType(), base, offset, "elem");
            }
            MemoryAccess access{.base = element, .offsets = {}};
            if (e.components) {
              access.offsets.assign(
                  e.components->begin(), e.components->end());
            } else {
              access.offsets = Sequence(stride);
            }
            return access;
          },
      },
      ptr.access);
}

auto ComponentPointer(Context& context, llvm::Value* base, uint32_t offset)
    -> llvm::Value* {
  if (offset == 0) {
    return base;
  }
  return context.GetBuilder().CreateConstInBoundsGEP1_32(
      context.GetComponentType(), base, offset);
}

// Components are 4 bytes in memory; bool lanes widen to 0/1.
auto LoadComponent(
    Context& context, llvm::Value* pointer, ir::ScalarKind kind)
    -> llvm::Value* {
  auto& builder = context.GetBuilder();
  llvm::Value* raw = builder.CreateLoad(context.GetComponentType(), pointer);
  if (kind == ir::ScalarKind::kBool) {
    return builder.CreateICmpNE(
        raw, llvm::ConstantInt::get(context.GetComponentType(), 0));
  }
  return raw;
}

void StoreComponent(
    Context& context, llvm::Value* pointer, llvm::Value* value,
    ir::ScalarKind kind) {
  auto& builder = context.GetBuilder();
  if (kind == ir::ScalarKind::kBool) {
    value = builder.CreateZExt(value, context.GetComponentType());
  }
  builder.CreateStore(value, pointer);
}

auto SsaLanes(const ir::Local& local, const ir::SsaHeld& ssa)
    -> llvm::SmallVector<uint32_t, 4> {
  if (ssa.components.empty()) {
    return Sequence(local.type.components);
  }
  return llvm::SmallVector<uint32_t, 4>(
      ssa.components.begin(), ssa.components.end());
}

auto LocalOf(Context& context, const ir::LValue& lvalue) -> const ir::Local& {
  return std::visit(
      Overloaded{
          [&](const ir::SsaHeld& ssa) -> const ir::Local& {
            return context.GetIrFunction().GetLocal(ssa.local);
          },
          [&](const ir::PointerBased& ptr) -> const ir::Local& {
            return context.GetIrFunction().GetLocal(ptr.base);
          },
      },
      lvalue);
}

}  // namespace

auto ReadLValue(Context& context, const ir::LValue& lvalue) -> Lanes {
  CheckedShape(context, lvalue);
  const ir::Local& local = LocalOf(context, lvalue);
  auto& builder = context.GetBuilder();

  Lanes values;
  if (const auto* ssa = std::get_if<ir::SsaHeld>(&lvalue)) {
    const auto& slots = context.GetRegisterSlots(ssa->local);
    for (uint32_t lane : SsaLanes(local, *ssa)) {
      values.push_back(builder.CreateLoad(
          context.GetLaneType(local.type.scalar), slots[lane]));
    }
    return values;
  }

  MemoryAccess access =
      ResolveMemory(context, std::get<ir::PointerBased>(lvalue));
  for (uint32_t offset : access.offsets) {
    values.push_back(LoadComponent(
        context, ComponentPointer(context, access.base, offset),
        local.type.scalar));
  }
  return values;
}

void WriteLValue(
    Context& context, const ir::LValue& lvalue, const Lanes& values) {
  ir::Shape shape = CheckedShape(context, lvalue);
  if (values.size() != shape.components) {
    throw DiagnosticException(Diagnostic::InvalidLValueAccess(fmt::format(
        "writing {} values to {}, which names {} components", values.size(),
        ir::ToString(lvalue), shape.components)));
  }
  const ir::Local& local = LocalOf(context, lvalue);
  auto& builder = context.GetBuilder();

  if (const auto* ssa = std::get_if<ir::SsaHeld>(&lvalue)) {
    const auto& slots = context.GetRegisterSlots(ssa->local);
    auto lanes = SsaLanes(local, *ssa);
    for (size_t i = 0; i < lanes.size(); ++i) {
      builder.CreateStore(values[i], slots[lanes[i]]);
    }
    return;
  }

  MemoryAccess access =
      ResolveMemory(context, std::get<ir::PointerBased>(lvalue));
  for (size_t i = 0; i < access.offsets.size(); ++i) {
    StoreComponent(
        context, ComponentPointer(context, access.base, access.offsets[i]),
        values[i], local.type.scalar);
  }
}

}  // namespace lumen::llvm_backend
