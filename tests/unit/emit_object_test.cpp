#include <gtest/gtest.h>

#include <algorithm>
#include <expected>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "lumen/builtins/external_symbols.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/common/opt_level.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/lvalue.hpp"
#include "lumen/ir/operation.hpp"
#include "lumen/llvm_backend/emit_object.hpp"
#include "lumen/llvm_backend/lower.hpp"
#include "lumen/target/target_descriptor.hpp"
#include "tests/common/jit_util.hpp"

namespace lumen::llvm_backend {
namespace {

using builtins::BuiltinRegistry;
using builtins::ExternalSymbolTable;
using target::ExtensionSet;
using target::TargetDescriptor;
using target::TargetMode;
using test::AddLocal;
using test::AddParam;
using test::AddTemp;
using test::FloatType;
using test::NewFunction;
using test::Ptr;
using test::Ssa;

// float wave(float t, float k) { return sin(t * k); }
auto Wave() -> ir::Function {
  ir::Function func = NewFunction("wave");
  ir::LocalId t = AddParam(func, "t", FloatType());
  ir::LocalId k = AddParam(func, "k", FloatType());
  ir::TempId product = AddTemp(func, FloatType());
  ir::TempId out = AddTemp(func, FloatType());
  func.result = FloatType();
  func.blocks.push_back(ir::BasicBlock{
      .instructions =
          {
              ir::Compute{
                  .dest = product,
                  .operation = ir::Binary{ir::BinaryOp::kMultiply},
                  .operands = {Ssa(t), Ssa(k)},
              },
              ir::Compute{
                  .dest = out,
                  .operation =
                      ir::Transcendental{ir::TranscendentalKind::kSin},
                  .operands = {product},
              },
          },
      .terminator = ir::Return{.value = ir::Operand{out}},
  });
  return func;
}

// void clear(inout float a[16]) {
//   for (int i = 0; i < 16; i++) a[i] = 0.0;
// }
auto ClearLoop() -> ir::Function {
  ir::Function func = NewFunction("clear");
  ir::LocalId a = AddParam(
      func, "a", ir::ValueType::Array(FloatType(), 16),
      ir::ParamMode::kInOut);
  ir::LocalId i =
      AddLocal(func, "i", ir::ValueType::Scalar(ir::ScalarKind::kInt));
  ir::TempId cond =
      AddTemp(func, ir::ValueType::Scalar(ir::ScalarKind::kBool));
  ir::TempId index =
      AddTemp(func, ir::ValueType::Scalar(ir::ScalarKind::kInt));
  ir::TempId next =
      AddTemp(func, ir::ValueType::Scalar(ir::ScalarKind::kInt));
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {ir::Assign{
          .dest = Ssa(i), .source = ir::Constant::Int(0)}},
      .terminator = ir::Jump{.target = ir::BlockId{1}},
  });
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {ir::Compute{
          .dest = cond,
          .operation = ir::Compare{ir::ComparePredicate::kLt},
          .operands = {Ssa(i), ir::Constant::Int(16)},
      }},
      .terminator = ir::Branch{
          .condition = cond,
          .then_target = ir::BlockId{2},
          .else_target = ir::BlockId{3},
      },
  });
  func.blocks.push_back(ir::BasicBlock{
      .instructions =
          {
              ir::Assign{.dest = index, .source = Ssa(i)},
              ir::Assign{
                  .dest = Ptr(a, ir::ArrayElement{.index = index}),
                  .source = ir::Constant::Float(0.0),
              },
              ir::Compute{
                  .dest = next,
                  .operation = ir::Binary{ir::BinaryOp::kAdd},
                  .operands = {Ssa(i), ir::Constant::Int(1)},
              },
              ir::Assign{.dest = Ssa(i), .source = next},
          },
      .terminator = ir::Jump{.target = ir::BlockId{1}},
  });
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {},
      .terminator = ir::Return{},
  });
  return func;
}

// vec3 tint(float h) { return hue2rgb(h); }
auto Tint() -> ir::Function {
  ir::Function func = NewFunction("tint");
  ir::LocalId h = AddParam(func, "h", FloatType());
  ir::TempId rgb = AddTemp(func, FloatType(3));
  func.result = FloatType(3);
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {ir::Compute{
          .dest = rgb,
          .operation = ir::LibraryCall{ir::LibraryFunction::kHue2rgb},
          .operands = {Ssa(h)},
      }},
      .terminator = ir::Return{.value = ir::Operand{rgb}},
  });
  return func;
}

auto Contains(const std::vector<std::string>& names, const std::string& name)
    -> bool {
  return std::ranges::find(names, name) != names.end();
}

class EmitObjectTest : public ::testing::Test {
 protected:
  auto Emit(const TargetDescriptor& target) -> Result<ObjectCode> {
    std::vector<ir::Function> functions;
    functions.push_back(Wave());
    auto lowered = LowerToLlvm(functions, target, registry_, {});
    if (!lowered) {
      return std::unexpected(std::move(lowered).error());
    }
    return EmitObject(*lowered);
  }

  const BuiltinRegistry& registry_ = BuiltinRegistry::Default();
};

// =============================================================================
// Emission
// =============================================================================

TEST_F(EmitObjectTest, Rv32iReferencesMulAndSin) {
  auto object = Emit(TargetDescriptor::Embedded(ExtensionSet{}, false));
  ASSERT_TRUE(object.has_value()) << FormatDiagnostic(object.error());
  EXPECT_FALSE(object->bytes.empty());
  EXPECT_TRUE(Contains(object->undefined_symbols, "__lp_q32_mul"));
  EXPECT_TRUE(Contains(object->undefined_symbols, "__lp_q32_sin"));
  EXPECT_TRUE(Contains(object->defined_functions, "wave"));
  EXPECT_TRUE(std::ranges::is_sorted(object->undefined_symbols));
}

TEST_F(EmitObjectTest, DefaultEmbeddedMultipliesInline) {
  auto object = Emit(TargetDescriptor::DefaultEmbedded());
  ASSERT_TRUE(object.has_value()) << FormatDiagnostic(object.error());
  EXPECT_FALSE(Contains(object->undefined_symbols, "__lp_q32_mul"));
  EXPECT_TRUE(Contains(object->undefined_symbols, "__lp_q32_sin"));
}

TEST_F(EmitObjectTest, ElfMagic) {
  auto object = Emit(TargetDescriptor::DefaultEmbedded());
  ASSERT_TRUE(object.has_value()) << FormatDiagnostic(object.error());
  ASSERT_GE(object->bytes.size(), 4U);
  EXPECT_EQ(object->bytes[0], 0x7F);
  EXPECT_EQ(object->bytes[1], 'E');
  EXPECT_EQ(object->bytes[2], 'L');
  EXPECT_EQ(object->bytes[3], 'F');
}

TEST_F(EmitObjectTest, ModuleIsConsumedOnce) {
  std::vector<ir::Function> functions;
  functions.push_back(Wave());
  auto lowered = LowerToLlvm(
      functions, TargetDescriptor::DefaultEmbedded(), registry_, {});
  ASSERT_TRUE(lowered.has_value()) << FormatDiagnostic(lowered.error());
  ASSERT_TRUE(EmitObject(*lowered).has_value());
  EXPECT_EQ(lowered->module, nullptr);
  EXPECT_EQ(lowered->context, nullptr);
  EXPECT_THROW((void)EmitObject(*lowered), common::InternalError);
}

// =============================================================================
// Optimized code
// =============================================================================

TEST_F(EmitObjectTest, StoreLoopTurnedIntoMemsetIsRejected) {
  std::vector<ir::Function> functions;
  functions.push_back(ClearLoop());
  auto lowered = LowerToLlvm(
      functions, TargetDescriptor::DefaultEmbedded(), registry_,
      {.opt_level = OptLevel::kO2});
  ASSERT_FALSE(lowered.has_value());
  EXPECT_EQ(lowered.error().code, ErrorCode::kUnsupportedInstruction);
  EXPECT_NE(
      lowered.error().primary.message.find("memset"), std::string::npos);
  ASSERT_FALSE(lowered.error().notes.empty());
  EXPECT_NE(
      lowered.error().notes.back().message.find("optimization"),
      std::string::npos);
}

TEST_F(EmitObjectTest, StoreLoopWithoutOptimizationIsAccepted) {
  std::vector<ir::Function> functions;
  functions.push_back(ClearLoop());
  auto lowered = LowerToLlvm(
      functions, TargetDescriptor::DefaultEmbedded(), registry_,
      {.opt_level = OptLevel::kO0});
  ASSERT_TRUE(lowered.has_value()) << FormatDiagnostic(lowered.error());
  auto object = EmitObject(*lowered, OptLevel::kO0);
  ASSERT_TRUE(object.has_value()) << FormatDiagnostic(object.error());
  EXPECT_FALSE(Contains(object->undefined_symbols, "memset"));
}

// =============================================================================
// Link verification
// =============================================================================

TEST_F(EmitObjectTest, UnsuppliedBuiltinsAreUnlinked) {
  auto object = Emit(TargetDescriptor::DefaultEmbedded());
  ASSERT_TRUE(object.has_value()) << FormatDiagnostic(object.error());

  ExternalSymbolTable table;
  auto before = VerifyLinkedBuiltins(
      *object, registry_, TargetMode::kFreestanding, table);
  ASSERT_FALSE(before.has_value());
  EXPECT_EQ(before.error().code, ErrorCode::kUnlinkedExternalSymbol);
  EXPECT_EQ(before.error().context.symbol, "__lp_q32_sin");

  builtins::ProvideHostImplementations(registry_, table);
  EXPECT_TRUE(VerifyLinkedBuiltins(
                  *object, registry_, TargetMode::kFreestanding, table)
                  .has_value());
}

TEST_F(EmitObjectTest, LibraryCallLinksAgainstLpfxSymbol) {
  std::vector<ir::Function> functions;
  functions.push_back(Tint());
  auto lowered = LowerToLlvm(
      functions, TargetDescriptor::DefaultEmbedded(), registry_, {});
  ASSERT_TRUE(lowered.has_value()) << FormatDiagnostic(lowered.error());
  auto object = EmitObject(*lowered);
  ASSERT_TRUE(object.has_value()) << FormatDiagnostic(object.error());
  EXPECT_TRUE(Contains(object->undefined_symbols, "__lpfx_hue2rgb_q32"));
  EXPECT_TRUE(Contains(object->defined_functions, "tint"));

  ExternalSymbolTable table;
  builtins::ProvideHostImplementations(registry_, table);
  EXPECT_TRUE(VerifyLinkedBuiltins(
                  *object, registry_, TargetMode::kFreestanding, table)
                  .has_value());
}

TEST_F(EmitObjectTest, ForeignSymbolIsUnresolved) {
  ObjectCode object{
      .bytes = {},
      .undefined_symbols = {"memcpy"},
      .defined_functions = {"wave"},
  };
  ExternalSymbolTable table;
  builtins::ProvideHostImplementations(registry_, table);
  auto result = VerifyLinkedBuiltins(
      object, registry_, TargetMode::kFreestanding, table);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kUnresolvedBuiltin);
}

TEST_F(EmitObjectTest, WriteObjectFile) {
  auto object = Emit(TargetDescriptor::DefaultEmbedded());
  ASSERT_TRUE(object.has_value()) << FormatDiagnostic(object.error());

  auto path =
      std::filesystem::temp_directory_path() / "lumen_emit_object_test.o";
  ASSERT_TRUE(WriteObjectFile(*object, path).has_value());
  EXPECT_EQ(std::filesystem::file_size(path), object->bytes.size());
  std::filesystem::remove(path);
}

}  // namespace
}  // namespace lumen::llvm_backend
