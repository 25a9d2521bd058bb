#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "lumen/common/diagnostic.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/lvalue.hpp"
#include "lumen/ir/value_type.hpp"
#include "lumen/llvm_backend/execution.hpp"
#include "tests/common/jit_util.hpp"

namespace lumen::llvm_backend {
namespace {

using ir::ArrayElement;
using ir::Component;
using ir::Constant;
using ir::Direct;
using ir::ParamMode;
using test::AddLocal;
using test::AddParam;
using test::AddTemp;
using test::CompileForHost;
using test::FloatType;
using test::NewFunction;
using test::Ptr;
using test::Q;
using test::Ssa;

auto FloatConstant(std::vector<double> values) -> Constant {
  return Constant{
      .kind = ir::ScalarKind::kFloat, .components = std::move(values)};
}

auto Store(ir::LValue dest, ir::Operand source) -> ir::Instruction {
  return ir::Assign{.dest = std::move(dest), .source = std::move(source)};
}

auto CompileOne(ir::Function func) -> Result<JitSession> {
  std::vector<ir::Function> functions;
  functions.push_back(std::move(func));
  return CompileForHost(std::move(functions));
}

class LValueTest : public ::testing::Test {};

// =============================================================================
// Component access through a pointer
// =============================================================================

// void set_y(inout vec4 v) { v.y = 9.0; }
TEST_F(LValueTest, ComponentWriteLeavesOtherComponentsUnchanged) {
  ir::Function func = NewFunction("set_y");
  ir::LocalId v = AddParam(func, "v", FloatType(4), ParamMode::kInOut);
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {Store(
          Ptr(v, Component{.indices = {1}}), Constant::Float(9.0))},
      .terminator = ir::Return{},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto lookup = session->LookupAs<void(int32_t*)>("set_y");
  ASSERT_TRUE(lookup.has_value());
  auto* set_y = *lookup;

  std::array<int32_t, 4> vec{Q(1.0), Q(2.0), Q(3.0), Q(4.0)};
  set_y(vec.data());
  EXPECT_EQ(vec[0], Q(1.0));
  EXPECT_EQ(vec[1], Q(9.0));
  EXPECT_EQ(vec[2], Q(3.0));
  EXPECT_EQ(vec[3], Q(4.0));
}

// void swizzle(inout vec4 v) { v.zx = vec2(5.0, 6.0); }
TEST_F(LValueTest, SwizzledWriteMapsInAccessOrder) {
  ir::Function func = NewFunction("swizzle");
  ir::LocalId v = AddParam(func, "v", FloatType(4), ParamMode::kInOut);
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {Store(
          Ptr(v, Component{.indices = {2, 0}}), FloatConstant({5.0, 6.0}))},
      .terminator = ir::Return{},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto lookup = session->LookupAs<void(int32_t*)>("swizzle");
  ASSERT_TRUE(lookup.has_value());
  auto* swizzle = *lookup;

  std::array<int32_t, 4> vec{Q(1.0), Q(2.0), Q(3.0), Q(4.0)};
  swizzle(vec.data());
  EXPECT_EQ(vec[0], Q(6.0));
  EXPECT_EQ(vec[1], Q(2.0));
  EXPECT_EQ(vec[2], Q(5.0));
  EXPECT_EQ(vec[3], Q(4.0));
}

// float sum_xz(inout vec3 v) { return v.x + v.z; }
TEST_F(LValueTest, ComponentRead) {
  ir::Function func = NewFunction("sum_xz");
  ir::LocalId v = AddParam(func, "v", FloatType(3), ParamMode::kInOut);
  ir::TempId sum = AddTemp(func, FloatType());
  func.result = FloatType();
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {ir::Compute{
          .dest = sum,
          .operation = ir::Binary{ir::BinaryOp::kAdd},
          .operands =
              {Ptr(v, Component{.indices = {0}}),
               Ptr(v, Component{.indices = {2}})},
      }},
      .terminator = ir::Return{.value = ir::Operand{sum}},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto lookup = session->LookupAs<int32_t(int32_t*)>("sum_xz");
  ASSERT_TRUE(lookup.has_value());
  auto* sum_xz = *lookup;

  std::array<int32_t, 3> vec{Q(1.5), Q(100.0), Q(2.25)};
  EXPECT_EQ(sum_xz(vec.data()), Q(3.75));
}

// =============================================================================
// Direct access
// =============================================================================

// void fill(out vec3 o) { o = vec3(1.0, -2.0, 0.5); }
TEST_F(LValueTest, DirectWriteStoresEveryComponent) {
  ir::Function func = NewFunction("fill");
  ir::LocalId o = AddParam(func, "o", FloatType(3), ParamMode::kOut);
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {Store(
          Ptr(o, Direct{.count = 3}), FloatConstant({1.0, -2.0, 0.5}))},
      .terminator = ir::Return{},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto lookup = session->LookupAs<void(int32_t*)>("fill");
  ASSERT_TRUE(lookup.has_value());
  auto* fill = *lookup;

  std::array<int32_t, 3> out{0, 0, 0};
  fill(out.data());
  EXPECT_EQ(out[0], Q(1.0));
  EXPECT_EQ(out[1], Q(-2.0));
  EXPECT_EQ(out[2], Q(0.5));
}

// =============================================================================
// Register-held locals
// =============================================================================

// vec3 build() { vec3 t = vec3(1, 2, 3); t.y = 7.0; return t; }
TEST_F(LValueTest, SsaComponentWriteKeepsOtherLanes) {
  ir::Function func = NewFunction("build");
  ir::LocalId t = AddLocal(func, "t", FloatType(3));
  func.result = FloatType(3);
  func.blocks.push_back(ir::BasicBlock{
      .instructions =
          {Store(Ssa(t), FloatConstant({1.0, 2.0, 3.0})),
           Store(Ssa(t, {1}), Constant::Float(7.0))},
      .terminator = ir::Return{.value = ir::Operand{Ssa(t)}},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto lookup = session->LookupAs<void(int32_t*)>("build");
  ASSERT_TRUE(lookup.has_value());
  auto* build = *lookup;

  std::array<int32_t, 3> result{0, 0, 0};
  build(result.data());
  EXPECT_EQ(result[0], Q(1.0));
  EXPECT_EQ(result[1], Q(7.0));
  EXPECT_EQ(result[2], Q(3.0));
}

// vec2 flip(vec2 v) { vec2 r; r.yx = v; return r; }
TEST_F(LValueTest, SsaSwizzleFromVectorParam) {
  ir::Function func = NewFunction("flip");
  ir::LocalId v = AddParam(func, "v", FloatType(2));
  ir::LocalId r = AddLocal(func, "r", FloatType(2));
  func.result = FloatType(2);
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {Store(Ssa(r, {1, 0}), Ssa(v))},
      .terminator = ir::Return{.value = ir::Operand{Ssa(r)}},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto lookup = session->LookupAs<void(int32_t*, int32_t, int32_t)>("flip");
  ASSERT_TRUE(lookup.has_value());
  auto* flip = *lookup;

  std::array<int32_t, 2> result{0, 0};
  flip(result.data(), Q(1.25), Q(-8.0));
  EXPECT_EQ(result[0], Q(-8.0));
  EXPECT_EQ(result[1], Q(1.25));
}

// =============================================================================
// Array elements
// =============================================================================

// float pick(int i) {
//   float arr[4] = {10, 20, 30, 40};
//   return arr[i];
// }
TEST_F(LValueTest, RuntimeArrayIndex) {
  ir::Function func = NewFunction("pick");
  ir::LocalId i =
      AddParam(func, "i", ir::ValueType::Scalar(ir::ScalarKind::kInt));
  ir::LocalId arr = AddLocal(
      func, "arr", ir::ValueType::Array(FloatType(), 4), ir::Storage::kStack);
  ir::TempId index =
      AddTemp(func, ir::ValueType::Scalar(ir::ScalarKind::kInt));
  func.result = FloatType();

  std::vector<ir::Instruction> body;
  for (uint32_t k = 0; k < 4; ++k) {
    body.push_back(Store(
        Ptr(arr, ArrayElement{.index = k}),
        Constant::Float(10.0 * (k + 1))));
  }
  body.push_back(ir::Assign{.dest = index, .source = Ssa(i)});
  func.blocks.push_back(ir::BasicBlock{
      .instructions = std::move(body),
      .terminator = ir::Return{
          .value = ir::Operand{Ptr(arr, ArrayElement{.index = index})}},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto lookup = session->LookupAs<int32_t(int32_t)>("pick");
  ASSERT_TRUE(lookup.has_value());
  auto* pick = *lookup;

  EXPECT_EQ(pick(0), Q(10.0));
  EXPECT_EQ(pick(2), Q(30.0));
  EXPECT_EQ(pick(3), Q(40.0));
}

// void set_col(inout mat2 m) { m[1].y = 4.0; }
TEST_F(LValueTest, MatrixColumnComponentWrite) {
  ir::Function func = NewFunction("set_col");
  ir::LocalId m =
      AddParam(func, "m", ir::ValueType::Matrix(2, 2), ParamMode::kInOut);
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {Store(
          Ptr(m, ArrayElement{
                     .index = 1U,
                     .components = std::vector<uint8_t>{1},
                 }),
          Constant::Float(4.0))},
      .terminator = ir::Return{},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto lookup = session->LookupAs<void(int32_t*)>("set_col");
  ASSERT_TRUE(lookup.has_value());
  auto* set_col = *lookup;

  std::array<int32_t, 4> mat{Q(1.0), Q(2.0), Q(3.0), Q(5.0)};
  set_col(mat.data());
  EXPECT_EQ(mat[0], Q(1.0));
  EXPECT_EQ(mat[1], Q(2.0));
  EXPECT_EQ(mat[2], Q(3.0));
  EXPECT_EQ(mat[3], Q(4.0));
}

// vec3 row(inout vec3 rows[2], int i) { return rows[i]; }
TEST_F(LValueTest, WholeElementOfVectorArray) {
  ir::Function func = NewFunction("row");
  ir::LocalId rows = AddParam(
      func, "rows", ir::ValueType::Array(FloatType(3), 2), ParamMode::kInOut);
  ir::LocalId i =
      AddParam(func, "i", ir::ValueType::Scalar(ir::ScalarKind::kInt));
  ir::TempId index =
      AddTemp(func, ir::ValueType::Scalar(ir::ScalarKind::kInt));
  func.result = FloatType(3);
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {ir::Assign{.dest = index, .source = Ssa(i)}},
      .terminator = ir::Return{
          .value = ir::Operand{Ptr(rows, ArrayElement{.index = index})}},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto lookup = session->LookupAs<void(int32_t*, int32_t*, int32_t)>("row");
  ASSERT_TRUE(lookup.has_value());
  auto* row = *lookup;

  std::array<int32_t, 6> data{Q(1), Q(2), Q(3), Q(4), Q(5), Q(6)};
  std::array<int32_t, 3> result{0, 0, 0};
  row(result.data(), data.data(), 1);
  EXPECT_EQ(result[0], Q(4));
  EXPECT_EQ(result[1], Q(5));
  EXPECT_EQ(result[2], Q(6));
}

// =============================================================================
// Invalid accesses
// =============================================================================

TEST_F(LValueTest, ComponentBeyondShapeIsRejected) {
  ir::Function func = NewFunction("bad");
  ir::LocalId v = AddParam(func, "v", FloatType(4), ParamMode::kInOut);
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {Store(
          Ptr(v, Component{.indices = {4}}), Constant::Float(1.0))},
      .terminator = ir::Return{},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_FALSE(session.has_value());
  EXPECT_EQ(session.error().code, ErrorCode::kInvalidLValueAccess);
}

TEST_F(LValueTest, ConstantIndexBeyondArrayIsRejected) {
  ir::Function func = NewFunction("bad_index");
  ir::LocalId arr = AddLocal(
      func, "arr", ir::ValueType::Array(FloatType(), 2), ir::Storage::kStack);
  func.blocks.push_back(ir::BasicBlock{
      .instructions = {Store(
          Ptr(arr, ArrayElement{.index = 2U}), Constant::Float(1.0))},
      .terminator = ir::Return{},
  });

  auto session = CompileOne(std::move(func));
  ASSERT_FALSE(session.has_value());
  EXPECT_EQ(session.error().code, ErrorCode::kInvalidLValueAccess);
}

}  // namespace
}  // namespace lumen::llvm_backend
