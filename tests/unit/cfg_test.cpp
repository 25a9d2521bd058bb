#include <gtest/gtest.h>

#include <cstdint>
#include <utility>
#include <vector>

#include "lumen/common/diagnostic.hpp"
#include "lumen/ir/cfg.hpp"
#include "lumen/ir/function.hpp"
#include "lumen/ir/operation.hpp"
#include "lumen/ir/value_type.hpp"
#include "lumen/llvm_backend/execution.hpp"
#include "tests/common/jit_util.hpp"

namespace lumen::ir {
namespace {

using test::AddParam;
using test::AddTemp;
using test::CompileForHost;
using test::FloatType;
using test::NewFunction;
using test::Q;
using test::Ssa;

auto ReturnBlock() -> BasicBlock {
  return BasicBlock{.instructions = {}, .terminator = Return{}};
}

auto JumpBlock(uint32_t target) -> BasicBlock {
  return BasicBlock{
      .instructions = {}, .terminator = Jump{.target = BlockId{target}}};
}

auto BranchBlock(LocalId cond, uint32_t then_target, uint32_t else_target)
    -> BasicBlock {
  return BasicBlock{
      .instructions = {},
      .terminator = Branch{
          .condition = Ssa(cond),
          .then_target = BlockId{then_target},
          .else_target = BlockId{else_target},
      },
  };
}

class CfgTest : public ::testing::Test {
 protected:
  // 0 -> {1, 2} -> 3, with block 4 unreachable.
  static auto Diamond() -> Function {
    Function func = NewFunction("diamond");
    LocalId c = AddParam(func, "c", ValueType::Scalar(ScalarKind::kBool));
    func.blocks.push_back(BranchBlock(c, 1, 2));
    func.blocks.push_back(JumpBlock(3));
    func.blocks.push_back(JumpBlock(3));
    func.blocks.push_back(ReturnBlock());
    func.blocks.push_back(JumpBlock(3));
    return func;
  }
};

// =============================================================================
// Dominators
// =============================================================================

TEST_F(CfgTest, Successors) {
  EXPECT_TRUE(Successors(Return{}).empty());
  auto jump = Successors(Jump{.target = BlockId{4}});
  ASSERT_EQ(jump.size(), 1U);
  EXPECT_EQ(jump[0], BlockId{4});
}

TEST_F(CfgTest, DiamondJoinIsDominatedByEntryOnly) {
  DominatorTree tree(Diamond());
  EXPECT_TRUE(tree.Dominates(BlockId{0}, BlockId{3}));
  EXPECT_FALSE(tree.Dominates(BlockId{1}, BlockId{3}));
  EXPECT_FALSE(tree.Dominates(BlockId{2}, BlockId{3}));
  EXPECT_TRUE(tree.Dominates(BlockId{3}, BlockId{3}));
  EXPECT_EQ(tree.ImmediateDominator(BlockId{3}), BlockId{0});
  EXPECT_EQ(tree.ImmediateDominator(BlockId{1}), BlockId{0});
  EXPECT_FALSE(tree.ImmediateDominator(BlockId{0}).has_value());
}

TEST_F(CfgTest, UnreachableBlockDominatesNothing) {
  DominatorTree tree(Diamond());
  EXPECT_FALSE(tree.IsReachable(BlockId{4}));
  EXPECT_FALSE(tree.Dominates(BlockId{4}, BlockId{3}));
  EXPECT_FALSE(tree.Dominates(BlockId{0}, BlockId{4}));
  EXPECT_FALSE(tree.ImmediateDominator(BlockId{4}).has_value());
}

TEST_F(CfgTest, ReversePostOrderPutsDominatorsFirst) {
  Function func = Diamond();
  DominatorTree tree(func);
  const auto& order = tree.ReversePostOrder();
  ASSERT_EQ(order.size(), 4U);
  EXPECT_EQ(order.front(), BlockId{0});
  EXPECT_EQ(order.back(), BlockId{3});
}

// 0 -> 1 -> 2 -> {1, 3}
TEST_F(CfgTest, LoopHeaderDominatesBody) {
  Function func = NewFunction("loop");
  LocalId c = AddParam(func, "c", ValueType::Scalar(ScalarKind::kBool));
  func.blocks.push_back(JumpBlock(1));
  func.blocks.push_back(JumpBlock(2));
  func.blocks.push_back(BranchBlock(c, 1, 3));
  func.blocks.push_back(ReturnBlock());

  DominatorTree tree(func);
  EXPECT_TRUE(tree.Dominates(BlockId{1}, BlockId{2}));
  EXPECT_TRUE(tree.Dominates(BlockId{2}, BlockId{3}));
  EXPECT_FALSE(tree.Dominates(BlockId{2}, BlockId{1}));
  EXPECT_EQ(tree.ImmediateDominator(BlockId{1}), BlockId{0});
}

// =============================================================================
// Lowering order
// =============================================================================

// Block 2 assigns the temp that block 1 returns; block indices do not
// follow control flow.
TEST_F(CfgTest, BlocksAreLoweredInDominanceOrder) {
  Function func = NewFunction("late");
  LocalId x = AddParam(func, "x", FloatType());
  TempId doubled = AddTemp(func, FloatType());
  func.result = FloatType();
  func.blocks.push_back(JumpBlock(2));
  func.blocks.push_back(BasicBlock{
      .instructions = {},
      .terminator = Return{.value = Operand{doubled}},
  });
  func.blocks.push_back(BasicBlock{
      .instructions = {Compute{
          .dest = doubled,
          .operation = Binary{BinaryOp::kAdd},
          .operands = {Ssa(x), Ssa(x)},
      }},
      .terminator = Jump{.target = BlockId{1}},
  });

  std::vector<Function> functions;
  functions.push_back(std::move(func));
  auto session = CompileForHost(std::move(functions));
  ASSERT_TRUE(session.has_value()) << FormatDiagnostic(session.error());
  auto late = session->LookupAs<int32_t(int32_t)>("late");
  ASSERT_TRUE(late.has_value());
  EXPECT_EQ((*late)(Q(1.25)), Q(2.5));
}

}  // namespace
}  // namespace lumen::ir
