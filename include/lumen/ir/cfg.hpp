#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <absl/container/inlined_vector.h>

#include "lumen/ir/function.hpp"

namespace lumen::ir {

// Blocks a terminator can transfer control to, in branch order.
auto Successors(const Terminator& term) -> absl::InlinedVector<BlockId, 2>;

// Dominator tree of a function's control-flow graph, rooted at block 0.
// Blocks unreachable from the entry have no dominator and dominate
// nothing. Every branch target must name an existing block.
//
// Built with the iterative scheme of Cooper, Harvey and Kennedy over a
// postorder numbering of the reachable blocks.
class DominatorTree {
 public:
  explicit DominatorTree(const Function& func);

  [[nodiscard]] auto IsReachable(BlockId block) const -> bool;

  // True when every path from the entry to `b` passes through `a`. A
  // reachable block dominates itself.
  [[nodiscard]] auto Dominates(BlockId a, BlockId b) const -> bool;

  // Nullopt for the entry block and for unreachable blocks.
  [[nodiscard]] auto ImmediateDominator(BlockId block) const
      -> std::optional<BlockId>;

  // Reachable blocks, each after all of its dominators.
  [[nodiscard]] auto ReversePostOrder() const -> const std::vector<BlockId>& {
    return reverse_postorder_;
  }

 private:
  static constexpr uint32_t kUndefined = UINT32_MAX;

  [[nodiscard]] auto Intersect(uint32_t a, uint32_t b) const -> uint32_t;

  std::vector<BlockId> reverse_postorder_;
  // Per block; kUndefined when unreachable.
  std::vector<uint32_t> postorder_number_;
  std::vector<uint32_t> idom_;
};

}  // namespace lumen::ir
