#include "lumen/ir/cfg.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <absl/container/inlined_vector.h>

#include "lumen/common/overloaded.hpp"
#include "lumen/ir/function.hpp"

namespace lumen::ir {

auto Successors(const Terminator& term) -> absl::InlinedVector<BlockId, 2> {
  return std::visit(
      Overloaded{
          [](const Jump& j) -> absl::InlinedVector<BlockId, 2> {
            return {j.target};
          },
          [](const Branch& b) -> absl::InlinedVector<BlockId, 2> {
            return {b.then_target, b.else_target};
          },
          [](const Return&) -> absl::InlinedVector<BlockId, 2> { return {}; },
      },
      term);
}

DominatorTree::DominatorTree(const Function& func)
    : postorder_number_(func.blocks.size(), kUndefined),
      idom_(func.blocks.size(), kUndefined) {
  if (func.blocks.empty()) {
    return;
  }

  struct Frame {
    uint32_t block;
    absl::InlinedVector<BlockId, 2> successors;
    size_t next = 0;
  };

  std::vector<uint32_t> postorder;
  std::vector<bool> visited(func.blocks.size(), false);
  std::vector<Frame> stack;
  visited[0] = true;
  stack.push_back(Frame{
      .block = 0, .successors = Successors(func.blocks[0].terminator)});
  while (!stack.empty()) {
    Frame& top = stack.back();
    if (top.next < top.successors.size()) {
      uint32_t succ = top.successors[top.next++].value;
      if (!visited[succ]) {
        visited[succ] = true;
        stack.push_back(Frame{
            .block = succ,
            .successors = Successors(func.blocks[succ].terminator)});
      }
      continue;
    }
    postorder_number_[top.block] = static_cast<uint32_t>(postorder.size());
    postorder.push_back(top.block);
    stack.pop_back();
  }

  std::vector<absl::InlinedVector<uint32_t, 2>> preds(func.blocks.size());
  for (uint32_t block : postorder) {
    for (BlockId succ : Successors(func.blocks[block].terminator)) {
      preds[succ.value].push_back(block);
    }
  }

  idom_[0] = 0;
  bool changed = true;
  while (changed) {
    changed = false;
    for (auto it = postorder.rbegin(); it != postorder.rend(); ++it) {
      uint32_t block = *it;
      if (block == 0) {
        continue;
      }
      uint32_t new_idom = kUndefined;
      for (uint32_t pred : preds[block]) {
        if (idom_[pred] == kUndefined) {
          continue;
        }
        new_idom = new_idom == kUndefined ? pred : Intersect(pred, new_idom);
      }
      if (idom_[block] != new_idom) {
        idom_[block] = new_idom;
        changed = true;
      }
    }
  }

  reverse_postorder_.reserve(postorder.size());
  for (auto it = postorder.rbegin(); it != postorder.rend(); ++it) {
    reverse_postorder_.push_back(BlockId{*it});
  }
}

auto DominatorTree::Intersect(uint32_t a, uint32_t b) const -> uint32_t {
  while (a != b) {
    while (postorder_number_[a] < postorder_number_[b]) {
      a = idom_[a];
    }
    while (postorder_number_[b] < postorder_number_[a]) {
      b = idom_[b];
    }
  }
  return a;
}

auto DominatorTree::IsReachable(BlockId block) const -> bool {
  return block.value < postorder_number_.size() &&
         postorder_number_[block.value] != kUndefined;
}

auto DominatorTree::Dominates(BlockId a, BlockId b) const -> bool {
  if (!IsReachable(a) || !IsReachable(b)) {
    return false;
  }
  uint32_t current = b.value;
  while (true) {
    if (current == a.value) {
      return true;
    }
    if (current == 0) {
      return false;
    }
    current = idom_[current];
  }
}

auto DominatorTree::ImmediateDominator(BlockId block) const
    -> std::optional<BlockId> {
  if (!IsReachable(block) || block.value == 0) {
    return std::nullopt;
  }
  return BlockId{idom_[block.value]};
}

}  // namespace lumen::ir
