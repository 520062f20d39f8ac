/**
 * @file tree_walker.hpp
 * @brief Generic explicit-stack tree traversal.
 */

#ifndef CANOPY_TREE_WALKER_HPP_
#define CANOPY_TREE_WALKER_HPP_

#include <cstddef>
#include <cstdint>

#include <utility>
#include <vector>

#include "canopy/types.hpp"

namespace canopy {

/**
 * @brief Pre-order, post-order and level-order traversal over any node type.
 * @tparam NodeT Node type exposing children_count() and child(index).
 *
 * Uses explicit buffers instead of recursion, so trees of any depth can be
 * walked. The buffers are kept between calls; keep a walker around to avoid
 * reallocating them on every traversal.
 *
 * A skip predicate stops descent: a node for which skip(node) returns true is
 * still visited, but its children are not.
 */
template <typename NodeT>
class TreeWalker final {
 public:
  TreeWalker() noexcept : current_level_(0) {}

  /**
   * @brief Walk the tree rooted at root.
   * @param root Subtree root (nullptr visits nothing).
   * @param visit Called as visit(NodeT&) for every visited node.
   * @param order Visitation order.
   */
  template <typename Visit>
  void Traverse(NodeT* root, Visit&& visit,
                Traversal order = Traversal::kPreOrder) {
    Traverse(root, std::forward<Visit>(visit), order,
             [](const NodeT&) { return false; });
  }

  /**
   * @brief Walk the tree rooted at root, pruning where skip returns true.
   */
  template <typename Visit, typename Skip>
  void Traverse(NodeT* root, Visit&& visit, Traversal order, Skip&& skip) {
    current_level_ = 0;
    if (root == nullptr) {
      return;
    }
    if (order == Traversal::kLevelOrder) {
      TraverseLevelOrder(root, visit, skip);
    } else {
      TraverseDepthFirst(root, visit, skip, order == Traversal::kPreOrder);
    }
  }

  /** @brief Depth of the node being visited (root = 0). */
  int32_t current_level() const noexcept { return current_level_; }

 private:
  struct Frame {
    NodeT* node;
    int32_t level;
    uint16_t next_child;
    bool descend;
  };

  struct Entry {
    NodeT* node;
    int32_t level;
  };

  template <typename Visit, typename Skip>
  void Push(NodeT* node, int32_t level, Visit& visit, Skip& skip,
            bool pre_order) {
    current_level_ = level;
    if (pre_order) {
      visit(*node);
    }
    const bool descend = !skip(*node);
    stack_.push_back(Frame{node, level, 0, descend});
  }

  template <typename Visit, typename Skip>
  void TraverseDepthFirst(NodeT* root, Visit& visit, Skip& skip,
                          bool pre_order) {
    stack_.clear();
    Push(root, 0, visit, skip, pre_order);

    while (!stack_.empty()) {
      Frame& top = stack_.back();
      const uint16_t count = top.descend ? top.node->children_count() : 0;

      if (top.next_child < count) {
        NodeT* child = top.node->child(top.next_child);
        const int32_t child_level = top.level + 1;
        ++top.next_child;
        // top is invalidated by the push below
        Push(child, child_level, visit, skip, pre_order);
      } else {
        NodeT* node = top.node;
        current_level_ = top.level;
        stack_.pop_back();
        if (!pre_order) {
          visit(*node);
        }
      }
    }
  }

  template <typename Visit, typename Skip>
  void TraverseLevelOrder(NodeT* root, Visit& visit, Skip& skip) {
    queue_.clear();
    queue_.push_back(Entry{root, 0});

    for (size_t head = 0; head < queue_.size(); ++head) {
      const Entry entry = queue_[head];
      current_level_ = entry.level;
      visit(*entry.node);

      if (skip(*entry.node)) {
        continue;
      }
      const uint16_t count = entry.node->children_count();
      for (uint16_t i = 0; i < count; ++i) {
        queue_.push_back(Entry{entry.node->child(i), entry.level + 1});
      }
    }
  }

  std::vector<Frame> stack_;
  std::vector<Entry> queue_;
  int32_t current_level_;
};

}  // namespace canopy

#endif  // CANOPY_TREE_WALKER_HPP_
