/**
 * @file iterator.hpp
 * @brief Execution cursor: one logical thread of control inside a tree.
 *
 * Include canopy/behavior_tree.hpp rather than this header directly.
 */

#ifndef CANOPY_ITERATOR_HPP_
#define CANOPY_ITERATOR_HPP_

#include <cassert>
#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <vector>

#include "canopy/node.hpp"
#include "canopy/types.hpp"

namespace canopy {

/**
 * @brief Execution cursor over a contiguous pre-order range of a tree.
 * @tparam Context Blackboard type of the tree.
 *
 * The cursor owns the half-open pre-order range [first(), last()) of one
 * subtree. It keeps the active path as a stack of pre-order indices; the top
 * is the current node. A requested node is pushed at once and stays pending
 * until the next Update() enters it, so the entered nodes are always the
 * bottom entered_depth() entries. A node returning kRunning parks the cursor
 * until the next Update().
 *
 * A tree has one main cursor for the whole tree; every parallel node owns
 * one cursor per child. A cursor only runs nodes inside its range that are
 * assigned to it, which keeps the cursors of one tree from interfering.
 */
template <typename Context>
class Iterator final {
 public:
  using NodeT = Node<Context>;
  using TreeT = BehaviorTree<Context>;

  /**
   * @brief Create a cursor covering the subtree of subtree_root.
   * @param tree Tree the nodes belong to (must outlive the cursor).
   * @param subtree_root First node of the range; its orders must be current.
   */
  Iterator(TreeT& tree, const NodeT& subtree_root)
      : tree_(tree),
        first_(subtree_root.pre_order()),
        last_(subtree_root.post_order() + subtree_root.level_order() + 1),
        entered_(0),
        last_status_(Status::kFailure),
        started_(false) {
    assert(subtree_root.is_connected());
    traversal_.reserve(static_cast<size_t>(tree.height()) + 1U);
  }

  // Non-copyable, non-movable
  Iterator(const Iterator&) = delete;
  Iterator& operator=(const Iterator&) = delete;
  Iterator(Iterator&&) = delete;
  Iterator& operator=(Iterator&&) = delete;

  /**
   * @brief Request execution of next.
   *
   * The node becomes the current node at once and is entered on the next
   * Update(). It must be inside the range and assigned to this cursor.
   */
  void Traverse(NodeT& next) {
    const int32_t index = next.pre_order();
    assert(Owns(index));
    assert(next.iterator() == this);
    traversal_.push_back(index);
    started_ = true;
  }

  /**
   * @brief Advance one step.
   *
   * Enters every pending node, runs the node on top of the active path
   * once and records its status. A finished node is popped and its status
   * reported to its parent, which requests its next child or resolves on the
   * next step. If the node rewound this cursor while running (an interrupt
   * from inside its tick), its status is dropped.
   */
  CANOPY_HOT void Update() {
    if (!is_running()) {
      return;
    }

    Context& ctx = tree_.blackboard();
    EnterRequestedNodes(ctx);
    if (traversal_.empty()) {
      return;
    }

    const int32_t index = traversal_.back();
    NodeT& node = tree_.GetNode(index);
    const Status status = node.Run(ctx);
    if (traversal_.empty() || (traversal_.back() != index) ||
        (entered_ != traversal_.size())) {
      return;
    }
    last_status_ = status;

    if (status == Status::kRunning) {
      return;
    }

    traversal_.pop_back();
    --entered_;
    node.Exit(ctx);
    if (!traversal_.empty()) {
      tree_.GetNode(traversal_.back()).ChildExit(status);
    }
  }

  /**
   * @brief Rewind the active path to subroot.
   * @param subroot Node to rewind to.
   * @param full_interrupt false: restart subroot on the next Update().
   *        true: drop subroot as failed and report the failure to its parent.
   *
   * Every entered node above subroot is interrupted before this returns;
   * pending nodes are dropped without notification. subroot may itself be
   * pending. If subroot is not on the active path the whole path is
   * interrupted and the cursor halts.
   */
  void StepBackInterrupt(NodeT& subroot, bool full_interrupt) {
    if (!is_running()) {
      return;
    }

    Context& ctx = tree_.blackboard();
    const int32_t target = subroot.pre_order();

    while (!traversal_.empty() && (traversal_.back() != target)) {
      PopInterrupted(ctx);
    }

    if (traversal_.empty()) {
      last_status_ = Status::kFailure;
      return;
    }

    PopInterrupted(ctx);
    if (full_interrupt) {
      last_status_ = Status::kFailure;
      if (!traversal_.empty()) {
        tree_.GetNode(traversal_.back()).ChildExit(Status::kFailure);
      }
    } else {
      Traverse(subroot);
    }
  }

  /**
   * @brief Restart the subtree of a conditional-abort node.
   *
   * If the node is on the active path its subtree is restarted in place.
   * Otherwise the path is rewound to the node's parent, which resumes at
   * the node.
   */
  void OnAbort(NodeT& aborter) {
    if (IsOnPath(aborter.pre_order())) {
      StepBackInterrupt(aborter, false);
      return;
    }

    NodeT* parent = aborter.parent();
    if ((parent == nullptr) || !IsEntered(parent->pre_order())) {
      return;
    }

    Context& ctx = tree_.blackboard();
    while (traversal_.back() != parent->pre_order()) {
      PopInterrupted(ctx);
    }
    parent->ChildAbort(aborter);
    Traverse(aborter);
  }

  // --- Query API ---

  /** @brief True while the cursor has an active path. */
  bool is_running() const noexcept { return !traversal_.empty(); }

  /** @brief Lifecycle state. */
  IteratorState state() const noexcept {
    return is_running() ? IteratorState::kRunning
         : started_     ? IteratorState::kHalted
         : IteratorState::kIdle;
  }

  /** @brief Status returned by the last node this cursor ran. */
  Status last_status() const noexcept { return last_status_; }

  /** @brief First pre-order index of the range. */
  int32_t first() const noexcept { return first_; }

  /** @brief One past the last pre-order index of the range. */
  int32_t last() const noexcept { return last_; }

  /** @brief Pre-order index of the current node, or kInvalidOrder. */
  int32_t current_index() const noexcept {
    return traversal_.empty() ? kInvalidOrder : traversal_.back();
  }

  /** @brief Length of the active path, pending nodes included. */
  size_t depth() const noexcept { return traversal_.size(); }

  /** @brief Number of entered nodes at the bottom of the active path. */
  size_t entered_depth() const noexcept { return entered_; }

  /** @brief True if index lies in the range of this cursor. */
  bool Owns(int32_t index) const noexcept {
    return (index >= first_) && (index < last_);
  }

  /** @brief True if the node at index is on the active path. */
  bool IsOnPath(int32_t index) const noexcept {
    return std::find(traversal_.begin(), traversal_.end(), index) !=
           traversal_.end();
  }

  /** @brief True if the node at index is on the active path and entered. */
  bool IsEntered(int32_t index) const noexcept {
    const auto end = traversal_.begin() + static_cast<std::ptrdiff_t>(entered_);
    return std::find(traversal_.begin(), end, index) != end;
  }

  /**
   * @brief Child of the node at index that is on the active path.
   * @return Pre-order index of that child, or kInvalidOrder.
   */
  int32_t ActiveChildOf(int32_t index) const noexcept {
    auto it = std::find(traversal_.begin(), traversal_.end(), index);
    if ((it == traversal_.end()) || ((it + 1) == traversal_.end())) {
      return kInvalidOrder;
    }
    return *(it + 1);
  }

 private:
  void EnterRequestedNodes(Context& ctx) {
    // Entering a node may request its first child, which grows traversal_.
    while (entered_ < traversal_.size()) {
      const int32_t index = traversal_[entered_];
      ++entered_;
      tree_.GetNode(index).Enter(ctx);
    }
  }

  void PopInterrupted(Context& ctx) {
    NodeT& node = tree_.GetNode(traversal_.back());
    traversal_.pop_back();
    if (entered_ > traversal_.size()) {
      entered_ = traversal_.size();
      node.Interrupt(ctx);
    }
  }

  TreeT& tree_;
  std::vector<int32_t> traversal_;
  int32_t first_;
  int32_t last_;
  size_t entered_;
  Status last_status_;
  bool started_;
};

}  // namespace canopy

#endif  // CANOPY_ITERATOR_HPP_
