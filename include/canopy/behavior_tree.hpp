/**
 * @file behavior_tree.hpp
 * @brief Lightweight C++14 header-only behavior tree runtime.
 * @version 1.0.0
 *
 * Design principles:
 * - Template for type-safe blackboard (no void* casting)
 * - Tree-owned node registry; parent, child and cursor links are
 *   non-owning pointers, pre-order indices address nodes across trees
 * - Node type tags instead of dynamic type tests
 * - Cooperative single-threaded scheduling: one Update() per frame, a node
 *   returning kRunning parks its cursor until the next frame
 * - Configurable callback type: function pointer (default) or std::function
 *
 * Include this header; it pulls in every other canopy header.
 */

#ifndef CANOPY_BEHAVIOR_TREE_HPP_
#define CANOPY_BEHAVIOR_TREE_HPP_

#include <cassert>
#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "canopy/iterator.hpp"
#include "canopy/log.hpp"
#include "canopy/node.hpp"
#include "canopy/tree_walker.hpp"
#include "canopy/types.hpp"

namespace canopy {

// ============================================================================
// BehaviorTree
// ============================================================================

/**
 * @brief Behavior tree orchestrator template.
 * @tparam Context Blackboard type, one instance owned by every tree.
 *
 * Owns the node registry, the blackboard, the main cursor and the caches
 * derived from the structure (observers, tree-ticked nodes, parallels).
 * The caches are rebuilt wholesale every time the tree is preprocessed.
 *
 * Recommended usage:
 * 1. Create nodes with CreateNode() and configure with set_type/set_tick/
 *    AddChild
 * 2. SetRoot() and ValidateTree() once to verify structure
 * 3. Start() to preprocess and begin execution
 * 4. Call Update() in your frame loop
 *
 * Any structural change (AddChild, SetRoot, CreateNode) requires Start()
 * again before the next Update().
 */
template <typename Context>
class BehaviorTree final {
  static_assert(!std::is_pointer<Context>::value,
                "Context must not be a pointer type; use the pointed-to type");

 public:
  using NodeT = Node<Context>;
  using IteratorT = Iterator<Context>;

  /** @brief Construct an empty tree with a default blackboard. */
  BehaviorTree() : BehaviorTree(Context{}) {}

  /** @brief Construct an empty tree owning a copy of blackboard. */
  explicit BehaviorTree(Context blackboard)
      : root_(nullptr),
        blackboard_(std::move(blackboard)),
        height_(0),
        tick_count_(0),
        initialized_(false) {}

  // Non-copyable, non-movable (nodes and cursors point back to the tree)
  BehaviorTree(const BehaviorTree&) = delete;
  BehaviorTree& operator=(const BehaviorTree&) = delete;
  BehaviorTree(BehaviorTree&&) = delete;
  BehaviorTree& operator=(BehaviorTree&&) = delete;

  // --- Structure API ---

  /**
   * @brief Create a node owned by this tree.
   * @param name Node name for debugging (must have static lifetime).
   * @return The new, unparented node.
   */
  NodeT& CreateNode(const char* name = "") {
    nodes_.push_back(std::make_unique<NodeT>(name));
    NodeT& node = *nodes_.back();
    node.tree_ = this;
    return node;
  }

  /**
   * @brief Set the tree root.
   * @return false (and no change) for nullptr, a node of another tree or a
   *         node that has a parent.
   *
   * Start() must be called again before the next Update().
   */
  bool SetRoot(NodeT* node) {
    if (node == nullptr) {
      GetLogger()->warn("Cannot initialize with null node");
      return false;
    }
    if (node->tree_ != this) {
      GetLogger()->warn("Cannot set node '{}' of another tree as tree root",
                        node->name());
      return false;
    }
    if (node->parent_ != nullptr) {
      GetLogger()->warn("Cannot set parented node '{}' as tree root",
                        node->name());
      return false;
    }
    root_ = node;
    initialized_ = false;
    return true;
  }

  /**
   * @brief Detach every node and clear the registry and the root.
   *
   * Nodes are owned by the registry and destroyed with it.
   */
  void ClearStructure() {
    observers_.clear();
    tree_tick_nodes_.clear();
    parallel_nodes_.clear();
    main_iterator_.reset();
    for (auto& node : nodes_) {
      node->sub_iterators_.clear();
    }
    nodes_.clear();
    root_ = nullptr;
    height_ = 0;
    initialized_ = false;
  }

  /**
   * @brief Validate the connected tree.
   * @return ValidateError::kMissingRoot without a root, otherwise the first
   *         node error in pre-order.
   */
  ValidateError ValidateTree() const {
    if (root_ == nullptr) {
      return ValidateError::kMissingRoot;
    }
    return root_->ValidateTree();
  }

  // --- Execution API ---

  /**
   * @brief Preprocess the tree and begin execution at the root.
   * @return false (and no change) if there is no root.
   *
   * Computes orders, sorts the registry, builds the cursors and caches,
   * calls on_start on every node and requests the root on the main cursor.
   */
  bool Start() {
    if (root_ == nullptr) {
      GetLogger()->warn("Cannot start tree with a null root.");
      return false;
    }

    PreProcess();

    for (auto& node : nodes_) {
      node->Start(blackboard_);
    }

    main_iterator_->Traverse(*root_);
    initialized_ = true;
    GetLogger()->info("Started tree at '{}' ({} nodes, height {})",
                      root_->name(), main_iterator_->last(), height_);
    return true;
  }

  /**
   * @brief Run one frame.
   * @return Status of the last node run by the main cursor.
   *
   * No-op unless started and the main cursor is running. Otherwise runs
   * the tree-tick callbacks, polls the observers (which may redirect the
   * main cursor) and advances the main cursor one step.
   */
  CANOPY_HOT Status Update() {
    if (!initialized_ || !main_iterator_->is_running()) {
      return last_status();
    }

    ++tick_count_;

    if (!tree_tick_nodes_.empty()) {
      TickTreeNodes();
    }

    if (!observers_.empty()) {
      TickObservers();
    }

    main_iterator_->Update();
    return main_iterator_->last_status();
  }

  /**
   * @brief Interrupt the subtree rooted at subroot.
   * @param subroot Node on an active path.
   * @param full_interrupt false: restart subroot on the next step.
   *        true: drop subroot as failed.
   *
   * Running cursors of parallel nodes under subroot are torn down too.
   */
  void Interrupt(NodeT& subroot, bool full_interrupt = false) {
    if (subroot.iterator_ == nullptr) {
      GetLogger()->warn("Cannot interrupt '{}': tree is not preprocessed",
                        subroot.name());
      return;
    }

    GetLogger()->trace("Interrupt '{}' (pre-order {}, full {})",
                       subroot.name(), subroot.pre_order_, full_interrupt);
    subroot.iterator_->StepBackInterrupt(subroot, full_interrupt);

    // Parallel nodes are few; a linear scan finds the ones under subroot.
    for (NodeT* parallel : parallel_nodes_) {
      if (!IsUnderSubtree(&subroot, *parallel)) {
        continue;
      }
      for (uint16_t i = 0; i < parallel->sub_iterator_count(); ++i) {
        IteratorT& itr = parallel->GetIterator(i);
        if (itr.is_running()) {
          NodeT& first = GetNode(itr.first());
          itr.StepBackInterrupt(*first.parent(), full_interrupt);
        }
      }
    }
  }

  // --- Order API ---

  /**
   * @brief Compute pre-order, post-order and level order of every
   *        connected node, and the tree height.
   *
   * Nodes not reachable from the root keep kInvalidOrder.
   */
  void CalculateTreeOrders() {
    ResetOrderIndices();
    height_ = 0;
    if (root_ == nullptr) {
      return;
    }

    int32_t counter = 0;
    walker_.Traverse(root_, [&counter](NodeT& node) {
      node.pre_order_ = counter++;
    });

    counter = 0;
    walker_.Traverse(
        root_, [&counter](NodeT& node) { node.post_order_ = counter++; },
        Traversal::kPostOrder);

    walker_.Traverse(
        root_,
        [this](NodeT& node) {
          node.level_order_ = walker_.current_level();
          height_ = walker_.current_level();
        },
        Traversal::kLevelOrder);
  }

  /**
   * @brief Recompute orders and sort the registry by pre-order.
   *
   * Dangling nodes are moved to the end in their previous relative order,
   * so GetNode(i) is the node with pre-order i.
   */
  void SortNodes() {
    CalculateTreeOrders();
    std::stable_sort(nodes_.begin(), nodes_.end(),
                     [](const std::unique_ptr<NodeT>& a,
                        const std::unique_ptr<NodeT>& b) {
                       const bool a_dangling = !a->is_connected();
                       const bool b_dangling = !b->is_connected();
                       if (a_dangling != b_dangling) {
                         return b_dangling;
                       }
                       return a->pre_order_ < b->pre_order_;
                     });
  }

  /**
   * @brief Test if node is a strict descendant of root.
   *
   * A null root stands for the parent of the tree root and contains every
   * node.
   */
  static bool IsUnderSubtree(const NodeT* root, const NodeT& node) noexcept {
    if (root == nullptr) {
      return true;
    }
    return (root->post_order_ > node.post_order_) &&
           (root->pre_order_ < node.pre_order_);
  }

  /** @brief Test if order_a has lower priority than order_b. */
  static constexpr bool IsLowerOrder(int32_t order_a,
                                     int32_t order_b) noexcept {
    return order_a > order_b;
  }

  /** @brief Test if order_a has higher priority than order_b. */
  static constexpr bool IsHigherOrder(int32_t order_a,
                                      int32_t order_b) noexcept {
    return order_a < order_b;
  }

  // --- Lookup API ---

  /** @brief Get the node at a registry (pre-order) index. */
  NodeT& GetNode(int32_t pre_order) const noexcept {
    assert((pre_order >= 0) &&
           (static_cast<size_t>(pre_order) < nodes_.size()));
    return *nodes_[static_cast<size_t>(pre_order)];
  }

  /** @brief Get every registry node of a type, in registry order. */
  std::vector<NodeT*> GetNodesOfType(NodeType type) const {
    std::vector<NodeT*> result;
    for (const auto& node : nodes_) {
      if (node->type() == type) {
        result.push_back(node.get());
      }
    }
    return result;
  }

  /**
   * @brief Get the copy of original inside tree.
   *
   * tree must be a clone of the tree original belongs to.
   */
  static NodeT& GetInstanceVersion(const BehaviorTree& tree,
                                   const NodeT& original) noexcept {
    return tree.GetNode(original.pre_order());
  }

  // --- Cloning ---

  /**
   * @brief Deep copy a template tree into an independent runtime tree.
   * @param original Template tree; its orders must be current.
   * @return The clone, with its own blackboard copy. Call Start() on it.
   *
   * Only nodes reachable from the root are copied, in pre-order, so the
   * clone's node at index i is the copy of the template's node with
   * pre-order i. on_copy runs on every copy once the structure is linked.
   */
  static std::unique_ptr<BehaviorTree> Clone(const BehaviorTree& original) {
    auto clone = std::make_unique<BehaviorTree>(original.blackboard_);

    if (original.root_ == nullptr) {
      GetLogger()->warn("Cloning a tree without root");
      return clone;
    }

    std::vector<const NodeT*> originals;
    originals.reserve(original.nodes_.size());

    BehaviorTree* target = clone.get();
    TreeWalker<NodeT> walker;
    walker.Traverse(original.root_, [target, &originals](const NodeT& node) {
      assert(node.pre_order() == static_cast<int32_t>(originals.size()));
      target->CreateNode(node.name()).CopyConfigFrom(node);
      originals.push_back(&node);
    });

    // Relink using pre-order as the correspondence key; index 0 is the root.
    for (size_t i = 1; i < originals.size(); ++i) {
      const NodeT* parent = originals[i]->parent();
      clone->GetNode(parent->pre_order()).AddChild(*clone->nodes_[i]);
    }

    clone->root_ = clone->nodes_.front().get();
    clone->CalculateTreeOrders();

    for (auto& node : clone->nodes_) {
      node->Copy(clone->blackboard_);
    }
    return clone;
  }

  // --- Accessors (lowercase) ---

  /** @brief Get root node, nullptr if unset. */
  NodeT* root() const noexcept { return root_; }

  /** @brief Get mutable blackboard reference. */
  Context& blackboard() noexcept { return blackboard_; }

  /** @brief Get const blackboard reference. */
  const Context& blackboard() const noexcept { return blackboard_; }

  /** @brief Number of nodes in the registry (dangling included). */
  size_t node_count() const noexcept { return nodes_.size(); }

  /** @brief Depth of the deepest node (root only = 0). */
  int32_t height() const noexcept { return height_; }

  /** @brief True between a successful Start() and the next structural set. */
  bool is_initialized() const noexcept { return initialized_; }

  /** @brief True while the main cursor is running. */
  bool is_running() const noexcept {
    return (main_iterator_ != nullptr) && main_iterator_->is_running();
  }

  /** @brief Status returned by the last node the main cursor ran. */
  Status last_status() const noexcept {
    return (main_iterator_ != nullptr) ? main_iterator_->last_status()
                                       : Status::kFailure;
  }

  /** @brief Get total number of Update() calls that advanced the tree. */
  uint32_t tick_count() const noexcept { return tick_count_; }

  /** @brief Main cursor, nullptr before the first Start(). */
  IteratorT* main_iterator() const noexcept { return main_iterator_.get(); }

  /** @brief Observers polled every tick, in pre-order. */
  const std::vector<NodeT*>& observers() const noexcept { return observers_; }

  /** @brief Nodes with a tree-tick callback, in pre-order. */
  const std::vector<NodeT*>& tree_tick_nodes() const noexcept {
    return tree_tick_nodes_;
  }

  /** @brief Connected parallel nodes, in pre-order. */
  const std::vector<NodeT*>& parallel_nodes() const noexcept {
    return parallel_nodes_;
  }

 private:
  void PreProcess() {
    SortNodes();

    main_iterator_ = std::make_unique<IteratorT>(*this, *root_);

    CacheObservers();
    CacheTreeTickNodes();
    SyncIterators();

    GetLogger()->debug(
        "Preprocessed '{}': {} observers, {} tree-tick nodes, {} parallels",
        root_->name(), observers_.size(), tree_tick_nodes_.size(),
        parallel_nodes_.size());
  }

  void ResetOrderIndices() noexcept {
    for (auto& node : nodes_) {
      node->pre_order_ = kInvalidOrder;
      node->post_order_ = kInvalidOrder;
      node->level_order_ = kInvalidOrder;
    }
  }

  void CacheObservers() {
    observers_.clear();
    for (const auto& node : nodes_) {
      if (node->is_connected() && node->is_observer()) {
        observers_.push_back(node.get());
      }
    }
  }

  void CacheTreeTickNodes() {
    tree_tick_nodes_.clear();
    for (const auto& node : nodes_) {
      if (node->is_connected() && node->can_tick_on_tree()) {
        tree_tick_nodes_.push_back(node.get());
      }
    }
  }

  void SyncParallelIterators() {
    parallel_nodes_.clear();
    for (const auto& node : nodes_) {
      if (node->is_connected() && node->is_parallel()) {
        parallel_nodes_.push_back(node.get());
      }
    }
    for (NodeT* parallel : parallel_nodes_) {
      parallel->SyncSubIterators();
    }
  }

  /**
   * @brief Assign the owning cursor of every node.
   *
   * Nodes under no parallel get the main cursor. A parallel node keeps the
   * cursor of its parent and each child subtree gets the child's sub-cursor,
   * recursively for nested parallels.
   */
  void SyncIterators() {
    SyncParallelIterators();

    for (auto& node : nodes_) {
      node->iterator_ = nullptr;
    }

    IteratorT* itr = main_iterator_.get();
    std::vector<NodeT*> parallel_roots;

    auto skip_and_assign = [&itr, &parallel_roots](NodeT& node) {
      node.iterator_ = itr;
      const bool is_parallel = node.is_parallel();
      if (is_parallel) {
        parallel_roots.push_back(&node);
      }
      return is_parallel;
    };
    auto no_visit = [](NodeT&) {};

    walker_.Traverse(root_, no_visit, Traversal::kPreOrder, skip_and_assign);

    while (!parallel_roots.empty()) {
      NodeT* parallel = parallel_roots.back();
      parallel_roots.pop_back();

      for (uint16_t i = 0; i < parallel->children_count(); ++i) {
        itr = &parallel->GetIterator(i);
        walker_.Traverse(parallel->child(i), no_visit, Traversal::kPreOrder,
                         skip_and_assign);
      }
    }
  }

  // Observers are polled in pre-order, so of several satisfied aborts the
  // highest priority (left most) one fires first and may tear down the
  // subtrees of the others.
  void TickObservers() {
    for (NodeT* node : observers_) {
      IteratorT* itr = node->iterator_;
      if (!itr->is_running()) {
        continue;
      }
      if (node->IsAbortSatisfied(blackboard_)) {
        GetLogger()->debug("Abort fired by '{}' (pre-order {})", node->name(),
                           node->pre_order_);
        itr->OnAbort(*node);
      }
    }
  }

  void TickTreeNodes() {
    for (NodeT* node : tree_tick_nodes_) {
      node->TreeTick(blackboard_);
    }
  }

  // Registry (arena): sorted by pre-order after SortNodes()
  std::vector<std::unique_ptr<NodeT>> nodes_;
  NodeT* root_;
  Context blackboard_;

  std::unique_ptr<IteratorT> main_iterator_;

  // Derived caches, rebuilt by PreProcess()
  std::vector<NodeT*> observers_;
  std::vector<NodeT*> tree_tick_nodes_;
  std::vector<NodeT*> parallel_nodes_;

  TreeWalker<NodeT> walker_;
  int32_t height_;
  uint32_t tick_count_;
  bool initialized_;
};

// ============================================================================
// Factory helpers (convenience functions for common node configurations)
// ============================================================================

namespace factory {

/** @brief Configure a node as an action leaf. */
template <typename Context>
Node<Context>& MakeAction(Node<Context>& node,
                          typename Node<Context>::TickFn tick) {
  return node.set_type(NodeType::kAction).set_tick(std::move(tick));
}

/** @brief Configure a node as a condition leaf. */
template <typename Context>
Node<Context>& MakeCondition(Node<Context>& node,
                             typename Node<Context>::TickFn tick) {
  return node.set_type(NodeType::kCondition).set_tick(std::move(tick));
}

/** @brief Configure a node as a sequence composite. */
template <typename Context>
Node<Context>& MakeSequence(Node<Context>& node,
                            Node<Context>* const* children,
                            uint16_t count) {
  return node.set_type(NodeType::kSequence).SetChildren(children, count);
}

/** @brief Configure a node as a selector composite. */
template <typename Context>
Node<Context>& MakeSelector(Node<Context>& node,
                            Node<Context>* const* children,
                            uint16_t count) {
  return node.set_type(NodeType::kSelector).SetChildren(children, count);
}

/** @brief Configure a node as a parallel composite. */
template <typename Context>
Node<Context>& MakeParallel(Node<Context>& node,
                            Node<Context>* const* children,
                            uint16_t count,
                            ParallelPolicy policy = ParallelPolicy::kRequireAll) {
  return node.set_type(NodeType::kParallel)
      .SetChildren(children, count)
      .set_parallel_policy(policy);
}

/** @brief Configure a node as an inverter decorator. */
template <typename Context>
Node<Context>& MakeInverter(Node<Context>& node, Node<Context>& child) {
  return node.set_type(NodeType::kInverter).SetChild(child);
}

/** @brief Configure a node as a conditional-abort decorator. */
template <typename Context>
Node<Context>& MakeConditionalAbort(Node<Context>& node,
                                    typename Node<Context>::ConditionFn condition,
                                    AbortType abort_type,
                                    Node<Context>& child) {
  return node.set_type(NodeType::kConditionalAbort)
      .set_condition(std::move(condition))
      .set_abort_type(abort_type)
      .SetChild(child);
}

}  // namespace factory

}  // namespace canopy

#endif  // CANOPY_BEHAVIOR_TREE_HPP_
