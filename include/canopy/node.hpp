/**
 * @file node.hpp
 * @brief Behavior tree node: structure, configuration and per-type routing.
 *
 * Nodes are created and owned by a BehaviorTree (BehaviorTree::CreateNode).
 * Parent, child and cursor links are non-owning pointers; the tree's node
 * registry is the only owner.
 *
 * Naming convention (Google C++ Style Guide):
 * - Accessors: lowercase (e.g., name(), status(), type())
 * - Mutators: set_xxx() (e.g., set_tick(), set_on_enter())
 * - Regular functions: PascalCase (e.g., AddChild(), Validate())
 *
 * Include canopy/behavior_tree.hpp rather than this header directly.
 */

#ifndef CANOPY_NODE_HPP_
#define CANOPY_NODE_HPP_

#include <cassert>
#include <cstdint>

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(CANOPY_USE_STD_FUNCTION)
#include <functional>
#endif

#include "canopy/tree_walker.hpp"
#include "canopy/types.hpp"

namespace canopy {

// ============================================================================
// Forward declarations
// ============================================================================

template <typename Context>
class Iterator;

template <typename Context>
class BehaviorTree;

// ============================================================================
// Node
// ============================================================================

/**
 * @brief Behavior tree node template.
 * @tparam Context Blackboard type shared by every node of one tree.
 *
 * The node type selects how the node routes control when a cursor enters it,
 * runs it and reports a finished child back to it. Leaf behaviour is supplied
 * through callbacks.
 *
 * Children are stored in a fixed-capacity inline array
 * (CANOPY_MAX_CHILDREN). Order indices are only valid between an order
 * computation (BehaviorTree::SortNodes(), BehaviorTree::Start()) and the next
 * structural change.
 *
 * Callback type is configurable:
 * - Default: raw function pointers (zero heap, deterministic latency).
 *   Per-node state should be placed in Context.
 * - CANOPY_USE_STD_FUNCTION: std::function (allows lambda captures at the
 *   cost of potential heap allocation).
 */
template <typename Context>
class Node final {
  static_assert(!std::is_pointer<Context>::value,
                "Context must not be a pointer type; use the pointed-to type");

 public:
  /// Maximum children per node (compile-time configurable).
  static constexpr uint16_t kMaxChildren =
      static_cast<uint16_t>(CANOPY_MAX_CHILDREN);

  static_assert(kMaxChildren <= 256U,
                "CANOPY_MAX_CHILDREN too large (max 256)");

  using IteratorT = Iterator<Context>;
  using TreeT = BehaviorTree<Context>;

#if defined(CANOPY_USE_STD_FUNCTION)
  /// Tick callback: returns execution status. Called every run of a leaf.
  using TickFn = std::function<Status(Context&)>;
  /// Condition callback for conditional-abort nodes.
  using ConditionFn = std::function<bool(Context&)>;
  /// Lifecycle callback.
  using CallbackFn = std::function<void(Context&)>;
#else
  /// Tick callback: raw function pointer (deterministic, no heap).
  using TickFn = Status (*)(Context&);
  /// Condition callback: raw function pointer.
  using ConditionFn = bool (*)(Context&);
  /// Lifecycle callback: raw function pointer.
  using CallbackFn = void (*)(Context&);
#endif

  /**
   * @brief Construct a detached node with an optional name.
   * @param name Node name for debugging (must have static lifetime).
   *
   * Use BehaviorTree::CreateNode() to create nodes that belong to a tree.
   */
  explicit Node(const char* name = "") noexcept
      : type_(NodeType::kAction),
        status_(Status::kFailure),
        abort_type_(AbortType::kNone),
        success_policy_(ParallelPolicy::kRequireAll),
        children_count_(0),
        current_child_(0),
        last_condition_(false),
        pre_order_(kInvalidOrder),
        post_order_(kInvalidOrder),
        level_order_(kInvalidOrder),
        parent_(nullptr),
        iterator_(nullptr),
        tree_(nullptr),
        tick_(nullptr),
        condition_(nullptr),
        on_enter_(nullptr),
        on_exit_(nullptr),
        on_interrupt_(nullptr),
        on_start_(nullptr),
        on_tree_tick_(nullptr),
        on_copy_(nullptr),
        children_{},
        name_(name) {}

  // Non-copyable, non-movable
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
  Node(Node&&) = delete;
  Node& operator=(Node&&) = delete;

  // --- Configuration API (Mutators: set_xxx, returns *this) ---

  /** @brief Set the node type. */
  Node& set_type(NodeType type) noexcept {
    type_ = type;
    return *this;
  }

  /** @brief Set the tick callback (required for leaf nodes). */
  Node& set_tick(TickFn fn) noexcept {
    tick_ = std::move(fn);
    return *this;
  }

  /** @brief Set the condition callback (required for conditional aborts). */
  Node& set_condition(ConditionFn fn) noexcept {
    condition_ = std::move(fn);
    return *this;
  }

  /** @brief Set which subtrees a conditional-abort node observes. */
  Node& set_abort_type(AbortType abort_type) noexcept {
    abort_type_ = abort_type;
    return *this;
  }

  /** @brief Set the on-enter callback (called when a cursor enters). */
  Node& set_on_enter(CallbackFn fn) noexcept {
    on_enter_ = std::move(fn);
    return *this;
  }

  /** @brief Set the on-exit callback (called when the node finishes). */
  Node& set_on_exit(CallbackFn fn) noexcept {
    on_exit_ = std::move(fn);
    return *this;
  }

  /**
   * @brief Set the on-interrupt callback.
   *
   * Called when an interrupt or abort tears the node down while it is on a
   * cursor's active path, before on_exit. Release resources held by a
   * running node here.
   */
  Node& set_on_interrupt(CallbackFn fn) noexcept {
    on_interrupt_ = std::move(fn);
    return *this;
  }

  /** @brief Set the on-start callback (called by BehaviorTree::Start()). */
  Node& set_on_start(CallbackFn fn) noexcept {
    on_start_ = std::move(fn);
    return *this;
  }

  /**
   * @brief Set the tree-tick callback.
   *
   * A node with a tree-tick callback is ticked on every
   * BehaviorTree::Update(), whether or not a cursor is on it. The set of
   * tree-ticked nodes is cached when the tree is preprocessed.
   */
  Node& set_on_tree_tick(CallbackFn fn) noexcept {
    on_tree_tick_ = std::move(fn);
    return *this;
  }

  /** @brief Set the on-copy callback (called on the copy after cloning). */
  Node& set_on_copy(CallbackFn fn) noexcept {
    on_copy_ = std::move(fn);
    return *this;
  }

  /** @brief Set the success policy for parallel nodes. */
  Node& set_parallel_policy(ParallelPolicy policy) noexcept {
    success_policy_ = policy;
    return *this;
  }

  // --- Structure API ---

  /**
   * @brief Append a child node.
   * @param child Unparented node of the same tree.
   * @return Reference to this node for chaining.
   *
   * Asserts if the maximum capacity (CANOPY_MAX_CHILDREN) is exceeded or
   * the child already has a parent.
   */
  Node& AddChild(Node& child) noexcept {
    assert(children_count_ < kMaxChildren);
    assert(child.parent_ == nullptr);
    assert(&child != this);
    assert(child.tree_ == tree_);
    children_[children_count_] = &child;
    ++children_count_;
    child.parent_ = this;
    return *this;
  }

  /**
   * @brief Replace the children with the nodes of a pointer array.
   * @param children Pointer to array of Node pointers.
   * @param count Number of children.
   */
  Node& SetChildren(Node* const* children, uint16_t count) noexcept {
    assert(count <= kMaxChildren);
    ClearChildren();
    for (uint16_t i = 0; i < count; ++i) {
      AddChild(*children[i]);
    }
    return *this;
  }

  /**
   * @brief Replace the children from a fixed-size array (auto-deduces size).
   * @tparam N Array size, automatically deduced.
   */
  template <size_t N>
  Node& SetChildren(Node* const (&children)[N]) noexcept {
    static_assert(N <= kMaxChildren,
                  "Children array exceeds CANOPY_MAX_CHILDREN");
    return SetChildren(children, static_cast<uint16_t>(N));
  }

  /**
   * @brief Set a single child (convenience for decorator nodes).
   *
   * Clears existing children and sets exactly one child.
   */
  Node& SetChild(Node& child) noexcept {
    ClearChildren();
    return AddChild(child);
  }

  /** @brief Detach all children. */
  Node& ClearChildren() noexcept {
    for (uint16_t i = 0; i < children_count_; ++i) {
      children_[i]->parent_ = nullptr;
      children_[i] = nullptr;
    }
    children_count_ = 0;
    current_child_ = 0;
    return *this;
  }

  // --- Query API (Accessors: lowercase) ---

  /** @brief Get node name. */
  const char* name() const noexcept { return name_; }

  /** @brief Get node type. */
  NodeType type() const noexcept { return type_; }

  /** @brief Get the status produced by the node's last run. */
  Status status() const noexcept { return status_; }

  /** @brief Get number of children. */
  uint16_t children_count() const noexcept { return children_count_; }

  /** @brief Get child at index, nullptr if out of range. */
  Node* child(uint16_t index) const noexcept {
    if (CANOPY_LIKELY(index < children_count_)) {
      return children_[index];
    }
    return nullptr;
  }

  /** @brief Get the position of a child, or kInvalidOrder. */
  int32_t ChildIndex(const Node& node) const noexcept {
    for (uint16_t i = 0; i < children_count_; ++i) {
      if (children_[i] == &node) {
        return static_cast<int32_t>(i);
      }
    }
    return kInvalidOrder;
  }

  /** @brief Get the parent, nullptr for roots and detached nodes. */
  Node* parent() const noexcept { return parent_; }

  /** @brief Get the owning tree. */
  TreeT* tree() const noexcept { return tree_; }

  /** @brief Get the cursor that runs this node (set by preprocessing). */
  IteratorT* iterator() const noexcept { return iterator_; }

  /** @brief Pre-order index (priority: lower is higher priority). */
  int32_t pre_order() const noexcept { return pre_order_; }

  /** @brief Post-order index. */
  int32_t post_order() const noexcept { return post_order_; }

  /** @brief Depth below the root (root = 0). */
  int32_t level_order() const noexcept { return level_order_; }

  /** @brief Get current child index (for sequence/selector). */
  uint16_t current_child_index() const noexcept { return current_child_; }

  /** @brief Get the abort type of a conditional-abort node. */
  AbortType abort_type() const noexcept { return abort_type_; }

  /** @brief Get parallel policy. */
  ParallelPolicy parallel_policy() const noexcept { return success_policy_; }

  /** @brief Condition result remembered from the last evaluation. */
  bool last_condition() const noexcept { return last_condition_; }

  /** @brief Check if tick callback is set. */
  bool has_tick() const noexcept { return tick_ != nullptr; }

  /** @brief Check if condition callback is set. */
  bool has_condition() const noexcept { return condition_ != nullptr; }

  /** @brief Check if on-enter callback is set. */
  bool has_on_enter() const noexcept { return on_enter_ != nullptr; }

  /** @brief Check if on-exit callback is set. */
  bool has_on_exit() const noexcept { return on_exit_ != nullptr; }

  /** @brief Check if status is a terminal state (not RUNNING). */
  bool is_finished() const noexcept { return status_ != Status::kRunning; }

  /** @brief Check if the node is currently running. */
  bool is_running() const noexcept { return status_ == Status::kRunning; }

  /** @brief Check if orders place this node in its tree. */
  bool is_connected() const noexcept { return pre_order_ != kInvalidOrder; }

  /** @brief Check if the node owns one cursor per child. */
  bool is_parallel() const noexcept { return type_ == NodeType::kParallel; }

  /** @brief Check if the node must be polled for aborts every tick. */
  bool is_observer() const noexcept {
    return (type_ == NodeType::kConditionalAbort) &&
           (abort_type_ != AbortType::kNone);
  }

  /** @brief Check if the node has a tree-tick callback. */
  bool can_tick_on_tree() const noexcept { return on_tree_tick_ != nullptr; }

  // --- Parallel cursors ---

  /**
   * @brief Recreate the per-child cursors of a parallel node.
   *
   * Each cursor covers exactly the pre-order range of one child's subtree,
   * so orders must be current. Non-parallel nodes drop their cursors.
   */
  void SyncSubIterators() {
    sub_iterators_.clear();
    if (type_ != NodeType::kParallel) {
      return;
    }
    assert(tree_ != nullptr);
    sub_iterators_.reserve(children_count_);
    for (uint16_t i = 0; i < children_count_; ++i) {
      sub_iterators_.push_back(
          std::make_unique<IteratorT>(*tree_, *children_[i]));
    }
  }

  /** @brief Get the cursor that runs child index of a parallel node. */
  IteratorT& GetIterator(uint16_t index) const noexcept {
    assert(index < sub_iterators_.size());
    return *sub_iterators_[index];
  }

  /** @brief Number of per-child cursors (0 unless parallel and synced). */
  uint16_t sub_iterator_count() const noexcept {
    return static_cast<uint16_t>(sub_iterators_.size());
  }

  // --- Validation API ---

  /**
   * @brief Validate this node's configuration (non-recursive).
   * @return ValidateError::kNone if valid, specific error code otherwise.
   *
   * Should be called after tree construction, before Start().
   */
  ValidateError Validate() const noexcept {
    if (IsLeafType(type_)) {
      if (tick_ == nullptr) {
        return ValidateError::kLeafMissingTick;
      }
      if (children_count_ != 0) {
        return ValidateError::kLeafHasChildren;
      }
    }

    if (type_ == NodeType::kInverter) {
      if (children_count_ != 1) {
        return ValidateError::kInverterNotOneChild;
      }
    }

    if (type_ == NodeType::kConditionalAbort) {
      if (condition_ == nullptr) {
        return ValidateError::kConditionalMissingCondition;
      }
      if (children_count_ > 1) {
        return ValidateError::kConditionalTooManyChildren;
      }
    }

    return ValidateError::kNone;
  }

  /**
   * @brief Validate this node and all descendants.
   * @return First error in pre-order, ValidateError::kNone if valid.
   */
  ValidateError ValidateTree() const {
    ValidateError err = ValidateError::kNone;
    TreeWalker<const Node> walker;
    walker.Traverse(
        this,
        [&err](const Node& node) {
          if (err == ValidateError::kNone) {
            err = node.Validate();
          }
        },
        Traversal::kPreOrder,
        [&err](const Node&) { return err != ValidateError::kNone; });
    return err;
  }

 private:
  friend class Iterator<Context>;
  friend class BehaviorTree<Context>;

  // --- Lifecycle (driven by BehaviorTree) ---

  /** @brief Reset runtime state and call on_start. */
  void Start(Context& ctx) {
    status_ = Status::kFailure;
    current_child_ = 0;
    last_condition_ = false;
    if (on_start_ != nullptr) {
      on_start_(ctx);
    }
  }

  void TreeTick(Context& ctx) {
    if (on_tree_tick_ != nullptr) {
      on_tree_tick_(ctx);
    }
  }

  void Copy(Context& ctx) {
    if (on_copy_ != nullptr) {
      on_copy_(ctx);
    }
  }

  /** @brief Copy type, policies and callbacks (not structure). */
  void CopyConfigFrom(const Node& other) {
    type_ = other.type_;
    abort_type_ = other.abort_type_;
    success_policy_ = other.success_policy_;
    tick_ = other.tick_;
    condition_ = other.condition_;
    on_enter_ = other.on_enter_;
    on_exit_ = other.on_exit_;
    on_interrupt_ = other.on_interrupt_;
    on_start_ = other.on_start_;
    on_tree_tick_ = other.on_tree_tick_;
    on_copy_ = other.on_copy_;
  }

  // --- Execution (driven by Iterator) ---

  /**
   * @brief Called when a cursor pushes the node on its active path.
   *
   * Composites and decorators request their first child on their own
   * cursor; the cursor enters it in the same update.
   */
  void Enter(Context& ctx) {
    status_ = Status::kRunning;
    CallEnter(ctx);

    switch (type_) {
      case NodeType::kSequence:
      case NodeType::kSelector:
        EnterComposite();
        break;
      case NodeType::kParallel:
        EnterParallel();
        break;
      case NodeType::kInverter:
        if (children_count_ == 1) {
          iterator_->Traverse(*children_[0]);
        } else {
          status_ = Status::kError;
        }
        break;
      case NodeType::kConditionalAbort:
        EnterConditional(ctx);
        break;
      default:
        break;
    }
  }

  /**
   * @brief Run the node once while it is on top of its cursor.
   *
   * Leaves call their tick callback, parallels advance their sub-cursors,
   * everything else reports the status its children resolved.
   */
  CANOPY_HOT Status Run(Context& ctx) {
    switch (type_) {
      case NodeType::kAction:
      case NodeType::kCondition:
        return TickLeaf(ctx);
      case NodeType::kParallel:
        return TickParallel();
      default:
        return status_;
    }
  }

  void Exit(Context& ctx) { CallExit(ctx); }

  /** @brief A child on the same cursor finished with child_status. */
  void ChildExit(Status child_status) {
    switch (type_) {
      case NodeType::kSequence:
        if (child_status == Status::kSuccess) {
          AdvanceOr(Status::kSuccess);
        } else {
          status_ = child_status;
        }
        break;
      case NodeType::kSelector:
        if (child_status == Status::kFailure) {
          AdvanceOr(Status::kFailure);
        } else {
          status_ = child_status;
        }
        break;
      case NodeType::kInverter:
        status_ = (child_status == Status::kSuccess)   ? Status::kFailure
                : (child_status == Status::kFailure) ? Status::kSuccess
                : child_status;  // RUNNING/ERROR unchanged
        break;
      case NodeType::kConditionalAbort:
        status_ = child_status;
        break;
      default:
        break;
    }
  }

  /** @brief A lower-priority abort is about to restart child. */
  void ChildAbort(const Node& child) noexcept {
    const int32_t index = ChildIndex(child);
    if (index != kInvalidOrder) {
      current_child_ = static_cast<uint16_t>(index);
    }
    status_ = Status::kRunning;
  }

  /** @brief Torn down by an interrupt while on an active path. */
  void Interrupt(Context& ctx) {
    status_ = Status::kFailure;
    if (type_ == NodeType::kParallel) {
      HaltSubIterators();
    }
    if (on_interrupt_ != nullptr) {
      on_interrupt_(ctx);
    }
    CallExit(ctx);
  }

  /**
   * @brief Re-evaluate the condition of an observer.
   * @return true if the change of the condition calls for an abort.
   *
   * Self aborts fire when the condition turns false while the node is on
   * its cursor's active path. Lower-priority aborts fire when the condition
   * turns true while the parent is running a child of lower priority.
   */
  bool IsAbortSatisfied(Context& ctx) {
    if (!is_observer() || (iterator_ == nullptr)) {
      return false;
    }

    const bool result = EvaluateCondition(ctx);
    const bool changed = (result != last_condition_);
    last_condition_ = result;
    if (!changed) {
      return false;
    }

    if (iterator_->IsOnPath(pre_order_)) {
      return !result && AbortsSelf(abort_type_);
    }

    if (!result || !AbortsLowerPriority(abort_type_) || (parent_ == nullptr)) {
      return false;
    }
    const int32_t active = iterator_->ActiveChildOf(parent_->pre_order_);
    return (active != kInvalidOrder) && (active > pre_order_);
  }

  // --- Private helpers ---

  CANOPY_FORCE_INLINE void CallEnter(Context& ctx) {
    if (on_enter_ != nullptr) {
      on_enter_(ctx);
    }
  }

  CANOPY_FORCE_INLINE void CallExit(Context& ctx) {
    if (on_exit_ != nullptr) {
      on_exit_(ctx);
    }
  }

  bool EvaluateCondition(Context& ctx) {
    return (condition_ != nullptr) ? condition_(ctx) : false;
  }

  void EnterComposite() {
    current_child_ = 0;
    if (children_count_ == 0) {
      status_ = (type_ == NodeType::kSequence) ? Status::kSuccess
                                               : Status::kFailure;
      return;
    }
    iterator_->Traverse(*children_[0]);
  }

  void EnterParallel() {
    assert(sub_iterators_.size() == children_count_);
    if (children_count_ == 0) {
      status_ = Status::kSuccess;
      return;
    }
    for (uint16_t i = 0; i < children_count_; ++i) {
      sub_iterators_[i]->Traverse(*children_[i]);
    }
  }

  void EnterConditional(Context& ctx) {
    last_condition_ = EvaluateCondition(ctx);
    if (!last_condition_) {
      status_ = Status::kFailure;
      return;
    }
    if (children_count_ == 0) {
      status_ = Status::kSuccess;
      return;
    }
    iterator_->Traverse(*children_[0]);
  }

  /** @brief Request the next child, or resolve with exhausted. */
  void AdvanceOr(Status exhausted) {
    ++current_child_;
    if (current_child_ < children_count_) {
      iterator_->Traverse(*children_[current_child_]);
    } else {
      status_ = exhausted;
    }
  }

  CANOPY_HOT Status TickLeaf(Context& ctx) {
    if (CANOPY_UNLIKELY(tick_ == nullptr)) {
      status_ = Status::kError;
      return Status::kError;
    }
    status_ = tick_(ctx);
    return status_;
  }

  /**
   * @brief Advance every running sub-cursor once and apply the policy.
   *
   * Finished children are not re-run; their cursor keeps the last status.
   */
  CANOPY_HOT Status TickParallel() {
    if (status_ != Status::kRunning) {
      return status_;
    }

    uint16_t running_count = 0;
    uint16_t success_count = 0;
    uint16_t failure_count = 0;

    for (uint16_t i = 0; i < children_count_; ++i) {
      IteratorT& itr = *sub_iterators_[i];
      if (itr.is_running()) {
        itr.Update();
      }

      if (itr.is_running()) {
        ++running_count;
      } else if (itr.last_status() == Status::kSuccess) {
        ++success_count;
      } else {
        ++failure_count;
      }
    }

    Status result;
    if (success_policy_ == ParallelPolicy::kRequireOne) {
      result = (success_count > 0)   ? Status::kSuccess
             : (running_count > 0) ? Status::kRunning
             : Status::kFailure;
    } else {
      // kRequireAll
      result = (failure_count > 0)   ? Status::kFailure
             : (running_count > 0) ? Status::kRunning
             : Status::kSuccess;
    }

    if (result != Status::kRunning) {
      HaltSubIterators();
    }
    status_ = result;
    return result;
  }

  void HaltSubIterators() {
    for (auto& itr : sub_iterators_) {
      if (itr->is_running()) {
        itr->StepBackInterrupt(*this, true);
      }
    }
  }

  // --- Data members (hot fields first) ---

  NodeType type_;
  Status status_;
  AbortType abort_type_;
  ParallelPolicy success_policy_;
  uint16_t children_count_;
  uint16_t current_child_;
  bool last_condition_;

  // Orders (valid after BehaviorTree order computation)
  int32_t pre_order_;
  int32_t post_order_;
  int32_t level_order_;

  // Non-owning links
  Node* parent_;
  IteratorT* iterator_;
  TreeT* tree_;

  // Callbacks
  TickFn tick_;
  ConditionFn condition_;
  CallbackFn on_enter_;
  CallbackFn on_exit_;
  CallbackFn on_interrupt_;
  CallbackFn on_start_;
  CallbackFn on_tree_tick_;
  CallbackFn on_copy_;

  // Children (fixed-capacity inline array)
  Node* children_[kMaxChildren];

  // Parallel only: one cursor per child
  std::vector<std::unique_ptr<IteratorT>> sub_iterators_;

  // Cold data (rarely accessed)
  const char* name_;
};

template <typename Context>
constexpr uint16_t Node<Context>::kMaxChildren;

}  // namespace canopy

#endif  // CANOPY_NODE_HPP_
