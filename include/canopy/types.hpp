/**
 * @file types.hpp
 * @brief Enumerations, constants and configuration macros shared by canopy.
 *
 * Configuration macros (define BEFORE including any canopy header):
 * - CANOPY_MAX_CHILDREN: Max children per node (default 8)
 * - CANOPY_USE_STD_FUNCTION: Use std::function for callbacks (allows lambda
 *   captures). Default: raw function pointers (zero heap, deterministic
 *   latency). When using function pointers, put per-node state in Context.
 * - CANOPY_LOGGER_NAME: Name of the spdlog logger used by the library
 *   (default "canopy").
 */

#ifndef CANOPY_TYPES_HPP_
#define CANOPY_TYPES_HPP_

#include <cstdint>

// ============================================================================
// Configuration
// ============================================================================

/** @brief Maximum children per node (fixed-capacity inline array). */
#ifndef CANOPY_MAX_CHILDREN
#define CANOPY_MAX_CHILDREN 8
#endif

// ============================================================================
// Compiler hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define CANOPY_LIKELY(x) __builtin_expect(!!(x), 1)
#define CANOPY_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define CANOPY_FORCE_INLINE inline __attribute__((always_inline))
#define CANOPY_HOT __attribute__((hot))
#else
#define CANOPY_LIKELY(x) (x)
#define CANOPY_UNLIKELY(x) (x)
#define CANOPY_FORCE_INLINE inline
#define CANOPY_HOT
#endif

namespace canopy {

/// Order index of a node that is not connected to the root, or whose orders
/// have not been computed yet.
constexpr int32_t kInvalidOrder = -1;

// ============================================================================
// Status
// ============================================================================

/**
 * @brief Behavior tree node execution status.
 *
 * A cursor stays parked on a node for as long as it returns kRunning.
 */
enum class Status : uint8_t {
  kSuccess = 0,  ///< Node executed successfully
  kFailure = 1,  ///< Node execution failed (or was interrupted)
  kRunning = 2,  ///< Node still executing, resumed on the next update
  kError = 3     ///< Node error (invalid configuration)
};

/**
 * @brief Convert Status to human-readable string.
 */
inline constexpr const char* StatusToString(Status s) noexcept {
  return (s == Status::kSuccess) ? "SUCCESS"
       : (s == Status::kFailure) ? "FAILURE"
       : (s == Status::kRunning) ? "RUNNING"
       : (s == Status::kError)   ? "ERROR"
       : "UNKNOWN";
}

// ============================================================================
// Node Type
// ============================================================================

/**
 * @brief Behavior tree node type enumeration.
 *
 * - ACTION:            Leaf node that performs an action
 * - CONDITION:         Leaf node that checks a condition
 * - SEQUENCE:          Composite: all children must succeed (AND logic)
 * - SELECTOR:          Composite: first successful child wins (OR logic)
 * - PARALLEL:          Composite: one cursor per child, all advanced per tick
 * - INVERTER:          Decorator: inverts child result (SUCCESS <-> FAILURE)
 * - CONDITIONAL_ABORT: Decorator: gates its child on a condition and can
 *                      observe that condition to abort running subtrees
 */
enum class NodeType : uint8_t {
  kAction = 0,
  kCondition,
  kSequence,
  kSelector,
  kParallel,
  kInverter,
  kConditionalAbort
};

/**
 * @brief Convert NodeType to human-readable string.
 */
inline constexpr const char* NodeTypeToString(NodeType t) noexcept {
  return (t == NodeType::kAction)           ? "ACTION"
       : (t == NodeType::kCondition)        ? "CONDITION"
       : (t == NodeType::kSequence)         ? "SEQUENCE"
       : (t == NodeType::kSelector)         ? "SELECTOR"
       : (t == NodeType::kParallel)         ? "PARALLEL"
       : (t == NodeType::kInverter)         ? "INVERTER"
       : (t == NodeType::kConditionalAbort) ? "CONDITIONAL_ABORT"
       : "UNKNOWN";
}

/** @brief Check if a node type is a leaf type (ACTION or CONDITION). */
inline constexpr bool IsLeafType(NodeType t) noexcept {
  return (t == NodeType::kAction) || (t == NodeType::kCondition);
}

/** @brief Check if a node type is a composite type. */
inline constexpr bool IsCompositeType(NodeType t) noexcept {
  return (t == NodeType::kSequence) || (t == NodeType::kSelector) ||
         (t == NodeType::kParallel);
}

/** @brief Check if a node type is a decorator type. */
inline constexpr bool IsDecoratorType(NodeType t) noexcept {
  return (t == NodeType::kInverter) || (t == NodeType::kConditionalAbort);
}

// ============================================================================
// Abort Type
// ============================================================================

/**
 * @brief Which running subtrees a conditional-abort node observes.
 *
 * - NONE:           never aborts, behaves as a plain conditional gate
 * - SELF:           aborts its own running subtree when the condition
 *                   turns false
 * - LOWER_PRIORITY: aborts a running lower-priority sibling subtree when the
 *                   condition turns true
 * - BOTH:           SELF and LOWER_PRIORITY
 */
enum class AbortType : uint8_t {
  kNone = 0,
  kSelf,
  kLowerPriority,
  kBoth
};

/** @brief Convert AbortType to human-readable string. */
inline constexpr const char* AbortTypeToString(AbortType a) noexcept {
  return (a == AbortType::kNone)          ? "NONE"
       : (a == AbortType::kSelf)          ? "SELF"
       : (a == AbortType::kLowerPriority) ? "LOWER_PRIORITY"
       : (a == AbortType::kBoth)          ? "BOTH"
       : "UNKNOWN";
}

/** @brief True if the abort type observes the node's own subtree. */
inline constexpr bool AbortsSelf(AbortType a) noexcept {
  return (a == AbortType::kSelf) || (a == AbortType::kBoth);
}

/** @brief True if the abort type observes lower-priority siblings. */
inline constexpr bool AbortsLowerPriority(AbortType a) noexcept {
  return (a == AbortType::kLowerPriority) || (a == AbortType::kBoth);
}

// ============================================================================
// Parallel Policy
// ============================================================================

/**
 * @brief Success/failure policy for parallel nodes.
 */
enum class ParallelPolicy : uint8_t {
  kRequireAll = 0,  ///< All children must succeed for parallel to succeed
  kRequireOne       ///< One child success is enough for parallel to succeed
};

// ============================================================================
// Traversal order
// ============================================================================

/** @brief Visitation order of TreeWalker. */
enum class Traversal : uint8_t {
  kPreOrder = 0,  ///< Node before its children
  kPostOrder,     ///< Node after its children
  kLevelOrder     ///< Breadth-first, one depth tier at a time
};

// ============================================================================
// Iterator state
// ============================================================================

/** @brief Lifecycle of an execution cursor. */
enum class IteratorState : uint8_t {
  kIdle = 0,  ///< Never traversed
  kRunning,   ///< Has an active path or a pending traversal
  kHalted     ///< Finished; last status is recorded
};

/** @brief Convert IteratorState to human-readable string. */
inline constexpr const char* IteratorStateToString(IteratorState s) noexcept {
  return (s == IteratorState::kIdle)    ? "IDLE"
       : (s == IteratorState::kRunning) ? "RUNNING"
       : (s == IteratorState::kHalted)  ? "HALTED"
       : "UNKNOWN";
}

// ============================================================================
// Validation Error
// ============================================================================

/**
 * @brief Tree structure validation error codes.
 *
 * Returned by Node::Validate() and BehaviorTree::ValidateTree() to report
 * configuration errors. Validation should be called once after tree
 * construction, before Start(). Zero runtime overhead on hot path.
 */
enum class ValidateError : uint8_t {
  kNone = 0,                     ///< No error
  kLeafMissingTick,              ///< Leaf node has no tick callback
  kLeafHasChildren,              ///< Leaf node has children
  kInverterNotOneChild,          ///< Inverter must have exactly 1 child
  kConditionalMissingCondition,  ///< Conditional abort has no condition
  kConditionalTooManyChildren,   ///< Conditional abort has more than 1 child
  kMissingRoot                   ///< Tree has no root
};

/** @brief Convert ValidateError to human-readable string. */
inline constexpr const char* ValidateErrorToString(ValidateError e) noexcept {
  return (e == ValidateError::kNone)                        ? "NONE"
       : (e == ValidateError::kLeafMissingTick)             ? "LEAF_MISSING_TICK"
       : (e == ValidateError::kLeafHasChildren)             ? "LEAF_HAS_CHILDREN"
       : (e == ValidateError::kInverterNotOneChild)         ? "INVERTER_NOT_ONE_CHILD"
       : (e == ValidateError::kConditionalMissingCondition) ? "CONDITIONAL_MISSING_CONDITION"
       : (e == ValidateError::kConditionalTooManyChildren)  ? "CONDITIONAL_TOO_MANY_CHILDREN"
       : (e == ValidateError::kMissingRoot)                 ? "MISSING_ROOT"
       : "UNKNOWN";
}

}  // namespace canopy

#endif  // CANOPY_TYPES_HPP_
