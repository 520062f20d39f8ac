/**
 * @file basic_example.cpp
 * @brief Minimal behavior tree example: Action, Sequence, Selector.
 *
 * Demonstrates:
 * - Creating tree-owned leaf nodes with lambda tick functions
 * - Building sequence and selector composites
 * - Driving the tree one Update() per frame
 * - Blackboard shared across all nodes
 */

#include <canopy/behavior_tree.hpp>
#include <cstdio>

struct AppContext {
  int step = 0;
  bool sensor_ok = false;
};

using AppTree = canopy::BehaviorTree<AppContext>;

static canopy::Status RunFrames(AppTree& tree) {
  while (tree.is_running()) {
    tree.Update();
  }
  return tree.root()->status();
}

int main() {
  AppTree tree;

  // --- Leaf nodes ---

  auto& check_sensor = tree.CreateNode("CheckSensor");
  check_sensor.set_type(canopy::NodeType::kCondition)
      .set_tick([](AppContext& c) {
        std::printf("  [Condition] CheckSensor: %s\n",
                    c.sensor_ok ? "OK" : "FAIL");
        return c.sensor_ok ? canopy::Status::kSuccess
                           : canopy::Status::kFailure;
      });

  auto& init_hw = tree.CreateNode("InitHW");
  init_hw.set_type(canopy::NodeType::kAction)
      .set_tick([](AppContext& c) {
        ++c.step;
        std::printf("  [Action] InitHW (step %d)\n", c.step);
        return canopy::Status::kSuccess;
      });

  auto& start_app = tree.CreateNode("StartApp");
  start_app.set_type(canopy::NodeType::kAction)
      .set_tick([](AppContext& c) {
        ++c.step;
        std::printf("  [Action] StartApp (step %d)\n", c.step);
        return canopy::Status::kSuccess;
      });

  auto& fallback = tree.CreateNode("Fallback");
  fallback.set_type(canopy::NodeType::kAction)
      .set_tick([](AppContext& c) {
        ++c.step;
        std::printf("  [Action] Fallback (step %d)\n", c.step);
        return canopy::Status::kSuccess;
      });

  // --- Composite: Sequence (check sensor -> init -> start) ---

  auto& startup = tree.CreateNode("Startup");
  canopy::Node<AppContext>* seq_children[] = {&check_sensor, &init_hw,
                                              &start_app};
  startup.set_type(canopy::NodeType::kSequence).SetChildren(seq_children);

  // --- Root: Selector (try startup, else fallback) ---

  auto& root = tree.CreateNode("Root");
  canopy::Node<AppContext>* root_children[] = {&startup, &fallback};
  root.set_type(canopy::NodeType::kSelector).SetChildren(root_children);

  if (!tree.SetRoot(&root) ||
      (tree.ValidateTree() != canopy::ValidateError::kNone)) {
    std::printf("invalid tree\n");
    return 1;
  }

  // --- Run ---

  tree.blackboard().sensor_ok = true;
  tree.Start();
  std::printf("=== Run 1: sensor OK ===\n");
  canopy::Status result = RunFrames(tree);
  std::printf("  Result: %s\n\n", canopy::StatusToString(result));

  // Restart and try with sensor failure
  tree.blackboard().step = 0;
  tree.blackboard().sensor_ok = false;
  tree.Start();

  std::printf("=== Run 2: sensor FAIL ===\n");
  result = RunFrames(tree);
  std::printf("  Result: %s\n\n", canopy::StatusToString(result));

  std::printf("Total frames: %u\n", tree.tick_count());

  return 0;
}
