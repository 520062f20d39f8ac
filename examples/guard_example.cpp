/**
 * @file guard_example.cpp
 * @brief Reactive agents: conditional aborts, parallel branches, cloning.
 *
 * One template tree is cloned into several agents, each with its own
 * blackboard:
 *
 *   Root (Selector)
 *   +-- Engage (ConditionalAbort, LOWER_PRIORITY: enemy_visible)
 *   |   +-- Attack (Action, RUNNING while the enemy is visible)
 *   +-- Patrol (Parallel, RequireOne)
 *       +-- Walk (Action, RUNNING)
 *       +-- Rest (ConditionalAbort, SELF: !tired)
 *           +-- Look (Action, RUNNING)
 *
 * While the agent patrols, the Engage guard watches its condition. When an
 * enemy appears the patrol branch is torn down and Attack starts in the same
 * frame.
 *
 * Demonstrates:
 * - Observers (conditional aborts) polled every frame
 * - Per-child cursors of a parallel node
 * - Tree-tick callbacks (a frame counter that runs regardless of the cursor)
 * - Cloning a template into independent runtime trees
 * - Routing library logs through spdlog
 */

#include <canopy/behavior_tree.hpp>
#include <cstdio>
#include <memory>
#include <vector>

struct Agent {
  int id = 0;
  int frame = 0;
  int enemy_frame = 0;  // frame the enemy shows up, 0 for never
  bool enemy_visible = false;
  bool tired = false;
  int attacks = 0;
};

using AgentTree = canopy::BehaviorTree<Agent>;

static bool EnemyVisible(Agent& a) { return a.enemy_visible; }
static bool Rested(Agent& a) { return !a.tired; }

static void BuildTemplate(AgentTree& tree) {
  auto& root = tree.CreateNode("Root");
  auto& engage = tree.CreateNode("Engage");
  auto& attack = tree.CreateNode("Attack");
  auto& patrol = tree.CreateNode("Patrol");
  auto& walk = tree.CreateNode("Walk");
  auto& rest = tree.CreateNode("Rest");
  auto& look = tree.CreateNode("Look");

  canopy::factory::MakeAction(attack, [](Agent& a) {
    ++a.attacks;
    std::printf("    agent %d: attack #%d\n", a.id, a.attacks);
    return a.enemy_visible ? canopy::Status::kRunning
                           : canopy::Status::kSuccess;
  });
  canopy::factory::MakeConditionalAbort(
      engage, EnemyVisible, canopy::AbortType::kLowerPriority, attack);

  canopy::factory::MakeAction(walk, [](Agent& a) {
    std::printf("    agent %d: walking\n", a.id);
    return canopy::Status::kRunning;
  });
  walk.set_on_interrupt([](Agent& a) {
    std::printf("    agent %d: patrol interrupted\n", a.id);
  });
  canopy::factory::MakeAction(look, [](Agent&) {
    return canopy::Status::kRunning;
  });
  canopy::factory::MakeConditionalAbort(rest, Rested, canopy::AbortType::kSelf,
                                        look);

  canopy::Node<Agent>* patrol_children[] = {&walk, &rest};
  canopy::factory::MakeParallel(patrol, patrol_children, 2,
                                canopy::ParallelPolicy::kRequireOne);

  canopy::Node<Agent>* root_children[] = {&engage, &patrol};
  canopy::factory::MakeSelector(root, root_children, 2);

  // Drives the simulated world before the observers are polled
  root.set_on_tree_tick([](Agent& a) {
    ++a.frame;
    a.enemy_visible = (a.enemy_frame != 0) && (a.frame >= a.enemy_frame) &&
                      (a.frame < a.enemy_frame + 3);
  });

  tree.SetRoot(&root);
}

int main() {
  canopy::SetLogLevel(spdlog::level::debug);

  AgentTree prototype;
  BuildTemplate(prototype);
  const canopy::ValidateError err = prototype.ValidateTree();
  if (err != canopy::ValidateError::kNone) {
    std::printf("invalid template: %s\n", canopy::ValidateErrorToString(err));
    return 1;
  }
  prototype.SortNodes();

  std::vector<std::unique_ptr<AgentTree>> agents;
  for (int i = 0; i < 2; ++i) {
    agents.push_back(AgentTree::Clone(prototype));
    Agent& a = agents.back()->blackboard();
    a.id = i;
    a.enemy_frame = (i == 0) ? 3 : 0;
    agents.back()->Start();
  }

  for (int frame = 1; frame <= 6; ++frame) {
    std::printf("=== Frame %d ===\n", frame);
    for (auto& agent : agents) {
      agent->Update();
    }
  }

  for (const auto& agent : agents) {
    std::printf("agent %d: %d attacks, %u frames, running %s\n",
                agent->blackboard().id, agent->blackboard().attacks,
                agent->tick_count(), agent->is_running() ? "yes" : "no");
  }
  return 0;
}
