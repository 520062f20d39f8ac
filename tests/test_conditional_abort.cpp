#include <catch2/catch.hpp>
#include <canopy/behavior_tree.hpp>

#include "test_util.hpp"

using canopy_test::RunToCompletion;
using canopy_test::StartAt;

struct AbortCtx {
  bool gate = false;
  bool inner_gate = false;
  int a_interrupts = 0;
  int b_enters = 0;
  int b_runs = 0;
  int b_interrupts = 0;
  int x_runs = 0;
  int y_interrupts = 0;
  int p1_interrupts = 0;
};

using AbortTree = canopy::BehaviorTree<AbortCtx>;
using AbortNode = canopy::Node<AbortCtx>;

static bool Gate(AbortCtx& c) { return c.gate; }
static bool InnerGate(AbortCtx& c) { return c.inner_gate; }
static canopy::Status Fail(AbortCtx&) { return canopy::Status::kFailure; }
static canopy::Status Succeed(AbortCtx&) { return canopy::Status::kSuccess; }
static canopy::Status Busy(AbortCtx&) { return canopy::Status::kRunning; }

TEST_CASE("Conditional gate without abort type", "[abort]") {
  AbortTree tree;
  auto& gate = tree.CreateNode("Gate");
  auto& child = tree.CreateNode("Child");
  child.set_tick(Succeed);
  gate.set_type(canopy::NodeType::kConditionalAbort)
      .set_condition(Gate)
      .SetChild(child);

  SECTION("condition false fails without running the child") {
    StartAt(tree, gate);
    REQUIRE(RunToCompletion(tree) == canopy::Status::kFailure);
    REQUIRE(child.status() == canopy::Status::kFailure);
  }

  SECTION("condition true reports the child") {
    tree.blackboard().gate = true;
    StartAt(tree, gate);
    REQUIRE(RunToCompletion(tree) == canopy::Status::kSuccess);
    REQUIRE(child.status() == canopy::Status::kSuccess);
  }

  SECTION("not polled as an observer") {
    StartAt(tree, gate);
    REQUIRE(tree.observers().empty());
  }
}

TEST_CASE("Conditional gate without child is a condition check", "[abort]") {
  AbortTree tree(AbortCtx{true});
  auto& gate = tree.CreateNode("Gate");
  gate.set_type(canopy::NodeType::kConditionalAbort).set_condition(Gate);
  StartAt(tree, gate);

  REQUIRE(tree.Update() == canopy::Status::kSuccess);
}

TEST_CASE("Self abort restarts the guarded subtree", "[abort]") {
  /*
   * 0 Selector
   * +-- 1 Guard (SELF, gate)
   * |   +-- 2 a (RUNNING forever)
   * +-- 3 b
   */
  AbortTree tree(AbortCtx{true});
  auto& sel = tree.CreateNode("Sel");
  auto& guard = tree.CreateNode("Guard");
  auto& a = tree.CreateNode("a");
  auto& b = tree.CreateNode("b");

  a.set_tick(Busy).set_on_interrupt([](AbortCtx& c) { ++c.a_interrupts; });
  b.set_tick([](AbortCtx& c) {
    ++c.b_runs;
    return canopy::Status::kSuccess;
  });
  guard.set_type(canopy::NodeType::kConditionalAbort)
      .set_condition(Gate)
      .set_abort_type(canopy::AbortType::kSelf)
      .SetChild(a);
  sel.set_type(canopy::NodeType::kSelector).AddChild(guard).AddChild(b);
  StartAt(tree, sel);

  REQUIRE(tree.observers().size() == 1);

  tree.Update();
  tree.Update();
  REQUIRE(a.is_running());

  tree.blackboard().gate = false;
  REQUIRE(tree.Update() == canopy::Status::kFailure);  // guard re-entered, fails
  REQUIRE(tree.blackboard().a_interrupts == 1);
  REQUIRE(guard.status() == canopy::Status::kFailure);
  REQUIRE(tree.blackboard().b_runs == 0);

  tree.Update();
  REQUIRE(tree.blackboard().b_runs == 1);
  REQUIRE(RunToCompletion(tree) == canopy::Status::kSuccess);
}

TEST_CASE("Self abort ignores an unchanged condition", "[abort]") {
  AbortTree tree(AbortCtx{true});
  auto& sel = tree.CreateNode("Sel");
  auto& guard = tree.CreateNode("Guard");
  auto& a = tree.CreateNode("a");

  a.set_tick(Busy).set_on_interrupt([](AbortCtx& c) { ++c.a_interrupts; });
  guard.set_type(canopy::NodeType::kConditionalAbort)
      .set_condition(Gate)
      .set_abort_type(canopy::AbortType::kSelf)
      .SetChild(a);
  sel.set_type(canopy::NodeType::kSelector).AddChild(guard);
  StartAt(tree, sel);

  for (int i = 0; i < 5; ++i) {
    tree.Update();
  }
  REQUIRE(tree.blackboard().a_interrupts == 0);
  REQUIRE(tree.main_iterator()->current_index() == a.pre_order());
}

TEST_CASE("Lower-priority abort preempts a running sibling", "[abort]") {
  /*
   * 0 Selector
   * +-- 1 Guard (LOWER_PRIORITY, gate)
   * |   +-- 2 x (RUNNING forever)
   * +-- 3 b (RUNNING forever)
   */
  AbortTree tree;
  auto& sel = tree.CreateNode("Sel");
  auto& guard = tree.CreateNode("Guard");
  auto& x = tree.CreateNode("x");
  auto& b = tree.CreateNode("b");

  x.set_tick([](AbortCtx& c) {
    ++c.x_runs;
    return canopy::Status::kRunning;
  });
  b.set_tick(Busy).set_on_interrupt([](AbortCtx& c) { ++c.b_interrupts; });
  guard.set_type(canopy::NodeType::kConditionalAbort)
      .set_condition(Gate)
      .set_abort_type(canopy::AbortType::kLowerPriority)
      .SetChild(x);
  sel.set_type(canopy::NodeType::kSelector).AddChild(guard).AddChild(b);
  StartAt(tree, sel);

  tree.Update();  // guard fails, b requested
  tree.Update();
  tree.Update();
  REQUIRE(b.is_running());
  REQUIRE(sel.current_child_index() == 1);

  tree.blackboard().gate = true;
  tree.Update();
  REQUIRE(tree.blackboard().b_interrupts == 1);
  REQUIRE(tree.blackboard().x_runs == 1);
  REQUIRE(sel.current_child_index() == 0);
  REQUIRE(tree.main_iterator()->current_index() == x.pre_order());
}

TEST_CASE("Lower-priority abort does not preempt higher priority", "[abort]") {
  AbortTree tree;
  auto& sel = tree.CreateNode("Sel");
  auto& first = tree.CreateNode("first");
  auto& guard = tree.CreateNode("Guard");
  auto& x = tree.CreateNode("x");

  first.set_tick(Busy);
  x.set_tick([](AbortCtx& c) {
    ++c.x_runs;
    return canopy::Status::kSuccess;
  });
  guard.set_type(canopy::NodeType::kConditionalAbort)
      .set_condition(Gate)
      .set_abort_type(canopy::AbortType::kLowerPriority)
      .SetChild(x);
  sel.set_type(canopy::NodeType::kSelector).AddChild(first).AddChild(guard);
  StartAt(tree, sel);

  tree.Update();
  tree.blackboard().gate = true;
  tree.Update();
  tree.Update();

  REQUIRE(tree.blackboard().x_runs == 0);
  REQUIRE(tree.main_iterator()->current_index() == first.pre_order());
}

TEST_CASE("Abort type BOTH preempts and self aborts", "[abort]") {
  AbortTree tree;
  auto& sel = tree.CreateNode("Sel");
  auto& guard = tree.CreateNode("Guard");
  auto& x = tree.CreateNode("x");
  auto& b = tree.CreateNode("b");

  x.set_tick(Busy);
  b.set_tick(Busy).set_on_enter([](AbortCtx& c) { ++c.b_enters; });
  guard.set_type(canopy::NodeType::kConditionalAbort)
      .set_condition(Gate)
      .set_abort_type(canopy::AbortType::kBoth)
      .SetChild(x);
  sel.set_type(canopy::NodeType::kSelector).AddChild(guard).AddChild(b);
  StartAt(tree, sel);

  tree.Update();
  tree.Update();
  REQUIRE(tree.blackboard().b_enters == 1);

  tree.blackboard().gate = true;  // preempts b
  tree.Update();
  REQUIRE(x.is_running());
  REQUIRE(b.status() == canopy::Status::kFailure);

  tree.blackboard().gate = false;  // aborts itself, selector moves on to b
  tree.Update();
  REQUIRE(guard.status() == canopy::Status::kFailure);
  tree.Update();
  REQUIRE(tree.blackboard().b_enters == 2);
  REQUIRE(b.is_running());
}

namespace {

/*
 * 0 Selector
 * +-- 1 c1 (FAILURE)
 * +-- 2 c2 (FAILURE)
 * +-- 3 X (LOWER_PRIORITY, gate)
 * |   +-- 4 x
 * +-- 5 P (Parallel)
 *     +-- 6 p1 (RUNNING)
 *     +-- 7 Y (SELF, inner_gate)
 *         +-- 8 y (RUNNING)
 */
struct TieBreakFixture {
  AbortTree tree{AbortCtx{false, true}};
  AbortNode& root = tree.CreateNode("Root");
  AbortNode& c1 = tree.CreateNode("c1");
  AbortNode& c2 = tree.CreateNode("c2");
  AbortNode& guard_x = tree.CreateNode("X");
  AbortNode& x = tree.CreateNode("x");
  AbortNode& par = tree.CreateNode("P");
  AbortNode& p1 = tree.CreateNode("p1");
  AbortNode& guard_y = tree.CreateNode("Y");
  AbortNode& y = tree.CreateNode("y");

  TieBreakFixture() {
    c1.set_tick(Fail);
    c2.set_tick(Fail);
    x.set_tick([](AbortCtx& c) {
      ++c.x_runs;
      return canopy::Status::kRunning;
    });
    p1.set_tick(Busy).set_on_interrupt([](AbortCtx& c) { ++c.p1_interrupts; });
    y.set_tick(Busy).set_on_interrupt([](AbortCtx& c) { ++c.y_interrupts; });

    guard_x.set_type(canopy::NodeType::kConditionalAbort)
        .set_condition(Gate)
        .set_abort_type(canopy::AbortType::kLowerPriority)
        .SetChild(x);
    guard_y.set_type(canopy::NodeType::kConditionalAbort)
        .set_condition(InnerGate)
        .set_abort_type(canopy::AbortType::kSelf)
        .SetChild(y);
    par.set_type(canopy::NodeType::kParallel).AddChild(p1).AddChild(guard_y);
    root.set_type(canopy::NodeType::kSelector)
        .AddChild(c1)
        .AddChild(c2)
        .AddChild(guard_x)
        .AddChild(par);
    StartAt(tree, root);

    for (int i = 0; i < 4; ++i) {
      tree.Update();
    }
  }
};

}  // namespace

TEST_CASE("Observers are cached in pre-order", "[abort]") {
  TieBreakFixture f;
  REQUIRE(f.guard_x.pre_order() == 3);
  REQUIRE(f.guard_y.pre_order() == 7);
  REQUIRE(f.tree.observers().size() == 2);
  REQUIRE(f.tree.observers()[0] == &f.guard_x);
  REQUIRE(f.tree.observers()[1] == &f.guard_y);

  // Both branches of the parallel are running
  REQUIRE(f.root.current_child_index() == 3);
  REQUIRE(f.p1.is_running());
  REQUIRE(f.y.is_running());
}

TEST_CASE("Higher-priority abort wins over a lower one", "[abort]") {
  TieBreakFixture f;
  f.tree.blackboard().gate = true;
  f.tree.blackboard().inner_gate = false;

  f.tree.Update();

  const AbortCtx& ctx = f.tree.blackboard();
  REQUIRE(f.root.current_child_index() == 2);
  REQUIRE(ctx.x_runs == 1);
  // The parallel branch was torn down once, by the preemption
  REQUIRE(ctx.p1_interrupts == 1);
  REQUIRE(ctx.y_interrupts == 1);
  REQUIRE(f.par.GetIterator(0).is_running() == false);
  REQUIRE(f.par.GetIterator(1).is_running() == false);
  REQUIRE(f.par.status() == canopy::Status::kFailure);
}

TEST_CASE("Self abort inside a parallel branch", "[abort]") {
  TieBreakFixture f;
  f.tree.blackboard().inner_gate = false;

  // Y restarts on its own cursor and fails; the parallel resolves
  REQUIRE(f.tree.Update() == canopy::Status::kFailure);

  const AbortCtx& ctx = f.tree.blackboard();
  REQUIRE(ctx.y_interrupts == 1);
  REQUIRE(ctx.p1_interrupts == 1);
  REQUIRE(ctx.x_runs == 0);
  REQUIRE(f.guard_y.status() == canopy::Status::kFailure);
  REQUIRE(f.par.status() == canopy::Status::kFailure);
  REQUIRE(RunToCompletion(f.tree) == canopy::Status::kFailure);
}
