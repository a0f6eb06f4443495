/**
 * MCTS Engine Unit Tests
 *
 * Validates:
 * - UCB1 scoring and unvisited-first selection
 * - Visit/value accounting through explore()
 * - Parent visits never trail child visits
 * - Virtual loss restored on every exit path
 * - Oracle failures are soft (EvaluationFailed), nothing half-attached
 * - Concurrent steps on one timeline
 * - branch_alternatives, housekeeping, auto_backtrack, merge
 * - dump/load
 */

#include <doctest/doctest.h>
#include <retrace/mcts.hpp>

#include "stubs/scripted_oracle.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <memory>
#include <thread>
#include <vector>

using namespace retrace;
using namespace retrace::mcts;
using retrace_test::Fail;
using retrace_test::ScriptedOracle;

// ============================================================================
// Test helpers
// ============================================================================

static SearchConfig inline_config() {
  SearchConfig c;
  c.oracle_timeout_ms = 0;  // run oracle calls on the caller's thread
  return c;
}

struct Fixture {
  branch::BranchStore branches;
  timeline::TimelineStore timelines{branches};
  std::shared_ptr<ScriptedOracle> oracle = std::make_shared<ScriptedOracle>();
  std::unique_ptr<Engine> engine;
  Id session = INVALID_ID;

  explicit Fixture(SearchConfig cfg = inline_config()) {
    session = branches.create_session();
    engine = std::make_unique<Engine>(branches, timelines, oracle, cfg);
  }

  SearchNode node(Id id) const {
    auto n = engine->node(id);
    REQUIRE(n);
    return *n;
  }

  void check_no_virtual_loss() const {
    for (Id id : all_nodes()) {
      CHECK(engine->in_flight(id) == 0);
    }
  }

  std::vector<Id> all_nodes() const {
    std::vector<Id> out;
    for (const auto& t : timelines.session_timelines(session)) {
      for (const auto& n : engine->timeline_nodes(t.id)) out.push_back(n.id);
    }
    return out;
  }
};

// ============================================================================
// Scoring
// ============================================================================

TEST_CASE("mcts: ucb1 formula and unvisited infinity") {
  CHECK(std::isinf(ucb1(0.0, 0, 10, 1.4)));

  double c = std::sqrt(2.0);
  double expected = 0.5 + c * std::sqrt(std::log(4.0) / 2.0);
  CHECK(ucb1(1.0, 2, 4, c) == doctest::Approx(expected));

  // ln(max(N,1)) keeps the exploration term finite for an unvisited parent
  CHECK(ucb1(0.7, 1, 0, c) == doctest::Approx(0.7));
}

// ============================================================================
// Start and step
// ============================================================================

TEST_CASE("mcts: start creates root branch, thought, timeline and node") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Design a cache");

  branch::Branch root = f.branches.get(r.branch);
  CHECK(root.name == "MCTS root");
  CHECK(root.parent == INVALID_ID);
  CHECK(f.branches.thoughts(r.branch).front().content == "Design a cache");
  CHECK(f.timelines.get(r.timeline).root_branch == r.branch);
  CHECK(f.node(r.root_node).branch == r.branch);
  CHECK(f.engine->node_for_branch(r.branch) == r.root_node);

  CHECK_THROWS_AS(f.engine->start(make_id(50, 0), "x"), ValidationError);
}

TEST_CASE("mcts: first step expands the root and simulates its first child") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->rewards = {0.8};

  StepResult s = f.engine->step(r.timeline);
  REQUIRE(s.ok());
  CHECK(s.selected_node == r.root_node);
  CHECK(s.expanded == 3);
  CHECK(s.backprop_nodes == 2);
  CHECK(s.reward == doctest::Approx(0.8));

  SearchNode root = f.node(r.root_node);
  CHECK(root.is_expanded);
  CHECK(root.children.size() == 3);
  CHECK(root.visit_count == 1);
  CHECK(f.node(s.simulated_node).parent == r.root_node);
  CHECK(f.node(s.simulated_node).simulation_depth == 1);

  // Each child is a branch + thought + overlay
  for (Id cid : root.children) {
    SearchNode c = f.node(cid);
    CHECK(f.branches.get(c.branch).parent == r.branch);
    CHECK(f.branches.thoughts(c.branch).front().content == c.content);
    auto ov = f.timelines.overlay(c.branch);
    REQUIRE(ov);
    CHECK(ov->mcts_generated);
    CHECK(ov->depth == 1);
  }

  // The oracle saw the root's prefix
  REQUIRE_FALSE(f.oracle->prefixes.empty());
  CHECK(f.oracle->prefixes.front() == oracle::Prefix{"Q"});
}

TEST_CASE("mcts: selection prefers an unvisited child") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  std::vector<Id> kids = f.engine->expand(r.root_node, 3);
  REQUIRE(kids.size() == 3);

  for (int i = 0; i < 3; ++i) f.engine->backpropagate(kids[0], 1.0);

  StepResult s = f.engine->step(r.timeline);
  REQUIRE(s.ok());
  CHECK(s.selected_node == kids[1]);
}

TEST_CASE("mcts: ten rollouts account every reward at the root") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->rewards = {0.1, 0.9, 0.4, 0.6, 0.3, 0.7, 0.2, 0.8, 0.5, 1.0};

  ExploreResult res = f.engine->explore(r.timeline, 10);
  CHECK(res.failed_steps == 0);
  CHECK(res.iteration_stats.size() == 10);
  CHECK(res.root_node == r.root_node);
  REQUIRE_FALSE(res.best_path.empty());
  CHECK(res.best_path.front() == r.root_node);
  CHECK(res.best_path_content.size() == res.best_path.size());
  CHECK(res.nodes_explored == f.engine->timeline_nodes(r.timeline).size());

  SearchNode root = f.node(r.root_node);
  CHECK(root.visit_count == 10);
  CHECK(root.total_value == doctest::Approx(f.oracle->returned_sum()));
  CHECK(f.timelines.overlay(r.branch)->visit_count == 10);
  f.check_no_virtual_loss();

  nlohmann::json j = res.iteration_stats.front();
  CHECK(j["status"] == "completed");
  CHECK(j["iteration"] == 1);
}

TEST_CASE("mcts: parent visits never trail child visits") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->reward_fn = [](const oracle::Prefix& p) { return p.size() % 2 == 0 ? 0.9 : 0.2; };

  f.engine->explore(r.timeline, 30);

  for (const auto& n : f.engine->timeline_nodes(r.timeline)) {
    if (n.parent == INVALID_ID) continue;
    CHECK(f.node(n.parent).visit_count >= n.visit_count);
  }
}

TEST_CASE("mcts: best path follows the highest mean") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  std::vector<Id> kids = f.engine->expand(r.root_node, 3);
  f.engine->backpropagate(kids[0], 0.2);
  f.engine->backpropagate(kids[1], 0.9);
  f.engine->backpropagate(kids[2], 0.4);

  BestPath best = f.engine->best_path(r.timeline);
  REQUIRE(best.nodes.size() == 2);
  CHECK(best.nodes[1] == kids[1]);
  CHECK(best.branches[1] == f.node(kids[1]).branch);
  CHECK(best.value == doctest::Approx(0.9));
}

TEST_CASE("mcts: children at max depth are terminal") {
  SearchConfig cfg = inline_config();
  cfg.max_depth = 1;
  Fixture f(cfg);
  StartResult r = f.engine->start(f.session, "Q");

  f.engine->explore(r.timeline, 8);
  CHECK(f.engine->node_count() == 4);
  for (Id cid : f.node(r.root_node).children) {
    CHECK(f.node(cid).is_terminal);
    CHECK_FALSE(f.node(cid).is_expanded);
  }
  CHECK(f.node(r.root_node).visit_count == 8);
}

TEST_CASE("mcts: no continuations marks the node terminal") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->continuations = std::vector<oracle::Continuation>{};

  StepResult s = f.engine->step(r.timeline);
  REQUIRE(s.ok());
  CHECK(s.expanded == 0);
  CHECK(s.simulated_node == r.root_node);
  CHECK(f.node(r.root_node).is_terminal);

  f.engine->step(r.timeline);
  CHECK(f.oracle->generate_calls == 1);
  CHECK(f.node(r.root_node).visit_count == 2);
}

TEST_CASE("mcts: step continues from the active branch") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  std::vector<Id> kids = f.engine->expand(r.root_node, 3);
  f.engine->set_active(r.timeline, f.node(kids[2]).branch);

  StepResult s = f.engine->step(r.timeline);
  REQUIRE(s.ok());
  CHECK(s.selected_node == kids[2]);
  CHECK(f.node(r.root_node).visit_count == 1);
}

// ============================================================================
// Merge
// ============================================================================

TEST_CASE("mcts: merge creates a merged branch under the target") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  std::vector<Id> kids = f.engine->expand(r.root_node, 2);
  Id source = f.node(kids[0]).branch;
  Id target = f.node(kids[1]).branch;
  f.oracle->continuations = std::vector<oracle::Continuation>{{"combined plan", 0.9}};

  MergeResult m = f.engine->merge(source, target, MergeStrategy::PreferSource);
  branch::Branch merged = f.branches.get(m.branch);
  CHECK(merged.parent == target);
  CHECK(merged.name == "Merged");
  CHECK(merged.confidence == doctest::Approx(0.9));
  REQUIRE(f.branches.thoughts(m.branch).size() == 1);
  CHECK(f.branches.thoughts(m.branch)[0].content == "combined plan");
  CHECK(m.merged_timeline == r.timeline);
  CHECK(f.timelines.get(r.timeline).state == TimelineState::Merged);

  auto ov = f.timelines.overlay(m.branch);
  REQUIRE(ov);
  CHECK(ov->depth == 2);
  CHECK_FALSE(ov->mcts_generated);

  // The oracle saw the strategy and both paths
  const oracle::Prefix& asked = f.oracle->prefixes.back();
  CHECK(asked.front().find("prefer the source") != std::string::npos);
  CHECK(std::find(asked.begin(), asked.end(), f.branches.thoughts(source)[0].content) != asked.end());
  CHECK(std::find(asked.begin(), asked.end(), f.branches.thoughts(target)[0].content) != asked.end());
}

TEST_CASE("mcts: merge writes nothing when the oracle fails") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  std::vector<Id> kids = f.engine->expand(r.root_node, 2);
  Id source = f.node(kids[0]).branch;
  Id target = f.node(kids[1]).branch;
  size_t before = f.branches.branch_count();

  f.oracle->fail_generate = Fail::Timeout;
  CHECK_THROWS_AS(f.engine->merge(source, target), oracle::Timeout);
  f.oracle->fail_generate = Fail::None;
  f.oracle->continuations = std::vector<oracle::Continuation>{};
  CHECK_THROWS_AS(f.engine->merge(source, target), oracle::Malformed);

  CHECK(f.branches.branch_count() == before);
  CHECK(f.timelines.get(r.timeline).state == TimelineState::Active);

  CHECK_THROWS_AS(f.engine->merge(source, source), ValidationError);
  CHECK_THROWS_AS(f.engine->merge(source, make_id(90, 0)), NotFound);
}

// ============================================================================
// Failure handling
// ============================================================================

TEST_CASE("mcts: failed evaluation restores virtual loss and skips backprop") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->fail_evaluate = Fail::Malformed;

  StepResult s = f.engine->step(r.timeline);
  CHECK(s.status == StepStatus::EvaluationFailed);
  CHECK_FALSE(s.error.empty());
  CHECK(f.node(r.root_node).visit_count == 0);
  f.check_no_virtual_loss();

  f.oracle->fail_evaluate = Fail::None;
  CHECK(f.engine->step(r.timeline).ok());
  CHECK(f.node(r.root_node).visit_count == 1);

  SearchMetrics m = f.engine->metrics();
  CHECK(m.failed_simulations == 1);
  CHECK(m.total_simulations == 1);
}

TEST_CASE("mcts: failed evaluation after expansion leaves the tree unchanged") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->fail_evaluate = Fail::Timeout;

  StepResult s = f.engine->step(r.timeline);
  CHECK(s.status == StepStatus::EvaluationFailed);
  CHECK(s.expanded == 0);
  CHECK(f.branches.branch_count() == 1);
  CHECK(f.engine->node_count() == 1);
  CHECK(f.timelines.overlays(r.timeline).size() == 1);
  CHECK_FALSE(f.node(r.root_node).is_expanded);
  CHECK(f.oracle->generate_calls == 1);
  f.check_no_virtual_loss();

  // The same step is repeated: expand the root and simulate its first child
  f.oracle->fail_evaluate = Fail::None;
  StepResult retry = f.engine->step(r.timeline);
  REQUIRE(retry.ok());
  CHECK(retry.selected_node == r.root_node);
  CHECK(retry.expanded == 3);
  CHECK(f.branches.branch_count() == 4);
  CHECK(f.node(r.root_node).children.front() == retry.simulated_node);
  CHECK(f.node(retry.simulated_node).visit_count == 1);
}

TEST_CASE("mcts: failed expansion attaches nothing and can be retried") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->fail_generate = Fail::Timeout;

  StepResult s = f.engine->step(r.timeline);
  CHECK(s.status == StepStatus::EvaluationFailed);
  CHECK(f.branches.branch_count() == 1);
  CHECK(f.engine->node_count() == 1);
  CHECK_FALSE(f.node(r.root_node).is_expanded);
  f.check_no_virtual_loss();
  CHECK(f.engine->metrics().expansion_success_rate() == doctest::Approx(0.0f));

  f.oracle->fail_generate = Fail::None;
  StepResult retry = f.engine->step(r.timeline);
  REQUIRE(retry.ok());
  CHECK(retry.expanded == 3);
}

TEST_CASE("mcts: malformed continuation is rejected before anything is created") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->continuations = std::vector<oracle::Continuation>{{"fine", 0.5}, {"bad prior", 1.5}};

  CHECK(f.engine->step(r.timeline).status == StepStatus::EvaluationFailed);
  CHECK(f.branches.branch_count() == 1);

  f.oracle->continuations = std::vector<oracle::Continuation>{{"", std::nullopt}};
  CHECK_THROWS_AS(f.engine->expand(r.root_node, 3), oracle::Malformed);
  CHECK(f.branches.branch_count() == 1);
}

TEST_CASE("mcts: out-of-range reward is malformed") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->rewards = {1.5};

  StepResult s = f.engine->step(r.timeline);
  CHECK(s.status == StepStatus::EvaluationFailed);
  CHECK(f.node(r.root_node).visit_count == 0);
  f.check_no_virtual_loss();
}

TEST_CASE("mcts: slow oracle times out") {
  SearchConfig cfg;
  cfg.oracle_timeout_ms = 20;
  Fixture f(cfg);
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->delay = std::chrono::milliseconds(2000);

  StepResult s = f.engine->step(r.timeline);
  CHECK(s.status == StepStatus::EvaluationFailed);
  CHECK(f.branches.branch_count() == 1);
  f.check_no_virtual_loss();
}

TEST_CASE("mcts: engine without an oracle fails steps softly") {
  branch::BranchStore branches;
  timeline::TimelineStore timelines(branches);
  Engine engine(branches, timelines, nullptr, inline_config());
  Id s = branches.create_session();
  StartResult r = engine.start(s, "Q");

  CHECK(engine.step(r.timeline).status == StepStatus::EvaluationFailed);
  CHECK_THROWS_AS(engine.step(make_id(33, 0)), NotFound);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("mcts: concurrent steps keep visit totals consistent") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->reward_fn = [](const oracle::Prefix& p) {
    return 0.25 * static_cast<double>(p.size() % 4);
  };

  std::atomic<size_t> ok{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < 25; ++i) {
        if (f.engine->step(r.timeline).ok()) ok.fetch_add(1);
      }
    });
  }
  for (auto& w : workers) w.join();

  SearchNode root = f.node(r.root_node);
  CHECK(ok.load() == 100);
  CHECK(root.visit_count == ok.load());
  CHECK(root.total_value == doctest::Approx(f.oracle->returned_sum()));
  f.check_no_virtual_loss();

  // One node per branch
  std::vector<Id> seen;
  for (const auto& n : f.engine->timeline_nodes(r.timeline)) {
    CHECK(std::find(seen.begin(), seen.end(), n.branch) == seen.end());
    seen.push_back(n.branch);
    if (n.parent != INVALID_ID) {
      CHECK(f.node(n.parent).visit_count >= n.visit_count);
    }
  }
}

// ============================================================================
// Alternatives, housekeeping, backtracking
// ============================================================================

TEST_CASE("mcts: branch_alternatives clamps n and recommends the best prior") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->continuations = std::vector<oracle::Continuation>{
      {"a", 0.2}, {"b", 0.9}, {"c", 0.5}, {"d", 0.4}, {"e", 0.99}};

  AlternativesResult alt = f.engine->branch_alternatives(r.timeline, 10);
  REQUIRE(alt.alternatives.size() == 4);
  CHECK(alt.parent_node == r.root_node);
  CHECK(alt.recommended_index == 1);
  CHECK(alt.alternatives[1].content == "b");
  CHECK(alt.alternatives[1].ucb_score == doctest::Approx(0.9));

  auto ov = f.timelines.overlay(alt.alternatives[0].branch);
  REQUIRE(ov);
  REQUIRE(ov->ucb_score);
  CHECK(*ov->ucb_score == doctest::Approx(alt.alternatives[0].ucb_score));
  CHECK(f.timelines.overlay(r.branch)->alternatives_explored == 4);
}

TEST_CASE("mcts: branch_alternatives asks for at least two") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  AlternativesResult alt = f.engine->branch_alternatives(r.timeline, 1);
  CHECK(alt.alternatives.size() == 2);
}

TEST_CASE("mcts: branch_alternatives propagates oracle failure") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.oracle->fail_generate = Fail::Timeout;
  CHECK_THROWS_AS(f.engine->branch_alternatives(r.timeline, 3), oracle::Timeout);
  CHECK(f.branches.branch_count() == 1);
}

TEST_CASE("mcts: housekeeping abandons weak and completes settled branches") {
  SearchConfig cfg = inline_config();
  cfg.exploration_constant = 0.0;
  cfg.promote_visits = 2;
  cfg.abandon_min_visits = 2;
  cfg.abandon_floor = 0.1;
  Fixture f(cfg);
  StartResult r = f.engine->start(f.session, "Q");
  std::vector<Id> kids = f.engine->expand(r.root_node, 3);

  for (int i = 0; i < 3; ++i) {
    f.engine->backpropagate(kids[0], 0.0);
    f.engine->backpropagate(kids[1], 0.9);
  }

  HousekeepingReport rep = f.engine->housekeeping();
  Id weak = f.node(kids[0]).branch;
  Id strong = f.node(kids[1]).branch;
  CHECK(rep.abandoned == std::vector<Id>{weak});
  CHECK(rep.completed == std::vector<Id>{strong});
  CHECK(f.branches.get(weak).state == BranchState::Abandoned);
  CHECK(f.branches.get(strong).state == BranchState::Completed);
  CHECK(f.branches.get(r.branch).state == BranchState::Active);

  // Second pass changes nothing
  HousekeepingReport again = f.engine->housekeeping();
  CHECK(again.abandoned.empty());
  CHECK(again.completed.empty());
}

TEST_CASE("mcts: auto_backtrack moves to the best ancestor") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  std::vector<Id> kids = f.engine->expand(r.root_node, 3);
  for (int i = 0; i < 3; ++i) f.engine->backpropagate(kids[0], 0.9);
  f.engine->backpropagate(kids[1], 0.05);
  f.engine->set_active(r.timeline, f.node(kids[1]).branch);

  BacktrackResult bt = f.engine->auto_backtrack(r.timeline);
  CHECK(bt.triggered);
  CHECK(bt.backtracked);
  CHECK(bt.backtrack_to == r.root_node);
  CHECK(bt.backtrack_branch == r.branch);
  CHECK(bt.current_reward == doctest::Approx(0.05));
  CHECK(f.timelines.active_branch(r.timeline) == r.branch);

  REQUIRE(bt.alternatives.size() == 2);
  CHECK(bt.alternatives[0].node == kids[0]);
  CHECK(bt.alternatives[0].expected_improvement == doctest::Approx(0.85));
  CHECK(bt.alternatives[1].node == kids[2]);
  CHECK(bt.alternatives[1].direction.size() <= 100);
}

TEST_CASE("mcts: auto_backtrack leaves a healthy search alone") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.engine->backpropagate(r.root_node, 0.8);

  BacktrackResult bt = f.engine->auto_backtrack(r.timeline);
  CHECK_FALSE(bt.triggered);
  CHECK_FALSE(bt.backtracked);
  CHECK_FALSE(bt.reason.empty());
  CHECK(f.timelines.active_branch(r.timeline) == r.branch);
}

TEST_CASE("mcts: auto_backtrack without a better ancestor") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.engine->backpropagate(r.root_node, 0.1);

  BacktrackResult bt = f.engine->auto_backtrack(r.timeline);
  CHECK(bt.triggered);
  CHECK_FALSE(bt.backtracked);
  CHECK_THROWS_AS(f.engine->auto_backtrack(make_id(44, 0)), NotFound);
}

// ============================================================================
// Removal and persistence
// ============================================================================

TEST_CASE("mcts: remove_branch drops the node and detaches its children") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  std::vector<Id> kids = f.engine->expand(r.root_node, 2);
  std::vector<Id> grandkids = f.engine->expand(kids[0], 2);

  f.engine->remove_branch(f.node(kids[0]).branch);
  CHECK_FALSE(f.engine->node(kids[0]));
  CHECK(f.node(grandkids[0]).parent == INVALID_ID);
  CHECK(f.node(r.root_node).children == std::vector<Id>{kids[1]});
}

TEST_CASE("mcts: load restores nodes and statistics") {
  Fixture f;
  StartResult r = f.engine->start(f.session, "Q");
  f.engine->explore(r.timeline, 5);
  nlohmann::json doc = f.engine->dump();

  Engine copy(f.branches, f.timelines, f.oracle, inline_config());
  copy.load(doc);
  CHECK(copy.node_count() == f.engine->node_count());
  CHECK(copy.node(r.root_node)->visit_count == 5);
  CHECK(copy.node(r.root_node)->children == f.node(r.root_node).children);
  CHECK(copy.dump() == doc);

  // Two nodes claiming one branch
  doc["search_nodes"][1]["branch"] = doc["search_nodes"][0]["branch"];
  Engine bad(f.branches, f.timelines, f.oracle, inline_config());
  CHECK_THROWS_AS(bad.load(doc), ValidationError);
  CHECK(bad.node_count() == 0);
}
