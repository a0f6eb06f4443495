#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

#include "branch.hpp"
#include "common.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "oracle.hpp"
#include "slot_table.hpp"
#include "timeline.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * MCTS (Monte Carlo Tree Search) over the branch tree
 *
 * This header provides UCB1 tree search where every search node is aligned
 * 1:1 with a Branch:
 * - Expansion asks the oracle for continuations and materializes each as a
 *   Branch + Thought + TimelineBranch + SearchNode, all or nothing
 * - Simulation asks the oracle for a bounded reward
 * - Backpropagation updates visit/value atomically and mirrors the
 *   statistics into the TimelineBranch overlay
 * - Virtual loss keeps concurrent steps from piling onto one path
 *
 * Steps may run concurrently on the same timeline. The arena lock is only
 * held for selection and attachment, never across an oracle call.
 *
 * Example usage:
 *
 *   retrace::mcts::Engine engine(branches, timelines, oracle, config.search);
 *   auto root = engine.start(session, "Design a cache eviction policy");
 *   auto result = engine.explore(root.timeline, 50);
 *   for (const auto& text : result.best_path_content) { ... }
 */

namespace retrace::mcts {

// ============================================================================
// Scoring
// ============================================================================

/**
 * UCB1 = mean + c * sqrt(ln(N_parent) / N)
 *
 * @return +infinity for an unvisited node, so it is always tried first
 */
inline double ucb1(double total_value, uint32_t visits, uint32_t parent_visits, double c) {
  if (visits == 0) {
    return std::numeric_limits<double>::infinity();
  }
  double mean = total_value / visits;
  double n = static_cast<double>(std::max<uint32_t>(parent_visits, 1));
  return mean + c * std::sqrt(std::log(n) / visits);
}

// ============================================================================
// Search Node
// ============================================================================

/**
 * Search tree node (value snapshot)
 *
 * Statistics are read from the live atomic counters at the time the
 * snapshot was taken.
 */
struct SearchNode {
  Id id = INVALID_ID;
  Id session = INVALID_ID;
  Id timeline = INVALID_ID;
  Id branch = INVALID_ID;

  /** Parent node (INVALID_ID for the search root) */
  Id parent = INVALID_ID;

  std::vector<Id> children;
  std::string content;

  uint32_t visit_count = 0;
  double total_value = 0.0;

  /** Oracle confidence in this continuation */
  double prior = 0.5;

  std::optional<double> ucb_score;

  /** All candidates from the oracle are attached */
  bool is_expanded = false;

  /** Reached max depth, or the oracle had nothing to continue with */
  bool is_terminal = false;

  uint32_t simulation_depth = 0;
  int64_t created_at = 0;
  int64_t last_visited = 0;

  double mean_value() const {
    return visit_count > 0 ? total_value / visit_count : 0.0;
  }
};

inline void to_json(nlohmann::json& j, const SearchNode& n) {
  j = {{"id", n.id}, {"session", n.session}, {"timeline", n.timeline},
       {"branch", n.branch}, {"parent", n.parent}, {"content", n.content},
       {"visit_count", n.visit_count}, {"total_value", n.total_value},
       {"prior", n.prior}, {"ucb_score", nullptr},
       {"is_expanded", n.is_expanded}, {"is_terminal", n.is_terminal},
       {"simulation_depth", n.simulation_depth},
       {"created_at", n.created_at}, {"last_visited", n.last_visited}};
  if (n.ucb_score) j["ucb_score"] = *n.ucb_score;
}

inline void from_json(const nlohmann::json& j, SearchNode& n) {
  n.id = j.at("id").get<Id>();
  n.session = j.at("session").get<Id>();
  n.timeline = j.at("timeline").get<Id>();
  n.branch = j.at("branch").get<Id>();
  n.parent = j.value("parent", INVALID_ID);
  n.children.clear();
  n.content = j.value("content", std::string());
  n.visit_count = j.value("visit_count", 0u);
  n.total_value = j.value("total_value", 0.0);
  n.prior = j.value("prior", 0.5);
  n.ucb_score.reset();
  if (j.contains("ucb_score") && j["ucb_score"].is_number()) {
    n.ucb_score = j["ucb_score"].get<double>();
  }
  n.is_expanded = j.value("is_expanded", false);
  n.is_terminal = j.value("is_terminal", false);
  n.simulation_depth = j.value("simulation_depth", 0u);
  n.created_at = j.value("created_at", int64_t{0});
  n.last_visited = j.value("last_visited", int64_t{0});
}

/**
 * Live per-node counters, updated without the arena lock
 */
struct NodeStats {
  std::atomic<uint32_t> visits{0};
  std::atomic<double> total_value{0.0};

  /** Simulations currently in flight through this node (virtual loss) */
  std::atomic<uint32_t> in_flight{0};

  std::atomic<int64_t> last_visited{0};

  /** NaN until the first backpropagation */
  std::atomic<double> ucb{std::numeric_limits<double>::quiet_NaN()};

  /** Set by the step that owns this node's expansion */
  std::atomic<bool> expanding{false};

  void add_value(double v) {
    double cur = total_value.load(std::memory_order_relaxed);
    while (!total_value.compare_exchange_weak(cur, cur + v, std::memory_order_acq_rel,
                                              std::memory_order_relaxed)) {
    }
  }
};

/**
 * Scoped virtual loss
 *
 * Each node added counts one more in-flight visit (lowering its effective
 * mean during selection) until the guard is released or destroyed. Every
 * exit path of a step, success, failure or exception, restores the counts.
 */
class VirtualLoss {
public:
  VirtualLoss() = default;
  ~VirtualLoss() { release(); }

  VirtualLoss(const VirtualLoss&) = delete;
  VirtualLoss& operator=(const VirtualLoss&) = delete;

  void add(std::shared_ptr<NodeStats> stats) {
    if (!stats) return;
    stats->in_flight.fetch_add(1, std::memory_order_acq_rel);
    held_.push_back(std::move(stats));
  }

  void release() {
    for (auto& s : held_) {
      s->in_flight.fetch_sub(1, std::memory_order_acq_rel);
    }
    held_.clear();
  }

  size_t size() const { return held_.size(); }

private:
  std::vector<std::shared_ptr<NodeStats>> held_;
};

// ============================================================================
// Results
// ============================================================================

enum class StepStatus { Completed, EvaluationFailed };

NLOHMANN_JSON_SERIALIZE_ENUM(StepStatus, {
    {StepStatus::Completed, "completed"},
    {StepStatus::EvaluationFailed, "evaluation_failed"},
})

/**
 * Outcome of one select/expand/simulate/backpropagate pass
 *
 * EvaluationFailed means the oracle timed out or answered malformed; nothing
 * was attached or backpropagated and the caller may retry.
 */
struct StepResult {
  StepStatus status = StepStatus::Completed;
  Id selected_node = INVALID_ID;
  Id simulated_node = INVALID_ID;
  double reward = 0.0;
  size_t expanded = 0;
  size_t backprop_nodes = 0;
  std::string error;

  bool ok() const { return status == StepStatus::Completed; }
};

struct IterationStats {
  size_t iteration = 0;
  Id selected_node = INVALID_ID;
  double simulation_value = 0.0;
  size_t backprop_nodes = 0;
  StepStatus status = StepStatus::Completed;
};

inline void to_json(nlohmann::json& j, const IterationStats& s) {
  j = {{"iteration", s.iteration}, {"selected_node", s.selected_node},
       {"simulation_value", s.simulation_value}, {"backprop_nodes", s.backprop_nodes},
       {"status", s.status}};
}

/**
 * Greedy path by mean value from the search root
 */
struct BestPath {
  std::vector<Id> nodes;
  std::vector<Id> branches;
  std::vector<std::string> content;
  /** Mean value of the last node on the path */
  double value = 0.0;
};

struct ExploreResult {
  Id root_node = INVALID_ID;
  std::vector<Id> best_path;
  std::vector<std::string> best_path_content;
  double best_path_value = 0.0;
  size_t nodes_explored = 0;
  size_t failed_steps = 0;
  std::vector<IterationStats> iteration_stats;
};

struct StartResult {
  Id branch = INVALID_ID;
  Id timeline = INVALID_ID;
  Id root_node = INVALID_ID;
};

struct Alternative {
  Id node = INVALID_ID;
  Id branch = INVALID_ID;
  std::string content;
  double prior = 0.5;
  double ucb_score = 0.0;
};

struct AlternativesResult {
  Id parent_node = INVALID_ID;
  std::vector<Alternative> alternatives;
  /** Index of the highest initial score */
  size_t recommended_index = 0;
};

struct AlternativePath {
  Id from_node = INVALID_ID;
  Id node = INVALID_ID;
  Id branch = INVALID_ID;
  /** Leading text of the alternative (at most 100 characters) */
  std::string direction;
  double expected_improvement = 0.0;
};

struct BacktrackResult {
  /** Current node fell under a threshold */
  bool triggered = false;
  /** Active branch was moved to an ancestor */
  bool backtracked = false;
  std::string reason;
  Id backtrack_to = INVALID_ID;
  Id backtrack_branch = INVALID_ID;
  std::vector<AlternativePath> alternatives;
  double current_confidence = 0.0;
  double current_reward = 0.0;
};

enum class MergeStrategy { Synthesize, PreferSource, PreferTarget };

struct MergeResult {
  /** New branch under the target holding the merged thought */
  Id branch = INVALID_ID;
  Id thought = INVALID_ID;
  std::string content;
  /** Timeline of the source that was marked merged, if it had one */
  Id merged_timeline = INVALID_ID;
};

struct HousekeepingReport {
  std::vector<Id> completed;
  std::vector<Id> abandoned;
};

/**
 * Metrics collected during search
 */
struct SearchMetrics {
  /** Successful expansions */
  size_t total_expansions = 0;

  /** Expansions aborted by an oracle failure */
  size_t failed_expansions = 0;

  /** Successful evaluations */
  size_t total_simulations = 0;

  /** Evaluations aborted by an oracle failure */
  size_t failed_simulations = 0;

  float expansion_success_rate() const {
    size_t total = total_expansions + failed_expansions;
    return total > 0
      ? static_cast<float>(total_expansions) / total
      : 1.0f;
  }
};

// ============================================================================
// Engine
// ============================================================================

class Engine {
public:
  /**
   * @param branches Branch store (not owned)
   * @param timelines Timeline store (not owned)
   * @param oracle Content oracle, shared with in-flight bounded calls
   * @param config Search configuration
   */
  Engine(branch::BranchStore& branches,
         timeline::TimelineStore& timelines,
         std::shared_ptr<oracle::Oracle> oracle,
         SearchConfig config = SearchConfig{})
      : branches_(branches),
        timelines_(timelines),
        oracle_(std::move(oracle)),
        config_(config) {}

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  const SearchConfig& config() const { return config_; }

  /**
   * Open a search: root branch with one thought, a timeline, a root node
   *
   * @throws ValidationError if the session is unknown
   */
  StartResult start(Id session, const std::string& content, std::string name = "") {
    branch::BranchOptions opts;
    opts.name = name.empty() ? "MCTS root" : std::move(name);
    opts.confidence = config_.default_prior;

    StartResult out;
    out.branch = branches_.create_branch(session, INVALID_ID, opts);
    branches_.add_thought(out.branch, content, config_.default_prior);
    out.timeline = timelines_.create_timeline(session, out.branch, opts.name);
    out.root_node = ensure_node(out.timeline, out.branch);

    RETRACE_LOG_INFO("[mcts::start] session=%llu timeline=%llu root=%llu",
                    (unsigned long long)session, (unsigned long long)out.timeline,
                    (unsigned long long)out.root_node);
    return out;
  }

  /**
   * Run one search step from the timeline's active node
   *
   * @throws NotFound if the timeline (or its root branch) does not exist
   */
  StepResult step(Id timeline_id) {
    Id start_id = start_node(timeline_id);

    StepResult r;
    VirtualLoss guard;
    std::vector<Id> path;
    {
      std::shared_lock lock(mu_);
      path = select_path(start_id);
      for (Id id : path) guard.add(stats_of(id));
    }
    Id leaf = path.back();
    r.selected_node = leaf;
    Id target = leaf;

    // Oracle calls come first; the tree changes only once both succeeded
    std::shared_ptr<NodeStats> leaf_stats = stats_for(leaf);
    std::optional<Expansion> pending;
    if (leaf_stats && claim_expansion(leaf, *leaf_stats)) {
      try {
        pending = generate(leaf, config_.expansion_width);
      } catch (const oracle::Error& e) {
        leaf_stats->expanding.store(false, std::memory_order_release);
        metrics_failed_expansions_.fetch_add(1, std::memory_order_relaxed);
        RETRACE_LOG_WARN("[mcts::step] expansion of node %llu failed: %s",
                        (unsigned long long)leaf, e.what());
        r.status = StepStatus::EvaluationFailed;
        r.error = e.what();
        return r;
      } catch (const Error&) {
        leaf_stats->expanding.store(false, std::memory_order_release);
        throw;
      }
    }

    oracle::Prefix prefix;
    if (pending && !pending->candidates.empty()) {
      prefix = pending->prefix;
      prefix.push_back(pending->candidates.front().content);
    } else {
      prefix = prefix_of(require_node(leaf, "step").branch);
    }

    try {
      r.reward = evaluate(prefix);
    } catch (const oracle::Error& e) {
      if (pending) leaf_stats->expanding.store(false, std::memory_order_release);
      metrics_failed_simulations_.fetch_add(1, std::memory_order_relaxed);
      RETRACE_LOG_WARN("[mcts::step] evaluation below node %llu failed: %s",
                      (unsigned long long)leaf, e.what());
      r.status = StepStatus::EvaluationFailed;
      r.error = e.what();
      return r;
    }

    if (pending) {
      std::vector<Id> children;
      try {
        children = commit(*pending);
      } catch (const Error&) {
        leaf_stats->expanding.store(false, std::memory_order_release);
        throw;
      }
      r.expanded = children.size();
      if (!children.empty()) {
        target = children.front();
        guard.add(stats_for(target));
      }
    }
    r.simulated_node = target;

    r.backprop_nodes = backpropagate(target, r.reward);
    RETRACE_LOG_DEBUG("[mcts::step] selected=%llu simulated=%llu reward=%.3f",
                     (unsigned long long)leaf, (unsigned long long)target, r.reward);
    return r;
  }

  /**
   * Run `iterations` steps; failed steps are counted, not retried
   */
  ExploreResult explore(Id timeline_id, size_t iterations) {
    ExploreResult out;
    for (size_t i = 0; i < iterations; ++i) {
      StepResult r = step(timeline_id);
      IterationStats s;
      s.iteration = i + 1;
      s.selected_node = r.selected_node;
      s.simulation_value = r.reward;
      s.backprop_nodes = r.backprop_nodes;
      s.status = r.status;
      out.iteration_stats.push_back(s);
      if (!r.ok()) ++out.failed_steps;
    }

    BestPath best = best_path(timeline_id);
    out.root_node = best.nodes.empty() ? INVALID_ID : best.nodes.front();
    out.best_path = best.nodes;
    out.best_path_content = best.content;
    out.best_path_value = best.value;
    out.nodes_explored = timeline_nodes(timeline_id).size();

    RETRACE_LOG_INFO("[mcts::explore] timeline=%llu iterations=%zu failed=%zu nodes=%zu",
                    (unsigned long long)timeline_id, iterations, out.failed_steps,
                    out.nodes_explored);
    return out;
  }

  /**
   * Expand the active node with n alternatives (clamped to [2,4])
   *
   * Each alternative gets an initial score that treats its prior as one
   * pseudo-visit; the highest is recommended.
   *
   * @throws oracle::Timeout / oracle::Malformed on oracle failure (nothing attached)
   */
  AlternativesResult branch_alternatives(Id timeline_id, size_t n) {
    n = std::clamp<size_t>(n, 2, 4);
    Id parent = start_node(timeline_id);

    AlternativesResult out;
    out.parent_node = parent;

    std::vector<Id> children = expand(parent, n);
    std::shared_ptr<NodeStats> parent_stats = stats_for(parent);
    if (parent_stats) parent_stats->expanding.store(true, std::memory_order_release);
    uint32_t parent_visits = parent_stats ? parent_stats->visits.load() : 0;

    double best_score = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < children.size(); ++i) {
      std::optional<SearchNode> c = node(children[i]);
      if (!c) continue;
      Alternative a;
      a.node = c->id;
      a.branch = c->branch;
      a.content = c->content;
      a.prior = c->prior;
      a.ucb_score = ucb1(c->prior, 1, parent_visits, config_.exploration_constant);
      timelines_.set_ucb(c->branch, a.ucb_score);
      if (a.ucb_score > best_score) {
        best_score = a.ucb_score;
        out.recommended_index = out.alternatives.size();
      }
      out.alternatives.push_back(std::move(a));
    }
    if (std::optional<SearchNode> p = node(parent)) {
      timelines_.add_alternatives_explored(p->branch, static_cast<uint32_t>(out.alternatives.size()));
    }
    return out;
  }

  /**
   * Advisory state transitions
   *
   * - abandoned: a non-root node with at least abandon_min_visits whose
   *   UCB1 is under abandon_floor
   * - completed: a node with more than promote_visits whose children never
   *   beat its own mean
   */
  HousekeepingReport housekeeping() {
    struct Candidate {
      Id branch;
      bool has_parent;
      uint32_t visits;
      double mean;
      double ucb;
      bool improving_child;
    };
    std::vector<Candidate> candidates;
    {
      std::shared_lock lock(mu_);
      nodes_.for_each([&](Id, const Node& n) {
        uint32_t visits = n.stats->visits.load(std::memory_order_acquire);
        if (visits == 0) return;
        double mean = n.stats->total_value.load(std::memory_order_acquire) / visits;
        uint32_t parent_visits = visits;
        if (const Node* p = nodes_.get(n.record.parent)) {
          parent_visits = p->stats->visits.load(std::memory_order_acquire);
        }
        bool improving = false;
        for (Id cid : n.record.children) {
          const Node* c = nodes_.get(cid);
          if (!c) continue;
          uint32_t cv = c->stats->visits.load(std::memory_order_acquire);
          if (cv > 0 && c->stats->total_value.load(std::memory_order_acquire) / cv > mean) {
            improving = true;
          }
        }
        candidates.push_back({n.record.branch, n.record.parent != INVALID_ID, visits, mean,
                              ucb1(mean * visits, visits, parent_visits,
                                   config_.exploration_constant),
                              improving});
      });
    }

    HousekeepingReport report;
    for (const Candidate& c : candidates) {
      std::optional<branch::Branch> b = branches_.find(c.branch);
      if (!b) continue;
      try {
        if (c.has_parent && c.visits >= config_.abandon_min_visits &&
            c.ucb < config_.abandon_floor && b->state != BranchState::Abandoned) {
          branches_.transition(c.branch, BranchState::Abandoned);
          report.abandoned.push_back(c.branch);
        } else if (c.visits > config_.promote_visits && !c.improving_child &&
                   b->state == BranchState::Active) {
          branches_.transition(c.branch, BranchState::Completed);
          report.completed.push_back(c.branch);
        }
      } catch (const InvalidTransition& e) {
        // Another writer moved the branch first
        RETRACE_LOG_DEBUG("[mcts::housekeeping] skipped %llu: %s",
                         (unsigned long long)c.branch, e.what());
      }
    }
    RETRACE_LOG_INFO("[mcts::housekeeping] completed=%zu abandoned=%zu",
                    report.completed.size(), report.abandoned.size());
    return report;
  }

  /**
   * Back off from a weak position
   *
   * The current position is the most recently visited non-terminal node of
   * the timeline. If its prior is under confidence_threshold or its mean
   * under reward_threshold, the active branch moves to the ancestor with the
   * highest mean, and up to 3 of that ancestor's other children are
   * suggested.
   */
  BacktrackResult auto_backtrack(Id timeline_id, double confidence_threshold = 0.3,
                                 double reward_threshold = 0.2) {
    if (!timelines_.contains(timeline_id)) {
      throw NotFound("auto_backtrack: timeline not found");
    }

    BacktrackResult out;
    std::vector<SearchNode> nodes = timeline_nodes(timeline_id);
    if (nodes.empty()) {
      out.reason = "No search nodes in timeline";
      return out;
    }

    const SearchNode* current = nullptr;
    for (const auto& n : nodes) {
      if (n.is_terminal) continue;
      if (!current || n.last_visited > current->last_visited ||
          (n.last_visited == current->last_visited && n.id > current->id)) {
        current = &n;
      }
    }
    if (!current) {
      out.reason = "All nodes are terminal";
      return out;
    }

    out.current_reward = current->visit_count > 0 ? current->mean_value() : 0.5;
    out.current_confidence = current->prior;
    out.triggered = out.current_confidence < confidence_threshold ||
                    out.current_reward < reward_threshold;
    if (!out.triggered) {
      out.reason = "No backtracking needed: reward and confidence at or above thresholds";
      return out;
    }

    auto by_id = [&](Id id) -> const SearchNode* {
      for (const auto& n : nodes) {
        if (n.id == id) return &n;
      }
      return nullptr;
    };

    const SearchNode* best = nullptr;
    double best_value = 0.0;
    size_t hops = 0;
    for (const SearchNode* a = by_id(current->parent); a && hops <= nodes.size();
         a = by_id(a->parent), ++hops) {
      double v = a->visit_count > 0 ? a->mean_value() : 0.0;
      if (v > best_value) {
        best_value = v;
        best = a;
      }
    }
    if (!best) {
      out.reason = "Backtracking indicated but no better ancestor found";
      return out;
    }

    set_active(timeline_id, best->branch);
    out.backtracked = true;
    out.backtrack_to = best->id;
    out.backtrack_branch = best->branch;
    for (Id cid : best->children) {
      if (out.alternatives.size() >= 3) break;
      const SearchNode* s = by_id(cid);
      if (!s || s->id == current->id) continue;
      AlternativePath alt;
      alt.from_node = best->id;
      alt.node = s->id;
      alt.branch = s->branch;
      alt.direction = s->content.substr(0, 100);
      alt.expected_improvement = (s->visit_count > 0 ? s->mean_value() : s->prior) -
                                 out.current_reward;
      out.alternatives.push_back(std::move(alt));
    }
    out.reason = "Backtracking triggered: current reward or confidence below threshold";

    RETRACE_LOG_INFO("[mcts::auto_backtrack] timeline=%llu to node=%llu",
                    (unsigned long long)timeline_id, (unsigned long long)best->id);
    return out;
  }

  /// Serialized per session by the timeline store
  /**
   * Merge the source branch's path into the target
   *
   * The oracle continues a prefix holding the strategy, the source path and
   * the target path; its first continuation becomes the thought of a new
   * "Merged" branch under the target. The source's timeline is then marked
   * merged. Nothing is written if the oracle call fails.
   *
   * @throws NotFound if either branch is missing
   * @throws ValidationError if they are the same branch or in different sessions
   * @throws oracle::Timeout / oracle::Malformed on oracle failure
   */
  MergeResult merge(Id source, Id target, MergeStrategy strategy = MergeStrategy::Synthesize) {
    branch::Branch src = branches_.get(source);
    branch::Branch dst = branches_.get(target);
    if (source == target) {
      throw ValidationError("merge: source and target are the same branch");
    }
    if (src.session != dst.session) {
      throw ValidationError("merge: branches belong to different sessions");
    }

    oracle::Prefix prefix;
    switch (strategy) {
      case MergeStrategy::Synthesize:
        prefix.push_back("Merge strategy: synthesize the best insights of both paths");
        break;
      case MergeStrategy::PreferSource:
        prefix.push_back("Merge strategy: prefer the source path, supplement with the target");
        break;
      case MergeStrategy::PreferTarget:
        prefix.push_back("Merge strategy: prefer the target path, supplement with the source");
        break;
    }
    prefix.push_back("Source path:");
    for (const auto& t : branches_.thought_prefix(source)) prefix.push_back(t.content);
    prefix.push_back("Target path:");
    for (const auto& t : branches_.thought_prefix(target)) prefix.push_back(t.content);

    std::shared_ptr<oracle::Oracle> o = require_oracle();
    std::vector<oracle::Continuation> merged = oracle::bounded_call(
        [o, prefix](std::stop_token stop) { return o->generate_continuations(prefix, 1, stop); },
        config_.oracle_timeout());
    if (merged.empty() || merged.front().content.empty()) {
      throw oracle::Malformed("merge: oracle returned no merged content");
    }

    std::optional<timeline::TimelineBranch> dst_overlay = timelines_.overlay(target);
    std::optional<timeline::TimelineBranch> src_overlay = timelines_.overlay(source);

    MergeResult out;
    out.content = merged.front().content;
    branch::BranchOptions opts;
    opts.name = "Merged";
    opts.confidence = 0.9;
    out.branch = branches_.create_branch(dst.session, target, opts);
    try {
      out.thought = branches_.add_thought(out.branch, out.content, 0.9);
      if (dst_overlay) {
        timelines_.attach(dst_overlay->timeline, out.branch, dst_overlay->depth + 1, false);
      }
      if (src_overlay) {
        timelines_.set_state(src_overlay->timeline, TimelineState::Merged);
        out.merged_timeline = src_overlay->timeline;
      }
    } catch (const Error&) {
      rollback({out.branch});
      throw;
    }

    RETRACE_LOG_INFO("[mcts::merge] source=%llu target=%llu -> branch=%llu",
                    (unsigned long long)source, (unsigned long long)target,
                    (unsigned long long)out.branch);
    return out;
  }

  void set_active(Id timeline_id, Id branch) {
    timelines_.set_active_branch(timeline_id, branch);
  }

  BestPath best_path(Id timeline_id) const {
    timeline::Timeline t = timelines_.get(timeline_id);

    BestPath out;
    std::shared_lock lock(mu_);
    auto it = by_branch_.find(t.root_branch);
    if (it == by_branch_.end()) return out;

    const Node* cur = nodes_.get(it->second);
    size_t bound = nodes_.size() + 1;
    while (cur && out.nodes.size() < bound) {
      out.nodes.push_back(cur->record.id);
      out.branches.push_back(cur->record.branch);
      out.content.push_back(cur->record.content);
      uint32_t v = cur->stats->visits.load(std::memory_order_acquire);
      out.value = v > 0 ? cur->stats->total_value.load(std::memory_order_acquire) / v : 0.0;

      const Node* next = nullptr;
      double best_mean = -std::numeric_limits<double>::infinity();
      for (Id cid : cur->record.children) {
        const Node* c = nodes_.get(cid);
        if (!c) continue;
        uint32_t cv = c->stats->visits.load(std::memory_order_acquire);
        if (cv == 0) continue;
        double mean = c->stats->total_value.load(std::memory_order_acquire) / cv;
        if (mean > best_mean) {
          best_mean = mean;
          next = c;
        }
      }
      cur = next;
    }
    return out;
  }

  /**
   * Materialize children for a node from oracle continuations
   *
   * All candidates are validated before anything is created; a failure
   * while creating rolls back whatever was created. The parent is marked
   * expanded once they are attached, or terminal when the oracle had none.
   *
   * @throws oracle::Timeout / oracle::Malformed on oracle failure
   * @throws NotFound if the node disappeared
   */
  std::vector<Id> expand(Id node_id, size_t n) {
    return commit(generate(node_id, n));
  }

  /**
   * Ask the oracle for a reward for the node's thought prefix
   *
   * @throws oracle::Malformed for a non-finite or out-of-range reward
   */
  double simulate(Id node_id) {
    SearchNode n = require_node(node_id, "simulate");
    return evaluate(prefix_of(n.branch));
  }

  /**
   * Add one visit and `reward` to the node and every ancestor
   *
   * Counters are updated root first, so a concurrent reader never sees a
   * child with more visits than its parent.
   *
   * @return Number of nodes updated
   */
  size_t backpropagate(Id node_id, double reward) {
    std::shared_lock lock(mu_);
    std::vector<const Node*> chain;
    size_t bound = nodes_.size() + 1;
    for (const Node* cur = nodes_.get(node_id); cur && chain.size() < bound;
         cur = nodes_.get(cur->record.parent)) {
      chain.push_back(cur);
    }

    int64_t now = now_ms();
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
      NodeStats& s = *(*it)->stats;
      s.visits.fetch_add(1, std::memory_order_acq_rel);
      s.add_value(reward);
      s.last_visited.store(now, std::memory_order_release);
    }

    for (size_t i = 0; i < chain.size(); ++i) {
      NodeStats& s = *chain[i]->stats;
      uint32_t visits = s.visits.load(std::memory_order_acquire);
      uint32_t parent_visits = i + 1 < chain.size()
          ? chain[i + 1]->stats->visits.load(std::memory_order_acquire)
          : visits;
      double score = ucb1(s.total_value.load(std::memory_order_acquire), visits,
                          parent_visits, config_.exploration_constant);
      s.ucb.store(score, std::memory_order_release);
      timelines_.record_visit(chain[i]->record.branch, reward, score);
    }
    return chain.size();
  }

  // ===== Inspection =====

  std::optional<SearchNode> node(Id id) const {
    std::shared_lock lock(mu_);
    const Node* n = nodes_.get(id);
    if (!n) return std::nullopt;
    return snapshot_of(*n);
  }

  std::optional<Id> node_for_branch(Id branch) const {
    std::shared_lock lock(mu_);
    auto it = by_branch_.find(branch);
    if (it == by_branch_.end()) return std::nullopt;
    return it->second;
  }

  std::vector<SearchNode> timeline_nodes(Id timeline_id) const {
    std::shared_lock lock(mu_);
    std::vector<SearchNode> out;
    nodes_.for_each([&](Id, const Node& n) {
      if (n.record.timeline == timeline_id) out.push_back(snapshot_of(n));
    });
    return out;
  }

  /// Simulations currently holding virtual loss on the node
  uint32_t in_flight(Id id) const {
    std::shared_lock lock(mu_);
    const Node* n = nodes_.get(id);
    return n ? n->stats->in_flight.load(std::memory_order_acquire) : 0;
  }

  size_t node_count() const {
    std::shared_lock lock(mu_);
    return nodes_.size();
  }

  SearchMetrics metrics() const {
    SearchMetrics m;
    m.total_expansions = metrics_expansions_.load(std::memory_order_relaxed);
    m.failed_expansions = metrics_failed_expansions_.load(std::memory_order_relaxed);
    m.total_simulations = metrics_simulations_.load(std::memory_order_relaxed);
    m.failed_simulations = metrics_failed_simulations_.load(std::memory_order_relaxed);
    return m;
  }

  // ===== Removal (cascade support) =====

  /// Drop the branch's node; its children become roots of their own
  void remove_branch(Id branch) {
    std::unique_lock lock(mu_);
    auto it = by_branch_.find(branch);
    if (it == by_branch_.end()) return;
    remove_node_locked(it->second);
  }

  void remove_session(Id session) {
    std::unique_lock lock(mu_);
    for (Id id : nodes_.select([&](const Node& n) { return n.record.session == session; })) {
      remove_node_locked(id);
    }
  }

  // ===== Persistence =====

  nlohmann::json dump() const {
    std::shared_lock lock(mu_);
    nlohmann::json j;
    j["search_nodes"] = nlohmann::json::array();
    nodes_.for_each([&](Id, const Node& n) { j["search_nodes"].emplace_back(snapshot_of(n)); });
    return j;
  }

  /**
   * Replace all nodes with a dumped document
   *
   * @throws ValidationError on duplicate ids, a second node for one branch,
   *         dangling references or a parent cycle
   */
  void load(const nlohmann::json& j) {
    SlotTable<Node> nodes;
    std::unordered_map<Id, Id> by_branch;

    for (const auto& item : j.value("search_nodes", nlohmann::json::array())) {
      SearchNode rec = item.get<SearchNode>();
      std::optional<branch::Branch> b = branches_.find(rec.branch);
      if (!b || b->session != rec.session || !timelines_.contains(rec.timeline)) {
        throw ValidationError("load: search node has dangling references");
      }
      if (!by_branch.emplace(rec.branch, rec.id).second) {
        throw ValidationError("load: more than one search node for a branch");
      }
      Node n;
      n.stats = std::make_shared<NodeStats>();
      n.stats->visits.store(rec.visit_count);
      n.stats->total_value.store(rec.total_value);
      n.stats->last_visited.store(rec.last_visited);
      n.stats->expanding.store(rec.is_expanded);
      if (rec.ucb_score) n.stats->ucb.store(*rec.ucb_score);
      Id id = rec.id;
      n.record = std::move(rec);
      if (!nodes.place(id, std::move(n))) {
        throw ValidationError("load: duplicate search node id");
      }
    }

    std::vector<std::pair<Id, Id>> links;
    nodes.for_each([&](Id id, const Node& n) {
      if (n.record.parent != INVALID_ID) links.emplace_back(n.record.parent, id);
    });
    for (const auto& [parent, child] : links) {
      Node* p = nodes.get(parent);
      if (!p) {
        throw ValidationError("load: search node parent not found");
      }
      p->record.children.push_back(child);
    }
    size_t bound = nodes.size() + 1;
    nodes.for_each([&](Id id, const Node&) {
      size_t hops = 0;
      for (const Node* cur = nodes.get(id); cur; cur = nodes.get(cur->record.parent)) {
        if (++hops > bound) {
          throw ValidationError("load: search node parent cycle");
        }
      }
    });
    nodes.rebuild_freelist();

    std::unique_lock lock(mu_);
    std::swap(nodes_, nodes);
    std::swap(by_branch_, by_branch);
  }

private:
  struct Node {
    SearchNode record;
    std::shared_ptr<NodeStats> stats;
  };

  static SearchNode snapshot_of(const Node& n) {
    SearchNode s = n.record;
    s.visit_count = n.stats->visits.load(std::memory_order_acquire);
    s.total_value = n.stats->total_value.load(std::memory_order_acquire);
    s.last_visited = n.stats->last_visited.load(std::memory_order_acquire);
    double u = n.stats->ucb.load(std::memory_order_acquire);
    s.ucb_score = std::isnan(u) ? std::nullopt : std::optional<double>(u);
    return s;
  }

  SearchNode require_node(Id id, const char* op) const {
    std::optional<SearchNode> n = node(id);
    if (!n) {
      throw NotFound(std::string(op) + ": search node not found");
    }
    return *n;
  }

  std::shared_ptr<NodeStats> stats_of(Id id) const {
    const Node* n = nodes_.get(id);
    return n ? n->stats : nullptr;
  }

  std::shared_ptr<NodeStats> stats_for(Id id) const {
    std::shared_lock lock(mu_);
    return stats_of(id);
  }

  std::shared_ptr<oracle::Oracle> require_oracle() const {
    if (!oracle_) {
      throw oracle::Error("no oracle configured");
    }
    return oracle_;
  }

  oracle::Prefix prefix_of(Id branch) const {
    oracle::Prefix prefix;
    for (const auto& t : branches_.thought_prefix(branch)) {
      prefix.push_back(t.content);
    }
    return prefix;
  }

  /**
   * Descend from `start` by UCB1 with virtual loss applied
   *
   * Stops at a node that is not expanded, is terminal, or has no children.
   * Caller holds mu_ (shared).
   */
  std::vector<Id> select_path(Id start) const {
    std::vector<Id> path{start};
    size_t bound = nodes_.size() + 1;
    const Node* cur = nodes_.get(start);
    while (cur && path.size() <= bound) {
      const SearchNode& rec = cur->record;
      if (!rec.is_expanded || rec.is_terminal || rec.children.empty()) break;

      uint32_t parent_n = cur->stats->visits.load(std::memory_order_acquire) +
                          cur->stats->in_flight.load(std::memory_order_acquire);
      const Node* best = nullptr;
      double best_score = -std::numeric_limits<double>::infinity();
      for (Id cid : rec.children) {
        const Node* c = nodes_.get(cid);
        if (!c) continue;
        uint32_t visits = c->stats->visits.load(std::memory_order_acquire);
        uint32_t effective = visits + c->stats->in_flight.load(std::memory_order_acquire);
        double score = visits == 0 && effective == 0
            ? std::numeric_limits<double>::infinity()
            : ucb1(c->stats->total_value.load(std::memory_order_acquire), effective,
                   parent_n, config_.exploration_constant);
        if (!best || score > best_score) {
          best_score = score;
          best = c;
        }
      }
      if (!best) break;
      path.push_back(best->record.id);
      cur = best;
    }
    return path;
  }

  // Validated oracle continuations for a node, not yet attached
  struct Expansion {
    SearchNode parent;
    oracle::Prefix prefix;
    std::vector<oracle::Continuation> candidates;
  };

  Expansion generate(Id node_id, size_t n) {
    Expansion e;
    e.parent = require_node(node_id, "expand");
    e.prefix = prefix_of(e.parent.branch);

    std::shared_ptr<oracle::Oracle> o = require_oracle();
    oracle::Prefix prefix = e.prefix;
    e.candidates = oracle::bounded_call(
        [o, prefix, n](std::stop_token stop) {
          return o->generate_continuations(prefix, n, stop);
        },
        config_.oracle_timeout());

    for (const auto& c : e.candidates) {
      if (c.content.empty()) {
        throw oracle::Malformed("generate_continuations: empty continuation");
      }
      if (c.prior && (!std::isfinite(*c.prior) || *c.prior < 0.0 || *c.prior > 1.0)) {
        throw oracle::Malformed("generate_continuations: prior outside [0,1]");
      }
    }
    if (e.candidates.size() > n) e.candidates.resize(n);
    return e;
  }

  std::vector<Id> commit(const Expansion& e) {
    if (e.candidates.empty()) {
      std::unique_lock lock(mu_);
      if (Node* p = nodes_.get(e.parent.id)) {
        p->record.is_expanded = true;
        p->record.is_terminal = true;
      }
      RETRACE_LOG_DEBUG("[mcts::expand] node=%llu has no continuations, terminal",
                       (unsigned long long)e.parent.id);
      return {};
    }

    std::vector<Id> out = attach_children(e.parent, e.candidates);
    metrics_expansions_.fetch_add(1, std::memory_order_relaxed);
    return out;
  }

  double evaluate(const oracle::Prefix& prefix) {
    std::shared_ptr<oracle::Oracle> o = require_oracle();
    double reward = oracle::bounded_call(
        [o, prefix](std::stop_token stop) { return o->evaluate(prefix, stop); },
        config_.oracle_timeout());
    if (!std::isfinite(reward) || reward < config_.reward_min || reward > config_.reward_max) {
      throw oracle::Malformed("evaluate: reward " + std::to_string(reward) +
                              " outside the configured range");
    }
    metrics_simulations_.fetch_add(1, std::memory_order_relaxed);
    return reward;
  }

  /// True if this caller now owns the node's expansion
  bool claim_expansion(Id id, NodeStats& stats) {
    {
      std::shared_lock lock(mu_);
      const Node* n = nodes_.get(id);
      if (!n || n->record.is_expanded || n->record.is_terminal) return false;
    }
    bool expected = false;
    return stats.expanding.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
  }

  /**
   * Node search starts from: the active branch's node, else its nearest
   * ancestor with one, else the timeline root (created on demand)
   */
  Id start_node(Id timeline_id) {
    timeline::Timeline t = timelines_.get(timeline_id);
    if (t.active_branch != INVALID_ID && branches_.contains(t.active_branch)) {
      std::vector<Id> path = branches_.branch_path_ids(t.active_branch);
      std::shared_lock lock(mu_);
      for (auto it = path.rbegin(); it != path.rend(); ++it) {
        auto found = by_branch_.find(*it);
        if (found != by_branch_.end()) return found->second;
      }
    }
    if (t.root_branch == INVALID_ID) {
      throw NotFound("step: timeline has no root branch");
    }
    return ensure_node(timeline_id, t.root_branch);
  }

  /// Search root for a timeline branch that has no node yet
  Id ensure_node(Id timeline_id, Id branch) {
    branch::Branch b = branches_.get(branch);
    std::vector<branch::Thought> thoughts = branches_.thoughts(branch);

    std::unique_lock lock(mu_);
    auto found = by_branch_.find(branch);
    if (found != by_branch_.end()) return found->second;

    Node n;
    n.stats = std::make_shared<NodeStats>();
    n.record.session = b.session;
    n.record.timeline = timeline_id;
    n.record.branch = branch;
    n.record.content = thoughts.empty() ? b.name : thoughts.back().content;
    n.record.prior = config_.default_prior;
    n.record.created_at = now_ms();
    Id id = nodes_.insert(std::move(n));
    if (id == INVALID_ID) {
      throw ValidationError("ensure_node: search node table exhausted");
    }
    nodes_.get(id)->record.id = id;
    by_branch_[branch] = id;
    return id;
  }

  std::vector<Id> attach_children(const SearchNode& parent,
                                  const std::vector<oracle::Continuation>& candidates) {
    uint32_t depth = parent.simulation_depth + 1;
    std::vector<Id> created;
    try {
      for (size_t i = 0; i < candidates.size(); ++i) {
        double prior = candidates[i].prior.value_or(config_.default_prior);
        branch::BranchOptions opts;
        opts.name = "Alternative " + std::to_string(i + 1);
        opts.confidence = prior;
        Id b = branches_.create_branch(parent.session, parent.branch, opts);
        created.push_back(b);
        branches_.add_thought(b, candidates[i].content, prior);
        timelines_.attach(parent.timeline, b, depth, true);
      }
    } catch (const Error&) {
      rollback(created);
      throw;
    }

    std::unique_lock lock(mu_);
    Node* p = nodes_.get(parent.id);
    if (!p) {
      lock.unlock();
      rollback(created);
      throw NotFound("expand: search node removed during expansion");
    }

    std::vector<Id> ids;
    int64_t now = now_ms();
    for (size_t i = 0; i < created.size(); ++i) {
      Node n;
      n.stats = std::make_shared<NodeStats>();
      n.record.session = parent.session;
      n.record.timeline = parent.timeline;
      n.record.branch = created[i];
      n.record.parent = parent.id;
      n.record.content = candidates[i].content;
      n.record.prior = candidates[i].prior.value_or(config_.default_prior);
      n.record.simulation_depth = depth;
      n.record.is_terminal = depth >= config_.max_depth;
      n.record.created_at = now;
      Id id = nodes_.insert(std::move(n));
      nodes_.get(id)->record.id = id;
      by_branch_[created[i]] = id;
      ids.push_back(id);
    }
    // Slot storage may have moved during insert
    p = nodes_.get(parent.id);
    p->record.children.insert(p->record.children.end(), ids.begin(), ids.end());
    p->record.is_expanded = true;

    RETRACE_LOG_DEBUG("[mcts::expand] node=%llu children=%zu depth=%u",
                     (unsigned long long)parent.id, ids.size(), depth);
    return ids;
  }

  void rollback(const std::vector<Id>& created) {
    for (Id b : created) {
      timelines_.remove_branch(b);
      branches_.remove_branch(b);
    }
  }

  void remove_node_locked(Id id) {
    Node* n = nodes_.get(id);
    if (!n) return;
    for (Id cid : n->record.children) {
      if (Node* c = nodes_.get(cid)) c->record.parent = INVALID_ID;
    }
    if (Node* p = nodes_.get(n->record.parent)) {
      auto& v = p->record.children;
      v.erase(std::remove(v.begin(), v.end(), id), v.end());
    }
    by_branch_.erase(n->record.branch);
    nodes_.release(id);
  }

  branch::BranchStore& branches_;
  timeline::TimelineStore& timelines_;
  std::shared_ptr<oracle::Oracle> oracle_;
  SearchConfig config_;

  mutable std::shared_mutex mu_;
  SlotTable<Node> nodes_;
  std::unordered_map<Id, Id> by_branch_;

  std::atomic<size_t> metrics_expansions_{0};
  std::atomic<size_t> metrics_failed_expansions_{0};
  std::atomic<size_t> metrics_simulations_{0};
  std::atomic<size_t> metrics_failed_simulations_{0};
};

}  // namespace retrace::mcts
