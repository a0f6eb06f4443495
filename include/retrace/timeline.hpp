#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * Timeline Store
 *
 * A Timeline is the container of one tree-mode exploration: a root branch,
 * the branch exploration currently continues from (active_branch), and
 * aggregate counts. TimelineBranch is the per-branch overlay carrying the
 * search statistics mirrored from the MCTS engine.
 *
 * active_branch is a single-writer field. Writers are serialized per
 * session; readers load it atomically and see either the old or the new
 * value.
 *
 * A branch without an overlay is legal (e.g. one produced by restore).
 */

#include "branch.hpp"
#include "common.hpp"
#include "errors.hpp"
#include "slot_table.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace retrace::timeline {

// ============================================================================
// Records
// ============================================================================

struct Timeline {
  Id id = INVALID_ID;
  Id session = INVALID_ID;
  std::string name;
  std::string description;
  Id root_branch = INVALID_ID;
  Id active_branch = INVALID_ID;
  uint32_t branch_count = 0;
  uint32_t max_depth = 0;
  TimelineState state = TimelineState::Active;
  int64_t created_at = 0;
  int64_t updated_at = 0;
};

struct TimelineBranch {
  Id branch = INVALID_ID;
  Id timeline = INVALID_ID;
  uint32_t depth = 0;
  uint32_t visit_count = 0;
  double total_value = 0.0;
  std::optional<double> ucb_score;
  std::optional<double> counterfactual_impact;
  bool mcts_generated = false;
  uint32_t alternatives_explored = 0;

  double mean_value() const {
    return visit_count > 0 ? total_value / visit_count : 0.0;
  }
};

/// Difference summary of two branches' thought paths
struct Comparison {
  Id branch_a = INVALID_ID;
  Id branch_b = INVALID_ID;
  Id common_ancestor = INVALID_ID;
  size_t shared_prefix = 0;  // leading thoughts both paths have in common
  std::vector<std::string> shared;
  std::vector<std::string> only_a;
  std::vector<std::string> only_b;
  std::optional<double> mean_a;  // set only for visited overlays
  std::optional<double> mean_b;
  Id recommended = INVALID_ID;   // higher mean, when both were visited
};

inline void to_json(nlohmann::json& j, const Timeline& t) {
  j = {{"id", t.id}, {"session", t.session}, {"name", t.name},
       {"description", t.description}, {"root_branch", t.root_branch},
       {"active_branch", t.active_branch}, {"branch_count", t.branch_count},
       {"max_depth", t.max_depth}, {"state", t.state},
       {"created_at", t.created_at}, {"updated_at", t.updated_at}};
}

inline void from_json(const nlohmann::json& j, Timeline& t) {
  t.id = j.at("id").get<Id>();
  t.session = j.at("session").get<Id>();
  t.name = j.value("name", std::string());
  t.description = j.value("description", std::string());
  t.root_branch = j.value("root_branch", INVALID_ID);
  t.active_branch = j.value("active_branch", t.root_branch);
  t.branch_count = j.value("branch_count", 0u);
  t.max_depth = j.value("max_depth", 0u);
  t.state = j.value("state", TimelineState::Active);
  t.created_at = j.value("created_at", int64_t{0});
  t.updated_at = j.value("updated_at", t.created_at);
}

inline void to_json(nlohmann::json& j, const TimelineBranch& tb) {
  j = {{"branch", tb.branch}, {"timeline", tb.timeline}, {"depth", tb.depth},
       {"visit_count", tb.visit_count}, {"total_value", tb.total_value},
       {"ucb_score", nullptr}, {"counterfactual_impact", nullptr},
       {"mcts_generated", tb.mcts_generated},
       {"alternatives_explored", tb.alternatives_explored}};
  if (tb.ucb_score) j["ucb_score"] = *tb.ucb_score;
  if (tb.counterfactual_impact) j["counterfactual_impact"] = *tb.counterfactual_impact;
}

inline void from_json(const nlohmann::json& j, TimelineBranch& tb) {
  tb.branch = j.at("branch").get<Id>();
  tb.timeline = j.at("timeline").get<Id>();
  tb.depth = j.value("depth", 0u);
  tb.visit_count = j.value("visit_count", 0u);
  tb.total_value = j.value("total_value", 0.0);
  tb.ucb_score.reset();
  tb.counterfactual_impact.reset();
  if (j.contains("ucb_score") && j["ucb_score"].is_number()) {
    tb.ucb_score = j["ucb_score"].get<double>();
  }
  if (j.contains("counterfactual_impact") && j["counterfactual_impact"].is_number()) {
    tb.counterfactual_impact = j["counterfactual_impact"].get<double>();
  }
  tb.mcts_generated = j.value("mcts_generated", false);
  tb.alternatives_explored = j.value("alternatives_explored", 0u);
}

// ============================================================================
// Timeline Store
// ============================================================================

class TimelineStore {
public:
  explicit TimelineStore(branch::BranchStore& branches) : branches_(branches) {}

  TimelineStore(const TimelineStore&) = delete;
  TimelineStore& operator=(const TimelineStore&) = delete;

  /**
   * Open a timeline rooted at an existing branch
   *
   * The root gets a depth-0 overlay and becomes the active branch.
   *
   * @throws NotFound if the root branch does not exist
   * @throws ValidationError if the root belongs to another session
   */
  Id create_timeline(Id session, Id root_branch, std::string name = "",
                     std::string description = "") {
    branch::Branch root = branches_.get(root_branch);
    if (root.session != session) {
      throw ValidationError("create_timeline: root branch belongs to a different session");
    }

    std::unique_lock lock(mu_);
    Entry e;
    e.record.session = session;
    e.record.name = std::move(name);
    e.record.description = std::move(description);
    e.record.root_branch = root_branch;
    e.record.branch_count = 1;
    e.record.created_at = now_ms();
    e.record.updated_at = e.record.created_at;
    e.active = std::make_unique<std::atomic<Id>>(root_branch);

    Id id = timelines_.insert(std::move(e));
    if (id == INVALID_ID) {
      throw ValidationError("create_timeline: timeline table exhausted");
    }
    timelines_.get(id)->record.id = id;

    TimelineBranch tb;
    tb.branch = root_branch;
    tb.timeline = id;
    overlays_[root_branch] = tb;
    lock.unlock();

    branches_.set_timeline(root_branch, id);
    RETRACE_LOG_DEBUG("[timeline::create_timeline] id=%llu root=%llu",
                     (unsigned long long)id, (unsigned long long)root_branch);
    return id;
  }

  bool contains(Id id) const {
    std::shared_lock lock(mu_);
    return timelines_.contains(id);
  }

  std::optional<Timeline> find(Id id) const {
    std::shared_lock lock(mu_);
    const Entry* e = timelines_.get(id);
    if (!e) return std::nullopt;
    return snapshot_of(*e);
  }

  /// @throws NotFound if the timeline does not exist
  Timeline get(Id id) const {
    std::shared_lock lock(mu_);
    return snapshot_of(require(id, "get"));
  }

  std::vector<Timeline> session_timelines(Id session) const {
    std::shared_lock lock(mu_);
    std::vector<Timeline> out;
    timelines_.for_each([&](Id, const Entry& e) {
      if (e.record.session == session) out.push_back(snapshot_of(e));
    });
    return out;
  }

  /// Never observes a torn value
  Id active_branch(Id id) const {
    std::shared_lock lock(mu_);
    return require(id, "active_branch").active->load(std::memory_order_acquire);
  }

  /**
   * Point the timeline at a new active branch
   *
   * Writers for the same session are serialized.
   *
   * @throws NotFound if the timeline or branch does not exist
   * @throws ValidationError if the branch belongs to another session
   */
  void set_active_branch(Id id, Id branch) {
    Id session = get(id).session;
    std::shared_ptr<std::mutex> writer = writer_mutex(session);
    std::lock_guard<std::mutex> serialized(*writer);

    branch::Branch b = branches_.get(branch);
    if (b.session != session) {
      throw ValidationError("set_active_branch: branch belongs to a different session");
    }

    std::unique_lock lock(mu_);
    Entry& e = require(id, "set_active_branch");
    e.active->store(branch, std::memory_order_release);
    e.record.updated_at = now_ms();
    RETRACE_LOG_DEBUG("[timeline::set_active_branch] timeline=%llu branch=%llu",
                     (unsigned long long)id, (unsigned long long)branch);
  }

  void set_state(Id id, TimelineState state) {
    std::unique_lock lock(mu_);
    Entry& e = require(id, "set_state");
    e.record.state = state;
    e.record.updated_at = now_ms();
  }

  // ===== Overlays =====

  /**
   * Attach a branch to a timeline with a fresh overlay
   *
   * @throws NotFound if the timeline does not exist
   * @throws ValidationError if the branch is in another session or already
   *         has an overlay
   */
  void attach(Id id, Id branch, uint32_t depth, bool mcts_generated) {
    branch::Branch b = branches_.get(branch);
    {
      std::unique_lock lock(mu_);
      Entry& e = require(id, "attach");
      if (b.session != e.record.session) {
        throw ValidationError("attach: branch belongs to a different session");
      }
      if (overlays_.count(branch) != 0) {
        throw ValidationError("attach: branch already has a timeline overlay");
      }
      TimelineBranch tb;
      tb.branch = branch;
      tb.timeline = id;
      tb.depth = depth;
      tb.mcts_generated = mcts_generated;
      overlays_[branch] = tb;
      e.record.branch_count += 1;
      e.record.max_depth = std::max(e.record.max_depth, depth);
      e.record.updated_at = now_ms();
    }
    branches_.set_timeline(branch, id);
  }

  std::optional<TimelineBranch> overlay(Id branch) const {
    std::shared_lock lock(mu_);
    auto it = overlays_.find(branch);
    if (it == overlays_.end()) return std::nullopt;
    return it->second;
  }

  std::vector<TimelineBranch> overlays(Id timeline) const {
    std::shared_lock lock(mu_);
    std::vector<TimelineBranch> out;
    for (const auto& kv : overlays_) {
      if (kv.second.timeline == timeline) out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const TimelineBranch& a, const TimelineBranch& b) {
      return a.branch < b.branch;
    });
    return out;
  }

  /// Mirror one backpropagated reward into the overlay
  void record_visit(Id branch, double reward, std::optional<double> ucb) {
    std::unique_lock lock(mu_);
    auto it = overlays_.find(branch);
    if (it == overlays_.end()) return;
    it->second.visit_count += 1;
    it->second.total_value += reward;
    it->second.ucb_score = ucb;
  }

  void set_ucb(Id branch, std::optional<double> ucb) {
    std::unique_lock lock(mu_);
    auto it = overlays_.find(branch);
    if (it != overlays_.end()) it->second.ucb_score = ucb;
  }

  void set_counterfactual_impact(Id branch, double impact) {
    std::unique_lock lock(mu_);
    auto it = overlays_.find(branch);
    if (it == overlays_.end()) {
      throw NotFound("set_counterfactual_impact: branch has no timeline overlay");
    }
    it->second.counterfactual_impact = impact;
  }

  void add_alternatives_explored(Id branch, uint32_t n) {
    std::unique_lock lock(mu_);
    auto it = overlays_.find(branch);
    if (it != overlays_.end()) it->second.alternatives_explored += n;
  }

  // ===== Comparison =====

  /**
   * Compare the thought paths of two branches
   *
   * Thoughts are matched by content, each occurrence at most once.
   *
   * @throws NotFound if either branch is missing
   * @throws ValidationError if they are in different sessions or neither
   *         path has any thoughts
   */
  Comparison compare(Id branch_a, Id branch_b) const {
    branch::Branch a = branches_.get(branch_a);
    branch::Branch b = branches_.get(branch_b);
    if (a.session != b.session) {
      throw ValidationError("compare: branches belong to different sessions");
    }
    std::vector<branch::Thought> path_a = branches_.thought_prefix(branch_a);
    std::vector<branch::Thought> path_b = branches_.thought_prefix(branch_b);
    if (path_a.empty() && path_b.empty()) {
      throw ValidationError("compare: neither branch has thoughts to compare");
    }

    Comparison out;
    out.branch_a = branch_a;
    out.branch_b = branch_b;

    std::vector<Id> ids_a = branches_.branch_path_ids(branch_a);
    std::vector<Id> ids_b = branches_.branch_path_ids(branch_b);
    for (size_t i = 0; i < ids_a.size() && i < ids_b.size() && ids_a[i] == ids_b[i]; ++i) {
      out.common_ancestor = ids_a[i];
    }

    while (out.shared_prefix < path_a.size() && out.shared_prefix < path_b.size() &&
           path_a[out.shared_prefix].content == path_b[out.shared_prefix].content) {
      ++out.shared_prefix;
    }

    std::unordered_map<std::string, size_t> unmatched;
    for (const auto& t : path_b) ++unmatched[t.content];
    for (const auto& t : path_a) {
      auto it = unmatched.find(t.content);
      if (it != unmatched.end() && it->second > 0) {
        --it->second;
        out.shared.push_back(t.content);
      } else {
        out.only_a.push_back(t.content);
      }
    }
    std::unordered_map<std::string, size_t> in_a;
    for (const auto& t : path_a) ++in_a[t.content];
    for (const auto& t : path_b) {
      auto it = in_a.find(t.content);
      if (it != in_a.end() && it->second > 0) {
        --it->second;
      } else {
        out.only_b.push_back(t.content);
      }
    }

    {
      std::shared_lock lock(mu_);
      auto oa = overlays_.find(branch_a);
      if (oa != overlays_.end() && oa->second.visit_count > 0) out.mean_a = oa->second.mean_value();
      auto ob = overlays_.find(branch_b);
      if (ob != overlays_.end() && ob->second.visit_count > 0) out.mean_b = ob->second.mean_value();
    }
    if (out.mean_a && out.mean_b) {
      out.recommended = *out.mean_b > *out.mean_a ? branch_b : branch_a;
    }
    return out;
  }

  // ===== Removal (cascade support) =====

  /**
   * Drop a branch's overlay and repoint timelines that referenced it
   *
   * An active_branch pointing at the removed branch falls back to the
   * timeline root; a removed root leaves the timeline without one.
   */
  void remove_branch(Id branch) {
    std::unique_lock lock(mu_);
    auto it = overlays_.find(branch);
    if (it != overlays_.end()) {
      if (Entry* e = timelines_.get(it->second.timeline)) {
        if (e->record.branch_count > 0) e->record.branch_count -= 1;
      }
      overlays_.erase(it);
    }
    timelines_.for_each([&](Id, Entry& e) {
      if (e.record.root_branch == branch) {
        e.record.root_branch = INVALID_ID;
      }
      if (e.active->load(std::memory_order_acquire) == branch) {
        e.active->store(e.record.root_branch, std::memory_order_release);
      }
    });
  }

  void remove_session(Id session) {
    {
      std::unique_lock lock(mu_);
      for (Id id : timelines_.select([&](const Entry& e) { return e.record.session == session; })) {
        for (auto it = overlays_.begin(); it != overlays_.end(); ) {
          it = it->second.timeline == id ? overlays_.erase(it) : std::next(it);
        }
        timelines_.release(id);
      }
    }
    // A writer still holding the mutex keeps it alive through its shared_ptr
    std::lock_guard<std::mutex> lock(writers_mu_);
    writers_.erase(session);
  }

  /// Sessions with a live active-branch writer mutex
  size_t writer_sessions() const {
    std::lock_guard<std::mutex> lock(writers_mu_);
    return writers_.size();
  }

  // ===== Persistence =====

  nlohmann::json dump() const {
    std::shared_lock lock(mu_);
    nlohmann::json j;
    j["timelines"] = nlohmann::json::array();
    j["timeline_branches"] = nlohmann::json::array();
    timelines_.for_each([&](Id, const Entry& e) { j["timelines"].emplace_back(snapshot_of(e)); });
    std::vector<Id> keys;
    for (const auto& kv : overlays_) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());
    for (Id k : keys) j["timeline_branches"].emplace_back(overlays_.at(k));
    return j;
  }

  /// @throws ValidationError on duplicate ids or dangling references
  void load(const nlohmann::json& j) {
    SlotTable<Entry> timelines;
    std::unordered_map<Id, TimelineBranch> overlays;

    for (const auto& item : j.value("timelines", nlohmann::json::array())) {
      Timeline t = item.get<Timeline>();
      if (!branches_.has_session(t.session)) {
        throw ValidationError("load: timeline references unknown session");
      }
      for (Id ref : {t.root_branch, t.active_branch}) {
        if (ref == INVALID_ID) continue;
        auto b = branches_.find(ref);
        if (!b || b->session != t.session) {
          throw ValidationError("load: timeline references a branch outside its session");
        }
      }
      Entry e;
      e.active = std::make_unique<std::atomic<Id>>(t.active_branch);
      e.record = std::move(t);
      Id id = e.record.id;
      if (!timelines.place(id, std::move(e))) {
        throw ValidationError("load: duplicate timeline id");
      }
    }
    for (const auto& item : j.value("timeline_branches", nlohmann::json::array())) {
      TimelineBranch tb = item.get<TimelineBranch>();
      if (!timelines.contains(tb.timeline) || !branches_.contains(tb.branch)) {
        throw ValidationError("load: timeline branch has dangling references");
      }
      if (!overlays.emplace(tb.branch, tb).second) {
        throw ValidationError("load: duplicate timeline branch");
      }
    }
    timelines.rebuild_freelist();

    std::unique_lock lock(mu_);
    std::swap(timelines_, timelines);
    std::swap(overlays_, overlays);
  }

private:
  struct Entry {
    Timeline record;
    std::unique_ptr<std::atomic<Id>> active;
  };

  static Timeline snapshot_of(const Entry& e) {
    Timeline t = e.record;
    t.active_branch = e.active ? e.active->load(std::memory_order_acquire) : INVALID_ID;
    return t;
  }

  Entry& require(Id id, const char* op) {
    Entry* e = timelines_.get(id);
    if (!e) {
      throw NotFound(std::string(op) + ": timeline not found");
    }
    return *e;
  }

  const Entry& require(Id id, const char* op) const {
    return const_cast<TimelineStore*>(this)->require(id, op);
  }

  std::shared_ptr<std::mutex> writer_mutex(Id session) {
    std::lock_guard<std::mutex> lock(writers_mu_);
    auto& slot = writers_[session];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
  }

  branch::BranchStore& branches_;

  mutable std::shared_mutex mu_;
  SlotTable<Entry> timelines_;
  std::unordered_map<Id, TimelineBranch> overlays_;

  mutable std::mutex writers_mu_;
  std::unordered_map<Id, std::shared_ptr<std::mutex>> writers_;
};

}  // namespace retrace::timeline
