#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * Branch Store
 *
 * Owns the branch forest of every session: sessions, branches, the thoughts
 * attached to each branch, and cross-references between branches.
 *
 * Branches are append-only history. They are never deleted by exploration,
 * only state-transitioned:
 *
 *   active ──► completed ──► abandoned
 *     └───────────────────────┘
 *
 * A branch's thought prefix is the concatenation of the thoughts of every
 * branch on its root-to-branch path, so forking a branch shares the prefix
 * instead of copying it.
 *
 * Usage:
 *   branch::BranchStore store;
 *   Id s = store.create_session("tree");
 *   Id root = store.create_branch(s, INVALID_ID, 1.0, 0.8);
 *   store.add_thought(root, "Start from first principles");
 *
 *   Id child = store.create_branch(s, root, 0.9, 0.7);
 *   auto path = store.branch_path(child);   // {root, child}
 *   store.transition(root, BranchState::Completed);
 *
 * Thread safety: internally synchronized (shared_mutex, readers shared).
 */

#include "common.hpp"
#include "errors.hpp"
#include "slot_table.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace retrace::branch {

// ============================================================================
// Records
// ============================================================================

struct Session {
  Id id = INVALID_ID;
  std::string mode = "tree";
  std::string name;
  int64_t created_at = 0;
  int64_t updated_at = 0;
};

struct Branch {
  Id id = INVALID_ID;
  Id session = INVALID_ID;
  std::string name;
  Id parent = INVALID_ID;
  double priority = 1.0;
  double confidence = 0.8;
  BranchState state = BranchState::Active;
  Id timeline = INVALID_ID;

  // Restored state payload (checkpoint/snapshot restore), null otherwise
  nlohmann::json content;

  // Topology and ordered thoughts, maintained by the store
  std::vector<Id> children;
  std::vector<Id> thoughts;

  int64_t created_at = 0;
  int64_t updated_at = 0;
};

struct Thought {
  Id id = INVALID_ID;
  Id session = INVALID_ID;
  Id branch = INVALID_ID;
  std::string content;
  double confidence = 0.8;
  int64_t created_at = 0;
};

struct CrossRef {
  Id id = INVALID_ID;
  Id from = INVALID_ID;
  Id to = INVALID_ID;
  CrossRefKind kind = CrossRefKind::Supports;
  std::string reason;
  double strength = 1.0;
  int64_t created_at = 0;
};

/// Optional attributes for create_branch
struct BranchOptions {
  std::string name;
  double priority = 1.0;
  double confidence = 0.8;
  nlohmann::json content;
};

// ============================================================================
// JSON (durable format)
// ============================================================================

inline void to_json(nlohmann::json& j, const Session& s) {
  j = {{"id", s.id}, {"mode", s.mode}, {"name", s.name},
       {"created_at", s.created_at}, {"updated_at", s.updated_at}};
}

inline void from_json(const nlohmann::json& j, Session& s) {
  s.id = j.at("id").get<Id>();
  s.mode = j.value("mode", std::string("tree"));
  s.name = j.value("name", std::string());
  s.created_at = j.value("created_at", int64_t{0});
  s.updated_at = j.value("updated_at", s.created_at);
}

inline void to_json(nlohmann::json& j, const Branch& b) {
  j = {{"id", b.id}, {"session", b.session}, {"name", b.name},
       {"parent", b.parent}, {"priority", b.priority},
       {"confidence", b.confidence}, {"state", b.state},
       {"timeline", b.timeline}, {"content", b.content},
       {"thoughts", b.thoughts},
       {"created_at", b.created_at}, {"updated_at", b.updated_at}};
}

// children are rebuilt from parent pointers on load
inline void from_json(const nlohmann::json& j, Branch& b) {
  b.id = j.at("id").get<Id>();
  b.session = j.at("session").get<Id>();
  b.name = j.value("name", std::string());
  b.parent = j.value("parent", INVALID_ID);
  b.priority = j.value("priority", 1.0);
  b.confidence = j.value("confidence", 0.8);
  b.state = j.value("state", BranchState::Active);
  b.timeline = j.value("timeline", INVALID_ID);
  b.content = j.value("content", nlohmann::json());
  b.thoughts = j.value("thoughts", std::vector<Id>{});
  b.created_at = j.value("created_at", int64_t{0});
  b.updated_at = j.value("updated_at", b.created_at);
}

inline void to_json(nlohmann::json& j, const Thought& t) {
  j = {{"id", t.id}, {"session", t.session}, {"branch", t.branch},
       {"content", t.content}, {"confidence", t.confidence},
       {"created_at", t.created_at}};
}

inline void from_json(const nlohmann::json& j, Thought& t) {
  t.id = j.at("id").get<Id>();
  t.session = j.at("session").get<Id>();
  t.branch = j.at("branch").get<Id>();
  t.content = j.value("content", std::string());
  t.confidence = j.value("confidence", 0.8);
  t.created_at = j.value("created_at", int64_t{0});
}

inline void to_json(nlohmann::json& j, const CrossRef& r) {
  j = {{"id", r.id}, {"from", r.from}, {"to", r.to}, {"kind", r.kind},
       {"reason", r.reason}, {"strength", r.strength},
       {"created_at", r.created_at}};
}

inline void from_json(const nlohmann::json& j, CrossRef& r) {
  r.id = j.at("id").get<Id>();
  r.from = j.at("from").get<Id>();
  r.to = j.at("to").get<Id>();
  r.kind = j.value("kind", CrossRefKind::Supports);
  r.reason = j.value("reason", std::string());
  r.strength = j.value("strength", 1.0);
  r.created_at = j.value("created_at", int64_t{0});
}

// ============================================================================
// State Machine
// ============================================================================

/**
 * Whether a branch may move from one state to another
 *
 * Same-state transitions are allowed (no-op). Nothing returns to active.
 */
inline bool transition_allowed(BranchState from, BranchState to) {
  if (from == to) return true;
  switch (from) {
    case BranchState::Active:
      return true;
    case BranchState::Completed:
      return to == BranchState::Abandoned;
    case BranchState::Abandoned:
      return false;
  }
  return false;
}

// ============================================================================
// Branch Store
// ============================================================================

class BranchStore {
public:
  /**
   * @param hop_limit Upper bound on ancestry walks. Exceeding it means the
   *                  stored parent pointers are corrupt.
   */
  explicit BranchStore(size_t hop_limit = 4096) : hop_limit_(hop_limit) {}

  BranchStore(const BranchStore&) = delete;
  BranchStore& operator=(const BranchStore&) = delete;

  size_t hop_limit() const { return hop_limit_; }

  // ===== Sessions =====

  Id create_session(std::string mode = "tree", std::string name = "") {
    std::unique_lock lock(mu_);
    Session s;
    s.mode = std::move(mode);
    s.name = std::move(name);
    s.created_at = now_ms();
    s.updated_at = s.created_at;
    Id id = sessions_.insert(s);
    sessions_.get(id)->id = id;
    RETRACE_LOG_DEBUG("[branch::create_session] id=%llu mode=%s",
                     (unsigned long long)id, s.mode.c_str());
    return id;
  }

  bool has_session(Id id) const {
    std::shared_lock lock(mu_);
    return sessions_.contains(id);
  }

  std::optional<Session> session(Id id) const {
    std::shared_lock lock(mu_);
    const Session* s = sessions_.get(id);
    if (!s) return std::nullopt;
    return *s;
  }

  std::vector<Id> sessions() const {
    std::shared_lock lock(mu_);
    return sessions_.select([](const Session&) { return true; });
  }

  // ===== Branches =====

  /**
   * Create a branch, optionally forked from a parent
   *
   * @throws ValidationError if the session is unknown, the parent is
   *         missing or belongs to another session, or the parent's ancestry
   *         does not terminate within the hop limit
   */
  Id create_branch(Id session, Id parent, const BranchOptions& opts = {}) {
    std::unique_lock lock(mu_);

    if (!sessions_.contains(session)) {
      throw ValidationError("create_branch: unknown session");
    }
    if (parent != INVALID_ID) {
      const Branch* p = branches_.get(parent);
      if (!p) {
        throw ValidationError("create_branch: parent branch not found");
      }
      if (p->session != session) {
        throw ValidationError("create_branch: parent belongs to a different session");
      }
      // Fail-safe against corrupted parent pointers
      if (!ancestry_terminates(parent, INVALID_ID)) {
        throw ValidationError("create_branch: parent ancestry exceeds hop limit");
      }
    }

    Branch b;
    b.session = session;
    b.name = opts.name;
    b.parent = parent;
    b.priority = opts.priority;
    b.confidence = opts.confidence;
    b.content = opts.content;
    b.created_at = now_ms();
    b.updated_at = b.created_at;

    Id id = branches_.insert(std::move(b));
    if (id == INVALID_ID) {
      throw ValidationError("create_branch: branch table exhausted");
    }
    branches_.get(id)->id = id;
    if (parent != INVALID_ID) {
      branches_.get(parent)->children.push_back(id);
    }
    touch_session(session);

    RETRACE_LOG_DEBUG("[branch::create_branch] id=%llu parent=%llu session=%llu",
                     (unsigned long long)id, (unsigned long long)parent,
                     (unsigned long long)session);
    return id;
  }

  Id create_branch(Id session, Id parent, double priority, double confidence) {
    BranchOptions opts;
    opts.priority = priority;
    opts.confidence = confidence;
    return create_branch(session, parent, opts);
  }

  bool contains(Id id) const {
    std::shared_lock lock(mu_);
    return branches_.contains(id);
  }

  std::optional<Branch> find(Id id) const {
    std::shared_lock lock(mu_);
    const Branch* b = branches_.get(id);
    if (!b) return std::nullopt;
    return *b;
  }

  /// @throws NotFound if the branch does not exist
  Branch get(Id id) const {
    std::shared_lock lock(mu_);
    return require(id, "get");
  }

  /**
   * Move a branch along the one-directional state machine
   *
   * @throws NotFound if the branch does not exist
   * @throws InvalidTransition on completed/abandoned -> active or
   *         abandoned -> completed
   */
  void transition(Id id, BranchState next) {
    std::unique_lock lock(mu_);
    Branch& b = require(id, "transition");
    if (!transition_allowed(b.state, next)) {
      throw InvalidTransition("transition: " + to_string(b.state) + " -> " +
                              to_string(next) + " is not allowed");
    }
    if (b.state == next) return;
    RETRACE_LOG_DEBUG("[branch::transition] id=%llu %s -> %s",
                     (unsigned long long)id, to_string(b.state).c_str(),
                     to_string(next).c_str());
    b.state = next;
    b.updated_at = now_ms();
  }

  void set_timeline(Id id, Id timeline) {
    std::unique_lock lock(mu_);
    Branch& b = require(id, "set_timeline");
    b.timeline = timeline;
    b.updated_at = now_ms();
  }

  void set_confidence(Id id, double confidence) {
    std::unique_lock lock(mu_);
    Branch& b = require(id, "set_confidence");
    b.confidence = confidence;
    b.updated_at = now_ms();
  }

  /**
   * Re-link a branch under a new parent (INVALID_ID detaches it)
   *
   * @throws ValidationError if the branch would become its own ancestor or
   *         the new parent is in another session; nothing changes then
   */
  void reparent(Id id, Id new_parent) {
    std::unique_lock lock(mu_);
    Branch& b = require(id, "reparent");
    if (new_parent != INVALID_ID) {
      const Branch* p = branches_.get(new_parent);
      if (!p) {
        throw ValidationError("reparent: parent branch not found");
      }
      if (p->session != b.session) {
        throw ValidationError("reparent: parent belongs to a different session");
      }
      if (!ancestry_terminates(new_parent, id)) {
        throw ValidationError("reparent: branch would become its own ancestor");
      }
    }
    unlink_child(b.parent, id);
    b.parent = new_parent;
    if (new_parent != INVALID_ID) {
      branches_.get(new_parent)->children.push_back(id);
    }
    b.updated_at = now_ms();
  }

  /**
   * Branches from the root down to (and including) the given branch
   *
   * @throws NotFound if the branch does not exist
   * @throws ValidationError if the ancestry exceeds the hop limit
   */
  std::vector<Branch> branch_path(Id id) const {
    std::shared_lock lock(mu_);
    std::vector<Branch> path;
    for (Id cur : path_ids(id, "branch_path")) {
      path.push_back(*branches_.get(cur));
    }
    return path;
  }

  std::vector<Id> branch_path_ids(Id id) const {
    std::shared_lock lock(mu_);
    return path_ids(id, "branch_path_ids");
  }

  /// Number of edges between the branch and its root
  size_t depth(Id id) const {
    std::shared_lock lock(mu_);
    return path_ids(id, "depth").size() - 1;
  }

  std::vector<Id> children(Id id) const {
    std::shared_lock lock(mu_);
    return require(id, "children").children;
  }

  std::vector<Id> session_branches(Id session) const {
    std::shared_lock lock(mu_);
    return branches_.select([&](const Branch& b) { return b.session == session; });
  }

  size_t branch_count() const {
    std::shared_lock lock(mu_);
    return branches_.size();
  }

  // ===== Thoughts =====

  /// @throws NotFound if the branch does not exist
  Id add_thought(Id branch, std::string content, double confidence = 0.8) {
    std::unique_lock lock(mu_);
    Branch& b = require(branch, "add_thought");
    Thought t;
    t.session = b.session;
    t.branch = branch;
    t.content = std::move(content);
    t.confidence = confidence;
    t.created_at = now_ms();
    b.updated_at = t.created_at;
    Id id = thoughts_.insert(std::move(t));
    thoughts_.get(id)->id = id;
    b.thoughts.push_back(id);
    return id;
  }

  std::optional<Thought> thought(Id id) const {
    std::shared_lock lock(mu_);
    const Thought* t = thoughts_.get(id);
    if (!t) return std::nullopt;
    return *t;
  }

  /// Thoughts attached directly to the branch, in insertion order
  std::vector<Thought> thoughts(Id branch) const {
    std::shared_lock lock(mu_);
    std::vector<Thought> out;
    for (Id t : require(branch, "thoughts").thoughts) {
      out.push_back(*thoughts_.get(t));
    }
    return out;
  }

  /// Thoughts of every branch on branch_path(branch), root first
  std::vector<Thought> thought_prefix(Id branch) const {
    std::shared_lock lock(mu_);
    std::vector<Thought> out;
    for (Id cur : path_ids(branch, "thought_prefix")) {
      for (Id t : branches_.get(cur)->thoughts) {
        out.push_back(*thoughts_.get(t));
      }
    }
    return out;
  }

  // ===== Cross-references =====

  /**
   * Record a directed relation between two branches (immutable)
   *
   * @throws NotFound if either branch is missing
   * @throws ValidationError if strength is outside [0, 1]
   */
  Id add_cross_ref(Id from, Id to, CrossRefKind kind, double strength = 1.0,
                   std::string reason = "") {
    std::unique_lock lock(mu_);
    if (!branches_.contains(from) || !branches_.contains(to)) {
      throw NotFound("add_cross_ref: branch not found");
    }
    if (!(strength >= 0.0 && strength <= 1.0)) {
      throw ValidationError("add_cross_ref: strength must be within [0, 1]");
    }
    CrossRef r;
    r.from = from;
    r.to = to;
    r.kind = kind;
    r.strength = strength;
    r.reason = std::move(reason);
    r.created_at = now_ms();
    Id id = cross_refs_.insert(std::move(r));
    cross_refs_.get(id)->id = id;
    return id;
  }

  std::optional<CrossRef> cross_ref(Id id) const {
    std::shared_lock lock(mu_);
    const CrossRef* r = cross_refs_.get(id);
    if (!r) return std::nullopt;
    return *r;
  }

  std::vector<CrossRef> cross_refs_from(Id branch) const {
    std::shared_lock lock(mu_);
    return collect_refs([&](const CrossRef& r) { return r.from == branch; });
  }

  std::vector<CrossRef> cross_refs_to(Id branch) const {
    std::shared_lock lock(mu_);
    return collect_refs([&](const CrossRef& r) { return r.to == branch; });
  }

  // ===== Removal (cascade support, used by Database and rollbacks) =====

  /**
   * Delete a branch with its thoughts and cross-references
   *
   * Children are detached (parent set to null), not deleted.
   */
  void remove_branch(Id id) {
    std::unique_lock lock(mu_);
    remove_branch_locked(id);
  }

  void remove_thought(Id id) {
    std::unique_lock lock(mu_);
    const Thought* t = thoughts_.get(id);
    if (!t) return;
    if (Branch* b = branches_.get(t->branch)) {
      auto& v = b->thoughts;
      v.erase(std::remove(v.begin(), v.end(), id), v.end());
    }
    thoughts_.release(id);
  }

  void remove_cross_ref(Id id) {
    std::unique_lock lock(mu_);
    cross_refs_.release(id);
  }

  /// Delete a session and everything in it
  void remove_session(Id session) {
    std::unique_lock lock(mu_);
    for (Id b : branches_.select([&](const Branch& x) { return x.session == session; })) {
      remove_branch_locked(b);
    }
    sessions_.release(session);
  }

  // ===== Persistence =====

  nlohmann::json dump() const {
    std::shared_lock lock(mu_);
    nlohmann::json j;
    j["sessions"] = nlohmann::json::array();
    j["branches"] = nlohmann::json::array();
    j["thoughts"] = nlohmann::json::array();
    j["cross_refs"] = nlohmann::json::array();
    sessions_.for_each([&](Id, const Session& s) { j["sessions"].emplace_back(s); });
    branches_.for_each([&](Id, const Branch& b) { j["branches"].emplace_back(b); });
    thoughts_.for_each([&](Id, const Thought& t) { j["thoughts"].emplace_back(t); });
    cross_refs_.for_each([&](Id, const CrossRef& r) { j["cross_refs"].emplace_back(r); });
    return j;
  }

  /**
   * Replace the store contents with a dumped document
   *
   * Validation happens on a staging copy, so a rejected document leaves the
   * store untouched.
   *
   * @throws ValidationError on duplicate ids, dangling references or a
   *         parent cycle
   */
  void load(const nlohmann::json& j) {
    BranchStore staging(hop_limit_);
    staging.load_into_empty(j);

    std::unique_lock lock(mu_);
    std::swap(sessions_, staging.sessions_);
    std::swap(branches_, staging.branches_);
    std::swap(thoughts_, staging.thoughts_);
    std::swap(cross_refs_, staging.cross_refs_);
  }

private:
  Branch& require(Id id, const char* op) {
    Branch* b = branches_.get(id);
    if (!b) {
      throw NotFound(std::string(op) + ": branch not found");
    }
    return *b;
  }

  const Branch& require(Id id, const char* op) const {
    return const_cast<BranchStore*>(this)->require(id, op);
  }

  void touch_session(Id session) {
    if (Session* s = sessions_.get(session)) {
      s->updated_at = now_ms();
    }
  }

  /**
   * Walk parent pointers from `start`
   *
   * Returns false if `forbidden` appears in the ancestry, a parent is
   * dangling, or the walk exceeds min(hop_limit, branch count).
   */
  bool ancestry_terminates(Id start, Id forbidden) const {
    size_t bound = std::min(hop_limit_, branches_.size() + 1);
    Id cur = start;
    for (size_t hops = 0; hops <= bound; ++hops) {
      if (cur == INVALID_ID) return true;
      if (cur == forbidden) return false;
      const Branch* b = branches_.get(cur);
      if (!b) return false;
      cur = b->parent;
    }
    return false;
  }

  std::vector<Id> path_ids(Id id, const char* op) const {
    require(id, op);
    std::vector<Id> path;
    size_t bound = std::min(hop_limit_, branches_.size() + 1);
    Id cur = id;
    while (cur != INVALID_ID) {
      if (path.size() > bound) {
        throw ValidationError(std::string(op) + ": ancestry exceeds hop limit");
      }
      const Branch* b = branches_.get(cur);
      if (!b) break;
      path.push_back(cur);
      cur = b->parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
  }

  template <typename Pred>
  std::vector<CrossRef> collect_refs(Pred&& pred) const {
    std::vector<CrossRef> out;
    cross_refs_.for_each([&](Id, const CrossRef& r) {
      if (pred(r)) out.push_back(r);
    });
    return out;
  }

  void unlink_child(Id parent, Id child) {
    if (Branch* p = branches_.get(parent)) {
      auto& v = p->children;
      v.erase(std::remove(v.begin(), v.end(), child), v.end());
    }
  }

  void remove_branch_locked(Id id) {
    Branch* b = branches_.get(id);
    if (!b) return;

    for (Id child : b->children) {
      if (Branch* c = branches_.get(child)) {
        c->parent = INVALID_ID;
      }
    }
    unlink_child(b->parent, id);

    for (Id t : b->thoughts) {
      thoughts_.release(t);
    }
    for (Id r : cross_refs_.select([&](const CrossRef& x) {
           return x.from == id || x.to == id;
         })) {
      cross_refs_.release(r);
    }
    branches_.release(id);
    RETRACE_LOG_DEBUG("[branch::remove_branch] id=%llu", (unsigned long long)id);
  }

  void load_into_empty(const nlohmann::json& j) {
    for (const auto& e : j.value("sessions", nlohmann::json::array())) {
      Session s = e.get<Session>();
      if (!sessions_.place(s.id, s)) {
        throw ValidationError("load: duplicate session id");
      }
    }
    for (const auto& e : j.value("branches", nlohmann::json::array())) {
      Branch b = e.get<Branch>();
      if (!sessions_.contains(b.session)) {
        throw ValidationError("load: branch references unknown session");
      }
      if (!branches_.place(b.id, b)) {
        throw ValidationError("load: duplicate branch id");
      }
    }
    for (const auto& e : j.value("thoughts", nlohmann::json::array())) {
      Thought t = e.get<Thought>();
      if (!branches_.contains(t.branch) || !thoughts_.place(t.id, t)) {
        throw ValidationError("load: invalid thought record");
      }
    }
    for (const auto& e : j.value("cross_refs", nlohmann::json::array())) {
      CrossRef r = e.get<CrossRef>();
      if (!branches_.contains(r.from) || !branches_.contains(r.to) ||
          !cross_refs_.place(r.id, r)) {
        throw ValidationError("load: invalid cross-reference record");
      }
    }
    sessions_.rebuild_freelist();
    branches_.rebuild_freelist();
    thoughts_.rebuild_freelist();
    cross_refs_.rebuild_freelist();

    // Rebuild topology, then prove the forest property
    std::vector<std::pair<Id, Id>> edges;
    branches_.for_each([&](Id id, const Branch& b) {
      edges.emplace_back(id, b.parent);
    });
    for (auto [child, parent] : edges) {
      if (parent == INVALID_ID) continue;
      Branch* p = branches_.get(parent);
      if (!p || p->session != branches_.get(child)->session) {
        throw ValidationError("load: branch parent is missing or in another session");
      }
      p->children.push_back(child);
    }
    for (auto [child, parent] : edges) {
      if (parent != INVALID_ID && !ancestry_terminates(parent, child)) {
        throw ValidationError("load: branch is its own ancestor");
      }
    }
    branches_.for_each([&](Id id, const Branch& b) {
      for (Id t : b.thoughts) {
        const Thought* th = thoughts_.get(t);
        if (!th || th->branch != id) {
          throw ValidationError("load: branch lists a thought it does not own");
        }
      }
    });
  }

  size_t hop_limit_;
  mutable std::shared_mutex mu_;
  SlotTable<Session> sessions_;
  SlotTable<Branch> branches_;
  SlotTable<Thought> thoughts_;
  SlotTable<CrossRef> cross_refs_;
};

}  // namespace retrace::branch
