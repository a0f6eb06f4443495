#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * Snapshot Store
 *
 * Two restore mechanisms sharing one shape:
 *
 * - Checkpoint: a named, immutable payload anchored to a branch.
 * - StateSnapshot: a session-scoped node in a snapshot DAG. Full snapshots
 *   carry complete state; incremental snapshots carry an RFC 7386 merge
 *   patch against their parent; branch snapshots record a restore.
 *
 * resolve() materializes a snapshot by walking to the nearest full snapshot
 * and applying patches root to leaf. Payloads are nlohmann::json with sorted
 * object keys, so resolving twice serializes byte-identically.
 *
 * Time travel is non-destructive: restore() never touches the source record
 * or the source branch. It creates a new active branch next to the source.
 *
 * Usage:
 *   snapshot::SnapshotStore snaps(branches);
 *   auto cp = snaps.create_checkpoint(b0, "before pivot", payload);
 *   branches.transition(b0, BranchState::Abandoned);
 *   Id b1 = snaps.restore(cp.id);          // active, content == payload
 *
 *   Id full = snaps.create_snapshot(s, SnapshotKind::Full, {{"x", 1}});
 *   Id inc  = snaps.create_snapshot(s, SnapshotKind::Incremental, {{"y", 2}}, full);
 *   snaps.resolve(inc);                    // {"x":1,"y":2}
 */

#include "branch.hpp"
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

namespace retrace::snapshot {

// ============================================================================
// Records
// ============================================================================

struct Checkpoint {
  Id id = INVALID_ID;
  Id session = INVALID_ID;
  Id branch = INVALID_ID;
  std::string name;
  std::string description;
  nlohmann::json payload;
  int64_t created_at = 0;
};

struct StateSnapshot {
  Id id = INVALID_ID;
  Id session = INVALID_ID;
  SnapshotKind kind = SnapshotKind::Full;
  nlohmann::json payload;
  Id parent = INVALID_ID;
  std::string description;
  int64_t created_at = 0;
};

inline void to_json(nlohmann::json& j, const Checkpoint& c) {
  j = {{"id", c.id}, {"session", c.session}, {"branch", c.branch},
       {"name", c.name}, {"description", c.description},
       {"payload", c.payload}, {"created_at", c.created_at}};
}

inline void from_json(const nlohmann::json& j, Checkpoint& c) {
  c.id = j.at("id").get<Id>();
  c.session = j.at("session").get<Id>();
  c.branch = j.value("branch", INVALID_ID);
  c.name = j.value("name", std::string());
  c.description = j.value("description", std::string());
  c.payload = j.value("payload", nlohmann::json());
  c.created_at = j.value("created_at", int64_t{0});
}

inline void to_json(nlohmann::json& j, const StateSnapshot& s) {
  j = {{"id", s.id}, {"session", s.session}, {"kind", s.kind},
       {"payload", s.payload}, {"parent", s.parent},
       {"description", s.description}, {"created_at", s.created_at}};
}

inline void from_json(const nlohmann::json& j, StateSnapshot& s) {
  s.id = j.at("id").get<Id>();
  s.session = j.at("session").get<Id>();
  s.kind = j.value("kind", SnapshotKind::Full);
  s.payload = j.value("payload", nlohmann::json());
  s.parent = j.value("parent", INVALID_ID);
  s.description = j.value("description", std::string());
  s.created_at = j.value("created_at", int64_t{0});
}

// ============================================================================
// Snapshot Store
// ============================================================================

class SnapshotStore {
public:
  /**
   * @param branches Branch store that checkpoints anchor to and restores
   *                 create branches in (not owned, must outlive this store)
   * @param max_chain_hops Bound on resolve() walks
   */
  explicit SnapshotStore(branch::BranchStore& branches, size_t max_chain_hops = 4096)
      : branches_(branches), max_chain_hops_(max_chain_hops) {}

  SnapshotStore(const SnapshotStore&) = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  // ===== Checkpoints =====

  /**
   * Write an immutable checkpoint anchored to an existing branch
   *
   * @throws NotFound if the branch does not exist
   */
  Checkpoint create_checkpoint(Id branch, std::string name, nlohmann::json payload,
                               std::string description = "") {
    std::unique_lock lock(mu_);
    // Checked under our lock: a checkpoint is only valid once its branch exists
    std::optional<branch::Branch> b = branches_.find(branch);
    if (!b) {
      throw NotFound("create_checkpoint: branch not found");
    }

    Checkpoint c;
    c.session = b->session;
    c.branch = branch;
    c.name = std::move(name);
    c.description = std::move(description);
    c.payload = std::move(payload);
    c.created_at = now_ms();
    Id id = checkpoints_.insert(std::move(c));
    checkpoints_.get(id)->id = id;

    RETRACE_LOG_DEBUG("[snapshot::create_checkpoint] id=%llu branch=%llu",
                     (unsigned long long)id, (unsigned long long)branch);
    return *checkpoints_.get(id);
  }

  /**
   * Checkpoint the branch's own state: its thoughts, scores and content
   *
   * The thoughts of ancestors are not copied; restore() places the new
   * branch under the same parent, so it inherits them from the path.
   */
  Checkpoint capture_checkpoint(Id branch, std::string name, std::string description = "") {
    branch::Branch b = branches_.get(branch);

    nlohmann::json thoughts = nlohmann::json::array();
    for (const auto& t : branches_.thoughts(branch)) {
      thoughts.push_back({{"content", t.content}, {"confidence", t.confidence}});
    }
    nlohmann::json payload = {
        {"branch", {{"name", b.name},
                    {"priority", b.priority},
                    {"confidence", b.confidence},
                    {"state", b.state}}},
        {"thoughts", std::move(thoughts)},
        {"content", b.content},
    };
    return create_checkpoint(branch, std::move(name), std::move(payload),
                             std::move(description));
  }

  std::optional<Checkpoint> checkpoint(Id id) const {
    std::shared_lock lock(mu_);
    const Checkpoint* c = checkpoints_.get(id);
    if (!c) return std::nullopt;
    return *c;
  }

  /// Checkpoints of a session, oldest first
  std::vector<Checkpoint> session_checkpoints(Id session) const {
    std::shared_lock lock(mu_);
    std::vector<Checkpoint> out;
    checkpoints_.for_each([&](Id, const Checkpoint& c) {
      if (c.session == session) out.push_back(c);
    });
    std::stable_sort(out.begin(), out.end(), [](const Checkpoint& a, const Checkpoint& b) {
      return a.created_at < b.created_at;
    });
    return out;
  }

  // ===== State snapshots =====

  /**
   * Write an immutable snapshot node
   *
   * @throws ValidationError if the session is unknown, a full snapshot has a
   *         parent, an incremental snapshot has none, or the parent belongs
   *         to another session
   * @throws NotFound if the parent snapshot does not exist
   */
  Id create_snapshot(Id session, SnapshotKind kind, nlohmann::json payload,
                     Id parent = INVALID_ID, std::string description = "") {
    if (!branches_.has_session(session)) {
      throw ValidationError("create_snapshot: unknown session");
    }
    if (kind == SnapshotKind::Full && parent != INVALID_ID) {
      throw ValidationError("create_snapshot: full snapshot cannot have a parent");
    }
    if (kind == SnapshotKind::Incremental && parent == INVALID_ID) {
      throw ValidationError("create_snapshot: incremental snapshot requires a parent");
    }

    std::unique_lock lock(mu_);
    if (parent != INVALID_ID) {
      const StateSnapshot* p = snapshots_.get(parent);
      if (!p) {
        throw NotFound("create_snapshot: parent snapshot not found");
      }
      if (p->session != session) {
        throw ValidationError("create_snapshot: parent belongs to a different session");
      }
    }

    StateSnapshot s;
    s.session = session;
    s.kind = kind;
    s.payload = std::move(payload);
    s.parent = parent;
    s.description = std::move(description);
    s.created_at = now_ms();
    s.created_at = std::max(s.created_at, last_snapshot_at_);
    last_snapshot_at_ = s.created_at;
    Id id = snapshots_.insert(std::move(s));
    snapshots_.get(id)->id = id;

    RETRACE_LOG_DEBUG("[snapshot::create_snapshot] id=%llu kind=%s parent=%llu",
                     (unsigned long long)id, to_string(kind).c_str(),
                     (unsigned long long)parent);
    return id;
  }

  std::optional<StateSnapshot> snapshot(Id id) const {
    std::shared_lock lock(mu_);
    const StateSnapshot* s = snapshots_.get(id);
    if (!s) return std::nullopt;
    return *s;
  }

  std::vector<StateSnapshot> session_snapshots(Id session) const {
    std::shared_lock lock(mu_);
    std::vector<StateSnapshot> out;
    snapshots_.for_each([&](Id, const StateSnapshot& s) {
      if (s.session == session) out.push_back(s);
    });
    std::stable_sort(out.begin(), out.end(), [](const StateSnapshot& a, const StateSnapshot& b) {
      return a.created_at < b.created_at;
    });
    return out;
  }

  std::optional<StateSnapshot> latest_snapshot(Id session) const {
    auto all = session_snapshots(session);
    if (all.empty()) return std::nullopt;
    return all.back();
  }

  /**
   * Fully materialized payload of a snapshot
   *
   * @throws NotFound if the snapshot does not exist
   * @throws CorruptChain if the chain hits a missing parent, exceeds the hop
   *         bound, or ends anywhere but a full snapshot
   */
  nlohmann::json resolve(Id id) const {
    std::shared_lock lock(mu_);
    const StateSnapshot* leaf = snapshots_.get(id);
    if (!leaf) {
      throw NotFound("resolve: snapshot not found");
    }
    // A standalone branch snapshot is its own base
    if (leaf->kind == SnapshotKind::Branch && leaf->parent == INVALID_ID) {
      return leaf->payload;
    }

    std::vector<const StateSnapshot*> chain{leaf};
    while (chain.back()->kind != SnapshotKind::Full) {
      if (chain.size() > max_chain_hops_) {
        throw CorruptChain("resolve: chain exceeds hop bound");
      }
      Id parent = chain.back()->parent;
      if (parent == INVALID_ID) {
        throw CorruptChain("resolve: chain does not terminate at a full snapshot");
      }
      const StateSnapshot* p = snapshots_.get(parent);
      if (!p) {
        throw CorruptChain("resolve: chain references a missing snapshot");
      }
      chain.push_back(p);
    }

    nlohmann::json state = chain.back()->payload;
    for (size_t i = chain.size() - 1; i-- > 0; ) {
      state.merge_patch(chain[i]->payload);
    }
    return state;
  }

  // ===== Restore =====

  /**
   * Restore a checkpoint as a new active branch
   *
   * The new branch is a sibling of the checkpoint's branch, its content is
   * the checkpoint payload, and the payload's "thoughts" are re-attached.
   * A branch snapshot documenting the restore is recorded.
   *
   * @throws NotFound if the checkpoint does not exist
   */
  Id restore(Id checkpoint_id) {
    std::optional<Checkpoint> cp = checkpoint(checkpoint_id);
    if (!cp) {
      throw NotFound("restore: checkpoint not found");
    }

    Id parent = INVALID_ID;
    if (auto src = branches_.find(cp->branch)) {
      parent = src->parent;
    }

    Id restored = materialize(cp->session, parent, cp->payload, "Restored: " + cp->name);
    create_snapshot(cp->session, SnapshotKind::Branch, cp->payload, INVALID_ID,
                    "Restore from checkpoint: " + cp->name);

    RETRACE_LOG_INFO("[snapshot::restore] checkpoint=%llu -> branch=%llu",
                    (unsigned long long)checkpoint_id, (unsigned long long)restored);
    return restored;
  }

  /**
   * Restore a snapshot's resolved state as a new active branch
   *
   * @param parent Branch to attach under (INVALID_ID for a new root)
   * @throws NotFound / CorruptChain as resolve()
   * @throws ValidationError if the parent is in another session
   */
  Id restore_snapshot(Id snapshot_id, Id parent = INVALID_ID) {
    std::optional<StateSnapshot> s = snapshot(snapshot_id);
    if (!s) {
      throw NotFound("restore_snapshot: snapshot not found");
    }
    nlohmann::json state = resolve(snapshot_id);
    std::string name = s->description.empty() ? "Restored snapshot" : "Restored: " + s->description;
    return materialize(s->session, parent, state, name);
  }

  // ===== Removal (cascade support) =====

  /// Delete every checkpoint anchored to the branch
  size_t remove_for_branch(Id branch) {
    std::unique_lock lock(mu_);
    auto ids = checkpoints_.select([&](const Checkpoint& c) { return c.branch == branch; });
    for (Id id : ids) checkpoints_.release(id);
    return ids.size();
  }

  void remove_session(Id session) {
    std::unique_lock lock(mu_);
    for (Id id : checkpoints_.select([&](const Checkpoint& c) { return c.session == session; })) {
      checkpoints_.release(id);
    }
    for (Id id : snapshots_.select([&](const StateSnapshot& s) { return s.session == session; })) {
      snapshots_.release(id);
    }
  }

  // ===== Persistence =====

  nlohmann::json dump() const {
    std::shared_lock lock(mu_);
    nlohmann::json j;
    j["checkpoints"] = nlohmann::json::array();
    j["snapshots"] = nlohmann::json::array();
    checkpoints_.for_each([&](Id, const Checkpoint& c) { j["checkpoints"].emplace_back(c); });
    snapshots_.for_each([&](Id, const StateSnapshot& s) { j["snapshots"].emplace_back(s); });
    return j;
  }

  /// @throws ValidationError on duplicate ids or dangling references
  void load(const nlohmann::json& j) {
    SlotTable<Checkpoint> checkpoints;
    SlotTable<StateSnapshot> snapshots;

    for (const auto& e : j.value("checkpoints", nlohmann::json::array())) {
      Checkpoint c = e.get<Checkpoint>();
      if (!branches_.has_session(c.session) || !branches_.contains(c.branch) ||
          !checkpoints.place(c.id, c)) {
        throw ValidationError("load: invalid checkpoint record");
      }
    }
    for (const auto& e : j.value("snapshots", nlohmann::json::array())) {
      StateSnapshot s = e.get<StateSnapshot>();
      if (!branches_.has_session(s.session) || !snapshots.place(s.id, s)) {
        throw ValidationError("load: invalid snapshot record");
      }
    }
    checkpoints.rebuild_freelist();
    snapshots.rebuild_freelist();

    std::unique_lock lock(mu_);
    std::swap(checkpoints_, checkpoints);
    std::swap(snapshots_, snapshots);
    last_snapshot_at_ = 0;
    snapshots_.for_each([&](Id, const StateSnapshot& s) {
      last_snapshot_at_ = std::max(last_snapshot_at_, s.created_at);
    });
  }

private:
  struct RestoredThought {
    std::string content;
    double confidence = 0.8;
  };

  static double number_field(const nlohmann::json& obj, const char* key, double fallback,
                             const char* what) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_number()) {
      throw ValidationError(std::string("restore: ") + what + "." + key + " must be a number");
    }
    return it->get<double>();
  }

  // Reads every field the restore needs; nothing is written until it returns
  static std::vector<RestoredThought> parse_thoughts(const nlohmann::json& state) {
    std::vector<RestoredThought> out;
    if (!state.is_object()) return out;
    auto it = state.find("thoughts");
    if (it == state.end() || !it->is_array()) return out;

    for (const auto& t : *it) {
      RestoredThought rt;
      if (t.is_string()) {
        rt.content = t.get<std::string>();
      } else if (t.is_object()) {
        auto c = t.find("content");
        if (c != t.end()) {
          if (!c->is_string()) {
            throw ValidationError("restore: thought content must be a string");
          }
          rt.content = c->get<std::string>();
        }
        rt.confidence = number_field(t, "confidence", rt.confidence, "thought");
      } else {
        throw ValidationError("restore: thoughts entries must be strings or objects");
      }
      out.push_back(std::move(rt));
    }
    return out;
  }

  Id materialize(Id session, Id parent, const nlohmann::json& state, std::string name) {
    branch::BranchOptions opts;
    opts.name = std::move(name);
    opts.content = state;
    if (state.is_object()) {
      auto meta = state.find("branch");
      if (meta != state.end() && meta->is_object()) {
        opts.priority = number_field(*meta, "priority", opts.priority, "branch");
        opts.confidence = number_field(*meta, "confidence", opts.confidence, "branch");
      }
    }
    std::vector<RestoredThought> thoughts = parse_thoughts(state);

    Id id = branches_.create_branch(session, parent, opts);
    for (auto& t : thoughts) {
      branches_.add_thought(id, std::move(t.content), t.confidence);
    }
    return id;
  }

  branch::BranchStore& branches_;
  size_t max_chain_hops_;
  int64_t last_snapshot_at_ = 0;

  mutable std::shared_mutex mu_;
  SlotTable<Checkpoint> checkpoints_;
  SlotTable<StateSnapshot> snapshots_;
};

}  // namespace retrace::snapshot
