#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * Database
 *
 * Owns one instance of every store plus the search engine and the
 * counterfactual analyzer, wired to the same branch store. Implements the
 * cross-store delete cascades and durable persistence.
 *
 * Cascades:
 * - delete_session: every record of the session in every store
 * - delete_branch: its thoughts, cross-references (either end),
 *   checkpoints, timeline overlay, search node and analyses; child
 *   branches are detached, not deleted; snapshots are session-scoped and
 *   unaffected
 *
 * Persistence is one JSON document with a schema version:
 *
 *   {"schema_version": 1, "sessions": [...], "branches": [...], ...}
 *
 * save() writes to a temporary file and renames it into place. Call it
 * while no other thread mutates the database.
 */

#include "branch.hpp"
#include "common.hpp"
#include "config.hpp"
#include "counterfactual.hpp"
#include "errors.hpp"
#include "mcts.hpp"
#include "oracle.hpp"
#include "slot_table.hpp"
#include "snapshot.hpp"
#include "timeline.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace retrace {

constexpr int SCHEMA_VERSION = 1;

class Database {
public:
  explicit Database(Config config = Config{},
                    std::shared_ptr<oracle::Oracle> oracle = nullptr)
      : config_(std::move(config)),
        oracle_(oracle),
        branches_(config_.hop_limit),
        snapshots_(branches_, config_.hop_limit),
        timelines_(branches_),
        engine_(branches_, timelines_, oracle, config_.search),
        analyzer_(branches_, timelines_, oracle, config_.analyzer) {
    config_.validate();
  }

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  const Config& config() const { return config_; }

  branch::BranchStore& branches() { return branches_; }
  snapshot::SnapshotStore& snapshots() { return snapshots_; }
  timeline::TimelineStore& timelines() { return timelines_; }
  mcts::Engine& engine() { return engine_; }
  counterfactual::Analyzer& analyzer() { return analyzer_; }

  const branch::BranchStore& branches() const { return branches_; }
  const snapshot::SnapshotStore& snapshots() const { return snapshots_; }
  const timeline::TimelineStore& timelines() const { return timelines_; }
  const mcts::Engine& engine() const { return engine_; }
  const counterfactual::Analyzer& analyzer() const { return analyzer_; }

  // ===== Cascades =====

  /// @throws NotFound if the session does not exist
  void delete_session(Id session) {
    if (!branches_.has_session(session)) {
      throw NotFound("delete_session: session not found");
    }
    analyzer_.remove_session(session);
    engine_.remove_session(session);
    timelines_.remove_session(session);
    snapshots_.remove_session(session);
    branches_.remove_session(session);
    RETRACE_LOG_INFO("[database::delete_session] session=%llu", (unsigned long long)session);
  }

  /**
   * Delete a branch and its dependents
   *
   * The branch goes first, so a checkpoint racing this call either fails
   * to find its branch or is removed with the others.
   *
   * @throws NotFound if the branch does not exist
   */
  void delete_branch(Id branch) {
    if (!branches_.contains(branch)) {
      throw NotFound("delete_branch: branch not found");
    }
    branches_.remove_branch(branch);
    snapshots_.remove_for_branch(branch);
    timelines_.remove_branch(branch);
    engine_.remove_branch(branch);
    analyzer_.remove_branch(branch);
    RETRACE_LOG_INFO("[database::delete_branch] branch=%llu", (unsigned long long)branch);
  }

  // ===== Persistence =====

  nlohmann::json to_json() const {
    nlohmann::json doc = nlohmann::json::object();
    doc["schema_version"] = SCHEMA_VERSION;
    doc.update(branches_.dump());
    doc.update(snapshots_.dump());
    doc.update(timelines_.dump());
    doc.update(engine_.dump());
    doc.update(analyzer_.dump());
    return doc;
  }

  /**
   * Replace the whole database with a document from to_json()
   *
   * The document is first applied to a scratch database; only if every
   * store accepts it is it applied here.
   *
   * @throws PersistenceError on a wrong schema version or invalid content
   */
  void from_json(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("schema_version") ||
        !doc["schema_version"].is_number_integer() ||
        doc["schema_version"].get<int>() != SCHEMA_VERSION) {
      throw PersistenceError("load: unsupported schema version");
    }
    try {
      {
        Database scratch(config_, oracle_);
        scratch.apply(doc);
      }
      apply(doc);
    } catch (const ValidationError& e) {
      throw PersistenceError(std::string("load: invalid document: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
      throw PersistenceError(std::string("load: malformed record: ") + e.what());
    }
  }

  /// @throws PersistenceError if the file cannot be written
  void save(const std::string& path) const {
    namespace fs = std::filesystem;
    fs::path target(path);
    fs::path tmp = target;
    tmp += ".tmp";
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw PersistenceError("save: cannot open " + tmp.string());
      }
      out << to_json().dump(2);
      out.flush();
      if (!out) {
        throw PersistenceError("save: write failed for " + tmp.string());
      }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
      fs::remove(tmp, ec);
      throw PersistenceError("save: cannot replace " + path);
    }
    RETRACE_LOG_DEBUG("[database::save] %s", path.c_str());
  }

  /// @throws PersistenceError if the file cannot be read, parsed or validated
  void load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      throw PersistenceError("load: cannot open " + path);
    }
    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
      throw PersistenceError("load: " + path + " is not valid JSON");
    }
    from_json(doc);
    RETRACE_LOG_INFO("[database::load] %s", path.c_str());
  }

private:
  void apply(const nlohmann::json& doc) {
    branches_.load(doc);
    snapshots_.load(doc);
    timelines_.load(doc);
    engine_.load(doc);
    analyzer_.load(doc);
  }

  Config config_;
  std::shared_ptr<oracle::Oracle> oracle_;

  branch::BranchStore branches_;
  snapshot::SnapshotStore snapshots_;
  timeline::TimelineStore timelines_;
  mcts::Engine engine_;
  counterfactual::Analyzer analyzer_;
};

}  // namespace retrace
