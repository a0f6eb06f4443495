#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * Counterfactual Analyzer
 *
 * "What if thought T had been different?" One analysis:
 *
 * 1. Locate T on the original branch's thought prefix.
 * 2. Build the counterfactual prefix: everything before T, then T changed,
 *    replaced, removed or followed by an injected thought.
 * 3. Ask the oracle for a continuation of the counterfactual prefix and
 *    score both prefixes `samples` times.
 * 4. Record the counterfactual branch (forked where T's branch forked), its
 *    thoughts, a cross-reference to the original, and the analysis.
 *
 * Every oracle call happens before any record is written, so an oracle
 * failure leaves nothing behind and surfaces as AnalysisIncomplete.
 */

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
#include <cmath>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace retrace::counterfactual {

// ============================================================================
// Records
// ============================================================================

struct Intervention {
  InterventionType type = InterventionType::Change;
  /** New or injected thought text; ignored for remove */
  std::string payload;
};

struct Request {
  Id original_branch = INVALID_ID;
  Id target_thought = INVALID_ID;
  Intervention intervention;
  std::string question;
  /** Rollouts per branch; analyzer default when unset */
  std::optional<uint32_t> samples;
  /** Timeline whose overlay receives the counterfactual impact */
  Id timeline = INVALID_ID;
};

struct Analysis {
  Id id = INVALID_ID;
  Id session = INVALID_ID;
  Id timeline = INVALID_ID;
  Id original_branch = INVALID_ID;
  std::string question;
  Id target_thought = INVALID_ID;
  Intervention intervention;
  Id counterfactual_branch = INVALID_ID;
  double outcome_delta = 0.0;
  double causal_attribution = 0.0;
  double confidence = 0.0;
  nlohmann::json comparison;
  int64_t created_at = 0;
};

inline void to_json(nlohmann::json& j, const Intervention& i) {
  j = {{"type", i.type}, {"payload", i.payload}};
}

inline void from_json(const nlohmann::json& j, Intervention& i) {
  i.type = j.value("type", InterventionType::Change);
  i.payload = j.value("payload", std::string());
}

inline void to_json(nlohmann::json& j, const Analysis& a) {
  j = {{"id", a.id}, {"session", a.session}, {"timeline", a.timeline},
       {"original_branch", a.original_branch}, {"question", a.question},
       {"target_thought", a.target_thought}, {"intervention", a.intervention},
       {"counterfactual_branch", a.counterfactual_branch},
       {"outcome_delta", a.outcome_delta},
       {"causal_attribution", a.causal_attribution},
       {"confidence", a.confidence}, {"comparison", a.comparison},
       {"created_at", a.created_at}};
}

inline void from_json(const nlohmann::json& j, Analysis& a) {
  a.id = j.at("id").get<Id>();
  a.session = j.at("session").get<Id>();
  a.timeline = j.value("timeline", INVALID_ID);
  a.original_branch = j.at("original_branch").get<Id>();
  a.question = j.value("question", std::string());
  a.target_thought = j.value("target_thought", INVALID_ID);
  a.intervention = j.value("intervention", Intervention{});
  a.counterfactual_branch = j.at("counterfactual_branch").get<Id>();
  a.outcome_delta = j.value("outcome_delta", 0.0);
  a.causal_attribution = j.value("causal_attribution", 0.0);
  a.confidence = j.value("confidence", 0.0);
  a.comparison = j.value("comparison", nlohmann::json::object());
  a.created_at = j.value("created_at", int64_t{0});
}

/**
 * Outcome statistics of two score samples
 */
struct Attribution {
  double delta = 0.0;
  double pooled_stddev = 0.0;
  double causal_attribution = 0.0;
  double confidence = 0.0;
};

inline double mean_of(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  double sum = 0.0;
  for (double x : v) sum += x;
  return sum / v.size();
}

inline double variance_of(const std::vector<double>& v) {
  if (v.size() < 2) return 0.0;
  double m = mean_of(v);
  double acc = 0.0;
  for (double x : v) acc += (x - m) * (x - m);
  return acc / v.size();
}

/**
 * delta = mean(cf) - mean(orig)
 * attribution = |delta| / (|delta| + pooled sd); 1 with no variance, 0 with no delta
 * confidence = 1 / (1 + pooled sd), scaled by n / (n + 1) for n samples
 */
inline Attribution attribute(const std::vector<double>& original,
                             const std::vector<double>& counterfactual) {
  Attribution a;
  a.delta = mean_of(counterfactual) - mean_of(original);
  a.pooled_stddev = std::sqrt((variance_of(original) + variance_of(counterfactual)) / 2.0);
  double mag = std::fabs(a.delta);
  if (mag == 0.0) {
    a.causal_attribution = 0.0;
  } else if (a.pooled_stddev == 0.0) {
    a.causal_attribution = 1.0;
  } else {
    a.causal_attribution = mag / (mag + a.pooled_stddev);
  }
  double n = static_cast<double>(std::min(original.size(), counterfactual.size()));
  a.confidence = (1.0 / (1.0 + a.pooled_stddev)) * (n / (n + 1.0));
  return a;
}

// ============================================================================
// Analyzer
// ============================================================================

class Analyzer {
public:
  Analyzer(branch::BranchStore& branches,
           timeline::TimelineStore& timelines,
           std::shared_ptr<oracle::Oracle> oracle,
           AnalyzerConfig config = AnalyzerConfig{})
      : branches_(branches),
        timelines_(timelines),
        oracle_(std::move(oracle)),
        config_(config) {}

  Analyzer(const Analyzer&) = delete;
  Analyzer& operator=(const Analyzer&) = delete;

  /**
   * Run one counterfactual analysis
   *
   * @throws ValidationError for an empty question, an empty payload on
   *         change/replace/inject, or zero samples
   * @throws NotFound if the branch or timeline is missing, or the target
   *         thought is not on the branch's thought prefix
   * @throws AnalysisIncomplete if the oracle fails; nothing is recorded
   */
  Analysis analyze(const Request& req) {
    // ===== Validate =====
    if (req.question.empty()) {
      throw ValidationError("analyze: question is empty");
    }
    const Intervention& iv = req.intervention;
    if (iv.type != InterventionType::Remove && iv.payload.empty()) {
      throw ValidationError("analyze: " + to_string(iv.type) + " needs a payload");
    }
    uint32_t samples = req.samples.value_or(config_.default_samples);
    if (samples < 1) {
      throw ValidationError("analyze: samples must be >= 1");
    }

    branch::Branch original = branches_.get(req.original_branch);
    if (req.timeline != INVALID_ID && !timelines_.contains(req.timeline)) {
      throw NotFound("analyze: timeline not found");
    }

    std::vector<branch::Thought> prefix = branches_.thought_prefix(req.original_branch);
    auto target_it = std::find_if(prefix.begin(), prefix.end(), [&](const branch::Thought& t) {
      return t.id == req.target_thought;
    });
    if (target_it == prefix.end()) {
      throw NotFound("analyze: target thought is not on the branch's thought prefix");
    }
    const branch::Thought target = *target_it;
    size_t k = static_cast<size_t>(target_it - prefix.begin());

    // ===== Counterfactual prefix =====
    oracle::Prefix original_text;
    for (const auto& t : prefix) original_text.push_back(t.content);

    oracle::Prefix cf_text(original_text.begin(), original_text.begin() + k);
    nlohmann::json changed = nlohmann::json::array();
    switch (iv.type) {
      case InterventionType::Change:
      case InterventionType::Replace:
        cf_text.push_back(iv.payload);
        changed.push_back({{"before", target.content}, {"after", iv.payload}});
        break;
      case InterventionType::Remove:
        changed.push_back({{"before", target.content}, {"after", nullptr}});
        break;
      case InterventionType::Inject:
        cf_text.push_back(target.content);
        cf_text.push_back(iv.payload);
        changed.push_back({{"before", nullptr}, {"after", iv.payload}});
        break;
    }

    // ===== Oracle: continuation and scores =====
    std::string cf_outcome;
    std::vector<double> original_scores;
    std::vector<double> cf_scores;
    try {
      std::vector<oracle::Continuation> cont = call_generate(cf_text, config_.continuation_width);
      if (cont.empty() || cont.front().content.empty()) {
        throw oracle::Malformed("generate_continuations: no counterfactual continuation");
      }
      cf_outcome = cont.front().content;

      oracle::Prefix cf_scored = cf_text;
      cf_scored.push_back(cf_outcome);
      for (uint32_t i = 0; i < samples; ++i) {
        original_scores.push_back(call_evaluate(original_text));
        cf_scores.push_back(call_evaluate(cf_scored));
      }
    } catch (const oracle::Error& e) {
      RETRACE_LOG_WARN("[counterfactual::analyze] oracle failed: %s", e.what());
      throw AnalysisIncomplete(std::string("analyze: oracle failed: ") + e.what());
    }

    Attribution attr = attribute(original_scores, cf_scores);

    // ===== Record =====
    Id cf_branch = materialize(original, target, req, cf_outcome);

    nlohmann::json unchanged = nlohmann::json::array();
    for (size_t i = 0; i < k; ++i) unchanged.push_back(original_text[i]);

    Analysis a;
    a.session = original.session;
    a.timeline = req.timeline;
    a.original_branch = req.original_branch;
    a.question = req.question;
    a.target_thought = req.target_thought;
    a.intervention = iv;
    a.counterfactual_branch = cf_branch;
    a.outcome_delta = attr.delta;
    a.causal_attribution = attr.causal_attribution;
    a.confidence = attr.confidence;
    a.comparison = {
        {"actual_outcome", original_text.back()},
        {"counterfactual_outcome", cf_outcome},
        {"outcome_delta", attr.delta},
        {"original_scores", original_scores},
        {"counterfactual_scores", cf_scores},
        {"changed_thoughts", std::move(changed)},
        {"unchanged_thoughts", std::move(unchanged)},
    };
    a.created_at = now_ms();

    Id id;
    {
      std::unique_lock lock(mu_);
      id = analyses_.insert(a);
      analyses_.get(id)->id = id;
    }
    a.id = id;

    if (req.timeline != INVALID_ID && timelines_.overlay(req.original_branch)) {
      timelines_.set_counterfactual_impact(req.original_branch, attr.delta);
    }

    RETRACE_LOG_INFO("[counterfactual::analyze] branch=%llu cf=%llu delta=%.3f attribution=%.3f",
                    (unsigned long long)req.original_branch, (unsigned long long)cf_branch,
                    attr.delta, attr.causal_attribution);
    return a;
  }

  std::optional<Analysis> analysis(Id id) const {
    std::shared_lock lock(mu_);
    const Analysis* a = analyses_.get(id);
    if (!a) return std::nullopt;
    return *a;
  }

  std::vector<Analysis> branch_analyses(Id original_branch) const {
    std::shared_lock lock(mu_);
    std::vector<Analysis> out;
    analyses_.for_each([&](Id, const Analysis& a) {
      if (a.original_branch == original_branch) out.push_back(a);
    });
    return out;
  }

  size_t size() const {
    std::shared_lock lock(mu_);
    return analyses_.size();
  }

  // ===== Removal (cascade support) =====

  /// Drop analyses whose original or counterfactual branch is `branch`
  void remove_branch(Id branch) {
    std::unique_lock lock(mu_);
    for (Id id : analyses_.select([&](const Analysis& a) {
           return a.original_branch == branch || a.counterfactual_branch == branch;
         })) {
      analyses_.release(id);
    }
  }

  void remove_session(Id session) {
    std::unique_lock lock(mu_);
    for (Id id : analyses_.select([&](const Analysis& a) { return a.session == session; })) {
      analyses_.release(id);
    }
  }

  // ===== Persistence =====

  nlohmann::json dump() const {
    std::shared_lock lock(mu_);
    nlohmann::json j;
    j["analyses"] = nlohmann::json::array();
    analyses_.for_each([&](Id, const Analysis& a) { j["analyses"].emplace_back(a); });
    return j;
  }

  /// @throws ValidationError on duplicate ids or dangling references
  void load(const nlohmann::json& j) {
    SlotTable<Analysis> analyses;
    for (const auto& item : j.value("analyses", nlohmann::json::array())) {
      Analysis a = item.get<Analysis>();
      if (!branches_.has_session(a.session) || !branches_.contains(a.original_branch) ||
          !branches_.contains(a.counterfactual_branch)) {
        throw ValidationError("load: analysis has dangling references");
      }
      if (!analyses.place(a.id, a)) {
        throw ValidationError("load: duplicate analysis id");
      }
    }
    analyses.rebuild_freelist();

    std::unique_lock lock(mu_);
    std::swap(analyses_, analyses);
  }

private:
  std::shared_ptr<oracle::Oracle> require_oracle() const {
    if (!oracle_) {
      throw oracle::Error("no oracle configured");
    }
    return oracle_;
  }

  std::vector<oracle::Continuation> call_generate(const oracle::Prefix& prefix, size_t n) {
    std::shared_ptr<oracle::Oracle> o = require_oracle();
    return oracle::bounded_call(
        [o, prefix, n](std::stop_token stop) { return o->generate_continuations(prefix, n, stop); },
        config_.oracle_timeout());
  }

  double call_evaluate(const oracle::Prefix& prefix) {
    std::shared_ptr<oracle::Oracle> o = require_oracle();
    double score = oracle::bounded_call(
        [o, prefix](std::stop_token stop) { return o->evaluate(prefix, stop); },
        config_.oracle_timeout());
    if (!std::isfinite(score)) {
      throw oracle::Malformed("evaluate: non-finite score");
    }
    return score;
  }

  /**
   * Create the counterfactual branch beside the branch owning the target
   *
   * Its thoughts are the owner's thoughts before the target, the
   * intervention, and the regenerated continuation. Rolled back if any
   * write fails.
   */
  Id materialize(const branch::Branch& original, const branch::Thought& target,
                 const Request& req, const std::string& continuation) {
    branch::Branch owner = branches_.get(target.branch);

    branch::BranchOptions opts;
    opts.name = "Counterfactual: " + req.question;
    opts.priority = original.priority;
    opts.confidence = original.confidence;
    Id cf = branches_.create_branch(original.session, owner.parent, opts);

    try {
      for (const auto& t : branches_.thoughts(owner.id)) {
        if (t.id == target.id) break;
        branches_.add_thought(cf, t.content, t.confidence);
      }
      const Intervention& iv = req.intervention;
      switch (iv.type) {
        case InterventionType::Change:
        case InterventionType::Replace:
          branches_.add_thought(cf, iv.payload, target.confidence);
          break;
        case InterventionType::Remove:
          break;
        case InterventionType::Inject:
          branches_.add_thought(cf, target.content, target.confidence);
          branches_.add_thought(cf, iv.payload, target.confidence);
          break;
      }
      branches_.add_thought(cf, continuation, target.confidence);

      CrossRefKind kind = iv.type == InterventionType::Inject
          ? CrossRefKind::Extends
          : CrossRefKind::Contradicts;
      branches_.add_cross_ref(cf, req.original_branch, kind, 1.0, req.question);
    } catch (const Error&) {
      branches_.remove_branch(cf);
      throw;
    }
    return cf;
  }

  branch::BranchStore& branches_;
  timeline::TimelineStore& timelines_;
  std::shared_ptr<oracle::Oracle> oracle_;
  AnalyzerConfig config_;

  mutable std::shared_mutex mu_;
  SlotTable<Analysis> analyses_;
};

}  // namespace retrace::counterfactual
