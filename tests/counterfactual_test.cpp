/**
 * Counterfactual Analyzer Unit Tests
 *
 * Validates:
 * - Attribution statistics
 * - Counterfactual branch construction per intervention type
 * - Comparison record contents
 * - Request validation before any write
 * - Oracle failure leaves no records (AnalysisIncomplete)
 * - Counterfactual impact mirrored into the timeline overlay
 */

#include <doctest/doctest.h>
#include <retrace/counterfactual.hpp>

#include "stubs/scripted_oracle.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace retrace;
using namespace retrace::counterfactual;
using retrace_test::Fail;
using retrace_test::ScriptedOracle;

// ============================================================================
// Test helpers
// ============================================================================

// root: [premise, assumption]  <-  child: [conclusion]
struct Fixture {
  branch::BranchStore branches;
  timeline::TimelineStore timelines{branches};
  std::shared_ptr<ScriptedOracle> oracle = std::make_shared<ScriptedOracle>();
  std::unique_ptr<Analyzer> analyzer;

  Id session;
  Id root;
  Id child;
  Id premise;
  Id assumption;
  Id conclusion;

  Fixture() {
    AnalyzerConfig cfg;
    cfg.oracle_timeout_ms = 0;
    analyzer = std::make_unique<Analyzer>(branches, timelines, oracle, cfg);

    session = branches.create_session();
    root = branches.create_branch(session, INVALID_ID);
    child = branches.create_branch(session, root);
    premise = branches.add_thought(root, "premise", 0.9);
    assumption = branches.add_thought(root, "assume linear growth", 0.7);
    conclusion = branches.add_thought(child, "conclusion", 0.6);

    // Higher score whenever the prefix mentions exponential growth
    oracle->reward_fn = [](const oracle::Prefix& p) {
      for (const auto& s : p) {
        if (s.find("exponential") != std::string::npos) return 0.9;
      }
      return 0.3;
    };
  }

  Request request(InterventionType type, std::string payload = "assume exponential growth") {
    Request r;
    r.original_branch = child;
    r.target_thought = assumption;
    r.intervention = Intervention{type, std::move(payload)};
    r.question = "What if growth were exponential?";
    return r;
  }

  std::vector<std::string> contents(Id branch) const {
    std::vector<std::string> out;
    for (const auto& t : branches.thoughts(branch)) out.push_back(t.content);
    return out;
  }
};

// ============================================================================
// Statistics
// ============================================================================

TEST_CASE("counterfactual: attribution statistics") {
  Attribution a = attribute({0.2, 0.4}, {0.6, 0.8});
  CHECK(a.delta == doctest::Approx(0.4));
  CHECK(a.pooled_stddev == doctest::Approx(0.1));
  CHECK(a.causal_attribution == doctest::Approx(0.8));
  CHECK(a.confidence == doctest::Approx((1.0 / 1.1) * (2.0 / 3.0)));

  Attribution same = attribute({0.5, 0.5}, {0.5, 0.5});
  CHECK(same.delta == doctest::Approx(0.0));
  CHECK(same.causal_attribution == doctest::Approx(0.0));

  Attribution exact = attribute({0.1}, {0.7});
  CHECK(exact.causal_attribution == doctest::Approx(1.0));
  CHECK(exact.confidence == doctest::Approx(0.5));
}

// ============================================================================
// Interventions
// ============================================================================

TEST_CASE("counterfactual: change forks beside the target's branch") {
  Fixture f;
  Request req = f.request(InterventionType::Change);
  req.samples = 3;

  Analysis a = f.analyzer->analyze(req);

  branch::Branch cf = f.branches.get(a.counterfactual_branch);
  CHECK(cf.parent == INVALID_ID);  // the assumption lives on the root
  CHECK(cf.session == f.session);
  CHECK(cf.state == BranchState::Active);
  std::vector<std::string> cf_thoughts = f.contents(a.counterfactual_branch);
  REQUIRE(cf_thoughts.size() == 3);
  CHECK(cf_thoughts[0] == "premise");
  CHECK(cf_thoughts[1] == "assume exponential growth");
  CHECK(cf_thoughts[2] == "assume exponential growth / option 1");

  CHECK(a.outcome_delta == doctest::Approx(0.6));
  CHECK(a.causal_attribution == doctest::Approx(1.0));
  CHECK(a.confidence == doctest::Approx(0.75));

  auto refs = f.branches.cross_refs_from(a.counterfactual_branch);
  REQUIRE(refs.size() == 1);
  CHECK(refs[0].to == f.child);
  CHECK(refs[0].kind == CrossRefKind::Contradicts);

  // Original is untouched
  CHECK(f.contents(f.root) == std::vector<std::string>{"premise", "assume linear growth"});
  CHECK(f.contents(f.child) == std::vector<std::string>{"conclusion"});
}

TEST_CASE("counterfactual: comparison record") {
  Fixture f;
  Analysis a = f.analyzer->analyze(f.request(InterventionType::Replace));

  const nlohmann::json& c = a.comparison;
  CHECK(c["actual_outcome"] == "conclusion");
  CHECK(c["counterfactual_outcome"] == "assume exponential growth / option 1");
  CHECK(c["outcome_delta"].get<double>() == doctest::Approx(a.outcome_delta));
  CHECK(c["original_scores"].size() == 1);
  CHECK(c["counterfactual_scores"].size() == 1);
  REQUIRE(c["changed_thoughts"].size() == 1);
  CHECK(c["changed_thoughts"][0]["before"] == "assume linear growth");
  CHECK(c["changed_thoughts"][0]["after"] == "assume exponential growth");
  CHECK(c["unchanged_thoughts"] == nlohmann::json::array({"premise"}));

  REQUIRE(f.analyzer->analysis(a.id));
  CHECK(f.analyzer->branch_analyses(f.child).size() == 1);
}

TEST_CASE("counterfactual: remove drops the target") {
  Fixture f;
  Analysis a = f.analyzer->analyze(f.request(InterventionType::Remove, ""));

  std::vector<std::string> cf_thoughts = f.contents(a.counterfactual_branch);
  REQUIRE(cf_thoughts.size() == 2);
  CHECK(cf_thoughts[0] == "premise");
  CHECK(cf_thoughts[1] == "premise / option 1");
  CHECK(a.comparison["changed_thoughts"][0]["after"].is_null());
}

TEST_CASE("counterfactual: inject keeps the target and extends") {
  Fixture f;
  Analysis a = f.analyzer->analyze(f.request(InterventionType::Inject, "but exponential later"));

  std::vector<std::string> cf_thoughts = f.contents(a.counterfactual_branch);
  REQUIRE(cf_thoughts.size() == 4);
  CHECK(cf_thoughts[1] == "assume linear growth");
  CHECK(cf_thoughts[2] == "but exponential later");

  auto refs = f.branches.cross_refs_from(a.counterfactual_branch);
  REQUIRE(refs.size() == 1);
  CHECK(refs[0].kind == CrossRefKind::Extends);
  CHECK(a.comparison["changed_thoughts"][0]["before"].is_null());
}

TEST_CASE("counterfactual: target on the original branch itself") {
  Fixture f;
  Request req = f.request(InterventionType::Change, "exponential conclusion");
  req.target_thought = f.conclusion;

  Analysis a = f.analyzer->analyze(req);
  CHECK(f.branches.get(a.counterfactual_branch).parent == f.root);
  CHECK(f.contents(a.counterfactual_branch).front() == "exponential conclusion");

  // Oracle saw the full original prefix when scoring it
  auto it = std::find(f.oracle->prefixes.begin(), f.oracle->prefixes.end(),
                      oracle::Prefix{"premise", "assume linear growth", "conclusion"});
  CHECK(it != f.oracle->prefixes.end());
}

// ============================================================================
// Validation and failure
// ============================================================================

TEST_CASE("counterfactual: invalid requests are rejected before any write") {
  Fixture f;
  size_t branches_before = f.branches.branch_count();

  Request empty_question = f.request(InterventionType::Change);
  empty_question.question.clear();
  CHECK_THROWS_AS(f.analyzer->analyze(empty_question), ValidationError);

  CHECK_THROWS_AS(f.analyzer->analyze(f.request(InterventionType::Change, "")), ValidationError);

  Request zero = f.request(InterventionType::Change);
  zero.samples = 0;
  CHECK_THROWS_AS(f.analyzer->analyze(zero), ValidationError);

  Request missing_branch = f.request(InterventionType::Change);
  missing_branch.original_branch = make_id(90, 0);
  CHECK_THROWS_AS(f.analyzer->analyze(missing_branch), NotFound);

  // A thought on an unrelated branch is not on the prefix
  Id other = f.branches.create_branch(f.session, INVALID_ID);
  Request off_path = f.request(InterventionType::Change);
  off_path.target_thought = f.branches.add_thought(other, "elsewhere");
  CHECK_THROWS_AS(f.analyzer->analyze(off_path), NotFound);

  Request missing_timeline = f.request(InterventionType::Change);
  missing_timeline.timeline = make_id(12, 0);
  CHECK_THROWS_AS(f.analyzer->analyze(missing_timeline), NotFound);

  CHECK(f.branches.branch_count() == branches_before + 1);
  CHECK(f.analyzer->size() == 0);
  CHECK(f.oracle->evaluate_calls == 0);
}

TEST_CASE("counterfactual: oracle failure is AnalysisIncomplete with no records") {
  Fixture f;
  size_t before = f.branches.branch_count();

  f.oracle->fail_evaluate = Fail::Timeout;
  CHECK_THROWS_AS(f.analyzer->analyze(f.request(InterventionType::Change)), AnalysisIncomplete);

  f.oracle->fail_evaluate = Fail::None;
  f.oracle->fail_generate = Fail::Malformed;
  CHECK_THROWS_AS(f.analyzer->analyze(f.request(InterventionType::Change)), AnalysisIncomplete);

  CHECK(f.branches.branch_count() == before);
  CHECK(f.analyzer->size() == 0);
  CHECK(f.branches.cross_refs_to(f.child).empty());
}

TEST_CASE("counterfactual: analyzer without an oracle is AnalysisIncomplete") {
  branch::BranchStore branches;
  timeline::TimelineStore timelines(branches);
  Analyzer analyzer(branches, timelines, nullptr);
  Id s = branches.create_session();
  Id b = branches.create_branch(s, INVALID_ID);

  Request req;
  req.original_branch = b;
  req.target_thought = branches.add_thought(b, "only");
  req.intervention = Intervention{InterventionType::Remove, ""};
  req.question = "q";
  CHECK_THROWS_AS(analyzer.analyze(req), AnalysisIncomplete);
}

// ============================================================================
// Timeline impact, removal, persistence
// ============================================================================

TEST_CASE("counterfactual: impact lands on the original branch overlay") {
  Fixture f;
  Id tl = f.timelines.create_timeline(f.session, f.root);
  f.timelines.attach(tl, f.child, 1, false);

  Request req = f.request(InterventionType::Change);
  req.timeline = tl;
  Analysis a = f.analyzer->analyze(req);

  auto ov = f.timelines.overlay(f.child);
  REQUIRE(ov);
  REQUIRE(ov->counterfactual_impact);
  CHECK(*ov->counterfactual_impact == doctest::Approx(a.outcome_delta));
  CHECK(a.timeline == tl);
}

TEST_CASE("counterfactual: remove_branch matches either side") {
  Fixture f;
  Analysis a = f.analyzer->analyze(f.request(InterventionType::Change));
  f.analyzer->analyze(f.request(InterventionType::Remove, ""));
  REQUIRE(f.analyzer->size() == 2);

  f.analyzer->remove_branch(a.counterfactual_branch);
  CHECK(f.analyzer->size() == 1);
  f.analyzer->remove_branch(f.child);
  CHECK(f.analyzer->size() == 0);
}

TEST_CASE("counterfactual: load restores analyses") {
  Fixture f;
  Analysis a = f.analyzer->analyze(f.request(InterventionType::Change));
  nlohmann::json doc = f.analyzer->dump();

  Analyzer copy(f.branches, f.timelines, f.oracle);
  copy.load(doc);
  REQUIRE(copy.analysis(a.id));
  CHECK(copy.analysis(a.id)->comparison == a.comparison);
  CHECK(copy.analysis(a.id)->intervention.type == InterventionType::Change);

  doc["analyses"][0]["counterfactual_branch"] = make_id(300, 0);
  Analyzer bad(f.branches, f.timelines, f.oracle);
  CHECK_THROWS_AS(bad.load(doc), ValidationError);
}
