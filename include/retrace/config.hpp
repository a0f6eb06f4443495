#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file config.hpp
 * @brief Engine configuration: defaults, JSON loading, environment overrides
 *
 * Precedence, lowest first: in-class defaults, JSON document, environment.
 *
 *   auto cfg = retrace::Config::from_file("retrace.json");   // also applies env
 *
 * Environment variables:
 *   RETRACE_EXPLORATION_CONSTANT   search.exploration_constant
 *   RETRACE_ORACLE_TIMEOUT_MS      search.oracle_timeout_ms and analyzer.oracle_timeout_ms
 *   RETRACE_MAX_DEPTH              search.max_depth
 *   RETRACE_EXPANSION_WIDTH        search.expansion_width
 */

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>

namespace retrace {

/**
 * Configuration for MCTS search
 */
struct SearchConfig {
  /** UCB1 exploration constant c (default sqrt(2)) */
  double exploration_constant = 1.4142135623730951;

  /** Candidates requested per expansion (default 3) */
  uint32_t expansion_width = 3;

  /** Nodes at this simulation depth are terminal (default 3) */
  uint32_t max_depth = 3;

  /** Prior for candidates the oracle did not score */
  double default_prior = 0.5;

  /** Per oracle call; 0 disables the deadline */
  int64_t oracle_timeout_ms = 30000;

  /** Accepted reward range; anything else is Malformed */
  double reward_min = 0.0;
  double reward_max = 1.0;

  /** Housekeeping: complete a branch after this many visits without improving children */
  uint32_t promote_visits = 20;

  /** Housekeeping: abandon a branch whose UCB1 stays below the floor... */
  double abandon_floor = 0.1;

  /** ...after at least this many visits */
  uint32_t abandon_min_visits = 10;

  std::chrono::milliseconds oracle_timeout() const {
    return std::chrono::milliseconds(oracle_timeout_ms);
  }
};

/**
 * Configuration for counterfactual analysis
 */
struct AnalyzerConfig {
  /** Rollouts per branch when the request does not say */
  uint32_t default_samples = 1;

  int64_t oracle_timeout_ms = 30000;

  /** Continuations requested when regenerating an outcome */
  uint32_t continuation_width = 1;

  std::chrono::milliseconds oracle_timeout() const {
    return std::chrono::milliseconds(oracle_timeout_ms);
  }
};

struct Config {
  /** Bound on parent-chain walks (branches and snapshots) */
  size_t hop_limit = 4096;

  SearchConfig search;
  AnalyzerConfig analyzer;

  /// @throws ConfigError if a value has the wrong type or is out of range
  static Config from_json(const nlohmann::json& j) {
    Config cfg;
    try {
      cfg.hop_limit = j.value("hop_limit", cfg.hop_limit);
      if (j.contains("search")) {
        const auto& s = j.at("search");
        SearchConfig& sc = cfg.search;
        sc.exploration_constant = s.value("exploration_constant", sc.exploration_constant);
        sc.expansion_width = s.value("expansion_width", sc.expansion_width);
        sc.max_depth = s.value("max_depth", sc.max_depth);
        sc.default_prior = s.value("default_prior", sc.default_prior);
        sc.oracle_timeout_ms = s.value("oracle_timeout_ms", sc.oracle_timeout_ms);
        sc.reward_min = s.value("reward_min", sc.reward_min);
        sc.reward_max = s.value("reward_max", sc.reward_max);
        sc.promote_visits = s.value("promote_visits", sc.promote_visits);
        sc.abandon_floor = s.value("abandon_floor", sc.abandon_floor);
        sc.abandon_min_visits = s.value("abandon_min_visits", sc.abandon_min_visits);
      }
      if (j.contains("analyzer")) {
        const auto& a = j.at("analyzer");
        AnalyzerConfig& ac = cfg.analyzer;
        ac.default_samples = a.value("default_samples", ac.default_samples);
        ac.oracle_timeout_ms = a.value("oracle_timeout_ms", ac.oracle_timeout_ms);
        ac.continuation_width = a.value("continuation_width", ac.continuation_width);
      }
    } catch (const nlohmann::json::exception& e) {
      throw ConfigError(std::string("config: ") + e.what());
    }
    cfg.validate();
    return cfg;
  }

  /**
   * Load a JSON config file, then apply environment overrides
   *
   * @throws ConfigError if the file cannot be read or parsed, or a value is invalid
   */
  static Config from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      throw ConfigError("config: cannot open " + path);
    }
    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      throw ConfigError("config: " + path + " is not a JSON object");
    }
    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
  }

  /// Defaults plus environment overrides
  static Config from_env() {
    Config cfg;
    cfg.apply_env();
    return cfg;
  }

  void apply_env() {
    if (const char* v = std::getenv("RETRACE_EXPLORATION_CONSTANT")) {
      search.exploration_constant = parse_double("RETRACE_EXPLORATION_CONSTANT", v);
    }
    if (const char* v = std::getenv("RETRACE_ORACLE_TIMEOUT_MS")) {
      int64_t ms = parse_int("RETRACE_ORACLE_TIMEOUT_MS", v);
      search.oracle_timeout_ms = ms;
      analyzer.oracle_timeout_ms = ms;
    }
    if (const char* v = std::getenv("RETRACE_MAX_DEPTH")) {
      search.max_depth = static_cast<uint32_t>(parse_int("RETRACE_MAX_DEPTH", v));
    }
    if (const char* v = std::getenv("RETRACE_EXPANSION_WIDTH")) {
      search.expansion_width = static_cast<uint32_t>(parse_int("RETRACE_EXPANSION_WIDTH", v));
    }
    validate();
  }

  void validate() const {
    const SearchConfig& s = search;
    if (!std::isfinite(s.exploration_constant) || s.exploration_constant < 0.0) {
      throw ConfigError("config: exploration_constant must be finite and >= 0");
    }
    if (s.expansion_width == 0) {
      throw ConfigError("config: expansion_width must be >= 1");
    }
    if (s.max_depth == 0) {
      throw ConfigError("config: max_depth must be >= 1");
    }
    if (!(s.default_prior >= 0.0 && s.default_prior <= 1.0)) {
      throw ConfigError("config: default_prior must be in [0,1]");
    }
    if (s.oracle_timeout_ms < 0 || analyzer.oracle_timeout_ms < 0) {
      throw ConfigError("config: oracle_timeout_ms must be >= 0");
    }
    if (!std::isfinite(s.reward_min) || !std::isfinite(s.reward_max) ||
        s.reward_min >= s.reward_max) {
      throw ConfigError("config: reward range must be finite with reward_min < reward_max");
    }
    if (analyzer.default_samples == 0 || analyzer.continuation_width == 0) {
      throw ConfigError("config: analyzer counts must be >= 1");
    }
    if (hop_limit == 0) {
      throw ConfigError("config: hop_limit must be >= 1");
    }
  }

private:
  static double parse_double(const char* name, const char* v) {
    char* end = nullptr;
    double d = std::strtod(v, &end);
    if (end == v || *end != '\0') {
      throw ConfigError(std::string("config: ") + name + " is not a number: " + v);
    }
    return d;
  }

  static int64_t parse_int(const char* name, const char* v) {
    char* end = nullptr;
    long long n = std::strtoll(v, &end, 10);
    if (end == v || *end != '\0' || n < 0) {
      throw ConfigError(std::string("config: ") + name + " is not a non-negative integer: " + v);
    }
    return static_cast<int64_t>(n);
  }
};

}  // namespace retrace
