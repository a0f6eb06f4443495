#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * Content-Generation Oracle
 *
 * The engine never generates or scores content itself. It asks an Oracle:
 *
 *   generate_continuations(prefix, n) -> up to n (content, prior) candidates
 *   evaluate(prefix)                  -> scalar reward
 *
 * `prefix` is the thought prefix of a branch, root first. Both calls are
 * blocking and may fail with oracle::Timeout or oracle::Malformed; callers
 * treat either as a soft failure of the step in flight.
 *
 * bounded_call() enforces the per-call timeout. The call runs on its own
 * thread with a stop_token; when the deadline passes the token is signalled
 * and Timeout is thrown immediately. A late result is discarded.
 *
 * Oracles must honour the stop_token: a timed-out call keeps its thread
 * until the oracle returns. At most max_outstanding_calls() such threads
 * exist at once; further bounded calls fail with Timeout without starting.
 *
 * Example:
 *
 *   auto oracle = std::make_shared<retrace::oracle::FunctionOracle>(
 *       [](const auto& prefix, size_t n, std::stop_token) {
 *         return std::vector<retrace::oracle::Continuation>{{"next step", 0.7}};
 *       },
 *       [](const auto& prefix, std::stop_token) { return 0.5; });
 */

#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace retrace::oracle {

class Error : public retrace::Error {
public:
  using retrace::Error::Error;
};

/// The oracle did not answer within the per-call timeout
class Timeout : public Error {
public:
  using Error::Error;
};

/// The oracle answered with something the engine cannot use
class Malformed : public Error {
public:
  using Error::Error;
};

struct Continuation {
  std::string content;
  /// Oracle's confidence in this candidate, in [0,1]; engine default if absent
  std::optional<double> prior;
};

using Prefix = std::vector<std::string>;

class Oracle {
public:
  virtual ~Oracle() = default;

  virtual std::vector<Continuation> generate_continuations(const Prefix& prefix, size_t n,
                                                           std::stop_token stop) = 0;

  virtual double evaluate(const Prefix& prefix, std::stop_token stop) = 0;
};

/// Oracle built from two callables
class FunctionOracle : public Oracle {
public:
  using GenerateFn = std::function<std::vector<Continuation>(const Prefix&, size_t, std::stop_token)>;
  using EvaluateFn = std::function<double(const Prefix&, std::stop_token)>;

  FunctionOracle(GenerateFn generate, EvaluateFn evaluate)
      : generate_(std::move(generate)), evaluate_(std::move(evaluate)) {}

  std::vector<Continuation> generate_continuations(const Prefix& prefix, size_t n,
                                                   std::stop_token stop) override {
    if (!generate_) {
      throw Malformed("generate_continuations: no generator configured");
    }
    return generate_(prefix, n, std::move(stop));
  }

  double evaluate(const Prefix& prefix, std::stop_token stop) override {
    if (!evaluate_) {
      throw Malformed("evaluate: no evaluator configured");
    }
    return evaluate_(prefix, std::move(stop));
  }

private:
  GenerateFn generate_;
  EvaluateFn evaluate_;
};

namespace detail {

template <typename R>
struct CallState {
  std::mutex mu;
  std::condition_variable cv;
  bool done = false;
  std::optional<R> value;
  std::exception_ptr error;
};

inline std::atomic<size_t>& outstanding_ref() {
  static std::atomic<size_t> n{0};
  return n;
}

inline std::atomic<size_t>& max_outstanding_ref() {
  static std::atomic<size_t> n{64};
  return n;
}

}  // namespace detail

/// Bounded calls whose worker thread has not returned yet
inline size_t outstanding_calls() {
  return detail::outstanding_ref().load(std::memory_order_acquire);
}

inline size_t max_outstanding_calls() {
  return detail::max_outstanding_ref().load(std::memory_order_relaxed);
}

inline void set_max_outstanding_calls(size_t n) {
  detail::max_outstanding_ref().store(n, std::memory_order_relaxed);
}

/**
 * Run fn(stop_token) with a deadline
 *
 * A non-positive timeout runs fn inline without a deadline. Exceptions
 * thrown by fn are rethrown to the caller.
 *
 * @throws Timeout if fn has not returned when the deadline passes, or if
 *         max_outstanding_calls() workers are still running
 */
template <typename Fn>
auto bounded_call(Fn fn, std::chrono::milliseconds timeout)
    -> std::invoke_result_t<Fn&, std::stop_token> {
  using R = std::invoke_result_t<Fn&, std::stop_token>;

  if (timeout.count() <= 0) {
    std::stop_source never;
    return fn(never.get_token());
  }

  std::atomic<size_t>& outstanding = detail::outstanding_ref();
  if (outstanding.fetch_add(1, std::memory_order_acq_rel) >= max_outstanding_calls()) {
    outstanding.fetch_sub(1, std::memory_order_acq_rel);
    throw Timeout("oracle call refused: " + std::to_string(max_outstanding_calls()) +
                  " earlier calls are still running");
  }

  auto state = std::make_shared<detail::CallState<R>>();
  std::stop_source source;

  std::thread worker;
  try {
    worker = std::thread([state, fn = std::move(fn), token = source.get_token()]() mutable {
      std::optional<R> value;
      std::exception_ptr error;
      try {
        value.emplace(fn(token));
      } catch (...) {
        // Handed to the waiting caller, which rethrows it
        error = std::current_exception();
      }
      std::lock_guard<std::mutex> lock(state->mu);
      state->value = std::move(value);
      state->error = error;
      state->done = true;
      state->cv.notify_all();
      detail::outstanding_ref().fetch_sub(1, std::memory_order_acq_rel);
    });
  } catch (const std::system_error&) {
    outstanding.fetch_sub(1, std::memory_order_acq_rel);
    throw;
  }
  worker.detach();

  std::unique_lock<std::mutex> lock(state->mu);
  if (!state->cv.wait_for(lock, timeout, [&] { return state->done; })) {
    source.request_stop();
    throw Timeout("oracle call exceeded " + std::to_string(timeout.count()) + " ms");
  }
  if (state->error) {
    std::rethrow_exception(state->error);
  }
  return std::move(*state->value);
}

}  // namespace retrace::oracle
