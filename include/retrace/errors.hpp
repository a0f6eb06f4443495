#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file errors.hpp
 * @brief Typed exceptions raised by the stores, engine and analyzer
 *
 * Every rejected operation throws before mutating any record. Catch
 * retrace::Error to handle all of them, or a subclass for a specific kind.
 */

#include <stdexcept>
#include <string>

namespace retrace {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Malformed input, e.g. a parent branch from another session
class ValidationError : public Error {
public:
  using Error::Error;
};

/// Referenced entity is absent (or its id is stale)
class NotFound : public Error {
public:
  using Error::Error;
};

/// Illegal branch state change (completed/abandoned -> active)
class InvalidTransition : public Error {
public:
  using Error::Error;
};

/// Snapshot chain does not terminate at a full snapshot
class CorruptChain : public Error {
public:
  using Error::Error;
};

/// Counterfactual analysis could not complete because the oracle failed
class AnalysisIncomplete : public Error {
public:
  using Error::Error;
};

class ConfigError : public Error {
public:
  using Error::Error;
};

/// Durable store could not be read or written
class PersistenceError : public Error {
public:
  using Error::Error;
};

}  // namespace retrace
